#include "cmd_check.h"
#include "cmd_extract.h"
#include "cmd_repair.h"
#include "cmd_run.h"
#include "runner_utils.h"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "pitchbox_cli <check|run|extract|repair> ...\n"
                  << "  check <script.py>\n"
                  << "  run <script.py> --data <csv> [--timeout SEC] [--memory-mb MB] [--caps a,b]\n"
                  << "      [--out DIR] [--repair] [--payloads]\n"
                  << "  extract <response.md> [--out DIR] [--report]\n"
                  << "  repair <script.py> --data <csv>\n";
        return 2;
    }

    pitchbox::prepare_runtime_env(argv[0]);

    std::string cmd = argv[1];
    try {
        if (cmd == "check") return cmd_check(argc, argv);
        if (cmd == "run") return cmd_run(argc, argv);
        if (cmd == "extract") return cmd_extract(argc, argv);
        if (cmd == "repair") return cmd_repair(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[" << cmd << "] error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}

#include "cmd_extract.h"
#include "runner_utils.h"

#include "pitchbox/code_repair.h"
#include "pitchbox/serialization.h"

#include <filesystem>
#include <iostream>

// pitchbox_cli extract <response.md> [--out DIR] [--report]
// Lists the fenced python blocks of a model response as a JSON array.
// --out also writes them as block_N.py; --report adds the stripped prose.
int cmd_extract(int argc, char** argv) {
    using namespace pitchbox;
    CliArgs args;
    std::string err;
    if (!parse_cli(argc, argv, 2, {"out"}, {"report"}, &args, &err) || args.positional.size() != 1) {
        if (!err.empty()) std::cerr << err << "\n";
        std::cerr << "usage: pitchbox_cli extract <response.md> [--out DIR] [--report]\n";
        return 2;
    }

    const std::string response = slurp(args.positional[0]);
    const auto blocks = extract_code_blocks(response);

    if (args.has("out")) {
        std::filesystem::path dir = args.get("out");
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[extract] cannot create " << dir.string() << ": " << ec.message() << "\n";
            return 1;
        }
        for (size_t i = 0; i < blocks.size(); i++) {
            if (!write_file(dir / ("block_" + std::to_string(i + 1) + ".py"), blocks[i] + "\n", &err)) {
                std::cerr << "[extract] " << err << "\n";
                return 1;
            }
        }
    }

    json_object* arr = json_object_new_array();
    for (const auto& b : blocks) json_object_array_add(arr, json_new_string(b));
    if (!args.has("report")) {
        print_json(arr);
        return 0;
    }
    json_object* o = json_object_new_object();
    json_object_object_add(o, "blocks", arr);
    json_object_object_add(o, "report", json_new_string(strip_code_blocks(response)));
    print_json(o);
    return 0;
}

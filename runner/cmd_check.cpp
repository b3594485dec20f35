#include "cmd_check.h"
#include "runner_utils.h"

#include "pitchbox/analyzer.h"
#include "pitchbox/config.h"
#include "pitchbox/serialization.h"

#include <iostream>

// pitchbox_cli check <script.py>
// Prints the safety verdict. Exit 0 when allowed, 1 when rejected.
int cmd_check(int argc, char** argv) {
    using namespace pitchbox;
    CliArgs args;
    std::string err;
    if (!parse_cli(argc, argv, 2, {}, {}, &args, &err) || args.positional.size() != 1) {
        if (!err.empty()) std::cerr << err << "\n";
        std::cerr << "usage: pitchbox_cli check <script.py>\n";
        return 2;
    }

    DenylistPolicy policy;
    if (!policy_from_env(&policy, &err)) {
        std::cerr << "[check] policy: " << err << "\n";
        return 2;
    }
    SafetyAnalyzer analyzer(std::move(policy));
    if (!analyzer.ok()) {
        std::cerr << "[check] policy: " << analyzer.init_error() << "\n";
        return 2;
    }

    SafetyVerdict v = analyzer.analyze(slurp(args.positional[0]));
    print_json(verdict_to_json(v));
    return v.allowed ? 0 : 1;
}

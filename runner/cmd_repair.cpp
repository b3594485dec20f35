#include "cmd_repair.h"
#include "runner_utils.h"

#include "pitchbox/code_repair.h"
#include "pitchbox/serialization.h"

#include <iostream>

// pitchbox_cli repair <script.py> --data <csv>
// Prints {"source":..,"corrections":[..]}. The repaired source is not checked.
int cmd_repair(int argc, char** argv) {
    using namespace pitchbox;
    CliArgs args;
    std::string err;
    if (!parse_cli(argc, argv, 2, {"data"}, {}, &args, &err) || args.positional.size() != 1 || !args.has("data")) {
        if (!err.empty()) std::cerr << err << "\n";
        std::cerr << "usage: pitchbox_cli repair <script.py> --data <csv>\n";
        return 2;
    }

    DatasetHandle ds;
    if (!load_dataset(args.get("data"), &ds, &err)) {
        std::cerr << "[repair] dataset: " << err << "\n";
        return 1;
    }

    RepairResult r = auto_repair(slurp(args.positional[0]), ds->column_names());

    json_object* o = json_object_new_object();
    json_object_object_add(o, "source", json_new_string(r.source));
    json_object* corr = json_object_new_array();
    for (const auto& c : r.corrections) json_object_array_add(corr, json_new_string(c));
    json_object_object_add(o, "corrections", corr);
    print_json(o);
    return 0;
}

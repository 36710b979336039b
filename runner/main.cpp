#include "cmd_run.h"
#include "cmd_serve.h"

#include "scriptbox/config.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "scriptbox_cli <validate|run|sweep|serve> ...\n";
        return 2;
    }
    scriptbox::apply_profile_defaults(scriptbox::detect_profile());

    std::string cmd = argv[1];
    if (cmd == "validate") return cmd_validate(argc, argv);
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "sweep") return cmd_sweep(argc, argv);
    if (cmd == "serve") return cmd_serve(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}

#include "cmd_run.h"
#include "cmd_validate.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "kyotee_cli <run|validate|check> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "validate") return cmd_validate(argc, argv);
    if (cmd == "check") return cmd_check(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}

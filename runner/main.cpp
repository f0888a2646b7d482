#include "cmd_serve.h"
#include "cmd_tools.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "capsule_cli <serve|schema|call|verify-audit> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "schema") return cmd_schema(argc, argv);
    if (cmd == "call") return cmd_call(argc, argv);
    if (cmd == "verify-audit") return cmd_verify_audit(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}

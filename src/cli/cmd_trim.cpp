// WATSIM - cmd_trim.cpp
// CLI handler for the 'trim' subcommand

#include "cli_common.h"
#include <exception>
#include <iostream>

namespace watsim {

extern int run_trim(int argc, char** argv);

int cmd_trim(int argc, char** argv) {
    CLICommand cmd = make_trim_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_required(argc, argv)) {
        return 1;
    }

    try {
        return run_trim(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace watsim

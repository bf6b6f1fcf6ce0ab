// WATSIM - cmd_ngrams.cpp
// CLI handler for the 'ngrams' subcommand

#include "cli_common.h"
#include <exception>
#include <iostream>

namespace watsim {

extern int run_ngrams(int argc, char** argv);

int cmd_ngrams(int argc, char** argv) {
    CLICommand cmd = make_ngrams_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_required(argc, argv)) {
        return 1;
    }

    try {
        return run_ngrams(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace watsim

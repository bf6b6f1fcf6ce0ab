// WATSIM - tokenize.cpp
// Tokenize command: prints the instruction tokens of one WAT file

#include "algorithms/instruction_tokenizer.h"
#include "io/text_io.h"
#include "util/logger.h"
#include <watsim/config.hpp>
#include <iostream>
#include <string>

namespace watsim {

int run_tokenize(int argc, char** argv) {
    TokenizeConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--wat" && i + 1 < argc) {
            config.wat_file = argv[++i];
        } else if (arg == "--count") {
            config.count_only = true;
        }
    }

    if (config.wat_file.empty()) {
        std::cerr << "Error: --wat is required\n";
        return 1;
    }

    Logger log("tokenize", VERSION);

    TokenSequence tokens;
    try {
        tokens = tokenize_instructions(read_text_file(config.wat_file));
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }

    if (config.count_only) {
        std::cout << tokens.size() << "\n";
        return 0;
    }

    for (const auto& tok : tokens) {
        std::cout << tok << "\n";
    }
    log.detail(std::to_string(tokens.size()) + " instructions");
    return 0;
}

}  // namespace watsim

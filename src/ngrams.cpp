// WATSIM - ngrams.cpp
// N-gram command: writes <stem>_<n>gram.txt tables next to WAT files

#include "algorithms/instruction_tokenizer.h"
#include "corpus/corpus.h"
#include "io/text_io.h"
#include "util/logger.h"
#include <watsim/config.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace watsim {

int run_ngrams(int argc, char** argv) {
    NgramConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--wat" && i + 1 < argc) {
            config.wat_file = argv[++i];
        } else if (arg == "--corpus" && i + 1 < argc) {
            config.corpus_root = argv[++i];
        } else if (arg == "--algos" && i + 1 < argc) {
            config.algorithms = split_list(argv[++i]);
        } else if (arg == "--langs" && i + 1 < argc) {
            config.languages = split_list(argv[++i]);
        } else if (arg == "--min-n" && i + 1 < argc) {
            config.min_n = std::stoi(argv[++i]);
        } else if (arg == "--max-n" && i + 1 < argc) {
            config.max_n = std::stoi(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
    }

    if (config.wat_file.empty() == config.corpus_root.empty()) {
        std::cerr << "Error: exactly one of --wat or --corpus is required\n";
        return 1;
    }
    if (config.min_n < 1 || config.max_n < config.min_n) {
        std::cerr << "Error: invalid n range " << config.min_n << ".." << config.max_n << "\n";
        return 1;
    }

    Logger log("ngrams", VERSION);
    log.console_level = config.verbose ? Verbosity::Verbose : Verbosity::Normal;

    std::vector<std::string> inputs;
    try {
        if (!config.wat_file.empty()) {
            inputs.push_back(config.wat_file);
        } else {
            validate_corpus_root(config.corpus_root);
            log.open_trace(config.corpus_root + "/ngrams_trace.log");
            log.info("WATSIM ngrams v" + std::string(VERSION) + " starting");
            log.info("Corpus: " + config.corpus_root);
            for (const auto& wf : find_wat_files(config.corpus_root, config.algorithms,
                                                 config.languages, log)) {
                inputs.push_back(wf.path);
            }
            if (inputs.empty()) {
                log.error("No .wat files found under " + config.corpus_root);
                return 1;
            }
        }

        log.metric("min_n", static_cast<size_t>(config.min_n));
        log.metric("max_n", static_cast<size_t>(config.max_n));

        size_t done = 0;
        size_t written = 0;
        for (const auto& path : inputs) {
            TokenSequence tokens = tokenize_instructions(read_text_file(path));
            auto files = write_gram_files(path, tokens, config.min_n, config.max_n);
            for (const auto& f : files) log.detail("Saved " + f);
            written += files.size();
            log.progress("Files", ++done, inputs.size());
        }

        log.info("Wrote " + std::to_string(written) + " gram files for " +
                 std::to_string(inputs.size()) + " WAT files");
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}

}  // namespace watsim

// WATSIM - trim.cpp
// Trim command: head/middle/tail/random trimmed corpus variants

#include "algorithms/trimming.h"
#include "corpus/corpus.h"
#include "corpus/corpus_trimmer.h"
#include "io/text_io.h"
#include "util/logger.h"
#include <watsim/config.hpp>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace watsim {

int run_trim(int argc, char** argv) {
    TrimConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            config.input_root = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.output_root = argv[++i];
        } else if (arg == "--method" && i + 1 < argc) {
            config.method = argv[++i];
        } else if (arg == "--unit" && i + 1 < argc) {
            config.unit = argv[++i];
        } else if (arg == "--lines" && i + 1 < argc) {
            config.target = parse_count_arg(argv[++i], "--lines");
        } else if (arg == "--trials" && i + 1 < argc) {
            config.trials = parse_positive_int_arg(argv[++i], "--trials");
        } else if (arg == "--seed" && i + 1 < argc) {
            config.random_seed = std::stoll(argv[++i]);
        } else if (arg == "--algos" && i + 1 < argc) {
            config.algorithms = split_list(argv[++i]);
        } else if (arg == "--langs" && i + 1 < argc) {
            config.languages = split_list(argv[++i]);
        } else if (arg == "--write-grams") {
            config.write_grams = true;
        } else if (arg == "--min-n" && i + 1 < argc) {
            config.min_n = std::stoi(argv[++i]);
        } else if (arg == "--max-n" && i + 1 < argc) {
            config.max_n = std::stoi(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
    }

    if (config.input_root.empty()) {
        std::cerr << "Error: --input is required\n";
        return 1;
    }
    if (config.trials < 1) {
        std::cerr << "Error: --trials must be at least 1\n";
        return 1;
    }
    if (config.random_seed > 0xFFFFFFFFLL) {
        std::cerr << "Error: --seed must fit in 32 bits\n";
        return 1;
    }
    if (config.min_n < 1 || config.max_n < config.min_n) {
        std::cerr << "Error: invalid n range " << config.min_n << ".." << config.max_n << "\n";
        return 1;
    }

    std::filesystem::create_directories(config.output_root);

    Logger log("trim", VERSION);
    log.console_level = config.verbose ? Verbosity::Verbose : Verbosity::Normal;
    log.open_trace(config.output_root + "/trim_trace.log");
    log.info("WATSIM trim v" + std::string(VERSION) + " starting");

    try {
        TrimOptions opts;
        opts.strategy = parse_trim_strategy(config.method);
        opts.unit = parse_trim_unit(config.unit);
        opts.target = config.target;
        opts.trials = opts.strategy == TrimStrategy::Random ? config.trials : 1;
        opts.write_grams = config.write_grams;
        opts.min_n = config.min_n;
        opts.max_n = config.max_n;

        validate_corpus_root(config.input_root);

        log.section("Parameters");
        log.metric("input", config.input_root);
        log.metric("output", config.output_root);
        log.metric("method", std::string(trim_strategy_name(opts.strategy)));
        log.metric("unit", std::string(trim_unit_name(opts.unit)));
        log.metric("target", opts.target);
        log.metric("trials", static_cast<size_t>(opts.trials));

        if (opts.strategy == TrimStrategy::Random) {
            if (config.random_seed >= 0) {
                opts.master_seed = static_cast<uint32_t>(config.random_seed);
                log.metric("random_seed", static_cast<size_t>(opts.master_seed));
            } else {
                std::random_device rd;
                opts.master_seed = rd();
                log.metric("random_seed", "random_device");
                log.metric("drawn_seed", static_cast<size_t>(opts.master_seed));
            }
        }

        auto files = find_wat_files(config.input_root, config.algorithms, config.languages, log);
        if (files.empty()) {
            log.error("No .wat files found under " + config.input_root);
            return 1;
        }
        log.info("Found " + std::to_string(files.size()) + " WAT files, trimming to " +
                 std::to_string(opts.target) + " " + trim_unit_name(opts.unit) + " (" +
                 trim_strategy_name(opts.strategy) + ", " + std::to_string(opts.trials) +
                 (opts.trials == 1 ? " trial)" : " trials)"));

        CorpusTrimmer trimmer(opts, log);
        TrimSummary summary = trimmer.run(files, config.output_root);

        log.section("Reduction");
        size_t before = 0;
        size_t after = 0;
        for (const auto& r : summary.records) {
            before += r.total;
            after += r.kept;
        }
        log.metric("files_written", summary.records.size());
        log.metric("files_skipped", summary.failed);
        log.metric("units_before", before);
        log.metric("units_after", after);
        log.metric("mean_line_reduction", mean_line_reduction(summary.records));
        log.metric("mean_byte_reduction", mean_byte_reduction(summary.records));

        log.info("Wrote " + std::to_string(summary.records.size()) + " trimmed files to " +
                 config.output_root);
        if (summary.failed > 0) {
            log.warn(std::to_string(summary.failed) + " input files could not be read");
        }
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}

}  // namespace watsim

// WATSIM - matrix.cpp
// Matrix command: one pairwise similarity matrix per selected metric

#include "corpus/corpus.h"
#include "io/text_io.h"
#include "matrix/matrix_builder.h"
#include "matrix/matrix_io.h"
#include "matrix/pairwise_metric.h"
#include "util/logger.h"
#include <watsim/config.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <omp.h>

namespace watsim {

namespace {

double mean_off_diagonal(const SimilarityMatrix& m) {
    if (m.size() < 2) return 0.0;
    return m.upper_triangle().mean();
}

std::string format_score(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << v;
    return ss.str();
}

}  // namespace

int run_matrix(int argc, char** argv) {
    MatrixConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--corpus" && i + 1 < argc) {
            config.corpus_root = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.output_dir = argv[++i];
        } else if (arg == "--metrics" && i + 1 < argc) {
            config.metrics = split_list(argv[++i]);
        } else if (arg == "--targets" && i + 1 < argc) {
            config.targets.clear();
            for (const auto& label : split_list(argv[++i])) {
                CorpusItem item = parse_corpus_label(label);
                config.targets.emplace_back(item.algorithm, item.language);
            }
        } else if (arg == "--source" && i + 1 < argc) {
            config.source = argv[++i];
        } else if (arg == "--lcs-method" && i + 1 < argc) {
            config.lcs_method = argv[++i];
        } else if (arg == "--lcs-limit" && i + 1 < argc) {
            config.lcs_limit = parse_count_arg(argv[++i], "--lcs-limit");
        } else if (arg == "--min-n" && i + 1 < argc) {
            config.min_n = std::stoi(argv[++i]);
        } else if (arg == "--max-n" && i + 1 < argc) {
            config.max_n = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            config.threads = parse_positive_int_arg(argv[++i], "--threads");
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
    }

    if (config.corpus_root.empty()) {
        std::cerr << "Error: --corpus is required\n";
        return 1;
    }
    if (config.source != "wat" && config.source != "grams") {
        std::cerr << "Error: --source must be 'wat' or 'grams'\n";
        return 1;
    }
    if (config.min_n < 1 || config.max_n < config.min_n) {
        std::cerr << "Error: invalid n range " << config.min_n << ".." << config.max_n << "\n";
        return 1;
    }
    if (config.targets.empty()) {
        std::cerr << "Error: --targets is empty\n";
        return 1;
    }

    std::filesystem::create_directories(config.output_dir);
    omp_set_num_threads(config.threads);

    Logger log("matrix", VERSION);
    log.console_level = config.verbose ? Verbosity::Verbose : Verbosity::Normal;
    log.open_trace(config.output_dir + "/matrix_trace.log");
    log.info("WATSIM matrix v" + std::string(VERSION) + " starting");

    try {
        validate_corpus_root(config.corpus_root);

        // Reject unknown names before any file is read
        std::vector<Metric> metrics;
        for (const auto& name : config.metrics) metrics.push_back(parse_metric(name));
        const LcsNormalization lcs_method = parse_lcs_normalization(config.lcs_method);

        log.section("Parameters");
        log.metric("corpus", config.corpus_root);
        log.metric("targets", config.targets.size());
        log.metric("source", config.source);
        log.metric("n_range", std::to_string(config.min_n) + ".." + std::to_string(config.max_n));
        log.metric("lcs_method", std::string(lcs_normalization_name(lcs_method)));
        log.metric("lcs_limit", config.lcs_limit);
        log.metric("threads", static_cast<size_t>(config.threads));

        std::vector<std::unique_ptr<IPairwiseMetric>> scorers;
        LoadOptions load;
        load.min_n = config.min_n;
        load.max_n = config.max_n;
        load.need_tokens = false;
        load.need_tables = false;
        load.tables_from_grams = config.source == "grams";
        load.token_limit = config.lcs_limit;
        for (Metric m : metrics) {
            scorers.push_back(create_pairwise_metric(m, lcs_method));
            load.need_tokens = load.need_tokens || scorers.back()->needs_tokens();
            load.need_tables = load.need_tables || scorers.back()->needs_tables();
        }

        // Load every representation once; all pairs share them
        log.section("Loading corpus");
        auto items = make_corpus(config.targets);
        std::vector<std::string> labels;
        for (const auto& item : items) labels.push_back(item.label());

        CorpusLoader loader(config.corpus_root, log);
        auto reps = loader.load_all(items, load);

        size_t missing = 0;
        for (const auto& rep : reps) missing += rep.missing ? 1 : 0;
        log.info("Loaded " + std::to_string(reps.size() - missing) + "/" +
                 std::to_string(reps.size()) + " items");

        for (size_t k = 0; k < metrics.size(); ++k) {
            const IPairwiseMetric& scorer = *scorers[k];
            log.section("Metric: " + scorer.name());
            log.info("Computing " + scorer.name() + " similarity (" +
                     std::to_string(labels.size() * (labels.size() - 1) / 2) + " pairs)");

            MatrixBuilder builder(scorer, config.threads);
            double pair_seconds = 0.0;
            builder.set_observer([&](const PairScore& ps) {
                pair_seconds += ps.elapsed;
                if (!ps.error.empty()) {
                    log.warn(scorer.name() + " failed for " + labels[ps.i] + " vs " +
                             labels[ps.j] + ", scored 0: " + ps.error);
                }
                log.detail(labels[ps.i] + " vs " + labels[ps.j] + ": " + format_score(ps.score) +
                           " (" + format_score(ps.elapsed) + "s)");
                log.progress(scorer.name(), ps.done, ps.total);
            });

            SimilarityMatrix matrix = builder.build(labels, reps);

            const std::string out = (std::filesystem::path(config.output_dir) /
                                     matrix_file_name(metrics[k], lcs_method)).string();
            write_matrix_csv(out, matrix);

            log.metric(scorer.name() + "_mean_offdiag", mean_off_diagonal(matrix));
            log.metric(scorer.name() + "_pair_seconds", pair_seconds, 3);
            log.info("Saved " + out);
        }
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }

    if (log.warnings() > 0) {
        log.info("Completed with " + std::to_string(log.warnings()) + " warnings");
    }
    return 0;
}

}  // namespace watsim

// WATSIM - average.cpp
// Average command: element-wise mean of per-trial matrices, optional
// correlation against a baseline (untrimmed) matrix

#include "io/text_io.h"
#include "matrix/matrix_io.h"
#include "matrix/similarity_matrix.h"
#include "util/logger.h"
#include <watsim/config.hpp>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace watsim {

int run_average(int argc, char** argv) {
    AverageConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--matrices" && i + 1 < argc) {
            for (const auto& f : split_list(argv[++i])) config.matrix_files.push_back(f);
        } else if (arg == "--output" && i + 1 < argc) {
            config.output_file = argv[++i];
        } else if (arg == "--baseline" && i + 1 < argc) {
            config.baseline_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
    }

    if (config.matrix_files.empty()) {
        std::cerr << "Error: --matrices is required\n";
        return 1;
    }

    std::filesystem::path out_dir = std::filesystem::path(config.output_file).parent_path();
    if (out_dir.empty()) out_dir = ".";
    std::filesystem::create_directories(out_dir);

    Logger log("average", VERSION);
    log.console_level = config.verbose ? Verbosity::Verbose : Verbosity::Normal;
    log.open_trace((out_dir / "average_trace.log").string());
    log.info("WATSIM average v" + std::string(VERSION) + " starting");

    try {
        std::vector<SimilarityMatrix> matrices;
        for (const auto& path : config.matrix_files) {
            matrices.push_back(read_matrix_csv(path));
            log.detail("Loaded " + path + " (" + std::to_string(matrices.back().size()) + " labels)");
        }

        SimilarityMatrix avg = average_matrices(matrices);
        write_matrix_csv(config.output_file, avg);
        log.metric("matrices", matrices.size());
        log.metric("labels", avg.size());
        log.info("Averaged " + std::to_string(matrices.size()) + " matrices -> " + config.output_file);

        if (!config.baseline_file.empty()) {
            SimilarityMatrix baseline = read_matrix_csv(config.baseline_file);
            double r = upper_triangle_correlation(baseline, avg);
            if (std::isnan(r)) {
                log.warn("Correlation undefined (constant or too few pairs) for " + config.baseline_file);
            } else {
                log.metric("pearson_r", r);
                log.info("Pearson r vs baseline: " + std::to_string(r));
            }
        }
    } catch (const std::exception& e) {
        log.error(e.what());
        return 1;
    }
    return 0;
}

}  // namespace watsim

// WATSIM - Centralized Configuration Structures
// All command configs in one place for consistency
#ifndef WATSIM_CONFIG_HPP
#define WATSIM_CONFIG_HPP

#include <string>
#include <utility>
#include <vector>
#include "watsim/version.h"

namespace watsim {

// Global version for all WATSIM tools (set by cmake)
constexpr const char* VERSION = WATSIM_VERSION_STRING;

// N-gram window range used by the table-based metrics
constexpr int DEFAULT_MIN_N = 1;
constexpr int DEFAULT_MAX_N = 6;

// Additive smoothing applied per key before taking logs in the KL metric
constexpr double KL_EPSILON = 1e-10;

// Reference study corpus: 15 (algorithm, language) pairs in matrix order
inline std::vector<std::pair<std::string, std::string>> default_targets() {
    return {
        {"bubsort", "go"},     {"collatz", "go"},
        {"collatz", "js"},     {"bubsort", "js"},
        {"helloworld", "go"},  {"fizzbuzz", "go"},
        {"wordcount", "go"},   {"collatz", "rust"},
        {"bubsort", "rust"},   {"wordcount", "c"},
        {"fizzbuzz", "c"},     {"collatz", "c"},
        {"bubsort", "c"},      {"bubsort", "ts"},
        {"helloworld", "ts"},
    };
}

inline std::vector<std::string> default_algorithms() {
    return {"bubsort", "collatz", "fizzbuzz", "helloworld", "wordcount"};
}

inline std::vector<std::string> default_languages() {
    return {"c", "go", "js", "rust", "ts"};
}

// Instruction dump
struct TokenizeConfig {
    std::string wat_file;
    bool count_only = false;
};

// N-gram table extraction
struct NgramConfig {
    std::string wat_file;          // single file mode
    std::string corpus_root;       // corpus mode: <root>/<algo>/<lang>/**.wat
    std::vector<std::string> algorithms = default_algorithms();
    std::vector<std::string> languages = default_languages();
    int min_n = DEFAULT_MIN_N;
    int max_n = DEFAULT_MAX_N;
    bool verbose = false;
};

// Similarity matrix construction
struct MatrixConfig {
    std::string corpus_root;
    std::string output_dir = ".";
    std::vector<std::pair<std::string, std::string>> targets = default_targets();
    std::vector<std::string> metrics = {"cosine", "jaccard", "overlap", "manhattan", "kl", "lcs"};
    std::string source = "wat";    // wat: tokenize sources, grams: read gram tables
    std::string lcs_method = "min";
    size_t lcs_limit = 0;          // 0 = full instruction sequence
    int min_n = DEFAULT_MIN_N;
    int max_n = DEFAULT_MAX_N;
    int threads = 1;
    bool verbose = false;
};

// Corpus trimming
struct TrimConfig {
    std::string input_root;
    std::string output_root = "trimmed";
    std::string method = "random"; // head, middle, tail, random
    std::string unit = "lines";    // lines or tokens
    size_t target = 500;
    int trials = 10;               // random strategy only
    long long random_seed = -1;    // -1 = seed from random_device
    std::vector<std::string> algorithms = default_algorithms();
    std::vector<std::string> languages = default_languages();
    bool write_grams = false;
    int min_n = DEFAULT_MIN_N;
    int max_n = DEFAULT_MAX_N;
    bool verbose = false;
};

// Trial averaging and baseline comparison
struct AverageConfig {
    std::vector<std::string> matrix_files;
    std::string output_file = "similarity_matrix_avg.csv";
    std::string baseline_file;     // optional
    bool verbose = false;
};

}  // namespace watsim

#endif  // WATSIM_CONFIG_HPP

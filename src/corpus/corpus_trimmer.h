// WATSIM - corpus_trimmer.h
// Produces trimmed copies of a WAT corpus plus per-trial audit logs

#pragma once

#include "corpus.h"
#include "../algorithms/trimming.h"
#include "../util/logger.h"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace watsim {

enum class TrimUnit { Lines, Tokens };

// "lines" or "tokens"; throws std::invalid_argument otherwise
TrimUnit parse_trim_unit(const std::string& name);
const char* trim_unit_name(TrimUnit unit);

// One trimmed output file
struct TrimRecord {
    int trial = 1;
    TrimStrategy strategy = TrimStrategy::Head;
    size_t target = 0;
    uint32_t trial_seed = 0;         // random strategy only
    std::string algorithm;
    std::string language;
    std::string relpath_after_lang;  // relative to <trial>/<algorithm>/<language>
    size_t total = 0;                // lines or tokens before trimming
    size_t kept = 0;
    size_t start = 0;
    size_t bytes_before = 0;
    size_t bytes_after = 0;
};

struct TrimOptions {
    TrimStrategy strategy = TrimStrategy::Random;
    TrimUnit unit = TrimUnit::Lines;
    size_t target = 500;
    int trials = 10;                 // forced to 1 for deterministic strategies
    uint32_t master_seed = 0;
    bool write_grams = false;
    int min_n = 1;
    int max_n = 6;
};

struct TrimSummary {
    std::vector<TrimRecord> records;
    std::vector<uint32_t> trial_seeds;   // one per trial, random strategy only
    size_t failed = 0;                   // inputs that could not be read
};

// trial,algo,lang,relpath_after_lang,total_lines,kept_lines,start_index
std::string format_trim_log(const std::vector<TrimRecord>& records);
void write_trim_log(const std::string& path, const std::vector<TrimRecord>& records);

// Mean of 1 - after/before over records with a non-empty input
double mean_line_reduction(const std::vector<TrimRecord>& records);
double mean_byte_reduction(const std::vector<TrimRecord>& records);

class CorpusTrimmer {
public:
    CorpusTrimmer(const TrimOptions& opts, Logger& log);

    // Writes <output_root>/<trial>/<algorithm>/<language>/<rel> for every
    // input and <output_root>/<trial>/trim_log.csv per trial. Unreadable
    // inputs are warned about and skipped; write failures throw.
    TrimSummary run(const std::vector<WatFile>& files, const std::string& output_root);

    // Trims one text; exposed for tests
    std::string trim_text(const std::string& text, std::mt19937& rng, TrimWindow& window) const;

private:
    void write_grams(const std::string& wat_out, const std::string& trimmed) const;

    TrimOptions opts_;
    Logger& log_;
};

}  // namespace watsim

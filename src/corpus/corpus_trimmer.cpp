// WATSIM - corpus_trimmer.cpp
// Produces trimmed copies of a WAT corpus plus per-trial audit logs

#include "corpus_trimmer.h"
#include "../io/text_io.h"
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace watsim {

namespace fs = std::filesystem;

TrimUnit parse_trim_unit(const std::string& name) {
    if (name == "lines") return TrimUnit::Lines;
    if (name == "tokens") return TrimUnit::Tokens;
    throw std::invalid_argument("Unknown trim unit: '" + name + "' (expected lines or tokens)");
}

const char* trim_unit_name(TrimUnit unit) {
    return unit == TrimUnit::Lines ? "lines" : "tokens";
}

std::string format_trim_log(const std::vector<TrimRecord>& records) {
    std::ostringstream out;
    out << "trial,algo,lang,relpath_after_lang,total_lines,kept_lines,start_index\n";
    for (const auto& r : records) {
        out << r.trial << "," << r.algorithm << "," << r.language << ","
            << r.relpath_after_lang << "," << r.total << "," << r.kept << ","
            << r.start << "\n";
    }
    return out.str();
}

void write_trim_log(const std::string& path, const std::vector<TrimRecord>& records) {
    write_text_file(path, format_trim_log(records));
}

namespace {

template <typename Before, typename After>
double mean_reduction(const std::vector<TrimRecord>& records, Before before, After after) {
    double sum = 0.0;
    size_t count = 0;
    for (const auto& r : records) {
        const size_t b = before(r);
        if (b == 0) continue;
        sum += 1.0 - static_cast<double>(after(r)) / static_cast<double>(b);
        ++count;
    }
    return count > 0 ? sum / count : 0.0;
}

}  // namespace

double mean_line_reduction(const std::vector<TrimRecord>& records) {
    return mean_reduction(records,
                          [](const TrimRecord& r) { return r.total; },
                          [](const TrimRecord& r) { return r.kept; });
}

double mean_byte_reduction(const std::vector<TrimRecord>& records) {
    return mean_reduction(records,
                          [](const TrimRecord& r) { return r.bytes_before; },
                          [](const TrimRecord& r) { return r.bytes_after; });
}

CorpusTrimmer::CorpusTrimmer(const TrimOptions& opts, Logger& log)
    : opts_(opts), log_(log) {
    if (opts_.strategy != TrimStrategy::Random) {
        opts_.trials = 1;
    }
    if (opts_.trials < 1) {
        throw std::invalid_argument("Number of trials must be at least 1");
    }
}

std::string CorpusTrimmer::trim_text(const std::string& text, std::mt19937& rng,
                                     TrimWindow& window) const {
    if (opts_.unit == TrimUnit::Lines) {
        auto lines = split_lines_keepends(text);
        return join_lines(trim_sequence(lines, opts_.target, opts_.strategy, rng, &window));
    }

    auto tokens = tokenize_instructions(text);
    auto kept = trim_sequence(tokens, opts_.target, opts_.strategy, rng, &window);
    std::string out;
    for (const auto& tok : kept) {
        out += tok;
        out += '\n';
    }
    return out;
}

void CorpusTrimmer::write_grams(const std::string& wat_out, const std::string& trimmed) const {
    auto written = write_gram_files(wat_out, tokenize_instructions(trimmed), opts_.min_n, opts_.max_n);
    log_.detail("Wrote " + std::to_string(written.size()) + " gram files for " + wat_out);
}

TrimSummary CorpusTrimmer::run(const std::vector<WatFile>& files, const std::string& output_root) {
    TrimSummary summary;

    // Read every input once; trials only differ in the selected windows
    std::vector<std::string> texts(files.size());
    std::vector<bool> readable(files.size(), false);
    for (size_t f = 0; f < files.size(); ++f) {
        try {
            texts[f] = read_text_file(files[f].path);
            readable[f] = true;
        } catch (const std::exception& e) {
            log_.warn(std::string(e.what()) + " (skipped)");
            ++summary.failed;
        }
    }

    TrialSeeder seeder(opts_.master_seed);

    for (int trial = 1; trial <= opts_.trials; ++trial) {
        std::mt19937 rng;
        uint32_t trial_seed = 0;
        if (opts_.strategy == TrimStrategy::Random) {
            trial_seed = seeder.next_trial_seed();
            rng.seed(trial_seed);
            summary.trial_seeds.push_back(trial_seed);
            log_.metric("trial_" + std::to_string(trial) + "_seed", static_cast<size_t>(trial_seed));
        }

        const fs::path trial_dir = fs::path(output_root) / std::to_string(trial);
        std::vector<TrimRecord> trial_records;

        for (size_t f = 0; f < files.size(); ++f) {
            if (!readable[f]) continue;
            const WatFile& wf = files[f];

            // Compressed inputs are written back as plain text
            std::string rel = wf.relpath_after_lang;
            if (rel.size() > 3 && rel.compare(rel.size() - 3, 3, ".gz") == 0) {
                rel.erase(rel.size() - 3);
            }

            TrimWindow window;
            std::string trimmed = trim_text(texts[f], rng, window);

            const std::string out_path =
                (trial_dir / wf.algorithm / wf.language / fs::path(rel)).string();
            write_text_file(out_path, trimmed);
            if (opts_.write_grams) write_grams(out_path, trimmed);

            TrimRecord rec;
            rec.trial = trial;
            rec.strategy = opts_.strategy;
            rec.target = opts_.target;
            rec.trial_seed = trial_seed;
            rec.algorithm = wf.algorithm;
            rec.language = wf.language;
            rec.relpath_after_lang = rel;
            rec.total = window.total;
            rec.kept = window.kept;
            rec.start = window.start;
            rec.bytes_before = texts[f].size();
            rec.bytes_after = trimmed.size();
            trial_records.push_back(rec);

            log_.detail("trial " + std::to_string(trial) + " " + wf.algorithm + "/" + wf.language +
                        "/" + rel + ": " + std::to_string(window.total) + " -> " +
                        std::to_string(window.kept) + " " + trim_unit_name(opts_.unit) +
                        " (start " + std::to_string(window.start) + ")");
        }

        write_trim_log((trial_dir / "trim_log.csv").string(), trial_records);
        log_.progress("Trials", trial, opts_.trials);

        summary.records.insert(summary.records.end(), trial_records.begin(), trial_records.end());
    }

    return summary;
}

}  // namespace watsim

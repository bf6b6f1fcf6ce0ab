#pragma once

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace watsim {

enum class TrimStrategy { Head, Middle, Tail, Random };

// "head", "middle", "tail" or "random"; throws std::invalid_argument otherwise
TrimStrategy parse_trim_strategy(const std::string& name);
const char* trim_strategy_name(TrimStrategy strategy);

// Contiguous window [start, start + kept) selected from a sequence of
// `total` elements for a requested `target` length.
struct TrimWindow {
    size_t total = 0;
    size_t target = 0;
    size_t start = 0;
    size_t kept = 0;
};

// Window selection per strategy:
//   head    first min(target, total) elements
//   tail    last min(target, total) elements
//   middle  start = (total - target) / 2, whole sequence if target >= total
//   random  start uniform in [0, total - target], whole sequence if total <= target
// `rng` is only consumed by the random strategy, and only when total > target.
TrimWindow select_window(size_t total, size_t target, TrimStrategy strategy, std::mt19937& rng);

// Deterministic strategies only; throws std::invalid_argument for Random
TrimWindow select_window(size_t total, size_t target, TrimStrategy strategy);

template <typename T>
std::vector<T> apply_window(const std::vector<T>& seq, const TrimWindow& w) {
    if (w.start >= seq.size() || w.kept == 0) return {};
    size_t end = std::min(seq.size(), w.start + w.kept);
    return std::vector<T>(seq.begin() + w.start, seq.begin() + end);
}

template <typename T>
std::vector<T> trim_sequence(const std::vector<T>& seq, size_t target,
                             TrimStrategy strategy, std::mt19937& rng,
                             TrimWindow* window_out = nullptr) {
    TrimWindow w = select_window(seq.size(), target, strategy, rng);
    if (window_out) *window_out = w;
    return apply_window(seq, w);
}

// Two-level seeding for random trimming trials.
// The master generator draws one sub-seed in [0, 2^31 - 1] per trial, so a
// fixed master seed reproduces every trial while trials stay independent.
class TrialSeeder {
public:
    explicit TrialSeeder(uint32_t master_seed) : master_(master_seed), master_seed_(master_seed) {}

    uint32_t next_trial_seed() {
        std::uniform_int_distribution<uint32_t> dist(0, 0x7FFFFFFFu);
        return dist(master_);
    }

    uint32_t master_seed() const { return master_seed_; }

private:
    std::mt19937 master_;
    uint32_t master_seed_;
};

}  // namespace watsim

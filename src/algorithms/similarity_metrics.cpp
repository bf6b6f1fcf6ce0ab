#include "similarity_metrics.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <unordered_map>

namespace watsim {

double cosine_similarity(const NGramTable& a, const NGramTable& b) {
    if (a.empty() || b.empty()) return 0.0;

    const NGramTable& small = a.size() <= b.size() ? a : b;
    const NGramTable& large = a.size() <= b.size() ? b : a;

    // Keys missing from either side contribute 0 to the dot product
    double dot = 0.0;
    for (const auto& [key, c] : small.counts) {
        auto it = large.counts.find(key);
        if (it != large.counts.end()) {
            dot += static_cast<double>(c) * static_cast<double>(it->second);
        }
    }

    double norm_a = 0.0, norm_b = 0.0;
    for (const auto& kv : a.counts) norm_a += static_cast<double>(kv.second) * kv.second;
    for (const auto& kv : b.counts) norm_b += static_cast<double>(kv.second) * kv.second;
    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;

    return dot / std::sqrt(norm_a * norm_b);
}

namespace {

size_t key_intersection(const NGramTable& a, const NGramTable& b) {
    const NGramTable& small = a.size() <= b.size() ? a : b;
    const NGramTable& large = a.size() <= b.size() ? b : a;
    size_t inter = 0;
    for (const auto& kv : small.counts) {
        if (large.counts.count(kv.first)) ++inter;
    }
    return inter;
}

}  // namespace

double jaccard_similarity(const NGramTable& a, const NGramTable& b) {
    if (a.empty() || b.empty()) return 0.0;
    size_t inter = key_intersection(a, b);
    size_t uni = a.size() + b.size() - inter;
    return uni > 0 ? static_cast<double>(inter) / uni : 0.0;
}

double overlap_coefficient(const NGramTable& a, const NGramTable& b) {
    if (a.empty() || b.empty()) return 0.0;
    size_t inter = key_intersection(a, b);
    size_t min_size = std::min(a.size(), b.size());
    return static_cast<double>(inter) / min_size;
}

double manhattan_similarity(const NGramTable& a, const NGramTable& b) {
    if (a.empty() || b.empty()) return 0.0;

    double dist = 0.0;
    for (const auto& [key, ca] : a.counts) {
        double cb = static_cast<double>(b.count(key));
        dist += std::fabs(static_cast<double>(ca) - cb);
    }
    for (const auto& [key, cb] : b.counts) {
        if (!a.counts.count(key)) dist += static_cast<double>(cb);
    }

    double total = static_cast<double>(a.total()) + static_cast<double>(b.total());
    if (total == 0.0) return 0.0;
    return 1.0 - dist / total;
}

double kl_similarity(const NGramTable& a, const NGramTable& b, double epsilon) {
    if (a.empty() || b.empty()) return 0.0;

    const double total_a = static_cast<double>(a.total());
    const double total_b = static_cast<double>(b.total());
    if (total_a == 0.0 || total_b == 0.0) return 0.0;

    // KL(P||Q) + KL(Q||P) = sum_k (p'_k - q'_k) * log(p'_k / q'_k)
    // with p' = p + eps and q' = q + eps over the key union
    auto term = [epsilon](double p, double q) {
        double pe = p + epsilon;
        double qe = q + epsilon;
        return (pe - qe) * std::log(pe / qe);
    };

    double divergence = 0.0;
    for (const auto& [key, ca] : a.counts) {
        double p = static_cast<double>(ca) / total_a;
        double q = static_cast<double>(b.count(key)) / total_b;
        divergence += term(p, q);
    }
    for (const auto& [key, cb] : b.counts) {
        if (a.counts.count(key)) continue;
        divergence += term(0.0, static_cast<double>(cb) / total_b);
    }

    return 1.0 / (1.0 + divergence);
}

double mean_over_n(const std::vector<NGramTable>& a, const std::vector<NGramTable>& b,
                   TableMetricFn fn) {
    const size_t count = std::max(a.size(), b.size());
    if (count == 0) return 0.0;

    static const NGramTable empty_table;
    double sum = 0.0;
    for (size_t k = 0; k < count; ++k) {
        const NGramTable& ta = k < a.size() ? a[k] : empty_table;
        const NGramTable& tb = k < b.size() ? b[k] : empty_table;
        sum += fn(ta, tb);
    }
    return sum / static_cast<double>(count);
}

LcsNormalization parse_lcs_normalization(const std::string& name) {
    if (name == "min") return LcsNormalization::Min;
    if (name == "avg") return LcsNormalization::Avg;
    if (name == "max") return LcsNormalization::Max;
    throw std::invalid_argument("Unknown LCS method: '" + name + "' (expected min, avg or max)");
}

const char* lcs_normalization_name(LcsNormalization method) {
    switch (method) {
    case LcsNormalization::Min: return "min";
    case LcsNormalization::Avg: return "avg";
    case LcsNormalization::Max: return "max";
    }
    return "min";
}

size_t lcs_length(const TokenSequence& a, const TokenSequence& b) {
    // Shorter sequence is the inner (column) dimension
    const TokenSequence& outer = a.size() >= b.size() ? a : b;
    const TokenSequence& inner = a.size() >= b.size() ? b : a;
    const size_t m = outer.size();
    const size_t n = inner.size();
    if (m == 0 || n == 0) return 0;

    // Map tokens to integer ids so the inner loop compares integers
    std::unordered_map<std::string, uint32_t> ids;
    ids.reserve(n * 2);
    std::vector<uint32_t> col(n);
    for (size_t j = 0; j < n; ++j) {
        auto it = ids.emplace(inner[j], static_cast<uint32_t>(ids.size())).first;
        col[j] = it->second;
    }
    const uint32_t absent = UINT32_MAX;

    std::vector<uint32_t> prev(n + 1, 0), curr(n + 1, 0);
    for (size_t i = 1; i <= m; ++i) {
        auto it = ids.find(outer[i - 1]);
        const uint32_t ai = it == ids.end() ? absent : it->second;
        curr[0] = 0;
        for (size_t j = 1; j <= n; ++j) {
            if (ai == col[j - 1]) {
                curr[j] = prev[j - 1] + 1;
            } else {
                curr[j] = prev[j] >= curr[j - 1] ? prev[j] : curr[j - 1];
            }
        }
        std::swap(prev, curr);
    }
    return prev[n];
}

double lcs_similarity(const TokenSequence& a, const TokenSequence& b, LcsNormalization method) {
    if (a.empty() || b.empty()) return 0.0;

    const double l = static_cast<double>(lcs_length(a, b));
    const double len1 = static_cast<double>(a.size());
    const double len2 = static_cast<double>(b.size());

    switch (method) {
    case LcsNormalization::Min: return l / std::min(len1, len2);
    case LcsNormalization::Avg: return 2.0 * l / (len1 + len2);
    case LcsNormalization::Max: return l / std::max(len1, len2);
    }
    return 0.0;
}

Metric parse_metric(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "cosine") return Metric::Cosine;
    if (lower == "jaccard") return Metric::Jaccard;
    if (lower == "overlap") return Metric::Overlap;
    if (lower == "manhattan") return Metric::Manhattan;
    if (lower == "kl") return Metric::KL;
    if (lower == "lcs") return Metric::LCS;
    throw std::invalid_argument("Unknown metric: '" + name + "'");
}

const char* metric_name(Metric metric) {
    switch (metric) {
    case Metric::Cosine: return "cosine";
    case Metric::Jaccard: return "jaccard";
    case Metric::Overlap: return "overlap";
    case Metric::Manhattan: return "manhattan";
    case Metric::KL: return "kl";
    case Metric::LCS: return "lcs";
    }
    return "unknown";
}

std::vector<Metric> all_metrics() {
    return {Metric::Cosine, Metric::Jaccard, Metric::Overlap,
            Metric::Manhattan, Metric::KL, Metric::LCS};
}

}  // namespace watsim

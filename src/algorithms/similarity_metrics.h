#pragma once

#include "ngram_table.h"
#include <watsim/config.hpp>
#include <string>
#include <vector>

namespace watsim {

// ============================================================================
// N-GRAM TABLE METRICS
// ============================================================================
// All functions return 0.0 when either table is empty; a missing gram file
// or source is loaded as an empty table and therefore scores 0.0 as well.
//
// | Metric    | Uses          | Score                                   |
// |-----------|---------------|-----------------------------------------|
// | Cosine    | counts        | dot / (|v1| |v2|)                       |
// | Jaccard   | key sets      | |A n B| / |A u B|                       |
// | Overlap   | key sets      | |A n B| / min(|A|, |B|)                 |
// | Manhattan | counts        | 1 - L1(v1, v2) / (sum v1 + sum v2)      |
// | KL        | distributions | 1 / (1 + KL(P||Q) + KL(Q||P))           |

double cosine_similarity(const NGramTable& a, const NGramTable& b);
double jaccard_similarity(const NGramTable& a, const NGramTable& b);
double overlap_coefficient(const NGramTable& a, const NGramTable& b);

// Not clamped: strongly skewed totals can push it below zero
double manhattan_similarity(const NGramTable& a, const NGramTable& b);

// Counts are normalized to probabilities; epsilon is added to every
// probability of the key union before taking logs.
double kl_similarity(const NGramTable& a, const NGramTable& b, double epsilon = KL_EPSILON);

// Arithmetic mean of a table metric over aligned per-n tables
// (a[k] and b[k] must hold the same n). Empty ranges score 0.0.
using TableMetricFn = double (*)(const NGramTable&, const NGramTable&);
double mean_over_n(const std::vector<NGramTable>& a, const std::vector<NGramTable>& b,
                   TableMetricFn fn);

// ============================================================================
// LONGEST COMMON SUBSEQUENCE
// ============================================================================

enum class LcsNormalization { Min, Avg, Max };

// "min", "avg" or "max"; anything else throws std::invalid_argument
LcsNormalization parse_lcs_normalization(const std::string& name);
const char* lcs_normalization_name(LcsNormalization method);

// Two-row DP, O(min(m, n)) memory
size_t lcs_length(const TokenSequence& a, const TokenSequence& b);

// L / min(len), 2L / (len1 + len2) or L / max(len); 0.0 if either is empty
double lcs_similarity(const TokenSequence& a, const TokenSequence& b,
                      LcsNormalization method = LcsNormalization::Min);

// ============================================================================
// METRIC SELECTION
// ============================================================================

enum class Metric { Cosine, Jaccard, Overlap, Manhattan, KL, LCS };

// Case-insensitive; throws std::invalid_argument for unknown names
Metric parse_metric(const std::string& name);
const char* metric_name(Metric metric);
std::vector<Metric> all_metrics();

}  // namespace watsim

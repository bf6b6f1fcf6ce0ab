#pragma once

#include "pairwise_metric.h"
#include "similarity_matrix.h"
#include <functional>
#include <string>
#include <vector>

namespace watsim {

// Reported once per scored pair (i < j)
struct PairScore {
    size_t i = 0;
    size_t j = 0;
    double score = 0.0;
    double elapsed = 0.0;   // seconds spent scoring this pair
    size_t done = 0;        // pairs finished so far, including this one
    size_t total = 0;       // n * (n - 1) / 2
    std::string error;      // set when the metric threw; score is then 0.0
};

using PairObserver = std::function<void(const PairScore&)>;

// Fills a symmetric similarity matrix by scoring each unordered pair once.
// The diagonal is fixed at 1.0 without calling the metric.
class MatrixBuilder {
public:
    explicit MatrixBuilder(const IPairwiseMetric& metric, int threads = 1)
        : metric_(metric), threads_(threads < 1 ? 1 : threads) {}

    // Observer calls are serialized; with threads > 1 they arrive in
    // completion order rather than pair order.
    void set_observer(PairObserver observer) { observer_ = std::move(observer); }

    // Throws std::invalid_argument if labels and reps differ in length.
    // A metric that throws for one pair scores that pair 0.0; the message is
    // passed to the observer and the build continues.
    SimilarityMatrix build(const std::vector<std::string>& labels,
                           const std::vector<ItemRepresentation>& reps) const;

private:
    const IPairwiseMetric& metric_;
    int threads_;
    PairObserver observer_;
};

}  // namespace watsim

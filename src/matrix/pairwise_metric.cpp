#include "pairwise_metric.h"
#include <stdexcept>

namespace watsim {

double TableMetric::score(const ItemRepresentation& a, const ItemRepresentation& b) const {
    if (a.min_n != b.min_n) {
        throw std::invalid_argument("N-gram ranges differ between " + a.label + " and " + b.label);
    }
    return mean_over_n(a.tables, b.tables, fn_);
}

double LcsMetric::score(const ItemRepresentation& a, const ItemRepresentation& b) const {
    return lcs_similarity(a.tokens, b.tokens, method_);
}

std::string LcsMetric::name() const {
    return std::string("lcs_") + lcs_normalization_name(method_);
}

std::unique_ptr<IPairwiseMetric> create_pairwise_metric(Metric metric, LcsNormalization lcs_method) {
    switch (metric) {
        case Metric::Cosine:
            return std::make_unique<TableMetric>(metric, &cosine_similarity);
        case Metric::Jaccard:
            return std::make_unique<TableMetric>(metric, &jaccard_similarity);
        case Metric::Overlap:
            return std::make_unique<TableMetric>(metric, &overlap_coefficient);
        case Metric::Manhattan:
            return std::make_unique<TableMetric>(metric, &manhattan_similarity);
        case Metric::KL:
            return std::make_unique<TableMetric>(
                metric, [](const NGramTable& a, const NGramTable& b) { return kl_similarity(a, b); });
        case Metric::LCS:
            return std::make_unique<LcsMetric>(lcs_method);
    }
    throw std::invalid_argument("Unknown metric");
}

std::string matrix_file_name(Metric metric, LcsNormalization lcs_method) {
    if (metric == Metric::LCS) {
        return std::string("lcs_instruction_similarity_matrix_") +
               lcs_normalization_name(lcs_method) + ".csv";
    }
    return std::string(metric_name(metric)) + "_similarity_matrix.csv";
}

}  // namespace watsim

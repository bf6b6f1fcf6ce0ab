#pragma once

#include "../algorithms/similarity_metrics.h"
#include "../corpus/corpus.h"
#include <memory>
#include <string>

namespace watsim {

// Scores one pair of corpus items. Implementations must be symmetric and
// safe to call concurrently on the same instance.
class IPairwiseMetric {
public:
    virtual ~IPairwiseMetric() = default;

    virtual double score(const ItemRepresentation& a, const ItemRepresentation& b) const = 0;

    // Used for the output file name and log lines
    virtual std::string name() const = 0;

    virtual bool needs_tables() const = 0;
    virtual bool needs_tokens() const = 0;
};

// Cosine, Jaccard, Overlap, Manhattan or KL averaged over the item's n range
class TableMetric : public IPairwiseMetric {
public:
    TableMetric(Metric metric, TableMetricFn fn) : metric_(metric), fn_(fn) {}
    ~TableMetric() override = default;

    double score(const ItemRepresentation& a, const ItemRepresentation& b) const override;
    std::string name() const override { return metric_name(metric_); }
    bool needs_tables() const override { return true; }
    bool needs_tokens() const override { return false; }

private:
    Metric metric_;
    TableMetricFn fn_;
};

class LcsMetric : public IPairwiseMetric {
public:
    explicit LcsMetric(LcsNormalization method) : method_(method) {}
    ~LcsMetric() override = default;

    double score(const ItemRepresentation& a, const ItemRepresentation& b) const override;
    std::string name() const override;
    bool needs_tables() const override { return false; }
    bool needs_tokens() const override { return true; }

private:
    LcsNormalization method_;
};

// lcs_method is ignored for the table metrics
std::unique_ptr<IPairwiseMetric> create_pairwise_metric(
    Metric metric, LcsNormalization lcs_method = LcsNormalization::Min);

// <metric>_similarity_matrix.csv, or lcs_instruction_similarity_matrix_<method>.csv
std::string matrix_file_name(Metric metric, LcsNormalization lcs_method = LcsNormalization::Min);

}  // namespace watsim

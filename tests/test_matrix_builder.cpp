#include <gtest/gtest.h>
#include "corpus/corpus.h"
#include "io/text_io.h"
#include "matrix/matrix_builder.h"
#include "matrix/pairwise_metric.h"
#include <watsim/config.hpp>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <random>
#include <set>
#include <stdexcept>

using namespace watsim;
namespace fs = std::filesystem;

namespace {

// Scores by label length difference and counts how often it is asked
class CountingMetric : public IPairwiseMetric {
public:
    double score(const ItemRepresentation& a, const ItemRepresentation& b) const override {
        ++calls;
        double d = std::fabs((double)a.label.size() - (double)b.label.size());
        return 1.0 / (1.0 + d);
    }
    std::string name() const override { return "counting"; }
    bool needs_tables() const override { return false; }
    bool needs_tokens() const override { return false; }

    mutable std::atomic<int> calls{0};
};

class ThrowingMetric : public CountingMetric {
public:
    double score(const ItemRepresentation&, const ItemRepresentation&) const override {
        throw std::runtime_error("boom");
    }
};

std::vector<ItemRepresentation> reps_for(const std::vector<std::string>& labels) {
    std::vector<ItemRepresentation> reps(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) reps[i].label = labels[i];
    return reps;
}

std::vector<std::string> default_labels() {
    std::vector<std::string> labels;
    for (const auto& item : make_corpus(default_targets())) labels.push_back(item.label());
    return labels;
}

}  // namespace

class MatrixBuilderTest : public ::testing::Test {
protected:
    std::vector<std::string> labels_ = default_labels();
    std::vector<ItemRepresentation> reps_ = reps_for(labels_);
};

TEST_F(MatrixBuilderTest, FifteenLabelsScoreOneHundredFivePairs) {
    CountingMetric metric;
    MatrixBuilder builder(metric);

    std::set<std::pair<size_t, size_t>> seen;
    size_t last_done = 0;
    builder.set_observer([&](const PairScore& ps) {
        EXPECT_LT(ps.i, ps.j);
        EXPECT_EQ(ps.total, 105u);
        EXPECT_EQ(ps.done, last_done + 1);
        EXPECT_GE(ps.elapsed, 0.0);
        last_done = ps.done;
        seen.insert({ps.i, ps.j});
    });

    SimilarityMatrix m = builder.build(labels_, reps_);
    EXPECT_EQ(metric.calls.load(), 105);
    EXPECT_EQ(seen.size(), 105u);
    EXPECT_EQ(m.size(), 15u);
}

TEST_F(MatrixBuilderTest, SymmetricWithUnitDiagonal) {
    CountingMetric metric;
    SimilarityMatrix m = MatrixBuilder(metric).build(labels_, reps_);
    for (size_t i = 0; i < m.size(); ++i) {
        EXPECT_EQ(m(i, i), 1.0);
        for (size_t j = 0; j < m.size(); ++j) {
            EXPECT_EQ(m(i, j), m(j, i));
        }
    }
    EXPECT_TRUE(m.is_symmetric());
    EXPECT_EQ(m.labels(), labels_);
}

TEST_F(MatrixBuilderTest, ParallelMatchesSequential) {
    CountingMetric seq_metric, par_metric;
    SimilarityMatrix seq = MatrixBuilder(seq_metric, 1).build(labels_, reps_);

    MatrixBuilder parallel(par_metric, 4);
    std::atomic<int> observed{0};
    parallel.set_observer([&](const PairScore&) { ++observed; });
    SimilarityMatrix par = parallel.build(labels_, reps_);

    EXPECT_EQ(par_metric.calls.load(), 105);
    EXPECT_EQ(observed.load(), 105);
    EXPECT_TRUE(seq.values() == par.values());
}

TEST_F(MatrixBuilderTest, SizeMismatchThrows) {
    CountingMetric metric;
    reps_.pop_back();
    EXPECT_THROW(MatrixBuilder(metric).build(labels_, reps_), std::invalid_argument);
}

TEST_F(MatrixBuilderTest, MetricErrorsDegradeToZero) {
    ThrowingMetric metric;
    MatrixBuilder builder(metric, 2);
    std::atomic<int> errors{0};
    builder.set_observer([&](const PairScore& ps) {
        if (ps.error == "boom") ++errors;
        EXPECT_EQ(ps.score, 0.0);
    });

    SimilarityMatrix m = builder.build(labels_, reps_);
    EXPECT_EQ(errors.load(), 105);
    EXPECT_EQ(m(0, 1), 0.0);
    EXPECT_EQ(m(3, 3), 1.0);
}

TEST_F(MatrixBuilderTest, SingleAndEmptyCorpora) {
    CountingMetric metric;
    SimilarityMatrix one = MatrixBuilder(metric).build({"a_c"}, reps_for({"a_c"}));
    EXPECT_EQ(one.size(), 1u);
    EXPECT_EQ(one(0, 0), 1.0);
    EXPECT_EQ(MatrixBuilder(metric).build({}, {}).size(), 0u);
    EXPECT_EQ(metric.calls.load(), 0);
}

TEST(PairwiseMetricTest, FactoryAndFileNames) {
    for (Metric m : all_metrics()) {
        auto metric = create_pairwise_metric(m, LcsNormalization::Avg);
        ASSERT_TRUE(metric != nullptr);
        EXPECT_EQ(metric->needs_tokens(), m == Metric::LCS);
        EXPECT_EQ(metric->needs_tables(), m != Metric::LCS);
    }
    EXPECT_EQ(create_pairwise_metric(Metric::LCS, LcsNormalization::Max)->name(), "lcs_max");
    EXPECT_EQ(matrix_file_name(Metric::Cosine), "cosine_similarity_matrix.csv");
    EXPECT_EQ(matrix_file_name(Metric::KL), "kl_similarity_matrix.csv");
    EXPECT_EQ(matrix_file_name(Metric::LCS, LcsNormalization::Avg),
              "lcs_instruction_similarity_matrix_avg.csv");
}

// Full pipeline over a small on-disk corpus
class CorpusMatrixTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root_ = fs::temp_directory_path() / ("watsim_matrix_" + std::to_string(rd()));
        const std::string shared =
            "(module (func (param i32) (result i32)\n"
            "  local.get 0 i32.const 3 i32.mul i32.const 1 i32.add\n"
            "  block loop local.get 0 br_if 1 br 0 end end call 2 drop))\n";
        write_text_file((root_ / "collatz" / "c" / "collatz.wat").string(), shared);
        write_text_file((root_ / "collatz" / "go" / "collatz.wat").string(), shared);
        write_text_file((root_ / "helloworld" / "ts" / "helloworld.wat").string(),
                        "(module (func f64.const 1.5 f64.sqrt f64.neg nop unreachable))\n");
        // fizzbuzz/js is deliberately absent
        log_.console_level = Verbosity::Quiet;

        items_ = make_corpus({{"collatz", "c"}, {"collatz", "go"},
                              {"helloworld", "ts"}, {"fizzbuzz", "js"}});
        for (const auto& item : items_) labels_.push_back(item.label());

        CorpusLoader loader(root_.string(), log_);
        reps_ = loader.load_all(items_, LoadOptions{});
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    Logger log_{"test"};
    std::vector<CorpusItem> items_;
    std::vector<std::string> labels_;
    std::vector<ItemRepresentation> reps_;
};

TEST_F(CorpusMatrixTest, IdenticalSourcesScoreOneOnEveryMetric) {
    for (Metric m : all_metrics()) {
        for (auto method : {LcsNormalization::Min, LcsNormalization::Avg, LcsNormalization::Max}) {
            auto metric = create_pairwise_metric(m, method);
            SimilarityMatrix sim = MatrixBuilder(*metric).build(labels_, reps_);
            EXPECT_NEAR(sim(0, 1), 1.0, 1e-12) << metric->name();
        }
    }
}

TEST_F(CorpusMatrixTest, DisjointVocabulariesScoreZero) {
    for (Metric m : {Metric::Cosine, Metric::Jaccard, Metric::Overlap, Metric::LCS}) {
        auto metric = create_pairwise_metric(m);
        SimilarityMatrix sim = MatrixBuilder(*metric).build(labels_, reps_);
        EXPECT_EQ(sim(0, 2), 0.0) << metric->name();
        EXPECT_EQ(sim(2, 1), 0.0) << metric->name();
    }
}

TEST_F(CorpusMatrixTest, MissingItemScoresZeroAgainstEverything) {
    EXPECT_TRUE(reps_[3].missing);
    for (Metric m : all_metrics()) {
        auto metric = create_pairwise_metric(m);
        SimilarityMatrix sim = MatrixBuilder(*metric, 2).build(labels_, reps_);
        for (size_t i = 0; i < 3; ++i) {
            EXPECT_EQ(sim(i, 3), 0.0) << metric->name();
        }
        EXPECT_EQ(sim(3, 3), 1.0);
    }
}

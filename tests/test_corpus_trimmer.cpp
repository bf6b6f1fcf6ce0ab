#include <gtest/gtest.h>
#include "corpus/corpus_trimmer.h"
#include "io/text_io.h"
#include <filesystem>
#include <random>
#include <stdexcept>

using namespace watsim;
namespace fs = std::filesystem;

class CorpusTrimmerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        base_ = fs::temp_directory_path() / ("watsim_trim_" + std::to_string(rd()));
        input_ = base_ / "data";
        output_ = base_ / "trimmed";

        std::string text;
        for (int i = 1; i <= 100; ++i) {
            text += "    i32.const " + std::to_string(i) + "\n";
        }
        write_text_file((input_ / "bubsort" / "go" / "bubsort.wat").string(), text);
        write_text_file((input_ / "bubsort" / "rust" / "pkg" / "bubsort_bg.wat").string(),
                        "(module\r\n  (func\r\n    nop\r\n    drop))\r\n");
        log_.console_level = Verbosity::Quiet;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    std::vector<WatFile> files() {
        return find_wat_files(input_.string(), {"bubsort"}, {"go", "rust"}, log_);
    }

    fs::path base_, input_, output_;
    Logger log_{"test"};
};

TEST_F(CorpusTrimmerTest, HeadWritesSingleTrialWithLog) {
    TrimOptions opts;
    opts.strategy = TrimStrategy::Head;
    opts.target = 10;
    opts.trials = 5;   // ignored for deterministic strategies

    CorpusTrimmer trimmer(opts, log_);
    TrimSummary summary = trimmer.run(files(), output_.string());

    ASSERT_EQ(summary.records.size(), 2u);
    EXPECT_TRUE(summary.trial_seeds.empty());
    EXPECT_FALSE(fs::exists(output_ / "2"));

    const auto& go = summary.records[0];
    EXPECT_EQ(go.trial, 1);
    EXPECT_EQ(go.total, 100u);
    EXPECT_EQ(go.kept, 10u);
    EXPECT_EQ(go.start, 0u);
    EXPECT_EQ(go.strategy, TrimStrategy::Head);
    EXPECT_EQ(go.target, 10u);
    EXPECT_EQ(go.trial_seed, 0u);

    std::string out = read_text_file((output_ / "1" / "bubsort" / "go" / "bubsort.wat").string());
    EXPECT_EQ(split_lines_keepends(out).size(), 10u);
    EXPECT_EQ(split_lines_keepends(out).front(), "    i32.const 1\n");

    // Shorter than the target: copied byte for byte, CRLF included
    std::string rust = read_text_file((output_ / "1" / "bubsort" / "rust" / "pkg" / "bubsort_bg.wat").string());
    EXPECT_EQ(rust, "(module\r\n  (func\r\n    nop\r\n    drop))\r\n");

    std::string log_csv = read_text_file((output_ / "1" / "trim_log.csv").string());
    EXPECT_EQ(log_csv,
              "trial,algo,lang,relpath_after_lang,total_lines,kept_lines,start_index\n"
              "1,bubsort,go,bubsort.wat,100,10,0\n"
              "1,bubsort,rust,pkg/bubsort_bg.wat,4,4,0\n");
}

TEST_F(CorpusTrimmerTest, RandomTrialsAreReproducibleFromMasterSeed) {
    TrimOptions opts;
    opts.strategy = TrimStrategy::Random;
    opts.target = 10;
    opts.trials = 3;
    opts.master_seed = 42;

    TrimSummary first = CorpusTrimmer(opts, log_).run(files(), (output_ / "a").string());
    TrimSummary second = CorpusTrimmer(opts, log_).run(files(), (output_ / "b").string());

    ASSERT_EQ(first.records.size(), 6u);
    ASSERT_EQ(first.trial_seeds.size(), 3u);
    EXPECT_EQ(first.trial_seeds, second.trial_seeds);
    for (size_t k = 0; k < first.records.size(); ++k) {
        const TrimRecord& rec = first.records[k];
        EXPECT_EQ(rec.strategy, TrimStrategy::Random);
        EXPECT_EQ(rec.target, 10u);
        EXPECT_EQ(rec.trial_seed, first.trial_seeds[static_cast<size_t>(rec.trial - 1)]);
        EXPECT_EQ(rec.start, second.records[k].start);
        EXPECT_LE(first.records[k].start, 90u);
    }
    for (int trial = 1; trial <= 3; ++trial) {
        EXPECT_TRUE(fs::exists(output_ / "a" / std::to_string(trial) / "trim_log.csv"));
    }

    // Window content matches the recorded start
    const auto& rec = first.records[0];
    std::string out = read_text_file((output_ / "a" / "1" / "bubsort" / "go" / "bubsort.wat").string());
    EXPECT_EQ(split_lines_keepends(out).front(),
              "    i32.const " + std::to_string(rec.start + 1) + "\n");
}

TEST_F(CorpusTrimmerTest, TokenUnitWritesOneInstructionPerLine) {
    TrimOptions opts;
    opts.strategy = TrimStrategy::Tail;
    opts.unit = TrimUnit::Tokens;
    opts.target = 3;
    opts.write_grams = true;
    opts.min_n = 1;
    opts.max_n = 2;

    TrimSummary summary = CorpusTrimmer(opts, log_).run(files(), output_.string());
    ASSERT_EQ(summary.records.size(), 2u);
    EXPECT_EQ(summary.records[0].total, 100u);
    EXPECT_EQ(summary.records[0].start, 97u);

    const fs::path go_dir = output_ / "1" / "bubsort" / "go";
    EXPECT_EQ(read_text_file((go_dir / "bubsort.wat").string()), "i32.const\ni32.const\ni32.const\n");
    NGramTable uni = parse_ngram_table(read_text_file((go_dir / "grams" / "bubsort_1gram.txt").string()), 1);
    EXPECT_EQ(uni.count("i32.const"), 3u);
    EXPECT_TRUE(fs::exists(go_dir / "grams" / "bubsort_2gram.txt"));
    EXPECT_TRUE(fs::exists(output_ / "1" / "bubsort" / "rust" / "pkg" / "grams" / "bubsort_bg_1gram.txt"));
}

TEST_F(CorpusTrimmerTest, ReductionStatistics) {
    std::vector<TrimRecord> records(2);
    records[0].total = 100;
    records[0].kept = 25;
    records[0].bytes_before = 1000;
    records[0].bytes_after = 500;
    records[1].total = 0;   // empty input is ignored
    EXPECT_DOUBLE_EQ(mean_line_reduction(records), 0.75);
    EXPECT_DOUBLE_EQ(mean_byte_reduction(records), 0.5);
    EXPECT_EQ(mean_line_reduction({}), 0.0);
}

TEST(TrimUnitTest, ParseNames) {
    EXPECT_EQ(parse_trim_unit("lines"), TrimUnit::Lines);
    EXPECT_EQ(parse_trim_unit("tokens"), TrimUnit::Tokens);
    EXPECT_THROW(parse_trim_unit("bytes"), std::invalid_argument);
}

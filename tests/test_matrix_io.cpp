#include <gtest/gtest.h>
#include "matrix/matrix_io.h"
#include "matrix/similarity_matrix.h"
#include <cmath>
#include <filesystem>
#include <random>
#include <stdexcept>

using namespace watsim;
namespace fs = std::filesystem;

namespace {

SimilarityMatrix make_matrix(const std::vector<std::string>& labels,
                             std::initializer_list<double> upper) {
    SimilarityMatrix m(labels);
    auto it = upper.begin();
    for (size_t i = 0; i < labels.size(); ++i) {
        for (size_t j = i + 1; j < labels.size(); ++j) {
            m.set_symmetric(i, j, *it++);
        }
    }
    return m;
}

}  // namespace

class MatrixIoTest : public ::testing::Test {
protected:
    std::vector<std::string> labels_ = {"bubsort_go", "collatz_go", "collatz_js"};
    SimilarityMatrix a_ = make_matrix(labels_, {0.5, 0.25, 0.125});
    SimilarityMatrix b_ = make_matrix(labels_, {0.7, 0.35, 0.1});
};

TEST_F(MatrixIoTest, CsvLayout) {
    EXPECT_EQ(format_matrix_csv(a_),
              ",bubsort_go,collatz_go,collatz_js\n"
              "bubsort_go,1,0.5,0.25\n"
              "collatz_go,0.5,1,0.125\n"
              "collatz_js,0.25,0.125,1\n");
}

TEST_F(MatrixIoTest, ParseRestoresLabelsAndValues) {
    SimilarityMatrix back = parse_matrix_csv(format_matrix_csv(b_));
    EXPECT_EQ(back.labels(), labels_);
    EXPECT_TRUE(back.values() == b_.values());
}

TEST_F(MatrixIoTest, WriteAndReadFile) {
    std::random_device rd;
    const fs::path dir = fs::temp_directory_path() / ("watsim_io_" + std::to_string(rd()));
    const std::string path = (dir / "nested" / "cosine_similarity_matrix.csv").string();

    write_matrix_csv(path, a_);
    SimilarityMatrix back = read_matrix_csv(path);
    EXPECT_EQ(back.labels(), labels_);
    EXPECT_DOUBLE_EQ(back(0, 2), 0.25);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_F(MatrixIoTest, EmptyCellsReadAsNaN) {
    SimilarityMatrix m = parse_matrix_csv(",a,b\na,1,\nb,,1\n");
    EXPECT_TRUE(std::isnan(m(0, 1)));
    EXPECT_EQ(m(1, 1), 1.0);
}

TEST_F(MatrixIoTest, MalformedTablesThrow) {
    EXPECT_THROW(parse_matrix_csv(""), std::runtime_error);
    EXPECT_THROW(parse_matrix_csv(",a,b\na,1,0\n"), std::runtime_error);          // missing row
    EXPECT_THROW(parse_matrix_csv(",a,b\na,1,0\nb,0\n"), std::runtime_error);     // ragged
    EXPECT_THROW(parse_matrix_csv(",a,b\na,1,0\nc,0,1\n"), std::runtime_error);   // row label
    EXPECT_THROW(parse_matrix_csv(",a,b\na,1,x\nb,0,1\n"), std::runtime_error);   // value
    EXPECT_THROW(read_matrix_csv("/nonexistent/watsim/matrix.csv"), std::runtime_error);
}

TEST_F(MatrixIoTest, AverageIsElementWiseMean) {
    SimilarityMatrix avg = average_matrices({a_, b_});
    EXPECT_EQ(avg.labels(), labels_);
    EXPECT_DOUBLE_EQ(avg(0, 1), 0.6);
    EXPECT_DOUBLE_EQ(avg(1, 0), 0.6);
    EXPECT_DOUBLE_EQ(avg(0, 2), 0.3);
    EXPECT_DOUBLE_EQ(avg(1, 2), 0.1125);
    for (size_t i = 0; i < avg.size(); ++i) EXPECT_DOUBLE_EQ(avg(i, i), 1.0);
}

TEST_F(MatrixIoTest, AverageRejectsMismatchedMatrices) {
    SimilarityMatrix other_labels = make_matrix({"bubsort_go", "collatz_go", "fizzbuzz_c"}, {0, 0, 0});
    SimilarityMatrix smaller = make_matrix({"bubsort_go", "collatz_go"}, {0.5});
    EXPECT_THROW(average_matrices({a_, other_labels}), std::invalid_argument);
    EXPECT_THROW(average_matrices({a_, smaller}), std::invalid_argument);
    EXPECT_THROW(average_matrices({}), std::invalid_argument);
}

TEST_F(MatrixIoTest, UpperTriangleCorrelation) {
    // b's triangle (0.7, 0.35, 0.1) is not a linear map of a's, c's is
    SimilarityMatrix c = make_matrix(labels_, {0.9, 0.4, 0.15});
    EXPECT_NEAR(upper_triangle_correlation(a_, c), 1.0, 1e-12);

    SimilarityMatrix reversed = make_matrix(labels_, {0.125, 0.25, 0.5});
    EXPECT_NEAR(upper_triangle_correlation(a_, reversed), -0.9285714285714286, 1e-12);

    double r = upper_triangle_correlation(a_, b_);
    EXPECT_GT(r, 0.9);
    EXPECT_LE(r, 1.0);
}

TEST_F(MatrixIoTest, CorrelationUndefinedCases) {
    SimilarityMatrix flat = make_matrix(labels_, {0.5, 0.5, 0.5});
    EXPECT_TRUE(std::isnan(upper_triangle_correlation(a_, flat)));

    SimilarityMatrix two = make_matrix({"x_c", "y_c"}, {0.4});
    EXPECT_TRUE(std::isnan(upper_triangle_correlation(two, two)));

    SimilarityMatrix smaller = make_matrix({"bubsort_go", "collatz_go"}, {0.5});
    EXPECT_THROW(upper_triangle_correlation(a_, smaller), std::invalid_argument);
}

TEST_F(MatrixIoTest, CorrelationSkipsNaNPairs) {
    SimilarityMatrix base = parse_matrix_csv(
        ",a_c,b_c,c_c,d_c\n"
        "a_c,1,0.1,0.2,0.3\n"
        "b_c,0.1,1,0.15,0.25\n"
        "c_c,0.2,0.15,1,0.05\n"
        "d_c,0.3,0.25,0.05,1\n");
    // Twice the baseline, with the (a_c, d_c) cell left empty
    SimilarityMatrix avg = parse_matrix_csv(
        ",a_c,b_c,c_c,d_c\n"
        "a_c,1,0.2,0.4,\n"
        "b_c,0.2,1,0.3,0.5\n"
        "c_c,0.4,0.3,1,0.1\n"
        "d_c,,0.5,0.1,1\n");
    ASSERT_TRUE(std::isnan(avg(0, 3)));
    EXPECT_NEAR(upper_triangle_correlation(base, avg), 1.0, 1e-12);

    // Only one usable pair left
    SimilarityMatrix sparse = parse_matrix_csv(
        ",a_c,b_c,c_c\n"
        "a_c,1,0.5,\n"
        "b_c,0.5,1,\n"
        "c_c,,,1\n");
    SimilarityMatrix full = make_matrix({"a_c", "b_c", "c_c"}, {0.5, 0.25, 0.125});
    EXPECT_TRUE(std::isnan(upper_triangle_correlation(full, sparse)));
}

TEST(SimilarityMatrixTest, RejectsNonSquareValues) {
    EXPECT_THROW(SimilarityMatrix({"a", "b"}, Eigen::MatrixXd::Zero(2, 3)), std::invalid_argument);
    EXPECT_THROW(SimilarityMatrix({"a"}, Eigen::MatrixXd::Zero(2, 2)), std::invalid_argument);
}

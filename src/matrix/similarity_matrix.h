#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace watsim {

// Square symmetric similarity matrix over an ordered label list.
// A freshly constructed matrix has 1.0 on the diagonal and 0.0 elsewhere.
class SimilarityMatrix {
public:
    SimilarityMatrix() = default;
    explicit SimilarityMatrix(std::vector<std::string> labels);

    // Wraps existing values (e.g. read from disk). Throws std::invalid_argument
    // if the matrix is not square or its size differs from the label count.
    SimilarityMatrix(std::vector<std::string> labels, Eigen::MatrixXd values);

    size_t size() const { return labels_.size(); }
    const std::vector<std::string>& labels() const { return labels_; }
    const Eigen::MatrixXd& values() const { return values_; }

    double operator()(size_t i, size_t j) const { return values_(i, j); }

    // Assigns (i, j) and (j, i)
    void set_symmetric(size_t i, size_t j, double value);

    bool is_symmetric(double tol = 0.0) const;

    // Strict upper triangle (i < j) in row-major order
    Eigen::VectorXd upper_triangle() const;

private:
    std::vector<std::string> labels_;
    Eigen::MatrixXd values_;
};

// Throws std::invalid_argument unless both matrices have the same labels in
// the same order.
void require_same_shape(const SimilarityMatrix& a, const SimilarityMatrix& b);

// Element-wise mean. Throws std::invalid_argument on an empty list or a
// shape/label mismatch.
SimilarityMatrix average_matrices(const std::vector<SimilarityMatrix>& matrices);

// Pearson correlation between the strict upper triangles of two matrices
// with identical labels. Pairs where either value is NaN are skipped; the
// result is NaN when fewer than two pairs remain or either side is constant. Throws std::invalid_argument on mismatch.
double upper_triangle_correlation(const SimilarityMatrix& a, const SimilarityMatrix& b);

}  // namespace watsim

#include "similarity_matrix.h"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace watsim {

SimilarityMatrix::SimilarityMatrix(std::vector<std::string> labels)
    : labels_(std::move(labels)) {
    const Eigen::Index n = static_cast<Eigen::Index>(labels_.size());
    values_ = Eigen::MatrixXd::Zero(n, n);
    values_.diagonal().setOnes();
}

SimilarityMatrix::SimilarityMatrix(std::vector<std::string> labels, Eigen::MatrixXd values)
    : labels_(std::move(labels)), values_(std::move(values)) {
    if (values_.rows() != values_.cols()) {
        throw std::invalid_argument("Similarity matrix is not square: " +
                                    std::to_string(values_.rows()) + "x" +
                                    std::to_string(values_.cols()));
    }
    if (static_cast<size_t>(values_.rows()) != labels_.size()) {
        throw std::invalid_argument("Similarity matrix has " + std::to_string(values_.rows()) +
                                    " rows but " + std::to_string(labels_.size()) + " labels");
    }
}

void SimilarityMatrix::set_symmetric(size_t i, size_t j, double value) {
    values_(i, j) = value;
    values_(j, i) = value;
}

bool SimilarityMatrix::is_symmetric(double tol) const {
    const Eigen::Index n = values_.rows();
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            if (std::fabs(values_(i, j) - values_(j, i)) > tol) return false;
        }
    }
    return true;
}

Eigen::VectorXd SimilarityMatrix::upper_triangle() const {
    const Eigen::Index n = values_.rows();
    Eigen::VectorXd v(n * (n - 1) / 2);
    Eigen::Index k = 0;
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            v(k++) = values_(i, j);
        }
    }
    return v;
}

void require_same_shape(const SimilarityMatrix& a, const SimilarityMatrix& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Matrix size mismatch: " + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()));
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a.labels()[i] != b.labels()[i]) {
            throw std::invalid_argument("Matrix label mismatch at position " + std::to_string(i) +
                                        ": " + a.labels()[i] + " vs " + b.labels()[i]);
        }
    }
}

SimilarityMatrix average_matrices(const std::vector<SimilarityMatrix>& matrices) {
    if (matrices.empty()) {
        throw std::invalid_argument("No matrices to average");
    }

    Eigen::MatrixXd sum = matrices.front().values();
    for (size_t k = 1; k < matrices.size(); ++k) {
        require_same_shape(matrices.front(), matrices[k]);
        sum += matrices[k].values();
    }
    sum /= static_cast<double>(matrices.size());
    return SimilarityMatrix(matrices.front().labels(), std::move(sum));
}

double upper_triangle_correlation(const SimilarityMatrix& a, const SimilarityMatrix& b) {
    require_same_shape(a, b);

    const Eigen::VectorXd ua = a.upper_triangle();
    const Eigen::VectorXd ub = b.upper_triangle();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    // Pairs with an empty cell on either side are left out
    Eigen::VectorXd x(ua.size());
    Eigen::VectorXd y(ub.size());
    Eigen::Index n = 0;
    for (Eigen::Index k = 0; k < ua.size(); ++k) {
        if (std::isfinite(ua[k]) && std::isfinite(ub[k])) {
            x[n] = ua[k];
            y[n] = ub[k];
            ++n;
        }
    }
    x.conservativeResize(n);
    y.conservativeResize(n);
    if (n < 2) return nan;

    const Eigen::ArrayXd dx = x.array() - x.mean();
    const Eigen::ArrayXd dy = y.array() - y.mean();
    const double sxx = (dx * dx).sum();
    const double syy = (dy * dy).sum();
    if (sxx == 0.0 || syy == 0.0) return nan;

    return (dx * dy).sum() / std::sqrt(sxx * syy);
}

}  // namespace watsim

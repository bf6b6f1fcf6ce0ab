#include "matrix_builder.h"
#include <chrono>
#include <omp.h>
#include <stdexcept>
#include <utility>

namespace watsim {

SimilarityMatrix MatrixBuilder::build(const std::vector<std::string>& labels,
                                      const std::vector<ItemRepresentation>& reps) const {
    if (labels.size() != reps.size()) {
        throw std::invalid_argument("Got " + std::to_string(labels.size()) + " labels but " +
                                    std::to_string(reps.size()) + " representations");
    }

    SimilarityMatrix matrix(labels);
    const size_t n = labels.size();

    std::vector<std::pair<size_t, size_t>> pairs;
    pairs.reserve(n * (n > 0 ? n - 1 : 0) / 2);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            pairs.emplace_back(i, j);
        }
    }

    const size_t total = pairs.size();
    std::vector<double> scores(total, 0.0);
    size_t done = 0;

    #pragma omp parallel for schedule(dynamic, 1) num_threads(threads_)
    for (size_t p = 0; p < total; ++p) {
        const size_t i = pairs[p].first;
        const size_t j = pairs[p].second;
        auto t0 = std::chrono::steady_clock::now();
        double s = 0.0;
        std::string error;
        try {
            s = metric_.score(reps[i], reps[j]);
        } catch (const std::exception& e) {
            error = e.what();
        }
        double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        scores[p] = s;

        #pragma omp critical(watsim_matrix_observer)
        {
            ++done;
            if (observer_) {
                PairScore ps;
                ps.i = i;
                ps.j = j;
                ps.score = s;
                ps.elapsed = secs;
                ps.done = done;
                ps.total = total;
                ps.error = std::move(error);
                observer_(ps);
            }
        }
    }

    for (size_t p = 0; p < total; ++p) {
        matrix.set_symmetric(pairs[p].first, pairs[p].second, scores[p]);
    }
    return matrix;
}

}  // namespace watsim

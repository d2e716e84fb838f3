#include "kmeanix/lloyd.hpp"
#include "kmeanix/logging.hpp"
#include "kmeanix/scratch.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace kmeanix {

const char* to_string(LloydState s) {
    switch (s) {
        case LloydState::Initializing: return "initializing";
        case LloydState::Assigning:    return "assigning";
        case LloydState::Updating:     return "updating";
        case LloydState::Converged:    return "converged";
        case LloydState::Exhausted:    return "exhausted";
    }
    return "unknown";
}

template <typename T>
LloydRefiner<T>::LloydRefiner(const DistanceEngine<T>& engine, size_t max_iter,
                              double tol, bool inertia_check)
    : engine_(engine), max_iter_(max_iter), tol_(tol), inertia_check_(inertia_check) {
    if (max_iter_ == 0)
        throw std::invalid_argument("LloydRefiner: max_iter must be >= 1");
}

template <typename T>
T LloydRefiner<T>::assign_pass(MatrixView<T> x, const T* weights,
                               MatrixView<T> centroids, std::vector<int>& labels,
                               T* sums, T* counts) const {
    const size_t dim = x.cols;
    T inertia = T(0);

    engine_.for_each_nearest(x, centroids, [&](Batch b, const int* l, const T* d) {
        for (size_t i = 0; i < b.size; ++i) {
            const size_t gi = b.offset + i;
            const T w = weights ? weights[gi] : T(1);
            labels[gi] = l[i];
            inertia += w * d[i];
            if (counts) counts[l[i]] += w;
        }
        if (!sums) return;

        // Column-parallel: every (centroid, feature) cell still sums rows in order.
        #pragma omp parallel for schedule(static) if (dim >= 32)
        for (size_t j = 0; j < dim; ++j) {
            for (size_t i = 0; i < b.size; ++i) {
                const size_t gi = b.offset + i;
                const T w = weights ? weights[gi] : T(1);
                sums[static_cast<size_t>(l[i]) * dim + j] += w * x.row(gi)[j];
            }
        }
    });
    return inertia;
}

template <typename T>
LloydResult<T> LloydRefiner<T>::run(MatrixView<T> x, const T* weights,
                                    Matrix<T> centroids) {
    state_ = LloydState::Initializing;
    if (centroids.cols() != x.cols)
        throw std::invalid_argument("LloydRefiner: centroid width differs from data width");

    const size_t k = centroids.rows();
    const size_t dim = x.cols;

    LloydResult<T> res;
    allocate_scratch(res.labels, x.rows, "label buffer");
    std::vector<T> sums, counts;
    allocate_scratch(sums, k * dim, "centroid accumulator");
    allocate_scratch(counts, k, "cluster weight accumulator");

    T prev = std::numeric_limits<T>::infinity();
    bool converged = false;

    for (size_t iter = 1; iter <= max_iter_; ++iter) {
        state_ = LloydState::Assigning;
        std::fill(sums.begin(), sums.end(), T(0));
        std::fill(counts.begin(), counts.end(), T(0));
        const T inertia = assign_pass(x, weights, centroids.view(), res.labels,
                                      sums.data(), counts.data());

        state_ = LloydState::Updating;
        double shift = 0.0;
        size_t empty = 0;
        for (size_t c = 0; c < k; ++c) {
            if (counts[c] <= T(0)) {
                ++empty;
                continue;
            }
            T* cv = centroids.row(c);
            const T* s = sums.data() + c * dim;
            for (size_t j = 0; j < dim; ++j) {
                const T nv = s[j] / counts[c];
                const double d = static_cast<double>(nv) - static_cast<double>(cv[j]);
                shift += d * d;
                cv[j] = nv;
            }
        }

        res.history.push_back({iter, static_cast<double>(inertia), shift, empty});
        res.n_iter = iter;

        if (empty > 0)
            KMEANIX_WARN("lloyd", "iteration %zu: %zu empty cluster(s) kept at previous position",
                         iter, empty);
        KMEANIX_DEBUG("lloyd", "iteration %zu: inertia=%.6e shift=%.6e",
                      iter, static_cast<double>(inertia), shift);

        if (inertia_check_ && iter > 1 &&
            static_cast<double>(prev - inertia) <= tol_ * static_cast<double>(prev)) {
            converged = true;
            break;
        }
        prev = inertia;
    }

    state_ = converged ? LloydState::Converged : LloydState::Exhausted;
    res.state = state_;

    res.inertia = assign_pass(x, weights, centroids.view(), res.labels, nullptr, nullptr);
    res.centroids = std::move(centroids);
    return res;
}

template class LloydRefiner<float>;
template class LloydRefiner<double>;

}  // namespace kmeanix

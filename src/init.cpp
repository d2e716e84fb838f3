#include "kmeanix/init.hpp"
#include "kmeanix/errors.hpp"
#include "kmeanix/lloyd.hpp"
#include "kmeanix/logging.hpp"
#include "kmeanix/scratch.hpp"

#include "absl/container/flat_hash_set.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <new>
#include <string>
#include <vector>

namespace kmeanix {

namespace {

template <typename T>
Matrix<T> gather_rows(MatrixView<T> x, const std::vector<size_t>& idx) {
    Matrix<T> out;
    try {
        out = Matrix<T>(idx.size(), x.cols);
    } catch (const std::bad_alloc&) {
        throw ResourceError("cannot allocate candidate set (" +
                            std::to_string(idx.size()) + " rows)");
    }
    for (size_t r = 0; r < idx.size(); ++r)
        std::memcpy(out.row(r), x.row(idx[r]), x.cols * sizeof(T));
    return out;
}

// Index drawn proportionally to mass[i]; uniform when the total is zero.
template <typename T>
size_t sample_proportional(const std::vector<T>& mass, Rng& rng) {
    double total = 0.0;
    for (T m : mass) total += static_cast<double>(m);
    if (!(total > 0.0)) {
        std::uniform_int_distribution<size_t> u(0, mass.size() - 1);
        return u(rng);
    }
    std::discrete_distribution<size_t> pick(mass.begin(), mass.end());
    return pick(rng);
}

// Uniform draws until size() reaches k, preferring rows not yet used.
void pad_indices(std::vector<size_t>& idx, absl::flat_hash_set<size_t>& used,
                 size_t n, size_t k, Rng& rng) {
    std::uniform_int_distribution<size_t> u(0, n - 1);
    while (idx.size() < k) {
        size_t r = u(rng);
        if (used.size() < n) {
            while (used.contains(r)) r = u(rng);
            used.insert(r);
        }
        idx.push_back(r);
    }
}

}  // namespace

template <typename T>
Matrix<T> init_from_array(size_t k, MatrixView<T> x, MatrixView<T> array) {
    if (array.rows != k)
        throw ConfigError("init array has " + std::to_string(array.rows) +
                          " rows, n_clusters is " + std::to_string(k));
    if (array.cols != x.cols)
        throw DimensionMismatch("init array has " + std::to_string(array.cols) +
                                " features, data has " + std::to_string(x.cols));
    return Matrix<T>::copy_of(array);
}

template <typename T>
Matrix<T> init_random(size_t k, MatrixView<T> x, Rng& rng) {
    const size_t n = x.rows;
    std::vector<size_t> idx;
    idx.reserve(k);

    if (k <= n) {
        // Floyd: exactly k draws, all distinct.
        absl::flat_hash_set<size_t> seen;
        seen.reserve(k);
        for (size_t j = n - k; j < n; ++j) {
            std::uniform_int_distribution<size_t> u(0, j);
            size_t t = u(rng);
            if (!seen.insert(t).second) {
                seen.insert(j);
                t = j;
            }
            idx.push_back(t);
        }
    } else {
        for (size_t i = 0; i < n; ++i) idx.push_back(i);
        std::uniform_int_distribution<size_t> u(0, n - 1);
        while (idx.size() < k) idx.push_back(u(rng));
        KMEANIX_WARN("init", "random init: n_clusters=%zu exceeds %zu rows, duplicates drawn",
                     k, n);
    }
    return gather_rows(x, idx);
}

template <typename T>
Matrix<T> kmeanspp_select(MatrixView<T> pts, const T* weights, size_t k, Rng& rng) {
    const size_t m = pts.rows;
    const size_t dim = pts.cols;
    Matrix<T> out(k, dim);

    std::vector<T> w(m, T(1));
    if (weights) std::copy(weights, weights + m, w.begin());

    size_t first = sample_proportional(w, rng);
    std::memcpy(out.row(0), pts.row(first), dim * sizeof(T));

    std::vector<T> min_dist(m);
    for (size_t i = 0; i < m; ++i)
        min_dist[i] = l2sq(pts.row(i), out.row(0), dim);

    std::vector<T> mass(m);
    for (size_t cc = 1; cc < k; ++cc) {
        for (size_t i = 0; i < m; ++i) mass[i] = w[i] * min_dist[i];
        const size_t chosen = sample_proportional(mass, rng);
        std::memcpy(out.row(cc), pts.row(chosen), dim * sizeof(T));

        const T* c_new = out.row(cc);
        for (size_t i = 0; i < m; ++i) {
            T d = l2sq(pts.row(i), c_new, dim);
            if (d < min_dist[i]) min_dist[i] = d;
        }
    }
    return out;
}

template <typename T>
Matrix<T> init_scalable(const KMeansParams& p, MatrixView<T> x, const T* weights,
                        Rng& rng, const DistanceEngine<T>& engine,
                        ScalableInitStats* stats) {
    const size_t n = x.rows;
    const size_t k = p.n_clusters;
    const double ell = p.oversampling_factor * static_cast<double>(k);

    ScalableInitStats local;
    ScalableInitStats& st = stats ? *stats : local;
    st = ScalableInitStats{};

    std::vector<size_t> cand_idx;
    absl::flat_hash_set<size_t> chosen;

    std::uniform_int_distribution<size_t> uidx(0, n - 1);
    const size_t first = uidx(rng);
    cand_idx.push_back(first);
    chosen.insert(first);

    // Sampling distances use the direct kernel: coincident rows give exactly 0
    // and phi does not depend on the batch shape.
    const DistanceEngine<T> direct(Metric::L2Unexpanded, engine.batch_samples(),
                                   engine.batch_centroids());

    std::vector<T> min_dist;
    allocate_scratch(min_dist, n, "k-means|| distance buffer");
    {
        Matrix<T> seed = gather_rows(x, cand_idx);
        direct.nearest(x, seed.view(), nullptr, min_dist.data());
    }

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::vector<size_t> fresh;

    for (int round = 0; round < kScalableInitRounds; ++round) {
        double phi = 0.0;
        for (size_t i = 0; i < n; ++i) {
            const double w = weights ? static_cast<double>(weights[i]) : 1.0;
            phi += w * static_cast<double>(min_dist[i]);
        }

        fresh.clear();
        if (phi > 0.0) {
            for (size_t i = 0; i < n; ++i) {
                if (min_dist[i] <= T(0)) continue;
                const double w = weights ? static_cast<double>(weights[i]) : 1.0;
                const double prob = std::min(1.0, ell * w * static_cast<double>(min_dist[i]) / phi);
                if (prob > 0.0 && coin(rng) < prob && !chosen.contains(i))
                    fresh.push_back(i);
            }
        }

        if (fresh.empty()) {
            ++st.rounds_skipped;
            KMEANIX_WARN("init", "k-means|| round %d: no candidates sampled (potential=%.6e), skipped",
                         round + 1, phi);
            continue;
        }
        ++st.rounds_sampled;

        for (size_t i : fresh) chosen.insert(i);
        cand_idx.insert(cand_idx.end(), fresh.begin(), fresh.end());

        Matrix<T> added = gather_rows(x, fresh);
        direct.for_each_nearest(x, added.view(), [&](Batch b, const int*, const T* d) {
            for (size_t i = 0; i < b.size; ++i) {
                T& md = min_dist[b.offset + i];
                if (d[i] < md) md = d[i];
            }
        });

        KMEANIX_DEBUG("init", "k-means|| round %d: +%zu candidates (total %zu), potential=%.6e",
                      round + 1, fresh.size(), cand_idx.size(), phi);
    }

    st.candidates = cand_idx.size();

    if (cand_idx.size() <= k) {
        if (cand_idx.size() < k) {
            st.padded = k - cand_idx.size();
            KMEANIX_WARN("init", "k-means|| produced %zu candidates for %zu clusters, padding with random rows",
                         cand_idx.size(), k);
            pad_indices(cand_idx, chosen, n, k, rng);
        }
        return gather_rows(x, cand_idx);
    }

    Matrix<T> cands = gather_rows(x, cand_idx);

    // Candidate weight = weight of the rows it is nearest to.
    std::vector<T> cand_w;
    allocate_scratch(cand_w, cands.rows(), "candidate weight buffer");
    direct.for_each_nearest(x, cands.view(), [&](Batch b, const int* l, const T*) {
        for (size_t i = 0; i < b.size; ++i)
            cand_w[l[i]] += weights ? weights[b.offset + i] : T(1);
    });

    Matrix<T> seeds = kmeanspp_select(cands.view(), cand_w.data(), k, rng);

    LloydRefiner<T> reducer(engine, kReductionMaxIter, p.tol, true);
    LloydResult<T> reduced = reducer.run(cands.view(), cand_w.data(), std::move(seeds));
    st.reduction_iters = reduced.n_iter;

    KMEANIX_DEBUG("init", "k-means|| reduced %zu candidates to %zu centroids in %zu iterations",
                  cands.rows(), k, reduced.n_iter);
    return std::move(reduced.centroids);
}

template <typename T>
Matrix<T> initialize_centroids(const KMeansParams& p, MatrixView<T> x,
                               const T* weights, MatrixView<T> array, Rng& rng,
                               const DistanceEngine<T>& engine,
                               ScalableInitStats* stats) {
    switch (p.init) {
        case InitMethod::Array:
            return init_from_array(p.n_clusters, x, array);
        case InitMethod::Random:
            return init_random(p.n_clusters, x, rng);
        case InitMethod::ScalableKMeansPlusPlus:
            return init_scalable(p, x, weights, rng, engine, stats);
    }
    throw ConfigError("unsupported init method");
}

#define KMEANIX_INSTANTIATE_INIT(T)                                                    \
    template Matrix<T> init_from_array<T>(size_t, MatrixView<T>, MatrixView<T>);       \
    template Matrix<T> init_random<T>(size_t, MatrixView<T>, Rng&);                    \
    template Matrix<T> kmeanspp_select<T>(MatrixView<T>, const T*, size_t, Rng&);      \
    template Matrix<T> init_scalable<T>(const KMeansParams&, MatrixView<T>, const T*,  \
                                        Rng&, const DistanceEngine<T>&,                \
                                        ScalableInitStats*);                           \
    template Matrix<T> initialize_centroids<T>(const KMeansParams&, MatrixView<T>,     \
                                               const T*, MatrixView<T>, Rng&,          \
                                               const DistanceEngine<T>&,               \
                                               ScalableInitStats*);

KMEANIX_INSTANTIATE_INIT(float)
KMEANIX_INSTANTIATE_INIT(double)

#undef KMEANIX_INSTANTIATE_INIT

}  // namespace kmeanix

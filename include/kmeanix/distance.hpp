#ifndef KMEANIX_DISTANCE_HPP
#define KMEANIX_DISTANCE_HPP

#include "kmeanix/batching.hpp"
#include "kmeanix/matrix.hpp"
#include "kmeanix/params.hpp"

#include <cstddef>
#include <functional>

namespace kmeanix {

// Squared L2 between two dim-length vectors, accumulated in T.
template <typename T>
inline T l2sq(const T* a, const T* b, size_t dim) {
    T s = T(0);
    for (size_t j = 0; j < dim; ++j) {
        T d = a[j] - b[j];
        s += d * d;
    }
    return s;
}

/**
 * Batched pairwise-distance kernel between data rows and a centroid set.
 *
 * Rows are processed in batches of at most batch_samples, and within a batch
 * the centroids in tiles of at most batch_centroids (0 = all of them), so the
 * scratch footprint is O(batch_samples * tile) regardless of N.
 *
 * L2Expanded evaluates ||x||^2 - 2 x.c + ||c||^2 with one GEMM per tile and
 * clamps negatives to 0. It can lose precision through cancellation when
 * ||x|| is large relative to ||x - c||; L2Unexpanded does not.
 *
 * Per-row work inside a batch runs on the OpenMP pool. Equidistant centroids
 * resolve to the lowest index.
 */
template <typename T>
class DistanceEngine {
public:
    // labels / min_dist point at batch-sized scratch, valid during the call.
    using NearestSink = std::function<void(Batch batch, const int* labels,
                                           const T* min_dist)>;

    DistanceEngine(Metric metric, size_t batch_samples, size_t batch_centroids = 0);

    void for_each_nearest(MatrixView<T> x, MatrixView<T> centroids,
                          const NearestSink& sink) const;

    // labels and min_dist are caller-owned, x.rows long; either may be null.
    void nearest(MatrixView<T> x, MatrixView<T> centroids,
                 int* labels, T* min_dist) const;

    // out is caller-owned, x.rows * centroids.rows, row-major. euclidean=true
    // takes the square root of every entry.
    void pairwise(MatrixView<T> x, MatrixView<T> centroids, T* out,
                  bool euclidean) const;

    Metric metric() const { return metric_; }
    size_t batch_samples() const { return batch_samples_; }
    size_t batch_centroids() const { return batch_centroids_; }
    size_t centroid_tile(size_t k) const;

    // Scratch bytes a nearest() pass allocates for the given shape.
    size_t scratch_bytes(size_t n, size_t k) const;

private:
    Metric metric_;
    size_t batch_samples_;
    size_t batch_centroids_;
};

extern template class DistanceEngine<float>;
extern template class DistanceEngine<double>;

}  // namespace kmeanix

#endif  // KMEANIX_DISTANCE_HPP

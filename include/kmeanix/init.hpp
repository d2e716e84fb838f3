#ifndef KMEANIX_INIT_HPP
#define KMEANIX_INIT_HPP

#include "kmeanix/distance.hpp"
#include "kmeanix/matrix.hpp"
#include "kmeanix/params.hpp"

#include <cstddef>
#include <random>

namespace kmeanix {

using Rng = std::mt19937_64;

// What the k-means|| initializer did, for diagnostics and tests.
struct ScalableInitStats {
    int    rounds_sampled = 0;
    int    rounds_skipped = 0;   // rounds that accepted no new candidate
    size_t candidates = 0;       // candidate-set size before reduction / padding
    size_t padded = 0;           // rows added because fewer than K candidates existed
    size_t reduction_iters = 0;  // weighted Lloyd iterations over the candidates
};

// Copies a caller-supplied centroid set. ConfigError unless it has exactly
// k rows; DimensionMismatch unless its width matches the data.
template <typename T>
Matrix<T> init_from_array(size_t k, MatrixView<T> x, MatrixView<T> array);

// K distinct rows drawn uniformly (Floyd's sampling). When K exceeds the row
// count every row is used once and the remainder is drawn with replacement.
template <typename T>
Matrix<T> init_random(size_t k, MatrixView<T> x, Rng& rng);

/**
 * k-means|| seeding.
 *
 * One uniformly chosen row starts the candidate set. Each of the
 * kScalableInitRounds rounds accepts row i with probability
 * min(1, l * w_i * d_i / phi), l = oversampling_factor * K, d_i the squared
 * distance to the nearest candidate and phi = sum w_i * d_i. Candidates are
 * then weighted by the (sample-weighted) number of rows closest to them and
 * reduced to K with weighted k-means++ followed by weighted Lloyd iterations.
 * A candidate set smaller than K is padded with uniformly drawn rows.
 */
template <typename T>
Matrix<T> init_scalable(const KMeansParams& p, MatrixView<T> x, const T* weights,
                        Rng& rng, const DistanceEngine<T>& engine,
                        ScalableInitStats* stats = nullptr);

// Weighted k-means++ over a small point set: picks k rows of pts.
template <typename T>
Matrix<T> kmeanspp_select(MatrixView<T> pts, const T* weights, size_t k, Rng& rng);

// Dispatches on p.init. array is only read for InitMethod::Array.
template <typename T>
Matrix<T> initialize_centroids(const KMeansParams& p, MatrixView<T> x,
                               const T* weights, MatrixView<T> array, Rng& rng,
                               const DistanceEngine<T>& engine,
                               ScalableInitStats* stats = nullptr);

}  // namespace kmeanix

#endif  // KMEANIX_INIT_HPP

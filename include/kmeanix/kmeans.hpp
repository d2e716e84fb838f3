#ifndef KMEANIX_KMEANS_HPP
#define KMEANIX_KMEANS_HPP

#include "kmeanix/assign.hpp"
#include "kmeanix/common.hpp"
#include "kmeanix/init.hpp"
#include "kmeanix/lloyd.hpp"
#include "kmeanix/matrix.hpp"
#include "kmeanix/metrics.hpp"
#include "kmeanix/params.hpp"

#include <cstddef>
#include <mutex>
#include <vector>

namespace kmeanix {

template <typename T>
struct FitResult {
    Matrix<T> centroids;
    std::vector<int> labels;
    T inertia = T(0);
    size_t n_iter = 0;
    LloydState state = LloydState::Initializing;
    std::vector<IterationStats> history;
    ScalableInitStats init_stats;
    size_t best_run = 0;   // which of the n_init runs was kept
};

/**
 * K-Means model. Parameters are validated at construction and fixed for the
 * lifetime of the instance; the fitted centroid set is owned by the instance
 * and replaced only when a fit completes.
 *
 * All data arguments are dense row-major float or double matrices. The element
 * width is fixed by the last successful fit (or by the init array); calls with
 * the other width throw DTypeError.
 *
 * Concurrent fit() calls on one instance are serialized. predict / transform /
 * score must not run while a fit on the same instance is in progress.
 */
class KMeans {
public:
    explicit KMeans(const KMeansParams& params);

    // init = InitMethod::Array with caller-supplied K x D starting centroids.
    template <typename T>
    KMeans(const KMeansParams& params, MatrixView<T> init_centroids);

    KMeans(const KMeans&) = delete;
    KMeans& operator=(const KMeans&) = delete;

    // sample_weight: nullptr or x.rows non-negative finite weights.
    template <typename T>
    FitResult<T> fit(MatrixView<T> x, const T* sample_weight = nullptr);

    template <typename T>
    Assignment<T> predict(MatrixView<T> x, const T* sample_weight = nullptr) const;

    // N x K Euclidean distances to the fitted centroids.
    template <typename T>
    Matrix<T> transform(MatrixView<T> x) const;

    template <typename T>
    std::vector<int> fit_predict(MatrixView<T> x, const T* sample_weight = nullptr);

    template <typename T>
    Matrix<T> fit_transform(MatrixView<T> x, const T* sample_weight = nullptr);

    // Negated inertia: higher is better.
    template <typename T>
    T score(MatrixView<T> x, const T* sample_weight = nullptr) const;

    template <typename T>
    std::vector<ClusterStats> cluster_stats(MatrixView<T> x) const;

    template <typename T>
    MatrixView<T> centroids() const;

    template <typename T>
    T inertia() const;

    const KMeansParams& params() const { return params_; }
    bool is_fitted() const { return fitted_; }
    DType dtype() const { return dtype_; }
    size_t n_clusters() const { return params_.n_clusters; }
    size_t n_features() const { return n_features_; }
    size_t n_iter() const { return n_iter_; }

private:
    template <typename T>
    const Matrix<T>& fitted_storage() const;

    template <typename T>
    const Matrix<T>& init_storage() const;

    template <typename T>
    void check_fitted(const char* op) const;

    template <typename T>
    void check_data(MatrixView<T> x, const T* sample_weight, bool fitting,
                    const char* op) const;

    KMeansParams params_;
    std::mutex fit_mutex_;

    bool has_init_array_ = false;
    DType init_dtype_ = DType::Float32;
    Matrix<float> init_f32_;
    Matrix<double> init_f64_;

    bool fitted_ = false;
    DType dtype_ = DType::Float32;
    size_t n_features_ = 0;
    size_t n_iter_ = 0;
    double inertia_ = 0.0;
    Matrix<float> centroids_f32_;
    Matrix<double> centroids_f64_;
};

}  // namespace kmeanix

#endif  // KMEANIX_KMEANS_HPP

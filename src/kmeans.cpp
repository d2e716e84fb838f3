#include "kmeanix/kmeans.hpp"
#include "kmeanix/errors.hpp"
#include "kmeanix/logging.hpp"

#include <cmath>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace kmeanix {

KMeans::KMeans(const KMeansParams& params) : params_(params) {
    validate_params(params_);
    if (params_.init == InitMethod::Array)
        throw ConfigError("init=array requires initial centroids");
}

template <typename T>
KMeans::KMeans(const KMeansParams& params, MatrixView<T> init_centroids)
    : params_(params) {
    validate_params(params_);
    if (params_.init != InitMethod::Array)
        throw ConfigError(std::string("initial centroids given but init is '") +
                          to_string(params_.init) + "'");
    if (init_centroids.rows != params_.n_clusters)
        throw ConfigError("init array has " + std::to_string(init_centroids.rows) +
                          " rows, n_clusters is " + std::to_string(params_.n_clusters));
    if (init_centroids.cols == 0 || init_centroids.data == nullptr)
        throw ConfigError("init array has no features");

    has_init_array_ = true;
    init_dtype_ = dtype_of<T>();
    if constexpr (std::is_same_v<T, float>)
        init_f32_ = Matrix<float>::copy_of(init_centroids);
    else
        init_f64_ = Matrix<double>::copy_of(init_centroids);
}

template <typename T>
const Matrix<T>& KMeans::fitted_storage() const {
    if constexpr (std::is_same_v<T, float>)
        return centroids_f32_;
    else
        return centroids_f64_;
}

template <typename T>
const Matrix<T>& KMeans::init_storage() const {
    if constexpr (std::is_same_v<T, float>)
        return init_f32_;
    else
        return init_f64_;
}

template <typename T>
void KMeans::check_fitted(const char* op) const {
    if (!fitted_)
        throw NotFittedError(std::string(op) + ": model is not fitted");
    if (dtype_of<T>() != dtype_)
        throw DTypeError(std::string(op) + ": model holds " + to_string(dtype_) +
                         " centroids, input is " + to_string(dtype_of<T>()));
}

template <typename T>
void KMeans::check_data(MatrixView<T> x, const T* sample_weight, bool fitting,
                        const char* op) const {
    if (x.rows == 0 || x.cols == 0)
        throw DimensionMismatch(std::string(op) + ": empty dataset");
    if (x.data == nullptr)
        throw std::invalid_argument(std::string(op) + ": null data");
    if (!fitting && x.cols != n_features_)
        throw DimensionMismatch(std::string(op) + ": data has " + std::to_string(x.cols) +
                                " features, model was fitted with " +
                                std::to_string(n_features_));
    if (!sample_weight) return;

    double total = 0.0;
    for (size_t i = 0; i < x.rows; ++i) {
        const T w = sample_weight[i];
        if (!std::isfinite(w) || w < T(0))
            throw ConfigError(std::string(op) + ": sample_weight[" + std::to_string(i) +
                              "] must be finite and >= 0");
        total += static_cast<double>(w);
    }
    if (fitting && !(total > 0.0))
        throw ConfigError(std::string(op) + ": sample weights sum to zero");
}

template <typename T>
FitResult<T> KMeans::fit(MatrixView<T> x, const T* sample_weight) {
    std::lock_guard<std::mutex> lock(fit_mutex_);
    ScopedLogLevel log_level(params_.verbosity);

    if (has_init_array_ && init_dtype_ != dtype_of<T>())
        throw DTypeError(std::string("fit: init array is ") + to_string(init_dtype_) +
                         ", input is " + to_string(dtype_of<T>()));
    check_data(x, sample_weight, true, "fit");

    KMEANIX_INFO("fit", "n=%zu d=%zu k=%zu init=%s metric=%s batch=%zu/%zu dtype=%s",
                 x.rows, x.cols, params_.n_clusters, to_string(params_.init),
                 to_string(params_.metric), params_.batch_samples,
                 params_.batch_centroids, to_string(dtype_of<T>()));

    FitResult<T> best;
    try {
        DistanceEngine<T> engine(params_.metric, params_.batch_samples,
                                 params_.batch_centroids);
        const size_t runs = params_.init == InitMethod::Array ? 1 : params_.n_init;
        const MatrixView<T> array =
            has_init_array_ ? init_storage<T>().view() : MatrixView<T>();

        bool have_best = false;
        for (size_t r = 0; r < runs; ++r) {
            Rng rng(params_.seed + r);
            ScalableInitStats init_stats;
            Matrix<T> init = initialize_centroids(params_, x, sample_weight, array, rng,
                                                  engine, &init_stats);

            LloydRefiner<T> refiner(engine, params_.max_iter, params_.tol,
                                    params_.inertia_check);
            LloydResult<T> run = refiner.run(x, sample_weight, std::move(init));

            KMEANIX_INFO("fit", "run %zu/%zu: %s after %zu iteration(s), inertia=%.6e",
                         r + 1, runs, to_string(run.state), run.n_iter,
                         static_cast<double>(run.inertia));

            if (!have_best || run.inertia < best.inertia) {
                best.centroids = std::move(run.centroids);
                best.labels = std::move(run.labels);
                best.inertia = run.inertia;
                best.n_iter = run.n_iter;
                best.state = run.state;
                best.history = std::move(run.history);
                best.init_stats = init_stats;
                best.best_run = r;
                have_best = true;
            }
        }

        if (runs > 1)
            KMEANIX_INFO("fit", "kept run %zu of %zu (inertia=%.6e)",
                         best.best_run + 1, runs, static_cast<double>(best.inertia));

        // Commit: nothing above touched the model state.
        Matrix<T> stored = best.centroids;
        if constexpr (std::is_same_v<T, float>) {
            centroids_f32_ = std::move(stored);
            centroids_f64_ = Matrix<double>();
        } else {
            centroids_f64_ = std::move(stored);
            centroids_f32_ = Matrix<float>();
        }
    } catch (const ResourceError& e) {
        KMEANIX_ERROR("fit", "%s", e.what());
        throw;
    } catch (const std::bad_alloc&) {
        KMEANIX_ERROR("fit", "out of memory for n=%zu d=%zu k=%zu", x.rows, x.cols,
                      params_.n_clusters);
        throw ResourceError("fit: out of memory for n=" + std::to_string(x.rows) +
                            " d=" + std::to_string(x.cols) + " k=" +
                            std::to_string(params_.n_clusters));
    }

    dtype_ = dtype_of<T>();
    n_features_ = x.cols;
    n_iter_ = best.n_iter;
    inertia_ = static_cast<double>(best.inertia);
    fitted_ = true;
    return best;
}

template <typename T>
Assignment<T> KMeans::predict(MatrixView<T> x, const T* sample_weight) const {
    ScopedLogLevel log_level(params_.verbosity);
    check_fitted<T>("predict");
    check_data(x, sample_weight, false, "predict");
    try {
        DistanceEngine<T> engine(params_.metric, params_.batch_samples,
                                 params_.batch_centroids);
        return assign_labels(engine, x, fitted_storage<T>().view(), sample_weight);
    } catch (const std::bad_alloc&) {
        throw ResourceError("predict: out of memory for n=" + std::to_string(x.rows));
    }
}

template <typename T>
Matrix<T> KMeans::transform(MatrixView<T> x) const {
    ScopedLogLevel log_level(params_.verbosity);
    check_fitted<T>("transform");
    check_data(x, static_cast<const T*>(nullptr), false, "transform");
    DistanceEngine<T> engine(params_.metric, params_.batch_samples,
                             params_.batch_centroids);
    return transform_distances(engine, x, fitted_storage<T>().view());
}

template <typename T>
std::vector<int> KMeans::fit_predict(MatrixView<T> x, const T* sample_weight) {
    return fit(x, sample_weight).labels;
}

template <typename T>
Matrix<T> KMeans::fit_transform(MatrixView<T> x, const T* sample_weight) {
    fit(x, sample_weight);
    return transform(x);
}

template <typename T>
T KMeans::score(MatrixView<T> x, const T* sample_weight) const {
    return -predict(x, sample_weight).inertia;
}

template <typename T>
std::vector<ClusterStats> KMeans::cluster_stats(MatrixView<T> x) const {
    Assignment<T> a = predict(x);
    return compute_cluster_stats(x, a.labels.data(), fitted_storage<T>().view());
}

template <typename T>
MatrixView<T> KMeans::centroids() const {
    check_fitted<T>("centroids");
    return fitted_storage<T>().view();
}

template <typename T>
T KMeans::inertia() const {
    check_fitted<T>("inertia");
    return static_cast<T>(inertia_);
}

#define KMEANIX_INSTANTIATE_KMEANS(T)                                                  \
    template KMeans::KMeans(const KMeansParams&, MatrixView<T>);                       \
    template FitResult<T> KMeans::fit<T>(MatrixView<T>, const T*);                     \
    template Assignment<T> KMeans::predict<T>(MatrixView<T>, const T*) const;          \
    template Matrix<T> KMeans::transform<T>(MatrixView<T>) const;                      \
    template std::vector<int> KMeans::fit_predict<T>(MatrixView<T>, const T*);         \
    template Matrix<T> KMeans::fit_transform<T>(MatrixView<T>, const T*);              \
    template T KMeans::score<T>(MatrixView<T>, const T*) const;                        \
    template std::vector<ClusterStats> KMeans::cluster_stats<T>(MatrixView<T>) const;  \
    template MatrixView<T> KMeans::centroids<T>() const;                               \
    template T KMeans::inertia<T>() const;

KMEANIX_INSTANTIATE_KMEANS(float)
KMEANIX_INSTANTIATE_KMEANS(double)

#undef KMEANIX_INSTANTIATE_KMEANS

}  // namespace kmeanix

#include "kmeanix/distance.hpp"
#include "kmeanix/errors.hpp"
#include "kmeanix/scratch.hpp"

#include <cblas.h>
#include <omp.h>

#include <algorithm>
#include <climits>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace kmeanix {

namespace {

// C[m x n] = alpha * A[m x k] . B[n x k]^T, row-major.
inline void gemm_nt(size_t m, size_t n, size_t k, float alpha,
                    const float* a, const float* b, float* c, size_t ldc) {
    cblas_sgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                static_cast<int>(m), static_cast<int>(n), static_cast<int>(k),
                alpha, a, static_cast<int>(k), b, static_cast<int>(k),
                0.0f, c, static_cast<int>(ldc));
}

inline void gemm_nt(size_t m, size_t n, size_t k, double alpha,
                    const double* a, const double* b, double* c, size_t ldc) {
    cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                static_cast<int>(m), static_cast<int>(n), static_cast<int>(k),
                alpha, a, static_cast<int>(k), b, static_cast<int>(k),
                0.0, c, static_cast<int>(ldc));
}

template <typename T>
void row_sqnorms(MatrixView<T> x, T* out) {
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < x.rows; ++i) {
        const T* r = x.row(i);
        T s = T(0);
        for (size_t j = 0; j < x.cols; ++j) s += r[j] * r[j];
        out[i] = s;
    }
}

template <typename T>
void check_shapes(MatrixView<T> x, MatrixView<T> c, const char* op) {
    if (c.rows == 0)
        throw std::invalid_argument(std::string("DistanceEngine::") + op +
                                    ": empty centroid set");
    if (c.cols == 0)
        throw DimensionMismatch(std::string("DistanceEngine::") + op +
                                ": centroids have no features");
    if (x.rows > 0 && x.cols != c.cols)
        throw DimensionMismatch(std::string("DistanceEngine::") + op +
                                ": data has " + std::to_string(x.cols) +
                                " features, centroids have " + std::to_string(c.cols));
    if (c.cols > static_cast<size_t>(INT_MAX) || c.rows > static_cast<size_t>(INT_MAX))
        throw ResourceError(std::string("DistanceEngine::") + op +
                            ": shape exceeds BLAS index range");
}

}  // namespace

template <typename T>
DistanceEngine<T>::DistanceEngine(Metric metric, size_t batch_samples,
                                  size_t batch_centroids)
    : metric_(metric), batch_samples_(batch_samples), batch_centroids_(batch_centroids) {
    if (batch_samples_ == 0)
        throw ConfigError("batch_samples must be >= 1");
    if (batch_samples_ > static_cast<size_t>(INT_MAX))
        batch_samples_ = static_cast<size_t>(INT_MAX);
}

template <typename T>
size_t DistanceEngine<T>::centroid_tile(size_t k) const {
    if (batch_centroids_ == 0) return k;
    return std::min(batch_centroids_, k);
}

template <typename T>
size_t DistanceEngine<T>::scratch_bytes(size_t n, size_t k) const {
    const size_t bs = std::min(batch_samples_, n);
    size_t bytes = bs * (sizeof(int) + sizeof(T));
    if (metric_ == Metric::L2Expanded)
        bytes += bs * centroid_tile(k) * sizeof(T) + bs * sizeof(T) + k * sizeof(T);
    return bytes;
}

template <typename T>
void DistanceEngine<T>::for_each_nearest(MatrixView<T> x, MatrixView<T> c,
                                         const NearestSink& sink) const {
    check_shapes(x, c, "nearest");
    if (x.rows == 0) return;

    const size_t k = c.rows;
    const size_t dim = c.cols;
    const size_t bs = std::min(batch_samples_, x.rows);
    const size_t kt = centroid_tile(k);
    const bool expanded = metric_ == Metric::L2Expanded;

    std::vector<int> best_idx;
    std::vector<T> best_d;
    std::vector<T> tile, x_norms, c_norms;
    allocate_scratch(best_idx, bs, "nearest-label batch buffer");
    allocate_scratch(best_d, bs, "nearest-distance batch buffer");
    if (expanded) {
        allocate_scratch(tile, bs * kt, "distance tile buffer");
        allocate_scratch(x_norms, bs, "row norm buffer");
        allocate_scratch(c_norms, k, "centroid norm buffer");
        row_sqnorms(c, c_norms.data());
    }

    const T inf = std::numeric_limits<T>::infinity();

    for (Batch b : RowBatches(x.rows, bs)) {
        MatrixView<T> xb = x.slice(b.offset, b.size);
        std::fill_n(best_d.begin(), b.size, inf);
        std::fill_n(best_idx.begin(), b.size, 0);
        if (expanded) row_sqnorms(xb, x_norms.data());

        for (Batch t : RowBatches(k, kt)) {
            MatrixView<T> cb = c.slice(t.offset, t.size);

            if (expanded) {
                // tile[i, j] = -2 * x_i . c_j
                gemm_nt(b.size, t.size, dim, T(-2), xb.data, cb.data,
                        tile.data(), t.size);
                const T* cn = c_norms.data() + t.offset;

                #pragma omp parallel for schedule(static)
                for (size_t i = 0; i < b.size; ++i) {
                    const T* row = tile.data() + i * t.size;
                    const T xn = x_norms[i];
                    T bd = best_d[i];
                    int bi = best_idx[i];
                    for (size_t j = 0; j < t.size; ++j) {
                        T v = row[j] + xn + cn[j];
                        if (v < T(0)) v = T(0);
                        if (v < bd) { bd = v; bi = static_cast<int>(t.offset + j); }
                    }
                    best_d[i] = bd;
                    best_idx[i] = bi;
                }
            } else {
                #pragma omp parallel for schedule(static)
                for (size_t i = 0; i < b.size; ++i) {
                    const T* xi = xb.row(i);
                    T bd = best_d[i];
                    int bi = best_idx[i];
                    for (size_t j = 0; j < t.size; ++j) {
                        T v = l2sq(xi, cb.row(j), dim);
                        if (v < bd) { bd = v; bi = static_cast<int>(t.offset + j); }
                    }
                    best_d[i] = bd;
                    best_idx[i] = bi;
                }
            }
        }

        sink(b, best_idx.data(), best_d.data());
    }
}

template <typename T>
void DistanceEngine<T>::nearest(MatrixView<T> x, MatrixView<T> c,
                                int* labels, T* min_dist) const {
    for_each_nearest(x, c, [&](Batch b, const int* l, const T* d) {
        if (labels) std::copy(l, l + b.size, labels + b.offset);
        if (min_dist) std::copy(d, d + b.size, min_dist + b.offset);
    });
}

template <typename T>
void DistanceEngine<T>::pairwise(MatrixView<T> x, MatrixView<T> c, T* out,
                                 bool euclidean) const {
    check_shapes(x, c, "pairwise");
    if (x.rows == 0) return;

    const size_t k = c.rows;
    const size_t dim = c.cols;
    const size_t bs = std::min(batch_samples_, x.rows);
    const size_t kt = centroid_tile(k);
    const bool expanded = metric_ == Metric::L2Expanded;

    std::vector<T> x_norms, c_norms;
    if (expanded) {
        allocate_scratch(x_norms, bs, "row norm buffer");
        allocate_scratch(c_norms, k, "centroid norm buffer");
        row_sqnorms(c, c_norms.data());
    }

    for (Batch b : RowBatches(x.rows, bs)) {
        MatrixView<T> xb = x.slice(b.offset, b.size);
        T* ob = out + b.offset * k;

        if (expanded) {
            row_sqnorms(xb, x_norms.data());
            // Tiled exactly as in for_each_nearest so both see the same values.
            for (Batch t : RowBatches(k, kt))
                gemm_nt(b.size, t.size, dim, T(-2), xb.data, c.row(t.offset),
                        ob + t.offset, k);

            #pragma omp parallel for schedule(static)
            for (size_t i = 0; i < b.size; ++i) {
                T* row = ob + i * k;
                const T xn = x_norms[i];
                for (size_t j = 0; j < k; ++j) {
                    T v = row[j] + xn + c_norms[j];
                    if (v < T(0)) v = T(0);
                    row[j] = euclidean ? std::sqrt(v) : v;
                }
            }
        } else {
            #pragma omp parallel for schedule(static)
            for (size_t i = 0; i < b.size; ++i) {
                const T* xi = xb.row(i);
                T* row = ob + i * k;
                for (size_t j = 0; j < k; ++j) {
                    T v = l2sq(xi, c.row(j), dim);
                    row[j] = euclidean ? std::sqrt(v) : v;
                }
            }
        }
    }
}

template class DistanceEngine<float>;
template class DistanceEngine<double>;

}  // namespace kmeanix

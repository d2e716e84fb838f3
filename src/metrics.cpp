#include "kmeanix/metrics.hpp"
#include "kmeanix/distance.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

namespace kmeanix {

template <typename T>
T compute_inertia(MatrixView<T> x, const int* labels, MatrixView<T> centroids) {
    const size_t k = centroids.rows;
    T total = T(0);
    for (size_t i = 0; i < x.rows; ++i) {
        const int l = labels[i];
        if (l < 0 || static_cast<size_t>(l) >= k) continue;
        total += l2sq(x.row(i), centroids.row(static_cast<size_t>(l)), x.cols);
    }
    return total;
}

void compute_cluster_sizes(const int* labels, size_t n, size_t k, size_t* out_sizes) {
    std::memset(out_sizes, 0, k * sizeof(size_t));
    for (size_t i = 0; i < n; ++i) {
        const int l = labels[i];
        if (l >= 0 && static_cast<size_t>(l) < k)
            out_sizes[static_cast<size_t>(l)]++;
    }
}

double compute_imbalance_ratio(const size_t* sizes, size_t k) {
    if (k == 0) return 0.0;
    size_t mn = std::numeric_limits<size_t>::max();
    size_t mx = 0;
    for (size_t i = 0; i < k; ++i) {
        mn = std::min(mn, sizes[i]);
        mx = std::max(mx, sizes[i]);
    }
    if (mn == 0) return 0.0;
    return static_cast<double>(mx) / static_cast<double>(mn);
}

template <typename T>
std::vector<ClusterStats> compute_cluster_stats(MatrixView<T> x, const int* labels,
                                                MatrixView<T> centroids) {
    const size_t k = centroids.rows;
    std::vector<ClusterStats> stats(k, ClusterStats{std::numeric_limits<double>::max(),
                                                    0.0, 0.0, 0.0, 0});

    for (size_t i = 0; i < x.rows; ++i) {
        const int l = labels[i];
        if (l < 0 || static_cast<size_t>(l) >= k) continue;

        const double dist = std::sqrt(static_cast<double>(
            l2sq(x.row(i), centroids.row(static_cast<size_t>(l)), x.cols)));

        auto& s = stats[static_cast<size_t>(l)];
        s.min_dist = std::min(s.min_dist, dist);
        s.max_dist = std::max(s.max_dist, dist);
        s.mean_dist += dist;
        s.count++;
    }

    for (auto& s : stats) {
        if (s.count > 0) {
            s.mean_dist /= static_cast<double>(s.count);
            s.radius_ratio = s.mean_dist > 0.0 ? s.max_dist / s.mean_dist : 0.0;
        } else {
            s.min_dist = 0.0;
        }
    }
    return stats;
}

double compute_cluster_size_stddev(const size_t* sizes, size_t k) {
    if (k == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < k; ++i) sum += static_cast<double>(sizes[i]);
    const double mean = sum / static_cast<double>(k);
    double var = 0.0;
    for (size_t i = 0; i < k; ++i) {
        const double d = static_cast<double>(sizes[i]) - mean;
        var += d * d;
    }
    return std::sqrt(var / static_cast<double>(k));
}

size_t count_empty_clusters(const size_t* sizes, size_t k) {
    size_t cnt = 0;
    for (size_t i = 0; i < k; ++i)
        if (sizes[i] == 0) ++cnt;
    return cnt;
}

double compute_purity(const int* pred_labels, const int* true_labels,
                      size_t n, size_t k_pred, size_t k_true) {
    if (n == 0 || k_pred == 0 || k_true == 0) return 0.0;

    // counts[p][t]; purity = sum over p of max_t counts[p][t], over n.
    std::vector<std::vector<size_t>> counts(k_pred, std::vector<size_t>(k_true, 0));
    for (size_t i = 0; i < n; ++i) {
        const int p = pred_labels[i];
        const int t = true_labels[i];
        if (p >= 0 && static_cast<size_t>(p) < k_pred &&
            t >= 0 && static_cast<size_t>(t) < k_true)
            counts[static_cast<size_t>(p)][static_cast<size_t>(t)]++;
    }

    size_t correct = 0;
    for (const auto& row : counts)
        correct += *std::max_element(row.begin(), row.end());
    return static_cast<double>(correct) / static_cast<double>(n);
}

template float compute_inertia<float>(MatrixView<float>, const int*, MatrixView<float>);
template double compute_inertia<double>(MatrixView<double>, const int*, MatrixView<double>);
template std::vector<ClusterStats> compute_cluster_stats<float>(MatrixView<float>, const int*,
                                                                MatrixView<float>);
template std::vector<ClusterStats> compute_cluster_stats<double>(MatrixView<double>, const int*,
                                                                 MatrixView<double>);

}  // namespace kmeanix

#ifndef KMEANIX_METRICS_HPP
#define KMEANIX_METRICS_HPP

#include "kmeanix/matrix.hpp"

#include <cstddef>
#include <vector>

namespace kmeanix {

struct ClusterStats {
    double min_dist;
    double max_dist;
    double mean_dist;
    double radius_ratio;   // max_dist / mean_dist, flags outlier-heavy clusters
    size_t count;
};

// Sum of squared distances from each row to centroids[labels[i]]; rows with an
// out-of-range label are skipped.
template <typename T>
T compute_inertia(MatrixView<T> x, const int* labels, MatrixView<T> centroids);

void compute_cluster_sizes(const int* labels, size_t n, size_t k, size_t* out_sizes);

// max / min cluster size, 0 when any cluster is empty.
double compute_imbalance_ratio(const size_t* sizes, size_t k);

template <typename T>
std::vector<ClusterStats> compute_cluster_stats(MatrixView<T> x, const int* labels,
                                                MatrixView<T> centroids);

double compute_cluster_size_stddev(const size_t* sizes, size_t k);

size_t count_empty_clusters(const size_t* sizes, size_t k);

// Purity score: fraction of points whose cluster assignment matches the
// majority ground-truth label within that predicted cluster.
double compute_purity(const int* pred_labels, const int* true_labels,
                      size_t n, size_t k_pred, size_t k_true);

}  // namespace kmeanix

#endif  // KMEANIX_METRICS_HPP

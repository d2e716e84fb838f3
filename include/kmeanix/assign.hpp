#ifndef KMEANIX_ASSIGN_HPP
#define KMEANIX_ASSIGN_HPP

#include "kmeanix/distance.hpp"
#include "kmeanix/matrix.hpp"

#include <vector>

namespace kmeanix {

template <typename T>
struct Assignment {
    std::vector<int> labels;
    T inertia = T(0);
};

// Nearest-centroid labels and (weighted) inertia against a fixed centroid set.
// DimensionMismatch when x and centroids differ in width.
template <typename T>
Assignment<T> assign_labels(const DistanceEngine<T>& engine, MatrixView<T> x,
                            MatrixView<T> centroids, const T* weights = nullptr);

// N x K Euclidean (square-rooted) distances from every row to every centroid.
template <typename T>
Matrix<T> transform_distances(const DistanceEngine<T>& engine, MatrixView<T> x,
                              MatrixView<T> centroids);

}  // namespace kmeanix

#endif  // KMEANIX_ASSIGN_HPP

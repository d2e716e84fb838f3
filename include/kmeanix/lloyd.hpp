#ifndef KMEANIX_LLOYD_HPP
#define KMEANIX_LLOYD_HPP

#include "kmeanix/distance.hpp"
#include "kmeanix/matrix.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kmeanix {

enum class LloydState : uint8_t { Initializing, Assigning, Updating, Converged, Exhausted };

const char* to_string(LloydState s);

struct IterationStats {
    size_t iteration;       // 1-based
    double inertia;         // measured against the centroids the iteration started with
    double centroid_shift;  // sum over centroids of squared movement
    size_t empty_clusters;  // clusters that kept their previous position
};

template <typename T>
struct LloydResult {
    Matrix<T> centroids;
    std::vector<int> labels;
    T inertia = T(0);
    size_t n_iter = 0;
    LloydState state = LloydState::Initializing;
    std::vector<IterationStats> history;
};

/**
 * Weighted Lloyd iteration: assign every row to its nearest centroid through
 * the DistanceEngine, then move each centroid to the weighted mean of its rows.
 * Clusters that receive no weight keep their previous position.
 *
 * With inertia_check, the run stops once prev - cur <= tol * prev; otherwise it
 * performs exactly max_iter iterations. Labels and inertia in the result come
 * from a final assignment against the returned centroids.
 *
 * Sums and inertia are accumulated in row order, so the result does not depend
 * on the engine's batch size.
 */
template <typename T>
class LloydRefiner {
public:
    LloydRefiner(const DistanceEngine<T>& engine, size_t max_iter, double tol,
                 bool inertia_check);

    // weights may be null (all ones).
    LloydResult<T> run(MatrixView<T> x, const T* weights, Matrix<T> centroids);

    LloydState state() const { return state_; }

private:
    // One assignment pass; fills labels, returns inertia. Accumulates weighted
    // sums / per-cluster weight when sums is non-null.
    T assign_pass(MatrixView<T> x, const T* weights, MatrixView<T> centroids,
                  std::vector<int>& labels, T* sums, T* counts) const;

    const DistanceEngine<T>& engine_;
    size_t max_iter_;
    double tol_;
    bool inertia_check_;
    LloydState state_ = LloydState::Initializing;
};

extern template class LloydRefiner<float>;
extern template class LloydRefiner<double>;

}  // namespace kmeanix

#endif  // KMEANIX_LLOYD_HPP

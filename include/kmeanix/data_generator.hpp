#ifndef KMEANIX_DATA_GENERATOR_HPP
#define KMEANIX_DATA_GENERATOR_HPP

#include <cstddef>
#include <vector>

namespace kmeanix {

// Mixture-of-Gaussians synthetic data for tests and benchmarking.
// Generates n row-major vectors of dimension dim from num_gaussians clusters,
// assigned round-robin (row i belongs to cluster i % num_gaussians). Each
// centre is uniformly sampled in [-spread, spread]^dim; points get isotropic
// noise with a per-cluster scale in [0.5, 2.0] times noise.
// When centres is non-null it receives the num_gaussians x dim generating centres.
template <typename T = float>
std::vector<T> generate_gaussian_mixture(size_t n, size_t dim, size_t num_gaussians,
                                         unsigned seed, std::vector<T>* centres = nullptr,
                                         T spread = T(10), T noise = T(1));

// Ground-truth cluster label for each row of generate_gaussian_mixture.
std::vector<int> generate_ground_truth_labels(size_t n, size_t num_gaussians);

}  // namespace kmeanix

#endif  // KMEANIX_DATA_GENERATOR_HPP

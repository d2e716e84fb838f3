#include "kmeanix/data_generator.hpp"

#include <random>
#include <stdexcept>
#include <utility>

namespace kmeanix {

template <typename T>
std::vector<T> generate_gaussian_mixture(size_t n, size_t dim, size_t num_gaussians,
                                         unsigned seed, std::vector<T>* centres,
                                         T spread, T noise) {
    if (n == 0 || dim == 0 || num_gaussians == 0)
        throw std::invalid_argument("generate_gaussian_mixture: invalid parameters");

    std::mt19937 rng(seed);
    std::uniform_real_distribution<T> mean_dist(-spread, spread);
    std::uniform_real_distribution<T> scale_dist(T(0.5), T(2.0));

    // Cluster centres and per-cluster scales.
    std::vector<T> c(num_gaussians * dim);
    std::vector<T> scales(num_gaussians);
    for (size_t g = 0; g < num_gaussians; ++g) {
        scales[g] = scale_dist(rng) * noise;
        for (size_t d = 0; d < dim; ++d)
            c[g * dim + d] = mean_dist(rng);
    }

    std::vector<T> data(n * dim);
    std::normal_distribution<T> unit(T(0), T(1));
    for (size_t i = 0; i < n; ++i) {
        const size_t g = i % num_gaussians;
        const T s = scales[g];
        const T* cg = c.data() + g * dim;
        T* row = data.data() + i * dim;
        for (size_t d = 0; d < dim; ++d)
            row[d] = cg[d] + s * unit(rng);
    }

    if (centres) *centres = std::move(c);
    return data;
}

std::vector<int> generate_ground_truth_labels(size_t n, size_t num_gaussians) {
    std::vector<int> labels(n);
    for (size_t i = 0; i < n; ++i)
        labels[i] = static_cast<int>(i % num_gaussians);
    return labels;
}

template std::vector<float> generate_gaussian_mixture<float>(size_t, size_t, size_t, unsigned,
                                                             std::vector<float>*, float, float);
template std::vector<double> generate_gaussian_mixture<double>(size_t, size_t, size_t, unsigned,
                                                               std::vector<double>*, double, double);

}  // namespace kmeanix

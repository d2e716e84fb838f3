#ifndef KMEANIX_PARAMS_HPP
#define KMEANIX_PARAMS_HPP

#include "kmeanix/common.hpp"
#include "kmeanix/logging.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace kmeanix {

enum class InitMethod : uint8_t {
    Array,                   // caller-supplied K x D centroids
    Random,                  // K rows drawn uniformly from the data
    ScalableKMeansPlusPlus,  // k-means|| (oversampled weighted rounds + reduction)
};

// Both selectors compute squared Euclidean distance.
enum class Metric : uint8_t {
    L2Expanded,    // ||x||^2 - 2 x.c + ||c||^2, cross term through GEMM
    L2Unexpanded,  // sum_d (x_d - c_d)^2
};

struct KMeansParams {
    size_t     n_clusters          = 8;
    InitMethod init                = InitMethod::ScalableKMeansPlusPlus;
    size_t     max_iter            = 300;
    double     tol                 = 1e-4;     // relative inertia improvement
    uint64_t   seed                = 0;
    double     oversampling_factor = 2.0;      // k-means|| candidates per round = factor * K
    size_t     batch_samples       = kDefaultBatchSamples;
    size_t     batch_centroids     = 0;        // 0 = all K centroids per tile
    bool       inertia_check       = true;     // false = run exactly max_iter iterations
    Metric     metric              = Metric::L2Unexpanded;   // bitwise batch-invariant
    size_t     n_init              = 1;        // independent seeded runs, best inertia kept
    LogLevel   verbosity           = LogLevel::Warn;
};

// Throws ConfigError naming the first invalid field.
void validate_params(const KMeansParams& p);

InitMethod parse_init_method(std::string_view s);
Metric parse_metric(std::string_view s);

const char* to_string(InitMethod m);
const char* to_string(Metric m);

}  // namespace kmeanix

#endif  // KMEANIX_PARAMS_HPP

#include "kmeanix/params.hpp"
#include "kmeanix/errors.hpp"

#include <cctype>
#include <cmath>
#include <string>

namespace kmeanix {

namespace {

std::string normalize(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        if (ch == '_') ch = '-';
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

}  // namespace

void validate_params(const KMeansParams& p) {
    if (p.n_clusters < 1)
        throw ConfigError("n_clusters must be >= 1");
    if (p.max_iter < 1)
        throw ConfigError("max_iter must be >= 1");
    if (!std::isfinite(p.tol) || p.tol < 0.0)
        throw ConfigError("tol must be a finite value >= 0");
    if (!std::isfinite(p.oversampling_factor) || p.oversampling_factor <= 0.0)
        throw ConfigError("oversampling_factor must be a finite value > 0");
    if (p.batch_samples < 1)
        throw ConfigError("batch_samples must be >= 1");
    if (p.n_init < 1)
        throw ConfigError("n_init must be >= 1");

    switch (p.init) {
        case InitMethod::Array:
        case InitMethod::Random:
        case InitMethod::ScalableKMeansPlusPlus:
            break;
        default:
            throw ConfigError("unsupported init method");
    }
    switch (p.metric) {
        case Metric::L2Expanded:
        case Metric::L2Unexpanded:
            break;
        default:
            throw ConfigError("unsupported metric");
    }
}

InitMethod parse_init_method(std::string_view s) {
    const std::string n = normalize(s);
    if (n == "k-means||" || n == "scalable-k-means++" || n == "k-means++" ||
        n == "kmeans||" || n == "scalable-kmeans++")
        return InitMethod::ScalableKMeansPlusPlus;
    if (n == "random") return InitMethod::Random;
    if (n == "array" || n == "ndarray" || n == "precomputed") return InitMethod::Array;
    throw ConfigError("unsupported init method: '" + std::string(s) + "'");
}

Metric parse_metric(std::string_view s) {
    const std::string n = normalize(s);
    if (n == "sqeuclidean" || n == "l2" || n == "l2-expanded") return Metric::L2Expanded;
    if (n == "l2-unexpanded") return Metric::L2Unexpanded;
    throw ConfigError("unsupported metric: '" + std::string(s) + "'");
}

const char* to_string(InitMethod m) {
    switch (m) {
        case InitMethod::Array:                  return "array";
        case InitMethod::Random:                 return "random";
        case InitMethod::ScalableKMeansPlusPlus: return "k-means||";
    }
    return "unknown";
}

const char* to_string(Metric m) {
    switch (m) {
        case Metric::L2Expanded:   return "l2_expanded";
        case Metric::L2Unexpanded: return "l2_unexpanded";
    }
    return "unknown";
}

const char* to_string(DType dt) {
    return dt == DType::Float32 ? "float32" : "float64";
}

}  // namespace kmeanix

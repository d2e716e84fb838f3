#ifndef KMEANIX_COMMON_HPP
#define KMEANIX_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace kmeanix {

// ---------------------------------------------------------------------------
// Constants
// ---------------------------------------------------------------------------

constexpr size_t kDefaultBatchSamples   = size_t{1} << 15;
constexpr int    kScalableInitRounds    = 8;
constexpr size_t kReductionMaxIter      = 20;

// ---------------------------------------------------------------------------
// Element type
// ---------------------------------------------------------------------------

enum class DType : uint8_t { Float32, Float64 };

template <typename T>
constexpr bool is_supported_dtype_v =
    std::is_same_v<T, float> || std::is_same_v<T, double>;

template <typename T>
constexpr DType dtype_of() {
    static_assert(is_supported_dtype_v<T>,
                  "kmeanix only supports float and double element types");
    return std::is_same_v<T, float> ? DType::Float32 : DType::Float64;
}

const char* to_string(DType dt);

}  // namespace kmeanix

#endif  // KMEANIX_COMMON_HPP

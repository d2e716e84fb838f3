#ifndef KMEANIX_SCRATCH_HPP
#define KMEANIX_SCRATCH_HPP

#include "kmeanix/errors.hpp"

#include <cstddef>
#include <new>
#include <string>
#include <vector>

namespace kmeanix {

// Sizes a per-call buffer, turning allocation failure into ResourceError.
template <typename V>
void allocate_scratch(V& buf, size_t count, const char* what) {
    try {
        buf.resize(count);
    } catch (const std::bad_alloc&) {
        throw ResourceError(std::string("cannot allocate ") + what + " (" +
                            std::to_string(count * sizeof(typename V::value_type)) +
                            " bytes)");
    } catch (const std::length_error&) {
        throw ResourceError(std::string("cannot allocate ") + what + " (" +
                            std::to_string(count) + " elements)");
    }
}

}  // namespace kmeanix

#endif  // KMEANIX_SCRATCH_HPP

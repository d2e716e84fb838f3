#ifndef KMEANIX_ERRORS_HPP
#define KMEANIX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace kmeanix {

// Invalid parameters, init-array shape, or selector string. Raised before any
// data is touched.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Element width of a call does not match the model, or is unsupported.
class DTypeError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

// Feature count (or weight length) of a call does not match the model.
class DimensionMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class NotFittedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// A scratch or candidate buffer could not be allocated.
class ResourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace kmeanix

#endif  // KMEANIX_ERRORS_HPP

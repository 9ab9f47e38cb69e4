// File: common/exceptions.hpp

#ifndef COMMON_EXCEPTIONS_HPP
#define COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace common {

    // Invalid run configuration (budgets, exploration weight, unknown names). Raised before any iteration runs.
    class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {}
    };

    // The covariance matrix could not be factorized, even with the maximum jitter.
    class NumericalError : public std::runtime_error {
    public:
        explicit NumericalError(const std::string &message) : std::runtime_error(message) {}
    };

} // namespace common

#endif // COMMON_EXCEPTIONS_HPP

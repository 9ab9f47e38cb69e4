// File: optimization/gaussian/regularized_cholesky.hpp

#ifndef OPTIMIZATION_REGULARIZED_CHOLESKY_HPP
#define OPTIMIZATION_REGULARIZED_CHOLESKY_HPP

#include <Eigen/Dense>
#include <optional>
#include <stdexcept>
#include <utility>

#include "common/logging/logger.hpp"
#include "types/concepts.hpp"

namespace optimization {

    template<FloatingPoint T>
    struct RegularizedCholesky {
        Eigen::LLT<Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>> llt;
        T jitter;
    };

    // Cholesky factorization of K + jitter * I, growing the jitter tenfold from initial_jitter up to max_jitter until
    // the matrix is numerically positive definite. Returns nullopt when even max_jitter is not enough.
    template<FloatingPoint T>
    [[nodiscard]] std::optional<RegularizedCholesky<T>>
    regularizedCholesky(const Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic> &K, const T initial_jitter,
                        const T max_jitter) {
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

        if (!(initial_jitter > 0) || !(max_jitter >= initial_jitter)) {
            LOG_ERROR("Invalid jitter range [{}, {}]", initial_jitter, max_jitter);
            throw std::invalid_argument("Jitter range must satisfy 0 < initial_jitter <= max_jitter.");
        }

        for (T jitter = initial_jitter; jitter <= max_jitter * T(1.0001); jitter *= T(10)) {
            MatrixType regularized = K;
            regularized.diagonal().array() += jitter;
            Eigen::LLT<MatrixType> llt(regularized);
            if (llt.info() == Eigen::Success && llt.matrixLLT().diagonal().allFinite()) {
                if (jitter > initial_jitter) {
                    LOG_DEBUG("Cholesky decomposition succeeded with jitter = {}", jitter);
                }
                return RegularizedCholesky<T>{std::move(llt), jitter};
            }
        }

        LOG_DEBUG("Cholesky decomposition failed even with jitter = {}", max_jitter);
        return std::nullopt;
    }

} // namespace optimization

#endif // OPTIMIZATION_REGULARIZED_CHOLESKY_HPP

// File: optimization/kernel/kernel.hpp

#ifndef KERNEL_HPP
#define KERNEL_HPP

#include <Eigen/Dense>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/logging/logger.hpp"
#include "types/concepts.hpp"

namespace optimization::kernel {

    template<FloatingPoint T = double>
    class Kernel {
    public:
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

        virtual ~Kernel() = default;

        // Core functionality
        [[nodiscard]] virtual T compute(const VectorType &x, const VectorType &y) const = 0;
        [[nodiscard]] virtual MatrixType computeGramMatrix(const MatrixType &X, const MatrixType &Y) const = 0;
        [[nodiscard]] virtual MatrixType computeGramMatrix(const MatrixType &X) const = 0;

        // k(x, x), constant for stationary kernels
        [[nodiscard]] virtual T getDiagonal() const = 0;

        // dK(X, X) / d log(theta_i), all parameters are strictly positive
        [[nodiscard]] virtual MatrixType computeLogGradientMatrix(const MatrixType &X, int param_index) const = 0;

        // Parameters
        virtual void setParameters(const VectorType &params) = 0;
        [[nodiscard]] virtual VectorType getParameters() const = 0;
        [[nodiscard]] virtual std::vector<std::string> getParameterNames() const = 0;
        [[nodiscard]] virtual int getParameterCount() const = 0;

        [[nodiscard]] virtual std::unique_ptr<Kernel<T>> clone() const = 0;
        [[nodiscard]] virtual std::string getKernelType() const = 0;

    protected:
        void validateParameters(const VectorType &params) const {
            if (params.size() != getParameterCount()) {
                LOG_ERROR("{} expects {} parameters, received {}", getKernelType(), getParameterCount(),
                          params.size());
                throw std::invalid_argument("Number of parameters does not match expected number for this kernel");
            }
            if (!(params.array() > T(0)).all() || !params.allFinite()) {
                LOG_ERROR("{} parameters must be positive and finite: {}", getKernelType(), params);
                throw std::invalid_argument("Kernel parameters must be positive and finite");
            }
        }
    };

} // namespace optimization::kernel

#endif // KERNEL_HPP

// File: optimization/kernel/matern_52.hpp

#ifndef KERNEL_MATERN52_HPP
#define KERNEL_MATERN52_HPP

#include <Eigen/Dense>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "optimization/kernel/kernel.hpp"

namespace optimization::kernel {

    /*
     * Matern 5/2 kernel with automatic relevance determination and an output scale:
     *   r^2    = sum_d (x_d - y_d)^2 / l_d^2
     *   k(x,y) = s^2 * (1 + sqrt(5) r + 5 r^2 / 3) * exp(-sqrt(5) r)
     * Parameters are ordered [l_1, ..., l_D, s^2].
     */
    template<FloatingPoint T = double>
    class Matern52 final : public Kernel<T> {
    public:
        using typename Kernel<T>::VectorType;
        using typename Kernel<T>::MatrixType;

        explicit Matern52(const int dimensions, T length_scale = 1.0, T output_scale = 1.0) :
            length_scales_(VectorType::Constant(checkDimensions(dimensions), length_scale)),
            output_scale_(output_scale) {
            this->validateParameters(getParameters());
            LOG_TRACE("Initialized Matern 5/2 kernel with length_scales={}, output_scale={}", length_scales_,
                      output_scale_);
        }

        [[nodiscard]] std::unique_ptr<Kernel<T>> clone() const override { return std::make_unique<Matern52>(*this); }

        [[nodiscard]] int getParameterCount() const override { return static_cast<int>(length_scales_.size()) + 1; }

        [[nodiscard]] int getDimensions() const noexcept { return static_cast<int>(length_scales_.size()); }

        [[nodiscard]] T compute(const VectorType &x, const VectorType &y) const override {
            const T r = ((x - y).array() / length_scales_.array()).matrix().norm();
            return shape(r);
        }

        [[nodiscard]] MatrixType computeGramMatrix(const MatrixType &X, const MatrixType &Y) const override {
            return shape(distances(X, Y));
        }

        [[nodiscard]] MatrixType computeGramMatrix(const MatrixType &X) const override {
            MatrixType K = shape(distances(X, X));
            // Exact symmetry for the Cholesky factorization
            return (K + K.transpose()) / T(2);
        }

        [[nodiscard]] T getDiagonal() const override { return output_scale_; }

        [[nodiscard]] MatrixType computeLogGradientMatrix(const MatrixType &X, const int param_index) const override {
            if (param_index < 0 || param_index >= getParameterCount()) {
                LOG_ERROR("Invalid parameter index in computeLogGradientMatrix: {}", param_index);
                throw std::out_of_range("Kernel parameter index out of range");
            }

            const MatrixType R = distances(X, X);
            if (param_index == getDimensions()) {
                return shape(R);
            }

            // dk/dlog(l_d) = s^2 * 5/3 * (1 + sqrt(5) r) * exp(-sqrt(5) r) * (x_d - y_d)^2 / l_d^2
            const T l = length_scales_(param_index);
            const auto column = X.col(param_index).array() / l;
            const MatrixType delta_sq =
                    (column.matrix().replicate(1, X.rows()) - column.matrix().transpose().replicate(X.rows(), 1))
                            .array()
                            .square()
                            .matrix();
            const auto z = sqrt_5_ * R.array();
            return (output_scale_ * (T(5) / T(3)) * (T(1) + z) * (-z).exp() * delta_sq.array()).matrix();
        }

        void setParameters(const VectorType &params) override {
            this->validateParameters(params);
            length_scales_ = params.head(getDimensions());
            output_scale_ = params(getDimensions());
        }

        [[nodiscard]] VectorType getParameters() const override {
            VectorType params(getParameterCount());
            params << length_scales_, output_scale_;
            return params;
        }

        [[nodiscard]] std::vector<std::string> getParameterNames() const override {
            std::vector<std::string> names;
            for (int d = 0; d < getDimensions(); ++d) {
                names.push_back("length_scale_" + std::to_string(d));
            }
            names.emplace_back("output_scale");
            return names;
        }

        [[nodiscard]] const VectorType &getLengthScales() const noexcept { return length_scales_; }

        [[nodiscard]] T getOutputScale() const noexcept { return output_scale_; }

        [[nodiscard]] std::string getKernelType() const override { return "Matern52"; }

    private:
        VectorType length_scales_;
        T output_scale_;
        static constexpr T sqrt_5_ = 2.236067977499789696;

        static int checkDimensions(const int dimensions) {
            if (dimensions < 1) {
                LOG_ERROR("Matern52 requires at least one input dimension, received {}", dimensions);
                throw std::invalid_argument("Kernel dimensionality must be positive.");
            }
            return dimensions;
        }

        [[nodiscard]] T shape(const T r) const {
            const T z = sqrt_5_ * r;
            return output_scale_ * (T(1) + z + z * z / T(3)) * std::exp(-z);
        }

        [[nodiscard]] MatrixType shape(const MatrixType &R) const {
            const auto z = sqrt_5_ * R.array();
            return (output_scale_ * (T(1) + z + z.square() / T(3)) * (-z).exp()).matrix();
        }

        // Pairwise scaled distances between the rows of X and Y
        [[nodiscard]] MatrixType distances(const MatrixType &X, const MatrixType &Y) const {
            if (X.cols() != getDimensions() || Y.cols() != getDimensions()) {
                LOG_ERROR("Matern52 expects {} columns, received {} and {}", getDimensions(), X.cols(), Y.cols());
                throw std::invalid_argument("Input dimensionality does not match the kernel.");
            }

            const MatrixType Xs = X.array().rowwise() / length_scales_.transpose().array();
            const MatrixType Ys = Y.array().rowwise() / length_scales_.transpose().array();
            MatrixType R(X.rows(), Y.rows());
            for (Eigen::Index i = 0; i < Xs.rows(); ++i) {
                for (Eigen::Index j = 0; j < Ys.rows(); ++j) {
                    R(i, j) = (Xs.row(i) - Ys.row(j)).norm();
                }
            }
            return R;
        }
    };

} // namespace optimization::kernel

#endif // KERNEL_MATERN52_HPP

// File: scaling/scaler.hpp

#ifndef SCALING_SCALER_HPP
#define SCALING_SCALER_HPP

#include <Eigen/Dense>
#include <stdexcept>

#include "common/logging/logger.hpp"
#include "types/concepts.hpp"

namespace scaling {

    /**
     * @brief Column-wise affine transform x' = (x - location) / (scale + epsilon) with statistics fitted from data.
     *
     * Rows are samples and columns are features. A vector is treated as a single column, which is how responses
     * are scaled. Inputs are never modified; every operation returns a copy.
     */
    template<FloatingPoint T = double>
    class Scaler {
    public:
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;

        static constexpr T epsilon = static_cast<T>(1e-10);

        virtual ~Scaler() = default;

        /**
         * @brief Computes and stores per-column location and scale.
         * @throws std::invalid_argument if data has no rows or no columns.
         */
        void fit(const MatrixType &data) {
            if (data.rows() == 0 || data.cols() == 0) {
                LOG_ERROR("Cannot fit {} on empty data ({}x{})", name(), data.rows(), data.cols());
                throw std::invalid_argument("Scaler cannot be fitted on empty data.");
            }
            computeStatistics(data, location_, scale_);
            LOG_TRACE("{} fitted on {} rows: location = {}, scale = {}", name(), data.rows(), location_, scale_);
        }

        /**
         * @brief Applies the fitted transform.
         * @throws std::runtime_error if the scaler is not fitted.
         * @throws std::invalid_argument if the column count differs from the fitted one.
         */
        [[nodiscard]] MatrixType transform(const MatrixType &data) const {
            validate(data);
            return ((data.rowwise() - location_.transpose()).array().rowwise() /
                    (scale_.array() + epsilon).transpose())
                    .matrix();
        }

        [[nodiscard]] MatrixType inverseTransform(const MatrixType &data) const {
            validate(data);
            return ((data.array().rowwise() * (scale_.array() + epsilon).transpose()).matrix().rowwise() +
                    location_.transpose());
        }

        MatrixType fitTransform(const MatrixType &data) {
            fit(data);
            return transform(data);
        }

        void fit(const VectorType &data) { fit(MatrixType(data)); }

        [[nodiscard]] VectorType transform(const VectorType &data) const { return transform(MatrixType(data)).col(0); }

        [[nodiscard]] VectorType inverseTransform(const VectorType &data) const {
            return inverseTransform(MatrixType(data)).col(0);
        }

        VectorType fitTransform(const VectorType &data) { return fitTransform(MatrixType(data)).col(0); }

        [[nodiscard]] bool isFitted() const noexcept { return location_.size() > 0; }

        [[nodiscard]] const VectorType &location() const noexcept { return location_; }

        [[nodiscard]] const VectorType &scale() const noexcept { return scale_; }

        [[nodiscard]] virtual const char *name() const noexcept = 0;

    protected:
        virtual void computeStatistics(const MatrixType &data, VectorType &location, VectorType &scale) const = 0;

    private:
        VectorType location_;
        VectorType scale_;

        void validate(const MatrixType &data) const {
            if (!isFitted()) {
                LOG_ERROR("{} used before fit", name());
                throw std::runtime_error("Scaler has not been fitted.");
            }
            if (data.cols() != location_.size()) {
                LOG_ERROR("{} fitted on {} columns, received {}", name(), location_.size(), data.cols());
                throw std::invalid_argument("Column count does not match the fitted scaler.");
            }
        }
    };

} // namespace scaling

#endif // SCALING_SCALER_HPP

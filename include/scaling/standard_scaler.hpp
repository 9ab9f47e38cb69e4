// File: scaling/standard_scaler.hpp

#ifndef SCALING_STANDARD_SCALER_HPP
#define SCALING_STANDARD_SCALER_HPP

#include "scaling/scaler.hpp"

namespace scaling {

    // Zero mean, unit population variance per column. Constant columns map to zero.
    template<FloatingPoint T = double>
    class StandardScaler final : public Scaler<T> {
    public:
        using typename Scaler<T>::MatrixType;
        using typename Scaler<T>::VectorType;

        [[nodiscard]] const char *name() const noexcept override { return "StandardScaler"; }

    protected:
        void computeStatistics(const MatrixType &data, VectorType &location, VectorType &scale) const override {
            location = data.colwise().mean().transpose();
            const MatrixType centered = data.rowwise() - location.transpose();
            scale = (centered.array().square().colwise().sum() / static_cast<T>(data.rows())).sqrt().transpose();
        }
    };

} // namespace scaling

#endif // SCALING_STANDARD_SCALER_HPP

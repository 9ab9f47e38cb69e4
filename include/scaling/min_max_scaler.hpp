// File: scaling/min_max_scaler.hpp

#ifndef SCALING_MIN_MAX_SCALER_HPP
#define SCALING_MIN_MAX_SCALER_HPP

#include "scaling/scaler.hpp"

namespace scaling {

    // Maps the fitted data of each column onto [0, 1]: (x - min) / (max - min + epsilon). The epsilon keeps a constant
    // column at 0, so the fitted maximum lands just below 1.
    template<FloatingPoint T = double>
    class MinMaxScaler final : public Scaler<T> {
    public:
        using typename Scaler<T>::MatrixType;
        using typename Scaler<T>::VectorType;

        [[nodiscard]] const char *name() const noexcept override { return "MinMaxScaler"; }

    protected:
        void computeStatistics(const MatrixType &data, VectorType &location, VectorType &scale) const override {
            location = data.colwise().minCoeff().transpose();
            scale = data.colwise().maxCoeff().transpose() - location;
        }
    };

} // namespace scaling

#endif // SCALING_MIN_MAX_SCALER_HPP

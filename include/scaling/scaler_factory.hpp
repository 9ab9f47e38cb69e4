// File: scaling/scaler_factory.hpp

#ifndef SCALING_SCALER_FACTORY_HPP
#define SCALING_SCALER_FACTORY_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "common/exceptions.hpp"
#include "common/logging/logger.hpp"
#include "scaling/min_max_scaler.hpp"
#include "scaling/standard_scaler.hpp"

namespace scaling {

    enum class ScalerType { Standard, MinMax };

    template<FloatingPoint T = double>
    [[nodiscard]] std::unique_ptr<Scaler<T>> makeScaler(const ScalerType type) {
        switch (type) {
            case ScalerType::Standard:
                return std::make_unique<StandardScaler<T>>();
            case ScalerType::MinMax:
                return std::make_unique<MinMaxScaler<T>>();
        }
        LOG_ERROR("Unknown scaler type {}", static_cast<int>(type));
        throw std::invalid_argument("Unknown scaler type");
    }

    [[nodiscard]] inline std::string_view scalerTypeToString(const ScalerType type) {
        return type == ScalerType::MinMax ? "minmax" : "standard";
    }

    [[nodiscard]] inline ScalerType stringToScalerType(std::string_view name) {
        if (name == "standard") {
            return ScalerType::Standard;
        }
        if (name == "minmax") {
            return ScalerType::MinMax;
        }
        LOG_ERROR("Unknown scaler '{}', expected 'standard' or 'minmax'", name);
        throw common::ConfigurationError("Unknown scaler: " + std::string(name));
    }

} // namespace scaling

#endif // SCALING_SCALER_FACTORY_HPP

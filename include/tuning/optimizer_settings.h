#pragma once

#include "tuning/enum_utils.h"
#include "tuning/errors.h"
#include "tuning/strategy.h"

#include <cmath>
#include <optional>
#include <string>
#include <string_view>

namespace tuning {

// Whether increasing the variable increases (Positive) or decreases the output
enum class Correlation { Positive, Negative };

inline int sign(Correlation c) {
    return c == Correlation::Positive ? +1 : -1;
}

inline char const* toSymbol(Correlation c) {
    return c == Correlation::Positive ? "+" : "-";
}

// Accepts "+", "-" or the enum names ("positive", "negative")
inline Correlation parseCorrelation(std::string_view str) {
    if (str == "+") {
        return Correlation::Positive;
    }
    if (str == "-") {
        return Correlation::Negative;
    }
    if (auto parsed = enum_utils::fromString<Correlation>(str)) {
        return *parsed;
    }
    throw ConfigurationError("Cannot correlate with `" + std::string(str) + "`. Can only use + or -");
}

// Fixed configuration of one single-parameter search
struct OptimizerSettings {
    std::string variable_name;      // Parameter varied in the simulation input
    std::string target_quantity;    // Measured quantity, e.g. "f0"
    double target_value = 0.0;      // e.g. 2.0e9 for a 2 GHz resonance
    double tolerance = 0.01;        // Fraction of target_value, 0.01 = +-1%
    Correlation correlation = Correlation::Positive;
    double mesh_size = 1.0;         // Grid all proposed values snap to
    std::optional<double> min_value;
    std::optional<double> max_value;
    StrategyPtr strategy;

    // Prefix for generated batch folders (empty = relative to cwd)
    std::string work_directory;

    // Throws ConfigurationError. The target quantity is checked by the
    // optimizer type, since only it knows which quantities it can measure.
    void validate() const {
        if (variable_name.empty()) {
            throw ConfigurationError("variable_name must not be empty");
        }
        if (!std::isfinite(target_value)) {
            throw ConfigurationError("target_value must be a finite number");
        }
        if (!(tolerance >= 0.0) || !std::isfinite(tolerance)) {
            throw ConfigurationError("tolerance must be a non-negative number");
        }
        if (!(mesh_size > 0.0) || !std::isfinite(mesh_size)) {
            throw ConfigurationError("mesh_size must be a positive number");
        }
        if (min_value && !std::isfinite(*min_value)) {
            throw ConfigurationError("min_value must be a finite number");
        }
        if (max_value && !std::isfinite(*max_value)) {
            throw ConfigurationError("max_value must be a finite number");
        }
        if (min_value && max_value && *min_value > *max_value) {
            throw ConfigurationError("min_value must not exceed max_value");
        }
        if (!strategy) {
            throw ConfigurationError("an optimization strategy is required");
        }
    }
};

} // namespace tuning

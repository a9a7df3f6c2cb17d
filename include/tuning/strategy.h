#pragma once

#include "tuning/trace.h"

#include <memory>
#include <span>
#include <string>

namespace tuning {

// ============================================================================
// STRATEGY CONTRACT
// ============================================================================
// A strategy proposes the next value of the variable parameter from the
// search history. Strategies hold no search state and never modify the
// history they are given, so one instance can be shared between optimizers.

enum class StrategyKind { PercentScale, MeshStep, LinFit, PolyFit, CrossingPointSplit };

// Everything a strategy may look at
struct StrategyInput {
    double current_output = 0.0;  // Output of the last analyzed batch
    double target_output = 0.0;
    std::span<double const> variable_values;
    std::span<double const> output_values;
    int correlation = +1;         // +1: output rises with the variable
    double mesh_size = 1.0;
};

// A proposed value and the strategy that actually produced it.
// The producer differs from the queried strategy after a fallback.
struct Proposal {
    double value = 0.0;
    std::string produced_by;
};

class Strategy {
public:
    virtual ~Strategy() = default;

    virtual StrategyKind kind() const = 0;
    virtual std::string name() const = 0;

    // Throws SearchExhausted (or BracketNotFound) when no usable value exists
    virtual Proposal nextValue(StrategyInput const& in) const = 0;

    // Draw the fit (if any) the strategy would use on the given history
    virtual void renderTrace(TraceSink& sink, std::span<double const> variable_values,
                             std::span<double const> output_values, double target_output) const = 0;
};

// Fit-based strategies need this many points before they stop bootstrapping
inline constexpr std::size_t MIN_POINTS_FOR_FIT = 4;

// ============================================================================
// CONCRETE STRATEGIES
// ============================================================================

// next = last -/+ correlation * 0.002 * |current - target|, snapped to mesh
class PercentScale final : public Strategy {
public:
    static constexpr double ADJUST_STRENGTH = 0.002;

    StrategyKind kind() const override { return StrategyKind::PercentScale; }
    std::string name() const override { return "PercentScale"; }
    Proposal nextValue(StrategyInput const& in) const override;
    void renderTrace(TraceSink&, std::span<double const>, std::span<double const>,
                     double) const override {}
};

// next = last -/+ correlation * mesh_size
class MeshStep final : public Strategy {
public:
    StrategyKind kind() const override { return StrategyKind::MeshStep; }
    std::string name() const override { return "MeshStep"; }
    Proposal nextValue(StrategyInput const& in) const override;
    void renderTrace(TraceSink&, std::span<double const>, std::span<double const>,
                     double) const override {}
};

// Polynomial fit of variable against output, evaluated at the target.
// Falls back to PercentScale, then MeshStep, when the fit lands on a value
// that has already been simulated.
class PolyFit : public Strategy {
public:
    explicit PolyFit(int degree);

    StrategyKind kind() const override { return StrategyKind::PolyFit; }
    std::string name() const override { return "PolyFit"; }
    int degree() const { return degree_; }

    Proposal nextValue(StrategyInput const& in) const override;
    void renderTrace(TraceSink& sink, std::span<double const> variable_values,
                     std::span<double const> output_values, double target_output) const override;

private:
    int degree_;
    PercentScale percent_scale_;
    MeshStep mesh_step_;
};

// Degree one PolyFit
class LinFit final : public PolyFit {
public:
    LinFit() : PolyFit(1) {}

    StrategyKind kind() const override { return StrategyKind::LinFit; }
    std::string name() const override { return "LinFit"; }
};

// Secant through the closest points either side of the target.
// Has no fallback: without a bracket the search cannot continue.
class CrossingPointSplit final : public Strategy {
public:
    StrategyKind kind() const override { return StrategyKind::CrossingPointSplit; }
    std::string name() const override { return "CrossingPointSplit"; }
    Proposal nextValue(StrategyInput const& in) const override;
    void renderTrace(TraceSink& sink, std::span<double const> variable_values,
                     std::span<double const> output_values, double target_output) const override;

private:
    PercentScale percent_scale_;
};

using StrategyPtr = std::shared_ptr<Strategy const>;

// Build a strategy by kind. degree is only used for PolyFit.
// Throws ConfigurationError for PolyFit with degree < 1.
StrategyPtr makeStrategy(StrategyKind kind, int degree = 2);

} // namespace tuning

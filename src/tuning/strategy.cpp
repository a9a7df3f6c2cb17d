#include "tuning/strategy.h"

#include "tuning/errors.h"
#include "tuning/least_squares.h"
#include "tuning/mesh.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace tuning {

namespace {

constexpr int FIT_TRACE_POINTS = 50;
constexpr int CROSSING_TRACE_POINTS = 10;

double lastVariableValue(StrategyInput const& in, std::string const& strategy) {
    if (in.variable_values.empty()) {
        throw SearchExhausted(strategy + " needs at least one analyzed batch");
    }
    return in.variable_values.back();
}

// Closest points either side of the target, as (offset from target, variable)
struct Bracket {
    double above_offset = std::numeric_limits<double>::infinity();
    double above_variable = 0.0;
    double below_offset = -std::numeric_limits<double>::infinity();
    double below_variable = 0.0;
    bool has_above = false;
    bool has_below = false;

    bool complete() const { return has_above && has_below; }

    // Variable value where the line through both points crosses the target
    double crossing() const {
        return below_variable +
               (0.0 - below_offset) * (above_variable - below_variable) / (above_offset - below_offset);
    }
};

Bracket findBracket(std::span<double const> variable_values, std::span<double const> output_values,
                    double target_output) {
    Bracket bracket;
    std::size_t n = std::min(variable_values.size(), output_values.size());
    for (std::size_t i = 0; i < n; ++i) {
        double offset = output_values[i] - target_output;
        if (offset > 0.0) {
            bracket.has_above = true;
            if (offset < bracket.above_offset) {
                bracket.above_offset = offset;
                bracket.above_variable = variable_values[i];
            }
        } else {
            bracket.has_below = true;
            if (offset > bracket.below_offset) {
                bracket.below_offset = offset;
                bracket.below_variable = variable_values[i];
            }
        }
    }
    return bracket;
}

} // namespace

// ============================================================================
// PercentScale
// ============================================================================

Proposal PercentScale::nextValue(StrategyInput const& in) const {
    double last = lastVariableValue(in, name());
    double step = ADJUST_STRENGTH * std::abs(in.current_output - in.target_output);

    double next = in.current_output > in.target_output ? last - in.correlation * step
                                                       : last + in.correlation * step;
    return {roundToMesh(next, in.mesh_size), name()};
}

// ============================================================================
// MeshStep
// ============================================================================

// Same direction rule as PercentScale: above the target moves against the
// correlation. Stepping the other way walks away from the target.
Proposal MeshStep::nextValue(StrategyInput const& in) const {
    double last = lastVariableValue(in, name());

    double next = in.current_output > in.target_output ? last - in.correlation * in.mesh_size
                                                       : last + in.correlation * in.mesh_size;
    return {next, name()};
}

// ============================================================================
// PolyFit / LinFit
// ============================================================================

PolyFit::PolyFit(int degree) : degree_(degree) {
    if (degree < 1) {
        throw ConfigurationError("PolyFit degree must be at least 1, got " + std::to_string(degree));
    }
}

Proposal PolyFit::nextValue(StrategyInput const& in) const {
    if (in.variable_values.size() < MIN_POINTS_FOR_FIT) {
        return percent_scale_.nextValue(in);
    }

    // Variable as a function of output, evaluated where output == target
    auto fit = PolynomialFit::fit(in.output_values, in.variable_values, degree_);
    double fitted = roundToMesh(fit(in.target_output), in.mesh_size);
    if (std::isfinite(fitted) && !alreadyTried(fitted, in.variable_values, in.mesh_size)) {
        return {fitted, name()};
    }

    // Stuck fit: fall back to the bounded step strategies
    Proposal scaled = percent_scale_.nextValue(in);
    if (!alreadyTried(scaled.value, in.variable_values, in.mesh_size)) {
        return scaled;
    }

    Proposal stepped = mesh_step_.nextValue(in);
    if (!alreadyTried(stepped.value, in.variable_values, in.mesh_size)) {
        return stepped;
    }

    throw SearchExhausted("Strategy " + name() +
                          " was unable to find appropriate next variable value");
}

void PolyFit::renderTrace(TraceSink& sink, std::span<double const> variable_values,
                          std::span<double const> output_values, double) const {
    if (variable_values.size() < MIN_POINTS_FOR_FIT || variable_values.size() != output_values.size()) {
        return;
    }

    auto fit = PolynomialFit::fit(output_values, variable_values, degree_);
    auto [lo, hi] = std::minmax_element(output_values.begin(), output_values.end());

    std::vector<double> outputs;
    std::vector<double> variables;
    fit.sample(*lo, *hi, FIT_TRACE_POINTS, outputs, variables);
    sink.series(name(), variables, outputs);
}

// ============================================================================
// CrossingPointSplit
// ============================================================================

Proposal CrossingPointSplit::nextValue(StrategyInput const& in) const {
    if (in.variable_values.size() < MIN_POINTS_FOR_FIT) {
        return percent_scale_.nextValue(in);
    }

    Bracket bracket = findBracket(in.variable_values, in.output_values, in.target_output);
    if (!bracket.complete()) {
        throw BracketNotFound("Cannot use " + name() +
                              " because there are not points either side of the target output " +
                              std::to_string(in.target_output));
    }

    return {roundToMesh(bracket.crossing(), in.mesh_size), name()};
}

void CrossingPointSplit::renderTrace(TraceSink& sink, std::span<double const> variable_values,
                                     std::span<double const> output_values,
                                     double target_output) const {
    Bracket bracket = findBracket(variable_values, output_values, target_output);
    if (!bracket.complete()) {
        return;
    }

    std::vector<double> variables;
    std::vector<double> outputs;
    for (int i = 0; i < CROSSING_TRACE_POINTS; ++i) {
        double t = static_cast<double>(i) / (CROSSING_TRACE_POINTS - 1);
        double offset = bracket.below_offset + t * (bracket.above_offset - bracket.below_offset);
        double variable = bracket.below_variable +
                          (offset - bracket.below_offset) * (bracket.above_variable - bracket.below_variable) /
                              (bracket.above_offset - bracket.below_offset);
        variables.push_back(variable);
        outputs.push_back(offset + target_output);
    }
    sink.series(name(), variables, outputs);
}

// ============================================================================
// Factory
// ============================================================================

StrategyPtr makeStrategy(StrategyKind kind, int degree) {
    switch (kind) {
    case StrategyKind::PercentScale:
        return std::make_shared<PercentScale>();
    case StrategyKind::MeshStep:
        return std::make_shared<MeshStep>();
    case StrategyKind::LinFit:
        return std::make_shared<LinFit>();
    case StrategyKind::PolyFit:
        return std::make_shared<PolyFit>(degree);
    case StrategyKind::CrossingPointSplit:
        return std::make_shared<CrossingPointSplit>();
    }
    throw ConfigurationError("Unknown strategy kind");
}

} // namespace tuning

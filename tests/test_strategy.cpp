#include "tuning/errors.h"
#include "tuning/least_squares.h"
#include "tuning/strategy.h"
#include "tuning/trace.h"

#include <catch2/catch.hpp>

#include <vector>

using namespace tuning;

namespace {

StrategyInput inputFor(std::vector<double> const& vars, std::vector<double> const& outs,
                       double target, int correlation = +1, double mesh = 1.0) {
    StrategyInput in;
    in.current_output = outs.back();
    in.target_output = target;
    in.variable_values = vars;
    in.output_values = outs;
    in.correlation = correlation;
    in.mesh_size = mesh;
    return in;
}

std::vector<double> scaled(std::vector<double> const& v, double factor) {
    std::vector<double> out;
    for (double x : v) {
        out.push_back(x * factor);
    }
    return out;
}

} // namespace

TEST_CASE("PercentScale moves a fraction of the error toward the target", "[strategy]") {
    PercentScale strategy;
    std::vector<double> vars = {100.0};

    SECTION("undershoot with positive correlation increases the variable") {
        std::vector<double> outs = {5.0e4};
        auto p = strategy.nextValue(inputFor(vars, outs, 1.0e5, +1));
        REQUIRE(p.value == 200.0);  // 0.002 * 5e4 = 100
        REQUIRE(p.produced_by == "PercentScale");
    }

    SECTION("overshoot with positive correlation decreases the variable") {
        std::vector<double> outs = {1.25e5};
        REQUIRE(strategy.nextValue(inputFor(vars, outs, 1.0e5, +1)).value == 50.0);
    }

    SECTION("negative correlation flips the direction") {
        std::vector<double> outs = {1.25e5};
        REQUIRE(strategy.nextValue(inputFor(vars, outs, 1.0e5, -1)).value == 150.0);
    }

    SECTION("result is snapped to the mesh") {
        std::vector<double> outs = {1.0e5 - 1234.0};  // step 2.468
        REQUIRE(strategy.nextValue(inputFor(vars, outs, 1.0e5, +1, 0.5)).value == 102.5);
    }

    SECTION("no history is an error") {
        StrategyInput in;
        REQUIRE_THROWS_AS(strategy.nextValue(in), SearchExhausted);
    }
}

TEST_CASE("MeshStep moves one mesh step toward the target", "[strategy]") {
    MeshStep strategy;
    std::vector<double> vars = {10.0, 12.0};

    std::vector<double> below = {1.0, 2.0};
    REQUIRE(strategy.nextValue(inputFor(vars, below, 5.0, +1, 0.5)).value == 12.5);
    REQUIRE(strategy.nextValue(inputFor(vars, below, 5.0, -1, 0.5)).value == 11.5);

    std::vector<double> above = {8.0, 9.0};
    REQUIRE(strategy.nextValue(inputFor(vars, above, 5.0, +1, 0.5)).value == 11.5);
}

TEST_CASE("LinFit evaluates the linear fit at the target", "[strategy]") {
    LinFit strategy;
    REQUIRE(strategy.degree() == 1);
    REQUIRE(strategy.kind() == StrategyKind::LinFit);

    std::vector<double> vars = {100.0, 110.0, 120.0, 130.0};
    std::vector<double> outs = {2.05e9, 2.03e9, 2.01e9, 1.99e9};

    auto p = strategy.nextValue(inputFor(vars, outs, 2.0e9, -1));
    REQUIRE(p.value == 125.0);
    REQUIRE(p.produced_by == "LinFit");
}

TEST_CASE("Fit strategies bootstrap with PercentScale", "[strategy]") {
    std::vector<double> vars = {100.0, 101.0, 102.0};
    std::vector<double> outs = {5.0e4, 5.05e4, 5.1e4};

    for (auto kind : {StrategyKind::LinFit, StrategyKind::PolyFit, StrategyKind::CrossingPointSplit}) {
        auto strategy = makeStrategy(kind);
        auto p = strategy->nextValue(inputFor(vars, outs, 1.0e5));
        REQUIRE(p.produced_by == "PercentScale");
        REQUIRE(p.value == 200.0);  // 102 + 0.002 * 4.9e4 = 200
    }
}

TEST_CASE("PolyFit fits higher degree curves", "[strategy]") {
    PolyFit strategy(2);
    std::vector<double> outs = {1.0, 2.0, 3.0, 4.0};
    std::vector<double> vars = {1.0, 4.0, 9.0, 16.0};

    auto p = strategy.nextValue(inputFor(vars, outs, 5.0));
    REQUIRE(p.value == 25.0);
    REQUIRE(p.produced_by == "PolyFit");

    REQUIRE_THROWS_AS(PolyFit(0), ConfigurationError);
    REQUIRE_THROWS_AS(makeStrategy(StrategyKind::PolyFit, -1), ConfigurationError);
}

TEST_CASE("Fit strategies fall back when the fit repeats a value", "[strategy]") {
    LinFit strategy;

    SECTION("PercentScale first") {
        std::vector<double> vars = {118.0, 119.0, 120.0, 121.0};
        auto p = strategy.nextValue(inputFor(vars, scaled(vars, 1000.0), 119000.0));
        REQUIRE(p.produced_by == "PercentScale");
        REQUIRE(p.value == 117.0);
    }

    SECTION("then MeshStep") {
        std::vector<double> vars = {119.0, 120.0, 125.0, 123.0};
        auto p = strategy.nextValue(inputFor(vars, vars, 120.0));
        REQUIRE(p.produced_by == "MeshStep");
        REQUIRE(p.value == 122.0);
    }

    SECTION("exhausting all three is an error") {
        std::vector<double> vars = {118.0, 119.0, 120.0, 121.0};
        REQUIRE_THROWS_AS(strategy.nextValue(inputFor(vars, vars, 119.0)), SearchExhausted);
    }
}

TEST_CASE("CrossingPointSplit interpolates between the bracketing points", "[strategy]") {
    CrossingPointSplit strategy;
    std::vector<double> vars = {100.0, 110.0, 120.0, 130.0};

    SECTION("bracketed target") {
        std::vector<double> outs = {2.05e9, 2.03e9, 2.01e9, 1.99e9};
        auto p = strategy.nextValue(inputFor(vars, outs, 2.0e9, -1));
        REQUIRE(p.value == 125.0);
        REQUIRE(p.produced_by == "CrossingPointSplit");
    }

    SECTION("closest points win over farther ones") {
        std::vector<double> outs = {1.0, 4.0, 9.0, 16.0};
        // Brackets 110 (4) and 120 (9): 110 + (5 - 4) / 5 * 10 = 112
        REQUIRE(strategy.nextValue(inputFor(vars, outs, 5.0)).value == 112.0);
    }

    SECTION("all outputs below the target") {
        std::vector<double> outs = {1.0e9, 1.1e9, 1.2e9, 1.3e9};
        REQUIRE_THROWS_AS(strategy.nextValue(inputFor(vars, outs, 2.0e9)), BracketNotFound);
    }

    SECTION("all outputs above the target") {
        std::vector<double> outs = {3.0e9, 3.1e9, 3.2e9, 3.3e9};
        REQUIRE_THROWS_AS(strategy.nextValue(inputFor(vars, outs, 2.0e9)), SearchExhausted);
    }
}

TEST_CASE("Strategies render their fits", "[strategy][trace]") {
    std::vector<double> vars = {100.0, 110.0, 120.0, 130.0};
    std::vector<double> outs = {2.05e9, 2.03e9, 2.01e9, 1.99e9};

    JsonTraceSink sink;
    sink.beginOptimizer("res");
    LinFit().renderTrace(sink, vars, outs, 2.0e9);
    CrossingPointSplit().renderTrace(sink, vars, outs, 2.0e9);
    PercentScale().renderTrace(sink, vars, outs, 2.0e9);

    auto const& series = sink.toJSON()["res"]["series"];
    REQUIRE(series.size() == 2);
    REQUIRE(series[0]["label"] == "LinFit");
    REQUIRE(series[0]["x"].size() == 50);
    REQUIRE(series[1]["label"] == "CrossingPointSplit");
    REQUIRE(series[1]["x"].size() == 10);
}

TEST_CASE("PolynomialFit stays accurate at GHz scale", "[least_squares]") {
    std::vector<double> ghz = {1.90e9, 1.95e9, 2.00e9, 2.05e9, 2.10e9};
    std::vector<double> len;
    for (double f : ghz) {
        double t = (f - 2.0e9) / 1.0e8;
        len.push_back(200.0 - 30.0 * t + 4.0 * t * t);
    }

    auto fit = PolynomialFit::fit(ghz, len, 2);
    REQUIRE(fit.degree() == 2);
    REQUIRE(fit(2.0e9) == Approx(200.0));
    REQUIRE(fit(2.03e9) == Approx(200.0 - 9.0 + 0.36));

    REQUIRE_THROWS_AS(PolynomialFit::fit(ghz, std::vector<double>{1.0}, 1), std::invalid_argument);
}

#include "test_doubles.h"

#include "tuning/errors.h"
#include "tuning/optimizer_set.h"
#include "tuning/resonator_optimizer.h"

#include <catch2/catch.hpp>

#include <limits>
#include <memory>

using namespace tuning;
using testing::cachedState;
using testing::firstBatch;
using testing::Harness;
using testing::settingsFor;

namespace {

std::unique_ptr<SingleParamOptimizer> makeOptimizer(std::string const& name, Harness& h,
                                                    double start = 100.0, double tolerance = 0.01) {
    h.lab->registerArtifact(name + "_v1", start);
    auto settings = settingsFor(1.0e5);
    settings.tolerance = tolerance;
    return std::make_unique<ResonatorOptimizer>(name, firstBatch(name + "_v1", start), settings,
                                                h.collaborators());
}

} // namespace

TEST_CASE("Optimizer names are unique within a set", "[set]") {
    Harness h([](double v) { return 500.0 * v; });
    OptimizerSet set;
    set.add(makeOptimizer("A", h));

    REQUIRE_THROWS_AS(set.add(makeOptimizer("A", h)), ConfigurationError);
    REQUIRE(set.size() == 1);

    SECTION("adding several is all or nothing") {
        std::vector<std::unique_ptr<SingleParamOptimizer>> batch;
        batch.push_back(makeOptimizer("B", h));
        batch.push_back(makeOptimizer("B", h));
        REQUIRE_THROWS_AS(set.add(std::move(batch)), ConfigurationError);
        REQUIRE(set.size() == 1);
        REQUIRE_FALSE(set.contains("B"));
    }

    SECTION("lookup by name") {
        REQUIRE(set.get("A").name() == "A");
        REQUIRE_THROWS_AS(set.get("Z"), ConfigurationError);
        REQUIRE_THAT(set.describe(), Catch::Contains("A"));
    }
}

TEST_CASE("Overrides for unknown optimizers fail before any round", "[set]") {
    Harness h([](double v) { return 500.0 * v; });
    OptimizerSet set;
    set.add(makeOptimizer("A", h));
    auto generated = h.lab->generated.size();

    SetOverrides overrides;
    overrides["B"].next_values[3] = 120.0;
    REQUIRE_THROWS_AS(set.iterBatches(overrides), ConfigurationError);
    REQUIRE(h.lab->generated.size() == generated);
    REQUIRE(set.get("A").previousBatchNo() == 1);
}

TEST_CASE("Rounds sort optimizers into outcome buckets", "[set]") {
    Harness converging([](double v) { return 500.0 * v; });
    Harness waiting([](double v) { return 500.0 * v; });
    Harness oscillating([](double v) { return 1000.0 * v; });

    OptimizerSet set;
    set.add(makeOptimizer("A", converging));
    set.add(makeOptimizer("B", waiting));
    set.add(makeOptimizer("C", oscillating, 50.0, 0.001));

    // Batch 2 of B has not been simulated yet
    waiting.lab->not_ready.insert(set.get("B").ledger().at(2).artifact_name);

    auto outcomes = set.iterBatches({}, 3);
    REQUIRE(outcomes.at("A") == RoundOutcome::Finished);
    REQUIRE(outcomes.at("B") == RoundOutcome::NotReady);
    REQUIRE(outcomes.at("C") == RoundOutcome::Advanced);

    REQUIRE(set.get("A").state() == SearchState::Stopped);
    REQUIRE(set.get("B").previousBatchNo() == 1);
    REQUIRE(set.get("C").currentBatchNo() == 5);

    SECTION("next call resumes waiting optimizers") {
        waiting.lab->releaseAll();
        outcomes = set.iterBatches({}, 1);
        REQUIRE(outcomes.at("A") == RoundOutcome::Finished);
        REQUIRE(outcomes.at("B") == RoundOutcome::Finished);
        REQUIRE(set.get("B").optimizedBatch()->batch_no == 2);
    }

    SECTION("ignore-stop revives a finished optimizer") {
        SetOverrides overrides;
        overrides["A"].ignore_stop = {3};
        overrides["A"].next_values[3] = 205.0;
        outcomes = set.iterBatches(overrides, 1);
        REQUIRE(outcomes.at("A") == RoundOutcome::Advanced);
        REQUIRE(set.get("A").pendingVariableValue() == 205.0);
    }
}

TEST_CASE("Rounds stop once every optimizer paused or finished", "[set]") {
    Harness h([](double v) { return 500.0 * v; });
    auto diagnostics = h.diagnostics;
    OptimizerSet set([diagnostics](Diagnostic const& d) { diagnostics->push_back(d); });
    set.add(makeOptimizer("A", h));

    auto outcomes = set.iterBatches();
    REQUIRE(outcomes.at("A") == RoundOutcome::Finished);

    int rounds = 0;
    for (auto const& d : *diagnostics) {
        if (d.kind == DiagnosticKind::RoundStarted) {
            ++rounds;
        }
    }
    REQUIRE(rounds == 1);
    REQUIRE(h.saw(DiagnosticKind::Finished));
}

TEST_CASE("Fatal optimizer errors abort the round", "[set]") {
    bool broken = false;
    Harness h([&broken](double v) {
        return broken ? std::numeric_limits<double>::quiet_NaN() : 500.0 * v;
    });

    OptimizerSet set;
    set.add(makeOptimizer("A", h));
    broken = true;

    REQUIRE_THROWS_AS(set.iterBatches(), ConfigurationError);
}

TEST_CASE("A missing bracket aborts the whole set", "[set]") {
    Harness bracketless([](double v) { return 1000.0 * v; });
    Harness steady([](double v) { return 500.0 * v; });

    // Every simulated output of A lies below its target
    bracketless.store->save(cachedState("A", {100.0, 110.0, 120.0, 130.0, 140.0},
                                        {1.0e5, 1.1e5, 1.2e5, 1.3e5}, bracketless));

    OptimizerSet set;
    set.add(std::make_unique<ResonatorOptimizer>(
        "A", firstBatch("A_v1", 100.0), settingsFor(1.0e6, StrategyKind::CrossingPointSplit),
        bracketless.collaborators()));
    set.add(makeOptimizer("B", steady));

    auto generated = steady.lab->generated.size();
    REQUIRE(set.get("A").currentBatchNo() == 5);
    REQUIRE(set.get("B").previousBatchNo() == 1);

    REQUIRE_THROWS_AS(set.iterBatches(), BracketNotFound);

    // A ran first, so B never analyzed or generated in that round
    REQUIRE(steady.lab->generated.size() == generated);
    REQUIRE(set.get("B").previousBatchNo() == 1);
    REQUIRE(set.get("A").ledger().size() == 5);
}

TEST_CASE("Overrides for the first generated batch", "[set][overrides]") {
    Harness h([](double v) { return 500.0 * v; });

    SECTION("are applied when passed at construction") {
        h.lab->registerArtifact("A_v1", 100.0);
        BatchOverrides overrides;
        overrides.next_values[2] = 150.0;

        OptimizerSet set;
        set.add(std::make_unique<ResonatorOptimizer>("A", firstBatch("A_v1", 100.0), settingsFor(1.0e5),
                                                     h.collaborators(), CacheMode::Load, overrides));
        REQUIRE(set.get("A").ledger().at(2).variable_value == 150.0);
    }

    SECTION("are reported when the batch already exists") {
        auto diagnostics = h.diagnostics;
        OptimizerSet set([diagnostics](Diagnostic const& d) { diagnostics->push_back(d); });
        set.add(makeOptimizer("A", h));
        REQUIRE(set.get("A").ledger().at(2).variable_value == 200.0);
        h.diagnostics->clear();

        SetOverrides overrides;
        overrides["A"].next_values[2] = 150.0;
        set.iterBatches(overrides, 1);

        bool warned = false;
        for (auto const& d : *diagnostics) {
            if (d.kind == DiagnosticKind::ValueOverride && d.optimizer == "A" && d.batch_no == 2) {
                warned = d.severity == Severity::Warning;
            }
        }
        REQUIRE(warned);
        REQUIRE(set.get("A").ledger().at(2).variable_value == 200.0);
    }
}

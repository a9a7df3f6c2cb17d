#include "test_doubles.h"

#include "tuning/errors.h"
#include "tuning/resonator_optimizer.h"
#include "tuning/state_cache.h"

#include <catch2/catch.hpp>

#include <fstream>

using namespace tuning;
using testing::TempDir;

namespace {

OptimizerState sampleState() {
    OptimizerState state;
    state.name = "res_a";
    state.variable_values = {100.0, 110.0};
    state.output_values = {2.05e9, 2.03e9};
    for (int n = 1; n <= 3; ++n) {
        Batch b;
        b.batch_no = n;
        b.artifact_name = "artifact_" + std::to_string(n);
        b.artifact_path = BatchLedger::artifactFolder(n);
        b.output_path = BatchLedger::outputFolder(n);
        b.variable_value = 90.0 + 10.0 * n;
        state.ledger.add(b);
    }
    return state;
}

} // namespace

TEST_CASE("JsonStateStore round trips an optimizer state", "[cache]") {
    TempDir dir;
    JsonStateStore store(dir.path() / "OptCache");

    REQUIRE_FALSE(store.contains("res_a"));
    REQUIRE_THROWS_AS(store.load("res_a"), CacheNotFound);

    store.save(sampleState());
    REQUIRE(store.contains("res_a"));
    REQUIRE(store.recordPath("res_a").filename() == "OPT_res_a.json");

    auto loaded = store.load("res_a");
    REQUIRE(loaded.name == "res_a");
    REQUIRE(loaded.variable_values == std::vector<double>{100.0, 110.0});
    REQUIRE(loaded.output_values == std::vector<double>{2.05e9, 2.03e9});
    REQUIRE(loaded.ledger.size() == 3);
    REQUIRE(loaded.ledger.at(3).artifact_name == "artifact_3");
    REQUIRE(loaded.ledger.at(3).variable_value == 120.0);
}

TEST_CASE("Malformed cache records are rejected", "[cache]") {
    TempDir dir;
    JsonStateStore store(dir.path());

    SECTION("not JSON") {
        std::ofstream(store.recordPath("res_a")) << "name = res_a\n";
        REQUIRE_THROWS_AS(store.load("res_a"), CacheError);
    }

    SECTION("misaligned histories") {
        auto j = sampleState().toJSON();
        j["output_values"].push_back(1.0);
        std::ofstream(store.recordPath("res_a")) << j.dump();
        REQUIRE_THROWS_AS(store.load("res_a"), CacheError);
    }

    SECTION("ledger with a gap") {
        auto j = sampleState().toJSON();
        j["ledger"].erase(1);
        std::ofstream(store.recordPath("res_a")) << j.dump();
        REQUIRE_THROWS_AS(store.load("res_a"), CacheError);
    }
}

TEST_CASE("Optimizers resume from the JSON cache", "[cache][optimizer]") {
    TempDir dir;
    auto response = [](double v) { return 1000.0 * v; };
    testing::Harness h(response);
    h.lab->registerArtifact("res_v1", 50.0);

    auto collaborators = h.collaborators();
    collaborators.store = std::make_shared<JsonStateStore>(dir.path());

    {
        ResonatorOptimizer opt("res_a", testing::firstBatch("res_v1", 50.0),
                               testing::settingsFor(1.0e5), collaborators);
        opt.analyzeBatch();
        REQUIRE(opt.generateNextBatch());
        REQUIRE(opt.previousBatchNo() == 2);
    }

    SECTION("cached history is restored") {
        ResonatorOptimizer opt("res_a", testing::firstBatch("res_v1", 50.0),
                               testing::settingsFor(1.0e5), collaborators);
        REQUIRE(opt.previousBatchNo() == 2);
        REQUIRE(opt.ledger().size() == 3);
        REQUIRE(opt.state() == SearchState::Searching);
        REQUIRE(h.saw(DiagnosticKind::CacheRestored));
        REQUIRE(*opt.pendingVariableValue() == opt.ledger().at(3).variable_value);
    }

    SECTION("ignoring the cache starts over") {
        ResonatorOptimizer opt("res_a", testing::firstBatch("res_v1", 50.0),
                               testing::settingsFor(1.0e5), collaborators, CacheMode::Ignore);
        REQUIRE(opt.previousBatchNo() == 1);
        REQUIRE(opt.ledger().size() == 2);
    }
}

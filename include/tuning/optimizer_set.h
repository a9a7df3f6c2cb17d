#pragma once

#include "tuning/diagnostics.h"
#include "tuning/optimizer.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tuning {

// ============================================================================
// OPTIMIZER SET
// ============================================================================
// Independent optimizers driven through synchronized batch rounds. Each round
// every optimizer that is still active analyzes its pending batch and
// generates the next one. Optimizers whose output is missing or whose search
// has finished drop out of the loop; any other error aborts the round.
// ============================================================================

enum class RoundOutcome {
    Advanced,  // Analyzed and generated a new batch
    NotReady,  // Output of the pending batch does not exist yet
    Finished   // Converged, no further batch
};

// Optimizer name -> overrides for that optimizer
using SetOverrides = std::map<std::string, BatchOverrides>;

struct RoundReport {
    int round = 0;
    std::map<std::string, RoundOutcome> outcomes;
};

class OptimizerSet {
public:
    explicit OptimizerSet(DiagnosticSink diagnostics = {});

    // Throws ConfigurationError on a duplicate or empty name
    void add(std::unique_ptr<SingleParamOptimizer> optimizer);

    // Adds all or none
    void add(std::vector<std::unique_ptr<SingleParamOptimizer>> optimizers);

    bool contains(std::string const& name) const;

    // Throws ConfigurationError for an unknown name
    SingleParamOptimizer& get(std::string const& name);
    SingleParamOptimizer const& get(std::string const& name) const;

    std::size_t size() const { return optimizers_.size(); }
    bool empty() const { return optimizers_.empty(); }

    // Insertion order
    auto begin() const { return optimizers_.begin(); }
    auto end() const { return optimizers_.end(); }

    // Throws ConfigurationError if an override names an unknown optimizer
    void validateOverrides(SetOverrides const& overrides) const;

    // One analyze + generate step for every optimizer not in `done`.
    // Optimizers that pause or finish are added to `done`.
    RoundReport runRound(SetOverrides const& overrides, std::map<std::string, RoundOutcome>& done,
                         int round = 1);

    // Rounds until every optimizer is paused or finished, or max_rounds
    // (0 = unlimited) have run. Returns the final outcome per optimizer.
    std::map<std::string, RoundOutcome> iterBatches(SetOverrides const& overrides = {},
                                                    int max_rounds = 0);

    std::string describe() const;

private:
    std::vector<std::unique_ptr<SingleParamOptimizer>> optimizers_;
    DiagnosticSink diagnostics_;

    RoundOutcome advance(SingleParamOptimizer& optimizer, BatchOverrides const& overrides);

    // Value overrides for batches that already exist with another value
    void warnSkippedOverrides(SetOverrides const& overrides) const;
    void emit(DiagnosticKind kind, Severity severity, std::string optimizer, int batch_no,
              std::string message) const;
};

} // namespace tuning

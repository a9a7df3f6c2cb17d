#pragma once

#include "tuning/batch_ledger.h"
#include "tuning/collaborators.h"
#include "tuning/diagnostics.h"
#include "tuning/optimizer_settings.h"
#include "tuning/state_cache.h"
#include "tuning/strategy.h"
#include "tuning/trace.h"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace tuning {

// ============================================================================
// SINGLE PARAMETER OPTIMIZER
// ============================================================================
//
// Drives one variable parameter toward a target output, one batch at a time:
//
//   analyzeBatch()       measure the output of the current batch
//   generateNextBatch()  pick the next value and materialize its artifact
//
// Batch numbering: after N analyses, currentBatchNo() == N + 1. That is the
// batch generateNextBatch() creates, and the key every override is looked up
// with.
//
// State transitions:
//   Initializing -> Searching            first analysis + generation
//   Searching    -> Waiting              output of the pending batch missing
//   Waiting      -> Searching            output appeared, analysis succeeded
//   Searching    -> Stopped              converged, no ignore-stop override
//   Stopped      -> Searching            ignore-stop override for currentBatchNo()
// ============================================================================

enum class SearchState { Initializing, Searching, Waiting, Stopped };

enum class CacheMode {
    Load,   // Resume from the state store if a record exists
    Ignore  // Start from batch 1 regardless
};

// Overrides for a single optimizer, keyed by the batch number being generated
struct BatchOverrides {
    std::map<int, double> next_values;       // Force the variable value
    std::set<int> ignore_stop;               // Keep going although converged
    std::map<int, StrategyPtr> strategies;   // Switch strategy from this batch on,
                                             // the highest key <= batch wins

    bool empty() const {
        return next_values.empty() && ignore_stop.empty() && strategies.empty();
    }
};

// External collaborators shared by the optimizers of a run
struct Collaborators {
    std::shared_ptr<ArtifactGenerator> generator;
    std::shared_ptr<BatchAnalyzer> analyzer;
    std::shared_ptr<StateStore> store;
    DiagnosticSink diagnostics;  // Optional
};

// Closest batch to the target seen so far
struct BestResult {
    Batch batch;
    double output_value = 0.0;
    bool optimized = false;  // Within tolerance
};

class SingleParamOptimizer {
public:
    virtual ~SingleParamOptimizer() = default;

    SingleParamOptimizer(SingleParamOptimizer const&) = delete;
    SingleParamOptimizer& operator=(SingleParamOptimizer const&) = delete;

    // ------------------------------------------------------------------------
    // Batch cycle
    // ------------------------------------------------------------------------

    // Analyze the current batch and append the result to the history.
    // Throws OutputNotReady (recoverable), SearchFinished when stopped,
    // LedgerError if the batch was never generated, ConfigurationError if
    // the analyzer returns a non-finite value.
    void analyzeBatch();

    // Generate batch currentBatchNo(). Returns false when the optimizer has
    // converged and stops instead.
    bool generateNextBatch(BatchOverrides const& overrides = {});

    // target*(1-tol) <= last output <= target*(1+tol), inclusive
    bool hasReachedOptimization() const;

    // ------------------------------------------------------------------------
    // Views
    // ------------------------------------------------------------------------

    std::string const& name() const { return name_; }
    OptimizerSettings const& settings() const { return settings_; }
    SearchState state() const { return state_; }

    int previousBatchNo() const { return static_cast<int>(variable_values_.size()); }
    int currentBatchNo() const { return previousBatchNo() + 1; }
    int nextBatchNo() const { return currentBatchNo() + 1; }

    std::span<double const> variableValues() const { return variable_values_; }
    std::span<double const> outputValues() const { return output_values_; }
    BatchLedger const& ledger() const { return ledger_; }

    // Throws TuningError when nothing has been analyzed yet
    double currentOutputValue() const;
    double currentVariableValue() const;

    // Value of the generated batch still awaiting analysis
    std::optional<double> pendingVariableValue() const;

    Strategy const& strategy() const { return *strategy_; }
    void setStrategy(StrategyPtr strategy);

    // Last analyzed batch, if it is within tolerance
    std::optional<Batch> optimizedBatch() const;

    // Optimized batch if there is one, otherwise the batch whose output is
    // closest to the target. Throws TuningError when nothing was analyzed.
    BestResult closestToOptimized() const;

    OptimizerState snapshot() const;

    std::string describe() const;

    // History scatter, target line, next value and strategy fit
    void renderTrace(TraceSink& sink) const;

protected:
    // batch_1 must describe an artifact that already exists
    SingleParamOptimizer(std::string name, Batch batch_1, OptimizerSettings settings,
                         Collaborators collaborators);

    // Validate, restore or analyze batch 1, and propose batch 2.
    // Called by the concrete type's constructor once it is fully built.
    // Overrides apply to any batch generated during startup.
    void start(CacheMode mode, BatchOverrides const& overrides = {});

    // Quantities the concrete optimizer knows how to measure
    virtual std::vector<std::string> acceptedQuantities() const = 0;

private:
    std::string name_;
    Batch batch_1_;
    OptimizerSettings settings_;
    Collaborators collaborators_;
    StrategyPtr strategy_;

    SearchState state_ = SearchState::Initializing;
    std::vector<double> variable_values_;
    std::vector<double> output_values_;
    BatchLedger ledger_;

    void checkTargetQuantity() const;
    void restore(OptimizerState state, BatchOverrides const& overrides);
    double proposeNextValue(int batch_no, BatchOverrides const& overrides);
    double clamp(double value, std::string const& source, int batch_no) const;
    void persist() const;
    void emit(DiagnosticKind kind, Severity severity, int batch_no, std::string message) const;
};

} // namespace tuning

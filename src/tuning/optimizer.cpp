#include "tuning/optimizer.h"

#include "tuning/errors.h"
#include "tuning/mesh.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace tuning {

namespace {

std::string formatValue(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

bool endsWith(std::string const& str, std::string const& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

SingleParamOptimizer::SingleParamOptimizer(std::string name, Batch batch_1,
                                           OptimizerSettings settings, Collaborators collaborators)
    : name_(std::move(name)),
      batch_1_(std::move(batch_1)),
      settings_(std::move(settings)),
      collaborators_(std::move(collaborators)),
      strategy_(settings_.strategy) {}

// ============================================================================
// Startup
// ============================================================================

void SingleParamOptimizer::start(CacheMode mode, BatchOverrides const& overrides) {
    if (name_.empty()) {
        throw ConfigurationError("Optimizer name must not be empty");
    }
    // The name becomes part of cache and artifact file names
    if (name_.find_first_of("/\\") != std::string::npos || name_ == "." || name_ == "..") {
        throw ConfigurationError("Optimizer name `" + name_ + "` must not contain path separators");
    }
    settings_.validate();
    checkTargetQuantity();

    if (endsWith(batch_1_.artifact_name, ".son")) {
        throw ConfigurationError("Batch 1 name `" + batch_1_.artifact_name +
                                 "` should not contain the '.son' file extension");
    }
    if (!collaborators_.generator || !collaborators_.analyzer || !collaborators_.store) {
        throw ConfigurationError("Optimizer `" + name_ +
                                 "` needs an artifact generator, a batch analyzer and a state store");
    }

    if (mode == CacheMode::Load && collaborators_.store->contains(name_)) {
        restore(collaborators_.store->load(name_), overrides);
        return;
    }

    batch_1_.batch_no = 1;
    ledger_ = BatchLedger(batch_1_);

    try {
        analyzeBatch();
    } catch (OutputNotReady const&) {
        // Solver has not produced batch 1 yet; the scheduler retries later
        persist();
        return;
    }
    generateNextBatch(overrides);
}

void SingleParamOptimizer::checkTargetQuantity() const {
    auto accepted = acceptedQuantities();
    if (std::find(accepted.begin(), accepted.end(), settings_.target_quantity) != accepted.end()) {
        return;
    }

    std::string list;
    for (auto const& q : accepted) {
        list += list.empty() ? q : ", " + q;
    }
    throw ConfigurationError("Cannot optimize for `" + settings_.target_quantity +
                             "`. Can only optimize for [" + list + "]");
}

void SingleParamOptimizer::restore(OptimizerState state, BatchOverrides const& overrides) {
    if (state.name != name_) {
        throw CacheError("Cache record for `" + name_ + "` belongs to `" + state.name + "`");
    }
    if (state.variable_values.size() != state.output_values.size()) {
        throw CacheError("Cache record for `" + name_ + "` has misaligned histories");
    }

    int analyzed = static_cast<int>(state.variable_values.size());
    int generated = state.ledger.size();
    if (generated != analyzed && generated != analyzed + 1) {
        throw CacheError("Cache record for `" + name_ + "` has " + std::to_string(generated) +
                         " batches for " + std::to_string(analyzed) + " analyses");
    }
    if (generated == 0) {
        throw CacheError("Cache record for `" + name_ + "` has an empty ledger");
    }

    variable_values_ = std::move(state.variable_values);
    output_values_ = std::move(state.output_values);
    ledger_ = std::move(state.ledger);
    state_ = SearchState::Searching;

    emit(DiagnosticKind::CacheRestored, Severity::Info, currentBatchNo(),
         "Restored " + std::to_string(analyzed) + " analyzed batches from cache");

    // Last analysis finished but its successor was never generated
    if (generated == analyzed) {
        generateNextBatch(overrides);
    }
}

// ============================================================================
// Batch cycle
// ============================================================================

void SingleParamOptimizer::analyzeBatch() {
    if (state_ == SearchState::Stopped) {
        throw SearchFinished("Optimizer `" + name_ + "` has finished at batch " +
                             std::to_string(previousBatchNo()));
    }

    int batch_no = currentBatchNo();
    Batch const& batch = ledger_.at(batch_no);

    double value = 0.0;
    try {
        value = collaborators_.analyzer->analyze(batch.artifact_name, batch.output_path,
                                                 settings_.target_quantity);
    } catch (OutputNotReady const&) {
        state_ = SearchState::Waiting;
        emit(DiagnosticKind::OutputNotReady, Severity::Warning, batch_no,
             "No output file to analyse yet");
        throw;
    }

    if (!std::isfinite(value)) {
        throw ConfigurationError("Analysis of batch " + std::to_string(batch_no) + " for `" + name_ +
                                 "` returned a non-numeric " + settings_.target_quantity +
                                 ". Cannot continue with optimizer.");
    }

    variable_values_.push_back(batch.variable_value);
    output_values_.push_back(value);
    state_ = SearchState::Searching;
    persist();
}

bool SingleParamOptimizer::generateNextBatch(BatchOverrides const& overrides) {
    if (output_values_.empty()) {
        throw TuningError("Optimizer `" + name_ + "` has no analyzed batch to continue from");
    }
    if (ledger_.size() != previousBatchNo()) {
        throw LedgerError("Batch " + std::to_string(ledger_.lastBatchNo()) + " of `" + name_ +
                          "` is already generated and awaits analysis");
    }

    int batch_no = currentBatchNo();

    if (hasReachedOptimization()) {
        emit(DiagnosticKind::Converged, Severity::Success, previousBatchNo(),
             "Reached desired " + settings_.target_quantity + " = " +
                 formatValue(currentOutputValue()) + " with " + settings_.variable_name + " = " +
                 formatValue(currentVariableValue()));

        if (overrides.ignore_stop.count(batch_no) == 0) {
            state_ = SearchState::Stopped;
            persist();
            return false;
        }
        emit(DiagnosticKind::IgnoredStop, Severity::Warning, batch_no,
             "Ignoring automatic stop for batch " + std::to_string(batch_no) + ". Continuing.");
    }

    double value = proposeNextValue(batch_no, overrides);

    Batch const& base = ledger_.at(previousBatchNo());
    Batch next;
    next.batch_no = batch_no;
    next.artifact_name =
        BatchLedger::artifactName(batch_no, name_, settings_.variable_name, value);
    next.artifact_path = BatchLedger::artifactFolder(batch_no, settings_.work_directory);
    next.output_path = BatchLedger::outputFolder(batch_no, settings_.work_directory);
    next.variable_value = value;

    collaborators_.generator->generate({base.artifact_name, base.artifact_path},
                                       {next.artifact_name, next.artifact_path},
                                       {{settings_.variable_name, value}});

    ledger_.add(next);
    state_ = SearchState::Searching;

    emit(DiagnosticKind::BatchGenerated, Severity::Info, batch_no,
         "Made batch " + std::to_string(batch_no) + " - VALUE=" + formatValue(value));

    persist();
    return true;
}

double SingleParamOptimizer::proposeNextValue(int batch_no, BatchOverrides const& overrides) {
    // Latest strategy override registered at or before this batch. Looking
    // back instead of matching batch_no keeps it in force after a resume.
    if (auto it = overrides.strategies.upper_bound(batch_no); it != overrides.strategies.begin()) {
        --it;
        if (it->second != strategy_) {
            setStrategy(it->second);
            emit(DiagnosticKind::StrategyOverride, Severity::Warning, batch_no,
                 "Strategy override to " + strategy_->name() + " from batch " +
                     std::to_string(it->first));
        }
    }

    if (auto it = overrides.next_values.find(batch_no); it != overrides.next_values.end()) {
        emit(DiagnosticKind::ValueOverride, Severity::Warning, batch_no,
             "Override: batch " + std::to_string(batch_no) + " - VALUE=" + formatValue(it->second));
        return clamp(it->second, "override", batch_no);
    }

    StrategyInput input;
    input.current_output = currentOutputValue();
    input.target_output = settings_.target_value;
    input.variable_values = variable_values_;
    input.output_values = output_values_;
    input.correlation = sign(settings_.correlation);
    input.mesh_size = settings_.mesh_size;

    Proposal proposal = strategy_->nextValue(input);
    if (proposal.produced_by != strategy_->name()) {
        emit(DiagnosticKind::Fallback, Severity::Warning, batch_no,
             strategy_->name() + " fell back to " + proposal.produced_by);
    }
    return clamp(proposal.value, proposal.produced_by, batch_no);
}

double SingleParamOptimizer::clamp(double value, std::string const& source, int batch_no) const {
    double bound = 0.0;
    if (settings_.min_value && value < *settings_.min_value) {
        bound = *settings_.min_value;
        emit(DiagnosticKind::Clamped, Severity::Warning, batch_no,
             "Got " + settings_.variable_name + " = " + formatValue(value) + " from " + source +
                 ", below the min allowed value. Clamped to " + formatValue(bound));
    } else if (settings_.max_value && value > *settings_.max_value) {
        bound = *settings_.max_value;
        emit(DiagnosticKind::Clamped, Severity::Warning, batch_no,
             "Got " + settings_.variable_name + " = " + formatValue(value) + " from " + source +
                 ", above the max allowed value. Clamped to " + formatValue(bound));
    } else {
        return value;
    }

    // A bound that was already simulated would repeat the same batch forever
    if (alreadyTried(bound, variable_values_, settings_.mesh_size)) {
        throw SearchExhausted("Optimizer `" + name_ + "` clamped " + settings_.variable_name +
                              " to the already simulated bound " + formatValue(bound) +
                              ". The target is out of reach within the bounds.");
    }
    return bound;
}

bool SingleParamOptimizer::hasReachedOptimization() const {
    if (output_values_.empty()) {
        return false;
    }
    double last = output_values_.back();
    double lower = settings_.target_value * (1.0 - settings_.tolerance);
    double upper = settings_.target_value * (1.0 + settings_.tolerance);
    // Negative targets flip the bounds
    if (lower > upper) {
        std::swap(lower, upper);
    }
    return lower <= last && last <= upper;
}

// ============================================================================
// Views
// ============================================================================

double SingleParamOptimizer::currentOutputValue() const {
    if (output_values_.empty()) {
        throw TuningError("Optimizer `" + name_ + "` has not analyzed any batch yet");
    }
    return output_values_.back();
}

double SingleParamOptimizer::currentVariableValue() const {
    if (variable_values_.empty()) {
        throw TuningError("Optimizer `" + name_ + "` has not analyzed any batch yet");
    }
    return variable_values_.back();
}

std::optional<double> SingleParamOptimizer::pendingVariableValue() const {
    if (!ledger_.contains(currentBatchNo())) {
        return std::nullopt;
    }
    return ledger_.at(currentBatchNo()).variable_value;
}

void SingleParamOptimizer::setStrategy(StrategyPtr strategy) {
    if (!strategy) {
        throw ConfigurationError("Cannot set an empty strategy on optimizer `" + name_ + "`");
    }
    strategy_ = std::move(strategy);
}

std::optional<Batch> SingleParamOptimizer::optimizedBatch() const {
    if (!hasReachedOptimization()) {
        return std::nullopt;
    }
    return ledger_.at(previousBatchNo());
}

BestResult SingleParamOptimizer::closestToOptimized() const {
    if (output_values_.empty()) {
        throw TuningError("Optimizer `" + name_ + "` has no analyzed batches");
    }

    if (auto optimized = optimizedBatch()) {
        return {*optimized, output_values_.back(), true};
    }

    std::size_t best = 0;
    for (std::size_t i = 1; i < output_values_.size(); ++i) {
        if (std::abs(output_values_[i] - settings_.target_value) <
            std::abs(output_values_[best] - settings_.target_value)) {
            best = i;
        }
    }
    int batch_no = static_cast<int>(best) + 1;
    return {ledger_.at(batch_no), output_values_[best], false};
}

OptimizerState SingleParamOptimizer::snapshot() const {
    OptimizerState state;
    state.name = name_;
    state.variable_values = variable_values_;
    state.output_values = output_values_;
    state.ledger = ledger_;
    return state;
}

std::string SingleParamOptimizer::describe() const {
    std::ostringstream ss;
    ss << "Optimizer: " << name_ << "\n";
    ss << "     optimization_strategy: " << strategy_->name() << "\n";
    ss << "          current_batch_no: " << currentBatchNo() << "\n";
    ss << "       variable_param_name: " << settings_.variable_name << "\n";
    ss << "      desired_output_param: " << settings_.target_quantity << "\n";
    ss << "desired_output_param_value: " << settings_.target_value << "\n";
    ss << "               correlation: " << toSymbol(settings_.correlation);
    return ss.str();
}

void SingleParamOptimizer::renderTrace(TraceSink& sink) const {
    sink.series("history", variable_values_, output_values_);
    sink.targetLine(settings_.target_value);

    if (!hasReachedOptimization()) {
        if (auto pending = pendingVariableValue()) {
            sink.nextValueMarker(*pending, settings_.target_value);
        }
    }
    strategy_->renderTrace(sink, variable_values_, output_values_, settings_.target_value);
}

// ============================================================================
// Internals
// ============================================================================

void SingleParamOptimizer::persist() const {
    collaborators_.store->save(snapshot());
}

void SingleParamOptimizer::emit(DiagnosticKind kind, Severity severity, int batch_no,
                                std::string message) const {
    if (!collaborators_.diagnostics) {
        return;
    }
    Diagnostic d;
    d.kind = kind;
    d.severity = severity;
    d.optimizer = name_;
    d.batch_no = batch_no;
    d.message = std::move(message);
    collaborators_.diagnostics(d);
}

} // namespace tuning

#include "tuning/optimizer_set.h"

#include "tuning/enum_utils.h"
#include "tuning/errors.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace tuning {

OptimizerSet::OptimizerSet(DiagnosticSink diagnostics) : diagnostics_(std::move(diagnostics)) {}

void OptimizerSet::add(std::unique_ptr<SingleParamOptimizer> optimizer) {
    if (!optimizer) {
        throw ConfigurationError("Cannot add an empty optimizer to the set");
    }
    if (contains(optimizer->name())) {
        throw ConfigurationError("Optimizer name `" + optimizer->name() +
                                 "` already exists in the set. Names must be unique.");
    }
    optimizers_.push_back(std::move(optimizer));
}

void OptimizerSet::add(std::vector<std::unique_ptr<SingleParamOptimizer>> optimizers) {
    // Check the whole batch first so a duplicate leaves the set untouched
    std::set<std::string> seen;
    for (auto const& opt : optimizers) {
        if (!opt) {
            throw ConfigurationError("Cannot add an empty optimizer to the set");
        }
        if (contains(opt->name()) || !seen.insert(opt->name()).second) {
            throw ConfigurationError("Optimizer name `" + opt->name() +
                                     "` already exists in the set. Names must be unique.");
        }
    }
    for (auto& opt : optimizers) {
        optimizers_.push_back(std::move(opt));
    }
}

bool OptimizerSet::contains(std::string const& name) const {
    return std::any_of(optimizers_.begin(), optimizers_.end(),
                       [&](auto const& opt) { return opt->name() == name; });
}

SingleParamOptimizer& OptimizerSet::get(std::string const& name) {
    for (auto& opt : optimizers_) {
        if (opt->name() == name) {
            return *opt;
        }
    }
    throw ConfigurationError("No optimizer named `" + name + "` in the set");
}

SingleParamOptimizer const& OptimizerSet::get(std::string const& name) const {
    for (auto const& opt : optimizers_) {
        if (opt->name() == name) {
            return *opt;
        }
    }
    throw ConfigurationError("No optimizer named `" + name + "` in the set");
}

void OptimizerSet::validateOverrides(SetOverrides const& overrides) const {
    for (auto const& [name, batch_overrides] : overrides) {
        if (!contains(name)) {
            throw ConfigurationError("Override references unknown optimizer `" + name + "`");
        }
        for (auto const& [batch_no, strategy] : batch_overrides.strategies) {
            if (!strategy) {
                throw ConfigurationError("Strategy override for `" + name + "` at batch " +
                                         std::to_string(batch_no) + " is empty");
            }
        }
        for (auto const& [batch_no, value] : batch_overrides.next_values) {
            if (batch_no < 2) {
                throw ConfigurationError("Value override for `" + name + "` at batch " +
                                         std::to_string(batch_no) +
                                         ": only batches after the first can be overridden");
            }
        }
    }
}

void OptimizerSet::warnSkippedOverrides(SetOverrides const& overrides) const {
    for (auto const& [name, batch_overrides] : overrides) {
        auto const& ledger = get(name).ledger();
        for (auto const& [batch_no, value] : batch_overrides.next_values) {
            // Generated before this call, e.g. while the optimizer was constructed
            if (ledger.contains(batch_no) && ledger.at(batch_no).variable_value != value) {
                emit(DiagnosticKind::ValueOverride, Severity::Warning, name, batch_no,
                     "Batch " + std::to_string(batch_no) +
                         " was already generated, value override not applied. Pass it at "
                         "construction to override the first generated batch.");
            }
        }
    }
}

// ============================================================================
// Rounds
// ============================================================================

RoundOutcome OptimizerSet::advance(SingleParamOptimizer& optimizer,
                                   BatchOverrides const& overrides) {
    try {
        if (optimizer.state() == SearchState::Stopped) {
            // Only an ignore-stop override revives a finished search
            if (overrides.ignore_stop.count(optimizer.currentBatchNo()) == 0) {
                return RoundOutcome::Finished;
            }
        } else {
            optimizer.analyzeBatch();
        }
        return optimizer.generateNextBatch(overrides) ? RoundOutcome::Advanced
                                                      : RoundOutcome::Finished;
    } catch (OutputNotReady const&) {
        return RoundOutcome::NotReady;
    } catch (SearchFinished const&) {
        return RoundOutcome::Finished;
    }
}

RoundReport OptimizerSet::runRound(SetOverrides const& overrides,
                                   std::map<std::string, RoundOutcome>& done, int round) {
    static BatchOverrides const no_overrides{};

    RoundReport report;
    report.round = round;
    emit(DiagnosticKind::RoundStarted, Severity::Info, "", 0, "Round " + std::to_string(round));

    for (auto& opt : optimizers_) {
        if (done.count(opt->name()) != 0) {
            continue;
        }

        auto it = overrides.find(opt->name());
        BatchOverrides const& batch_overrides = it != overrides.end() ? it->second : no_overrides;

        RoundOutcome outcome = advance(*opt, batch_overrides);
        report.outcomes[opt->name()] = outcome;

        if (outcome == RoundOutcome::Finished) {
            emit(DiagnosticKind::Finished, Severity::Success, opt->name(), opt->previousBatchNo(),
                 "Optimization finished");
        }
        if (outcome != RoundOutcome::Advanced) {
            done[opt->name()] = outcome;
        }
    }
    return report;
}

std::map<std::string, RoundOutcome> OptimizerSet::iterBatches(SetOverrides const& overrides,
                                                              int max_rounds) {
    validateOverrides(overrides);
    warnSkippedOverrides(overrides);

    std::map<std::string, RoundOutcome> done;
    std::map<std::string, RoundOutcome> last;
    int round = 0;

    while (done.size() < optimizers_.size() && (max_rounds <= 0 || round < max_rounds)) {
        ++round;
        RoundReport report = runRound(overrides, done, round);
        for (auto const& [name, outcome] : report.outcomes) {
            last[name] = outcome;
        }
    }

    emit(DiagnosticKind::Info, Severity::Info, "", 0,
         "Stopped after " + std::to_string(round) + " round(s), " + std::to_string(done.size()) +
             "/" + std::to_string(optimizers_.size()) + " optimizers paused or finished");
    return last;
}

std::string OptimizerSet::describe() const {
    std::ostringstream ss;
    ss << "OptimizerSet (" << optimizers_.size() << ")";
    for (auto const& opt : optimizers_) {
        ss << "\n  - " << opt->name() << " [" << enum_utils::toDisplayString(opt->state()) << ", batch "
           << opt->currentBatchNo() << "]";
    }
    return ss.str();
}

void OptimizerSet::emit(DiagnosticKind kind, Severity severity, std::string optimizer,
                        int batch_no, std::string message) const {
    if (!diagnostics_) {
        return;
    }
    Diagnostic d;
    d.kind = kind;
    d.severity = severity;
    d.optimizer = std::move(optimizer);
    d.batch_no = batch_no;
    d.message = std::move(message);
    diagnostics_(d);
}

} // namespace tuning

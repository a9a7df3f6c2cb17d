#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace tuning {

// ============================================================================
// ERROR TAXONOMY
// ============================================================================
// Configuration errors and search exhaustion are fatal. OutputNotReady and
// SearchFinished are the two conditions the scheduler treats as "stop driving
// this optimizer for now" instead of aborting the round.

struct TuningError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Invalid settings, unknown quantities, malformed overrides, duplicate names
struct ConfigurationError : TuningError {
    using TuningError::TuningError;
};

// The output artifact of the current batch does not exist yet
struct OutputNotReady : TuningError {
    using TuningError::TuningError;
};

// The optimizer has converged and has no pending batch
struct SearchFinished : TuningError {
    using TuningError::TuningError;
};

// No strategy in the fallback chain produced an untried value
struct SearchExhausted : TuningError {
    using TuningError::TuningError;
};

// CrossingPointSplit has no point on one side of the target
struct BracketNotFound : SearchExhausted {
    using SearchExhausted::SearchExhausted;
};

// Batch ledger lookup miss or out-of-order insertion
struct LedgerError : TuningError {
    using TuningError::TuningError;
};

struct CacheError : TuningError {
    using TuningError::TuningError;
};

struct CacheNotFound : CacheError {
    using CacheError::CacheError;
};

// Raised by artifact generators
struct ArtifactNotFound : TuningError {
    using TuningError::TuningError;
};

struct ParamNotFound : TuningError {
    ParamNotFound(std::string param_name, std::string const& artifact)
        : TuningError("Parameter `" + param_name + "` not found in `" + artifact + "`"),
          param(std::move(param_name)) {}

    std::string param;
};

} // namespace tuning

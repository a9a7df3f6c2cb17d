#pragma once

#include <functional>
#include <string>

namespace tuning {

// Events the engine reports while it runs. The engine never prints;
// whoever owns the sink decides how (and whether) to present them.
enum class DiagnosticKind {
    Info,
    RoundStarted,
    BatchGenerated,
    Converged,
    Clamped,          // Proposed value exceeded a bound
    Fallback,         // Fit strategy degenerated, a simpler one was used
    ValueOverride,
    StrategyOverride,
    IgnoredStop,      // Converged but forced to keep going
    OutputNotReady,
    Finished,
    CacheRestored
};

enum class Severity { Info, Success, Warning };

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::Info;
    Severity severity = Severity::Info;
    std::string optimizer;  // Empty for set-level events
    int batch_no = 0;
    std::string message;
};

using DiagnosticSink = std::function<void(Diagnostic const&)>;

} // namespace tuning

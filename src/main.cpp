// Iterative single-parameter tuning of EM simulations
//
// Drives one optimizer per [[optimizer]] entry of a TOML run file. Each round
// analyzes the batch the external solver finished and generates the next
// simulation input. Run again once the solver has processed the new batches;
// progress is resumed from the JSON state cache.
//
// Usage:
//   ./sontune run.toml [options]
//
// Options:
//   --ignore-cache       Start every optimizer from batch 1
//   --max-rounds <N>     Stop after N rounds (default: from config, 0 = unlimited)
//   --trace <file>       Write fit traces as JSON
//   --status             Print summaries without running any round

#include "config.h"
#include "tuning/enum_utils.h"
#include "tuning/errors.h"
#include "tuning/manifest_generator.h"
#include "tuning/optimizer_set.h"
#include "tuning/quantity_analyzer.h"
#include "tuning/state_cache.h"
#include "tuning/trace.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace {

void printUsage(char const* prog) {
    std::cerr
        << "Usage: " << prog << " run.toml [options]\n\n"
        << "Iterative single-parameter tuning of EM simulation batches.\n\n"
        << "Options:\n"
        << "  --ignore-cache       Start every optimizer from batch 1\n"
        << "  --max-rounds <N>     Stop after N rounds (0 = until all pause or finish)\n"
        << "  --trace <file>       Write history, fits and next values as JSON\n"
        << "  --status             Only print optimizer summaries\n"
        << "  --help               Show this help message\n";
}

void printDiagnostic(tuning::Diagnostic const& d) {
    std::ostream& out = d.severity == tuning::Severity::Warning ? std::cerr : std::cout;

    if (d.kind == tuning::DiagnosticKind::RoundStarted) {
        out << "\n=== " << d.message << " ===\n";
        return;
    }

    char const* tag = d.severity == tuning::Severity::Warning   ? "[warn] "
                      : d.severity == tuning::Severity::Success ? "[done] "
                                                                : "";
    out << tag;
    if (!d.optimizer.empty()) {
        out << d.optimizer << ": ";
    }
    out << d.message << "\n";
}

void printSummary(tuning::SingleParamOptimizer const& opt) {
    std::cout << "\n" << opt.describe() << "\n";
    std::cout << "                     state: " << enum_utils::toDisplayString(opt.state()) << "\n";

    if (opt.outputValues().empty()) {
        std::cout << "  No batch analyzed yet\n";
        return;
    }

    auto best = opt.closestToOptimized();
    std::cout << (best.optimized ? "  Optimized batch: " : "  Closest batch so far: ")
              << best.batch.batch_no << "\n"
              << "    artifact: " << best.batch.artifact_name << "\n"
              << "    path:     " << best.batch.artifact_path << "\n"
              << "    output:   " << best.batch.output_path << "\n"
              << "    " << opt.settings().variable_name << " = " << best.batch.variable_value
              << " -> " << opt.settings().target_quantity << " = " << std::setprecision(10)
              << best.output_value << std::setprecision(6) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string config_path;
    std::string trace_path;
    bool ignore_cache = false;
    bool status_only = false;
    int max_rounds = -1;  // -1 = use config

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--ignore-cache") {
            ignore_cache = true;
        } else if (arg == "--status") {
            status_only = true;
        } else if (arg == "--max-rounds" && i + 1 < argc) {
            try {
                max_rounds = std::stoi(argv[++i]);
            } catch (std::exception const&) {
                std::cerr << "Invalid --max-rounds value: " << argv[i] << "\n";
                return 1;
            }
            if (max_rounds < 0) {
                max_rounds = 0;
            }
        } else if (arg == "--trace" && i + 1 < argc) {
            trace_path = argv[++i];
        } else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else if (config_path.empty()) {
            config_path = arg;
        }
    }

    if (config_path.empty()) {
        std::cerr << "Error: run config path required\n";
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto config = tuning::RunConfig::load(config_path);
        if (ignore_cache) {
            config.run.ignore_cache = true;
        }
        if (max_rounds >= 0) {
            config.run.max_rounds = max_rounds;
        }
        if (!trace_path.empty()) {
            config.run.trace_file = trace_path;
        }

        std::cout << "Loaded " << config.optimizers.size() << " optimizer(s) from " << config_path
                  << "\n";
        std::cout << "State cache: " << config.run.cache_directory
                  << (config.run.ignore_cache ? " (ignored)" : "") << "\n";

        tuning::Collaborators collaborators;
        collaborators.generator = std::make_shared<tuning::ManifestArtifactGenerator>();
        collaborators.analyzer = std::make_shared<tuning::QuantityFileAnalyzer>();
        collaborators.store = std::make_shared<tuning::JsonStateStore>(config.run.cache_directory);
        collaborators.diagnostics = printDiagnostic;

        // Built once so construction and rounds share the same strategy objects
        auto overrides = config.overrides();

        tuning::OptimizerSet set(printDiagnostic);
        for (auto const& opt_config : config.optimizers) {
            auto it = overrides.find(opt_config.name);
            set.add(tuning::buildOptimizer(opt_config, config.run, collaborators,
                                           it != overrides.end() ? it->second
                                                                 : tuning::BatchOverrides{}));
        }

        if (!status_only) {
            auto outcomes = set.iterBatches(overrides, config.run.max_rounds);

            std::cout << "\n=== Round Outcomes ===\n";
            for (auto const& [name, outcome] : outcomes) {
                std::cout << std::left << std::setw(24) << name << std::right
                          << enum_utils::toDisplayString(outcome) << "\n";
            }
        }

        std::cout << "\n=== Optimizers ===";
        for (auto const& opt : set) {
            printSummary(*opt);
        }

        if (!config.run.trace_file.empty()) {
            tuning::JsonTraceSink trace;
            for (auto const& opt : set) {
                trace.beginOptimizer(opt->name());
                opt->renderTrace(trace);
            }
            trace.save(config.run.trace_file);
            std::cout << "\nTrace written to " << config.run.trace_file << "\n";
        }
    } catch (tuning::TuningError const& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (std::exception const& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

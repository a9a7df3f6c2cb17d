#pragma once

#include "tuning/batch_ledger.h"
#include "tuning/optimizer.h"
#include "tuning/optimizer_settings.h"
#include "tuning/optimizer_set.h"
#include "tuning/strategy.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tuning {

// Strategy switch registered for one batch number
struct StrategyOverrideConfig {
    int batch = 0;
    StrategyKind strategy = StrategyKind::PercentScale;
    int degree = 2;  // poly_fit only
};

// One [[optimizer]] entry
struct OptimizerConfig {
    std::string name;
    std::string type = "resonator";

    // Batch 1, simulated before the run
    std::string batch_1_name;
    std::string batch_1_path;         // Default: batch_1_son_files
    std::string batch_1_output_path;  // Default: batch_1_outputs
    double initial_value = 0.0;

    std::string variable;
    std::string quantity;
    double target = 0.0;
    double tolerance = 0.01;
    Correlation correlation = Correlation::Positive;
    double mesh_size = 1.0;
    std::optional<double> min_value;
    std::optional<double> max_value;
    StrategyKind strategy = StrategyKind::PercentScale;
    int degree = 2;

    // [optimizer.overrides]
    std::vector<int> ignore_stop;
    std::map<int, double> next_values;
    std::vector<StrategyOverrideConfig> strategy_overrides;

    Batch batch1(std::string const& work_directory = "") const;
    OptimizerSettings settings(std::string const& work_directory = "") const;
    BatchOverrides overrides() const;
};

struct RunParams {
    std::string cache_directory = "OptCache";
    std::string work_directory;  // Prefix for generated batch folders
    bool ignore_cache = false;
    int max_rounds = 0;          // 0 = until every optimizer pauses or finishes
    std::string trace_file;      // Empty = no trace
};

struct RunConfig {
    RunParams run;
    std::vector<OptimizerConfig> optimizers;

    // Throws ConfigurationError on parse errors, missing keys or invalid values
    static RunConfig load(std::string const& path);
    static RunConfig parse(std::string_view toml_text, std::string const& source = "<string>");

    // Overrides of every optimizer, keyed by name
    SetOverrides overrides() const;
};

// Builds the optimizer type named by config.type. Construction analyzes
// batch 1 (or restores the cache), so collaborators must be ready, and may
// generate a batch with the given overrides.
// Throws ConfigurationError for an unknown type.
std::unique_ptr<SingleParamOptimizer> buildOptimizer(OptimizerConfig const& config,
                                                     RunParams const& run,
                                                     Collaborators const& collaborators,
                                                     BatchOverrides const& overrides = {});

} // namespace tuning

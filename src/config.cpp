#include "config.h"

#include "tuning/enum_utils.h"
#include "tuning/errors.h"
#include "tuning/resonator_optimizer.h"

#include <filesystem>
#include <set>
#include <toml++/toml.hpp>

namespace tuning {

namespace {

// Safe value extraction helpers
template <typename T> T get_or(toml::table const& tbl, std::string_view key, T default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<T>()) {
            return *val;
        }
        throw ConfigurationError("Invalid type for `" + std::string(key) + "`");
    }
    return default_val;
}

template <typename T> std::optional<T> get_optional(toml::table const& tbl, std::string_view key) {
    if (!tbl.contains(key)) {
        return std::nullopt;
    }
    return get_or<T>(tbl, key, T{});
}

template <typename T> T require(toml::table const& tbl, std::string_view key, std::string const& owner) {
    if (!tbl.contains(key)) {
        throw ConfigurationError("Missing `" + std::string(key) + "` in " + owner);
    }
    return get_or<T>(tbl, key, T{});
}

StrategyKind parseStrategyKind(std::string const& str) {
    if (auto kind = enum_utils::fromString<StrategyKind>(str)) {
        return *kind;
    }
    throw ConfigurationError("Unknown strategy `" + str + "`. Expected one of " +
                             enum_utils::joinedNames<StrategyKind>());
}

int parseBatchKey(std::string_view key, std::string const& owner) {
    std::string str(key);
    std::size_t pos = 0;
    int batch_no = 0;
    try {
        batch_no = std::stoi(str, &pos);
    } catch (std::exception const&) {
        pos = 0;
    }
    if (pos != str.size() || batch_no < 1) {
        throw ConfigurationError("Invalid batch number `" + str + "` in " + owner);
    }
    return batch_no;
}

void loadOverrides(OptimizerConfig& opt, toml::table const& tbl, std::string const& owner) {
    if (auto ignore = tbl["ignore_stop"].as_array()) {
        for (auto const& entry : *ignore) {
            auto batch_no = entry.value<int>();
            if (!batch_no || *batch_no < 1) {
                throw ConfigurationError("ignore_stop in " + owner + " must hold batch numbers");
            }
            opt.ignore_stop.push_back(*batch_no);
        }
    }

    if (auto values = tbl["next_values"].as_table()) {
        for (auto const& [key, node] : *values) {
            auto value = node.value<double>();
            if (!value) {
                throw ConfigurationError("next_values in " + owner + " must map batch numbers to numbers");
            }
            opt.next_values[parseBatchKey(key.str(), owner)] = *value;
        }
    }

    if (auto strategies = tbl["strategy"].as_array()) {
        for (auto const& entry : *strategies) {
            auto entry_tbl = entry.as_table();
            if (!entry_tbl) {
                throw ConfigurationError("Strategy overrides in " + owner + " must be tables");
            }
            StrategyOverrideConfig so;
            so.batch = require<int>(*entry_tbl, "batch", owner + " strategy override");
            so.strategy = parseStrategyKind(require<std::string>(*entry_tbl, "strategy", owner + " strategy override"));
            so.degree = get_or(*entry_tbl, "degree", so.degree);
            if (so.batch < 1) {
                throw ConfigurationError("Invalid batch number in " + owner + " strategy override");
            }
            opt.strategy_overrides.push_back(so);
        }
    }
}

OptimizerConfig loadOptimizer(toml::table const& tbl, std::size_t index) {
    OptimizerConfig opt;
    std::string owner = "[[optimizer]] #" + std::to_string(index + 1);

    opt.name = require<std::string>(tbl, "name", owner);
    owner = "optimizer `" + opt.name + "`";

    opt.type = get_or<std::string>(tbl, "type", opt.type);
    opt.batch_1_name = require<std::string>(tbl, "batch_1_name", owner);
    opt.batch_1_path = get_or<std::string>(tbl, "batch_1_path", opt.batch_1_path);
    opt.batch_1_output_path = get_or<std::string>(tbl, "batch_1_output_path", opt.batch_1_output_path);
    opt.initial_value = require<double>(tbl, "initial_value", owner);

    opt.variable = require<std::string>(tbl, "variable", owner);
    opt.quantity = require<std::string>(tbl, "quantity", owner);
    opt.target = require<double>(tbl, "target", owner);
    opt.tolerance = get_or(tbl, "tolerance", opt.tolerance);
    opt.correlation = parseCorrelation(get_or<std::string>(tbl, "correlation", "+"));
    opt.mesh_size = get_or(tbl, "mesh_size", opt.mesh_size);
    opt.min_value = get_optional<double>(tbl, "min_value");
    opt.max_value = get_optional<double>(tbl, "max_value");
    opt.strategy = parseStrategyKind(get_or<std::string>(tbl, "strategy", "percent_scale"));
    opt.degree = get_or(tbl, "degree", opt.degree);

    if (auto overrides = tbl["overrides"].as_table()) {
        loadOverrides(opt, *overrides, owner);
    }
    return opt;
}

RunConfig loadFromTable(toml::table const& tbl) {
    RunConfig config;

    if (auto run = tbl["run"].as_table()) {
        config.run.cache_directory = get_or<std::string>(*run, "cache_directory", config.run.cache_directory);
        config.run.work_directory = get_or<std::string>(*run, "work_directory", config.run.work_directory);
        config.run.ignore_cache = get_or(*run, "ignore_cache", config.run.ignore_cache);
        config.run.max_rounds = get_or(*run, "max_rounds", config.run.max_rounds);
        config.run.trace_file = get_or<std::string>(*run, "trace_file", config.run.trace_file);
    }
    if (config.run.max_rounds < 0) {
        throw ConfigurationError("max_rounds must not be negative");
    }

    auto optimizers = tbl["optimizer"].as_array();
    if (!optimizers || optimizers->empty()) {
        throw ConfigurationError("Config defines no [[optimizer]]");
    }

    std::set<std::string> names;
    for (std::size_t i = 0; i < optimizers->size(); ++i) {
        auto opt_tbl = optimizers->get(i)->as_table();
        if (!opt_tbl) {
            throw ConfigurationError("[[optimizer]] entries must be tables");
        }
        OptimizerConfig opt = loadOptimizer(*opt_tbl, i);
        if (!names.insert(opt.name).second) {
            throw ConfigurationError("Optimizer name `" + opt.name + "` is defined twice");
        }
        config.optimizers.push_back(std::move(opt));
    }
    return config;
}

} // namespace

// ============================================================================
// OptimizerConfig
// ============================================================================

Batch OptimizerConfig::batch1(std::string const& work_directory) const {
    Batch batch;
    batch.batch_no = 1;
    batch.artifact_name = batch_1_name;
    batch.artifact_path =
        batch_1_path.empty() ? BatchLedger::artifactFolder(1, work_directory) : batch_1_path;
    batch.output_path = batch_1_output_path.empty() ? BatchLedger::outputFolder(1, work_directory)
                                                    : batch_1_output_path;
    batch.variable_value = initial_value;
    return batch;
}

OptimizerSettings OptimizerConfig::settings(std::string const& work_directory) const {
    OptimizerSettings s;
    s.variable_name = variable;
    s.target_quantity = quantity;
    s.target_value = target;
    s.tolerance = tolerance;
    s.correlation = correlation;
    s.mesh_size = mesh_size;
    s.min_value = min_value;
    s.max_value = max_value;
    s.strategy = makeStrategy(strategy, degree);
    s.work_directory = work_directory;
    return s;
}

BatchOverrides OptimizerConfig::overrides() const {
    BatchOverrides o;
    o.next_values = next_values;
    o.ignore_stop.insert(ignore_stop.begin(), ignore_stop.end());
    for (auto const& so : strategy_overrides) {
        o.strategies[so.batch] = makeStrategy(so.strategy, so.degree);
    }
    return o;
}

// ============================================================================
// RunConfig
// ============================================================================

RunConfig RunConfig::load(std::string const& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigurationError("Config file not found: " + path);
    }
    try {
        return loadFromTable(toml::parse_file(path));
    } catch (toml::parse_error const& err) {
        throw ConfigurationError("Error parsing config " + path + ": " + std::string(err.description()));
    }
}

RunConfig RunConfig::parse(std::string_view toml_text, std::string const& source) {
    try {
        return loadFromTable(toml::parse(toml_text, source));
    } catch (toml::parse_error const& err) {
        throw ConfigurationError("Error parsing config " + source + ": " + std::string(err.description()));
    }
}

SetOverrides RunConfig::overrides() const {
    SetOverrides result;
    for (auto const& opt : optimizers) {
        BatchOverrides o = opt.overrides();
        if (!o.empty()) {
            result[opt.name] = std::move(o);
        }
    }
    return result;
}

std::unique_ptr<SingleParamOptimizer> buildOptimizer(OptimizerConfig const& config,
                                                     RunParams const& run,
                                                     Collaborators const& collaborators,
                                                     BatchOverrides const& overrides) {
    CacheMode mode = run.ignore_cache ? CacheMode::Ignore : CacheMode::Load;
    if (config.type == "resonator") {
        return std::make_unique<ResonatorOptimizer>(config.name, config.batch1(run.work_directory),
                                                    config.settings(run.work_directory),
                                                    collaborators, mode, overrides);
    }
    throw ConfigurationError("Unknown optimizer type `" + config.type + "` for `" + config.name +
                             "`. Can only use resonator");
}

} // namespace tuning

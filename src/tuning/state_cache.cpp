#include "tuning/state_cache.h"

#include "tuning/errors.h"

#include <fstream>
#include <system_error>
#include <utility>

using json = nlohmann::json;

namespace tuning {

json OptimizerState::toJSON() const {
    json j;
    j["name"] = name;
    j["variable_values"] = variable_values;
    j["output_values"] = output_values;

    json batches = json::array();
    for (auto const& [batch_no, batch] : ledger.batches()) {
        batches.push_back({{"batch_no", batch_no},
                           {"artifact_name", batch.artifact_name},
                           {"artifact_path", batch.artifact_path},
                           {"output_path", batch.output_path},
                           {"variable_value", batch.variable_value}});
    }
    j["ledger"] = batches;
    return j;
}

OptimizerState OptimizerState::fromJSON(json const& j) {
    OptimizerState state;
    try {
        state.name = j.at("name").get<std::string>();
        state.variable_values = j.at("variable_values").get<std::vector<double>>();
        state.output_values = j.at("output_values").get<std::vector<double>>();

        for (auto const& entry : j.at("ledger")) {
            Batch batch;
            batch.batch_no = entry.at("batch_no").get<int>();
            batch.artifact_name = entry.at("artifact_name").get<std::string>();
            batch.artifact_path = entry.at("artifact_path").get<std::string>();
            batch.output_path = entry.at("output_path").get<std::string>();
            batch.variable_value = entry.at("variable_value").get<double>();
            state.ledger.add(std::move(batch));
        }
    } catch (json::exception const& e) {
        throw CacheError("Malformed optimizer state: " + std::string(e.what()));
    } catch (LedgerError const& e) {
        throw CacheError("Malformed optimizer state ledger: " + std::string(e.what()));
    }

    if (state.variable_values.size() != state.output_values.size()) {
        throw CacheError("Optimizer state for `" + state.name +
                         "` has misaligned variable and output histories");
    }
    return state;
}

JsonStateStore::JsonStateStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path JsonStateStore::recordPath(std::string const& name) const {
    return directory_ / ("OPT_" + name + ".json");
}

bool JsonStateStore::contains(std::string const& name) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(recordPath(name), ec);
}

void JsonStateStore::save(OptimizerState const& state) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw CacheError("Could not create cache directory " + directory_.string() + ": " +
                         ec.message());
    }

    auto path = recordPath(state.name);
    std::ofstream out(path);
    if (!out) {
        throw CacheError("Could not open cache file for writing: " + path.string());
    }
    out << state.toJSON().dump(2) << "\n";
    if (!out) {
        throw CacheError("Failed writing cache file: " + path.string());
    }
}

OptimizerState JsonStateStore::load(std::string const& name) const {
    auto path = recordPath(name);
    std::ifstream in(path);
    if (!in) {
        throw CacheNotFound("Unable to find cache file: " + path.string());
    }

    json j;
    try {
        j = json::parse(in);
    } catch (json::exception const& e) {
        throw CacheError("Error parsing cache file " + path.string() + ": " + e.what());
    }
    return OptimizerState::fromJSON(j);
}

} // namespace tuning

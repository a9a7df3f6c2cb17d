#pragma once

#include "tuning/batch_ledger.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace tuning {

// Snapshot of everything needed to resume a search
struct OptimizerState {
    std::string name;
    std::vector<double> variable_values;
    std::vector<double> output_values;
    BatchLedger ledger;

    nlohmann::json toJSON() const;

    // Throws CacheError if the document does not describe a valid state
    static OptimizerState fromJSON(nlohmann::json const& j);
};

// Durable keyed store, one record per optimizer name
class StateStore {
public:
    virtual ~StateStore() = default;

    // Throws CacheError on write failure
    virtual void save(OptimizerState const& state) = 0;

    // Throws CacheNotFound if no record exists, CacheError if it is unreadable
    virtual OptimizerState load(std::string const& name) const = 0;

    virtual bool contains(std::string const& name) const = 0;
};

// Stores each optimizer as <directory>/OPT_<name>.json
class JsonStateStore : public StateStore {
public:
    explicit JsonStateStore(std::filesystem::path directory = "OptCache");

    void save(OptimizerState const& state) override;
    OptimizerState load(std::string const& name) const override;
    bool contains(std::string const& name) const override;

    std::filesystem::path recordPath(std::string const& name) const;
    std::filesystem::path const& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

} // namespace tuning

#include "tuning/quantity_analyzer.h"

#include "tuning/errors.h"

#include <nlohmann/json.hpp>

#include <fstream>

using json = nlohmann::json;

namespace tuning {

std::filesystem::path QuantityFileAnalyzer::quantityFile(std::string const& artifact_name,
                                                         std::string const& output_path) {
    return std::filesystem::path(output_path) / (artifact_name + ".json");
}

double QuantityFileAnalyzer::analyze(std::string const& artifact_name,
                                     std::string const& output_path, std::string const& quantity) {
    auto path = quantityFile(artifact_name, output_path);
    std::ifstream in(path);
    if (!in) {
        throw OutputNotReady("No output file for " + artifact_name + " at " + path.string());
    }

    json j;
    try {
        j = json::parse(in);
    } catch (json::exception const& e) {
        throw ConfigurationError("Error parsing output file " + path.string() + ": " + e.what());
    }

    if (!j.is_object() || !j.contains(quantity)) {
        throw ConfigurationError("Output file " + path.string() + " has no `" + quantity + "`");
    }
    auto const& value = j.at(quantity);
    if (!value.is_number()) {
        throw ConfigurationError("`" + quantity + "` in " + path.string() + " is not a number");
    }
    return value.get<double>();
}

} // namespace tuning

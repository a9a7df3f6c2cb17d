#pragma once

#include "tuning/collaborators.h"

#include <filesystem>

namespace tuning {

// Reads quantities already extracted from the solver output:
// <output_path>/<artifact_name>.json holding e.g. {"f0": 2.01e9, "QR": 1.2e4}
class QuantityFileAnalyzer : public BatchAnalyzer {
public:
    double analyze(std::string const& artifact_name, std::string const& output_path,
                   std::string const& quantity) override;

    static std::filesystem::path quantityFile(std::string const& artifact_name,
                                              std::string const& output_path);
};

} // namespace tuning

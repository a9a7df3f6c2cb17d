#pragma once

#include <map>
#include <string>

namespace tuning {

// Reference to a simulation-input artifact: a name without extension in a folder
struct ArtifactRef {
    std::string name;
    std::string path;
};

using ParamSubstitutions = std::map<std::string, double>;

// Creates a new simulation input from a base one with some parameters changed.
// Overwriting an existing output artifact is allowed.
class ArtifactGenerator {
public:
    virtual ~ArtifactGenerator() = default;

    // Throws ArtifactNotFound if the base is missing,
    // ParamNotFound if the base does not declare a substituted parameter
    virtual void generate(ArtifactRef const& base, ArtifactRef const& output,
                          ParamSubstitutions const& substitutions) = 0;
};

// Turns the solver output of a batch into the measured quantity
class BatchAnalyzer {
public:
    virtual ~BatchAnalyzer() = default;

    // Throws OutputNotReady if the solver has not written the output yet
    virtual double analyze(std::string const& artifact_name, std::string const& output_path,
                           std::string const& quantity) = 0;
};

} // namespace tuning

#include "tuning/manifest_generator.h"

#include "tuning/errors.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <system_error>

using json = nlohmann::json;

namespace tuning {

std::filesystem::path ManifestArtifactGenerator::artifactFile(ArtifactRef const& ref) {
    return std::filesystem::path(ref.path) / (ref.name + ARTIFACT_EXTENSION);
}

std::filesystem::path ManifestArtifactGenerator::manifestFile(ArtifactRef const& ref) {
    return std::filesystem::path(ref.path) / (ref.name + MANIFEST_EXTENSION);
}

void ManifestArtifactGenerator::generate(ArtifactRef const& base, ArtifactRef const& output,
                                         ParamSubstitutions const& substitutions) {
    auto base_file = artifactFile(base);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(base_file, ec)) {
        throw ArtifactNotFound("Unable to find base artifact: " + base_file.string());
    }

    json manifest = json::object();
    auto base_manifest = manifestFile(base);
    if (std::filesystem::is_regular_file(base_manifest, ec)) {
        std::ifstream in(base_manifest);
        try {
            manifest = json::parse(in);
        } catch (json::exception const& e) {
            throw ConfigurationError("Error parsing parameter manifest " + base_manifest.string() +
                                     ": " + e.what());
        }

        for (auto const& [param, value] : substitutions) {
            if (!manifest.contains(param)) {
                throw ParamNotFound(param, base_file.string());
            }
        }
    }

    for (auto const& [param, value] : substitutions) {
        manifest[param] = value;
    }

    std::filesystem::create_directories(output.path.empty() ? "." : output.path, ec);
    if (ec) {
        throw TuningError("Could not create artifact folder " + output.path + ": " + ec.message());
    }

    auto out_file = artifactFile(output);
    std::filesystem::copy_file(base_file, out_file,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw TuningError("Could not copy " + base_file.string() + " to " + out_file.string() +
                          ": " + ec.message());
    }

    auto out_manifest = manifestFile(output);
    std::ofstream out(out_manifest);
    if (!out) {
        throw TuningError("Could not open manifest for writing: " + out_manifest.string());
    }
    out << manifest.dump(2) << "\n";
}

} // namespace tuning

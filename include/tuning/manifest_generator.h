#pragma once

#include "tuning/collaborators.h"

#include <filesystem>

namespace tuning {

// Materializes a batch by copying the base simulation file and writing the
// parameter values next to it:
//
//   <base.path>/<base.name>.son          -> <output.path>/<output.name>.son
//   <base.path>/<base.name>.params.json  -> <output.path>/<output.name>.params.json
//
// The solver wrapper applies the manifest to the copied project. Without a
// base manifest every substituted parameter is accepted.
class ManifestArtifactGenerator : public ArtifactGenerator {
public:
    static constexpr char const* ARTIFACT_EXTENSION = ".son";
    static constexpr char const* MANIFEST_EXTENSION = ".params.json";

    void generate(ArtifactRef const& base, ArtifactRef const& output,
                  ParamSubstitutions const& substitutions) override;

    static std::filesystem::path artifactFile(ArtifactRef const& ref);
    static std::filesystem::path manifestFile(ArtifactRef const& ref);
};

} // namespace tuning

#pragma once

#include "tuning/optimizer.h"

#include <string>
#include <utility>
#include <vector>

namespace tuning {

// Tunes a resonator geometry parameter against one of its fitted quantities
class ResonatorOptimizer final : public SingleParamOptimizer {
public:
    ResonatorOptimizer(std::string name, Batch batch_1, OptimizerSettings settings,
                       Collaborators collaborators, CacheMode mode = CacheMode::Load,
                       BatchOverrides const& overrides = {})
        : SingleParamOptimizer(std::move(name), std::move(batch_1), std::move(settings),
                               std::move(collaborators)) {
        start(mode, overrides);
    }

    static std::vector<std::string> quantities() {
        return {"QR", "QC", "QI", "f0", "three_dB_BW"};
    }

protected:
    std::vector<std::string> acceptedQuantities() const override { return quantities(); }
};

} // namespace tuning

#pragma once

#include <algorithm>
#include <cmath>
#include <span>

namespace tuning {

// Snap a value to the nearest multiple of the simulation mesh size.
// Half-way cases round away from zero.
inline double roundToMesh(double value, double mesh_size) {
    return std::round(value / mesh_size) * mesh_size;
}

// Two mesh-snapped values are the same grid point if they differ by less
// than a tiny fraction of the mesh
inline bool sameMeshPoint(double a, double b, double mesh_size) {
    return std::abs(a - b) <= 1e-9 * std::abs(mesh_size);
}

// Whether a candidate value has already been simulated
inline bool alreadyTried(double candidate, std::span<double const> tried, double mesh_size) {
    return std::any_of(tried.begin(), tried.end(),
                       [&](double v) { return sameMeshPoint(candidate, v, mesh_size); });
}

} // namespace tuning

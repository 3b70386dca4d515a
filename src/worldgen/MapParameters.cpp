// src/worldgen/MapParameters.cpp
#include "worldgen/MapParameters.hpp"

#include <algorithm>
#include <limits>

namespace planetmap::worldgen {
namespace {

bool anyContains(const std::vector<ValueRange>& ranges, float v) noexcept {
    return std::any_of(ranges.begin(), ranges.end(),
                       [v](const ValueRange& r) { return r.contains(v); });
}

} // namespace

bool TileType::matches(float elevationM, float temperatureC, float precipitationMm) const noexcept {
    return anyContains(elevation, elevationM)
        && anyContains(temperature, temperatureC)
        && anyContains(precipitation, precipitationMm);
}

float TileType::highestElevation() const noexcept {
    float best = -std::numeric_limits<float>::infinity();
    for (const auto& r : elevation)
        best = std::max(best, r.max);
    return best;
}

float MapParameters::maxTileTypeElevation() const noexcept {
    float best = -std::numeric_limits<float>::infinity();
    for (const auto& t : tileTypes)
        best = std::max(best, t.highestElevation());
    return best;
}

} // namespace planetmap::worldgen

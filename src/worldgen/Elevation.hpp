// src/worldgen/Elevation.hpp
#pragma once

// Elevation synthesis: seamless simplex noise calibrated so that a configured
// fraction of the tiles lies at or below sea level.

#include <cstddef>
#include <vector>

#include "worldgen/MapParameters.hpp"
#include "worldgen/Noise.hpp"
#include "worldgen/Random.hpp"
#include "worldgen/Tile.hpp"

namespace planetmap::worldgen {

struct ElevationCalibration {
    std::size_t oceanRank   = 0;     // floor(N * oceanFraction): tiles at or below sea level
    float       seaLevelRaw = 0.0f;  // raw noise value mapped to elevation 0
    float       scale       = 1.0f;  // metres per raw noise unit
};

// Sampler for the map's wrap configuration, translated by offsets drawn from rng
// (one per noise dimension, in order).
[[nodiscard]] noise::SeamlessSampler makeElevationSampler(const MapParameters& p, Pcg32& rng);

// Raw noise per tile, row-major.
[[nodiscard]] std::vector<float> sampleRawElevation(const MapParameters& p,
                                                    const noise::SeamlessSampler& sampler);

// Finds the sea-level threshold by a full sort of the raw values.
// Every raw value <= seaLevelRaw becomes ocean; with distinct samples that is
// exactly oceanRank tiles. Scale maps raw 1.0 to the highest tile-type elevation.
[[nodiscard]] ElevationCalibration calibrateElevation(const std::vector<float>& raw,
                                                      float oceanFraction,
                                                      float maxElevation);

[[nodiscard]] inline float calibratedElevation(float raw, const ElevationCalibration& c) noexcept {
    return (raw - c.seaLevelRaw) * c.scale;
}

// Samples, calibrates and writes Tile::elevation for every tile.
ElevationCalibration generateElevation(TileGrid& tiles, const MapParameters& p, Pcg32& rng);

} // namespace planetmap::worldgen

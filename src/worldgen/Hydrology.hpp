// src/worldgen/Hydrology.hpp
#pragma once

// Rainfall shaping that depends on terrain: distance from the ocean and
// orographic lift along the prevailing wind.

#include <cstddef>

#include "worldgen/MapParameters.hpp"
#include "worldgen/Tile.hpp"

namespace planetmap::worldgen {

struct OceanDistanceStats {
    std::size_t oceanTiles  = 0;
    std::size_t updates     = 0;   // nearest-ocean assignments, including re-labels
    std::size_t unreachable = 0;   // tiles left without a nearest ocean
};

// Multi-source label-correcting relaxation: every ocean tile is its own nearest
// ocean; a tile adopts a neighbour's nearest ocean when it has none or when the
// neighbour's is strictly closer (squared km, wrap-aware), and is then revisited.
OceanDistanceStats computeNearestOcean(TileGrid& tiles, const MapParameters& p);

// Divides each land tile's precipitation by exp(sqrt(d) / eFoldingDistance),
// d being the squared km distance to its nearest ocean. Tiles without a known
// nearest ocean are left unchanged.
void attenuateRainfallByOceanDistance(TileGrid& tiles, const MapParameters& p);

// True if wind in the row at `latitude` (radians) blows toward +x.
// Westerlies between the high- and low-pressure latitudes, easterlies elsewhere;
// rotateWest mirrors both.
[[nodiscard]] bool windBlowsEast(float latitude, const MapParameters& p) noexcept;

// Orographic precipitation for one land tile rising from prevElevation.
[[nodiscard]] float orographicRainfall(float elevation, float prevElevation,
                                       float seaLevelTempC, float tempC,
                                       const MapParameters& p) noexcept;

// Sweeps every row in its wind direction adding orographic precipitation.
void applyOrographicRainfall(TileGrid& tiles, const MapParameters& p);

} // namespace planetmap::worldgen

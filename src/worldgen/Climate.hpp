// src/worldgen/Climate.hpp
#pragma once

// Latitude-driven climate: sea-level temperature, elevation lapse and the
// baseline (latitude-only) rainfall profile.

#include "worldgen/MapParameters.hpp"
#include "worldgen/Tile.hpp"

namespace planetmap::worldgen {

// Latitude in radians of tile row y: -π/2 at row 0, approaching +π/2 at the last row.
[[nodiscard]] float latitudeOf(int y, int height) noexcept;

// Sea-level temperature (°C) at a latitude (radians).
[[nodiscard]] float seaLevelTemperature(float latitude, const MapParameters& p) noexcept;

// Annual rainfall (mm) from latitude alone: one peak at the equator and two at
// ±lowPressureLatitude.
[[nodiscard]] float baselineRainfall(float latitude, const MapParameters& p) noexcept;

// Sets Tile::temperature. Land tiles lose elevation * lapseRate; ocean tiles
// keep the sea-level value.
void applyTemperature(TileGrid& tiles, const MapParameters& p);

// Sets Tile::precipitation to the baseline rainfall of the tile's row.
void applyLatitudeRainfall(TileGrid& tiles, const MapParameters& p);

} // namespace planetmap::worldgen

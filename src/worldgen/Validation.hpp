// src/worldgen/Validation.hpp
#pragma once

// Parameter hygiene before a run: a clamping pass that makes every value
// usable, advisory warnings for values that are legal but odd, and the hard
// preconditions generation cannot proceed without.

#include <limits>
#include <string>
#include <vector>

#include "worldgen/MapParameters.hpp"

namespace planetmap::worldgen {

struct ParamWarning {
    std::string field;     // e.g. "poleTemperature", "tileTypes[2].elevation"
    std::string message;
};

// Clamps min into [lo, hi], then max into [min, hi].
void validateRange(ValueRange& r,
                   float lo = -std::numeric_limits<float>::infinity(),
                   float hi =  std::numeric_limits<float>::infinity()) noexcept;

// Elevation ranges are capped at FLT_MAX (the highest bound sets the terrain
// scale); temperature and precipitation ranges are only ordered.
void validateTileType(TileType& t) noexcept;

// Clamps every field of p into its usable domain. Idempotent.
void validateParameters(MapParameters& p) noexcept;

// Legal-but-suspicious settings. Does not modify p.
[[nodiscard]] std::vector<ParamWarning> collectWarnings(const MapParameters& p);

// Throws std::invalid_argument if generation cannot run: empty grid, no tile
// types, or no tile type reaching above sea level.
void checkPreconditions(const MapParameters& p);

} // namespace planetmap::worldgen

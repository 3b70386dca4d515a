#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "u16_raster.hpp"
#include "worldgen/GeneratedMap.hpp"

namespace planetmap::tools {

struct ElevationRange {
    float min = 0.0f;
    float max = 0.0f;
};

ElevationRange elevation_range(const worldgen::GeneratedMap& m);

// Elevation normalised over `range`, row-major.
U16Raster elevation_raster(const worldgen::GeneratedMap& m, const ElevationRange& range);

// world.meta.json: seed, size, validated parameters and run statistics.
nlohmann::json meta_json(const worldgen::GeneratedMap& m, const ElevationRange& range);

// tiles.json: per-tile values, nearest ocean and tile-type name.
nlohmann::json tiles_json(const worldgen::GeneratedMap& m);

// rivers.json: corner grid size and every river corner with its mask and
// mirrored drawing positions.
nlohmann::json rivers_json(const worldgen::GeneratedMap& m);

bool write_json(const std::string& path, const nlohmann::json& j);

} // namespace planetmap::tools

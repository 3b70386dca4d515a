// src/worldgen/StageContext.hpp
#pragma once
#include "worldgen/WorldGenFwd.hpp"
#include "worldgen/Random.hpp"
#include "worldgen/Tile.hpp"

namespace spdlog { class logger; }

namespace planetmap::worldgen {

struct GenerationReport;

// Everything a stage may touch during one run. The RNG is shared by all
// stages, so the order stages draw from it is part of the output.
struct StageContext {
  // Read-only parameters for this run (validated).
  const MapParameters& params;

  // The run's only random source.
  Pcg32& rng;

  // Writable outputs.
  TileGrid&         tiles;
  RiverNetwork&     rivers;
  GenerationReport& report;

  spdlog::logger& log;

  // Convenience: grid dimensions in tiles.
  int width  = 0;
  int height = 0;

  // Definition lives in StageContext.cpp where GeneratedMap is complete.
  StageContext(GeneratedMap& map, Pcg32& r, spdlog::logger& logger) noexcept;
};

} // namespace planetmap::worldgen

#pragma once
#include <cstdint>
#include <utility>

#include "worldgen/Biomes.hpp"
#include "worldgen/Elevation.hpp"
#include "worldgen/Hydrology.hpp"
#include "worldgen/MapParameters.hpp"
#include "worldgen/Rivers.hpp"
#include "worldgen/Tile.hpp"

namespace planetmap::worldgen {

// What the stages measured along the way. Filled by the default stages;
// left zeroed by stages that do not report.
struct GenerationReport {
    ElevationCalibration calibration{};
    OceanDistanceStats   oceanDistance{};
    RiverStats           rivers{};
    BiomeStats           biomes{};
};

// The output of one run. Stages read/write these fields directly.
struct GeneratedMap {
    MapParameters    params;        // after validation
    TileGrid         tiles;
    RiverNetwork     rivers;
    std::uint64_t    seed = 0;      // the seed actually used
    GenerationReport report{};

    GeneratedMap() = default;

    explicit GeneratedMap(MapParameters p, std::uint64_t s)
        : params(std::move(p))
        , tiles(params.width, params.height)
        , rivers(params.width, params.height, params.wrapX, params.wrapY)
        , seed(s) {}

    [[nodiscard]] int width()  const noexcept { return tiles.width(); }
    [[nodiscard]] int height() const noexcept { return tiles.height(); }
};

} // namespace planetmap::worldgen

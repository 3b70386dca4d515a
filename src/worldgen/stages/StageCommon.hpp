#pragma once
#include "worldgen/WorldGen.hpp"      // StageId + IWorldGenStage + stage classes
#include "worldgen/StageContext.hpp"  // StageContext
#include "worldgen/GeneratedMap.hpp"  // GenerationReport, complete for ctx.report.*
#include <spdlog/spdlog.h>            // complete spdlog::logger for ctx.log
#include <cstddef>

namespace planetmap::worldgen::stage_detail {

inline std::size_t countLand(const TileGrid& tiles) noexcept {
    std::size_t n = 0;
    for (const Tile& t : tiles)
        if (t.isLand()) ++n;
    return n;
}

} // namespace planetmap::worldgen::stage_detail

// src/worldgen/stages/Elevation.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Elevation.hpp"

namespace planetmap::worldgen {

void ElevationStage::generate(StageContext& ctx)
{
    const ElevationCalibration c = generateElevation(ctx.tiles, ctx.params, ctx.rng);
    ctx.report.calibration = c;

    const std::size_t land = stage_detail::countLand(ctx.tiles);
    ctx.log.info("Elevation: sea level at raw {:.4f} (rank {}), {} m per unit, {} land / {} ocean tiles",
                 c.seaLevelRaw, c.oceanRank, c.scale, land, ctx.tiles.size() - land);
    if (land == 0)
        ctx.log.warn("Elevation: the map has no land");
}

} // namespace planetmap::worldgen

// src/worldgen/stages/Precipitation.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Climate.hpp"
#include "worldgen/Hydrology.hpp"

namespace planetmap::worldgen {

void PrecipitationStage::generate(StageContext& ctx)
{
    applyLatitudeRainfall(ctx.tiles, ctx.params);

    const OceanDistanceStats s = computeNearestOcean(ctx.tiles, ctx.params);
    ctx.report.oceanDistance = s;
    ctx.log.debug("Precipitation: nearest ocean settled after {} updates from {} ocean tiles",
                  s.updates, s.oceanTiles);
    if (s.oceanTiles == 0)
        ctx.log.warn("Precipitation: no ocean tiles; rainfall is not attenuated by distance");
    else if (s.unreachable > 0)
        ctx.log.warn("Precipitation: {} tiles cannot reach an ocean; left unattenuated", s.unreachable);

    attenuateRainfallByOceanDistance(ctx.tiles, ctx.params);
    applyOrographicRainfall(ctx.tiles, ctx.params);
}

} // namespace planetmap::worldgen

// src/worldgen/stages/Temperature.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Climate.hpp"

namespace planetmap::worldgen {

void TemperatureStage::generate(StageContext& ctx)
{
    applyTemperature(ctx.tiles, ctx.params);
    ctx.log.debug("Temperature: equator {} C, pole {} C, lapse {} K/m",
                  ctx.params.equatorTemperature, ctx.params.poleTemperature,
                  ctx.params.temperatureLapseRate);
}

} // namespace planetmap::worldgen

// src/worldgen/stages/Rivers.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Rivers.hpp"

namespace planetmap::worldgen {

void RiverStage::generate(StageContext& ctx)
{
    RiverStats s{};
    ctx.rivers = buildRiverNetwork(ctx.tiles, ctx.params, ctx.rng, &s);
    ctx.report.rivers = s;

    ctx.log.info("Rivers: {} sources from {} eligible corners, {} links, {} mouths, {} merges",
                 s.sources, s.eligible, s.links, s.mouths, s.merges);
    if (s.sources == 0)
        ctx.log.warn("Rivers: no river sources were drawn");
}

} // namespace planetmap::worldgen

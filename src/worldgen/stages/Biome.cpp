// src/worldgen/stages/Biome.cpp
#include "worldgen/stages/StageCommon.hpp"
#include "worldgen/Biomes.hpp"

namespace planetmap::worldgen {

void BiomeStage::generate(StageContext& ctx)
{
    const BiomeStats s = classifyBiomes(ctx.tiles, ctx.params.tileTypes, ctx.rng);
    ctx.report.biomes = s;

    ctx.log.info("Biome: {} tiles classified ({} ties broken), {} unmatched",
                 s.classified, s.ambiguous, s.unmatched);
    if (s.unmatched > 0)
        ctx.log.warn("Biome: {} tiles match no tile type", s.unmatched);
}

} // namespace planetmap::worldgen

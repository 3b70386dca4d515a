#include "worldgen/StageContext.hpp"
#include "worldgen/GeneratedMap.hpp"

namespace planetmap::worldgen {

StageContext::StageContext(GeneratedMap& map, Pcg32& r, spdlog::logger& logger) noexcept
    : params(map.params), rng(r), tiles(map.tiles), rivers(map.rivers), report(map.report), log(logger)
{
    width  = tiles.width();
    height = tiles.height();
}

} // namespace planetmap::worldgen

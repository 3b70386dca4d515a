// src/worldgen/Biomes.cpp
#include "worldgen/Biomes.hpp"

namespace planetmap::worldgen {

void matchingTileTypes(const Tile& t, const std::vector<TileType>& types,
                       std::vector<std::int32_t>& out) {
    out.clear();
    for (std::size_t i = 0; i < types.size(); ++i)
        if (types[i].matches(t.elevation, t.temperature, t.precipitation))
            out.push_back(static_cast<std::int32_t>(i));
}

BiomeStats classifyBiomes(TileGrid& tiles, const std::vector<TileType>& types, Pcg32& rng) {
    BiomeStats stats{};
    std::vector<std::int32_t> candidates;
    candidates.reserve(types.size());

    for (Tile& t : tiles) {
        matchingTileTypes(t, types, candidates);
        if (candidates.empty()) {
            t.type = Tile::kNoType;
            ++stats.unmatched;
            continue;
        }
        if (candidates.size() == 1) {
            t.type = candidates.front();
        } else {
            t.type = candidates[rng.next_bounded(static_cast<std::uint32_t>(candidates.size()))];
            ++stats.ambiguous;
        }
        ++stats.classified;
    }
    return stats;
}

const char* tileTypeName(const Tile& t, const std::vector<TileType>& types) noexcept {
    if (!t.hasType() || static_cast<std::size_t>(t.type) >= types.size())
        return "unmatched";
    return types[static_cast<std::size_t>(t.type)].name.c_str();
}

} // namespace planetmap::worldgen

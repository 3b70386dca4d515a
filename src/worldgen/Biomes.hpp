#pragma once
// -----------------------------------------------------------------------------
// src/worldgen/Biomes.hpp
// Tile-type classification. Each tile gets one of the configured TileTypes whose
// elevation, temperature and precipitation ranges all contain the tile's values.
// Ties are broken uniformly with the run's RNG; tiles nothing matches stay
// Tile::kNoType.
// -----------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <vector>

#include "worldgen/MapParameters.hpp"
#include "worldgen/Random.hpp"
#include "worldgen/Tile.hpp"

namespace planetmap::worldgen {

struct BiomeStats {
    std::size_t classified = 0;
    std::size_t ambiguous  = 0;   // more than one candidate; consumed an RNG draw
    std::size_t unmatched  = 0;
};

// Indices into types of every TileType matching the tile, in declaration order.
void matchingTileTypes(const Tile& t, const std::vector<TileType>& types,
                       std::vector<std::int32_t>& out);

// Sets Tile::type for every tile, visiting tiles in row-major order.
BiomeStats classifyBiomes(TileGrid& tiles, const std::vector<TileType>& types, Pcg32& rng);

// Debug: name of a tile's type, or "unmatched".
[[nodiscard]] const char* tileTypeName(const Tile& t, const std::vector<TileType>& types) noexcept;

} // namespace planetmap::worldgen

// src/worldgen/Rivers.hpp
#pragma once

// River network on the corner (dual) grid. A corner sits where up to four tiles
// meet; corner (cx, cy) touches tiles (cx-1, cy-1), (cx, cy-1), (cx-1, cy), (cx, cy).
// Rivers run along tile edges from corner to corner.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "worldgen/MapParameters.hpp"
#include "worldgen/Random.hpp"
#include "worldgen/Tile.hpp"
#include "worldgen/Wrap.hpp"

namespace planetmap::worldgen {

// Connection bits. Up is +y.
enum class RiverDir : std::uint8_t {
    Up    = 1u << 0,
    Down  = 1u << 1,
    Left  = 1u << 2,
    Right = 1u << 3,
};

inline constexpr std::array<RiverDir, 4> kRiverDirs{
    RiverDir::Up, RiverDir::Down, RiverDir::Left, RiverDir::Right
};

[[nodiscard]] constexpr std::uint8_t bit(RiverDir d) noexcept { return static_cast<std::uint8_t>(d); }

[[nodiscard]] constexpr RiverDir opposite(RiverDir d) noexcept {
    switch (d) {
        case RiverDir::Up:    return RiverDir::Down;
        case RiverDir::Down:  return RiverDir::Up;
        case RiverDir::Left:  return RiverDir::Right;
        case RiverDir::Right: return RiverDir::Left;
    }
    return d;
}

[[nodiscard]] constexpr Int2 offset(RiverDir d) noexcept {
    switch (d) {
        case RiverDir::Up:    return Int2{ 0,  1};
        case RiverDir::Down:  return Int2{ 0, -1};
        case RiverDir::Left:  return Int2{-1,  0};
        case RiverDir::Right: return Int2{ 1,  0};
    }
    return Int2{};
}

struct RiverCorner {
    Int2         pos{};
    std::uint8_t connections = 0;   // OR of RiverDir bits

    [[nodiscard]] bool connected(RiverDir d) const noexcept { return (connections & bit(d)) != 0; }

    friend bool operator==(const RiverCorner&, const RiverCorner&) = default;
};

// Sparse set of river corners: an arena of the corners a river passes through
// plus a dense corner-grid index into it (-1 = no river).
class RiverNetwork {
public:
    RiverNetwork() = default;
    RiverNetwork(int tileWidth, int tileHeight, bool wrapX, bool wrapY);

    // Corner count per axis: tiles if the axis wraps, tiles + 1 otherwise.
    [[nodiscard]] int cornerWidth()  const noexcept { return cw_; }
    [[nodiscard]] int cornerHeight() const noexcept { return ch_; }
    [[nodiscard]] bool wrapX() const noexcept { return wrapX_; }
    [[nodiscard]] bool wrapY() const noexcept { return wrapY_; }

    [[nodiscard]] bool inBounds(Int2 c) const noexcept {
        return c.x >= 0 && c.y >= 0 && c.x < cw_ && c.y < ch_;
    }

    // Wrap-aware neighbouring corner, or nullopt past a non-wrapping edge.
    [[nodiscard]] std::optional<Int2> step(Int2 c, RiverDir d) const noexcept;

    [[nodiscard]] bool has(Int2 c) const noexcept;
    [[nodiscard]] const RiverCorner* find(Int2 c) const noexcept;
    [[nodiscard]] std::uint8_t connections(Int2 c) const noexcept;

    // Links c with its neighbour in direction d, setting the bit on both corners
    // and creating either corner if needed. Throws std::out_of_range if c is off
    // the corner grid or has no neighbour that way.
    void connect(Int2 c, RiverDir d);

    [[nodiscard]] const std::vector<RiverCorner>& corners() const noexcept { return arena_; }
    [[nodiscard]] std::size_t size() const noexcept { return arena_.size(); }
    [[nodiscard]] bool empty() const noexcept { return arena_.empty(); }

    // Positions on a (tiles + 1)-per-axis drawing lattice where corner c appears.
    // A corner on a wrapping seam shows on both sides, so up to four entries.
    [[nodiscard]] std::vector<Int2> mirroredPositions(Int2 c) const;

    friend bool operator==(const RiverNetwork&, const RiverNetwork&) = default;

private:
    RiverCorner& materialize_(Int2 c);

    int  tw_ = 0, th_ = 0;
    int  cw_ = 0, ch_ = 0;
    bool wrapX_ = false, wrapY_ = false;
    std::vector<RiverCorner>  arena_;
    std::vector<std::int32_t> index_;
};

// --- Corner-grid terrain queries -------------------------------------------

// Mean elevation / precipitation of the tiles touching corner c.
[[nodiscard]] float cornerElevation(const TileGrid& tiles, Int2 c, const MapParameters& p) noexcept;
[[nodiscard]] float cornerPrecipitation(const TileGrid& tiles, Int2 c, const MapParameters& p) noexcept;

// True if any tile touching corner c is ocean.
[[nodiscard]] bool isOceanAdjacent(const TileGrid& tiles, Int2 c, const MapParameters& p) noexcept;

struct Descent {
    Int2     next{};
    RiverDir dir   = RiverDir::Up;
    double   slope = 0.0;   // metres of drop per metre travelled
};

// Steepest strictly downhill neighbouring corner (ties keep Up, Down, Left, Right order).
[[nodiscard]] std::optional<Descent> steepestDescent(const TileGrid& tiles, const RiverNetwork& net,
                                                     Int2 c, const MapParameters& p) noexcept;

// (4/π²)·atan(rainMult·precipitation)·atan(slopeMult·slope), in [0, 1).
[[nodiscard]] double riverProbability(float precipitation, double slope, const MapParameters& p) noexcept;

struct RiverStats {
    std::size_t eligible = 0;   // corners that drew a source roll
    std::size_t sources  = 0;   // rolls that started a river
    std::size_t links    = 0;
    std::size_t merges   = 0;
    std::size_t mouths   = 0;   // rivers that reached an ocean-adjacent corner
};

// Visits corners in row-major order; each eligible corner (no river yet, not
// ocean-adjacent) draws one Bernoulli from rng and on success walks downhill.
[[nodiscard]] RiverNetwork buildRiverNetwork(const TileGrid& tiles, const MapParameters& p,
                                             Pcg32& rng, RiverStats* stats = nullptr);

} // namespace planetmap::worldgen

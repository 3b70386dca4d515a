// src/worldgen/Rivers.cpp
#include "worldgen/Rivers.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace planetmap::worldgen {
namespace {

constexpr double kPi = 3.14159265358979323846;

// Calls fn(tile) for each existing tile touching corner c.
template <class Fn>
void forEachTouchingTile(const TileGrid& tiles, Int2 c, const MapParameters& p, Fn&& fn) {
    for (int dy = -1; dy <= 0; ++dy) {
        const auto ty = wrapCoord(c.y + dy, tiles.height(), p.wrapY);
        if (!ty)
            continue;
        for (int dx = -1; dx <= 0; ++dx) {
            const auto tx = wrapCoord(c.x + dx, tiles.width(), p.wrapX);
            if (!tx)
                continue;
            fn(tiles.at(*tx, *ty));
        }
    }
}

inline double spacingMetres(RiverDir d, const MapParameters& p) noexcept {
    const bool horizontal = d == RiverDir::Left || d == RiverDir::Right;
    return static_cast<double>(horizontal ? p.tileScaleKmX : p.tileScaleKmY) * kKmToM;
}

} // namespace

// --- RiverNetwork ----------------------------------------------------------

RiverNetwork::RiverNetwork(int tileWidth, int tileHeight, bool wrapX, bool wrapY)
    : tw_(tileWidth), th_(tileHeight),
      cw_(wrapX ? tileWidth : tileWidth + 1),
      ch_(wrapY ? tileHeight : tileHeight + 1),
      wrapX_(wrapX), wrapY_(wrapY),
      index_(static_cast<std::size_t>(cw_) * static_cast<std::size_t>(ch_), -1) {}

std::optional<Int2> RiverNetwork::step(Int2 c, RiverDir d) const noexcept {
    const Int2 o = offset(d);
    return neighbor(c, o.x, o.y, cw_, ch_, wrapX_, wrapY_);
}

bool RiverNetwork::has(Int2 c) const noexcept {
    return find(c) != nullptr;
}

const RiverCorner* RiverNetwork::find(Int2 c) const noexcept {
    if (!inBounds(c))
        return nullptr;
    const std::int32_t i = index_[static_cast<std::size_t>(c.y) * cw_ + c.x];
    return i < 0 ? nullptr : &arena_[static_cast<std::size_t>(i)];
}

std::uint8_t RiverNetwork::connections(Int2 c) const noexcept {
    const RiverCorner* rc = find(c);
    return rc ? rc->connections : 0;
}

RiverCorner& RiverNetwork::materialize_(Int2 c) {
    std::int32_t& slot = index_[static_cast<std::size_t>(c.y) * cw_ + c.x];
    if (slot < 0) {
        slot = static_cast<std::int32_t>(arena_.size());
        arena_.push_back(RiverCorner{c, 0});
    }
    return arena_[static_cast<std::size_t>(slot)];
}

void RiverNetwork::connect(Int2 c, RiverDir d) {
    if (!inBounds(c))
        throw std::out_of_range("RiverNetwork::connect: corner (" + std::to_string(c.x) + "," +
                                std::to_string(c.y) + ") is off the corner grid");
    const auto n = step(c, d);
    if (!n)
        throw std::out_of_range("RiverNetwork::connect: no neighbour past the map edge");

    // Materialize both before taking references; the arena may reallocate.
    materialize_(c);
    materialize_(*n);
    const auto ic = static_cast<std::size_t>(index_[static_cast<std::size_t>(c.y) * cw_ + c.x]);
    const auto in = static_cast<std::size_t>(index_[static_cast<std::size_t>(n->y) * cw_ + n->x]);
    arena_[ic].connections |= bit(d);
    arena_[in].connections |= bit(opposite(d));
}

std::vector<Int2> RiverNetwork::mirroredPositions(Int2 c) const {
    std::vector<Int2> out;
    out.push_back(c);
    const bool seamX = wrapX_ && c.x == 0;
    const bool seamY = wrapY_ && c.y == 0;
    if (seamX)
        out.push_back(Int2{tw_, c.y});
    if (seamY)
        out.push_back(Int2{c.x, th_});
    if (seamX && seamY)
        out.push_back(Int2{tw_, th_});
    return out;
}

// --- Terrain queries -------------------------------------------------------

float cornerElevation(const TileGrid& tiles, Int2 c, const MapParameters& p) noexcept {
    float sum = 0.0f;
    int n = 0;
    forEachTouchingTile(tiles, c, p, [&](const Tile& t) { sum += t.elevation; ++n; });
    return n > 0 ? sum / static_cast<float>(n) : 0.0f;
}

float cornerPrecipitation(const TileGrid& tiles, Int2 c, const MapParameters& p) noexcept {
    float sum = 0.0f;
    int n = 0;
    forEachTouchingTile(tiles, c, p, [&](const Tile& t) { sum += t.precipitation; ++n; });
    return n > 0 ? sum / static_cast<float>(n) : 0.0f;
}

bool isOceanAdjacent(const TileGrid& tiles, Int2 c, const MapParameters& p) noexcept {
    bool ocean = false;
    forEachTouchingTile(tiles, c, p, [&](const Tile& t) { ocean = ocean || t.isOcean(); });
    return ocean;
}

std::optional<Descent> steepestDescent(const TileGrid& tiles, const RiverNetwork& net,
                                       Int2 c, const MapParameters& p) noexcept {
    const float here = cornerElevation(tiles, c, p);
    std::optional<Descent> best;
    for (RiverDir d : kRiverDirs) {
        const auto n = net.step(c, d);
        if (!n)
            continue;
        const double drop = static_cast<double>(here) - static_cast<double>(cornerElevation(tiles, *n, p));
        if (!(drop > 0.0))
            continue;
        const double slope = drop / spacingMetres(d, p);
        if (!best || slope > best->slope)
            best = Descent{*n, d, slope};
    }
    return best;
}

double riverProbability(float precipitation, double slope, const MapParameters& p) noexcept {
    return 4.0 / (kPi * kPi)
         * std::atan(static_cast<double>(p.riverRainfallMultiplier) * precipitation)
         * std::atan(static_cast<double>(p.riverSlopeMultiplier) * slope);
}

// --- Network construction --------------------------------------------------

RiverNetwork buildRiverNetwork(const TileGrid& tiles, const MapParameters& p,
                               Pcg32& rng, RiverStats* stats) {
    RiverNetwork net(tiles.width(), tiles.height(), p.wrapX, p.wrapY);
    RiverStats local{};

    for (int cy = 0; cy < net.cornerHeight(); ++cy) {
        for (int cx = 0; cx < net.cornerWidth(); ++cx) {
            const Int2 source{cx, cy};
            if (net.has(source) || isOceanAdjacent(tiles, source, p))
                continue;

            ++local.eligible;
            const auto first = steepestDescent(tiles, net, source, p);
            const double chance = riverProbability(cornerPrecipitation(tiles, source, p),
                                                   first ? first->slope : 0.0, p);
            if (!rng.next_bernoulli(chance) || !first)
                continue;

            ++local.sources;
            Int2 cur = source;
            std::optional<Descent> d = first;
            // Elevation strictly decreases along the walk, so it terminates.
            while (d) {
                const bool merging = net.has(d->next);
                net.connect(cur, d->dir);
                ++local.links;
                if (merging) {
                    ++local.merges;
                    break;
                }
                if (isOceanAdjacent(tiles, d->next, p)) {
                    ++local.mouths;
                    break;
                }
                cur = d->next;
                d = steepestDescent(tiles, net, cur, p);
            }
        }
    }

    if (stats)
        *stats = local;
    return net;
}

} // namespace planetmap::worldgen

// src/worldgen/Wrap.hpp
#pragma once
// Coordinate wrapping and toroidal distance helpers. Header-only, pure inlines.

#include <cstdlib>
#include <optional>

#include "worldgen/MapParameters.hpp"

namespace planetmap::worldgen {

// Integer tile / corner coordinate.
struct Int2 {
    int x = 0;
    int y = 0;

    friend constexpr bool operator==(const Int2& a, const Int2& b) noexcept { return a.x == b.x && a.y == b.y; }
    friend constexpr bool operator!=(const Int2& a, const Int2& b) noexcept { return !(a == b); }
};

// Returns coord if it lies in [0, length). Outside that range returns the
// wrapped index when wrapping, otherwise std::nullopt (no neighbour).
[[nodiscard]] inline std::optional<int> wrapCoord(int coord, int length, bool wrap) noexcept {
    if (coord >= 0 && coord < length)
        return coord;
    if (!wrap || length <= 0)
        return std::nullopt;
    const int m = coord % length;
    return m < 0 ? m + length : m;
}

// |a - b|, or the shorter way around when wrapping.
[[nodiscard]] inline int toroidalDelta(int a, int b, int length, bool wrap) noexcept {
    const int d = std::abs(a - b);
    if (!wrap)
        return d;
    const int around = length - d;
    return around < d ? around : d;
}

// Squared physical distance (km^2) between two tiles of the map.
[[nodiscard]] inline double squaredDistanceKm(Int2 a, Int2 b, const MapParameters& p) noexcept {
    const double dx = static_cast<double>(toroidalDelta(a.x, b.x, p.width,  p.wrapX)) * p.tileScaleKmX;
    const double dy = static_cast<double>(toroidalDelta(a.y, b.y, p.height, p.wrapY)) * p.tileScaleKmY;
    return dx * dx + dy * dy;
}

// Wrap-aware 4-neighbour of (x, y) in a width x height lattice.
[[nodiscard]] inline std::optional<Int2> neighbor(Int2 c, int dx, int dy,
                                                  int width, int height,
                                                  bool wrapX, bool wrapY) noexcept {
    const auto nx = wrapCoord(c.x + dx, width, wrapX);
    const auto ny = wrapCoord(c.y + dy, height, wrapY);
    if (!nx || !ny)
        return std::nullopt;
    return Int2{*nx, *ny};
}

} // namespace planetmap::worldgen

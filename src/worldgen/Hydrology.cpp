// src/worldgen/Hydrology.cpp

#include "worldgen/Hydrology.hpp"
#include "worldgen/Climate.hpp"
#include "worldgen/Wrap.hpp"

#include <cmath>
#include <cstdint>
#include <deque>
#include <vector>

namespace planetmap::worldgen {
namespace {

constexpr float kRadToDeg = 180.0f / 3.14159265358979323846f;

constexpr int kDx4[4] = { 1, -1, 0,  0 };
constexpr int kDy4[4] = { 0,  0, 1, -1 };

inline float landElevation(const Tile& t) noexcept {
    return t.isLand() ? t.elevation : 0.0f;
}

} // namespace

OceanDistanceStats computeNearestOcean(TileGrid& tiles, const MapParameters& p) {
    OceanDistanceStats stats{};
    const int w = tiles.width();
    const int h = tiles.height();

    std::deque<Int2> frontier;
    std::vector<std::uint8_t> queued(tiles.size(), 0);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            Tile& t = tiles.at(x, y);
            if (t.isOcean()) {
                t.nearestOcean = Int2{x, y};
                frontier.push_back(Int2{x, y});
                queued[tiles.index(x, y)] = 1;
                ++stats.oceanTiles;
            } else {
                t.nearestOcean = Tile::kUnknownOcean;
            }
        }
    }

    while (!frontier.empty()) {
        const Int2 c = frontier.front();
        frontier.pop_front();
        queued[tiles.index(c.x, c.y)] = 0;

        const Int2 source = tiles.at(c.x, c.y).nearestOcean;

        for (int k = 0; k < 4; ++k) {
            const auto n = neighbor(c, kDx4[k], kDy4[k], w, h, p.wrapX, p.wrapY);
            if (!n)
                continue;

            Tile& nt = tiles.at(n->x, n->y);
            if (nt.hasNearestOcean()) {
                const double current = squaredDistanceKm(*n, nt.nearestOcean, p);
                const double offered = squaredDistanceKm(*n, source, p);
                if (!(offered < current))
                    continue;
            }

            nt.nearestOcean = source;
            ++stats.updates;

            const std::size_t ni = tiles.index(n->x, n->y);
            if (!queued[ni]) {
                queued[ni] = 1;
                frontier.push_back(*n);
            }
        }
    }

    for (const Tile& t : tiles)
        if (!t.hasNearestOcean())
            ++stats.unreachable;
    return stats;
}

void attenuateRainfallByOceanDistance(TileGrid& tiles, const MapParameters& p) {
    for (int y = 0; y < tiles.height(); ++y) {
        for (int x = 0; x < tiles.width(); ++x) {
            Tile& t = tiles.at(x, y);
            if (!t.isLand() || !t.hasNearestOcean())
                continue;
            const double distKm = std::sqrt(squaredDistanceKm(Int2{x, y}, t.nearestOcean, p));
            const double factor = std::exp(distKm / static_cast<double>(p.rainfallOceanEFoldingDistance));
            t.setPrecipitation(static_cast<float>(static_cast<double>(t.precipitation) / factor));
        }
    }
}

bool windBlowsEast(float latitude, const MapParameters& p) noexcept {
    const float absDeg = std::fabs(latitude * kRadToDeg);
    const bool westerlies = absDeg >= p.highPressureLatitude && absDeg <= p.lowPressureLatitude;
    return westerlies != p.rotateWest;
}

float orographicRainfall(float elevation, float prevElevation,
                         float seaLevelTempC, float tempC,
                         const MapParameters& p) noexcept {
    const float tempK = tempC + kCelsiusToKelvin;
    const float exponent =
        p.saturationPressureConst1 * seaLevelTempC / (p.saturationPressureConst2 + seaLevelTempC)
        - elevation * p.moistureScaleHeightDivisor * p.temperatureLapseRate / (tempK * tempK);
    return p.condensationRateMultiplier * std::exp(exponent)
         * (elevation - prevElevation) / (p.tileScaleKmX * kKmToM);
}

void applyOrographicRainfall(TileGrid& tiles, const MapParameters& p) {
    const int w = tiles.width();
    const int h = tiles.height();
    if (w <= 0)
        return;

    for (int y = 0; y < h; ++y) {
        const float lat = latitudeOf(y, h);
        const float seaLevelTemp = seaLevelTemperature(lat, p);
        const bool east = windBlowsEast(lat, p);
        const int step  = east ? 1 : -1;
        const int first = east ? 0 : w - 1;
        const int last  = east ? w - 1 : 0;

        // On a wrapping row the first tile is downwind of the last one.
        float prev = landElevation(tiles.at(last, y));
        bool havePrev = p.wrapX;

        for (int i = 0, x = first; i < w; ++i, x += step) {
            Tile& t = tiles.at(x, y);
            if (t.isLand() && havePrev) {
                t.setPrecipitation(t.precipitation +
                    orographicRainfall(t.elevation, prev, seaLevelTemp, t.temperature, p));
            }
            prev = landElevation(t);
            havePrev = true;
        }
    }
}

} // namespace planetmap::worldgen

// src/worldgen/Validation.cpp
#include "worldgen/Validation.hpp"

#include "worldgen/Tile.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace planetmap::worldgen {
namespace {

constexpr float kInf    = std::numeric_limits<float>::infinity();
constexpr float kFltMax = std::numeric_limits<float>::max();
constexpr float kTiny   = std::numeric_limits<float>::denorm_min();

// Smallest float f with f >= 1 - 1/tiles, so floor(tiles * f) still reaches tiles - 1.
float maxOceanFraction(int width, int height) noexcept {
    const double tiles = static_cast<double>(width) * static_cast<double>(height);
    const double bound = 1.0 - 1.0 / tiles;
    float f = static_cast<float>(bound);
    if (static_cast<double>(f) < bound)
        f = std::nextafter(f, 1.0f);
    return f;
}

} // namespace

void validateRange(ValueRange& r, float lo, float hi) noexcept {
    r.min = std::clamp(r.min, lo, hi);
    r.max = std::clamp(r.max, r.min, hi);
}

void validateTileType(TileType& t) noexcept {
    for (auto& r : t.elevation)     validateRange(r, -kInf, kFltMax);
    for (auto& r : t.temperature)   validateRange(r);
    for (auto& r : t.precipitation) validateRange(r);
}

void validateParameters(MapParameters& p) noexcept {
    p.width  = std::max(p.width, 1);
    p.height = std::max(p.height, 1);

    // Total extent per axis must stay finite.
    p.tileScaleKmX = std::clamp(p.tileScaleKmX, kTiny, kFltMax / static_cast<float>(p.width));
    p.tileScaleKmY = std::clamp(p.tileScaleKmY, kTiny, kFltMax / static_cast<float>(p.height));

    p.oceanFraction = std::clamp(p.oceanFraction, 0.0f, maxOceanFraction(p.width, p.height));
    p.noiseScale    = std::clamp(p.noiseScale, kTiny, kFltMax);

    for (auto& t : p.tileTypes)
        validateTileType(t);

    p.highPressureLatitude = std::clamp(p.highPressureLatitude, 0.0f, 90.0f);
    p.lowPressureLatitude  = std::clamp(p.lowPressureLatitude, p.highPressureLatitude, 90.0f);

    p.equatorTemperature = std::clamp(p.equatorTemperature, minTemperatureC(), kFltMax);
    p.poleTemperature    = std::clamp(p.poleTemperature, minTemperatureC(), kFltMax);

    p.equatorRainfall     = std::max(p.equatorRainfall, 0.0f);
    p.midLatitudeRainfall = std::max(p.midLatitudeRainfall, 0.0f);

    // Evenness divides the latitude offset.
    p.equatorRainfallEvenness     = std::max(p.equatorRainfallEvenness, kTiny);
    p.midLatitudeRainfallEvenness = std::max(p.midLatitudeRainfallEvenness, kTiny);

    if (p.rainfallOceanEFoldingDistance == 0.0f)
        p.rainfallOceanEFoldingDistance = kTiny;

    // c2 + T0 must not reach 0 for any sea-level temperature of the map.
    const float lowT  = std::min(p.equatorTemperature, p.poleTemperature);
    const float highT = std::max(p.equatorTemperature, p.poleTemperature);
    const float pole  = -p.saturationPressureConst2;
    if (pole >= lowT && pole <= highT)
        p.saturationPressureConst2 = std::nextafter(-lowT, kInf);

    p.riverRainfallMultiplier = std::max(p.riverRainfallMultiplier, 0.0f);
    p.riverSlopeMultiplier    = std::max(p.riverSlopeMultiplier, 0.0f);
}

std::vector<ParamWarning> collectWarnings(const MapParameters& p) {
    std::vector<ParamWarning> out;

    if (p.poleTemperature > p.equatorTemperature)
        out.push_back({"poleTemperature",
                       "The poles are warmer than the equator."});
    if (p.temperatureLapseRate < 0.0f)
        out.push_back({"temperatureLapseRate",
                       "The lapse rate is negative: temperature rises with elevation."});
    if (p.rainfallOceanEFoldingDistance < 0.0f)
        out.push_back({"rainfallOceanEFoldingDistance",
                       "The e-folding distance is negative: rainfall grows away from the ocean."});
    if (p.condensationRateMultiplier < 0.0f)
        out.push_back({"condensationRateMultiplier",
                       "The condensation multiplier is negative: windward slopes get drier."});

    if (p.tileTypes.empty())
        out.push_back({"tileTypes", "No tile types are defined."});

    for (std::size_t i = 0; i < p.tileTypes.size(); ++i) {
        const TileType& t = p.tileTypes[i];
        const bool straddles = std::any_of(t.elevation.begin(), t.elevation.end(),
            [](const ValueRange& r) { return r.min < 0.0f && r.max > 0.0f; });
        if (straddles)
            out.push_back({"tileTypes[" + std::to_string(i) + "].elevation",
                           "Tile type '" + t.name + "' spans both positive and negative elevations; "
                           "positive is land and non-positive is ocean."});
    }
    return out;
}

void checkPreconditions(const MapParameters& p) {
    if (p.width <= 0 || p.height <= 0)
        throw std::invalid_argument("map dimensions must be positive (got " +
                                    std::to_string(p.width) + "x" + std::to_string(p.height) + ")");
    if (p.tileTypes.empty())
        throw std::invalid_argument("at least one tile type is required");

    const float top = p.maxTileTypeElevation();
    if (!(top > 0.0f) || !std::isfinite(top))
        throw std::invalid_argument("the highest tile-type elevation bound must be positive and finite");
}

} // namespace planetmap::worldgen

// src/worldgen/Climate.cpp
#include "worldgen/Climate.hpp"

#include <cmath>

namespace planetmap::worldgen {
namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kRadToDeg = 180.0f / kPi;

// peak / (1 + ((lat - centre) / evenness)^2), all angles in degrees.
inline float rainfallPeak(float latDeg, float centreDeg, float peak, float evenness) noexcept {
    const float u = (latDeg - centreDeg) / evenness;
    return peak / (1.0f + u * u);
}

} // namespace

float latitudeOf(int y, int height) noexcept {
    return (static_cast<float>(y) / static_cast<float>(height) - 0.5f) * kPi;
}

float seaLevelTemperature(float latitude, const MapParameters& p) noexcept {
    const float s = std::sin(latitude);
    return p.equatorTemperature - (p.equatorTemperature - p.poleTemperature) * s * s;
}

float baselineRainfall(float latitude, const MapParameters& p) noexcept {
    const float latDeg = latitude * kRadToDeg;
    return rainfallPeak(latDeg, 0.0f, p.equatorRainfall, p.equatorRainfallEvenness)
         + rainfallPeak(latDeg,  p.lowPressureLatitude, p.midLatitudeRainfall, p.midLatitudeRainfallEvenness)
         + rainfallPeak(latDeg, -p.lowPressureLatitude, p.midLatitudeRainfall, p.midLatitudeRainfallEvenness);
}

void applyTemperature(TileGrid& tiles, const MapParameters& p) {
    for (int y = 0; y < tiles.height(); ++y) {
        const float seaLevel = seaLevelTemperature(latitudeOf(y, tiles.height()), p);
        for (int x = 0; x < tiles.width(); ++x) {
            Tile& t = tiles.at(x, y);
            float c = seaLevel;
            if (t.isLand())
                c -= t.elevation * p.temperatureLapseRate;
            t.setTemperature(c);
        }
    }
}

void applyLatitudeRainfall(TileGrid& tiles, const MapParameters& p) {
    for (int y = 0; y < tiles.height(); ++y) {
        const float rain = baselineRainfall(latitudeOf(y, tiles.height()), p);
        for (int x = 0; x < tiles.width(); ++x)
            tiles.at(x, y).setPrecipitation(rain);
    }
}

} // namespace planetmap::worldgen

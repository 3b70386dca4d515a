// src/worldgen/MapParameters.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace planetmap::worldgen {

// Closed interval [min, max].
struct ValueRange {
    float min = 0.0f;
    float max = 0.0f;

    [[nodiscard]] constexpr bool contains(float v) const noexcept {
        return v >= min && v <= max;
    }
};

// A kind of tile and the climate envelope it may be placed in.
// Each attribute holds one or more ranges; a value matches the attribute if it
// lies in any of them.
struct TileType {
    std::string             name;
    std::vector<ValueRange> elevation;      // metres above sea level
    std::vector<ValueRange> temperature;    // °C
    std::vector<ValueRange> precipitation;  // mm / year
    std::string             assetKey;       // opaque to the generator

    [[nodiscard]] bool matches(float elevationM, float temperatureC, float precipitationMm) const noexcept;

    // Highest elevation bound over all elevation ranges (-inf if none).
    [[nodiscard]] float highestElevation() const noexcept;
};

// Everything a generation run needs. Plain data; validated by validateParameters().
struct MapParameters {
    // Grid
    int   width  = 128;
    int   height = 64;
    bool  wrapX  = true;
    bool  wrapY  = false;
    float tileScaleKmX = 100.0f;   // kilometres per tile
    float tileScaleKmY = 100.0f;

    // Elevation
    float oceanFraction = 0.65f;   // portion of tiles at or below sea level
    float noiseScale    = 4.0f;    // noise units spanned by the longer grid side

    // Seed; empty => derived from the system clock
    std::optional<std::uint64_t> seed{};

    // Atmospheric circulation (degrees)
    float highPressureLatitude = 30.0f;
    float lowPressureLatitude  = 60.0f;
    bool  rotateWest = false;      // Earth rotates east

    // Temperature
    float equatorTemperature   = 30.0f;    // °C at sea level
    float poleTemperature      = -20.0f;   // °C at sea level
    float temperatureLapseRate = 0.0065f;  // K per metre

    // Latitude rainfall (mm / year, evenness in degrees of latitude)
    float equatorRainfall             = 2000.0f;
    float equatorRainfallEvenness     = 10.0f;
    float midLatitudeRainfall         = 1000.0f;
    float midLatitudeRainfallEvenness = 10.0f;
    float rainfallOceanEFoldingDistance = 1000.0f;   // km

    // Orographic rainfall
    float condensationRateMultiplier = 50000.0f;
    float saturationPressureConst1   = 17.67f;
    float saturationPressureConst2   = 243.5f;
    float moistureScaleHeightDivisor = 5000.0f;

    // Rivers
    float riverRainfallMultiplier = 0.001f;
    float riverSlopeMultiplier    = 50.0f;

    std::vector<TileType> tileTypes;

    [[nodiscard]] long long tileCount() const noexcept {
        return static_cast<long long>(width) * static_cast<long long>(height);
    }

    // Highest elevation bound declared by any tile type (-inf if none).
    [[nodiscard]] float maxTileTypeElevation() const noexcept;
};

} // namespace planetmap::worldgen

// src/worldgen/Tile.hpp
#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

#include "worldgen/Grid2D.hpp"
#include "worldgen/Wrap.hpp"

namespace planetmap::worldgen {

inline constexpr float kCelsiusToKelvin = 273.15f;
inline constexpr float kKmToM = 1000.0f;

// Smallest representable temperature strictly above absolute zero (°C).
[[nodiscard]] inline float minTemperatureC() noexcept {
    return std::nextafter(-kCelsiusToKelvin, std::numeric_limits<float>::infinity());
}

// One grid cell. Created once per run and filled in by successive stages.
struct Tile {
    static constexpr std::int32_t kNoType = -1;
    static constexpr Int2 kUnknownOcean{-1, -1};

    float elevation     = 0.0f;   // metres; <= 0 is ocean
    float temperature   = 0.0f;   // °C, strictly above absolute zero
    float precipitation = 0.0f;   // mm / year, >= 0
    Int2  nearestOcean  = kUnknownOcean;
    std::int32_t type   = kNoType; // index into MapParameters::tileTypes

    [[nodiscard]] bool isOcean() const noexcept { return elevation <= 0.0f; }
    [[nodiscard]] bool isLand()  const noexcept { return elevation > 0.0f; }
    [[nodiscard]] bool hasNearestOcean() const noexcept { return nearestOcean != kUnknownOcean; }
    [[nodiscard]] bool hasType() const noexcept { return type != kNoType; }

    void setTemperature(float c) noexcept { temperature = std::max(c, minTemperatureC()); }
    void setPrecipitation(float mm) noexcept { precipitation = std::max(mm, 0.0f); }

    friend bool operator==(const Tile&, const Tile&) = default;
};

using TileGrid = Grid2D<Tile>;

} // namespace planetmap::worldgen

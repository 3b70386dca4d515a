// src/worldgen/Elevation.cpp
#include "worldgen/Elevation.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace planetmap::worldgen {

noise::SeamlessSampler makeElevationSampler(const MapParameters& p, Pcg32& rng) {
    noise::SeamlessSampler sampler(p.width, p.height, p.wrapX, p.wrapY, p.noiseScale);

    // Random translation so every run samples a different region of noise space.
    // The permutation lattice repeats every 256 units.
    std::array<float, noise::SeamlessSampler::kMaxDims> offset{};
    for (std::size_t d = 0; d < sampler.dimensions(); ++d)
        offset[d] = randf(rng, 0.0f, 256.0f);
    sampler.setOffset(offset);
    return sampler;
}

std::vector<float> sampleRawElevation(const MapParameters& p, const noise::SeamlessSampler& sampler) {
    std::vector<float> raw;
    raw.reserve(static_cast<std::size_t>(p.tileCount()));
    for (int y = 0; y < p.height; ++y)
        for (int x = 0; x < p.width; ++x)
            raw.push_back(sampler.sample(static_cast<float>(x), static_cast<float>(y)));
    return raw;
}

ElevationCalibration calibrateElevation(const std::vector<float>& raw, float oceanFraction, float maxElevation) {
    ElevationCalibration c{};
    if (raw.empty())
        return c;

    std::vector<float> sorted(raw);
    std::sort(sorted.begin(), sorted.end());

    const std::size_t n = sorted.size();
    c.oceanRank = static_cast<std::size_t>(std::floor(static_cast<double>(n) * static_cast<double>(oceanFraction)));
    c.oceanRank = std::min(c.oceanRank, n - 1);

    // Sea level sits on the highest ocean sample so that sample maps to exactly 0.
    // With no ocean it sits just below the lowest sample.
    c.seaLevelRaw = c.oceanRank > 0
        ? sorted[c.oceanRank - 1]
        : std::nextafter(sorted.front(), -std::numeric_limits<float>::infinity());

    float denom = 1.0f - c.seaLevelRaw;
    if (!(denom > std::numeric_limits<float>::epsilon()))
        denom = std::max(sorted.back() - c.seaLevelRaw, std::numeric_limits<float>::min());
    c.scale = maxElevation / denom;
    return c;
}

ElevationCalibration generateElevation(TileGrid& tiles, const MapParameters& p, Pcg32& rng) {
    const noise::SeamlessSampler sampler = makeElevationSampler(p, rng);
    const std::vector<float> raw = sampleRawElevation(p, sampler);
    const ElevationCalibration c = calibrateElevation(raw, p.oceanFraction, p.maxTileTypeElevation());

    for (std::size_t i = 0; i < raw.size(); ++i)
        tiles[i].elevation = calibratedElevation(raw[i], c);
    return c;
}

} // namespace planetmap::worldgen

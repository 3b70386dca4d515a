// src/worldgen/Noise.hpp
#pragma once
#include <array>
#include <cstddef>

namespace planetmap::worldgen::noise {

// Simplex noise (after Stefan Gustavson's reference implementation).
// Results are scaled and biased to lie roughly in [0, 1].
float simplex2D(float x, float y) noexcept;
float simplex3D(float x, float y, float z) noexcept;
float simplex4D(float x, float y, float z, float w) noexcept;

// Samples simplex noise over a width x height tile grid so that wrapping axes
// are seamless. A wrapping axis is mapped onto a circle and contributes two
// noise inputs; a non-wrapping axis contributes one. The noise dimension used is
// therefore 2 + (number of wrapping axes).
class SeamlessSampler {
public:
    static constexpr std::size_t kMaxDims = 4;

    // noiseScale: noise units spanned by the longer grid side.
    SeamlessSampler(int width, int height, bool wrapX, bool wrapY, float noiseScale) noexcept;

    [[nodiscard]] std::size_t dimensions() const noexcept { return dims_; }

    // Translation applied to each noise input (only the first dimensions() are used).
    void setOffset(const std::array<float, kMaxDims>& offset) noexcept { offset_ = offset; }
    [[nodiscard]] const std::array<float, kMaxDims>& offset() const noexcept { return offset_; }

    // Raw noise at tile (x, y). Fractional coordinates are accepted.
    [[nodiscard]] float sample(float x, float y) const noexcept;

private:
    int   width_  = 1;
    int   height_ = 1;
    bool  wrapX_  = false;
    bool  wrapY_  = false;
    float unitsPerTile_ = 1.0f;
    std::size_t dims_ = 2;
    std::array<float, kMaxDims> offset_{};
};

} // namespace planetmap::worldgen::noise

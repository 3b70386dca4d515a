// src/worldgen/Noise.cpp
#include "worldgen/Noise.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

namespace planetmap::worldgen::noise {
namespace {

constexpr float kPi = 3.14159265358979323846f;

// Gradients for 2D and 3D noise: midpoints of the edges of a cube.
constexpr float kGrad3[12][3] = {
  { 1, 1, 0}, {-1, 1, 0}, { 1,-1, 0}, {-1,-1, 0},
  { 1, 0, 1}, {-1, 0, 1}, { 1, 0,-1}, {-1, 0,-1},
  { 0, 1, 1}, { 0,-1, 1}, { 0, 1,-1}, { 0,-1,-1}
};

// Gradients for 4D noise: midpoints of the edges of a tesseract.
constexpr float kGrad4[32][4] = {
  { 0, 1, 1, 1}, { 0, 1, 1,-1}, { 0, 1,-1, 1}, { 0, 1,-1,-1},
  { 0,-1, 1, 1}, { 0,-1, 1,-1}, { 0,-1,-1, 1}, { 0,-1,-1,-1},
  { 1, 0, 1, 1}, { 1, 0, 1,-1}, { 1, 0,-1, 1}, { 1, 0,-1,-1},
  {-1, 0, 1, 1}, {-1, 0, 1,-1}, {-1, 0,-1, 1}, {-1, 0,-1,-1},
  { 1, 1, 0, 1}, { 1, 1, 0,-1}, { 1,-1, 0, 1}, { 1,-1, 0,-1},
  {-1, 1, 0, 1}, {-1, 1, 0,-1}, {-1,-1, 0, 1}, {-1,-1, 0,-1},
  { 1, 1, 1, 0}, { 1, 1,-1, 0}, { 1,-1, 1, 0}, { 1,-1,-1, 0},
  {-1, 1, 1, 0}, {-1, 1,-1, 0}, {-1,-1, 1, 0}, {-1,-1,-1, 0}
};

// Ken Perlin's reference permutation.
constexpr std::uint8_t kP[256] = {
  151,160,137, 91, 90, 15,131, 13,201, 95, 96, 53,194,233,  7,225,
  140, 36,103, 30, 69,142,  8, 99, 37,240, 21, 10, 23,190,  6,148,
  247,120,234, 75,  0, 26,197, 62, 94,252,219,203,117, 35, 11, 32,
   57,177, 33, 88,237,149, 56, 87,174, 20,125,136,171,168, 68,175,
   74,165, 71,134,139, 48, 27,166, 77,146,158,231, 83,111,229,122,
   60,211,133,230,220,105, 92, 41, 55, 46,245, 40,244,102,143, 54,
   65, 25, 63,161,  1,216, 80, 73,209, 76,132,187,208, 89, 18,169,
  200,196,135,130,116,188,159, 86,164,100,109,198,173,186,  3, 64,
   52,217,226,250,124,123,  5,202, 38,147,118,126,255, 82, 85,212,
  207,206, 59,227, 47, 16, 58, 17,182,189, 28, 42,223,183,170,213,
  119,248,152,  2, 44,154,163, 70,221,153,101,155,167, 43,172,  9,
  129, 22, 39,253, 19, 98,108,110, 79,113,224,232,178,185,112,104,
  218,246, 97,228,251, 34,242,193,238,210,144, 12,191,179,162,241,
   81, 51,145,235,249, 14,239,107, 49,192,214, 31,181,199,106,157,
  184, 84,204,176,115,121, 50, 45,127,  4,150,254,138,236,205, 93,
  222,114, 67, 29, 24, 72,243,141,128,195, 78, 66,215, 61,156,180
};

// Doubled so that lookups never need an index wrap.
constexpr std::array<std::uint8_t, 512> makePerm() noexcept {
  std::array<std::uint8_t, 512> perm{};
  for (int i = 0; i < 512; ++i) perm[static_cast<std::size_t>(i)] = kP[i & 255];
  return perm;
}
constexpr std::array<std::uint8_t, 512> kPerm = makePerm();

inline int perm(int i) noexcept { return kPerm[static_cast<std::size_t>(i)]; }

// Traversal order of the 4-simplex corners, indexed by six comparison bits.
// Only 24 of the 64 entries can occur; the rest are zero.
constexpr std::uint8_t kSimplex4[64][4] = {
  {0,1,2,3},{0,1,3,2},{0,0,0,0},{0,2,3,1},{0,0,0,0},{0,0,0,0},{0,0,0,0},{1,2,3,0},
  {0,2,1,3},{0,0,0,0},{0,3,1,2},{0,3,2,1},{0,0,0,0},{0,0,0,0},{0,0,0,0},{1,3,2,0},
  {0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},
  {1,2,0,3},{0,0,0,0},{1,3,0,2},{0,0,0,0},{0,0,0,0},{0,0,0,0},{2,3,0,1},{2,3,1,0},
  {1,0,2,3},{1,0,3,2},{0,0,0,0},{0,0,0,0},{0,0,0,0},{2,0,3,1},{0,0,0,0},{2,1,3,0},
  {0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},{0,0,0,0},
  {2,0,1,3},{0,0,0,0},{0,0,0,0},{0,0,0,0},{3,0,1,2},{3,0,2,1},{0,0,0,0},{3,1,2,0},
  {2,1,0,3},{0,0,0,0},{0,0,0,0},{0,0,0,0},{3,1,0,2},{0,0,0,0},{3,2,0,1},{3,2,1,0}
};

// Skew / unskew factors.
const float kF2 = 0.5f * (std::sqrt(3.0f) - 1.0f);
const float kG2 = (3.0f - std::sqrt(3.0f)) / 6.0f;
constexpr float kF3 = 1.0f / 3.0f;
constexpr float kG3 = 1.0f / 6.0f;
const float kF4 = (std::sqrt(5.0f) - 1.0f) / 4.0f;
const float kG4 = (5.0f - std::sqrt(5.0f)) / 20.0f;

inline int fastFloor(float v) noexcept {
  const int i = static_cast<int>(v);
  return v < static_cast<float>(i) ? i - 1 : i;
}

// t^4 * (g . d) when t = falloff - |d|^2 is non-negative, else 0.
template <int N>
inline float cornerContribution(float falloff, const float (&d)[N], const float* g) noexcept {
  float t = falloff;
  float dot = 0.0f;
  for (int k = 0; k < N; ++k) {
    t   -= d[k] * d[k];
    dot += g[k] * d[k];
  }
  if (t < 0.0f) return 0.0f;
  t *= t;
  return t * t * dot;
}

} // namespace

float simplex2D(float x, float y) noexcept {
  // Skew the input space to find the containing cell.
  const float s = (x + y) * kF2;
  const int i = fastFloor(x + s);
  const int j = fastFloor(y + s);
  const float t = static_cast<float>(i + j) * kG2;
  const float x0 = x - (static_cast<float>(i) - t);
  const float y0 = y - (static_cast<float>(j) - t);

  // Lower triangle (XY order) or upper triangle (YX order).
  const int i1 = x0 > y0 ? 1 : 0;
  const int j1 = x0 > y0 ? 0 : 1;

  const float d0[2] = { x0, y0 };
  const float d1[2] = { x0 - static_cast<float>(i1) + kG2, y0 - static_cast<float>(j1) + kG2 };
  const float d2[2] = { x0 - 1.0f + 2.0f * kG2, y0 - 1.0f + 2.0f * kG2 };

  const int ii = i & 255;
  const int jj = j & 255;
  const int gi0 = perm(ii +      perm(jj))      % 12;
  const int gi1 = perm(ii + i1 + perm(jj + j1)) % 12;
  const int gi2 = perm(ii + 1  + perm(jj + 1))  % 12;

  const float n = cornerContribution(0.5f, d0, kGrad3[gi0])
                + cornerContribution(0.5f, d1, kGrad3[gi1])
                + cornerContribution(0.5f, d2, kGrad3[gi2]);
  return 35.0f * n + 0.5f;
}

float simplex3D(float x, float y, float z) noexcept {
  const float s = (x + y + z) * kF3;
  const int i = fastFloor(x + s);
  const int j = fastFloor(y + s);
  const int k = fastFloor(z + s);
  const float t = static_cast<float>(i + j + k) * kG3;
  const float x0 = x - (static_cast<float>(i) - t);
  const float y0 = y - (static_cast<float>(j) - t);
  const float z0 = z - (static_cast<float>(k) - t);

  // Second and third corner offsets from the magnitude ordering of (x0, y0, z0).
  int i1, j1, k1, i2, j2, k2;
  if (x0 >= y0) {
    if (y0 >= z0)      { i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 1; k2 = 0; } // X Y Z
    else if (x0 >= z0) { i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 0; k2 = 1; } // X Z Y
    else               { i1 = 0; j1 = 0; k1 = 1; i2 = 1; j2 = 0; k2 = 1; } // Z X Y
  } else {
    if (y0 < z0)       { i1 = 0; j1 = 0; k1 = 1; i2 = 0; j2 = 1; k2 = 1; } // Z Y X
    else if (x0 < z0)  { i1 = 0; j1 = 1; k1 = 0; i2 = 0; j2 = 1; k2 = 1; } // Y Z X
    else               { i1 = 0; j1 = 1; k1 = 0; i2 = 1; j2 = 1; k2 = 0; } // Y X Z
  }

  const float d0[3] = { x0, y0, z0 };
  const float d1[3] = { x0 - i1 + kG3, y0 - j1 + kG3, z0 - k1 + kG3 };
  const float d2[3] = { x0 - i2 + 2.0f * kG3, y0 - j2 + 2.0f * kG3, z0 - k2 + 2.0f * kG3 };
  const float d3[3] = { x0 - 1.0f + 3.0f * kG3, y0 - 1.0f + 3.0f * kG3, z0 - 1.0f + 3.0f * kG3 };

  const int ii = i & 255;
  const int jj = j & 255;
  const int kk = k & 255;
  const int gi0 = perm(ii +      perm(jj +      perm(kk)))      % 12;
  const int gi1 = perm(ii + i1 + perm(jj + j1 + perm(kk + k1))) % 12;
  const int gi2 = perm(ii + i2 + perm(jj + j2 + perm(kk + k2))) % 12;
  const int gi3 = perm(ii + 1  + perm(jj + 1  + perm(kk + 1)))  % 12;

  const float n = cornerContribution(0.6f, d0, kGrad3[gi0])
                + cornerContribution(0.6f, d1, kGrad3[gi1])
                + cornerContribution(0.6f, d2, kGrad3[gi2])
                + cornerContribution(0.6f, d3, kGrad3[gi3]);
  return 16.0f * n + 0.5f;
}

float simplex4D(float x, float y, float z, float w) noexcept {
  const float s = (x + y + z + w) * kF4;
  const int i = fastFloor(x + s);
  const int j = fastFloor(y + s);
  const int k = fastFloor(z + s);
  const int l = fastFloor(w + s);
  const float t = static_cast<float>(i + j + k + l) * kG4;
  const float x0 = x - (static_cast<float>(i) - t);
  const float y0 = y - (static_cast<float>(j) - t);
  const float z0 = z - (static_cast<float>(k) - t);
  const float w0 = w - (static_cast<float>(l) - t);

  // Six pairwise comparisons select one of the 24 simplices in the cell.
  const int c = (x0 > y0 ? 32 : 0) | (x0 > z0 ? 16 : 0) | (y0 > z0 ? 8 : 0)
              | (x0 > w0 ?  4 : 0) | (y0 > w0 ?  2 : 0) | (z0 > w0 ? 1 : 0);
  const std::uint8_t* sc = kSimplex4[c];

  // Corner n (1..3) steps along every axis whose rank is >= 4 - n.
  int off[5][4] = {};
  for (int n = 1; n < 4; ++n)
    for (int a = 0; a < 4; ++a)
      off[n][a] = sc[a] >= 4 - n ? 1 : 0;
  for (int a = 0; a < 4; ++a)
    off[4][a] = 1;

  const int ii = i & 255;
  const int jj = j & 255;
  const int kk = k & 255;
  const int ll = l & 255;

  float n = 0.0f;
  for (int c5 = 0; c5 < 5; ++c5) {
    const float u = kG4 * static_cast<float>(c5);
    const float d[4] = {
      x0 - static_cast<float>(off[c5][0]) + u,
      y0 - static_cast<float>(off[c5][1]) + u,
      z0 - static_cast<float>(off[c5][2]) + u,
      w0 - static_cast<float>(off[c5][3]) + u
    };
    const int gi = perm(ii + off[c5][0] +
                   perm(jj + off[c5][1] +
                   perm(kk + off[c5][2] +
                   perm(ll + off[c5][3])))) % 32;
    n += cornerContribution(0.6f, d, kGrad4[gi]);
  }
  return 13.5f * n + 0.5f;
}

// -------------------- SeamlessSampler --------------------

SeamlessSampler::SeamlessSampler(int width, int height, bool wrapX, bool wrapY, float noiseScale) noexcept
    : width_(std::max(width, 1))
    , height_(std::max(height, 1))
    , wrapX_(wrapX)
    , wrapY_(wrapY)
    , unitsPerTile_(noiseScale / static_cast<float>(std::max(width_, height_)))
    , dims_(2u + (wrapX ? 1u : 0u) + (wrapY ? 1u : 0u))
{
}

float SeamlessSampler::sample(float x, float y) const noexcept {
  std::array<float, kMaxDims> in{};
  std::size_t n = 0;

  // A wrapping axis becomes a circle whose circumference equals the axis'
  // linear extent in noise units, so spacing matches the non-wrapping case.
  const auto push = [&](float coord, int length, bool wrap) {
    if (wrap) {
      const float angle  = 2.0f * kPi * coord / static_cast<float>(length);
      const float radius = static_cast<float>(length) * unitsPerTile_ / (2.0f * kPi);
      in[n++] = radius * std::cos(angle);
      in[n++] = radius * std::sin(angle);
    } else {
      in[n++] = coord * unitsPerTile_;
    }
  };
  push(x, width_,  wrapX_);
  push(y, height_, wrapY_);

  for (std::size_t d = 0; d < n; ++d)
    in[d] += offset_[d];

  switch (n) {
    case 2:  return simplex2D(in[0], in[1]);
    case 3:  return simplex3D(in[0], in[1], in[2]);
    default: return simplex4D(in[0], in[1], in[2], in[3]);
  }
}

} // namespace planetmap::worldgen::noise

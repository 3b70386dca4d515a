// tests/worldgen/test_noise.cpp
//
// Do NOT define DOCTEST_CONFIG_IMPLEMENT* here; tests/test_main.cpp provides main().
#if defined(DOCTEST_CONFIG_IMPLEMENT) || defined(DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN)
    #error "Define DOCTEST_CONFIG_IMPLEMENT only in tests/test_main.cpp."
#endif

#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>

#include "worldgen/Noise.hpp"

namespace noise = planetmap::worldgen::noise;

namespace {

// Mean absolute difference between horizontally adjacent samples.
double meanNeighbourDelta(const noise::SeamlessSampler& s, int w, int h) {
    double sum = 0.0;
    int n = 0;
    for (int y = 0; y < h; ++y)
        for (int x = 0; x + 1 < w; ++x, ++n)
            sum += std::fabs(s.sample(float(x + 1), float(y)) - s.sample(float(x), float(y)));
    return sum / n;
}

} // namespace

TEST_SUITE_BEGIN("noise");

TEST_CASE("simplex: the lattice origin yields exactly the 0.5 bias")
{
    CHECK(noise::simplex2D(0.0f, 0.0f) == 0.5f);
    CHECK(noise::simplex3D(0.0f, 0.0f, 0.0f) == 0.5f);
    CHECK(noise::simplex4D(0.0f, 0.0f, 0.0f, 0.0f) == 0.5f);
}

TEST_CASE("simplex: values stay near [0,1] and actually vary")
{
    float lo2 = 1.0f, hi2 = 0.0f, lo3 = 1.0f, hi3 = 0.0f, lo4 = 1.0f, hi4 = 0.0f;
    for (int i = 0; i < 40; ++i) {
        for (int j = 0; j < 40; ++j) {
            const float x = i * 0.173f - 3.1f;
            const float y = j * 0.211f + 7.9f;
            const float a = noise::simplex2D(x, y);
            const float b = noise::simplex3D(x, y, x * 0.5f - y);
            const float c = noise::simplex4D(x, y, y * 0.3f, x * 0.7f + 1.0f);
            lo2 = std::min(lo2, a); hi2 = std::max(hi2, a);
            lo3 = std::min(lo3, b); hi3 = std::max(hi3, b);
            lo4 = std::min(lo4, c); hi4 = std::max(hi4, c);
        }
    }
    CHECK(lo2 > -0.25f); CHECK(hi2 < 1.25f);
    CHECK(lo3 > -0.25f); CHECK(hi3 < 1.25f);
    CHECK(lo4 > -0.25f); CHECK(hi4 < 1.25f);
    CHECK(hi2 - lo2 > 0.3f);
    CHECK(hi3 - lo3 > 0.3f);
    CHECK(hi4 - lo4 > 0.3f);
}

TEST_CASE("simplex: same input, same output")
{
    CHECK(noise::simplex2D(1.25f, -4.5f) == noise::simplex2D(1.25f, -4.5f));
    CHECK(noise::simplex3D(1.25f, -4.5f, 9.0f) == noise::simplex3D(1.25f, -4.5f, 9.0f));
    CHECK(noise::simplex4D(1.25f, -4.5f, 9.0f, 0.1f) == noise::simplex4D(1.25f, -4.5f, 9.0f, 0.1f));
}

TEST_CASE("SeamlessSampler: dimension follows the number of wrapping axes")
{
    CHECK(noise::SeamlessSampler(16, 8, false, false, 4.0f).dimensions() == 2);
    CHECK(noise::SeamlessSampler(16, 8, true,  false, 4.0f).dimensions() == 3);
    CHECK(noise::SeamlessSampler(16, 8, false, true,  4.0f).dimensions() == 3);
    CHECK(noise::SeamlessSampler(16, 8, true,  true,  4.0f).dimensions() == 4);
}

TEST_CASE("SeamlessSampler: a wrapping axis repeats with the grid period")
{
    noise::SeamlessSampler s(16, 8, true, true, 4.0f);
    s.setOffset({ 12.5f, 40.25f, 3.0f, 101.0f });

    for (int y = 0; y < 8; ++y) {
        CHECK(s.sample(16.0f, float(y)) == doctest::Approx(s.sample(0.0f, float(y))).epsilon(1e-3));
        CHECK(s.sample(-1.0f, float(y)) == doctest::Approx(s.sample(15.0f, float(y))).epsilon(1e-3));
    }
    for (int x = 0; x < 16; ++x)
        CHECK(s.sample(float(x), 8.0f) == doctest::Approx(s.sample(float(x), 0.0f)).epsilon(1e-3));
}

TEST_CASE("SeamlessSampler: the offset moves the sampled region")
{
    noise::SeamlessSampler a(32, 32, false, false, 4.0f);
    noise::SeamlessSampler b(32, 32, false, false, 4.0f);
    b.setOffset({ 17.3f, 88.1f, 0.0f, 0.0f });

    int differing = 0;
    for (int i = 0; i < 32; ++i)
        if (a.sample(float(i), float(i)) != b.sample(float(i), float(i))) ++differing;
    CHECK(differing > 24);
}

TEST_CASE("SeamlessSampler: a larger noise scale gives higher-frequency terrain")
{
    constexpr int W = 64, H = 64;
    noise::SeamlessSampler coarse(W, H, false, false, 1.0f);
    noise::SeamlessSampler fine(W, H, false, false, 16.0f);
    coarse.setOffset({ 5.5f, 9.5f, 0.0f, 0.0f });
    fine.setOffset({ 5.5f, 9.5f, 0.0f, 0.0f });

    CHECK(meanNeighbourDelta(fine, W, H) > 4.0 * meanNeighbourDelta(coarse, W, H));
}

TEST_SUITE_END();

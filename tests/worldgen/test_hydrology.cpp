// tests/worldgen/test_hydrology.cpp
#include <doctest/doctest.h>

#include <cmath>

#include "worldgen/Climate.hpp"
#include "worldgen/Hydrology.hpp"
#include "test_helpers.hpp"

namespace wg = planetmap::worldgen;

namespace {
constexpr float kPi = 3.14159265358979323846f;

// Ocean everywhere except the given row, whose elevations are set from `row`.
template <std::size_t N>
wg::TileGrid oceanWithRow(int height, int y, const float (&row)[N]) {
    auto tiles = pm_test::flatGrid(static_cast<int>(N), height, -10.0f, 10.0f, 0.0f);
    for (std::size_t x = 0; x < N; ++x)
        tiles.at(static_cast<int>(x), y).elevation = row[x];
    return tiles;
}
}

TEST_SUITE_BEGIN("hydrology");

TEST_CASE("computeNearestOcean: ocean tiles are their own nearest ocean")
{
    auto p = pm_test::smallParams(5, 3, false, false);
    auto tiles = pm_test::flatGrid(5, 3, 100.0f);
    tiles.at(2, 1).elevation = -5.0f;
    tiles.at(4, 0).elevation = 0.0f;   // zero counts as ocean

    const auto s = wg::computeNearestOcean(tiles, p);
    CHECK(s.oceanTiles == 2);
    CHECK(s.unreachable == 0);
    CHECK(tiles.at(2, 1).nearestOcean == wg::Int2{2, 1});
    CHECK(tiles.at(4, 0).nearestOcean == wg::Int2{4, 0});
}

TEST_CASE("computeNearestOcean: distance goes around a wrapping edge")
{
    auto p = pm_test::smallParams(10, 1, true, false);
    auto tiles = pm_test::flatGrid(10, 1, 100.0f);
    tiles.at(0, 0).elevation = -1.0f;

    (void)wg::computeNearestOcean(tiles, p);
    const wg::Tile& east = tiles.at(9, 0);
    REQUIRE(east.hasNearestOcean());
    CHECK(east.nearestOcean == wg::Int2{0, 0});
    CHECK(wg::squaredDistanceKm({9, 0}, east.nearestOcean, p) == doctest::Approx(100.0 * 100.0));
    CHECK(wg::squaredDistanceKm({5, 0}, tiles.at(5, 0).nearestOcean, p) == doctest::Approx(500.0 * 500.0));

    p.wrapX = false;
    auto flat = pm_test::flatGrid(10, 1, 100.0f);
    flat.at(0, 0).elevation = -1.0f;
    (void)wg::computeNearestOcean(flat, p);
    CHECK(wg::squaredDistanceKm({9, 0}, flat.at(9, 0).nearestOcean, p) == doctest::Approx(900.0 * 900.0));
}

TEST_CASE("computeNearestOcean: each land tile settles on the closer of two seas")
{
    auto p = pm_test::smallParams(7, 1, false, false);
    auto tiles = pm_test::flatGrid(7, 1, 100.0f);
    tiles.at(0, 0).elevation = -1.0f;
    tiles.at(6, 0).elevation = -1.0f;

    (void)wg::computeNearestOcean(tiles, p);
    CHECK(tiles.at(1, 0).nearestOcean == wg::Int2{0, 0});
    CHECK(tiles.at(2, 0).nearestOcean == wg::Int2{0, 0});
    CHECK(tiles.at(4, 0).nearestOcean == wg::Int2{6, 0});
    CHECK(tiles.at(5, 0).nearestOcean == wg::Int2{6, 0});
    CHECK(wg::squaredDistanceKm({3, 0}, tiles.at(3, 0).nearestOcean, p) == doctest::Approx(300.0 * 300.0));
}

TEST_CASE("attenuateRainfallByOceanDistance divides by exp(distance / e-folding)")
{
    auto p = pm_test::smallParams(3, 1, false, false);
    p.tileScaleKmX = 100.0f;
    p.rainfallOceanEFoldingDistance = 100.0f;
    auto tiles = pm_test::flatGrid(3, 1, 100.0f, 10.0f, 100.0f);
    tiles.at(0, 0).elevation = -1.0f;

    (void)wg::computeNearestOcean(tiles, p);
    wg::attenuateRainfallByOceanDistance(tiles, p);
    CHECK(tiles.at(0, 0).precipitation == doctest::Approx(100.0f));
    CHECK(tiles.at(1, 0).precipitation == doctest::Approx(100.0f / std::exp(1.0f)));
    CHECK(tiles.at(2, 0).precipitation == doctest::Approx(100.0f / std::exp(2.0f)));
}

TEST_CASE("a map without ocean keeps its rainfall and reports every tile unreachable")
{
    auto p = pm_test::smallParams(3, 2, true, true);
    auto tiles = pm_test::flatGrid(3, 2, 50.0f, 10.0f, 321.0f);

    const auto s = wg::computeNearestOcean(tiles, p);
    CHECK(s.oceanTiles == 0);
    CHECK(s.unreachable == 6);

    wg::attenuateRainfallByOceanDistance(tiles, p);
    for (const auto& t : tiles) {
        CHECK_FALSE(t.hasNearestOcean());
        CHECK(t.precipitation == 321.0f);
    }
}

TEST_CASE("windBlowsEast: westerlies between the pressure belts, easterlies elsewhere")
{
    wg::MapParameters p; // high 30, low 60
    const float deg = kPi / 180.0f;
    CHECK(wg::windBlowsEast(45.0f * deg, p));
    CHECK(wg::windBlowsEast(-45.0f * deg, p));
    CHECK_FALSE(wg::windBlowsEast(10.0f * deg, p));
    CHECK_FALSE(wg::windBlowsEast(-75.0f * deg, p));

    p.rotateWest = true;
    CHECK_FALSE(wg::windBlowsEast(45.0f * deg, p));
    CHECK(wg::windBlowsEast(10.0f * deg, p));
}

TEST_CASE("orographicRainfall: zero on flat ground, positive uphill, negative downhill")
{
    wg::MapParameters p;
    CHECK(wg::orographicRainfall(800.0f, 800.0f, 20.0f, 15.0f, p) == 0.0f);
    CHECK(wg::orographicRainfall(800.0f, 300.0f, 20.0f, 15.0f, p) > 0.0f);
    CHECK(wg::orographicRainfall(300.0f, 800.0f, 20.0f, 15.0f, p) < 0.0f);

    const float tk = 15.0f + 273.15f;
    const float expected = p.condensationRateMultiplier
        * std::exp(p.saturationPressureConst1 * 20.0f / (p.saturationPressureConst2 + 20.0f)
                   - 800.0f * p.moistureScaleHeightDivisor * p.temperatureLapseRate / (tk * tk))
        * (800.0f - 300.0f) / (p.tileScaleKmX * 1000.0f);
    CHECK(wg::orographicRainfall(800.0f, 300.0f, 20.0f, 15.0f, p) == doctest::Approx(expected));
}

TEST_CASE("applyOrographicRainfall: westerly rows gain rain on the rising side only")
{
    auto p = pm_test::smallParams(4, 4, false, false);
    const float row[] = { -10.0f, 500.0f, 1000.0f, 200.0f };
    auto tiles = oceanWithRow(4, 3, row);      // row 3 of 4 sits at +45 degrees

    wg::applyOrographicRainfall(tiles, p);
    const float lat = wg::latitudeOf(3, 4);
    CHECK(tiles.at(0, 3).precipitation == 0.0f);
    CHECK(tiles.at(1, 3).precipitation ==
          doctest::Approx(wg::orographicRainfall(500.0f, 0.0f, wg::seaLevelTemperature(lat, p), 10.0f, p)));
    CHECK(tiles.at(2, 3).precipitation > 0.0f);
    CHECK(tiles.at(3, 3).precipitation == 0.0f);   // descending: clamped at zero

    for (int y = 0; y < 3; ++y)
        for (int x = 0; x < 4; ++x)
            CHECK(tiles.at(x, y).precipitation == 0.0f);
}

TEST_CASE("applyOrographicRainfall: the first tile of a row only counts when X wraps")
{
    const float row[] = { 500.0f, 600.0f, 700.0f, -10.0f };

    auto p = pm_test::smallParams(4, 4, false, false);
    auto open = oceanWithRow(4, 3, row);
    wg::applyOrographicRainfall(open, p);
    CHECK(open.at(0, 3).precipitation == 0.0f);
    CHECK(open.at(1, 3).precipitation > 0.0f);

    p.wrapX = true;
    auto wrapped = oceanWithRow(4, 3, row);
    wg::applyOrographicRainfall(wrapped, p);
    CHECK(wrapped.at(0, 3).precipitation > 0.0f);
    CHECK(wrapped.at(1, 3).precipitation == doctest::Approx(open.at(1, 3).precipitation));
}

TEST_CASE("applyOrographicRainfall: easterly rows sweep toward -x, rotateWest reverses them")
{
    const float row[] = { 700.0f, 600.0f, 500.0f, -10.0f };
    auto p = pm_test::smallParams(4, 4, false, false);

    auto tiles = oceanWithRow(4, 2, row);      // row 2 of 4 is the equator
    wg::applyOrographicRainfall(tiles, p);
    CHECK(tiles.at(2, 2).precipitation > 0.0f);
    CHECK(tiles.at(1, 2).precipitation > 0.0f);
    CHECK(tiles.at(0, 2).precipitation > 0.0f);

    p.rotateWest = true;
    auto reversed = oceanWithRow(4, 2, row);
    wg::applyOrographicRainfall(reversed, p);
    CHECK(reversed.at(0, 2).precipitation == 0.0f);
    CHECK(reversed.at(1, 2).precipitation == 0.0f);
    CHECK(reversed.at(2, 2).precipitation == 0.0f);
}

TEST_SUITE_END();

// tests/worldgen/test_climate.cpp
#include <doctest/doctest.h>

#include <cmath>

#include "worldgen/Climate.hpp"
#include "test_helpers.hpp"

namespace wg = planetmap::worldgen;

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kDeg = kPi / 180.0f;
}

TEST_SUITE_BEGIN("climate");

TEST_CASE("latitudeOf spans -pi/2 at the first row toward +pi/2")
{
    CHECK(wg::latitudeOf(0, 8) == doctest::Approx(-kPi / 2.0f));
    CHECK(wg::latitudeOf(4, 8) == doctest::Approx(0.0f));
    CHECK(wg::latitudeOf(7, 8) < kPi / 2.0f);
    CHECK(wg::latitudeOf(6, 8) == doctest::Approx(kPi / 4.0f));
}

TEST_CASE("seaLevelTemperature interpolates on sin^2 of latitude")
{
    wg::MapParameters p;
    p.equatorTemperature = 30.0f;
    p.poleTemperature = -20.0f;
    CHECK(wg::seaLevelTemperature(0.0f, p) == doctest::Approx(30.0f));
    CHECK(wg::seaLevelTemperature(kPi / 2.0f, p) == doctest::Approx(-20.0f));
    CHECK(wg::seaLevelTemperature(-kPi / 2.0f, p) == doctest::Approx(-20.0f));
    CHECK(wg::seaLevelTemperature(kPi / 4.0f, p) == doctest::Approx(5.0f));
}

TEST_CASE("baselineRainfall peaks at the equator and the low-pressure latitudes")
{
    wg::MapParameters p; // equator 2000, mid 1000, evenness 10, low 60
    CHECK(wg::baselineRainfall(0.0f, p) == doctest::Approx(2000.0f + 2.0f * 1000.0f / 37.0f));
    CHECK(wg::baselineRainfall(60.0f * kDeg, p) ==
          doctest::Approx(2000.0f / 37.0f + 1000.0f + 1000.0f / 145.0f).epsilon(1e-4));

    // Symmetric about the equator, with a trough at the subtropical high.
    CHECK(wg::baselineRainfall(-60.0f * kDeg, p) == doctest::Approx(wg::baselineRainfall(60.0f * kDeg, p)));
    CHECK(wg::baselineRainfall(30.0f * kDeg, p) < wg::baselineRainfall(60.0f * kDeg, p));
    CHECK(wg::baselineRainfall(30.0f * kDeg, p) < wg::baselineRainfall(0.0f, p));
}

TEST_CASE("applyTemperature lowers land by the lapse rate and leaves ocean at sea level")
{
    wg::MapParameters p;
    p.temperatureLapseRate = 0.0065f;
    auto tiles = pm_test::flatGrid(2, 4, -1000.0f);
    tiles.at(1, 2).elevation = 1000.0f;   // row 2 of 4 is the equator

    wg::applyTemperature(tiles, p);
    CHECK(tiles.at(0, 2).temperature == doctest::Approx(30.0f));
    CHECK(tiles.at(1, 2).temperature == doctest::Approx(30.0f - 6.5f));
    CHECK(tiles.at(0, 0).temperature == doctest::Approx(-20.0f));
}

TEST_CASE("applyTemperature never reaches absolute zero")
{
    wg::MapParameters p;
    p.equatorTemperature = -270.0f;
    p.poleTemperature = -270.0f;
    p.temperatureLapseRate = 1.0f;
    auto tiles = pm_test::flatGrid(3, 3, 5000.0f);

    wg::applyTemperature(tiles, p);
    for (const auto& t : tiles) {
        CHECK(t.temperature > -273.15f);
        CHECK(t.temperature == wg::minTemperatureC());
    }
}

TEST_CASE("applyLatitudeRainfall fills each row with its baseline")
{
    wg::MapParameters p;
    auto tiles = pm_test::flatGrid(3, 6, 100.0f);
    wg::applyLatitudeRainfall(tiles, p);
    for (int y = 0; y < 6; ++y)
        for (int x = 0; x < 3; ++x)
            CHECK(tiles.at(x, y).precipitation == wg::baselineRainfall(wg::latitudeOf(y, 6), p));
}

TEST_SUITE_END();

// tests/config/test_map_parameters_config.cpp
#include <doctest/doctest.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "config/MapParametersConfig.h"
#include "worldgen/Validation.hpp"

using planetmap::config::MapParametersConfig;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Writes `text` to a fresh file under the temp directory and returns its path.
std::string writeTemp(const std::string& name, const std::string& text) {
    const fs::path dir = fs::temp_directory_path() / "planetmap_tests";
    fs::create_directories(dir);
    const fs::path p = dir / name;
    std::ofstream os(p, std::ios::binary | std::ios::trunc);
    os << text;
    return p.string();
}

} // namespace

TEST_SUITE_BEGIN("config");

TEST_CASE("fromJson: an empty document yields defaults and the built-in tile types")
{
    const auto p = MapParametersConfig::fromJson(json::object());
    const auto d = MapParametersConfig::makeDefault();
    CHECK(p.width == d.width);
    CHECK(p.oceanFraction == d.oceanFraction);
    CHECK_FALSE(p.seed.has_value());
    CHECK(p.tileTypes.size() == d.tileTypes.size());
    CHECK(p.tileTypes.size() == 9);
}

TEST_CASE("built-in land types start above sea level and ocean types end at it")
{
    const auto p = MapParametersConfig::makeDefault();
    for (const auto& t : p.tileTypes) {
        CAPTURE(t.name);
        const bool ocean = t.name == "Ocean" || t.name == "Sea ice";
        CHECK(t.elevation[0].contains(0.0f) == ocean);
        CHECK(t.elevation[0].contains(-1.0f) == ocean);
    }
}

TEST_CASE("fromJson: present keys override, absent keys keep defaults")
{
    const json root = json::parse(R"({
        "map": { "width": 10, "wrap_y": true, "seed": 99 },
        "climate": { "rotate_west": true, "pole_temperature": -45.5 },
        "rivers": { "slope_multiplier": 7 }
    })");
    const auto p = MapParametersConfig::fromJson(root);
    const planetmap::worldgen::MapParameters d;

    CHECK(p.width == 10);
    CHECK(p.height == d.height);
    CHECK(p.wrapY);
    REQUIRE(p.seed.has_value());
    CHECK(*p.seed == 99u);
    CHECK(p.rotateWest);
    CHECK(p.poleTemperature == doctest::Approx(-45.5f));
    CHECK(p.riverSlopeMultiplier == 7.0f);
    CHECK(p.riverRainfallMultiplier == d.riverRainfallMultiplier);
}

TEST_CASE("fromJson: tile types accept a single range or a list of ranges")
{
    const json root = json::parse(R"({
        "tile_types": [
            { "name": "Marsh", "asset": "marsh",
              "elevation": { "min": 0, "max": 50 },
              "temperature": [ { "min": 5, "max": 15 }, { "min": 20, "max": 30 } ],
              "precipitation": [ { "min": 800 } ] }
        ]
    })");
    const auto p = MapParametersConfig::fromJson(root);
    REQUIRE(p.tileTypes.size() == 1);
    const auto& t = p.tileTypes.front();
    CHECK(t.name == "Marsh");
    CHECK(t.assetKey == "marsh");
    REQUIRE(t.elevation.size() == 1);
    CHECK(t.elevation[0].max == 50.0f);
    CHECK(t.temperature.size() == 2);
    CHECK(t.precipitation[0].min == 800.0f);
    CHECK(t.precipitation[0].max > 1.0e5f);
    CHECK(t.matches(10.0f, 25.0f, 1000.0f));
}

TEST_CASE("fromJson: wrong value types are errors, not silent defaults")
{
    CHECK_THROWS_AS(MapParametersConfig::fromJson(json::parse(R"({"map": {"width": "ten"}})")),
                    std::runtime_error);
    CHECK_THROWS_AS(MapParametersConfig::fromJson(json::parse(R"({"climate": 5})")), std::runtime_error);
    CHECK_THROWS_AS(MapParametersConfig::fromJson(json::parse(R"({"tile_types": {}})")), std::runtime_error);
    CHECK_THROWS_AS(MapParametersConfig::fromJson(json::parse("[1, 2]")), std::runtime_error);
}

TEST_CASE("toJson writes back what fromJson reads")
{
    auto p = MapParametersConfig::makeDefault();
    p.width = 77;
    p.seed = 123456789012345ull;
    p.noiseScale = 2.5f;
    p.tileTypes.resize(2);

    const auto q = MapParametersConfig::fromJson(MapParametersConfig::toJson(p));
    CHECK(q.width == 77);
    REQUIRE(q.seed.has_value());
    CHECK(*q.seed == 123456789012345ull);
    CHECK(q.noiseScale == 2.5f);
    REQUIRE(q.tileTypes.size() == 2);
    CHECK(q.tileTypes[1].name == p.tileTypes[1].name);
    CHECK(q.tileTypes[1].temperature[0].min == p.tileTypes[1].temperature[0].min);
}

TEST_CASE("load/tryLoad: files, missing files and malformed files")
{
    const auto good = writeTemp("good.json", R"({"map": {"height": 12}})");
    CHECK(MapParametersConfig::load(good).height == 12);

    const auto missing = (fs::temp_directory_path() / "planetmap_tests" / "nope.json").string();
    CHECK_THROWS_AS(MapParametersConfig::load(missing), std::runtime_error);

    planetmap::worldgen::MapParameters out;
    out.width = 5;
    std::string error;
    CHECK_FALSE(MapParametersConfig::tryLoad(missing, out, &error));
    CHECK(out.width == 5);
    CHECK(error.find("nope.json") != std::string::npos);

    const auto broken = writeTemp("broken.json", "{ \"map\": ");
    CHECK_FALSE(MapParametersConfig::tryLoad(broken, out));
    CHECK(MapParametersConfig::tryLoad(good, out));
    CHECK(out.height == 12);
}

TEST_CASE("the shipped worldmap.json loads cleanly")
{
    const std::string path = std::string(PM_SOURCE_DIR) + "/" + MapParametersConfig::defaultPath();
    auto p = MapParametersConfig::load(path);
    const auto d = MapParametersConfig::makeDefault();
    REQUIRE(p.tileTypes.size() == d.tileTypes.size());
    for (std::size_t i = 0; i < d.tileTypes.size(); ++i) {
        CAPTURE(d.tileTypes[i].name);
        CHECK(p.tileTypes[i].name == d.tileTypes[i].name);
        CHECK(p.tileTypes[i].elevation[0].min == d.tileTypes[i].elevation[0].min);
        CHECK(p.tileTypes[i].elevation[0].max == d.tileTypes[i].elevation[0].max);
    }
    CHECK_FALSE(p.seed.has_value());

    planetmap::worldgen::validateParameters(p);
    CHECK(planetmap::worldgen::collectWarnings(p).empty());
    CHECK_NOTHROW(planetmap::worldgen::checkPreconditions(p));
}

TEST_SUITE_END();

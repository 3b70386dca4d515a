#include "config/MapParametersConfig.h"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace planetmap::config {
namespace
{
    using worldgen::MapParameters;
    using worldgen::TileType;
    using worldgen::ValueRange;

    constexpr float kAnyLow  = -1.0e6f;
    constexpr float kAnyHigh =  1.0e6f;

    template <typename T>
    T GetOr(const json& j, const char* section, const char* key, const T& fallback)
    {
        if (!j.is_object())
            return fallback;
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return fallback;
        try
        {
            return it->get<T>();
        }
        catch (const json::exception& e)
        {
            throw std::runtime_error(std::string("MapParametersConfig: '") + section + "." + key +
                                     "' has the wrong type: " + e.what());
        }
    }

    json Section(const json& root, const char* name)
    {
        const json s = root.value(name, json::object());
        if (!s.is_object())
            throw std::runtime_error(std::string("MapParametersConfig: section '") + name + "' must be an object");
        return s;
    }

    // [ {"min": a, "max": b}, ... ] or a single {"min": a, "max": b}
    std::vector<ValueRange> RangesFrom(const json& j, const std::string& where)
    {
        std::vector<ValueRange> out;
        if (j.is_null())
            return out;
        const json list = j.is_array() ? j : json::array({ j });
        for (const json& r : list)
        {
            if (!r.is_object())
                throw std::runtime_error("MapParametersConfig: " + where + " entries must be {min, max} objects");
            ValueRange v;
            v.min = GetOr<float>(r, where.c_str(), "min", kAnyLow);
            v.max = GetOr<float>(r, where.c_str(), "max", kAnyHigh);
            out.push_back(v);
        }
        return out;
    }

    json RangesTo(const std::vector<ValueRange>& ranges)
    {
        json out = json::array();
        for (const auto& r : ranges)
            out.push_back({ {"min", r.min}, {"max", r.max} });
        return out;
    }

    TileType MakeType(std::string name, ValueRange elev, ValueRange temp, ValueRange precip, std::string asset)
    {
        TileType t;
        t.name = std::move(name);
        t.elevation = { elev };
        t.temperature = { temp };
        t.precipitation = { precip };
        t.assetKey = std::move(asset);
        return t;
    }
}

MapParameters MapParametersConfig::makeDefault()
{
    MapParameters p;
    const ValueRange anyTemp{ -273.15f, 100.0f };
    const ValueRange anyRain{ 0.0f, kAnyHigh };
    // Land starts above 0 m; sea level itself belongs to the ocean types.
    const ValueRange land{ std::nextafter(0.0f, 1.0f), 8848.0f };

    p.tileTypes = {
        MakeType("Ocean",            { kAnyLow, 0.0f }, { -10.0f, 100.0f }, anyRain, "tiles/ocean"),
        MakeType("Sea ice",          { kAnyLow, 0.0f }, { -273.15f, -10.0f }, anyRain, "tiles/sea_ice"),
        MakeType("Ice cap",          land, { -273.15f, -10.0f }, anyRain, "tiles/ice_cap"),
        MakeType("Tundra",           land, { -10.0f, 0.0f }, anyRain, "tiles/tundra"),
        MakeType("Desert",           land, { 0.0f, 100.0f }, { 0.0f, 250.0f }, "tiles/desert"),
        MakeType("Grassland",        land, { 0.0f, 100.0f }, { 250.0f, 750.0f }, "tiles/grassland"),
        MakeType("Temperate forest", land, { 0.0f, 20.0f }, { 750.0f, kAnyHigh }, "tiles/temperate_forest"),
        MakeType("Tropical forest",  land, { 20.0f, 100.0f }, { 750.0f, kAnyHigh }, "tiles/tropical_forest"),
        MakeType("Mountains",        { 3000.0f, 8848.0f }, anyTemp, anyRain, "tiles/mountains"),
    };
    return p;
}

MapParameters MapParametersConfig::fromJson(const json& root)
{
    if (!root.is_object())
        throw std::runtime_error("MapParametersConfig: document root must be an object");

    MapParameters p = makeDefault();

    // Map
    const json map = Section(root, "map");
    p.width         = GetOr<int>  (map, "map", "width",          p.width);
    p.height        = GetOr<int>  (map, "map", "height",         p.height);
    p.wrapX         = GetOr<bool> (map, "map", "wrap_x",         p.wrapX);
    p.wrapY         = GetOr<bool> (map, "map", "wrap_y",         p.wrapY);
    p.tileScaleKmX  = GetOr<float>(map, "map", "tile_scale_km_x", p.tileScaleKmX);
    p.tileScaleKmY  = GetOr<float>(map, "map", "tile_scale_km_y", p.tileScaleKmY);
    p.oceanFraction = GetOr<float>(map, "map", "ocean_fraction", p.oceanFraction);
    p.noiseScale    = GetOr<float>(map, "map", "noise_scale",    p.noiseScale);
    if (map.contains("seed") && !map.at("seed").is_null())
        p.seed = GetOr<std::uint64_t>(map, "map", "seed", 0);

    // Climate
    const json climate = Section(root, "climate");
    p.highPressureLatitude = GetOr<float>(climate, "climate", "high_pressure_latitude", p.highPressureLatitude);
    p.lowPressureLatitude  = GetOr<float>(climate, "climate", "low_pressure_latitude",  p.lowPressureLatitude);
    p.rotateWest           = GetOr<bool> (climate, "climate", "rotate_west",            p.rotateWest);
    p.equatorTemperature   = GetOr<float>(climate, "climate", "equator_temperature",    p.equatorTemperature);
    p.poleTemperature      = GetOr<float>(climate, "climate", "pole_temperature",       p.poleTemperature);
    p.temperatureLapseRate = GetOr<float>(climate, "climate", "temperature_lapse_rate", p.temperatureLapseRate);

    // Rainfall
    const json rain = Section(root, "rainfall");
    p.equatorRainfall               = GetOr<float>(rain, "rainfall", "equator",                    p.equatorRainfall);
    p.equatorRainfallEvenness       = GetOr<float>(rain, "rainfall", "equator_evenness",           p.equatorRainfallEvenness);
    p.midLatitudeRainfall           = GetOr<float>(rain, "rainfall", "mid_latitude",               p.midLatitudeRainfall);
    p.midLatitudeRainfallEvenness   = GetOr<float>(rain, "rainfall", "mid_latitude_evenness",      p.midLatitudeRainfallEvenness);
    p.rainfallOceanEFoldingDistance = GetOr<float>(rain, "rainfall", "ocean_e_folding_distance_km", p.rainfallOceanEFoldingDistance);

    // Orographic
    const json oro = Section(root, "orographic");
    p.condensationRateMultiplier = GetOr<float>(oro, "orographic", "condensation_rate_multiplier",  p.condensationRateMultiplier);
    p.saturationPressureConst1   = GetOr<float>(oro, "orographic", "saturation_pressure_const1",    p.saturationPressureConst1);
    p.saturationPressureConst2   = GetOr<float>(oro, "orographic", "saturation_pressure_const2",    p.saturationPressureConst2);
    p.moistureScaleHeightDivisor = GetOr<float>(oro, "orographic", "moisture_scale_height_divisor", p.moistureScaleHeightDivisor);

    // Rivers
    const json rivers = Section(root, "rivers");
    p.riverRainfallMultiplier = GetOr<float>(rivers, "rivers", "rainfall_multiplier", p.riverRainfallMultiplier);
    p.riverSlopeMultiplier    = GetOr<float>(rivers, "rivers", "slope_multiplier",    p.riverSlopeMultiplier);

    // Tile types replace the built-in set when present.
    if (root.contains("tile_types"))
    {
        const json& types = root.at("tile_types");
        if (!types.is_array())
            throw std::runtime_error("MapParametersConfig: 'tile_types' must be an array");
        p.tileTypes.clear();
        for (std::size_t i = 0; i < types.size(); ++i)
        {
            const json& t = types[i];
            const std::string where = "tile_types[" + std::to_string(i) + "]";
            if (!t.is_object())
                throw std::runtime_error("MapParametersConfig: " + where + " must be an object");
            TileType type;
            type.name          = GetOr<std::string>(t, where.c_str(), "name", where);
            type.assetKey      = GetOr<std::string>(t, where.c_str(), "asset", std::string{});
            type.elevation     = RangesFrom(t.value("elevation", json()),     where + ".elevation");
            type.temperature   = RangesFrom(t.value("temperature", json()),   where + ".temperature");
            type.precipitation = RangesFrom(t.value("precipitation", json()), where + ".precipitation");
            p.tileTypes.push_back(std::move(type));
        }
    }
    return p;
}

json MapParametersConfig::toJson(const MapParameters& p)
{
    json root;
    root["map"] = {
        {"width", p.width}, {"height", p.height},
        {"wrap_x", p.wrapX}, {"wrap_y", p.wrapY},
        {"tile_scale_km_x", p.tileScaleKmX}, {"tile_scale_km_y", p.tileScaleKmY},
        {"ocean_fraction", p.oceanFraction}, {"noise_scale", p.noiseScale},
        {"seed", p.seed ? json(*p.seed) : json(nullptr)},
    };
    root["climate"] = {
        {"high_pressure_latitude", p.highPressureLatitude},
        {"low_pressure_latitude", p.lowPressureLatitude},
        {"rotate_west", p.rotateWest},
        {"equator_temperature", p.equatorTemperature},
        {"pole_temperature", p.poleTemperature},
        {"temperature_lapse_rate", p.temperatureLapseRate},
    };
    root["rainfall"] = {
        {"equator", p.equatorRainfall},
        {"equator_evenness", p.equatorRainfallEvenness},
        {"mid_latitude", p.midLatitudeRainfall},
        {"mid_latitude_evenness", p.midLatitudeRainfallEvenness},
        {"ocean_e_folding_distance_km", p.rainfallOceanEFoldingDistance},
    };
    root["orographic"] = {
        {"condensation_rate_multiplier", p.condensationRateMultiplier},
        {"saturation_pressure_const1", p.saturationPressureConst1},
        {"saturation_pressure_const2", p.saturationPressureConst2},
        {"moisture_scale_height_divisor", p.moistureScaleHeightDivisor},
    };
    root["rivers"] = {
        {"rainfall_multiplier", p.riverRainfallMultiplier},
        {"slope_multiplier", p.riverSlopeMultiplier},
    };

    json types = json::array();
    for (const auto& t : p.tileTypes)
    {
        types.push_back({
            {"name", t.name},
            {"asset", t.assetKey},
            {"elevation", RangesTo(t.elevation)},
            {"temperature", RangesTo(t.temperature)},
            {"precipitation", RangesTo(t.precipitation)},
        });
    }
    root["tile_types"] = std::move(types);
    return root;
}

MapParameters MapParametersConfig::load(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
        throw std::runtime_error("MapParametersConfig: could not open '" + path + "'");

    json root;
    try
    {
        f >> root;
    }
    catch (const json::parse_error& e)
    {
        throw std::runtime_error("MapParametersConfig: parse error in '" + path + "': " + e.what());
    }
    return fromJson(root);
}

bool MapParametersConfig::tryLoad(const std::string& path, MapParameters& out, std::string* error)
{
    try
    {
        out = load(path);
        return true;
    }
    catch (const std::runtime_error& e)
    {
        if (error)
            *error = e.what();
        return false;
    }
}

std::string MapParametersConfig::defaultPath()
{
    return "assets/config/worldmap.json";
}

} // namespace planetmap::config

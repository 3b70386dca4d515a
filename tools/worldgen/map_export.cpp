#include "map_export.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "config/MapParametersConfig.h"
#include "worldgen/Biomes.hpp"

using nlohmann::json;

namespace planetmap::tools {

ElevationRange elevation_range(const worldgen::GeneratedMap& m) {
    ElevationRange r{};
    bool first = true;
    for (const auto& t : m.tiles) {
        if (first) { r.min = r.max = t.elevation; first = false; continue; }
        r.min = std::min(r.min, t.elevation);
        r.max = std::max(r.max, t.elevation);
    }
    return r;
}

U16Raster elevation_raster(const worldgen::GeneratedMap& m, const ElevationRange& range) {
    std::vector<float> values;
    values.reserve(m.tiles.size());
    for (const auto& t : m.tiles) values.push_back(t.elevation);
    return normalize_u16(values, static_cast<uint32_t>(m.width()), static_cast<uint32_t>(m.height()),
                         range.min, range.max);
}

json meta_json(const worldgen::GeneratedMap& m, const ElevationRange& range) {
    size_t land = 0;
    for (const auto& t : m.tiles) if (t.isLand()) ++land;

    const auto& rep = m.report;
    return {
        {"version", 1},
        {"seed", m.seed},
        {"size", { {"width", m.width()}, {"height", m.height()} }},
        {"wrap", { {"x", m.params.wrapX}, {"y", m.params.wrapY} }},
        {"scales", { {"elevation", { {"min", range.min}, {"max", range.max} }} }},
        {"counts", {
            {"land", land},
            {"ocean", m.tiles.size() - land},
            {"river_corners", m.rivers.size()},
            {"river_sources", rep.rivers.sources},
            {"unmatched", rep.biomes.unmatched},
        }},
        {"calibration", {
            {"ocean_rank", rep.calibration.oceanRank},
            {"sea_level_raw", rep.calibration.seaLevelRaw},
            {"scale", rep.calibration.scale},
        }},
        {"parameters", config::MapParametersConfig::toJson(m.params)},
    };
}

json tiles_json(const worldgen::GeneratedMap& m) {
    json tiles = json::array();
    for (int y = 0; y < m.height(); ++y) {
        for (int x = 0; x < m.width(); ++x) {
            const auto& t = m.tiles.at(x, y);
            tiles.push_back({
                {"x", x}, {"y", y},
                {"elevation", t.elevation},
                {"temperature", t.temperature},
                {"precipitation", t.precipitation},
                {"nearest_ocean", t.hasNearestOcean()
                    ? json::array({ t.nearestOcean.x, t.nearestOcean.y }) : json(nullptr)},
                {"type", t.hasType() ? json(worldgen::tileTypeName(t, m.params.tileTypes)) : json(nullptr)},
            });
        }
    }
    return { {"width", m.width()}, {"height", m.height()}, {"tiles", std::move(tiles)} };
}

json rivers_json(const worldgen::GeneratedMap& m) {
    json corners = json::array();
    for (const auto& c : m.rivers.corners()) {
        json positions = json::array();
        for (const auto& p : m.rivers.mirroredPositions(c.pos))
            positions.push_back({ p.x, p.y });
        corners.push_back({ {"x", c.pos.x}, {"y", c.pos.y}, {"mask", c.connections}, {"positions", positions} });
    }
    return {
        {"corner_width", m.rivers.cornerWidth()},
        {"corner_height", m.rivers.cornerHeight()},
        {"directions", { {"up", 1}, {"down", 2}, {"left", 4}, {"right", 8} }},
        {"corners", std::move(corners)},
    };
}

bool write_json(const std::string& path, const json& j) {
    std::ofstream os(path, std::ios::binary);
    if (!os) return false;
    os << j.dump(2) << '\n';
    return os.good();
}

} // namespace planetmap::tools

#pragma once
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "worldgen/MapParameters.hpp"

namespace planetmap::config {

// Loads/saves worldgen::MapParameters as JSON. Sections: "map", "climate",
// "rainfall", "orographic", "rivers" and the "tile_types" array. Keys that are
// absent keep their defaults; a key holding the wrong JSON type is an error.
struct MapParametersConfig
{
    // Throws std::runtime_error if the file cannot be read or parsed.
    static worldgen::MapParameters load(const std::string& path);

    // As load(), but reports failure through the return value (and *error).
    // `out` is untouched on failure.
    static bool tryLoad(const std::string& path, worldgen::MapParameters& out,
                        std::string* error = nullptr);

    // Overlays the keys present in `root` onto the defaults. Throws std::runtime_error.
    static worldgen::MapParameters fromJson(const nlohmann::json& root);
    static nlohmann::json toJson(const worldgen::MapParameters& p);

    // Defaults plus a built-in Earth-like set of tile types.
    static worldgen::MapParameters makeDefault();

    static std::string defaultPath();   // "assets/config/worldmap.json"
};

} // namespace planetmap::config

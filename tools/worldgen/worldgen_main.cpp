#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>

#include <spdlog/spdlog.h>

#include "config/MapParametersConfig.h"
#include "logging/Log.h"
#include "map_export.hpp"
#include "worldgen/Validation.hpp"
#include "worldgen/WorldGen.hpp"

using std::string;
namespace fs = std::filesystem;
using namespace planetmap;

// --- utilities ---------------------------------------------------------------

static bool ensure_dir(const fs::path& p) {
    std::error_code ec;
    if (p.empty() || fs::exists(p, ec)) return true;
    return fs::create_directories(p, ec);
}

static std::map<string, string> parse_kv(int argc, char** argv) {
    std::map<string,string> kv;
    for (int i=1;i<argc;++i) {
        string a = argv[i];
        auto eq = a.find('=');
        if (eq != string::npos) {
            kv[a.substr(0,eq)] = a.substr(eq+1);
        } else if (a.rfind("--",0)==0 && i+1<argc && string(argv[i+1]).rfind("--",0)!=0) {
            kv[a] = argv[++i];
        } else {
            kv[a] = "";
        }
    }
    return kv;
}

static void usage() {
    std::cerr <<
      "Usage:\n"
      "  planetmap_worldgen [--config <file.json>] [--seed <n>] [--width <w>] [--height <h>]\n"
      "                     [--out <dir>] [--log-level <trace|debug|info|warn|error>] [--log-file <path>]\n"
      "\n"
      "Writes elevation.r16, world.meta.json, tiles.json and rivers.json into --out (default: out).\n";
}

// Parameters from --config, else the default config file if present, else built-ins.
static worldgen::MapParameters load_params(const std::map<string,string>& kv) {
    auto log = logsys::get();
    if (kv.count("--config")) {
        const string path = kv.at("--config");
        log->info("Loading parameters from {}", path);
        return config::MapParametersConfig::load(path);
    }

    const string fallback = config::MapParametersConfig::defaultPath();
    worldgen::MapParameters p;
    string error;
    std::error_code ec;
    if (fs::exists(fallback, ec)) {
        if (config::MapParametersConfig::tryLoad(fallback, p, &error)) {
            log->info("Loading parameters from {}", fallback);
            return p;
        }
        log->warn("Ignoring {}: {}", fallback, error);
    }
    log->info("Using built-in parameters");
    return config::MapParametersConfig::makeDefault();
}

static int run(const std::map<string,string>& kv) {
    auto log = logsys::get();

    worldgen::MapParameters params = load_params(kv);
    if (kv.count("--seed"))   params.seed   = std::stoull(kv.at("--seed"));
    if (kv.count("--width"))  params.width  = std::stoi(kv.at("--width"));
    if (kv.count("--height")) params.height = std::stoi(kv.at("--height"));

    const worldgen::WorldGenerator gen(params);
    const worldgen::GeneratedMap map = gen.generate();

    const fs::path outDir = kv.count("--out") ? fs::path(kv.at("--out")) : fs::path("out");
    if (!ensure_dir(outDir)) {
        log->error("Could not create output directory {}", outDir.string());
        return 1;
    }

    const auto range = tools::elevation_range(map);
    bool ok = true;
    ok = tools::write_u16_raw((outDir / "elevation.r16").string(), tools::elevation_raster(map, range)) && ok;
    ok = tools::write_json((outDir / "world.meta.json").string(), tools::meta_json(map, range)) && ok;
    ok = tools::write_json((outDir / "tiles.json").string(), tools::tiles_json(map)) && ok;
    ok = tools::write_json((outDir / "rivers.json").string(), tools::rivers_json(map)) && ok;
    if (!ok) {
        log->error("Failed writing outputs to {}", outDir.string());
        return 1;
    }

    log->info("Wrote {}x{} map (seed {}) to {}", map.width(), map.height(), map.seed, outDir.string());
    return 0;
}

// --- entry -------------------------------------------------------------------

int main(int argc, char** argv) {
    auto kv = parse_kv(argc, argv);
    if (kv.count("--help") || kv.count("-h")) { usage(); return 0; }

    try {
        logsys::Options opts;
        if (kv.count("--log-level")) opts.level = spdlog::level::from_str(kv.at("--log-level"));
        if (kv.count("--log-file"))  opts.filePath = kv.at("--log-file");
        logsys::init(opts);

        return run(kv);
    } catch (const std::exception& e) {
        std::cerr << "planetmap_worldgen: " << e.what() << "\n";
        usage();
        return 1;
    }
}

// src/worldgen/WorldGen.cpp
#include "WorldGen.hpp"
#include "Validation.hpp"
#include "logging/Log.h"

#include <utility>
#include <cstdint>

namespace planetmap::worldgen {

// -------------------- WorldGenerator --------------------

WorldGenerator::WorldGenerator(MapParameters p) : params_(std::move(p)) {
    validateParameters(params_);

    // Default pipeline
    stages_.emplace_back(std::make_unique<ElevationStage>());
    stages_.emplace_back(std::make_unique<TemperatureStage>());
    stages_.emplace_back(std::make_unique<PrecipitationStage>());
    stages_.emplace_back(std::make_unique<RiverStage>());
    stages_.emplace_back(std::make_unique<BiomeStage>());
}

void WorldGenerator::clearStages() { stages_.clear(); }
void WorldGenerator::addStage(StagePtr stage) { stages_.emplace_back(std::move(stage)); }

void WorldGenerator::run_(GeneratedMap& map) const {
    auto log = logsys::get();
    checkPreconditions(map.params);

    for (const auto& w : collectWarnings(map.params))
        log->warn("{}: {}", w.field, w.message);

    log->info("Generating {}x{} map (wrapX={}, wrapY={}) with seed {}",
              map.params.width, map.params.height, map.params.wrapX, map.params.wrapY, map.seed);

    // One stream for the whole run; stages draw from it in pipeline order.
    Pcg32 rng(map.seed, kWorldStream);
    StageContext ctx{ map, rng, *log };
    for (const auto& st : stages_) {
        log->debug("Stage {} ({})", st->name(), static_cast<std::uint32_t>(st->id()));
        st->generate(ctx);
    }
}

GeneratedMap WorldGenerator::generate() const {
    if (params_.seed)
        return generate(*params_.seed);

    const std::uint64_t seed = seedFromClock();
    logsys::get()->info("No seed given; using clock-derived seed {}", seed);
    return generate(seed);
}

GeneratedMap WorldGenerator::generate(std::uint64_t seed) const {
    GeneratedMap m{ params_, seed };
    m.params.seed = seed;
    run_(m);
    return m;
}

} // namespace planetmap::worldgen

#pragma once

#include <vector>
#include <memory>
#include <cstdint>

//  - WorldGenFwd: forward declarations + StagePtr
//  - StagesApi: StageId + IWorldGenStage interface
//  - StageContext / GeneratedMap: what stages read and write
#include "WorldGenFwd.hpp"
#include "StagesApi.hpp"
#include "StageContext.hpp"
#include "GeneratedMap.hpp"

namespace planetmap::worldgen {

class WorldGenerator {
public:
    // Parameters are validated (clamped) on construction.
    explicit WorldGenerator(MapParameters params);

    // Register/override stages (call before generating)
    void clearStages();
    void addStage(StagePtr stage); // appended in order
    [[nodiscard]] std::size_t stageCount() const noexcept { return stages_.size(); }

    // Uses params().seed, or a clock-derived seed when it is empty.
    // Throws std::invalid_argument if the parameters cannot produce a map.
    [[nodiscard]] GeneratedMap generate() const;

    // Same, with an explicit seed overriding params().seed.
    [[nodiscard]] GeneratedMap generate(std::uint64_t seed) const;

    [[nodiscard]] const MapParameters& params() const noexcept { return params_; }

private:
    void run_(GeneratedMap& map) const;

private:
    MapParameters params_;
    std::vector<StagePtr> stages_;
};

// ----- Default stages -----
// Registered by the constructor in this order; remove or replace as needed.

// Noise elevation calibrated to the ocean fraction. Draws the noise offsets.
class ElevationStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Elevation; }
    const char* name() const noexcept override { return "Elevation"; }
    void generate(StageContext& ctx) override;
};

class TemperatureStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Temperature; }
    const char* name() const noexcept override { return "Temperature"; }
    void generate(StageContext& ctx) override;
};

// Latitude baseline, then ocean-distance attenuation, then orographic lift.
class PrecipitationStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Precipitation; }
    const char* name() const noexcept override { return "Precipitation"; }
    void generate(StageContext& ctx) override;
};

// Draws one Bernoulli per eligible corner.
class RiverStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Rivers; }
    const char* name() const noexcept override { return "Rivers"; }
    void generate(StageContext& ctx) override;
};

// Draws only for tiles with more than one candidate type.
class BiomeStage final : public IWorldGenStage {
public:
    StageId id() const noexcept override { return StageId::Biome; }
    const char* name() const noexcept override { return "Biome"; }
    void generate(StageContext& ctx) override;
};

} // namespace planetmap::worldgen

// src/worldgen/StagesApi.hpp
#pragma once
#include <cstdint>
#include <memory>

namespace planetmap::worldgen {

// Keep this scoped enum stable; values appear in logs and tools.
enum class StageId : std::uint32_t {
    Elevation     = 1,
    Temperature   = 2,
    Precipitation = 3,
    Rivers        = 4,
    Biome         = 5
};

struct StageContext; // forward declare (definition in StageContext.hpp)

// Polymorphic interface for all worldgen stages.
struct IWorldGenStage {
    virtual ~IWorldGenStage() = default;

    virtual StageId     id()   const noexcept = 0;
    virtual const char* name() const noexcept = 0;
    virtual void        generate(StageContext& ctx) = 0;
};

// Owning pointer for stages.
using StagePtr = std::unique_ptr<IWorldGenStage>;

} // namespace planetmap::worldgen

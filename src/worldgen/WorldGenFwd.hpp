#pragma once
#include <memory>
namespace planetmap::worldgen {
    struct MapParameters;
    struct StageContext;       // defined in StageContext.hpp
    struct GeneratedMap;       // defined in GeneratedMap.hpp
    struct IWorldGenStage;     // defined in StagesApi.hpp
    class  RiverNetwork;
    using StagePtr = std::unique_ptr<IWorldGenStage>;
} // namespace planetmap::worldgen

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace planetmap::tools {

struct U16Raster {
    uint32_t width{};
    uint32_t height{};
    std::vector<uint16_t> pixels; // row-major, little-endian on disk
};

// Linear map of values in [lo, hi] onto [0, 65535]. lo == hi maps everything to 0.
U16Raster normalize_u16(const std::vector<float>& values, uint32_t width, uint32_t height,
                        float lo, float hi);

bool write_u16_raw(const std::string& path, const U16Raster& r);
bool read_u16_raw(const std::string& path, uint32_t width, uint32_t height, U16Raster& out);

} // namespace planetmap::tools

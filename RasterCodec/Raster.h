#pragma once

#include <cstdint>
#include <vector>

namespace RasterCodec
{
// Interleaved RGBA, one byte per channel, row-major, no padding
struct Raster
{
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    static constexpr unsigned channels = 4;

    size_t index( uint32_t x, uint32_t y ) const
    {
        return ( size_t( y ) * width + x ) * channels;
    }
};
}

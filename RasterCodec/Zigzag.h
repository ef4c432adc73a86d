#pragma once

#include <cstdint>
#include <array>

#include "RasterCodec/Blocks.h"

namespace RasterCodec
{
// ZigZag[k] is the natural (row-major) index of the k-th coefficient in scan order
constexpr std::array<uint8_t, 64> ZigZag =
{
    0, 1, 8, 16, 9, 2, 3, 10,
    17, 24, 32, 25, 18, 11, 4, 5,
    12, 19, 26, 33, 40, 48, 41, 34,
    27, 20, 13, 6, 7, 14, 21, 28,
    35, 42, 49, 56, 57, 50, 43, 36,
    29, 22, 15, 23, 30, 37, 44, 51,
    58, 59, 52, 45, 38, 31, 39, 46,
    53, 60, 61, 54, 47, 55, 62, 63
};

template<typename T>
std::array<T, 64> toZigzag( const std::array<T, 64> &natural )
{
    std::array<T, 64> result;
    for( size_t k = 0; k < 64; ++k )
        result[k] = natural[ZigZag[k]];
    return result;
}

template<typename T>
std::array<T, 64> fromZigzag( const std::array<T, 64> &zigzag )
{
    std::array<T, 64> result;
    for( size_t k = 0; k < 64; ++k )
        result[ZigZag[k]] = zigzag[k];
    return result;
}
}

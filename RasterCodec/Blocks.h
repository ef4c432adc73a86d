#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <array>

namespace RasterCodec
{
// 8x8 samples or coefficients, row-major, [0] is DC
using Block = std::array<double, 64>;

struct MCUGrid
{
    uint32_t blocksX = 0;
    uint32_t blocksY = 0;
    uint32_t paddedWidth = 0;
    uint32_t paddedHeight = 0;
    size_t totalBlocks = 0;
};

// ceil( w / 8 ) x ceil( h / 8 ) blocks
MCUGrid calculateMCUGrid( uint32_t width, uint32_t height );

// One channel of an interleaved buffer
// Samples past the image edge replicate the nearest edge sample, or take `fill`
// Throws RangeError for block coordinates outside the grid
Block extractBlock( const std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, unsigned channels, unsigned channel,
                    uint32_t blockX, uint32_t blockY, std::optional<double> fill = {} );

// Rounds and clamps to 0..255, samples past the image edge are dropped
void placeBlock( std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, unsigned channels, unsigned channel,
                 uint32_t blockX, uint32_t blockY, const Block &block );

// Blocks of every channel in row-major grid order
std::vector<std::vector<Block>> separateChannels( const std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, unsigned channels );
std::vector<uint8_t> combineChannels( const std::vector<std::vector<Block>> &channelBlocks, uint32_t width, uint32_t height, unsigned channels );

// Single channel sample plane
struct Plane
{
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> samples;

    uint8_t at( int64_t x, int64_t y ) const; // Clamped to the edges
};

Plane extractPlane( const std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, unsigned channels, unsigned channel );

// Box average over factorX x factorY source samples, edges replicated
Plane downsample( const Plane &plane, unsigned factorX, unsigned factorY );

// Bilinear resampling of a subsampled plane onto a width x height grid, ratios are component / maximum sampling factor
std::vector<uint8_t> upsample( const Plane &plane, uint32_t width, uint32_t height, double ratioX, double ratioY );
}

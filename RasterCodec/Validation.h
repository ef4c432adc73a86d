#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace RasterCodec
{
constexpr uint64_t maxPngDimension = 0x7FFFFFFFu;
constexpr uint64_t maxJpegDimension = 0xFFFFu;

// Throws InvalidDimensionsError unless 1 <= width, height <= limit
void validateDimensions( uint64_t width, uint64_t height, uint64_t limit );

// Throws PixelDataSizeError unless size == width * height * channels
void validatePixelBuffer( size_t size, uint64_t width, uint64_t height, unsigned channels );

inline void validatePixelBuffer( const std::vector<uint8_t> &pixels, uint64_t width, uint64_t height, unsigned channels )
{
    validatePixelBuffer( pixels.size(), width, height, channels );
}

// False when the product does not fit in 64 bits
bool multiplyChecked( uint64_t a, uint64_t b, uint64_t &product );

// Throws InvalidQualityError unless 1 <= quality <= 100
void validateQuality( int quality );
}

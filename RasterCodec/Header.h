#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace RasterCodec
{
enum class ColorType : uint8_t
{
    Grayscale = 0,
    Truecolor = 2,
    Indexed = 3,
    GrayscaleAlpha = 4,
    TruecolorAlpha = 6
};

// Decoded IHDR payload
struct Ihdr
{
    uint32_t width = 0;
    uint32_t height = 0;
    uint8_t bitDepth = 8;
    ColorType colorType = ColorType::TruecolorAlpha;
    uint8_t compressionMethod = 0;
    uint8_t filterMethod = 0;
    uint8_t interlaceMethod = 0; // 1 for Adam7

    unsigned channels() const;
    unsigned bitsPerPixel() const;

    // Filter distance, at least one
    unsigned bytesPerPixel() const;

    // Without the filter type byte
    size_t scanlineBytes( uint32_t columns ) const;

    // Filtered stream size, including filter bytes of every (non-empty) pass
    // Throws InvalidHeaderError when it cannot be addressed
    size_t expectedDataSize() const;

    bool interlaced() const
    {
        return interlaceMethod == 1;
    }
};

unsigned channelsFor( ColorType colorType );
bool isValidColorType( unsigned value );
bool isValidBitDepth( ColorType colorType, unsigned bitDepth );

// Throws InvalidHeaderError naming the field
Ihdr decodeIhdr( const std::vector<uint8_t> &data );
void validateIhdr( const Ihdr &ihdr );

// Exactly 13 bytes
std::vector<uint8_t> encodeIhdr( const Ihdr &ihdr );
}

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <array>

#include "RasterCodec/Header.h"

namespace RasterCodec
{
using PaletteEntry = std::array<uint8_t, 3>;
using Palette = std::vector<PaletteEntry>;

// Scales a sample of the given depth to 8 bits, 16-bit samples are truncated
uint8_t expandSample( unsigned value, unsigned bitDepth );

// Inverse of expandSample for depths up to 8, round( v * max / 255 )
unsigned quantizeSample( uint8_t value, unsigned bitDepth );

// MSB-first samples of `rows` lines, every line starts on a byte boundary
std::vector<uint16_t> unpackSamples( const std::vector<uint8_t> &raw, uint32_t columns, uint32_t rows, unsigned channels, unsigned bitDepth );
std::vector<uint8_t> packSamples( const std::vector<uint16_t> &samples, uint32_t columns, uint32_t rows, unsigned channels, unsigned bitDepth );

// PLTE payload, 1..256 entries
Palette decodePalette( const std::vector<uint8_t> &data );
std::vector<uint8_t> encodePalette( const Palette &palette );

struct Transparency
{
    // Raw sample values, gray keys use the first element only
    std::optional<std::array<uint16_t, 3>> key;

    // Alpha per palette index, missing entries are opaque
    std::vector<uint8_t> paletteAlpha;
};

// Throws StructuralError for color types with an alpha channel
Transparency decodeTransparency( const std::vector<uint8_t> &data, ColorType colorType, size_t paletteSize );

// RGBA from raw samples, alpha of indexed pixels comes from `paletteAlpha`
std::vector<uint8_t> samplesToRgba( const std::vector<uint16_t> &samples, uint32_t width, uint32_t height, ColorType colorType, unsigned bitDepth,
                                    const Palette &palette = {}, const std::vector<uint8_t> &paletteAlpha = {} );

// Zeroes the alpha of every pixel whose raw samples equal `key`
void applyTransparency( std::vector<uint8_t> &rgba, const std::vector<uint16_t> &samples, ColorType colorType, const std::array<uint16_t, 3> &key );

struct EncodedSamples
{
    std::vector<uint16_t> samples;
    Palette palette;
    std::vector<uint8_t> paletteAlpha; // Trailing opaque entries trimmed
};

// Converts RGBA to samples of the target format
// Indexed output builds the palette in first-seen order, RangeError if it doesn't fit the depth
EncodedSamples rgbaToSamples( const std::vector<uint8_t> &rgba, uint32_t width, uint32_t height, ColorType colorType, unsigned bitDepth );

// round( 0.299 R + 0.587 G + 0.114 B )
uint8_t luminance( uint8_t r, uint8_t g, uint8_t b );

struct PixelAnalysis
{
    bool hasTransparency = false;
    bool isGrayscale = true;
    size_t uniqueColors = 0; // Stops counting at the cap
};

PixelAnalysis analyzePixels( const std::vector<uint8_t> &rgba, uint32_t width, uint32_t height, size_t uniqueColorCap = 257 );
}

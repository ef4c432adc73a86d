#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "RasterCodec/Raster.h"
#include "RasterCodec/Header.h"
#include "RasterCodec/Chunk.h"
#include "RasterCodec/Filter.h"
#include "RasterCodec/Metadata.h"
#include "RasterCodec/Zlib.h"

// https://www.w3.org/TR/png/

namespace RasterCodec
{
struct PngDecodeOptions
{
    ParseOptions parse;
    bool metadata = true;
};

struct PngEncodeOptions
{
    int compressionLevel = defaultCompressionLevel; // 0..9
    bool interlace = false;
    std::optional<FilterType> filter; // Adaptive per scanline when empty
    size_t maxChunkSize = 65536;      // IDAT payload limit
    PngMetadata metadata;
};

struct PngImage : Raster
{
    Ihdr header;
    PngMetadata metadata;
};

// RGBA pixels and the format to store them in
struct PngInput
{
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;
    ColorType colorType = ColorType::TruecolorAlpha;
    unsigned bitDepth = 8;
};

PngImage decodePNG( const uint8_t *data, size_t size, const PngDecodeOptions &options = {} );

inline PngImage decodePNG( const std::vector<uint8_t> &data, const PngDecodeOptions &options = {} )
{
    return decodePNG( data.data(), data.size(), options );
}

std::vector<uint8_t> encodePNG( const PngInput &input, const PngEncodeOptions &options = {} );

// Throws InvalidOptionError for out of range settings
void validateOptions( const PngEncodeOptions &options );
}

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "RasterCodec/Raster.h"
#include "RasterCodec/ColorSpace.h"
#include "RasterCodec/Jfif.h"
#include "RasterCodec/Exif.h"

// https://en.wikipedia.org/wiki/JPEG
// https://docs.fileformat.com/image/jpeg/

namespace RasterCodec
{
// JPG pipeline:
// (File) segments <-> Huffman-code <-> quantization <-> DCT <-> scaling <-> color space conversion (Pixels)

enum class JpegColorSpace
{
    YCbCr,
    Grayscale
};

// Luma sampling relative to chroma
enum class ChromaSubsampling
{
    S444, // 1x1
    S422, // 2x1
    S420  // 2x2
};

struct JpegEncodeOptions
{
    int quality = 75; // 1..100
    JpegColorSpace colorSpace = JpegColorSpace::YCbCr;
    ChromaSubsampling subsampling = ChromaSubsampling::S420;
    uint16_t restartInterval = 0; // MCUs between RSTn markers, 0 disables
    bool optimizeHuffman = false;

    JfifInfo jfif;
    bool writeJfif = true;

    std::vector<uint8_t> exif; // TIFF structure, stored after "Exif\0\0"
    std::vector<uint8_t> icc;  // Opaque profile, split across APP2 segments
    std::string comment;

    ColorConversionOptions color;
};

// Color interpretation of the decoded components
enum class JpegColorModel
{
    Grayscale,
    YCbCr,
    RGB,
    CMYK,
    YCCK
};

struct JpegComponentInfo
{
    uint8_t id = 0;
    uint8_t horizontal = 1;
    uint8_t vertical = 1;
    uint8_t quantTable = 0;
};

struct JpegMetadata
{
    uint8_t frameMarker = 0xC0;
    bool progressive = false;
    unsigned precision = 8;
    std::vector<JpegComponentInfo> components;
    std::optional<JpegColorModel> colorModel; // Empty for unsupported component counts

    std::optional<JfifInfo> jfif;
    std::optional<ExifData> exif;
    std::optional<std::vector<uint8_t>> icc;
    std::optional<std::string> comment;
    std::optional<uint8_t> adobeTransform;

    uint16_t restartInterval = 0;
    std::optional<int> estimatedQuality; // From the first component's table
};

struct JpegImage : Raster
{
    JpegMetadata metadata;
};

// Frame description without entropy decoding
struct JpegInfo
{
    uint32_t width = 0;
    uint32_t height = 0;
    std::string codingProcess;
    JpegMetadata metadata;
};

// RGBA input, alpha is dropped
std::vector<uint8_t> encodeJPEGPixels( const std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, const JpegEncodeOptions &options = {} );

// Baseline and extended sequential Huffman frames with 8-bit precision
// Other coding processes throw StructuralError
JpegImage decodeJPEG( const uint8_t *data, size_t size, const ColorConversionOptions &color = {} );

inline JpegImage decodeJPEG( const std::vector<uint8_t> &data, const ColorConversionOptions &color = {} )
{
    return decodeJPEG( data.data(), data.size(), color );
}

// Works for any frame type, including progressive
JpegInfo readJPEGInfo( const uint8_t *data, size_t size );

inline JpegInfo readJPEGInfo( const std::vector<uint8_t> &data )
{
    return readJPEGInfo( data.data(), data.size() );
}

// Throws RangeError subclasses for out of range settings
void validateOptions( const JpegEncodeOptions &options );
}

#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace RasterCodec
{
// APP0 "JFIF\0" payload
struct JfifInfo
{
    uint8_t versionMajor = 1;
    uint8_t versionMinor = 1;
    uint8_t units = 1; // 0 aspect ratio only, 1 per inch, 2 per centimeter
    uint16_t xDensity = 72;
    uint16_t yDensity = 72;
    uint8_t thumbnailWidth = 0;
    uint8_t thumbnailHeight = 0;
};

// `body` starts at the identifier, throws MetadataError when malformed
JfifInfo parseJfif( const uint8_t *body, size_t size );
JfifInfo parseJfif( const std::vector<uint8_t> &body );

// Segment body without thumbnail, InvalidOptionError for units above 2 or zero densities
std::vector<uint8_t> encodeJfif( const JfifInfo &info );

// Horizontal and vertical DPI, none for units 0
std::optional<std::pair<double, double>> jfifDpi( const JfifInfo &info );
}

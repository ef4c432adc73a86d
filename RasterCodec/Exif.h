#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <map>

// https://www.cipa.jp/std/documents/e/DC-008-2012_E.pdf

namespace RasterCodec
{
enum class ExifType : uint16_t
{
    Byte = 1,
    Ascii = 2,
    Short = 3,
    Long = 4,
    Rational = 5,
    SLong = 9,
    SRational = 10
};

enum class ExifDirectory
{
    Image, // IFD0
    Exif,
    Gps
};

struct ExifEntry
{
    uint16_t tag = 0;
    ExifType type = ExifType::Byte;
    ExifDirectory directory = ExifDirectory::Image;

    std::string text; // Ascii
    std::vector<double> values; // Numeric types, rationals divided out
};

struct ExifData
{
    bool littleEndian = true;

    // Known tags by name
    std::map<std::string, ExifEntry> tags;

    std::optional<std::string> text( const std::string &name ) const;

    // First value
    std::optional<double> number( const std::string &name ) const;
};

// Null for tags outside the known set
const char *exifTagName( ExifDirectory directory, uint16_t tag );

// TIFF structure after "Exif\0\0"
// Throws MetadataError for a bad header or IFD0 outside the data, skips entries it cannot read
ExifData parseExif( const uint8_t *data, size_t size );
ExifData parseExif( const std::vector<uint8_t> &data );
}

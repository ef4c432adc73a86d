#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <array>

#include "RasterCodec/Header.h"
#include "RasterCodec/Chunk.h"

// Ancillary PNG chunks, https://www.w3.org/TR/png/#11Ancillary-chunks

namespace RasterCodec
{
enum class TextKind
{
    Text,          // tEXt, Latin-1
    Compressed,    // zTXt, Latin-1
    International  // iTXt, UTF-8
};

struct TextEntry
{
    std::string keyword;
    std::string text;
    std::string language;
    std::string translatedKeyword;
    TextKind kind = TextKind::Text;
    bool compressed = false; // iTXt only
};

struct PngTime
{
    unsigned year = 0;
    unsigned month = 1;
    unsigned day = 1;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
};

struct PhysicalDimensions
{
    uint32_t pixelsPerUnitX = 0;
    uint32_t pixelsPerUnitY = 0;
    uint8_t unit = 0; // 1 for meters

    // Filled by the decoder when the unit is meters
    std::optional<uint32_t> dpiX, dpiY;
};

struct Chromaticities
{
    double whiteX = 0, whiteY = 0;
    double redX = 0, redY = 0;
    double greenX = 0, greenY = 0;
    double blueX = 0, blueY = 0;
};

struct IccProfile
{
    std::string name;
    std::vector<uint8_t> profile; // Uncompressed
};

// One of the members is set depending on the color type
struct Background
{
    std::optional<uint8_t> index;
    std::optional<uint16_t> gray;
    std::optional<std::array<uint16_t, 3>> rgb;
};

struct PngMetadata
{
    std::vector<TextEntry> texts;
    std::optional<PngTime> time;
    std::optional<PhysicalDimensions> physical;
    std::optional<std::vector<uint8_t>> significantBits;
    std::optional<double> gamma;
    std::optional<Chromaticities> chromaticities;
    std::optional<uint8_t> srgbIntent;
    std::optional<IccProfile> iccProfile;
    std::optional<Background> background;

    bool empty() const;
};

// 1..79 printable Latin-1 characters, no leading, trailing or consecutive spaces
bool isValidKeyword( const std::string &keyword );
void validateKeyword( const std::string &keyword );

Chunk encodeText( const std::string &keyword, const std::string &text );
Chunk encodeCompressedText( const std::string &keyword, const std::string &text );
Chunk encodeInternationalText( const std::string &keyword, const std::string &text, const std::string &language = {},
                               const std::string &translatedKeyword = {}, bool compressed = false );
Chunk encodeTime( const PngTime &time );
Chunk encodePhysicalDimensions( uint32_t pixelsPerUnitX, uint32_t pixelsPerUnitY, uint8_t unit );
Chunk encodeGamma( double gamma );
Chunk encodeSrgb( unsigned renderingIntent );
Chunk encodeSignificantBits( const std::vector<uint8_t> &bits, ColorType colorType, unsigned bitDepth );
Chunk encodeChromaticities( const Chromaticities &chromaticities );
Chunk encodeIccProfile( const std::string &name, const std::vector<uint8_t> &profile );
Chunk encodeBackground( const Background &background, ColorType colorType, unsigned bitDepth );

// Chunks for every present field, ordered so that those required before PLTE come first
// A field failing validation is logged and left out
std::vector<Chunk> encodeMetadataChunks( const PngMetadata &metadata, ColorType colorType, unsigned bitDepth );

// iCCP, sRGB, gAMA, cHRM and sBIT
bool precedesPalette( const std::string &type );

// Malformed or invalid chunks are logged and skipped
PngMetadata extractMetadata( const std::vector<Chunk> &chunks, const Ihdr &ihdr );

// Pixels per meter to dots per inch
uint32_t metersToDpi( uint32_t pixelsPerMeter );
}

#include "RasterCodec/Metadata.h"

#include <functional>
#include <string>

#include "RasterCodec/Errors.h"
#include "RasterCodec/Zlib.h"
#include "BitIO.h"
#include "Log.h"

namespace RasterCodec
{
bool PngMetadata::empty() const
{
    return texts.empty() && !time && !physical && !significantBits && !gamma && !chromaticities && !srgbIntent && !iccProfile && !background;
}

bool isValidKeyword( const std::string &keyword )
{
    if( keyword.empty() || keyword.size() > 79 )
        return false;
    if( keyword.front() == ' ' || keyword.back() == ' ' )
        return false;

    for( size_t i = 0; i < keyword.size(); ++i )
    {
        auto c = uint8_t( keyword[i] );
        if( !( ( 32 <= c && c <= 126 ) || c >= 161 ) )
            return false;
        if( c == ' ' && i > 0 && keyword[i - 1] == ' ' )
            return false;
    }
    return true;
}

void validateKeyword( const std::string &keyword )
{
    if( !isValidKeyword( keyword ) )
    {
        throw InvalidKeywordError( "keyword must be 1-79 printable Latin-1 characters without leading, trailing or consecutive spaces",
                                   atField( "keyword" ) );
    }
}

static void append( std::vector<uint8_t> &data, const std::string &text, bool terminate )
{
    data.insert( data.end(), text.begin(), text.end() );
    if( terminate )
        data.push_back( 0 );
}

static void appendFixed( std::vector<uint8_t> &data, double value, const char *field )
{
    double scaled = Round( value * 100000 );
    if( !( scaled >= 0 && scaled <= 4294967295.0 ) )
        throw InvalidMetadataError( std::string( field ) + " is out of range", atField( field ) );
    appendBe32( data, uint32_t( scaled ) );
}

Chunk encodeText( const std::string &keyword, const std::string &text )
{
    validateKeyword( keyword );
    if( text.find( '\0' ) != std::string::npos )
        throw InvalidMetadataError( "tEXt text cannot contain NUL", atChunk( "tEXt" ) );

    std::vector<uint8_t> data;
    append( data, keyword, true );
    append( data, text, false );
    return Chunk( "tEXt", std::move( data ) );
}

Chunk encodeCompressedText( const std::string &keyword, const std::string &text )
{
    validateKeyword( keyword );

    std::vector<uint8_t> data;
    append( data, keyword, true );
    data.push_back( 0 ); // Compression method

    auto compressed = zlibCompress( ( const uint8_t * )text.data(), text.size() );
    data.insert( data.end(), compressed.begin(), compressed.end() );
    return Chunk( "zTXt", std::move( data ) );
}

Chunk encodeInternationalText( const std::string &keyword, const std::string &text, const std::string &language,
                               const std::string &translatedKeyword, bool compressed )
{
    validateKeyword( keyword );
    if( language.find( '\0' ) != std::string::npos || translatedKeyword.find( '\0' ) != std::string::npos )
        throw InvalidMetadataError( "iTXt language and translated keyword cannot contain NUL", atChunk( "iTXt" ) );

    std::vector<uint8_t> data;
    append( data, keyword, true );
    data.push_back( compressed ? 1 : 0 );
    data.push_back( 0 );
    append( data, language, true );
    append( data, translatedKeyword, true );

    if( compressed )
    {
        auto packed = zlibCompress( ( const uint8_t * )text.data(), text.size() );
        data.insert( data.end(), packed.begin(), packed.end() );
    }
    else
    {
        append( data, text, false );
    }
    return Chunk( "iTXt", std::move( data ) );
}

Chunk encodeTime( const PngTime &time )
{
    auto check = [&]( unsigned value, unsigned low, unsigned high, const char *field )
    {
        if( value < low || value > high )
        {
            throw InvalidMetadataError( std::string( field ) + " must be in " + std::to_string( low ) + ".." + std::to_string( high ) +
                                        ", got " + std::to_string( value ), atField( field ) );
        }
    };

    check( time.year, 0, 65535, "year" );
    check( time.month, 1, 12, "month" );
    check( time.day, 1, 31, "day" );
    check( time.hour, 0, 23, "hour" );
    check( time.minute, 0, 59, "minute" );
    check( time.second, 0, 60, "second" );

    std::vector<uint8_t> data;
    appendBe16( data, uint16_t( time.year ) );
    data.push_back( uint8_t( time.month ) );
    data.push_back( uint8_t( time.day ) );
    data.push_back( uint8_t( time.hour ) );
    data.push_back( uint8_t( time.minute ) );
    data.push_back( uint8_t( time.second ) );
    return Chunk( "tIME", std::move( data ) );
}

Chunk encodePhysicalDimensions( uint32_t pixelsPerUnitX, uint32_t pixelsPerUnitY, uint8_t unit )
{
    if( unit > 1 )
        throw InvalidMetadataError( "unit must be 0 (unknown) or 1 (meters)", atField( "unit" ) );

    std::vector<uint8_t> data;
    appendBe32( data, pixelsPerUnitX );
    appendBe32( data, pixelsPerUnitY );
    data.push_back( unit );
    return Chunk( "pHYs", std::move( data ) );
}

Chunk encodeGamma( double gamma )
{
    if( !( gamma > 0 ) )
        throw InvalidMetadataError( "gamma must be positive", atField( "gamma" ) );

    std::vector<uint8_t> data;
    appendFixed( data, gamma, "gamma" );
    return Chunk( "gAMA", std::move( data ) );
}

Chunk encodeSrgb( unsigned renderingIntent )
{
    if( renderingIntent > 3 )
        throw InvalidMetadataError( "rendering intent must be in 0..3", atField( "srgbIntent" ) );
    return Chunk( "sRGB", { uint8_t( renderingIntent ) } );
}

Chunk encodeSignificantBits( const std::vector<uint8_t> &bits, ColorType colorType, unsigned bitDepth )
{
    size_t expected = 0;
    switch( colorType )
    {
    case ColorType::Grayscale:
        expected = 1;
        break;
    case ColorType::Truecolor:
    case ColorType::Indexed:
        expected = 3;
        break;
    case ColorType::GrayscaleAlpha:
        expected = 2;
        break;
    case ColorType::TruecolorAlpha:
        expected = 4;
        break;
    }

    if( bits.size() != expected )
    {
        throw InvalidMetadataError( "sBIT needs " + std::to_string( expected ) + " values for color type " +
                                    std::to_string( unsigned( colorType ) ), atField( "significantBits" ) );
    }

    unsigned limit = colorType == ColorType::Indexed ? 8 : bitDepth;
    for( auto b : bits )
    {
        if( b < 1 || b > limit )
            throw InvalidMetadataError( "significant bits must be in 1.." + std::to_string( limit ), atField( "significantBits" ) );
    }
    return Chunk( "sBIT", bits );
}

Chunk encodeChromaticities( const Chromaticities &c )
{
    std::vector<uint8_t> data;
    appendFixed( data, c.whiteX, "whiteX" );
    appendFixed( data, c.whiteY, "whiteY" );
    appendFixed( data, c.redX, "redX" );
    appendFixed( data, c.redY, "redY" );
    appendFixed( data, c.greenX, "greenX" );
    appendFixed( data, c.greenY, "greenY" );
    appendFixed( data, c.blueX, "blueX" );
    appendFixed( data, c.blueY, "blueY" );
    return Chunk( "cHRM", std::move( data ) );
}

Chunk encodeIccProfile( const std::string &name, const std::vector<uint8_t> &profile )
{
    validateKeyword( name );
    if( profile.empty() )
        throw InvalidMetadataError( "ICC profile is empty", atChunk( "iCCP" ) );

    std::vector<uint8_t> data;
    append( data, name, true );
    data.push_back( 0 );

    auto compressed = zlibCompress( profile );
    data.insert( data.end(), compressed.begin(), compressed.end() );
    return Chunk( "iCCP", std::move( data ) );
}

Chunk encodeBackground( const Background &background, ColorType colorType, unsigned bitDepth )
{
    std::vector<uint8_t> data;
    uint32_t limit = bitDepth >= 16 ? 0xFFFF : ( 1u << bitDepth ) - 1;

    switch( colorType )
    {
    case ColorType::Indexed:
        if( !background.index )
            throw InvalidMetadataError( "bKGD for indexed images needs a palette index", atField( "background" ) );
        data.push_back( *background.index );
        break;
    case ColorType::Grayscale:
    case ColorType::GrayscaleAlpha:
        if( !background.gray || *background.gray > limit )
            throw InvalidMetadataError( "bKGD for grayscale images needs a gray level within the bit depth", atField( "background" ) );
        appendBe16( data, *background.gray );
        break;
    case ColorType::Truecolor:
    case ColorType::TruecolorAlpha:
        if( !background.rgb )
            throw InvalidMetadataError( "bKGD for truecolor images needs an RGB triple", atField( "background" ) );
        for( auto v : *background.rgb )
        {
            if( v > limit )
                throw InvalidMetadataError( "bKGD sample exceeds the bit depth", atField( "background" ) );
            appendBe16( data, v );
        }
        break;
    }
    return Chunk( "bKGD", std::move( data ) );
}

bool precedesPalette( const std::string &type )
{
    return type == "iCCP" || type == "sRGB" || type == "gAMA" || type == "cHRM" || type == "sBIT";
}

std::vector<Chunk> encodeMetadataChunks( const PngMetadata &metadata, ColorType colorType, unsigned bitDepth )
{
    std::vector<Chunk> chunks;

    auto add = [&]( const char *field, const std::function<Chunk()> &encode )
    {
        try
        {
            chunks.push_back( encode() );
        }
        catch( const MetadataError &e )
        {
            Log::warning( std::string( "skipping metadata field " ) + field + ": " + e.text(), "png" );
        }
    };

    if( metadata.iccProfile )
        add( "iccProfile", [&] { return encodeIccProfile( metadata.iccProfile->name, metadata.iccProfile->profile ); } );
    if( metadata.srgbIntent )
        add( "srgbIntent", [&] { return encodeSrgb( *metadata.srgbIntent ); } );
    if( metadata.gamma )
        add( "gamma", [&] { return encodeGamma( *metadata.gamma ); } );
    if( metadata.chromaticities )
        add( "chromaticities", [&] { return encodeChromaticities( *metadata.chromaticities ); } );
    if( metadata.significantBits )
        add( "significantBits", [&] { return encodeSignificantBits( *metadata.significantBits, colorType, bitDepth ); } );

    if( metadata.background )
        add( "background", [&] { return encodeBackground( *metadata.background, colorType, bitDepth ); } );
    if( metadata.physical )
    {
        auto &p = *metadata.physical;
        add( "physical", [&] { return encodePhysicalDimensions( p.pixelsPerUnitX, p.pixelsPerUnitY, p.unit ); } );
    }
    if( metadata.time )
        add( "time", [&] { return encodeTime( *metadata.time ); } );

    for( auto &entry : metadata.texts )
    {
        add( "texts", [&]
        {
            switch( entry.kind )
            {
            case TextKind::Text:
                return encodeText( entry.keyword, entry.text );
            case TextKind::Compressed:
                return encodeCompressedText( entry.keyword, entry.text );
            case TextKind::International:
                return encodeInternationalText( entry.keyword, entry.text, entry.language, entry.translatedKeyword, entry.compressed );
            }
            throw InvalidMetadataError( "unknown text kind", atField( "texts" ) );
        } );
    }
    return chunks;
}

uint32_t metersToDpi( uint32_t pixelsPerMeter )
{
    return uint32_t( Round( pixelsPerMeter / 39.3701 ) );
}

// Latin-1 string up to the next NUL, `position` moves past the separator
static std::string readTerminated( const Chunk &chunk, size_t &position, const char *what )
{
    auto &data = chunk.data;
    size_t end = position;
    while( end < data.size() && data[end] != 0 )
        ++end;
    if( end == data.size() )
        throw InvalidMetadataError( std::string( what ) + " is not NUL-terminated", atChunk( chunk.type, chunk.offset ) );

    std::string result( data.begin() + position, data.begin() + end );
    position = end + 1;
    return result;
}

static std::string readRest( const Chunk &chunk, size_t position, bool compressed )
{
    if( !compressed )
        return std::string( chunk.data.begin() + position, chunk.data.end() );

    auto inflated = zlibDecompress( chunk.data.data() + position, chunk.data.size() - position );
    return std::string( inflated.begin(), inflated.end() );
}

static void requireSize( const Chunk &chunk, size_t size )
{
    if( chunk.data.size() != size )
    {
        throw InvalidMetadataError( chunk.type + " must be " + std::to_string( size ) + " bytes, got " +
                                    std::to_string( chunk.data.size() ), atChunk( chunk.type, chunk.offset ) );
    }
}

static void requireMethod( const Chunk &chunk, uint8_t method )
{
    if( method != 0 )
        throw InvalidMetadataError( "unknown compression method " + std::to_string( method ), atChunk( chunk.type, chunk.offset ) );
}

static void extractChunk( const Chunk &chunk, const Ihdr &ihdr, PngMetadata &metadata )
{
    auto &data = chunk.data;

    if( chunk.is( "tEXt" ) )
    {
        TextEntry entry;
        size_t position = 0;
        entry.keyword = readTerminated( chunk, position, "keyword" );
        validateKeyword( entry.keyword );
        entry.text = readRest( chunk, position, false );
        metadata.texts.push_back( std::move( entry ) );
    }
    else if( chunk.is( "zTXt" ) )
    {
        TextEntry entry;
        entry.kind = TextKind::Compressed;
        size_t position = 0;
        entry.keyword = readTerminated( chunk, position, "keyword" );
        validateKeyword( entry.keyword );
        if( position >= data.size() )
            throw InvalidMetadataError( "zTXt has no compression method", atChunk( chunk.type, chunk.offset ) );
        requireMethod( chunk, data[position++] );
        entry.text = readRest( chunk, position, true );
        metadata.texts.push_back( std::move( entry ) );
    }
    else if( chunk.is( "iTXt" ) )
    {
        TextEntry entry;
        entry.kind = TextKind::International;
        size_t position = 0;
        entry.keyword = readTerminated( chunk, position, "keyword" );
        validateKeyword( entry.keyword );
        if( position + 2 > data.size() )
            throw InvalidMetadataError( "iTXt has no compression fields", atChunk( chunk.type, chunk.offset ) );
        entry.compressed = data[position++] != 0;
        auto method = data[position++];
        if( entry.compressed )
            requireMethod( chunk, method );
        entry.language = readTerminated( chunk, position, "language tag" );
        entry.translatedKeyword = readTerminated( chunk, position, "translated keyword" );
        entry.text = readRest( chunk, position, entry.compressed );
        metadata.texts.push_back( std::move( entry ) );
    }
    else if( chunk.is( "tIME" ) )
    {
        requireSize( chunk, 7 );
        PngTime time;
        time.year = readBe16( data.data() );
        time.month = data[2];
        time.day = data[3];
        time.hour = data[4];
        time.minute = data[5];
        time.second = data[6];
        metadata.time = time;
    }
    else if( chunk.is( "pHYs" ) )
    {
        requireSize( chunk, 9 );
        PhysicalDimensions physical;
        physical.pixelsPerUnitX = readBe32( data.data() );
        physical.pixelsPerUnitY = readBe32( data.data() + 4 );
        physical.unit = data[8];
        if( physical.unit == 1 )
        {
            physical.dpiX = metersToDpi( physical.pixelsPerUnitX );
            physical.dpiY = metersToDpi( physical.pixelsPerUnitY );
        }
        metadata.physical = physical;
    }
    else if( chunk.is( "sBIT" ) )
    {
        if( data.empty() || data.size() > 4 )
            throw InvalidMetadataError( "sBIT must hold 1..4 bytes", atChunk( chunk.type, chunk.offset ) );
        metadata.significantBits = data;
    }
    else if( chunk.is( "gAMA" ) )
    {
        requireSize( chunk, 4 );
        metadata.gamma = readBe32( data.data() ) / 100000.0;
    }
    else if( chunk.is( "cHRM" ) )
    {
        requireSize( chunk, 32 );
        auto at = [&]( unsigned i )
        {
            return readBe32( data.data() + 4 * i ) / 100000.0;
        };
        Chromaticities c;
        c.whiteX = at( 0 );
        c.whiteY = at( 1 );
        c.redX = at( 2 );
        c.redY = at( 3 );
        c.greenX = at( 4 );
        c.greenY = at( 5 );
        c.blueX = at( 6 );
        c.blueY = at( 7 );
        metadata.chromaticities = c;
    }
    else if( chunk.is( "sRGB" ) )
    {
        requireSize( chunk, 1 );
        metadata.srgbIntent = data[0];
    }
    else if( chunk.is( "iCCP" ) )
    {
        IccProfile icc;
        size_t position = 0;
        icc.name = readTerminated( chunk, position, "profile name" );
        if( position >= data.size() )
            throw InvalidMetadataError( "iCCP has no compression method", atChunk( chunk.type, chunk.offset ) );
        requireMethod( chunk, data[position++] );
        icc.profile = zlibDecompress( data.data() + position, data.size() - position );
        metadata.iccProfile = std::move( icc );
    }
    else if( chunk.is( "bKGD" ) )
    {
        Background background;
        switch( ihdr.colorType )
        {
        case ColorType::Indexed:
            requireSize( chunk, 1 );
            background.index = data[0];
            break;
        case ColorType::Grayscale:
        case ColorType::GrayscaleAlpha:
            requireSize( chunk, 2 );
            background.gray = readBe16( data.data() );
            break;
        case ColorType::Truecolor:
        case ColorType::TruecolorAlpha:
            requireSize( chunk, 6 );
            background.rgb = std::array<uint16_t, 3> { readBe16( data.data() ), readBe16( data.data() + 2 ), readBe16( data.data() + 4 ) };
            break;
        }
        metadata.background = background;
    }
}

PngMetadata extractMetadata( const std::vector<Chunk> &chunks, const Ihdr &ihdr )
{
    PngMetadata metadata;
    for( auto &chunk : chunks )
    {
        if( !chunk.valid )
            continue;

        try
        {
            extractChunk( chunk, ihdr, metadata );
        }
        catch( const CodecError &e )
        {
            Log::warning( "skipping " + chunk.type + " chunk at offset " + std::to_string( chunk.offset ) + ": " + e.text(), "png" );
        }
    }
    return metadata;
}
}

#include "RasterCodec/Header.h"

#include <limits>
#include <string>

#include "RasterCodec/Interlace.h"
#include "RasterCodec/Validation.h"
#include "RasterCodec/Errors.h"
#include "BitIO.h"

namespace RasterCodec
{
// Ensure structures are packed without padding
#pragma pack(push, 1)
struct IhdrData
{
    uint32_t width;            // Big-endian
    uint32_t height;           // Big-endian
    uint8_t bitDepth;
    uint8_t colorType;
    uint8_t compressionMethod; // Always 0
    uint8_t filterMethod;      // Always 0
    uint8_t interlaceMethod;   // 0 or 1
};
#pragma pack(pop)

static_assert( sizeof( IhdrData ) == 13 );

unsigned channelsFor( ColorType colorType )
{
    switch( colorType )
    {
    case ColorType::Grayscale:
        return 1;
    case ColorType::Truecolor:
        return 3;
    case ColorType::Indexed:
        return 1;
    case ColorType::GrayscaleAlpha:
        return 2;
    case ColorType::TruecolorAlpha:
        return 4;
    }
    throw InvalidHeaderError( "unknown color type", atField( "colorType" ) );
}

bool isValidColorType( unsigned value )
{
    return value == 0 || value == 2 || value == 3 || value == 4 || value == 6;
}

bool isValidBitDepth( ColorType colorType, unsigned bitDepth )
{
    switch( colorType )
    {
    case ColorType::Grayscale:
        return bitDepth == 1 || bitDepth == 2 || bitDepth == 4 || bitDepth == 8 || bitDepth == 16;
    case ColorType::Indexed:
        return bitDepth == 1 || bitDepth == 2 || bitDepth == 4 || bitDepth == 8;
    case ColorType::Truecolor:
    case ColorType::GrayscaleAlpha:
    case ColorType::TruecolorAlpha:
        return bitDepth == 8 || bitDepth == 16;
    }
    return false;
}

unsigned Ihdr::channels() const
{
    return channelsFor( colorType );
}

unsigned Ihdr::bitsPerPixel() const
{
    return channels() * bitDepth;
}

unsigned Ihdr::bytesPerPixel() const
{
    return Max( bitsPerPixel() / 8, 1u );
}

size_t Ihdr::scanlineBytes( uint32_t columns ) const
{
    return DivUp<uint64_t>( uint64_t( columns ) * bitsPerPixel(), 8 );
}

// Filter byte plus packed samples for each of `rows` lines, false on overflow
static bool addPassSize( const Ihdr &ihdr, uint32_t columns, uint32_t rows, uint64_t &total )
{
    uint64_t bytes = 0;
    if( !multiplyChecked( rows, 1 + uint64_t( ihdr.scanlineBytes( columns ) ), bytes ) )
        return false;
    if( bytes > std::numeric_limits<uint64_t>::max() - total )
        return false;
    total += bytes;
    return true;
}

size_t Ihdr::expectedDataSize() const
{
    uint64_t total = 0;
    bool fits = true;
    if( !interlaced() )
    {
        fits = addPassSize( *this, width, height, total );
    }
    else
    {
        for( unsigned pass = 0; fits && pass < 7; ++pass )
        {
            Adam7Size passSize( Adam7Step( pass ), width, height );
            if( !passSize.empty() )
                fits = addPassSize( *this, passSize.columns, passSize.rows, total );
        }
    }

    if( !fits || total > std::vector<uint8_t>().max_size() )
    {
        throw InvalidHeaderError( "image data for " + std::to_string( width ) + "x" + std::to_string( height ) + " at " +
                                  std::to_string( bitsPerPixel() ) + " bits per pixel exceeds the addressable size", atChunk( "IHDR" ) );
    }
    return size_t( total );
}

void validateIhdr( const Ihdr &ihdr )
{
    if( ihdr.width < 1 || ihdr.width > maxPngDimension )
        throw InvalidHeaderError( "width must be in 1..2^31-1, got " + std::to_string( ihdr.width ), atField( "width" ) );

    if( ihdr.height < 1 || ihdr.height > maxPngDimension )
        throw InvalidHeaderError( "height must be in 1..2^31-1, got " + std::to_string( ihdr.height ), atField( "height" ) );

    if( !isValidColorType( unsigned( ihdr.colorType ) ) )
        throw InvalidHeaderError( "colorType must be one of 0, 2, 3, 4, 6, got " + std::to_string( unsigned( ihdr.colorType ) ), atField( "colorType" ) );

    if( !isValidBitDepth( ihdr.colorType, ihdr.bitDepth ) )
    {
        throw InvalidHeaderError( "bitDepth " + std::to_string( ihdr.bitDepth ) + " is not allowed for colorType " +
                                  std::to_string( unsigned( ihdr.colorType ) ), atField( "bitDepth" ) );
    }

    if( ihdr.compressionMethod != 0 )
        throw InvalidHeaderError( "compressionMethod must be 0", atField( "compressionMethod" ) );

    if( ihdr.filterMethod != 0 )
        throw InvalidHeaderError( "filterMethod must be 0", atField( "filterMethod" ) );

    if( ihdr.interlaceMethod > 1 )
        throw InvalidHeaderError( "interlaceMethod must be 0 or 1", atField( "interlaceMethod" ) );
}

Ihdr decodeIhdr( const std::vector<uint8_t> &data )
{
    if( data.size() != sizeof( IhdrData ) )
        throw InvalidHeaderError( "IHDR must be 13 bytes, got " + std::to_string( data.size() ), atChunk( "IHDR" ) );

    IhdrData raw;
    copy( &raw, data.data(), sizeof( raw ) );

    if( !isValidColorType( raw.colorType ) )
        throw InvalidHeaderError( "colorType must be one of 0, 2, 3, 4, 6, got " + std::to_string( raw.colorType ), atField( "colorType" ) );

    Ihdr ihdr;
    ihdr.width = swapBe32( raw.width );
    ihdr.height = swapBe32( raw.height );
    ihdr.bitDepth = raw.bitDepth;
    ihdr.colorType = ColorType( raw.colorType );
    ihdr.compressionMethod = raw.compressionMethod;
    ihdr.filterMethod = raw.filterMethod;
    ihdr.interlaceMethod = raw.interlaceMethod;

    validateIhdr( ihdr );
    return ihdr;
}

std::vector<uint8_t> encodeIhdr( const Ihdr &ihdr )
{
    validateIhdr( ihdr );

    IhdrData raw;
    raw.width = swapBe32( ihdr.width );
    raw.height = swapBe32( ihdr.height );
    raw.bitDepth = ihdr.bitDepth;
    raw.colorType = uint8_t( ihdr.colorType );
    raw.compressionMethod = ihdr.compressionMethod;
    raw.filterMethod = ihdr.filterMethod;
    raw.interlaceMethod = ihdr.interlaceMethod;

    std::vector<uint8_t> result( sizeof( raw ) );
    copy( result.data(), &raw, sizeof( raw ) );
    return result;
}
}

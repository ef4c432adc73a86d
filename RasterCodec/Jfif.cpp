#include "RasterCodec/Jfif.h"

#include <string>

#include "RasterCodec/Errors.h"
#include "BitIO.h"

namespace RasterCodec
{
#pragma pack(push,1)
struct DataJFIF
{
    char identifier[5]; // "JFIF\0"
    uint8_t versionMajor;
    uint8_t versionMinor;
    uint8_t units;
    uint16_t xDensity; // Big-endian in file
    uint16_t yDensity; // Big-endian in file
    uint8_t xThumbnail;
    uint8_t yThumbnail;
};
#pragma pack(pop)

JfifInfo parseJfif( const uint8_t *body, size_t size )
{
    SimpleReader r( body, size );

    DataJFIF data;
    if( !r.read( sizeof( data ), &data ) )
        throw MetadataError( "JFIF segment holds " + std::to_string( size ) + " bytes", atField( "jfif" ) );

    if( !compare( data.identifier, "JFIF", sizeof( data.identifier ) ) )
        throw MetadataError( "missing JFIF identifier", atField( "jfif" ) );

    if( data.versionMajor != 1 )
        throw MetadataError( "unsupported JFIF version " + std::to_string( data.versionMajor ), atField( "jfif" ) );

    if( data.units > 2 )
        throw MetadataError( "unknown JFIF density unit " + std::to_string( data.units ), atField( "jfif" ) );

    // Uncompressed RGB thumbnail follows
    size_t thumbBytes = size_t( 3 ) * data.xThumbnail * data.yThumbnail;
    if( thumbBytes > r.remaining() )
        throw MetadataError( "JFIF thumbnail exceeds the segment", atField( "jfif" ) );

    JfifInfo info;
    info.versionMajor = data.versionMajor;
    info.versionMinor = data.versionMinor;
    info.units = data.units;
    info.xDensity = swapBe16( data.xDensity );
    info.yDensity = swapBe16( data.yDensity );
    info.thumbnailWidth = data.xThumbnail;
    info.thumbnailHeight = data.yThumbnail;
    return info;
}

JfifInfo parseJfif( const std::vector<uint8_t> &body )
{
    return parseJfif( body.data(), body.size() );
}

std::vector<uint8_t> encodeJfif( const JfifInfo &info )
{
    if( info.units > 2 )
        throw InvalidOptionError( "JFIF density unit must be 0, 1 or 2", atField( "jfif.units" ) );
    if( info.xDensity == 0 || info.yDensity == 0 )
        throw InvalidOptionError( "JFIF densities must be positive", atField( "jfif.density" ) );

    DataJFIF data;
    copy( data.identifier, "JFIF", sizeof( data.identifier ) );
    data.versionMajor = info.versionMajor;
    data.versionMinor = info.versionMinor;
    data.units = info.units;
    data.xDensity = swapBe16( info.xDensity );
    data.yDensity = swapBe16( info.yDensity );
    data.xThumbnail = 0;
    data.yThumbnail = 0;

    std::vector<uint8_t> body;
    VectorWriter w( body );
    w.write( sizeof( data ), &data );
    return body;
}

std::optional<std::pair<double, double>> jfifDpi( const JfifInfo &info )
{
    switch( info.units )
    {
    case 1:
        return std::make_pair( double( info.xDensity ), double( info.yDensity ) );
    case 2:
        return std::make_pair( info.xDensity * 2.54, info.yDensity * 2.54 );
    default:
        return std::nullopt;
    }
}
}

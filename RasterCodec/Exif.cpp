#include "RasterCodec/Exif.h"

#include "RasterCodec/Errors.h"
#include "BitIO.h"
#include "Log.h"

namespace RasterCodec
{
namespace
{
struct TagName
{
    ExifDirectory directory;
    uint16_t tag;
    const char *name;
};

const TagName knownTags[] =
{
    { ExifDirectory::Image, 0x010E, "ImageDescription" },
    { ExifDirectory::Image, 0x010F, "Make" },
    { ExifDirectory::Image, 0x0110, "Model" },
    { ExifDirectory::Image, 0x0112, "Orientation" },
    { ExifDirectory::Image, 0x0131, "Software" },
    { ExifDirectory::Image, 0x0132, "DateTime" },
    { ExifDirectory::Exif, 0x829A, "ExposureTime" },
    { ExifDirectory::Exif, 0x829D, "FNumber" },
    { ExifDirectory::Exif, 0x8827, "ISO" },
    { ExifDirectory::Exif, 0x9003, "DateTimeOriginal" },
    { ExifDirectory::Exif, 0x9004, "DateTimeDigitized" },
    { ExifDirectory::Exif, 0x9207, "MeteringMode" },
    { ExifDirectory::Exif, 0x9209, "Flash" },
    { ExifDirectory::Exif, 0x920A, "FocalLength" },
    { ExifDirectory::Gps, 0x0001, "GPSLatitudeRef" },
    { ExifDirectory::Gps, 0x0002, "GPSLatitude" },
    { ExifDirectory::Gps, 0x0003, "GPSLongitudeRef" },
    { ExifDirectory::Gps, 0x0004, "GPSLongitude" },
    { ExifDirectory::Gps, 0x0006, "GPSAltitude" }
};

constexpr uint16_t exifPointerTag = 0x8769;
constexpr uint16_t gpsPointerTag = 0x8825;

// Bounds-checked access to the TIFF structure
class TiffReader
{
public:
    TiffReader( const uint8_t *d, size_t s, bool le ) : data( d ), size( s ), littleEndian( le )
    {}

    bool fits( uint64_t offset, uint64_t bytes ) const
    {
        return offset <= size && bytes <= size - offset;
    }

    uint8_t u8( uint64_t offset ) const
    {
        check( offset, 1 );
        return data[offset];
    }

    uint16_t u16( uint64_t offset ) const
    {
        check( offset, 2 );
        auto p = data + offset;
        return littleEndian ? uint16_t( p[0] | ( p[1] << 8 ) ) : readBe16( p );
    }

    uint32_t u32( uint64_t offset ) const
    {
        check( offset, 4 );
        auto p = data + offset;
        if( littleEndian )
            return uint32_t( p[0] ) | ( uint32_t( p[1] ) << 8 ) | ( uint32_t( p[2] ) << 16 ) | ( uint32_t( p[3] ) << 24 );
        return readBe32( p );
    }

    std::string ascii( uint64_t offset, uint64_t count ) const
    {
        check( offset, count );
        std::string text( ( const char * )data + offset, size_t( count ) );

        // Remove null terminator if present
        auto end = text.find( '\0' );
        if( end != std::string::npos )
            text.resize( end );
        return text;
    }
private:
    void check( uint64_t offset, uint64_t bytes ) const
    {
        if( !fits( offset, bytes ) )
            throw MetadataError( "EXIF offset " + std::to_string( offset ) + " is outside the data", atField( "exif" ) );
    }

    const uint8_t *data;
    size_t size;
    bool littleEndian;
};

std::optional<unsigned> typeSize( uint16_t type )
{
    switch( type )
    {
    case 1:
    case 2:
        return 1;
    case 3:
        return 2;
    case 4:
    case 9:
        return 4;
    case 5:
    case 10:
        return 8;
    default:
        return std::nullopt;
    }
}

double readValue( const TiffReader &r, ExifType type, uint64_t offset )
{
    switch( type )
    {
    case ExifType::Byte:
    case ExifType::Ascii:
        return r.u8( offset );
    case ExifType::Short:
        return r.u16( offset );
    case ExifType::Long:
        return r.u32( offset );
    case ExifType::SLong:
        return int32_t( r.u32( offset ) );
    case ExifType::Rational:
    {
        double denominator = r.u32( offset + 4 );
        return denominator != 0 ? r.u32( offset ) / denominator : 0;
    }
    case ExifType::SRational:
    {
        double denominator = int32_t( r.u32( offset + 4 ) );
        return denominator != 0 ? int32_t( r.u32( offset ) ) / denominator : 0;
    }
    }
    return 0;
}

void parseDirectory( const TiffReader &r, uint32_t offset, ExifDirectory directory, ExifData &result )
{
    uint16_t count = r.u16( offset );

    for( unsigned i = 0; i < count; ++i )
    {
        uint64_t entry = uint64_t( offset ) + 2 + uint64_t( i ) * 12;
        if( !r.fits( entry, 12 ) )
        {
            Log::warning( "EXIF directory entry " + std::to_string( i ) + " is outside the data", "exif" );
            break;
        }

        uint16_t tag = r.u16( entry );
        uint16_t rawType = r.u16( entry + 2 );
        uint32_t values = r.u32( entry + 4 );

        auto size = typeSize( rawType );
        if( !size )
            continue;

        uint64_t bytes = uint64_t( *size ) * values;
        uint64_t location = bytes <= 4 ? entry + 8 : r.u32( entry + 8 );
        if( !r.fits( location, bytes ) )
        {
            Log::warning( "EXIF tag " + std::to_string( tag ) + " points outside the data", "exif" );
            continue;
        }

        if( directory == ExifDirectory::Image && ( tag == exifPointerTag || tag == gpsPointerTag ) && values == 1 )
        {
            auto sub = tag == exifPointerTag ? ExifDirectory::Exif : ExifDirectory::Gps;
            try
            {
                uint32_t target = rawType == 3 ? r.u16( location ) : r.u32( location );
                parseDirectory( r, target, sub, result );
            }
            catch( const MetadataError &e )
            {
                Log::warning( "skipping EXIF sub-directory: " + e.text(), "exif" );
            }
            continue;
        }

        auto name = exifTagName( directory, tag );
        if( !name )
            continue;

        ExifEntry item;
        item.tag = tag;
        item.type = ExifType( rawType );
        item.directory = directory;

        if( item.type == ExifType::Ascii )
        {
            item.text = r.ascii( location, bytes );
        }
        else
        {
            item.values.reserve( values );
            for( uint32_t k = 0; k < values; ++k )
                item.values.push_back( readValue( r, item.type, location + uint64_t( k ) * *size ) );
        }

        result.tags[name] = std::move( item );
    }
}
}

std::optional<std::string> ExifData::text( const std::string &name ) const
{
    auto i = tags.find( name );
    if( i == tags.end() || i->second.type != ExifType::Ascii )
        return std::nullopt;
    return i->second.text;
}

std::optional<double> ExifData::number( const std::string &name ) const
{
    auto i = tags.find( name );
    if( i == tags.end() || i->second.values.empty() )
        return std::nullopt;
    return i->second.values.front();
}

const char *exifTagName( ExifDirectory directory, uint16_t tag )
{
    for( auto &known : knownTags )
    {
        if( known.directory == directory && known.tag == tag )
            return known.name;
    }
    return nullptr;
}

ExifData parseExif( const uint8_t *data, size_t size )
{
    if( size < 8 )
        throw MetadataError( "TIFF header too short", atField( "exif" ) );

    ExifData result;
    if( data[0] == 'I' && data[1] == 'I' )
        result.littleEndian = true;
    else if( data[0] == 'M' && data[1] == 'M' )
        result.littleEndian = false;
    else
        throw MetadataError( "invalid TIFF byte order", atField( "exif" ) );

    TiffReader r( data, size, result.littleEndian );
    if( r.u16( 2 ) != 42 )
        throw MetadataError( "invalid TIFF magic number", atField( "exif" ) );

    parseDirectory( r, r.u32( 4 ), ExifDirectory::Image, result );
    return result;
}

ExifData parseExif( const std::vector<uint8_t> &data )
{
    return parseExif( data.data(), data.size() );
}
}

#include "RasterCodec/Validation.h"

#include <limits>
#include <string>

#include "RasterCodec/Errors.h"

namespace RasterCodec
{
void validateDimensions( uint64_t width, uint64_t height, uint64_t limit )
{
    if( width < 1 || width > limit )
        throw InvalidDimensionsError( "width must be in 1.." + std::to_string( limit ) + ", got " + std::to_string( width ), atField( "width" ) );
    if( height < 1 || height > limit )
        throw InvalidDimensionsError( "height must be in 1.." + std::to_string( limit ) + ", got " + std::to_string( height ), atField( "height" ) );
}

void validatePixelBuffer( size_t size, uint64_t width, uint64_t height, unsigned channels )
{
    uint64_t pixels = 0, expected = 0;
    if( !multiplyChecked( width, height, pixels ) || !multiplyChecked( pixels, channels, expected ) )
        throw PixelDataSizeError( "pixel buffer size for " + std::to_string( width ) + "x" + std::to_string( height ) + " overflows" );

    if( size != expected )
    {
        throw PixelDataSizeError( "pixel buffer holds " + std::to_string( size ) + " bytes, expected " + std::to_string( expected ) +
                                  " for " + std::to_string( width ) + "x" + std::to_string( height ) + "x" + std::to_string( channels ) );
    }
}

bool multiplyChecked( uint64_t a, uint64_t b, uint64_t &product )
{
    if( a != 0 && b > std::numeric_limits<uint64_t>::max() / a )
        return false;
    product = a * b;
    return true;
}

void validateQuality( int quality )
{
    if( quality < 1 || quality > 100 )
        throw InvalidQualityError( "quality must be in 1..100, got " + std::to_string( quality ), atField( "quality" ) );
}
}

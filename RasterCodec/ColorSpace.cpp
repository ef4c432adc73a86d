#include "RasterCodec/ColorSpace.h"

#include "RasterCodec/Validation.h"
#include "Basic.h"

namespace RasterCodec
{
LumaCoefficients lumaCoefficients( ColorStandard standard )
{
    switch( standard )
    {
    case ColorStandard::BT601:
        return { 0.299, 0.114 };
    case ColorStandard::BT709:
        return { 0.2126, 0.0722 };
    case ColorStandard::BT2020:
        return { 0.2627, 0.0593 };
    }
    return { 0.299, 0.114 };
}

double applyRounding( double value, Rounding rounding )
{
    switch( rounding )
    {
    case Rounding::Nearest:
        return Round( value );
    case Rounding::Truncate:
        return RoundDown( value );
    case Rounding::Ceiling:
        return RoundUp( value );
    case Rounding::Bankers:
        return RoundEven( value );
    }
    return Round( value );
}

static uint8_t finish( double value, double low, double high, Rounding rounding )
{
    return uint8_t( Clamp( applyRounding( value, rounding ), low, high ) );
}

YCbCr rgbToYCbCr( uint8_t r, uint8_t g, uint8_t b, const ColorConversionOptions &options )
{
    auto k = lumaCoefficients( options.standard );

    double y = k.kr * r + k.kg() * g + k.kb * b;
    double cb = ( b - y ) / ( 2 * ( 1 - k.kb ) );
    double cr = ( r - y ) / ( 2 * ( 1 - k.kr ) );

    if( options.range == ColorRange::Limited )
    {
        return
        {
            finish( 16 + y * 219 / 255, 16, 235, options.rounding ),
            finish( 128 + cb * 224 / 255, 16, 240, options.rounding ),
            finish( 128 + cr * 224 / 255, 16, 240, options.rounding )
        };
    }

    return
    {
        finish( y, 0, 255, options.rounding ),
        finish( 128 + cb, 0, 255, options.rounding ),
        finish( 128 + cr, 0, 255, options.rounding )
    };
}

Rgb yCbCrToRgb( uint8_t y, uint8_t cb, uint8_t cr, const ColorConversionOptions &options )
{
    auto k = lumaCoefficients( options.standard );

    double luma, blue, red;
    if( options.range == ColorRange::Limited )
    {
        luma = ( y - 16.0 ) * 255 / 219;
        blue = ( cb - 128.0 ) * 255 / 224;
        red = ( cr - 128.0 ) * 255 / 224;
    }
    else
    {
        luma = y;
        blue = cb - 128.0;
        red = cr - 128.0;
    }

    double r = luma + 2 * ( 1 - k.kr ) * red;
    double b = luma + 2 * ( 1 - k.kb ) * blue;
    double g = ( luma - k.kr * r - k.kb * b ) / k.kg();

    return
    {
        finish( r, 0, 255, options.rounding ),
        finish( g, 0, 255, options.rounding ),
        finish( b, 0, 255, options.rounding )
    };
}

std::vector<uint8_t> convertRgbaToYCbCr( const std::vector<uint8_t> &rgba, uint32_t width, uint32_t height, const ColorConversionOptions &options )
{
    validatePixelBuffer( rgba, width, height, 4 );

    std::vector<uint8_t> result( rgba.size() );
    for( size_t i = 0; i < rgba.size(); i += 4 )
    {
        auto c = rgbToYCbCr( rgba[i], rgba[i + 1], rgba[i + 2], options );
        result[i] = c.y;
        result[i + 1] = c.cb;
        result[i + 2] = c.cr;
        result[i + 3] = rgba[i + 3];
    }
    return result;
}

std::vector<uint8_t> convertYCbCrToRgba( const std::vector<uint8_t> &ycbcra, uint32_t width, uint32_t height, const ColorConversionOptions &options )
{
    validatePixelBuffer( ycbcra, width, height, 4 );

    std::vector<uint8_t> result( ycbcra.size() );
    for( size_t i = 0; i < ycbcra.size(); i += 4 )
    {
        auto c = yCbCrToRgb( ycbcra[i], ycbcra[i + 1], ycbcra[i + 2], options );
        result[i] = c.r;
        result[i + 1] = c.g;
        result[i + 2] = c.b;
        result[i + 3] = ycbcra[i + 3];
    }
    return result;
}

ConversionAccuracy analyzeConversionAccuracy( const std::vector<uint8_t> &original, const std::vector<uint8_t> &converted, uint32_t width, uint32_t height )
{
    validatePixelBuffer( original, width, height, 4 );
    validatePixelBuffer( converted, width, height, 4 );

    ConversionAccuracy result;
    double sum = 0, squares = 0;
    size_t samples = 0;

    for( size_t i = 0; i < original.size(); i += 4 )
    {
        for( unsigned c = 0; c < 3; ++c )
        {
            double error = Abs( double( original[i + c] ) - double( converted[i + c] ) );
            result.maxError = Max( result.maxError, error );
            sum += error;
            squares += error * error;
            ++samples;
        }
    }

    result.averageError = sum / samples;
    result.rmse = Sqrt( squares / samples );
    return result;
}
}

#include "Tests/Fixtures.h"

#include "RasterCodec/ColorSpace.h"
#include "RasterCodec/Errors.h"
#include "Basic.h"

using namespace RasterCodec;

void colorSpaceTests( Tests &tests )
{
    tests( []( Context &context )
    {
        auto s = context.scope( "ColorSpace_Rounding" );

        makeException( applyRounding( 2.5, Rounding::Nearest ) == 3 && applyRounding( -2.5, Rounding::Nearest ) == -3 );
        makeException( applyRounding( 2.7, Rounding::Truncate ) == 2 && applyRounding( -2.3, Rounding::Truncate ) == -3 );
        makeException( applyRounding( 2.1, Rounding::Ceiling ) == 3 && applyRounding( -2.9, Rounding::Ceiling ) == -2 );
        makeException( applyRounding( 2.5, Rounding::Bankers ) == 2 && applyRounding( 3.5, Rounding::Bankers ) == 4 );
        makeException( applyRounding( 2.6, Rounding::Bankers ) == 3 );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "ColorSpace_Known_Values" );

        auto red = rgbToYCbCr( 255, 0, 0 );
        makeException( red.y == 76 && red.cb == 85 && red.cr == 255 );

        auto gray = rgbToYCbCr( 128, 128, 128 );
        makeException( gray.y == 128 && gray.cb == 128 && gray.cr == 128 );

        auto k = lumaCoefficients( ColorStandard::BT709 );
        makeException( k.kr == 0.2126 && k.kb == 0.0722 );
        makeException( Abs( k.kg() - 0.7152 ) < 1e-12 );

        auto back = yCbCrToRgb( 128, 128, 128 );
        makeException( back.r == 128 && back.g == 128 && back.b == 128 );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "ColorSpace_Range_Bounds" );

        for( auto standard : { ColorStandard::BT601, ColorStandard::BT709, ColorStandard::BT2020 } )
        {
            ColorConversionOptions options;
            options.standard = standard;

            auto black = rgbToYCbCr( 0, 0, 0, options );
            auto white = rgbToYCbCr( 255, 255, 255, options );
            makeException( black.y == 0 && black.cb == 128 && black.cr == 128 );
            makeException( white.y == 255 && white.cb == 128 && white.cr == 128 );

            options.range = ColorRange::Limited;
            black = rgbToYCbCr( 0, 0, 0, options );
            white = rgbToYCbCr( 255, 255, 255, options );
            makeException( black.y == 16 && white.y == 235 );
            makeException( black.cb == 128 && white.cr == 128 );

            // Saturated colors stay inside the chroma range
            for( auto c : { Rgb { 255, 0, 0 }, Rgb { 0, 255, 0 }, Rgb { 0, 0, 255 }, Rgb { 255, 255, 0 } } )
            {
                auto v = rgbToYCbCr( c.r, c.g, c.b, options );
                makeException( 16 <= v.y && v.y <= 235 );
                makeException( 16 <= v.cb && v.cb <= 240 && 16 <= v.cr && v.cr <= 240 );
            }

            auto limitedBlack = yCbCrToRgb( 16, 128, 128, options );
            makeException( limitedBlack.r == 0 && limitedBlack.g == 0 && limitedBlack.b == 0 );
            auto limitedWhite = yCbCrToRgb( 235, 128, 128, options );
            makeException( limitedWhite.r == 255 && limitedWhite.g == 255 && limitedWhite.b == 255 );
        }
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "ColorSpace_Round_Trip_Accuracy" );

        const uint32_t w = 32, h = 32;
        auto rgba = randomPixels( w, h, 11, false );

        for( auto standard : { ColorStandard::BT601, ColorStandard::BT709, ColorStandard::BT2020 } )
        {
            for( auto range : { ColorRange::Full, ColorRange::Limited } )
            {
                ColorConversionOptions options;
                options.standard = standard;
                options.range = range;

                auto ycc = convertRgbaToYCbCr( rgba, w, h, options );
                auto back = convertYCbCrToRgba( ycc, w, h, options );

                // Alpha passes through
                for( size_t i = 3; i < rgba.size(); i += 4 )
                    makeException( ycc[i] == rgba[i] && back[i] == rgba[i] );

                auto accuracy = analyzeConversionAccuracy( rgba, back, w, h );
                makeException( accuracy.maxError <= 3 );
                makeException( accuracy.averageError < 1.5 );
                makeException( accuracy.rmse <= accuracy.maxError );
            }
        }

        auto same = analyzeConversionAccuracy( rgba, rgba, w, h );
        makeException( same.maxError == 0 && same.averageError == 0 && same.rmse == 0 );

        expectThrow<PixelDataSizeError>( [&] { convertRgbaToYCbCr( rgba, w + 1, h ); } );
    } );
}

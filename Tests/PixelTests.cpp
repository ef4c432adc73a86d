#include "Tests/Fixtures.h"

#include "RasterCodec/Pixels.h"
#include "RasterCodec/Errors.h"

using namespace RasterCodec;

void pixelTests( Tests &tests )
{
    tests( []( Context &context )
    {
        auto s = context.scope( "Pixels_Expand_Sample" );

        makeException( expandSample( 0, 1 ) == 0 && expandSample( 1, 1 ) == 255 );
        makeException( expandSample( 2, 2 ) == 170 && expandSample( 3, 2 ) == 255 );
        makeException( expandSample( 0, 4 ) == 0 && expandSample( 15, 4 ) == 255 && expandSample( 8, 4 ) == 136 );
        makeException( expandSample( 200, 8 ) == 200 );

        // Truncation, not rounding
        makeException( expandSample( 0xABFF, 16 ) == 0xAB );
        makeException( expandSample( 0x00FF, 16 ) == 0 );

        expectThrow<InvalidOptionError>( [] { expandSample( 1, 3 ); } );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Pixels_Quantize_Sample" );

        makeException( quantizeSample( 255, 1 ) == 1 && quantizeSample( 127, 1 ) == 0 && quantizeSample( 128, 1 ) == 1 );
        makeException( quantizeSample( 170, 2 ) == 2 );
        makeException( quantizeSample( 136, 4 ) == 8 && quantizeSample( 255, 4 ) == 15 );
        makeException( quantizeSample( 77, 8 ) == 77 );
        makeException( quantizeSample( 0xAB, 16 ) == 0xABAB );

        for( unsigned depth : { 1u, 2u, 4u, 8u } )
        {
            for( unsigned v = 0; v < ( 1u << depth ); ++v )
                makeException( quantizeSample( expandSample( v, depth ), depth ) == v );
        }
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Pixels_Unpack_Row_Padding" );

        // Three 1-bit samples per row, five padding bits
        std::vector<uint8_t> raw = { 0b10100000, 0b01100000 };
        auto samples = unpackSamples( raw, 3, 2, 1, 1 );
        makeException( samples == std::vector<uint16_t>( { 1, 0, 1, 0, 1, 1 } ) );
        makeException( packSamples( samples, 3, 2, 1, 1 ) == raw );

        std::vector<uint8_t> nibbles = { 0x12, 0x30, 0xAB, 0xC0 };
        auto fours = unpackSamples( nibbles, 3, 2, 1, 4 );
        makeException( fours == std::vector<uint16_t>( { 1, 2, 3, 0xA, 0xB, 0xC } ) );

        std::vector<uint8_t> wide = { 0x12, 0x34, 0xFF, 0x00 };
        makeException( unpackSamples( wide, 2, 1, 1, 16 ) == std::vector<uint16_t>( { 0x1234, 0xFF00 } ) );

        expectThrow<PixelDataSizeError>( [&] { unpackSamples( raw, 9, 2, 1, 1 ); } );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Pixels_To_Rgba" );

        auto gray = samplesToRgba( { 0, 1 }, 2, 1, ColorType::Grayscale, 1 );
        makeException( gray == std::vector<uint8_t>( { 0, 0, 0, 255, 255, 255, 255, 255 } ) );

        auto grayAlpha = samplesToRgba( { 10, 20 }, 1, 1, ColorType::GrayscaleAlpha, 8 );
        makeException( grayAlpha == std::vector<uint8_t>( { 10, 10, 10, 20 } ) );

        auto rgb16 = samplesToRgba( { 0x1234, 0x5678, 0x9ABC }, 1, 1, ColorType::Truecolor, 16 );
        makeException( rgb16 == std::vector<uint8_t>( { 0x12, 0x56, 0x9A, 255 } ) );

        Palette palette = { { 1, 2, 3 }, { 4, 5, 6 }, { 7, 8, 9 } };
        auto indexed = samplesToRgba( { 2, 0, 1 }, 3, 1, ColorType::Indexed, 2, palette, { 0, 128 } );
        makeException( indexed == std::vector<uint8_t>( { 7, 8, 9, 255, 1, 2, 3, 0, 4, 5, 6, 128 } ) );

        // Indices are never scaled by the bit depth
        auto single = samplesToRgba( { 1 }, 1, 1, ColorType::Indexed, 1, palette );
        makeException( single == std::vector<uint8_t>( { 4, 5, 6, 255 } ) );

        expectThrow<StructuralError>( [&] { samplesToRgba( { 3 }, 1, 1, ColorType::Indexed, 2, palette ); }, "palette index" );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Pixels_Transparency" );

        auto grayKey = decodeTransparency( { 0x01, 0x00 }, ColorType::Grayscale, 0 );
        makeException( grayKey.key && ( *grayKey.key )[0] == 0x0100 );

        // 16-bit samples that agree in the high byte differ in the raw comparison
        std::vector<uint16_t> samples = { 0x0100, 0x01FF };
        auto rgba = samplesToRgba( samples, 2, 1, ColorType::Grayscale, 16 );
        applyTransparency( rgba, samples, ColorType::Grayscale, *grayKey.key );
        makeException( rgba[3] == 0 && rgba[7] == 255 );
        makeException( rgba[0] == rgba[4] );

        auto rgbKey = decodeTransparency( { 0, 1, 0, 2, 0, 3 }, ColorType::Truecolor, 0 );
        std::vector<uint16_t> rgbSamples = { 1, 2, 3, 1, 2, 4 };
        auto colors = samplesToRgba( rgbSamples, 2, 1, ColorType::Truecolor, 8 );
        applyTransparency( colors, rgbSamples, ColorType::Truecolor, *rgbKey.key );
        makeException( colors[3] == 0 && colors[7] == 255 );

        auto alphas = decodeTransparency( { 0, 10 }, ColorType::Indexed, 3 );
        makeException( !alphas.key && alphas.paletteAlpha == std::vector<uint8_t>( { 0, 10 } ) );

        expectThrow<StructuralError>( [] { decodeTransparency( { 0, 0, 0, 0 }, ColorType::Indexed, 3 ); } );
        expectThrow<StructuralError>( [] { decodeTransparency( { 0, 0 }, ColorType::TruecolorAlpha, 0 ); } );
        expectThrow<StructuralError>( [] { decodeTransparency( { 0, 0 }, ColorType::GrayscaleAlpha, 0 ); } );
        expectThrow<StructuralError>( [] { decodeTransparency( { 0, 0, 0 }, ColorType::Grayscale, 0 ); } );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Pixels_Palette" );

        std::vector<uint8_t> rgba =
        {
            255, 0, 0, 255,
            0, 255, 0, 128,
            255, 0, 0, 255,
            0, 0, 255, 255
        };

        auto encoded = rgbaToSamples( rgba, 4, 1, ColorType::Indexed, 2 );
        makeException( encoded.samples == std::vector<uint16_t>( { 0, 1, 0, 2 } ) );
        makeException( encoded.palette.size() == 3 );
        makeException( encoded.palette[1] == PaletteEntry( { 0, 255, 0 } ) );

        // Trailing opaque entries are trimmed
        makeException( encoded.paletteAlpha == std::vector<uint8_t>( { 255, 128 } ) );

        expectThrow<RangeError>( [&] { rgbaToSamples( rgba, 4, 1, ColorType::Indexed, 1 ); }, "colors" );

        auto bytes = encodePalette( encoded.palette );
        makeException( bytes.size() == 9 && decodePalette( bytes ) == encoded.palette );
        expectThrow<StructuralError>( [] { decodePalette( { 1, 2 } ); } );
        expectThrow<StructuralError>( [] { decodePalette( {} ); } );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Pixels_Gray_Conversion" );

        makeException( luminance( 0, 0, 0 ) == 0 && luminance( 255, 255, 255 ) == 255 );
        makeException( luminance( 255, 0, 0 ) == 76 && luminance( 0, 255, 0 ) == 150 && luminance( 0, 0, 255 ) == 29 );

        auto encoded = rgbaToSamples( { 255, 255, 255, 255, 0, 0, 0, 255 }, 2, 1, ColorType::Grayscale, 1 );
        makeException( encoded.samples == std::vector<uint16_t>( { 1, 0 } ) );

        auto withAlpha = rgbaToSamples( { 90, 90, 90, 17 }, 1, 1, ColorType::GrayscaleAlpha, 16 );
        makeException( withAlpha.samples == std::vector<uint16_t>( { 90 * 257, 17 * 257 } ) );

        expectThrow<InvalidOptionError>( [] { rgbaToSamples( { 0, 0, 0, 0 }, 1, 1, ColorType::Truecolor, 4 ); } );
        expectThrow<PixelDataSizeError>( [] { rgbaToSamples( { 0, 0, 0 }, 1, 1, ColorType::Truecolor, 8 ); } );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Pixels_Analysis" );

        auto opaqueGray = checkerboardPixels( 4, 4, 1 );
        auto a = analyzePixels( opaqueGray, 4, 4 );
        makeException( !a.hasTransparency && a.isGrayscale && a.uniqueColors == 2 );

        auto noisy = randomPixels( 32, 32, 5, false );
        auto b = analyzePixels( noisy, 32, 32, 100 );
        makeException( b.hasTransparency && !b.isGrayscale && b.uniqueColors == 100 );
    } );
}

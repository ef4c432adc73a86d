#include "Tests/Fixtures.h"

#include <cstdlib>

#include "RasterCodec/Quantization.h"
#include "RasterCodec/Errors.h"

using namespace RasterCodec;

void quantizationTests( Tests &tests )
{
    tests( []( Context &context )
    {
        auto s = context.scope( "Quantization_Scaling" );

        makeException( qualityScaleFactor( 10 ) == 500 && qualityScaleFactor( 50 ) == 100 );
        makeException( qualityScaleFactor( 75 ) == 50 && qualityScaleFactor( 100 ) == 0 );

        makeException( scaleQuantizationTable( standardLuminanceTable, 50 ) == standardLuminanceTable );
        makeException( scaleQuantizationTable( standardChrominanceTable, 50 ) == standardChrominanceTable );

        QuantizationTable ones;
        ones.fill( 1 );
        makeException( scaleQuantizationTable( standardLuminanceTable, 100 ) == ones );

        auto coarsest = scaleQuantizationTable( standardLuminanceTable, 1 );
        for( auto v : coarsest )
            makeException( v == 255 );

        // Entries never grow with quality
        for( int q = 1; q < 100; ++q )
        {
            auto lower = scaleQuantizationTable( standardLuminanceTable, q );
            auto higher = scaleQuantizationTable( standardLuminanceTable, q + 1 );
            for( size_t i = 0; i < 64; ++i )
                makeException( higher[i] <= lower[i] && 1 <= higher[i] && lower[i] <= 255 );
        }

        expectThrow<InvalidQualityError>( [] { scaleQuantizationTable( standardLuminanceTable, 0 ); } );
        expectThrow<InvalidQualityError>( [] { scaleQuantizationTable( standardLuminanceTable, 101 ); } );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Quantization_Blocks" );

        QuantizationTable twos;
        twos.fill( 2 );

        Block coefficients {};
        coefficients[0] = 801;
        coefficients[1] = 7;
        coefficients[2] = -7;
        coefficients[3] = 0.9;

        auto quantized = quantizeBlock( coefficients, twos );
        makeException( quantized[0] == 401 && quantized[1] == 4 && quantized[2] == -4 && quantized[3] == 0 );
        makeException( quantized[63] == 0 );

        auto restored = dequantizeBlock( quantized, twos );
        makeException( restored[0] == 802 && restored[1] == 8 && restored[2] == -8 );

        auto standard = quantizeBlock( coefficients, standardLuminanceTable );
        makeException( standard[0] == 50 && standard[1] == 1 && standard[2] == -1 );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Quantization_Estimate" );

        for( int quality : { 25, 50, 75, 90 } )
        {
            auto luminance = scaleQuantizationTable( standardLuminanceTable, quality );
            makeException( std::abs( estimateQuality( luminance ) - quality ) <= 2 );

            auto chrominance = scaleQuantizationTable( standardChrominanceTable, quality );
            makeException( std::abs( estimateQuality( chrominance, false ) - quality ) <= 2 );
        }

        makeException( estimateQuality( standardLuminanceTable ) == 50 );
    } );
}

#include "Tests/Fixtures.h"

#include "RasterCodec/Filter.h"
#include "RasterCodec/Errors.h"
#include "RandomNumber.h"

using namespace RasterCodec;

void filterTests( Tests &tests )
{
    tests( []( Context &context )
    {
        auto s = context.scope( "Filter_Paeth_Predictor" );

        makeException( paethPredictor( 5, 5, 5 ) == 5 );
        makeException( paethPredictor( 10, 20, 10 ) == 20 );
        makeException( paethPredictor( 10, 0, 5 ) == 5 );
        makeException( paethPredictor( 0, 0, 100 ) == 0 );

        // Ties prefer left, then up
        makeException( paethPredictor( 1, 7, 5 ) == 1 );
        makeException( paethPredictor( 6, 0, 4 ) == 0 );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Filter_Round_Trip" );

        RandomNumber random( 77 );
        for( unsigned bytesPerPixel : { 1u, 3u, 4u, 8u } )
        {
            auto previous = random.getBytes( 8 * bytesPerPixel );
            auto line = random.getBytes( 8 * bytesPerPixel );

            for( unsigned f = 0; f < filterTypeCount; ++f )
            {
                auto type = FilterType( f );

                auto filtered = applyFilter( line, previous, type, bytesPerPixel );
                makeException( reverseFilter( filtered, previous, type, bytesPerPixel ) == line );

                // First line of an image
                auto first = applyFilter( line, {}, type, bytesPerPixel );
                makeException( reverseFilter( first, {}, type, bytesPerPixel ) == line );
            }
        }
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Filter_Selection" );

        makeException( filterScore( { 0xFF, 0x01, 0x00, 0x80 } ) == 1 + 1 + 0 + 128 );

        std::vector<uint8_t> flat( 8, 7 );
        makeException( filterScore( flat ) == 56 );

        // Sub and Paeth both score 7, the lower type wins
        makeException( selectFilter( flat, {}, 1 ) == FilterType::Sub );

        // Identical lines reduce to zero with Up
        std::vector<uint8_t> ramp = { 10, 50, 90, 130, 170, 210, 250, 30 };
        makeException( selectFilter( ramp, ramp, 1 ) == FilterType::Up );

        std::vector<uint8_t> zeros( 8, 0 );
        makeException( selectFilter( zeros, zeros, 1 ) == FilterType::None );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Filter_Scanlines" );

        RandomNumber random( 99 );
        const uint32_t columns = 13, rows = 9;

        for( unsigned bitsPerPixel : { 1u, 2u, 4u, 8u, 24u, 32u, 64u } )
        {
            size_t lineBytes = ( columns * bitsPerPixel + 7 ) / 8;
            auto raw = random.getBytes( lineBytes * rows );

            auto adaptive = filterScanlines( raw, columns, rows, bitsPerPixel, std::nullopt );
            makeException( adaptive.size() == rows * ( lineBytes + 1 ) );
            makeException( unfilterScanlines( adaptive.data(), adaptive.size(), columns, rows, bitsPerPixel ) == raw );

            for( unsigned f = 0; f < filterTypeCount; ++f )
            {
                auto fixed = filterScanlines( raw, columns, rows, bitsPerPixel, FilterType( f ) );
                makeException( unfilterScanlines( fixed.data(), fixed.size(), columns, rows, bitsPerPixel ) == raw );

                auto usage = analyzeFilterUsage( fixed, columns, rows, bitsPerPixel );
                makeException( usage[f] == rows );
            }
        }
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Filter_Invalid_Stream" );

        std::vector<uint8_t> stream = { 0, 1, 2, 5, 1, 2 };
        expectThrow<StructuralError>( [&] { unfilterScanlines( stream.data(), stream.size(), 2, 2, 8 ); }, "invalid filter type" );
        expectThrow<PixelDataSizeError>( [&] { unfilterScanlines( stream.data(), stream.size() - 1, 2, 2, 8 ); } );
        expectThrow<StructuralError>( [] { toFilterType( 5 ); } );
    } );
}

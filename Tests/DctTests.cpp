#include "Tests/Fixtures.h"

#include <algorithm>
#include <cmath>

#include "RasterCodec/DCT.h"
#include "RandomNumber.h"

using namespace RasterCodec;

static double maxError( const Block &a, const Block &b )
{
    double result = 0;
    for( size_t i = 0; i < a.size(); ++i )
        result = std::max( result, std::fabs( a[i] - b[i] ) );
    return result;
}

static double energy( const Block &block )
{
    double sum = 0;
    for( auto v : block )
        sum += v * v;
    return sum;
}

void dctTests( Tests &tests )
{
    tests( []( Context &context )
    {
        auto s = context.scope( "Dct_Cosine_Table" );

        auto &table = cosineTable();
        for( int x = 0; x < 8; ++x )
            makeException( std::fabs( table[0][x] - 0.5 / std::sqrt( 2.0 ) ) < 1e-12 );
        makeException( std::fabs( table[1][0] - 0.5 * std::cos( std::acos( -1.0 ) / 16 ) ) < 1e-12 );
        makeException( &table == &cosineTable() );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Dct_Constant_Block" );

        Block flat;
        flat.fill( 100 );
        auto coefficients = forwardDCT( flat );
        makeException( std::fabs( coefficients[0] - 800 ) < 1e-9 );
        for( size_t i = 1; i < 64; ++i )
            makeException( std::fabs( coefficients[i] ) < 1e-9 );

        Block dc {};
        dc[0] = -240;
        makeException( isDcOnly( dc ) );
        auto samples = inverseDCT( dc );
        for( auto v : samples )
            makeException( std::fabs( v + 30 ) < 1e-12 );

        dc[63] = 0.5;
        makeException( !isDcOnly( dc ) );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Dct_Round_Trip" );

        RandomNumber random( 5 );
        std::vector<Block> blocks( 5 );
        for( size_t i = 0; i < 64; ++i )
        {
            int x = int( i % 8 ), y = int( i / 8 );
            blocks[0][i] = -37;
            blocks[1][i] = x * 16 + y * 2 - 128;
            blocks[2][i] = ( x + y ) % 2 ? 127 : -128;
            blocks[3][i] = i == 27 ? 255 : 0;
            blocks[4][i] = double( random.getInteger( -128, 127 ) );
        }

        for( auto &block : blocks )
        {
            auto coefficients = forwardDCT( block );
            makeException( maxError( inverseDCT( coefficients ), block ) <= 0.01 );

            // Orthonormal, energy is preserved
            double before = energy( block ), after = energy( coefficients );
            makeException( std::fabs( before - after ) <= 0.01 * before );
        }
    } );
}

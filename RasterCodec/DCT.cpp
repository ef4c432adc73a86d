#include "RasterCodec/DCT.h"

#include "Basic.h"

namespace RasterCodec
{
const std::array<std::array<double, 8>, 8> &cosineTable()
{
    // The per-pass scale factor 0.5 is folded into the coefficients
    static const auto table = []
    {
        std::array<std::array<double, 8>, 8> t;
        for( int u = 0; u < 8; ++u )
        {
            double cu = ( u == 0 ) ? 1.0 / Sqrt( 2.0 ) : 1.0;
            for( int x = 0; x < 8; ++x )
                t[u][x] = cu * Cos( ( 2.0 * x + 1.0 ) * u * Pi() / 16.0 ) * 0.5;
        }
        return t;
    }();
    return table;
}

Block forwardDCT( const Block &samples )
{
    auto &coef = cosineTable();
    Block tmp, out;

    // Rows
    for( int y = 0; y < 8; ++y )
    {
        for( int u = 0; u < 8; ++u )
        {
            double sum = 0;
            for( int x = 0; x < 8; ++x )
                sum += samples[y * 8 + x] * coef[u][x];
            tmp[y * 8 + u] = sum;
        }
    }

    // Columns
    for( int u = 0; u < 8; ++u )
    {
        for( int v = 0; v < 8; ++v )
        {
            double sum = 0;
            for( int y = 0; y < 8; ++y )
                sum += tmp[y * 8 + u] * coef[v][y];
            out[v * 8 + u] = sum;
        }
    }
    return out;
}

Block inverseDCT( const Block &coefficients )
{
    Block out;

    // Flat block
    if( isDcOnly( coefficients ) )
    {
        out.fill( coefficients[0] / 8 );
        return out;
    }

    auto &coef = cosineTable();
    Block tmp;

    // Rows
    for( int v = 0; v < 8; ++v )
    {
        for( int x = 0; x < 8; ++x )
        {
            double sum = 0;
            for( int u = 0; u < 8; ++u )
                sum += coefficients[v * 8 + u] * coef[u][x];
            tmp[v * 8 + x] = sum;
        }
    }

    // Columns
    for( int x = 0; x < 8; ++x )
    {
        for( int y = 0; y < 8; ++y )
        {
            double sum = 0;
            for( int v = 0; v < 8; ++v )
                sum += tmp[v * 8 + x] * coef[v][y];
            out[y * 8 + x] = sum;
        }
    }
    return out;
}

bool isDcOnly( const Block &coefficients )
{
    for( size_t i = 1; i < coefficients.size(); ++i )
    {
        if( coefficients[i] != 0 )
            return false;
    }
    return true;
}
}

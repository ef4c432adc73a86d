#include "RasterCodec/Quantization.h"

#include "RasterCodec/Validation.h"
#include "Basic.h"

namespace RasterCodec
{
const QuantizationTable standardLuminanceTable =
{
    16, 11, 10, 16, 24, 40, 51, 61,
    12, 12, 14, 19, 26, 58, 60, 55,
    14, 13, 16, 24, 40, 57, 69, 56,
    14, 17, 22, 29, 51, 87, 80, 62,
    18, 22, 37, 56, 68, 109, 103, 77,
    24, 35, 55, 64, 81, 104, 113, 92,
    49, 64, 78, 87, 103, 121, 120, 101,
    72, 92, 95, 98, 112, 100, 103, 99
};

const QuantizationTable standardChrominanceTable =
{
    17, 18, 24, 47, 99, 99, 99, 99,
    18, 21, 26, 66, 99, 99, 99, 99,
    24, 26, 56, 99, 99, 99, 99, 99,
    47, 66, 99, 99, 99, 99, 99, 99,
    99, 99, 99, 99, 99, 99, 99, 99,
    99, 99, 99, 99, 99, 99, 99, 99,
    99, 99, 99, 99, 99, 99, 99, 99,
    99, 99, 99, 99, 99, 99, 99, 99
};

int qualityScaleFactor( int quality )
{
    validateQuality( quality );
    return quality < 50 ? 5000 / quality : 200 - 2 * quality;
}

QuantizationTable scaleQuantizationTable( const QuantizationTable &base, int quality )
{
    int scale = qualityScaleFactor( quality );

    QuantizationTable result;
    for( size_t i = 0; i < result.size(); ++i )
        result[i] = uint16_t( Clamp( ( base[i] * scale + 50 ) / 100, 1, 255 ) );
    return result;
}

Block quantizeBlock( const Block &coefficients, const QuantizationTable &table )
{
    Block result;
    for( size_t i = 0; i < result.size(); ++i )
        result[i] = Round( coefficients[i] / table[i] );
    return result;
}

Block dequantizeBlock( const Block &quantized, const QuantizationTable &table )
{
    Block result;
    for( size_t i = 0; i < result.size(); ++i )
        result[i] = quantized[i] * table[i];
    return result;
}

int estimateQuality( const QuantizationTable &table, bool luminance )
{
    auto &base = luminance ? standardLuminanceTable : standardChrominanceTable;

    double ratio = 0;
    for( size_t i = 0; i < table.size(); ++i )
        ratio += double( table[i] ) / base[i];
    double scale = ratio / table.size() * 100;

    // scale = 200 - 2q above 50, 5000 / q below
    double quality = scale <= 100 ? ( 200 - scale ) / 2 : 5000 / scale;
    return int( Clamp( Round( quality ), 1.0, 100.0 ) );
}
}

#pragma once

#include <cstdint>
#include <array>

#include "RasterCodec/Blocks.h"

namespace RasterCodec
{
// Natural (row-major) order
using QuantizationTable = std::array<uint16_t, 64>;

// ITU T.81 Annex K, tables K.1 and K.2
extern const QuantizationTable standardLuminanceTable;
extern const QuantizationTable standardChrominanceTable;

// IJG scaling factor, 5000 / q below 50, 200 - 2q otherwise
int qualityScaleFactor( int quality );

// clamp( floor( ( base * scale + 50 ) / 100 ), 1, 255 ), InvalidQualityError unless quality is in 1..100
QuantizationTable scaleQuantizationTable( const QuantizationTable &base, int quality );

// Rounds to nearest
Block quantizeBlock( const Block &coefficients, const QuantizationTable &table );
Block dequantizeBlock( const Block &quantized, const QuantizationTable &table );

// Inverts the IJG scaling from the mean ratio to the standard table
int estimateQuality( const QuantizationTable &table, bool luminance = true );
}

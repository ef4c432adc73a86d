#pragma once

#include <array>

#include "RasterCodec/Blocks.h"

// 8x8 DCT-II / DCT-III
// F(u,v) = 1/4 C(u) C(v) sum f(x,y) cos((2x+1)u pi/16) cos((2y+1)v pi/16), C(0) = 1/sqrt(2), C(k) = 1 otherwise

namespace RasterCodec
{
// C(u) cos((2x+1)u pi/16) / 2, indexed [frequency][position], built on first use
const std::array<std::array<double, 8>, 8> &cosineTable();

Block forwardDCT( const Block &samples );
Block inverseDCT( const Block &coefficients );

// True when every AC coefficient is zero
bool isDcOnly( const Block &coefficients );
}

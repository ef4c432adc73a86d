#include "RandomNumber.h"

#include "Exception.h"

static constexpr int64_t parkMillerA = 16807;
static constexpr int64_t parkMillerM = 2147483647;
static constexpr int64_t parkMillerQ = parkMillerM / parkMillerA;
static constexpr int64_t parkMillerR = parkMillerM % parkMillerA;

RandomNumber::RandomNumber() : RandomNumber( 314159 )
{}

RandomNumber::RandomNumber( int64_t seed )
{
    setSeed( seed );
}

void RandomNumber::setSeed( int64_t seed )
{
    // State must stay in 1..M-1
    z = seed % parkMillerM;
    if( z <= 0 )
        z += parkMillerM - 1;
    if( z == 0 )
        z = 1;
}

void RandomNumber::next()
{
    // Schrage's method, no overflow
    int64_t gamma = parkMillerA * ( z % parkMillerQ ) - parkMillerR * ( z / parkMillerQ );
    z = gamma > 0 ? gamma : gamma + parkMillerM;
}

int64_t RandomNumber::getInteger( int64_t start, int64_t finish )
{
    makeException( start <= finish );
    int64_t result = z % ( finish - start + 1 ) + start;
    next();
    return result;
}

double RandomNumber::getReal( double start, double finish )
{
    double result = double( z ) * ( finish - start ) / double( parkMillerM ) + start;
    next();
    return result;
}

uint8_t RandomNumber::getByte()
{
    return uint8_t( getInteger( 0, 255 ) );
}

std::vector<uint8_t> RandomNumber::getBytes( size_t count )
{
    std::vector<uint8_t> result( count );
    for( auto &b : result )
        b = getByte();
    return result;
}

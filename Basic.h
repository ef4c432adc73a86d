#pragma once

#include <type_traits>
#include <limits>
#include <cmath>

template<typename A, typename B>
inline decltype( A() + B() ) Min( A a, B b )
{
    static_assert( std::is_arithmetic_v<A> &&std::is_arithmetic_v<B> );
    static_assert( std::is_unsigned_v<A> == std::is_unsigned_v<B> );
    if( a < b )
        return a;
    return b;
}

template<typename A, typename B>
inline decltype( A() + B() ) Max( A a, B b )
{
    static_assert( std::is_arithmetic_v<A> &&std::is_arithmetic_v<B> );
    static_assert( std::is_unsigned_v<A> == std::is_unsigned_v<B> );
    if( a > b )
        return a;
    return b;
}

// Keeps a in [low, high]
template<typename A>
inline A Clamp( A a, A low, A high )
{
    static_assert( std::is_arithmetic_v<A> );
    if( a < low )
        return low;
    if( a > high )
        return high;
    return a;
}

template<typename A>
inline A Abs( A a )
{
    static_assert( std::is_arithmetic_v<A> );
    if( a >= A( 0 ) )
        return a;
    return -a;
}

template<typename A>
A Sqrt( A a )
{
    static_assert( std::is_arithmetic_v<A> );
    return std::sqrt( a );
}

template<typename A>
A Cos( A a )
{
    static_assert( std::is_arithmetic_v<A> );
    return std::cos( a );
}

template<typename A = double>
A Pi()
{
    static_assert( std::is_floating_point_v<A> );
    return std::atan2( A( 0 ), A( -1 ) );
}

template<typename A>
A RoundDown( A a )
{
    static_assert( std::is_arithmetic_v<A> );
    return std::floor( a );
}

template<typename A>
A RoundUp( A a )
{
    static_assert( std::is_arithmetic_v<A> );
    return std::ceil( a );
}

// Half away from zero
template<typename A>
A Round( A a )
{
    static_assert( std::is_arithmetic_v<A> );
    return std::round( a );
}

// Half to even
template<typename A>
A RoundEven( A a )
{
    static_assert( std::is_floating_point_v<A> );
    A lower = std::floor( a );
    A fraction = a - lower;
    if( fraction > A( 0.5 ) )
        return lower + 1;
    if( fraction < A( 0.5 ) )
        return lower;
    return std::fmod( lower, A( 2 ) ) == 0 ? lower : lower + 1;
}

// Ceiling of a / b for positive integers
template<typename A>
inline A DivUp( A a, A b )
{
    static_assert( std::is_integral_v<A> );
    return ( a + b - 1 ) / b;
}

void copy( void *destination, const void *source, size_t bytes );
void clear( void *destination, size_t bytes );
bool compare( const void *source0, const void *source1, size_t bytes );
size_t stringLength( const char *string );

#pragma once

#include <cstdint>
#include <vector>

#include "Exception.h"

// Adam7 interlacing, https://www.w3.org/TR/png/#8Interlace

namespace RasterCodec
{
// Starting offsets and increments of the seven passes
constexpr unsigned adam7Start[7][2] =
{
    {0, 0}, {4, 0}, {0, 4}, {2, 0}, {0, 2}, {1, 0}, {0, 1}
};

constexpr unsigned adam7Increment[7][2] =
{
    {8, 8}, {8, 8}, {4, 8}, {4, 4}, {2, 4}, {2, 2}, {1, 2}
};

struct Adam7Step
{
    unsigned startX, startY, incX, incY;

    explicit Adam7Step( unsigned pass );

    uint32_t x( uint32_t passX ) const
    {
        return startX + incX * passX;
    }

    uint32_t y( uint32_t passY ) const
    {
        return startY + incY * passY;
    }
};

// Reduced image dimensions of one pass
struct Adam7Size
{
    uint32_t columns, rows;

    Adam7Size( const Adam7Step &step, uint32_t w, uint32_t h );

    bool empty() const
    {
        return columns == 0 || rows == 0;
    }
};

// Splits a full image of `stride` elements per pixel into 7 reduced images, empty passes stay empty
template<typename T>
std::vector<std::vector<T>> interlace( const std::vector<T> &image, uint32_t w, uint32_t h, unsigned stride )
{
    makeException( image.size() == size_t( w ) * h * stride );

    std::vector<std::vector<T>> passes( 7 );
    for( unsigned pass = 0; pass < 7; ++pass )
    {
        Adam7Step step( pass );
        Adam7Size size( step, w, h );
        if( size.empty() )
            continue;

        auto &reduced = passes[pass];
        reduced.reserve( size_t( size.columns ) * size.rows * stride );
        for( uint32_t py = 0; py < size.rows; ++py )
        {
            for( uint32_t px = 0; px < size.columns; ++px )
            {
                auto source = ( size_t( step.y( py ) ) * w + step.x( px ) ) * stride;
                reduced.insert( reduced.end(), image.begin() + source, image.begin() + source + stride );
            }
        }
    }
    return passes;
}

// Places every pass element at its final position
template<typename T>
std::vector<T> deinterlace( const std::vector<std::vector<T>> &passes, uint32_t w, uint32_t h, unsigned stride )
{
    makeException( passes.size() == 7 );

    std::vector<T> image( size_t( w ) * h * stride );
    for( unsigned pass = 0; pass < 7; ++pass )
    {
        Adam7Step step( pass );
        Adam7Size size( step, w, h );
        makeException( passes[pass].size() == size_t( size.columns ) * size.rows * stride );

        size_t source = 0;
        for( uint32_t py = 0; py < size.rows; ++py )
        {
            for( uint32_t px = 0; px < size.columns; ++px )
            {
                auto target = ( size_t( step.y( py ) ) * w + step.x( px ) ) * stride;
                for( unsigned k = 0; k < stride; ++k )
                    image[target + k] = passes[pass][source++];
            }
        }
    }
    return image;
}
}

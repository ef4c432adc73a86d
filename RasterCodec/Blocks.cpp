#include "RasterCodec/Blocks.h"

#include <string>

#include "RasterCodec/Validation.h"
#include "RasterCodec/Errors.h"
#include "Basic.h"

namespace RasterCodec
{
MCUGrid calculateMCUGrid( uint32_t width, uint32_t height )
{
    MCUGrid grid;
    grid.blocksX = DivUp<uint32_t>( width, 8 );
    grid.blocksY = DivUp<uint32_t>( height, 8 );
    grid.paddedWidth = grid.blocksX * 8;
    grid.paddedHeight = grid.blocksY * 8;
    grid.totalBlocks = size_t( grid.blocksX ) * grid.blocksY;
    return grid;
}

static void checkBlock( uint32_t width, uint32_t height, uint32_t blockX, uint32_t blockY )
{
    auto grid = calculateMCUGrid( width, height );
    if( blockX >= grid.blocksX || blockY >= grid.blocksY )
    {
        throw RangeError( "block ( " + std::to_string( blockX ) + ", " + std::to_string( blockY ) + " ) is outside the " +
                          std::to_string( grid.blocksX ) + "x" + std::to_string( grid.blocksY ) + " grid" );
    }
}

Block extractBlock( const std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, unsigned channels, unsigned channel,
                    uint32_t blockX, uint32_t blockY, std::optional<double> fill )
{
    validatePixelBuffer( pixels, width, height, channels );
    makeException( channel < channels );
    checkBlock( width, height, blockX, blockY );

    Block block;
    for( unsigned y = 0; y < 8; ++y )
    {
        for( unsigned x = 0; x < 8; ++x )
        {
            uint32_t px = blockX * 8 + x;
            uint32_t py = blockY * 8 + y;

            if( fill && ( px >= width || py >= height ) )
            {
                block[y * 8 + x] = *fill;
                continue;
            }

            px = Min( px, width - 1 );
            py = Min( py, height - 1 );
            block[y * 8 + x] = pixels[( size_t( py ) * width + px ) * channels + channel];
        }
    }
    return block;
}

void placeBlock( std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, unsigned channels, unsigned channel,
                 uint32_t blockX, uint32_t blockY, const Block &block )
{
    validatePixelBuffer( pixels, width, height, channels );
    makeException( channel < channels );
    checkBlock( width, height, blockX, blockY );

    for( unsigned y = 0; y < 8; ++y )
    {
        uint32_t py = blockY * 8 + y;
        if( py >= height )
            break;

        for( unsigned x = 0; x < 8; ++x )
        {
            uint32_t px = blockX * 8 + x;
            if( px >= width )
                break;

            double value = Clamp( Round( block[y * 8 + x] ), 0.0, 255.0 );
            pixels[( size_t( py ) * width + px ) * channels + channel] = uint8_t( value );
        }
    }
}

std::vector<std::vector<Block>> separateChannels( const std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, unsigned channels )
{
    validatePixelBuffer( pixels, width, height, channels );
    auto grid = calculateMCUGrid( width, height );

    std::vector<std::vector<Block>> result( channels );
    for( unsigned c = 0; c < channels; ++c )
    {
        result[c].reserve( grid.totalBlocks );
        for( uint32_t by = 0; by < grid.blocksY; ++by )
        {
            for( uint32_t bx = 0; bx < grid.blocksX; ++bx )
                result[c].push_back( extractBlock( pixels, width, height, channels, c, bx, by ) );
        }
    }
    return result;
}

std::vector<uint8_t> combineChannels( const std::vector<std::vector<Block>> &channelBlocks, uint32_t width, uint32_t height, unsigned channels )
{
    auto grid = calculateMCUGrid( width, height );
    if( channelBlocks.size() != channels )
        throw SizeMismatchError( "expected " + std::to_string( channels ) + " channels, got " + std::to_string( channelBlocks.size() ) );

    std::vector<uint8_t> pixels( size_t( width ) * height * channels );
    for( unsigned c = 0; c < channels; ++c )
    {
        if( channelBlocks[c].size() != grid.totalBlocks )
        {
            throw SizeMismatchError( "channel " + std::to_string( c ) + " holds " + std::to_string( channelBlocks[c].size() ) +
                                     " blocks, expected " + std::to_string( grid.totalBlocks ) );
        }

        size_t i = 0;
        for( uint32_t by = 0; by < grid.blocksY; ++by )
        {
            for( uint32_t bx = 0; bx < grid.blocksX; ++bx )
                placeBlock( pixels, width, height, channels, c, bx, by, channelBlocks[c][i++] );
        }
    }
    return pixels;
}

uint8_t Plane::at( int64_t x, int64_t y ) const
{
    x = Clamp<int64_t>( x, 0, int64_t( width ) - 1 );
    y = Clamp<int64_t>( y, 0, int64_t( height ) - 1 );
    return samples[size_t( y ) * width + size_t( x )];
}

Plane extractPlane( const std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, unsigned channels, unsigned channel )
{
    validatePixelBuffer( pixels, width, height, channels );
    makeException( channel < channels );

    Plane plane;
    plane.width = width;
    plane.height = height;
    plane.samples.resize( size_t( width ) * height );
    for( size_t i = 0; i < plane.samples.size(); ++i )
        plane.samples[i] = pixels[i * channels + channel];
    return plane;
}

Plane downsample( const Plane &plane, unsigned factorX, unsigned factorY )
{
    makeException( factorX > 0 && factorY > 0 );
    if( factorX == 1 && factorY == 1 )
        return plane;

    Plane result;
    result.width = DivUp<uint32_t>( plane.width, factorX );
    result.height = DivUp<uint32_t>( plane.height, factorY );
    result.samples.resize( size_t( result.width ) * result.height );

    unsigned count = factorX * factorY;
    for( uint32_t y = 0; y < result.height; ++y )
    {
        for( uint32_t x = 0; x < result.width; ++x )
        {
            unsigned sum = 0;
            for( unsigned dy = 0; dy < factorY; ++dy )
            {
                for( unsigned dx = 0; dx < factorX; ++dx )
                    sum += plane.at( int64_t( x ) * factorX + dx, int64_t( y ) * factorY + dy );
            }
            result.samples[size_t( y ) * result.width + x] = uint8_t( ( sum + count / 2 ) / count );
        }
    }
    return result;
}

std::vector<uint8_t> upsample( const Plane &plane, uint32_t width, uint32_t height, double ratioX, double ratioY )
{
    makeException( plane.width > 0 && plane.height > 0 );

    std::vector<uint8_t> result( size_t( width ) * height );
    if( ratioX == 1 && ratioY == 1 )
    {
        for( uint32_t y = 0; y < height; ++y )
        {
            for( uint32_t x = 0; x < width; ++x )
                result[size_t( y ) * width + x] = plane.at( x, y );
        }
        return result;
    }

    for( uint32_t y = 0; y < height; ++y )
    {
        double sy = Max( ( y + 0.5 ) * ratioY - 0.5, 0.0 );
        auto y0 = int64_t( RoundDown( sy ) );
        double wy = sy - y0;

        for( uint32_t x = 0; x < width; ++x )
        {
            double sx = Max( ( x + 0.5 ) * ratioX - 0.5, 0.0 );
            auto x0 = int64_t( RoundDown( sx ) );
            double wx = sx - x0;

            double value = ( 1 - wx ) * ( 1 - wy ) * plane.at( x0, y0 ) + wx * ( 1 - wy ) * plane.at( x0 + 1, y0 ) +
                           ( 1 - wx ) * wy * plane.at( x0, y0 + 1 ) + wx * wy * plane.at( x0 + 1, y0 + 1 );

            result[size_t( y ) * width + x] = uint8_t( Clamp( Round( value ), 0.0, 255.0 ) );
        }
    }
    return result;
}
}

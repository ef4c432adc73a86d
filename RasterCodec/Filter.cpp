#include "RasterCodec/Filter.h"

#include <string>

#include "RasterCodec/Errors.h"
#include "Basic.h"

namespace RasterCodec
{
FilterType toFilterType( unsigned value )
{
    if( value >= filterTypeCount )
        throw StructuralError( "invalid filter type " + std::to_string( value ) );
    return FilterType( value );
}

uint8_t paethPredictor( int a, int b, int c )
{
    int p = a + b - c;
    int pa = Abs( p - a );
    int pb = Abs( p - b );
    int pc = Abs( p - c );
    if( pa <= pb && pa <= pc )
        return uint8_t( a );
    if( pb <= pc )
        return uint8_t( b );
    return uint8_t( c );
}

// `apply` subtracts the predictor, otherwise adds it to the already reconstructed bytes
static std::vector<uint8_t> runFilter( const std::vector<uint8_t> &line, const std::vector<uint8_t> &previous, FilterType type, unsigned bytesPerPixel, bool apply )
{
    makeException( bytesPerPixel > 0 );
    makeException( previous.empty() || previous.size() == line.size() );

    size_t width = line.size();
    std::vector<uint8_t> result( width );

    // Predictors read unfiltered bytes: the input when filtering, the output when reconstructing
    const auto &orig = apply ? line : result;

    auto combine = [apply]( uint8_t value, int predictor )
    {
        return apply ? uint8_t( value - predictor ) : uint8_t( value + predictor );
    };

    switch( type )
    {
    case FilterType::None:
        result = line;
        break;
    case FilterType::Sub:
        for( size_t i = 0; i < width; ++i )
        {
            int left = i >= bytesPerPixel ? orig[i - bytesPerPixel] : 0;
            result[i] = combine( line[i], left );
        }
        break;
    case FilterType::Up:
        for( size_t i = 0; i < width; ++i )
        {
            int up = !previous.empty() ? previous[i] : 0;
            result[i] = combine( line[i], up );
        }
        break;
    case FilterType::Average:
        for( size_t i = 0; i < width; ++i )
        {
            int left = i >= bytesPerPixel ? orig[i - bytesPerPixel] : 0;
            int up = !previous.empty() ? previous[i] : 0;
            result[i] = combine( line[i], ( left + up ) / 2 );
        }
        break;
    case FilterType::Paeth:
        for( size_t i = 0; i < width; ++i )
        {
            int left = i >= bytesPerPixel ? orig[i - bytesPerPixel] : 0;
            int up = !previous.empty() ? previous[i] : 0;
            int upLeft = i >= bytesPerPixel && !previous.empty() ? previous[i - bytesPerPixel] : 0;
            result[i] = combine( line[i], paethPredictor( left, up, upLeft ) );
        }
        break;
    }
    return result;
}

std::vector<uint8_t> applyFilter( const std::vector<uint8_t> &line, const std::vector<uint8_t> &previous, FilterType type, unsigned bytesPerPixel )
{
    return runFilter( line, previous, type, bytesPerPixel, true );
}

std::vector<uint8_t> reverseFilter( const std::vector<uint8_t> &filtered, const std::vector<uint8_t> &previous, FilterType type, unsigned bytesPerPixel )
{
    return runFilter( filtered, previous, type, bytesPerPixel, false );
}

unsigned filterScore( const std::vector<uint8_t> &filtered )
{
    unsigned score = 0;
    for( auto v : filtered )
    {
        int8_t diff = int8_t( v );
        score += Abs( int( diff ) );
    }
    return score;
}

FilterType selectFilter( const std::vector<uint8_t> &line, const std::vector<uint8_t> &previous, unsigned bytesPerPixel )
{
    FilterType best = FilterType::None;
    unsigned bestScore = filterScore( line );
    for( unsigned f = 1; f < filterTypeCount; ++f )
    {
        auto score = filterScore( applyFilter( line, previous, FilterType( f ), bytesPerPixel ) );
        if( score < bestScore )
        {
            bestScore = score;
            best = FilterType( f );
        }
    }
    return best;
}

std::vector<uint8_t> filterScanlines( const std::vector<uint8_t> &raw, uint32_t columns, uint32_t rows, unsigned bitsPerPixel, std::optional<FilterType> fixed )
{
    size_t lineBytes = DivUp<uint64_t>( uint64_t( columns ) * bitsPerPixel, 8 );
    unsigned bytesPerPixel = Max( bitsPerPixel / 8, 1u );
    makeException( raw.size() == lineBytes * rows );

    std::vector<uint8_t> result;
    result.reserve( rows * ( lineBytes + 1 ) );

    std::vector<uint8_t> previous, line;
    for( uint32_t y = 0; y < rows; ++y )
    {
        line.assign( raw.begin() + y * lineBytes, raw.begin() + ( y + 1 ) * lineBytes );

        auto type = fixed ? *fixed : selectFilter( line, previous, bytesPerPixel );
        auto filtered = applyFilter( line, previous, type, bytesPerPixel );

        result.push_back( uint8_t( type ) );
        result.insert( result.end(), filtered.begin(), filtered.end() );

        previous.swap( line );
    }
    return result;
}

std::vector<uint8_t> unfilterScanlines( const uint8_t *data, size_t size, uint32_t columns, uint32_t rows, unsigned bitsPerPixel )
{
    size_t lineBytes = DivUp<uint64_t>( uint64_t( columns ) * bitsPerPixel, 8 );
    unsigned bytesPerPixel = Max( bitsPerPixel / 8, 1u );

    if( size != rows * ( lineBytes + 1 ) )
    {
        throw PixelDataSizeError( "filtered data holds " + std::to_string( size ) + " bytes, expected " +
                                  std::to_string( rows * ( lineBytes + 1 ) ) );
    }

    std::vector<uint8_t> result;
    result.reserve( rows * lineBytes );

    // Each line depends on the reconstructed previous one
    std::vector<uint8_t> previous, line;
    for( uint32_t y = 0; y < rows; ++y )
    {
        auto start = data + y * ( lineBytes + 1 );
        auto type = toFilterType( start[0] );

        line.assign( start + 1, start + 1 + lineBytes );
        line = reverseFilter( line, previous, type, bytesPerPixel );

        result.insert( result.end(), line.begin(), line.end() );
        previous.swap( line );
    }
    return result;
}

std::array<size_t, filterTypeCount> analyzeFilterUsage( const std::vector<uint8_t> &filtered, uint32_t columns, uint32_t rows, unsigned bitsPerPixel )
{
    size_t lineBytes = DivUp<uint64_t>( uint64_t( columns ) * bitsPerPixel, 8 );
    if( filtered.size() != rows * ( lineBytes + 1 ) )
        throw PixelDataSizeError( "filtered data size does not match the scanline geometry" );

    std::array<size_t, filterTypeCount> usage {};
    for( uint32_t y = 0; y < rows; ++y )
        ++usage[size_t( toFilterType( filtered[y * ( lineBytes + 1 )] ) )];
    return usage;
}
}

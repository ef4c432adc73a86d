#include "Tests/Fixtures.h"

#include "RandomNumber.h"
#include "Basic.h"

std::vector<uint8_t> solidPixels( uint32_t w, uint32_t h, uint8_t r, uint8_t g, uint8_t b, uint8_t a )
{
    std::vector<uint8_t> pixels;
    pixels.reserve( size_t( w ) * h * 4 );
    for( size_t i = 0; i < size_t( w ) * h; ++i )
        pixels.insert( pixels.end(), { r, g, b, a } );
    return pixels;
}

std::vector<uint8_t> gradientPixels( uint32_t w, uint32_t h )
{
    std::vector<uint8_t> pixels;
    pixels.reserve( size_t( w ) * h * 4 );
    for( uint32_t y = 0; y < h; ++y )
    {
        for( uint32_t x = 0; x < w; ++x )
        {
            auto r = uint8_t( w > 1 ? x * 255 / ( w - 1 ) : 0 );
            auto g = uint8_t( h > 1 ? y * 255 / ( h - 1 ) : 0 );
            pixels.insert( pixels.end(), { r, g, 128, 255 } );
        }
    }
    return pixels;
}

std::vector<uint8_t> checkerboardPixels( uint32_t w, uint32_t h, uint32_t cell )
{
    std::vector<uint8_t> pixels;
    pixels.reserve( size_t( w ) * h * 4 );
    for( uint32_t y = 0; y < h; ++y )
    {
        for( uint32_t x = 0; x < w; ++x )
        {
            uint8_t v = ( ( x / cell ) + ( y / cell ) ) % 2 ? 255 : 0;
            pixels.insert( pixels.end(), { v, v, v, 255 } );
        }
    }
    return pixels;
}

std::vector<uint8_t> randomPixels( uint32_t w, uint32_t h, int64_t seed, bool opaque )
{
    RandomNumber random( seed );
    auto pixels = random.getBytes( size_t( w ) * h * 4 );
    if( opaque )
    {
        for( size_t i = 3; i < pixels.size(); i += 4 )
            pixels[i] = 255;
    }
    return pixels;
}

int maxDifference( const std::vector<uint8_t> &a, const std::vector<uint8_t> &b )
{
    makeException( a.size() == b.size() );

    int result = 0;
    for( size_t i = 0; i < a.size(); ++i )
    {
        if( i % 4 != 3 )
            result = Max( result, Abs( int( a[i] ) - int( b[i] ) ) );
    }
    return result;
}

double meanDifference( const std::vector<uint8_t> &a, const std::vector<uint8_t> &b )
{
    makeException( a.size() == b.size() && !a.empty() );

    double sum = 0;
    size_t count = 0;
    for( size_t i = 0; i < a.size(); ++i )
    {
        if( i % 4 == 3 )
            continue;
        sum += Abs( int( a[i] ) - int( b[i] ) );
        ++count;
    }
    return sum / count;
}

bool contains( const std::string &text, const std::string &fragment )
{
    return text.find( fragment ) != std::string::npos;
}

LogCapture::LogCapture() : sink( std::make_shared<MemorySink>() ), previous( Log::threshold() )
{
    Log::clearSinks();
    Log::addSink( sink );
    Log::threshold( LogLevel::Warning );
}

LogCapture::~LogCapture()
{
    Log::removeSink( sink );
    Log::threshold( previous );
}

size_t LogCapture::warnings() const
{
    return sink->count( LogLevel::Warning );
}

bool LogCapture::logged( const std::string &fragment ) const
{
    for( auto &entry : sink->entries() )
    {
        if( contains( entry.message, fragment ) )
            return true;
    }
    return false;
}

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Exception.h"
#include "Log.h"
#include "Tests.h"

// Registration of every test area
void chunkTests( Tests &tests );
void headerTests( Tests &tests );
void filterTests( Tests &tests );
void pixelTests( Tests &tests );
void interlaceTests( Tests &tests );
void zlibTests( Tests &tests );
void metadataTests( Tests &tests );
void pngTests( Tests &tests );
void colorSpaceTests( Tests &tests );
void blockTests( Tests &tests );
void dctTests( Tests &tests );
void quantizationTests( Tests &tests );
void huffmanTests( Tests &tests );
void markerTests( Tests &tests );
void jpegTests( Tests &tests );
void logTests( Tests &tests );

// RGBA images
std::vector<uint8_t> solidPixels( uint32_t w, uint32_t h, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255 );
std::vector<uint8_t> gradientPixels( uint32_t w, uint32_t h );
std::vector<uint8_t> checkerboardPixels( uint32_t w, uint32_t h, uint32_t cell );
std::vector<uint8_t> randomPixels( uint32_t w, uint32_t h, int64_t seed, bool opaque );

// Largest and mean absolute difference over the RGB channels
int maxDifference( const std::vector<uint8_t> &a, const std::vector<uint8_t> &b );
double meanDifference( const std::vector<uint8_t> &a, const std::vector<uint8_t> &b );

bool contains( const std::string &text, const std::string &fragment );

// Fails unless `function` throws E whose message holds `fragment`
template<typename E, typename F>
void expectThrow( F function, const std::string &fragment = {} )
{
    bool thrown = false;
    try
    {
        function();
    }
    catch( const E &e )
    {
        thrown = true;
        makeException( fragment.empty() || contains( Exception::encode( e.message() ), fragment ) );
    }
    makeException( thrown );
}

// Routes log records into memory while alive
class LogCapture
{
public:
    LogCapture();
    ~LogCapture();

    size_t warnings() const;
    bool logged( const std::string &fragment ) const;
private:
    std::shared_ptr<MemorySink> sink;
    LogLevel previous;
};

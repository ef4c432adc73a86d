#include "RasterCodec/Zlib.h"

#include <limits>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wall"
#pragma GCC diagnostic ignored "-Wextra"
#pragma GCC diagnostic ignored "-Wzero-as-null-pointer-constant"
#include <zlib.h>
#pragma GCC diagnostic pop

#include "RasterCodec/Errors.h"
#include "Basic.h"
#include "Log.h"

namespace RasterCodec
{
std::vector<uint8_t> zlibCompress( const uint8_t *data, size_t size, int level )
{
    if( level < 0 || level > 9 )
        throw InvalidOptionError( "compression level must be in 0..9, got " + std::to_string( level ), atField( "compressionLevel" ) );

    std::vector<uint8_t> outBuffer( compressBound( uLong( size ) ) );

    z_stream strm = {};
    if( deflateInit( &strm, level ) != Z_OK )
        throw CompressionError( "deflateInit failed" );

    strm.avail_in = uInt( size );
    strm.next_in = const_cast<Bytef *>( data );
    strm.avail_out = uInt( outBuffer.size() );
    strm.next_out = outBuffer.data();

    auto result = deflate( &strm, Z_FINISH );
    deflateEnd( &strm );
    if( result != Z_STREAM_END )
        throw CompressionError( "deflate did not finish the stream" );

    outBuffer.resize( outBuffer.size() - strm.avail_out );
    return outBuffer;
}

// DEFLATE expands at most about 1032 to 1
constexpr size_t maxInflateRatio = 1032;

std::vector<uint8_t> zlibDecompress( const uint8_t *data, size_t size, size_t sizeHint, size_t limit )
{
    z_stream strm = {};
    strm.avail_in = uInt( size );
    strm.next_in = const_cast<Bytef *>( data );
    if( inflateInit( &strm ) != Z_OK )
        throw CompressionError( "inflateInit failed" );

    const size_t unbounded = std::numeric_limits<size_t>::max();
    size_t ceiling = limit == unbounded ? unbounded : limit + 1;
    size_t reachable = size > unbounded / maxInflateRatio ? unbounded : size * maxInflateRatio;

    std::vector<uint8_t> outBuffer( Min( Max( Min( sizeHint, reachable ), size_t( 1024 ) ), ceiling ) );
    size_t produced = 0;

    int result = Z_OK;
    while( result != Z_STREAM_END )
    {
        if( produced == outBuffer.size() )
        {
            if( produced == ceiling )
            {
                Log::debug( "inflate stopped past " + std::to_string( limit ) + " bytes", "zlib" );
                break;
            }
            outBuffer.resize( outBuffer.size() > ceiling / 2 ? ceiling : outBuffer.size() * 2 );
        }

        // avail_out is 32-bit, larger buffers are filled over several calls
        strm.avail_out = uInt( Min( outBuffer.size() - produced, size_t( std::numeric_limits<uInt>::max() ) ) );
        strm.next_out = outBuffer.data() + produced;

        result = inflate( &strm, Z_NO_FLUSH );
        produced = size_t( strm.next_out - outBuffer.data() );

        if( result == Z_STREAM_END )
            break;

        if( result == Z_BUF_ERROR && strm.avail_in == 0 && strm.avail_out > 0 )
        {
            inflateEnd( &strm );
            throw TruncatedDataError( "zlib stream ends before its final block" );
        }

        if( result != Z_OK && result != Z_BUF_ERROR )
        {
            std::string reason = strm.msg ? strm.msg : "inflate error " + std::to_string( result );
            inflateEnd( &strm );
            throw CompressionError( "corrupt zlib stream: " + reason );
        }
    }

    inflateEnd( &strm );
    outBuffer.resize( produced );
    return outBuffer;
}
}

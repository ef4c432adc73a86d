#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace RasterCodec
{
constexpr int defaultCompressionLevel = 6;

// zlib-wrapped DEFLATE, level in 0..9 (InvalidOptionError otherwise)
std::vector<uint8_t> zlibCompress( const uint8_t *data, size_t size, int level = defaultCompressionLevel );

inline std::vector<uint8_t> zlibCompress( const std::vector<uint8_t> &data, int level = defaultCompressionLevel )
{
    return zlibCompress( data.data(), data.size(), level );
}

// Throws CompressionError for a corrupt stream, TruncatedDataError when it ends early
// `sizeHint` is the expected output size, 0 if unknown
// Inflation stops once the output passes `limit`, the result then holds limit + 1 bytes
std::vector<uint8_t> zlibDecompress( const uint8_t *data, size_t size, size_t sizeHint = 0,
                                     size_t limit = std::numeric_limits<size_t>::max() );

inline std::vector<uint8_t> zlibDecompress( const std::vector<uint8_t> &data, size_t sizeHint = 0,
                                            size_t limit = std::numeric_limits<size_t>::max() )
{
    return zlibDecompress( data.data(), data.size(), sizeHint, limit );
}
}

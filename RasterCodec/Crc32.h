#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <array>

namespace RasterCodec
{
// IEEE 802.3 CRC-32 (reflected polynomial 0xEDB88320) as used by PNG chunks

// Built on first use, read-only afterwards
const std::array<uint32_t, 256> &crc32Table();

// `crc` is a finished value from a previous call, 0 to start
uint32_t crc32Update( uint32_t crc, const void *data, size_t bytes );

inline uint32_t crc32( const void *data, size_t bytes )
{
    return crc32Update( 0, data, bytes );
}

inline uint32_t crc32( const std::vector<uint8_t> &data )
{
    return crc32Update( 0, data.data(), data.size() );
}
}

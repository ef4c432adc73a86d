#include "RasterCodec/Crc32.h"

namespace RasterCodec
{
const std::array<uint32_t, 256> &crc32Table()
{
    static const std::array<uint32_t, 256> table = []()
    {
        std::array<uint32_t, 256> result {};
        for( uint32_t n = 0; n < 256; ++n )
        {
            uint32_t c = n;
            for( int k = 0; k < 8; ++k )
                c = ( c & 1 ) ? 0xEDB88320u ^ ( c >> 1 ) : c >> 1;
            result[n] = c;
        }
        return result;
    }();
    return table;
}

uint32_t crc32Update( uint32_t crc, const void *data, size_t bytes )
{
    const auto &table = crc32Table();
    auto p = ( const uint8_t * )data;

    uint32_t c = crc ^ 0xFFFFFFFFu;
    for( size_t i = 0; i < bytes; ++i )
        c = table[( c ^ p[i] ) & 0xFF] ^ ( c >> 8 );
    return c ^ 0xFFFFFFFFu;
}
}

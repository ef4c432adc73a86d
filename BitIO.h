#pragma once

#include <cstdint>
#include <vector>

#include "Exception.h"
#include "Basic.h"

using BitList = uint64_t;

class ReaderBase
{
public:
    virtual bool read( long long unsigned bits, BitList &value ) = 0;
    virtual bool read( long long unsigned bytes, void *value ) = 0;
    virtual ~ReaderBase()
    {}
};

class WriterBase
{
public:
    virtual bool write( long long unsigned bits, BitList value ) = 0;
    virtual bool write( long long unsigned bytes, const void *value ) = 0;
    virtual ~WriterBase()
    {}
};

// Byte cursor over a caller-owned buffer, never reads past `end`
class SimpleReader : public ReaderBase
{
private:
    const uint8_t *start, *p, *end;
public:
    SimpleReader( const void *data, long long unsigned bytes )
    {
        start = p = ( const uint8_t * )data;
        end = p + bytes;
    }

    bool read( long long unsigned, BitList & ) override
    {
        makeException( false );
        return false;
    }

    // A null value skips the bytes
    bool read( long long unsigned bytes, void *value ) override
    {
        if( bytes > remaining() )
            return false;
        if( value )
            copy( value, p, bytes );
        p += bytes;
        return true;
    }

    bool skip( long long unsigned bytes )
    {
        return read( bytes, nullptr );
    }

    size_t position() const
    {
        return p - start;
    }

    size_t remaining() const
    {
        return end - p;
    }

    const uint8_t *current() const
    {
        return p;
    }
};

// MSB-first bit reader, byte reads require alignment
class Reader : public ReaderBase
{
protected:
    const uint8_t *p;
    unsigned bitOffset;
    long long unsigned bitPosition, bitVolume;
public:
    Reader( const void *link, long long unsigned bytes, long long unsigned offset )
    {
        makeException( bytes >= offset );

        p = ( const uint8_t * )link + offset;
        bitOffset = 0;
        bitVolume = ( bytes - offset ) * 8;
        bitPosition = 0;
    }

    bool read( long long unsigned bits, BitList &value ) override
    {
        makeException( bits <= 64 );
        if( bitPosition + bits > bitVolume )
            return false;
        bitPosition += bits;

        value = 0;
        while( bits > 0 )
        {
            unsigned available = 8 - bitOffset;
            unsigned take = bits < available ? unsigned( bits ) : available;
            unsigned shift = available - take;

            BitList part = ( *p >> shift ) & ( ( 1u << take ) - 1 );
            value = ( value << take ) | part;

            bits -= take;
            bitOffset += take;
            if( bitOffset == 8 )
            {
                bitOffset = 0;
                ++p;
            }
        }
        return true;
    }

    bool read( long long unsigned bytes, void *value ) override
    {
        makeException( bitOffset == 0 );

        if( bitPosition + 8 * bytes > bitVolume )
            return false;
        bitPosition += 8 * bytes;

        if( value )
            copy( value, p, bytes );
        p += bytes;
        return true;
    }

    // Skips the padding bits up to the next byte boundary
    void align()
    {
        if( bitOffset == 0 )
            return;
        bitPosition += 8 - bitOffset;
        bitOffset = 0;
        ++p;
    }

    long long unsigned bytesLeft() const
    {
        makeException( bitOffset == 0 );
        return ( bitVolume - bitPosition ) / 8;
    }
};

// Appends to a growable buffer, MSB-first at bit level
class VectorWriter : public WriterBase
{
private:
    std::vector<uint8_t> &target;
    unsigned bitOffset;
public:
    explicit VectorWriter( std::vector<uint8_t> &t ) : target( t ), bitOffset( 0 )
    {}

    bool write( long long unsigned bits, BitList value ) override
    {
        makeException( bits <= 64 );
        while( bits > 0 )
        {
            if( bitOffset == 0 )
                target.push_back( 0 );

            unsigned available = 8 - bitOffset;
            unsigned take = bits < available ? unsigned( bits ) : available;

            BitList part = ( value >> ( bits - take ) ) & ( ( 1u << take ) - 1 );
            target.back() = uint8_t( target.back() | ( part << ( available - take ) ) );

            bits -= take;
            bitOffset = ( bitOffset + take ) % 8;
        }
        return true;
    }

    bool write( long long unsigned bytes, const void *value ) override
    {
        makeException( bitOffset == 0 );
        auto data = ( const uint8_t * )value;
        target.insert( target.end(), data, data + bytes );
        return true;
    }

    // Remaining bits of the current byte stay zero
    void align()
    {
        bitOffset = 0;
    }

    size_t size() const
    {
        return target.size();
    }
};

inline uint16_t swapBe16( uint16_t v ) noexcept
{
    return uint16_t( ( v << 8 ) | ( v >> 8 ) );
}

inline uint32_t swapBe32( uint32_t v ) noexcept
{
    return ( ( v & 0x000000FFU ) << 24 ) |
           ( ( v & 0x0000FF00U ) << 8 )  |
           ( ( v & 0x00FF0000U ) >> 8 )  |
           ( ( v & 0xFF000000U ) >> 24 );
}

inline uint16_t readBe16( const uint8_t *p ) noexcept
{
    return uint16_t( ( p[0] << 8 ) | p[1] );
}

inline uint32_t readBe32( const uint8_t *p ) noexcept
{
    return ( uint32_t( p[0] ) << 24 ) | ( uint32_t( p[1] ) << 16 ) | ( uint32_t( p[2] ) << 8 ) | uint32_t( p[3] );
}

inline void appendBe16( std::vector<uint8_t> &out, uint16_t v )
{
    out.push_back( uint8_t( v >> 8 ) );
    out.push_back( uint8_t( v ) );
}

inline void appendBe32( std::vector<uint8_t> &out, uint32_t v )
{
    out.push_back( uint8_t( v >> 24 ) );
    out.push_back( uint8_t( v >> 16 ) );
    out.push_back( uint8_t( v >> 8 ) );
    out.push_back( uint8_t( v ) );
}

#include "RasterCodec/Huffman.h"

#include <string>

#include "RasterCodec/Errors.h"

namespace RasterCodec
{
const HuffmanSpec standardDcLuminance =
{
    { 0, 1, 5, 1, 1, 1, 1, 1, 1, 0, 0, 0, 0, 0, 0, 0 },
    { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11 }
};

const HuffmanSpec standardDcChrominance =
{
    { 0, 3, 1, 1, 1, 1, 1, 1, 1, 1, 1, 0, 0, 0, 0, 0 },
    { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11 }
};

const HuffmanSpec standardAcLuminance =
{
    { 0, 2, 1, 3, 3, 2, 4, 3, 5, 5, 4, 4, 0, 0, 1, 0x7D },
    {
        0x01, 0x02, 0x03, 0x00, 0x04, 0x11, 0x05, 0x12, 0x21, 0x31, 0x41, 0x06, 0x13, 0x51, 0x61, 0x07,
        0x22, 0x71, 0x14, 0x32, 0x81, 0x91, 0xA1, 0x08, 0x23, 0x42, 0xB1, 0xC1, 0x15, 0x52, 0xD1, 0xF0,
        0x24, 0x33, 0x62, 0x72, 0x82, 0x09, 0x0A, 0x16, 0x17, 0x18, 0x19, 0x1A, 0x25, 0x26, 0x27, 0x28,
        0x29, 0x2A, 0x34, 0x35, 0x36, 0x37, 0x38, 0x39, 0x3A, 0x43, 0x44, 0x45, 0x46, 0x47, 0x48, 0x49,
        0x4A, 0x53, 0x54, 0x55, 0x56, 0x57, 0x58, 0x59, 0x5A, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68, 0x69,
        0x6A, 0x73, 0x74, 0x75, 0x76, 0x77, 0x78, 0x79, 0x7A, 0x83, 0x84, 0x85, 0x86, 0x87, 0x88, 0x89,
        0x8A, 0x92, 0x93, 0x94, 0x95, 0x96, 0x97, 0x98, 0x99, 0x9A, 0xA2, 0xA3, 0xA4, 0xA5, 0xA6, 0xA7,
        0xA8, 0xA9, 0xAA, 0xB2, 0xB3, 0xB4, 0xB5, 0xB6, 0xB7, 0xB8, 0xB9, 0xBA, 0xC2, 0xC3, 0xC4, 0xC5,
        0xC6, 0xC7, 0xC8, 0xC9, 0xCA, 0xD2, 0xD3, 0xD4, 0xD5, 0xD6, 0xD7, 0xD8, 0xD9, 0xDA, 0xE1, 0xE2,
        0xE3, 0xE4, 0xE5, 0xE6, 0xE7, 0xE8, 0xE9, 0xEA, 0xF1, 0xF2, 0xF3, 0xF4, 0xF5, 0xF6, 0xF7, 0xF8,
        0xF9, 0xFA
    }
};

const HuffmanSpec standardAcChrominance =
{
    { 0, 2, 1, 2, 4, 4, 3, 4, 7, 5, 4, 4, 0, 1, 2, 0x77 },
    {
        0x00, 0x01, 0x02, 0x03, 0x11, 0x04, 0x05, 0x21, 0x31, 0x06, 0x12, 0x41, 0x51, 0x07, 0x61, 0x71,
        0x13, 0x22, 0x32, 0x81, 0x08, 0x14, 0x42, 0x91, 0xA1, 0xB1, 0xC1, 0x09, 0x23, 0x33, 0x52, 0xF0,
        0x15, 0x62, 0x72, 0xD1, 0x0A, 0x16, 0x24, 0x34, 0xE1, 0x25, 0xF1, 0x17, 0x18, 0x19, 0x1A, 0x26,
        0x27, 0x28, 0x29, 0x2A, 0x35, 0x36, 0x37, 0x38, 0x39, 0x3A, 0x43, 0x44, 0x45, 0x46, 0x47, 0x48,
        0x49, 0x4A, 0x53, 0x54, 0x55, 0x56, 0x57, 0x58, 0x59, 0x5A, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68,
        0x69, 0x6A, 0x73, 0x74, 0x75, 0x76, 0x77, 0x78, 0x79, 0x7A, 0x82, 0x83, 0x84, 0x85, 0x86, 0x87,
        0x88, 0x89, 0x8A, 0x92, 0x93, 0x94, 0x95, 0x96, 0x97, 0x98, 0x99, 0x9A, 0xA2, 0xA3, 0xA4, 0xA5,
        0xA6, 0xA7, 0xA8, 0xA9, 0xAA, 0xB2, 0xB3, 0xB4, 0xB5, 0xB6, 0xB7, 0xB8, 0xB9, 0xBA, 0xC2, 0xC3,
        0xC4, 0xC5, 0xC6, 0xC7, 0xC8, 0xC9, 0xCA, 0xD2, 0xD3, 0xD4, 0xD5, 0xD6, 0xD7, 0xD8, 0xD9, 0xDA,
        0xE2, 0xE3, 0xE4, 0xE5, 0xE6, 0xE7, 0xE8, 0xE9, 0xEA, 0xF2, 0xF3, 0xF4, 0xF5, 0xF6, 0xF7, 0xF8,
        0xF9, 0xFA
    }
};

// Codes in symbol order, produced in increasing code length order
static std::vector<HuffmanCode> generateCodes( const HuffmanSpec &spec )
{
    size_t total = 0;
    for( auto count : spec.counts )
        total += count;

    if( total != spec.symbols.size() || total > 256 )
    {
        throw StructuralError( "Huffman table declares " + std::to_string( total ) + " codes for " +
                               std::to_string( spec.symbols.size() ) + " symbols" );
    }

    std::vector<HuffmanCode> codes;
    codes.reserve( total );

    uint32_t code = 0;
    for( unsigned length = 1; length <= 16; ++length )
    {
        for( unsigned i = 0; i < spec.counts[length - 1]; ++i )
        {
            // Code must fit in 'length' bits
            if( code >= ( 1u << length ) )
                throw StructuralError( "Huffman code lengths exceed the code space" );

            codes.push_back( { uint16_t( code ), uint8_t( length ) } );
            ++code;
        }
        code <<= 1;
    }
    return codes;
}

HuffmanEncodeTable buildEncodeTable( const HuffmanSpec &spec )
{
    auto codes = generateCodes( spec );

    HuffmanEncodeTable table{};
    for( size_t i = 0; i < codes.size(); ++i )
        table[spec.symbols[i]] = codes[i];
    return table;
}

HuffmanDecodeTable buildDecodeTable( const HuffmanSpec &spec )
{
    auto codes = generateCodes( spec );

    HuffmanDecodeTable table;
    table.symbols = spec.symbols;

    int32_t p = 0;
    for( unsigned l = 1; l <= 16; ++l )
    {
        uint8_t count = spec.counts[l - 1];
        if( count )
        {
            table.valPtr[l] = p;
            table.minCode[l] = codes[p].code;
            p += count;
            table.maxCode[l] = codes[p - 1].code;
        }
        else
        {
            // Signal empty length
            table.valPtr[l] = 0;
            table.minCode[l] = 0;
            table.maxCode[l] = -1;
        }
    }
    table.valPtr[0] = table.minCode[0] = 0;
    table.maxCode[0] = -1;
    return table;
}

HuffmanSpec buildOptimizedSpec( const std::array<uint32_t, 256> &frequencies )
{
    // Symbol 256 is reserved so that no real code consists of all 1-bits
    constexpr int symbolCount = 257;

    std::array<uint64_t, symbolCount> freq;
    std::array<unsigned, symbolCount> codeSize{};
    std::array<int, symbolCount> others;

    bool any = false;
    for( int i = 0; i < 256; ++i )
    {
        freq[i] = frequencies[i];
        any = any || frequencies[i] > 0;
    }
    freq[256] = 1;
    others.fill( -1 );

    HuffmanSpec spec;
    if( !any )
    {
        spec.counts[0] = 1;
        spec.symbols.push_back( 0 );
        return spec;
    }

    while( true )
    {
        // Least frequency, ties go to the largest symbol
        int v1 = -1;
        for( int i = 0; i < symbolCount; ++i )
        {
            if( freq[i] && ( v1 < 0 || freq[i] <= freq[v1] ) )
                v1 = i;
        }

        int v2 = -1;
        for( int i = 0; i < symbolCount; ++i )
        {
            if( freq[i] && i != v1 && ( v2 < 0 || freq[i] <= freq[v2] ) )
                v2 = i;
        }

        if( v2 < 0 )
            break;

        freq[v1] += freq[v2];
        freq[v2] = 0;

        ++codeSize[v1];
        while( others[v1] >= 0 )
        {
            v1 = others[v1];
            ++codeSize[v1];
        }
        others[v1] = v2;

        ++codeSize[v2];
        while( others[v2] >= 0 )
        {
            v2 = others[v2];
            ++codeSize[v2];
        }
    }

    std::vector<unsigned> bits( symbolCount + 1, 0 );
    for( int i = 0; i < symbolCount; ++i )
    {
        if( codeSize[i] )
            ++bits[codeSize[i]];
    }

    // Move codes longer than 16 bits up the tree, ITU T.81 K.3
    for( size_t i = bits.size() - 1; i > 16; --i )
    {
        while( bits[i] > 0 )
        {
            size_t j = i - 2;
            while( bits[j] == 0 )
                --j;

            bits[i] -= 2;
            ++bits[i - 1];
            bits[j + 1] += 2;
            --bits[j];
        }
    }

    // Drop the reserved code, which is the longest
    size_t longest = 16;
    while( bits[longest] == 0 )
        --longest;
    --bits[longest];

    for( unsigned l = 1; l <= 16; ++l )
        spec.counts[l - 1] = uint8_t( bits[l] );

    // Symbols by increasing code length, then by value
    for( unsigned length = 1; length < bits.size(); ++length )
    {
        for( int s = 0; s < 256; ++s )
        {
            if( codeSize[s] == length )
                spec.symbols.push_back( uint8_t( s ) );
        }
    }
    return spec;
}

unsigned magnitudeCategory( int32_t value )
{
    uint32_t magnitude = value < 0 ? uint32_t( -int64_t( value ) ) : uint32_t( value );

    unsigned size = 0;
    while( magnitude )
    {
        ++size;
        magnitude >>= 1;
    }
    return size;
}

uint32_t encodeMagnitudeBits( int32_t value, unsigned size )
{
    if( size == 0 )
        return 0;
    if( value < 0 )
        value -= 1;
    return uint32_t( value ) & ( ( 1u << size ) - 1 );
}

int32_t extendMagnitude( uint32_t bits, unsigned size )
{
    if( size == 0 )
        return 0;

    // Extension as per JPEG HUFF_EXTEND semantics
    if( bits < ( 1u << ( size - 1 ) ) )
        return int32_t( bits ) - int32_t( ( 1u << size ) - 1 );
    return int32_t( bits );
}

BitWriter::BitWriter( std::vector<uint8_t> &t ) : target( t ), accumulator( 0 ), pending( 0 )
{}

void BitWriter::emit( uint8_t byte )
{
    target.push_back( byte );
    if( byte == 0xFF )
        target.push_back( 0x00 );
}

bool BitWriter::write( long long unsigned bits, BitList value )
{
    makeException( bits <= 32 );
    if( bits == 0 )
        return true;

    accumulator = ( accumulator << bits ) | ( value & ( ( BitList( 1 ) << bits ) - 1 ) );
    pending += unsigned( bits );

    while( pending >= 8 )
    {
        pending -= 8;
        emit( uint8_t( accumulator >> pending ) );
    }
    accumulator &= ( uint64_t( 1 ) << pending ) - 1;
    return true;
}

bool BitWriter::write( long long unsigned bytes, const void *value )
{
    makeException( pending == 0 );
    auto data = ( const uint8_t * )value;
    target.insert( target.end(), data, data + bytes );
    return true;
}

void BitWriter::flush()
{
    if( pending == 0 )
        return;

    unsigned padding = 8 - pending;
    write( padding, ( BitList( 1 ) << padding ) - 1 );
}

BitReader::BitReader( const void *data, size_t bytes )
{
    p = ( const uint8_t * )data;
    end = p + bytes;
    accumulator = 0;
    available = 0;
    consumed = 0;
    volume = uint64_t( bytes ) * 8;
}

bool BitReader::read( long long unsigned bits, BitList &value )
{
    makeException( bits <= 32 );

    while( available < bits )
    {
        uint8_t byte = 0xFF;
        if( p < end )
            byte = *p++;

        accumulator = ( accumulator << 8 ) | byte;
        available += 8;
    }

    available -= unsigned( bits );
    value = ( accumulator >> available ) & ( ( BitList( 1 ) << bits ) - 1 );
    consumed += bits;
    return true;
}

bool BitReader::read( long long unsigned, void * )
{
    makeException( false );
    return false;
}

bool BitReader::exhausted() const
{
    return consumed > volume;
}

void writeSymbol( BitWriter &writer, const HuffmanEncodeTable &table, uint8_t symbol )
{
    auto &code = table[symbol];
    if( code.length == 0 )
        throw RangeError( "symbol " + std::to_string( symbol ) + " has no Huffman code" );
    writer.write( code.length, code.code );
}

uint8_t decodeSymbol( BitReader &reader, const HuffmanDecodeTable &table )
{
    int32_t code = 0;
    for( unsigned length = 1; length <= 16; ++length )
    {
        BitList bit;
        reader.read( 1, bit );
        code = ( code << 1 ) | int32_t( bit );

        if( code <= table.maxCode[length] && code >= table.minCode[length] )
        {
            size_t index = size_t( table.valPtr[length] + code - table.minCode[length] );
            if( index >= table.symbols.size() )
                break;
            return table.symbols[index];
        }
    }

    if( reader.exhausted() )
        throw TruncatedDataError( "entropy-coded data ends early" );
    throw StructuralError( "invalid Huffman code in entropy-coded data" );
}

void encodeBlock( BitWriter &writer, const CoefficientBlock &block, int32_t &previousDc,
                  const HuffmanEncodeTable &dc, const HuffmanEncodeTable &ac )
{
    int32_t diff = block[0] - previousDc;
    previousDc = block[0];

    unsigned size = magnitudeCategory( diff );
    writeSymbol( writer, dc, uint8_t( size ) );
    writer.write( size, encodeMagnitudeBits( diff, size ) );

    unsigned run = 0;
    for( size_t k = 1; k < 64; ++k )
    {
        if( block[k] == 0 )
        {
            ++run;
            continue;
        }

        while( run > 15 )
        {
            writeSymbol( writer, ac, 0xF0 );
            run -= 16;
        }

        size = magnitudeCategory( block[k] );
        writeSymbol( writer, ac, uint8_t( ( run << 4 ) | size ) );
        writer.write( size, encodeMagnitudeBits( block[k], size ) );
        run = 0;
    }

    if( run > 0 )
        writeSymbol( writer, ac, 0x00 );
}

CoefficientBlock decodeBlock( BitReader &reader, int32_t &previousDc, const HuffmanDecodeTable &dc, const HuffmanDecodeTable &ac )
{
    CoefficientBlock block{};

    unsigned size = decodeSymbol( reader, dc );
    if( size > 11 )
        throw StructuralError( "DC magnitude category " + std::to_string( size ) + " is out of range" );

    BitList bits = 0;
    reader.read( size, bits );
    previousDc += extendMagnitude( uint32_t( bits ), size );
    block[0] = previousDc;

    for( size_t k = 1; k < 64; )
    {
        uint8_t rs = decodeSymbol( reader, ac );
        unsigned run = rs >> 4;
        size = rs & 0x0F;

        if( size == 0 )
        {
            // EOB
            if( run != 15 )
                break;

            // ZRL
            k += 16;
            continue;
        }

        k += run;
        if( k > 63 || size > 10 )
            throw StructuralError( "AC coefficient run exceeds the block" );

        reader.read( size, bits );
        block[k++] = extendMagnitude( uint32_t( bits ), size );
    }
    return block;
}

void countBlockSymbols( const CoefficientBlock &block, int32_t &previousDc,
                        std::array<uint32_t, 256> &dcFrequencies, std::array<uint32_t, 256> &acFrequencies )
{
    ++dcFrequencies[magnitudeCategory( block[0] - previousDc )];
    previousDc = block[0];

    unsigned run = 0;
    for( size_t k = 1; k < 64; ++k )
    {
        if( block[k] == 0 )
        {
            ++run;
            continue;
        }

        while( run > 15 )
        {
            ++acFrequencies[0xF0];
            run -= 16;
        }

        ++acFrequencies[( run << 4 ) | magnitudeCategory( block[k] )];
        run = 0;
    }

    if( run > 0 )
        ++acFrequencies[0x00];
}
}

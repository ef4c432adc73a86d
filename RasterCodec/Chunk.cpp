#include "RasterCodec/Chunk.h"

#include "RasterCodec/Crc32.h"
#include "RasterCodec/Errors.h"
#include "Log.h"

namespace RasterCodec
{
static bool isLetter( char c )
{
    return ( 'A' <= c && c <= 'Z' ) || ( 'a' <= c && c <= 'z' );
}

static std::string hex32( uint32_t value )
{
    static const char digits[] = "0123456789ABCDEF";
    std::string result = "0x";
    for( int shift = 28; shift >= 0; shift -= 4 )
        result += digits[( value >> shift ) & 0xF];
    return result;
}

bool PngSignature::read( ReaderBase &r )
{
    uint8_t sgntr[8];
    if( !r.read( sizeof( sgntr ), sgntr ) )
        return false;
    return compare( sgntr, bytes, sizeof( bytes ) );
}

bool PngSignature::write( WriterBase &w )
{
    return w.write( sizeof( bytes ), bytes );
}

Chunk::Chunk( std::string t, std::vector<uint8_t> d ) : type( std::move( t ) ), data( std::move( d ) )
{
    validateChunkType( type );
    length = uint32_t( data.size() );
    updateCrc();
}

bool Chunk::is( const char *name ) const
{
    return type == name;
}

bool Chunk::critical() const
{
    return !type.empty() && 'A' <= type[0] && type[0] <= 'Z';
}

void Chunk::updateCrc()
{
    crc = calculateCrc();
}

uint32_t Chunk::calculateCrc() const
{
    // Over the type and the data, not the length
    uint32_t result = crc32Update( 0, type.data(), type.size() );
    return crc32Update( result, data.data(), data.size() );
}

size_t Chunk::size() const
{
    return 4 + 4 + data.size() + 4;
}

bool Chunk::write( WriterBase &w ) const
{
    makeException( type.size() == 4 );

    uint8_t word[4];
    auto put32 = [&]( uint32_t v )
    {
        word[0] = uint8_t( v >> 24 );
        word[1] = uint8_t( v >> 16 );
        word[2] = uint8_t( v >> 8 );
        word[3] = uint8_t( v );
        return w.write( sizeof( word ), word );
    };

    if( !put32( uint32_t( data.size() ) ) )
        return false;

    if( !w.write( type.size(), type.data() ) )
        return false;

    if( !data.empty() && !w.write( data.size(), data.data() ) )
        return false;

    return put32( crc );
}

void validateChunkType( const std::string &type )
{
    bool ok = type.size() == 4;
    for( auto c : type )
        ok = ok && isLetter( c );
    if( !ok )
        throw InvalidOptionError( "chunk type must be four ASCII letters", atField( "type" ) );
}

std::vector<Chunk> parseChunks( const uint8_t *bytes, size_t size, const ParseOptions &options, size_t baseOffset )
{
    std::vector<Chunk> chunks;
    SimpleReader r( bytes, size );

    while( r.remaining() > 0 )
    {
        size_t offset = baseOffset + r.position();

        if( r.remaining() < 12 )
        {
            if( options.strictMode )
                throw TruncatedChunkError( "Incomplete chunk: " + std::to_string( r.remaining() ) + " bytes left, at least 12 required", atOffset( offset ) );
            Log::warning( "Incomplete chunk at offset " + std::to_string( offset ) + ", parsing stopped", "png" );
            break;
        }

        Chunk chunk;
        chunk.offset = uint32_t( offset );

        uint8_t header[8];
        makeException( r.read( sizeof( header ), header ) );

        chunk.length = readBe32( header );
        chunk.type.assign( ( const char * )header + 4, 4 );

        // Data and CRC must both fit
        if( uint64_t( chunk.length ) + 4 > r.remaining() )
        {
            if( options.strictMode )
            {
                throw TruncatedChunkError( "Chunk length " + std::to_string( chunk.length ) + " exceeds remaining buffer of " +
                                           std::to_string( r.remaining() ) + " bytes", atChunk( chunk.type, offset ) );
            }
            Log::warning( "Chunk " + chunk.type + " at offset " + std::to_string( offset ) + " exceeds remaining buffer, parsing stopped", "png" );
            break;
        }

        chunk.data.resize( chunk.length );
        makeException( r.read( chunk.length, chunk.data.data() ) );

        uint8_t word[4];
        makeException( r.read( sizeof( word ), word ) );
        chunk.crc = readBe32( word );

        bool typeOk = true;
        for( auto c : chunk.type )
            typeOk = typeOk && isLetter( c );

        if( !typeOk )
        {
            if( options.strictMode )
                throw StructuralError( "Invalid chunk type", atOffset( offset ) );
            chunk.valid = false;
            chunk.error = "Invalid chunk type";
        }
        else if( options.validateCRC )
        {
            auto expected = chunk.calculateCrc();
            if( expected != chunk.crc )
            {
                std::string text = "CRC32 mismatch: stored " + hex32( chunk.crc ) + ", calculated " + hex32( expected );
                if( options.strictMode )
                    throw ChunkCrcError( text, atChunk( chunk.type, offset ) );

                Log::warning( text + " in chunk " + chunk.type + " at offset " + std::to_string( offset ), "png" );
                chunk.valid = false;
                chunk.error = text;
            }
        }

        chunks.push_back( std::move( chunk ) );
    }

    return chunks;
}

std::vector<uint8_t> writeChunk( const std::string &type, const std::vector<uint8_t> &data )
{
    Chunk chunk( type, data );

    std::vector<uint8_t> result;
    result.reserve( chunk.size() );
    VectorWriter w( result );
    makeException( chunk.write( w ) );
    return result;
}

std::vector<const Chunk *> findChunksByType( const std::vector<Chunk> &chunks, const std::string &type )
{
    std::vector<const Chunk *> result;
    for( const auto &chunk : chunks )
    {
        if( chunk.type == type )
            result.push_back( &chunk );
    }
    return result;
}

void validateChunkStructure( const std::vector<Chunk> &chunks )
{
    if( chunks.empty() )
        throw StructuralError( "first chunk must be IHDR: no chunks present" );

    if( !chunks.front().is( "IHDR" ) )
        throw StructuralError( "first chunk must be IHDR", atChunk( chunks.front().type, chunks.front().offset ) );

    if( !chunks.back().is( "IEND" ) )
        throw StructuralError( "last chunk must be IEND", atChunk( chunks.back().type, chunks.back().offset ) );

    if( findChunksByType( chunks, "IHDR" ).size() != 1 )
        throw StructuralError( "exactly one IHDR chunk is allowed" );

    if( findChunksByType( chunks, "IEND" ).size() != 1 )
        throw StructuralError( "exactly one IEND chunk is allowed" );

    if( findChunksByType( chunks, "PLTE" ).size() > 1 )
        throw StructuralError( "at most one PLTE chunk is allowed" );

    std::optional<size_t> firstIdat, lastIdat, plte;
    for( size_t i = 0; i < chunks.size(); ++i )
    {
        if( chunks[i].is( "IDAT" ) )
        {
            if( !firstIdat )
                firstIdat = i;
            if( lastIdat && *lastIdat + 1 != i )
                throw StructuralError( "IDAT chunks must be contiguous", atChunk( "IDAT", chunks[i].offset ) );
            lastIdat = i;
        }
        else if( chunks[i].is( "PLTE" ) )
        {
            plte = i;
        }
    }

    if( !firstIdat )
        throw StructuralError( "missing IDAT chunk" );

    if( plte && *plte > *firstIdat )
        throw StructuralError( "PLTE must precede IDAT", atChunk( "PLTE", chunks[*plte].offset ) );
}

std::vector<Chunk> splitIdat( const std::vector<uint8_t> &compressed, size_t maxChunkSize )
{
    if( maxChunkSize == 0 || maxChunkSize > 0x7FFFFFFFu )
        throw InvalidOptionError( "maxChunkSize must be a positive integer", atField( "maxChunkSize" ) );

    std::vector<Chunk> chunks;
    size_t position = 0;
    do
    {
        size_t take = Min( maxChunkSize, compressed.size() - position );
        chunks.emplace_back( "IDAT", std::vector<uint8_t>( compressed.begin() + position, compressed.begin() + position + take ) );
        position += take;
    }
    while( position < compressed.size() );

    return chunks;
}
}

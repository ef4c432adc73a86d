#include "Tests/Fixtures.h"

#include <zlib.h>

#include "RasterCodec/Header.h"
#include "RasterCodec/Errors.h"
#include "RasterCodec/Chunk.h"
#include "RasterCodec/Crc32.h"
#include "RandomNumber.h"

using namespace RasterCodec;

static std::vector<uint8_t> concat( std::initializer_list<std::vector<uint8_t>> parts )
{
    std::vector<uint8_t> result;
    for( auto &part : parts )
        result.insert( result.end(), part.begin(), part.end() );
    return result;
}

static Chunk headerChunk()
{
    Ihdr ihdr;
    ihdr.width = 1;
    ihdr.height = 1;
    return Chunk( "IHDR", encodeIhdr( ihdr ) );
}

void chunkTests( Tests &tests )
{
    tests( []( Context &context )
    {
        auto s = context.scope( "Crc32_Known_Values" );

        makeException( RasterCodec::crc32( "IEND", 4 ) == 0xAE426082u );

        std::string check = "123456789";
        makeException( RasterCodec::crc32( check.data(), check.size() ) == 0xCBF43926u );
        makeException( crc32Table()[1] == 0x77073096u );
        makeException( RasterCodec::crc32( nullptr, 0 ) == 0 );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Crc32_Agrees_With_Zlib" );

        RandomNumber random( 4242 );
        for( size_t size : { 1, 7, 64, 1000, 4099 } )
        {
            auto data = random.getBytes( size );

            uLong expected = ::crc32( 0L, Z_NULL, 0 );
            expected = ::crc32( expected, data.data(), uInt( data.size() ) );
            makeException( RasterCodec::crc32( data ) == expected );

            // Continuation
            auto half = data.size() / 2;
            auto first = RasterCodec::crc32( data.data(), half );
            makeException( crc32Update( first, data.data() + half, data.size() - half ) == expected );
        }
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Chunk_Round_Trip" );

        std::vector<uint8_t> payload = { 1, 2, 3, 250 };
        auto bytes = writeChunk( "tEXt", payload );
        makeException( bytes.size() == 16 );

        auto chunks = parseChunks( bytes );
        makeException( chunks.size() == 1 );
        makeException( chunks[0].type == "tEXt" );
        makeException( chunks[0].data == payload );
        makeException( chunks[0].length == 4 );
        makeException( chunks[0].valid && !chunks[0].error );
        makeException( chunks[0].crc == chunks[0].calculateCrc() );

        std::vector<uint8_t> iend = { 0, 0, 0, 0, 'I', 'E', 'N', 'D', 0xAE, 0x42, 0x60, 0x82 };
        makeException( writeChunk( "IEND", {} ) == iend );

        auto two = parseChunks( concat( { bytes, iend } ) );
        makeException( two.size() == 2 );
        makeException( two[0].offset == 0 && two[1].offset == 16 );
        makeException( two[1].is( "IEND" ) && two[1].critical() && !two[0].critical() );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Chunk_Invalid_Type" );

        expectThrow<InvalidOptionError>( [] { writeChunk( "IHD", {} ); } );
        expectThrow<InvalidOptionError>( [] { writeChunk( "IH1R", {} ); } );
        expectThrow<InvalidOptionError>( [] { writeChunk( "tEXtt", {} ); } );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Chunk_Crc_Mismatch" );

        auto text = writeChunk( "tEXt", { 'a', 0, 'b' } );
        text.back() ^= 0x01;
        auto bytes = concat( { text, writeChunk( "IEND", {} ) } );

        {
            auto s = context.scope( "Strict" );
            expectThrow<ChunkCrcError>( [&] { parseChunks( bytes ); }, "CRC32 mismatch" );
            expectThrow<IntegrityError>( [&] { parseChunks( bytes ); }, "tEXt" );
        }

        {
            auto s = context.scope( "Lenient" );
            LogCapture capture;

            ParseOptions options;
            options.strictMode = false;
            auto chunks = parseChunks( bytes, options );
            makeException( chunks.size() == 2 );
            makeException( !chunks[0].valid );
            makeException( chunks[0].error && contains( *chunks[0].error, "CRC32 mismatch" ) );
            makeException( chunks[1].valid );
            makeException( capture.warnings() == 1 );
            makeException( capture.logged( "CRC32 mismatch" ) );
        }

        {
            auto s = context.scope( "Unchecked" );

            ParseOptions options;
            options.validateCRC = false;
            auto chunks = parseChunks( bytes, options );
            makeException( chunks.size() == 2 && chunks[0].valid && chunks[1].valid );
        }
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Chunk_Truncation" );

        auto good = writeChunk( "tEXt", { 'k', 0, 'v' } );

        // Declares 100 bytes of data with only 3 available
        auto overlong = writeChunk( "zTXt", { 1, 2, 3 } );
        overlong[3] = 100;

        auto bytes = concat( { good, overlong } );
        expectThrow<TruncatedChunkError>( [&] { parseChunks( bytes ); }, "exceeds remaining buffer" );
        expectThrow<StructuralError>( [&] { parseChunks( bytes ); } );

        // Parsing from a copy of exact size so any over-read would leave the buffer
        std::vector<uint8_t> exact( bytes.begin(), bytes.end() );
        exact.shrink_to_fit();
        expectThrow<StructuralError>( [&] { parseChunks( exact.data(), exact.size() ); } );

        ParseOptions lenient;
        lenient.strictMode = false;
        {
            LogCapture capture;
            auto chunks = parseChunks( bytes, lenient );
            makeException( chunks.size() == 1 && chunks[0].is( "tEXt" ) );
            makeException( capture.warnings() == 1 );
        }

        auto tail = concat( { good, { 0, 0, 0, 1, 'a' } } );
        expectThrow<TruncatedChunkError>( [&] { parseChunks( tail ); }, "Incomplete chunk" );
        {
            LogCapture capture;
            auto chunks = parseChunks( tail, lenient );
            makeException( chunks.size() == 1 );
        }
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Chunk_Structure" );

        auto ihdr = headerChunk();
        Chunk idat( "IDAT", { 1 } ), iend( "IEND", {} ), plte( "PLTE", { 0, 0, 0 } ), text( "tEXt", { 'a', 0 } );

        validateChunkStructure( { ihdr, idat, idat, iend } );
        validateChunkStructure( { ihdr, plte, text, idat, iend } );

        expectThrow<StructuralError>( [&] { validateChunkStructure( {} ); }, "first chunk must be IHDR" );
        expectThrow<StructuralError>( [&] { validateChunkStructure( { idat, ihdr, iend } ); }, "first chunk must be IHDR" );
        expectThrow<StructuralError>( [&] { validateChunkStructure( { ihdr, idat } ); }, "last chunk must be IEND" );
        expectThrow<StructuralError>( [&] { validateChunkStructure( { ihdr, ihdr, idat, iend } ); }, "exactly one IHDR" );
        expectThrow<StructuralError>( [&] { validateChunkStructure( { ihdr, idat, iend, iend } ); }, "exactly one IEND" );
        expectThrow<StructuralError>( [&] { validateChunkStructure( { ihdr, idat, text, idat, iend } ); }, "IDAT chunks must be contiguous" );
        expectThrow<StructuralError>( [&] { validateChunkStructure( { ihdr, text, iend } ); }, "missing IDAT" );
        expectThrow<StructuralError>( [&] { validateChunkStructure( { ihdr, idat, plte, iend } ); }, "PLTE must precede IDAT" );
        expectThrow<StructuralError>( [&] { validateChunkStructure( { ihdr, plte, plte, idat, iend } ); }, "at most one PLTE" );

        auto found = findChunksByType( { ihdr, idat, text, idat, iend }, "IDAT" );
        makeException( found.size() == 2 );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Chunk_Split_Idat" );

        std::vector<uint8_t> data( 10, 7 );
        auto chunks = splitIdat( data, 4 );
        makeException( chunks.size() == 3 );
        makeException( chunks[0].data.size() == 4 && chunks[1].data.size() == 4 && chunks[2].data.size() == 2 );
        for( auto &chunk : chunks )
            makeException( chunk.is( "IDAT" ) && chunk.crc == chunk.calculateCrc() );

        makeException( splitIdat( {}, 4 ).size() == 1 );
        makeException( splitIdat( data, 100 ).size() == 1 );
        expectThrow<InvalidOptionError>( [&] { splitIdat( data, 0 ); } );
    } );
}

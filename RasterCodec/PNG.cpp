#include "RasterCodec/PNG.h"

#include <string>

#include "RasterCodec/Interlace.h"
#include "RasterCodec/Validation.h"
#include "RasterCodec/Pixels.h"
#include "RasterCodec/Errors.h"
#include "Log.h"

namespace RasterCodec
{
static bool isKnownCritical( const Chunk &chunk )
{
    return chunk.is( "IHDR" ) || chunk.is( "PLTE" ) || chunk.is( "IDAT" ) || chunk.is( "IEND" );
}

// Unfilters and unpacks one reduced image
static std::vector<uint16_t> readPass( const Ihdr &ihdr, const std::vector<uint8_t> &stream, size_t &position, uint32_t columns, uint32_t rows )
{
    size_t bytes = rows * ( 1 + ihdr.scanlineBytes( columns ) );
    makeException( position + bytes <= stream.size() );

    auto raw = unfilterScanlines( stream.data() + position, bytes, columns, rows, ihdr.bitsPerPixel() );
    position += bytes;
    return unpackSamples( raw, columns, rows, ihdr.channels(), ihdr.bitDepth );
}

PngImage decodePNG( const uint8_t *data, size_t size, const PngDecodeOptions &options )
{
    Log::debug( "decoding PNG of " + std::to_string( size ) + " bytes", "png" );

    SimpleReader r( data, size );
    if( !PngSignature::read( r ) )
        throw StructuralError( "invalid PNG signature", atOffset( 0 ) );

    auto chunks = parseChunks( r.current(), r.remaining(), options.parse, r.position() );
    validateChunkStructure( chunks );

    for( auto &chunk : chunks )
    {
        // Lenient parsing only recovers chunks the pixels do not depend on
        if( !chunk.valid && isKnownCritical( chunk ) && !chunk.is( "IEND" ) )
            throw ChunkCrcError( "damaged " + chunk.type + ": " + chunk.error.value_or( "invalid" ), atChunk( chunk.type, chunk.offset ) );
        if( chunk.critical() && !isKnownCritical( chunk ) )
            throw StructuralError( "unknown critical chunk " + chunk.type, atChunk( chunk.type, chunk.offset ) );
        if( !chunk.critical() && !isKnownCritical( chunk ) && chunk.type != "tRNS" )
            Log::debug( "ancillary chunk " + chunk.type + " at offset " + std::to_string( chunk.offset ), "png" );
    }

    PngImage image;
    image.header = decodeIhdr( chunks.front().data );
    const auto &ihdr = image.header;
    image.width = ihdr.width;
    image.height = ihdr.height;

    Palette palette;
    auto plte = findChunksByType( chunks, "PLTE" );
    if( !plte.empty() )
    {
        if( ihdr.colorType == ColorType::Grayscale || ihdr.colorType == ColorType::GrayscaleAlpha )
            throw StructuralError( "PLTE is not allowed for grayscale images", atChunk( "PLTE", plte.front()->offset ) );
        palette = decodePalette( plte.front()->data );
        if( ihdr.colorType == ColorType::Indexed && palette.size() > ( size_t( 1 ) << ihdr.bitDepth ) )
            throw StructuralError( "PLTE has more entries than the bit depth allows", atChunk( "PLTE", plte.front()->offset ) );
    }
    else if( ihdr.colorType == ColorType::Indexed )
    {
        throw StructuralError( "missing PLTE for an indexed image" );
    }

    Transparency transparency;
    auto trns = findChunksByType( chunks, "tRNS" );
    if( !trns.empty() && !trns.front()->valid )
        Log::warning( "ignoring damaged tRNS at offset " + std::to_string( trns.front()->offset ), "png" );
    else if( !trns.empty() )
        transparency = decodeTransparency( trns.front()->data, ihdr.colorType, palette.size() );

    std::vector<uint8_t> compressed;
    for( auto idat : findChunksByType( chunks, "IDAT" ) )
        compressed.insert( compressed.end(), idat->data.begin(), idat->data.end() );

    auto expected = ihdr.expectedDataSize();
    auto stream = zlibDecompress( compressed, expected, expected );
    if( stream.size() != expected )
    {
        throw PixelDataSizeError( "decompressed image data holds " + std::to_string( stream.size() ) + " bytes, expected " +
                                  std::to_string( expected ), atChunk( "IDAT" ) );
    }

    std::vector<uint16_t> samples;
    size_t position = 0;
    if( ihdr.interlaced() )
    {
        std::vector<std::vector<uint16_t>> passes( 7 );
        for( unsigned pass = 0; pass < 7; ++pass )
        {
            Adam7Size passSize( Adam7Step( pass ), ihdr.width, ihdr.height );
            if( passSize.empty() )
                continue;
            passes[pass] = readPass( ihdr, stream, position, passSize.columns, passSize.rows );
        }
        samples = deinterlace( passes, ihdr.width, ihdr.height, ihdr.channels() );
    }
    else
    {
        samples = readPass( ihdr, stream, position, ihdr.width, ihdr.height );
    }

    image.pixels = samplesToRgba( samples, ihdr.width, ihdr.height, ihdr.colorType, ihdr.bitDepth, palette, transparency.paletteAlpha );
    if( transparency.key )
        applyTransparency( image.pixels, samples, ihdr.colorType, *transparency.key );

    if( options.metadata )
        image.metadata = extractMetadata( chunks, ihdr );

    return image;
}

void validateOptions( const PngEncodeOptions &options )
{
    if( options.compressionLevel < 0 || options.compressionLevel > 9 )
    {
        throw InvalidOptionError( "compressionLevel must be in 0..9, got " + std::to_string( options.compressionLevel ),
                                  atField( "compressionLevel" ) );
    }

    if( options.maxChunkSize == 0 || options.maxChunkSize > 0x7FFFFFFFu )
        throw InvalidOptionError( "maxChunkSize must be a positive integer", atField( "maxChunkSize" ) );
}

// Packs and filters one reduced image, appending to `stream`
static void writePass( const Ihdr &ihdr, const std::vector<uint16_t> &samples, uint32_t columns, uint32_t rows,
                       std::optional<FilterType> filter, std::vector<uint8_t> &stream )
{
    auto raw = packSamples( samples, columns, rows, ihdr.channels(), ihdr.bitDepth );
    auto filtered = filterScanlines( raw, columns, rows, ihdr.bitsPerPixel(), filter );
    stream.insert( stream.end(), filtered.begin(), filtered.end() );
}

std::vector<uint8_t> encodePNG( const PngInput &input, const PngEncodeOptions &options )
{
    validateOptions( options );
    validateDimensions( input.width, input.height, maxPngDimension );
    validatePixelBuffer( input.pixels, input.width, input.height, 4 );

    Ihdr ihdr;
    ihdr.width = input.width;
    ihdr.height = input.height;
    ihdr.colorType = input.colorType;
    ihdr.bitDepth = uint8_t( input.bitDepth );
    ihdr.interlaceMethod = options.interlace ? 1 : 0;
    if( !isValidColorType( unsigned( input.colorType ) ) || !isValidBitDepth( input.colorType, input.bitDepth ) )
    {
        throw InvalidHeaderError( "bitDepth " + std::to_string( input.bitDepth ) + " is not allowed for colorType " +
                                  std::to_string( unsigned( input.colorType ) ), atField( "bitDepth" ) );
    }

    Log::debug( "encoding " + std::to_string( input.width ) + "x" + std::to_string( input.height ) + " PNG", "png" );

    auto encoded = rgbaToSamples( input.pixels, input.width, input.height, input.colorType, input.bitDepth );

    std::vector<uint8_t> stream;
    stream.reserve( ihdr.expectedDataSize() );
    if( ihdr.interlaced() )
    {
        auto passes = interlace( encoded.samples, ihdr.width, ihdr.height, ihdr.channels() );
        for( unsigned pass = 0; pass < 7; ++pass )
        {
            Adam7Size passSize( Adam7Step( pass ), ihdr.width, ihdr.height );
            if( passSize.empty() )
                continue;
            writePass( ihdr, passes[pass], passSize.columns, passSize.rows, options.filter, stream );
        }
    }
    else
    {
        writePass( ihdr, encoded.samples, ihdr.width, ihdr.height, options.filter, stream );
    }
    makeException( stream.size() == ihdr.expectedDataSize() );

    auto compressed = zlibCompress( stream, options.compressionLevel );
    auto metadata = encodeMetadataChunks( options.metadata, ihdr.colorType, ihdr.bitDepth );

    std::vector<uint8_t> result;
    VectorWriter w( result );
    makeException( PngSignature::write( w ) );
    makeException( Chunk( "IHDR", encodeIhdr( ihdr ) ).write( w ) );

    for( auto &chunk : metadata )
    {
        if( precedesPalette( chunk.type ) )
            makeException( chunk.write( w ) );
    }

    if( ihdr.colorType == ColorType::Indexed )
    {
        makeException( Chunk( "PLTE", encodePalette( encoded.palette ) ).write( w ) );
        if( !encoded.paletteAlpha.empty() )
            makeException( Chunk( "tRNS", encoded.paletteAlpha ).write( w ) );
    }

    for( auto &chunk : metadata )
    {
        if( !precedesPalette( chunk.type ) )
            makeException( chunk.write( w ) );
    }

    for( auto &idat : splitIdat( compressed, options.maxChunkSize ) )
        makeException( idat.write( w ) );

    makeException( Chunk( "IEND", {} ).write( w ) );
    return result;
}
}

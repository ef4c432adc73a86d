#include "RasterCodec/Pixels.h"

#include <unordered_map>
#include <unordered_set>
#include <string>

#include "RasterCodec/Validation.h"
#include "RasterCodec/Errors.h"
#include "BitIO.h"

namespace RasterCodec
{
static size_t lineBytes( uint32_t columns, unsigned channels, unsigned bitDepth )
{
    return DivUp<uint64_t>( uint64_t( columns ) * channels * bitDepth, 8 );
}

uint8_t expandSample( unsigned value, unsigned bitDepth )
{
    switch( bitDepth )
    {
    case 1:
        return uint8_t( ( value & 0x1 ) * 255 );
    case 2:
        return uint8_t( ( value & 0x3 ) * 85 );
    case 4:
        return uint8_t( ( value & 0xF ) * 17 );
    case 8:
        return uint8_t( value );
    case 16:
        return uint8_t( value >> 8 );
    }
    throw InvalidOptionError( "unsupported bit depth " + std::to_string( bitDepth ), atField( "bitDepth" ) );
}

unsigned quantizeSample( uint8_t value, unsigned bitDepth )
{
    if( bitDepth == 16 )
        return value * 257u;
    if( bitDepth == 8 )
        return value;

    unsigned max = ( 1u << bitDepth ) - 1;
    return ( 2 * value * max + 255 ) / 510;
}

std::vector<uint16_t> unpackSamples( const std::vector<uint8_t> &raw, uint32_t columns, uint32_t rows, unsigned channels, unsigned bitDepth )
{
    auto bytes = lineBytes( columns, channels, bitDepth );
    if( raw.size() != bytes * rows )
    {
        throw PixelDataSizeError( "scanlines hold " + std::to_string( raw.size() ) + " bytes, expected " +
                                  std::to_string( bytes * rows ) );
    }

    std::vector<uint16_t> samples;
    samples.reserve( size_t( columns ) * rows * channels );

    Reader reader( raw.data(), raw.size(), 0 );
    for( uint32_t y = 0; y < rows; ++y )
    {
        for( size_t i = 0; i < size_t( columns ) * channels; ++i )
        {
            BitList value;
            makeException( reader.read( bitDepth, value ) );
            samples.push_back( uint16_t( value ) );
        }
        reader.align();
    }
    return samples;
}

std::vector<uint8_t> packSamples( const std::vector<uint16_t> &samples, uint32_t columns, uint32_t rows, unsigned channels, unsigned bitDepth )
{
    makeException( samples.size() == size_t( columns ) * rows * channels );

    std::vector<uint8_t> raw;
    raw.reserve( lineBytes( columns, channels, bitDepth ) * rows );

    VectorWriter writer( raw );
    size_t i = 0;
    for( uint32_t y = 0; y < rows; ++y )
    {
        for( size_t x = 0; x < size_t( columns ) * channels; ++x )
            writer.write( bitDepth, BitList( samples[i++] ) );
        writer.align();
    }
    return raw;
}

Palette decodePalette( const std::vector<uint8_t> &data )
{
    if( data.empty() || data.size() % 3 != 0 || data.size() > 256 * 3 )
        throw StructuralError( "PLTE length must be a multiple of 3 with 1..256 entries", atChunk( "PLTE" ) );

    Palette palette( data.size() / 3 );
    for( size_t i = 0; i < palette.size(); ++i )
        palette[i] = { data[3 * i], data[3 * i + 1], data[3 * i + 2] };
    return palette;
}

std::vector<uint8_t> encodePalette( const Palette &palette )
{
    makeException( !palette.empty() && palette.size() <= 256 );

    std::vector<uint8_t> data;
    data.reserve( palette.size() * 3 );
    for( auto &entry : palette )
        data.insert( data.end(), entry.begin(), entry.end() );
    return data;
}

Transparency decodeTransparency( const std::vector<uint8_t> &data, ColorType colorType, size_t paletteSize )
{
    Transparency result;
    switch( colorType )
    {
    case ColorType::Grayscale:
        if( data.size() != 2 )
            throw StructuralError( "tRNS for grayscale must be 2 bytes", atChunk( "tRNS" ) );
        result.key = std::array<uint16_t, 3> { readBe16( data.data() ), 0, 0 };
        break;
    case ColorType::Truecolor:
        if( data.size() != 6 )
            throw StructuralError( "tRNS for truecolor must be 6 bytes", atChunk( "tRNS" ) );
        result.key = std::array<uint16_t, 3> { readBe16( data.data() ), readBe16( data.data() + 2 ), readBe16( data.data() + 4 ) };
        break;
    case ColorType::Indexed:
        if( data.size() > paletteSize )
            throw StructuralError( "tRNS has more entries than the palette", atChunk( "tRNS" ) );
        result.paletteAlpha = data;
        break;
    case ColorType::GrayscaleAlpha:
    case ColorType::TruecolorAlpha:
        throw StructuralError( "tRNS is not allowed for color types with alpha", atChunk( "tRNS" ) );
    }
    return result;
}

std::vector<uint8_t> samplesToRgba( const std::vector<uint16_t> &samples, uint32_t width, uint32_t height, ColorType colorType, unsigned bitDepth,
                                    const Palette &palette, const std::vector<uint8_t> &paletteAlpha )
{
    auto channels = channelsFor( colorType );
    size_t pixels = size_t( width ) * height;
    makeException( samples.size() == pixels * channels );

    std::vector<uint8_t> rgba( pixels * 4 );
    for( size_t i = 0; i < pixels; ++i )
    {
        auto source = &samples[i * channels];
        auto target = &rgba[i * 4];
        switch( colorType )
        {
        case ColorType::Grayscale:
            target[0] = target[1] = target[2] = expandSample( source[0], bitDepth );
            target[3] = 255;
            break;
        case ColorType::Truecolor:
            for( unsigned c = 0; c < 3; ++c )
                target[c] = expandSample( source[c], bitDepth );
            target[3] = 255;
            break;
        case ColorType::Indexed:
        {
            size_t index = source[0];
            if( index >= palette.size() )
            {
                throw StructuralError( "palette index " + std::to_string( index ) + " is beyond " +
                                       std::to_string( palette.size() ) + " entries", atChunk( "PLTE" ) );
            }
            target[0] = palette[index][0];
            target[1] = palette[index][1];
            target[2] = palette[index][2];
            target[3] = index < paletteAlpha.size() ? paletteAlpha[index] : 255;
            break;
        }
        case ColorType::GrayscaleAlpha:
            target[0] = target[1] = target[2] = expandSample( source[0], bitDepth );
            target[3] = expandSample( source[1], bitDepth );
            break;
        case ColorType::TruecolorAlpha:
            for( unsigned c = 0; c < 4; ++c )
                target[c] = expandSample( source[c], bitDepth );
            break;
        }
    }
    return rgba;
}

void applyTransparency( std::vector<uint8_t> &rgba, const std::vector<uint16_t> &samples, ColorType colorType, const std::array<uint16_t, 3> &key )
{
    unsigned compared;
    switch( colorType )
    {
    case ColorType::Grayscale:
        compared = 1;
        break;
    case ColorType::Truecolor:
        compared = 3;
        break;
    default:
        return;
    }

    size_t pixels = rgba.size() / 4;
    makeException( samples.size() == pixels * compared );

    for( size_t i = 0; i < pixels; ++i )
    {
        bool match = true;
        for( unsigned c = 0; c < compared; ++c )
            match = match && samples[i * compared + c] == key[c];
        if( match )
            rgba[i * 4 + 3] = 0;
    }
}

uint8_t luminance( uint8_t r, uint8_t g, uint8_t b )
{
    double y = Round( 0.299 * r + 0.587 * g + 0.114 * b );
    return uint8_t( Clamp( y, 0.0, 255.0 ) );
}

EncodedSamples rgbaToSamples( const std::vector<uint8_t> &rgba, uint32_t width, uint32_t height, ColorType colorType, unsigned bitDepth )
{
    validatePixelBuffer( rgba, width, height, 4 );
    if( !isValidBitDepth( colorType, bitDepth ) )
    {
        throw InvalidOptionError( "bitDepth " + std::to_string( bitDepth ) + " is not allowed for colorType " +
                                  std::to_string( unsigned( colorType ) ), atField( "bitDepth" ) );
    }

    EncodedSamples result;
    size_t pixels = size_t( width ) * height;
    result.samples.reserve( pixels * channelsFor( colorType ) );

    auto put = [&]( uint8_t value )
    {
        result.samples.push_back( uint16_t( quantizeSample( value, bitDepth ) ) );
    };

    std::unordered_map<uint32_t, size_t> indices;
    size_t limit = size_t( 1 ) << bitDepth;

    for( size_t i = 0; i < pixels; ++i )
    {
        auto p = &rgba[i * 4];
        switch( colorType )
        {
        case ColorType::Grayscale:
            put( luminance( p[0], p[1], p[2] ) );
            break;
        case ColorType::Truecolor:
            put( p[0] );
            put( p[1] );
            put( p[2] );
            break;
        case ColorType::Indexed:
        {
            uint32_t color = readBe32( p );
            auto found = indices.find( color );
            if( found == indices.end() )
            {
                if( indices.size() == limit )
                {
                    throw RangeError( "image has more than " + std::to_string( limit ) + " colors for a " +
                                      std::to_string( bitDepth ) + "-bit palette", atField( "bitDepth" ) );
                }
                found = indices.emplace( color, result.palette.size() ).first;
                result.palette.push_back( { p[0], p[1], p[2] } );
                result.paletteAlpha.push_back( p[3] );
            }
            result.samples.push_back( uint16_t( found->second ) );
            break;
        }
        case ColorType::GrayscaleAlpha:
            put( luminance( p[0], p[1], p[2] ) );
            put( p[3] );
            break;
        case ColorType::TruecolorAlpha:
            for( unsigned c = 0; c < 4; ++c )
                put( p[c] );
            break;
        }
    }

    while( !result.paletteAlpha.empty() && result.paletteAlpha.back() == 255 )
        result.paletteAlpha.pop_back();

    return result;
}

PixelAnalysis analyzePixels( const std::vector<uint8_t> &rgba, uint32_t width, uint32_t height, size_t uniqueColorCap )
{
    validatePixelBuffer( rgba, width, height, 4 );

    PixelAnalysis result;
    std::unordered_set<uint32_t> colors;
    for( size_t i = 0; i < rgba.size(); i += 4 )
    {
        auto p = &rgba[i];
        if( p[3] != 255 )
            result.hasTransparency = true;
        if( p[0] != p[1] || p[1] != p[2] )
            result.isGrayscale = false;
        if( colors.size() < uniqueColorCap )
            colors.insert( readBe32( p ) );
    }
    result.uniqueColors = colors.size();
    return result;
}
}

#include "Tests/Fixtures.h"

#include <cmath>

#include "RasterCodec/Metadata.h"
#include "RasterCodec/Errors.h"
#include "RasterCodec/Zlib.h"

using namespace RasterCodec;

static const TextEntry *findText( const PngMetadata &metadata, const std::string &keyword )
{
    for( auto &entry : metadata.texts )
    {
        if( entry.keyword == keyword )
            return &entry;
    }
    return nullptr;
}

void metadataTests( Tests &tests )
{
    tests( []( Context &context )
    {
        auto s = context.scope( "Metadata_Keywords" );

        makeException( isValidKeyword( "Title" ) );
        makeException( isValidKeyword( "Creation Time" ) );
        makeException( isValidKeyword( std::string( 79, 'k' ) ) );
        makeException( isValidKeyword( "Caf\xE9" ) );

        makeException( !isValidKeyword( "" ) );
        makeException( !isValidKeyword( std::string( 80, 'k' ) ) );
        makeException( !isValidKeyword( " Title" ) );
        makeException( !isValidKeyword( "Title " ) );
        makeException( !isValidKeyword( "Two  Spaces" ) );
        makeException( !isValidKeyword( std::string( "Nul\0Inside", 10 ) ) );
        makeException( !isValidKeyword( "Tab\tInside" ) );
        makeException( !isValidKeyword( "Control\x9F" ) );

        expectThrow<InvalidKeywordError>( [] { validateKeyword( " x" ); } );
        expectThrow<InvalidKeywordError>( [] { encodeText( "", "text" ); } );
        expectThrow<MetadataError>( [] { encodeCompressedText( "a  b", "text" ); } );
        expectThrow<InvalidKeywordError>( [] { encodeIccProfile( std::string( 80, 'p' ), { 1 } ); } );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Metadata_Encoders" );

        auto text = encodeText( "Title", "Hi" );
        makeException( text.is( "tEXt" ) );
        makeException( text.data == std::vector<uint8_t>( { 'T', 'i', 't', 'l', 'e', 0, 'H', 'i' } ) );

        auto ztxt = encodeCompressedText( "Comment", "aaaaaaaaaaaaaaaa" );
        makeException( ztxt.data[7] == 0 && ztxt.data[8] == 0 );
        auto inflated = zlibDecompress( ztxt.data.data() + 9, ztxt.data.size() - 9 );
        makeException( std::string( inflated.begin(), inflated.end() ) == "aaaaaaaaaaaaaaaa" );

        PngTime time;
        time.year = 2024;
        time.month = 2;
        time.day = 29;
        time.hour = 23;
        time.minute = 59;
        time.second = 60;
        auto tIME = encodeTime( time );
        makeException( tIME.data == std::vector<uint8_t>( { 0x07, 0xE8, 2, 29, 23, 59, 60 } ) );

        auto badMonth = time;
        badMonth.month = 13;
        expectThrow<InvalidMetadataError>( [&] { encodeTime( badMonth ); }, "month" );
        auto badSecond = time;
        badSecond.second = 61;
        expectThrow<InvalidMetadataError>( [&] { encodeTime( badSecond ); }, "second" );

        auto pHYs = encodePhysicalDimensions( 2835, 2835, 1 );
        makeException( pHYs.data.size() == 9 && pHYs.data[8] == 1 );
        expectThrow<InvalidMetadataError>( [] { encodePhysicalDimensions( 1, 1, 2 ); } );

        // round( 0.45455 * 100000 ) = 45455 = 0xB18F
        auto gAMA = encodeGamma( 0.45455 );
        makeException( gAMA.data == std::vector<uint8_t>( { 0, 0, 0xB1, 0x8F } ) );
        expectThrow<InvalidMetadataError>( [] { encodeGamma( 0 ); } );
        expectThrow<InvalidMetadataError>( [] { encodeGamma( -1 ); } );

        makeException( encodeSrgb( 3 ).data == std::vector<uint8_t>( { 3 } ) );
        expectThrow<InvalidMetadataError>( [] { encodeSrgb( 4 ); } );

        makeException( encodeSignificantBits( { 5 }, ColorType::Grayscale, 8 ).data.size() == 1 );
        makeException( encodeSignificantBits( { 5, 6, 5 }, ColorType::Indexed, 2 ).data.size() == 3 );
        makeException( encodeSignificantBits( { 8, 8 }, ColorType::GrayscaleAlpha, 8 ).data.size() == 2 );
        makeException( encodeSignificantBits( { 16, 16, 16, 16 }, ColorType::TruecolorAlpha, 16 ).data.size() == 4 );
        expectThrow<InvalidMetadataError>( [] { encodeSignificantBits( { 5, 5 }, ColorType::Truecolor, 8 ); } );
        expectThrow<InvalidMetadataError>( [] { encodeSignificantBits( { 9 }, ColorType::Grayscale, 8 ); } );
        expectThrow<InvalidMetadataError>( [] { encodeSignificantBits( { 0 }, ColorType::Grayscale, 8 ); } );

        Chromaticities c;
        c.whiteX = 0.3127;
        c.whiteY = 0.329;
        makeException( encodeChromaticities( c ).data.size() == 32 );

        Background index;
        index.index = 4;
        makeException( encodeBackground( index, ColorType::Indexed, 8 ).data == std::vector<uint8_t>( { 4 } ) );
        Background gray;
        gray.gray = 3;
        makeException( encodeBackground( gray, ColorType::Grayscale, 2 ).data.size() == 2 );
        gray.gray = 4;
        expectThrow<InvalidMetadataError>( [&] { encodeBackground( gray, ColorType::Grayscale, 2 ); } );
        expectThrow<InvalidMetadataError>( [&] { encodeBackground( gray, ColorType::Truecolor, 8 ); } );

        expectThrow<InvalidMetadataError>( [] { encodeIccProfile( "sRGB", {} ); } );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Metadata_Chunk_Round_Trip" );

        PngMetadata metadata;
        metadata.texts.push_back( { "Title", "Plain text", "", "", TextKind::Text, false } );
        metadata.texts.push_back( { "Comment", std::string( 300, 'z' ), "", "", TextKind::Compressed, false } );
        metadata.texts.push_back( { "Author", "\xC3\x85sa", "sv", "F\xC3\xB6rfattare", TextKind::International, true } );
        metadata.texts.push_back( { "Note", "uncompressed", "en", "", TextKind::International, false } );

        PngTime time;
        time.year = 1999;
        time.month = 12;
        time.day = 31;
        metadata.time = time;

        PhysicalDimensions physical;
        physical.pixelsPerUnitX = 2835;
        physical.pixelsPerUnitY = 11811;
        physical.unit = 1;
        metadata.physical = physical;

        metadata.gamma = 0.45455;
        metadata.srgbIntent = 1;
        metadata.significantBits = std::vector<uint8_t>( { 8, 8, 8, 8 } );

        Chromaticities c;
        c.whiteX = 0.3127;
        c.whiteY = 0.329;
        c.redX = 0.64;
        c.redY = 0.33;
        c.greenX = 0.3;
        c.greenY = 0.6;
        c.blueX = 0.15;
        c.blueY = 0.06;
        metadata.chromaticities = c;

        metadata.iccProfile = IccProfile{ "Display", std::vector<uint8_t>( 500, 0x42 ) };

        Background background;
        background.rgb = std::array<uint16_t, 3> { 10, 20, 30 };
        metadata.background = background;

        auto chunks = encodeMetadataChunks( metadata, ColorType::TruecolorAlpha, 8 );
        makeException( chunks.size() == 13 );

        // Chunks that must precede PLTE come first
        bool seenOther = false;
        for( auto &chunk : chunks )
        {
            if( !precedesPalette( chunk.type ) )
                seenOther = true;
            else
                makeException( !seenOther );
        }

        Ihdr ihdr;
        ihdr.width = 1;
        ihdr.height = 1;
        auto decoded = extractMetadata( chunks, ihdr );

        makeException( decoded.texts.size() == 4 );
        auto title = findText( decoded, "Title" );
        makeException( title && title->text == "Plain text" && title->kind == TextKind::Text );
        auto comment = findText( decoded, "Comment" );
        makeException( comment && comment->text == std::string( 300, 'z' ) && comment->kind == TextKind::Compressed );
        auto author = findText( decoded, "Author" );
        makeException( author && author->text == "\xC3\x85sa" && author->compressed );
        makeException( author->language == "sv" && author->translatedKeyword == "F\xC3\xB6rfattare" );
        auto note = findText( decoded, "Note" );
        makeException( note && note->text == "uncompressed" && !note->compressed && note->kind == TextKind::International );

        makeException( decoded.time && decoded.time->year == 1999 && decoded.time->month == 12 && decoded.time->day == 31 );
        makeException( decoded.physical && decoded.physical->pixelsPerUnitY == 11811 );
        makeException( decoded.physical->dpiX == 72u && decoded.physical->dpiY == 300u );
        makeException( decoded.gamma && std::fabs( *decoded.gamma - 0.45455 ) < 1e-9 );
        makeException( decoded.srgbIntent == uint8_t( 1 ) );
        makeException( decoded.significantBits == metadata.significantBits );
        makeException( decoded.chromaticities && std::fabs( decoded.chromaticities->blueY - 0.06 ) < 1e-9 );
        makeException( decoded.iccProfile && decoded.iccProfile->name == "Display" );
        makeException( decoded.iccProfile->profile == metadata.iccProfile->profile );
        makeException( decoded.background && decoded.background->rgb == background.rgb );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Metadata_Invalid_Fields_Skipped" );
        LogCapture capture;

        PngMetadata metadata;
        metadata.texts.push_back( { "Good", "kept", "", "", TextKind::Text, false } );
        metadata.texts.push_back( { " Bad", "dropped", "", "", TextKind::Text, false } );
        metadata.gamma = -2;
        metadata.srgbIntent = 9;

        auto chunks = encodeMetadataChunks( metadata, ColorType::Truecolor, 8 );
        makeException( chunks.size() == 1 && chunks[0].is( "tEXt" ) );
        makeException( capture.warnings() == 3 );
        makeException( capture.logged( "gamma" ) );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Metadata_Malformed_Chunks_Skipped" );
        LogCapture capture;

        Ihdr ihdr;
        ihdr.width = 1;
        ihdr.height = 1;
        ihdr.colorType = ColorType::Grayscale;

        std::vector<Chunk> chunks;
        chunks.emplace_back( "tIME", std::vector<uint8_t>( { 7, 0xD0, 1 } ) );
        chunks.emplace_back( "tEXt", std::vector<uint8_t>( { 'n', 'o', 'n', 'u', 'l' } ) );
        chunks.emplace_back( "zTXt", std::vector<uint8_t>( { 'k', 0, 0, 1, 2, 3 } ) );
        chunks.emplace_back( "bKGD", std::vector<uint8_t>( { 0, 0, 0, 0, 0, 0 } ) );
        chunks.push_back( encodeGamma( 1.0 ) );

        auto invalid = encodeSrgb( 0 );
        invalid.valid = false;
        chunks.push_back( invalid );

        auto metadata = extractMetadata( chunks, ihdr );
        makeException( !metadata.time && metadata.texts.empty() && !metadata.background );
        makeException( !metadata.srgbIntent );
        makeException( metadata.gamma && *metadata.gamma == 1.0 );
        makeException( capture.warnings() == 4 );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Metadata_Dpi" );

        makeException( metersToDpi( 2835 ) == 72 );
        makeException( metersToDpi( 3780 ) == 96 );
        makeException( metersToDpi( 0 ) == 0 );
    } );
}

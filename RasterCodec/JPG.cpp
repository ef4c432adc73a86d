#include "RasterCodec/JPG.h"

#include <algorithm>
#include <memory>
#include <array>

#include "RasterCodec/Quantization.h"
#include "RasterCodec/Validation.h"
#include "RasterCodec/Markers.h"
#include "RasterCodec/Huffman.h"
#include "RasterCodec/Blocks.h"
#include "RasterCodec/Zigzag.h"
#include "RasterCodec/Errors.h"
#include "RasterCodec/DCT.h"
#include "Log.h"

namespace RasterCodec
{
// APP2 payload per segment after the 14 byte ICC header
constexpr size_t maxIccChunk = 65519;

struct FrameGeometry
{
    unsigned maxH = 1, maxV = 1;
    uint32_t mcusX = 0, mcusY = 0;
};

static FrameGeometry frameGeometry( uint32_t width, uint32_t height, const std::vector<JpegComponentInfo> &components )
{
    FrameGeometry g;
    for( auto &c : components )
    {
        g.maxH = Max( g.maxH, unsigned( c.horizontal ) );
        g.maxV = Max( g.maxV, unsigned( c.vertical ) );
    }

    g.mcusX = DivUp<uint32_t>( width, 8 * g.maxH );
    g.mcusY = DivUp<uint32_t>( height, 8 * g.maxV );
    return g;
}

// Level shifted 8x8 samples, edges replicated past the plane
static Block planeBlock( const Plane &plane, uint32_t blockX, uint32_t blockY )
{
    Block block;
    for( unsigned y = 0; y < 8; ++y )
    {
        for( unsigned x = 0; x < 8; ++x )
            block[y * 8 + x] = plane.at( int64_t( blockX ) * 8 + x, int64_t( blockY ) * 8 + y ) - 128.0;
    }
    return block;
}

void validateOptions( const JpegEncodeOptions &options )
{
    validateQuality( options.quality );

    if( options.comment.size() > 0xFFFF - 2 )
        throw InvalidOptionError( "comment exceeds a COM segment", atField( "comment" ) );
    if( options.exif.size() > 0xFFFF - 2 - 6 )
        throw InvalidOptionError( "EXIF data exceeds an APP1 segment", atField( "exif" ) );
    if( options.icc.size() > 255 * maxIccChunk )
        throw InvalidOptionError( "ICC profile exceeds 255 APP2 segments", atField( "icc" ) );

    // Units and densities
    if( options.writeJfif )
        encodeJfif( options.jfif );
}

std::vector<uint8_t> encodeJPEGPixels( const std::vector<uint8_t> &pixels, uint32_t width, uint32_t height, const JpegEncodeOptions &options )
{
    validateOptions( options );
    validateDimensions( width, height, maxJpegDimension );
    validatePixelBuffer( pixels, width, height, Raster::channels );

    Log::debug( "encoding " + std::to_string( width ) + "x" + std::to_string( height ) + " JPEG at quality " +
                std::to_string( options.quality ), "jpeg" );

    bool gray = options.colorSpace == JpegColorSpace::Grayscale;
    unsigned tableCount = gray ? 1 : 2;

    // Index 0 for luminance, 1 for chrominance
    std::array<QuantizationTable, 2> quant =
    {
        scaleQuantizationTable( standardLuminanceTable, options.quality ),
        scaleQuantizationTable( standardChrominanceTable, options.quality )
    };

    auto ycc = convertRgbaToYCbCr( pixels, width, height, options.color );

    std::vector<JpegComponentInfo> components;
    std::vector<Plane> planes;
    if( gray )
    {
        components.push_back( { 1, 1, 1, 0 } );
        planes.push_back( extractPlane( ycc, width, height, Raster::channels, 0 ) );
    }
    else
    {
        unsigned h = 1, v = 1;
        switch( options.subsampling )
        {
        case ChromaSubsampling::S444:
            break;
        case ChromaSubsampling::S422:
            h = 2;
            break;
        case ChromaSubsampling::S420:
            h = v = 2;
            break;
        }

        components.push_back( { 1, uint8_t( h ), uint8_t( v ), 0 } );
        components.push_back( { 2, 1, 1, 1 } );
        components.push_back( { 3, 1, 1, 1 } );

        planes.push_back( extractPlane( ycc, width, height, Raster::channels, 0 ) );
        planes.push_back( downsample( extractPlane( ycc, width, height, Raster::channels, 1 ), h, v ) );
        planes.push_back( downsample( extractPlane( ycc, width, height, Raster::channels, 2 ), h, v ) );
    }

    auto geometry = frameGeometry( width, height, components );
    size_t mcuCount = size_t( geometry.mcusX ) * geometry.mcusY;

    // Component of each block inside an MCU
    std::vector<unsigned> layout;
    for( unsigned c = 0; c < components.size(); ++c )
        layout.insert( layout.end(), size_t( components[c].horizontal ) * components[c].vertical, c );

    // Quantized blocks in scan order
    std::vector<CoefficientBlock> blocks;
    blocks.reserve( mcuCount * layout.size() );
    for( uint32_t my = 0; my < geometry.mcusY; ++my )
    {
        for( uint32_t mx = 0; mx < geometry.mcusX; ++mx )
        {
            for( unsigned c = 0; c < components.size(); ++c )
            {
                auto &info = components[c];
                for( unsigned j = 0; j < info.vertical; ++j )
                {
                    for( unsigned i = 0; i < info.horizontal; ++i )
                    {
                        auto block = planeBlock( planes[c], mx * info.horizontal + i, my * info.vertical + j );
                        auto quantized = quantizeBlock( forwardDCT( block ), quant[info.quantTable] );

                        CoefficientBlock natural;
                        for( size_t k = 0; k < 64; ++k )
                            natural[k] = int32_t( quantized[k] );
                        blocks.push_back( toZigzag( natural ) );
                    }
                }
            }
        }
    }

    auto restartDue = [&]( size_t mcu )
    {
        return options.restartInterval && mcu > 0 && mcu % options.restartInterval == 0;
    };

    std::array<HuffmanSpec, 2> dcSpecs = { standardDcLuminance, standardDcChrominance };
    std::array<HuffmanSpec, 2> acSpecs = { standardAcLuminance, standardAcChrominance };

    if( options.optimizeHuffman )
    {
        std::array<std::array<uint32_t, 256>, 2> dcFrequencies{}, acFrequencies{};
        std::vector<int32_t> predictors( components.size(), 0 );

        for( size_t m = 0; m < mcuCount; ++m )
        {
            if( restartDue( m ) )
                std::fill( predictors.begin(), predictors.end(), 0 );

            for( size_t k = 0; k < layout.size(); ++k )
            {
                unsigned c = layout[k];
                unsigned t = components[c].quantTable;
                countBlockSymbols( blocks[m * layout.size() + k], predictors[c], dcFrequencies[t], acFrequencies[t] );
            }
        }

        for( unsigned t = 0; t < tableCount; ++t )
        {
            dcSpecs[t] = buildOptimizedSpec( dcFrequencies[t] );
            acSpecs[t] = buildOptimizedSpec( acFrequencies[t] );
        }
    }

    std::array<HuffmanEncodeTable, 2> dcTables, acTables;
    for( unsigned t = 0; t < tableCount; ++t )
    {
        dcTables[t] = buildEncodeTable( dcSpecs[t] );
        acTables[t] = buildEncodeTable( acSpecs[t] );
    }

    std::vector<uint8_t> entropy;
    {
        BitWriter writer( entropy );
        std::vector<int32_t> predictors( components.size(), 0 );
        unsigned restartIndex = 0;

        for( size_t m = 0; m < mcuCount; ++m )
        {
            if( restartDue( m ) )
            {
                writer.flush();
                uint8_t rst[] = { 0xFF, uint8_t( 0xD0 + ( restartIndex++ & 7 ) ) };
                writer.write( sizeof( rst ), rst );
                std::fill( predictors.begin(), predictors.end(), 0 );
            }

            for( size_t k = 0; k < layout.size(); ++k )
            {
                unsigned c = layout[k];
                unsigned t = components[c].quantTable;
                encodeBlock( writer, blocks[m * layout.size() + k], predictors[c], dcTables[t], acTables[t] );
            }
        }
        writer.flush();
    }

    JpegFile jpeg;
    jpeg.add( std::make_shared<SegmentSOI>() );

    if( options.writeJfif )
    {
        auto app0 = std::make_shared<SegmentJFIF>();
        app0->data = encodeJfif( options.jfif );
        jpeg.add( app0 );
    }

    if( !options.exif.empty() )
    {
        auto app1 = std::make_shared<SegmentEXIF>();
        app1->data = { 'E', 'x', 'i', 'f', 0, 0 };
        app1->data.insert( app1->data.end(), options.exif.begin(), options.exif.end() );
        jpeg.add( app1 );
    }

    size_t iccChunks = DivUp( options.icc.size(), maxIccChunk );
    for( size_t i = 0; i < iccChunks; ++i )
    {
        auto app2 = std::make_shared<SegmentICC>();
        copy( app2->header.identifier, "ICC_PROFILE", sizeof( app2->header.identifier ) );
        app2->header.sequence = uint8_t( i + 1 );
        app2->header.count = uint8_t( iccChunks );

        auto begin = options.icc.begin() + i * maxIccChunk;
        auto end = options.icc.begin() + Min( ( i + 1 ) * maxIccChunk, options.icc.size() );
        app2->profile.assign( begin, end );
        jpeg.add( app2 );
    }

    if( !options.comment.empty() )
    {
        auto com = std::make_shared<SegmentCOM>();
        com->text = options.comment;
        jpeg.add( com );
    }

    auto dqt = std::make_shared<SegmentDQT>();
    for( unsigned t = 0; t < tableCount; ++t )
    {
        DataDQT::Table8 table;
        table.pq_tq = uint8_t( t );
        for( size_t k = 0; k < 64; ++k )
            table.values[k] = uint8_t( quant[t][ZigZag[k]] );
        dqt->tables.push_back( table );
    }
    jpeg.add( dqt );

    auto sof = std::make_shared<SegmentSOF>();
    sof->marker = 0xC0;
    sof->header.samplePrecision = 8;
    sof->header.imageWidth = uint16_t( width );
    sof->header.imageHeight = uint16_t( height );
    sof->header.numComponents = uint8_t( components.size() );
    for( auto &c : components )
        sof->components.push_back( { c.id, uint8_t( ( c.horizontal << 4 ) | c.vertical ), c.quantTable } );
    jpeg.add( sof );

    auto dht = std::make_shared<SegmentDHT>();
    for( unsigned t = 0; t < tableCount; ++t )
    {
        dht->tables.push_back( { uint8_t( 0x00 | t ), dcSpecs[t] } );
        dht->tables.push_back( { uint8_t( 0x10 | t ), acSpecs[t] } );
    }
    jpeg.add( dht );

    if( options.restartInterval )
    {
        auto dri = std::make_shared<SegmentDRI>();
        dri->restartInterval = options.restartInterval;
        jpeg.add( dri );
    }

    auto sos = std::make_shared<SegmentSOS>();
    for( auto &c : components )
        sos->components.push_back( { c.id, uint8_t( ( c.quantTable << 4 ) | c.quantTable ) } );
    sos->coded = std::move( entropy );
    jpeg.add( sos );

    jpeg.add( std::make_shared<SegmentEOI>() );

    std::vector<uint8_t> result;
    VectorWriter w( result );
    jpeg.write( w );
    return result;
}

static uint8_t tableId( const SegmentDQT::Table &table )
{
    return std::visit( []( const auto & t )
    {
        return uint8_t( t.pq_tq & 0x0F );
    }, table );
}

// DQT values arrive in zigzag order
static QuantizationTable naturalTable( const SegmentDQT::Table &table )
{
    QuantizationTable result;
    std::visit( [&]( const auto & t )
    {
        for( size_t k = 0; k < 64; ++k )
            result[ZigZag[k]] = uint16_t( t.values[k] );
    }, table );
    return result;
}

static const SegmentSOF &frameOf( const JpegFile &jpeg )
{
    auto frames = jpeg.find<SegmentSOF>();
    if( frames.empty() )
        throw StructuralError( "missing SOF segment" );
    if( frames.size() > 1 )
        throw StructuralError( "multiple SOF segments" );
    return *frames.front();
}

static std::optional<JpegColorModel> colorModelOf( const JpegFile &jpeg, const SegmentSOF &sof )
{
    std::optional<uint8_t> transform;
    auto adobe = jpeg.find<SegmentAdobe>();
    if( !adobe.empty() )
        transform = adobe.front()->header.colorTransform;

    switch( sof.components.size() )
    {
    case 1:
        return JpegColorModel::Grayscale;
    case 3:
        if( transform )
            return *transform == 0 ? JpegColorModel::RGB : JpegColorModel::YCbCr;
        if( sof.components[0].componentId == 'R' && sof.components[1].componentId == 'G' && sof.components[2].componentId == 'B' )
            return JpegColorModel::RGB;
        return JpegColorModel::YCbCr;
    case 4:
        if( transform && *transform == 2 )
            return JpegColorModel::YCCK;
        return JpegColorModel::CMYK;
    default:
        return std::nullopt;
    }
}

static std::optional<std::vector<uint8_t>> assembleIcc( const JpegFile &jpeg )
{
    auto chunks = jpeg.find<SegmentICC>();
    if( chunks.empty() )
        return std::nullopt;

    std::sort( chunks.begin(), chunks.end(), []( const SegmentICC * a, const SegmentICC * b )
    {
        return a->header.sequence < b->header.sequence;
    } );

    std::vector<uint8_t> profile;
    for( size_t i = 0; i < chunks.size(); ++i )
    {
        if( chunks[i]->header.sequence != i + 1 || chunks[i]->header.count != chunks.size() )
        {
            Log::warning( "ICC profile segments are out of sequence, profile dropped", "jpeg" );
            return std::nullopt;
        }
        profile.insert( profile.end(), chunks[i]->profile.begin(), chunks[i]->profile.end() );
    }
    return profile;
}

static void collectMetadata( const JpegFile &jpeg, const SegmentSOF &sof, JpegMetadata &metadata )
{
    metadata.frameMarker = sof.marker;
    metadata.progressive = sof.progressive();
    metadata.precision = sof.header.samplePrecision;
    metadata.colorModel = colorModelOf( jpeg, sof );

    for( auto &c : sof.components )
        metadata.components.push_back( { c.componentId, uint8_t( c.samplingFactors >> 4 ), uint8_t( c.samplingFactors & 0x0F ), c.quantTableId } );

    auto jfif = jpeg.find<SegmentJFIF>();
    if( !jfif.empty() )
    {
        try
        {
            metadata.jfif = parseJfif( jfif.front()->data );
        }
        catch( const MetadataError &e )
        {
            Log::warning( "skipping JFIF segment: " + e.text(), "jpeg" );
        }
    }

    auto exif = jpeg.find<SegmentEXIF>();
    if( !exif.empty() )
    {
        try
        {
            metadata.exif = parseExif( exif.front()->tiff() );
        }
        catch( const MetadataError &e )
        {
            Log::warning( "skipping EXIF segment: " + e.text(), "jpeg" );
        }
    }

    metadata.icc = assembleIcc( jpeg );

    auto comments = jpeg.find<SegmentCOM>();
    if( !comments.empty() )
        metadata.comment = comments.front()->text;

    auto adobe = jpeg.find<SegmentAdobe>();
    if( !adobe.empty() )
        metadata.adobeTransform = adobe.front()->header.colorTransform;

    auto dri = jpeg.find<SegmentDRI>();
    if( !dri.empty() )
        metadata.restartInterval = dri.front()->restartInterval;

    // Last definition of the first component's table
    std::optional<QuantizationTable> table;
    for( auto dqt : jpeg.find<SegmentDQT>() )
    {
        for( auto &t : dqt->tables )
        {
            if( !sof.components.empty() && tableId( t ) == sof.components.front().quantTableId )
                table = naturalTable( t );
        }
    }
    if( table )
        metadata.estimatedQuality = estimateQuality( *table, true );
}

static JpegFile parseContainer( const uint8_t *data, size_t size )
{
    SimpleReader r( data, size );
    JpegFile jpeg;
    jpeg.read( r );
    return jpeg;
}

JpegInfo readJPEGInfo( const uint8_t *data, size_t size )
{
    auto jpeg = parseContainer( data, size );
    auto &sof = frameOf( jpeg );

    JpegInfo info;
    info.width = sof.header.imageWidth;
    info.height = sof.header.imageHeight;
    info.codingProcess = SegmentSOF::codingProcess( sof.marker );
    collectMetadata( jpeg, sof, info.metadata );
    return info;
}

namespace
{
struct ComponentState
{
    JpegComponentInfo info;
    uint32_t width = 0, height = 0;   // Samples
    uint32_t blocksX = 0, blocksY = 0; // Padded to whole MCUs
    std::vector<CoefficientBlock> coefficients;
    std::optional<QuantizationTable> quant;
    bool scanned = false;
};

using QuantSlots = std::array<std::optional<QuantizationTable>, 4>;
using HuffmanSlots = std::array<std::optional<HuffmanDecodeTable>, 4>;
}

static void decodeScan( const SegmentSOS &sos, std::vector<ComponentState> &states, const FrameGeometry &geometry,
                        const HuffmanSlots &dc, const HuffmanSlots &ac, const QuantSlots &quant, uint16_t restartInterval )
{
    if( sos.spectralStart != 0 || sos.spectralEnd != 63 || sos.successiveApproximation != 0 )
        throw StructuralError( "sequential scan declares spectral selection or successive approximation", atField( "SOS" ) );

    struct ScanComponent
    {
        ComponentState *state;
        const HuffmanDecodeTable *dc, *ac;
        int32_t predictor;
    };

    std::vector<ScanComponent> scan;
    for( auto &c : sos.components )
    {
        auto state = std::find_if( states.begin(), states.end(), [&]( const ComponentState & s )
        {
            return s.info.id == c.componentId;
        } );
        if( state == states.end() )
            throw StructuralError( "scan references unknown component " + std::to_string( c.componentId ), atField( "SOS" ) );

        unsigned td = c.huffmanSelectors >> 4, ta = c.huffmanSelectors & 0x0F;
        if( td > 3 || ta > 3 || !dc[td] || !ac[ta] )
            throw StructuralError( "scan references an undefined Huffman table", atField( "SOS" ) );

        if( !state->quant )
        {
            auto tq = state->info.quantTable;
            if( tq > 3 || !quant[tq] )
                throw StructuralError( "component " + std::to_string( c.componentId ) + " references an undefined quantization table", atField( "DQT" ) );
            state->quant = quant[tq];
        }

        state->scanned = true;
        scan.push_back( { &*state, &*dc[td], &*ac[ta], 0 } );
    }

    // A single component scan covers that component's own block grid
    bool interleaved = scan.size() > 1;
    uint32_t unitsX = geometry.mcusX, unitsY = geometry.mcusY;
    if( !interleaved )
    {
        unitsX = DivUp<uint32_t>( scan.front().state->width, 8 );
        unitsY = DivUp<uint32_t>( scan.front().state->height, 8 );
    }

    auto decodeInto = [&]( BitReader & bits, ScanComponent & sc, uint32_t bx, uint32_t by )
    {
        auto &state = *sc.state;
        state.coefficients[size_t( by ) * state.blocksX + bx] = decodeBlock( bits, sc.predictor, *sc.dc, *sc.ac );
    };

    if( sos.intervals.empty() )
        throw TruncatedDataError( "scan holds no entropy-coded data", atField( "SOS" ) );

    size_t slice = 0;
    BitReader reader( sos.intervals.front().data.data(), sos.intervals.front().data.size() );

    size_t units = size_t( unitsX ) * unitsY;
    for( size_t m = 0; m < units; ++m )
    {
        if( restartInterval && m > 0 && m % restartInterval == 0 )
        {
            ++slice;
            if( slice >= sos.intervals.size() )
                throw TruncatedDataError( "restart marker missing after " + std::to_string( m ) + " MCUs", atField( "SOS" ) );

            auto &next = sos.intervals[slice];
            if( next.restart != uint8_t( 0xD0 + ( ( slice - 1 ) & 7 ) ) )
                Log::warning( "restart marker out of sequence at MCU " + std::to_string( m ), "jpeg" );

            reader = BitReader( next.data.data(), next.data.size() );
            for( auto &sc : scan )
                sc.predictor = 0;
        }

        uint32_t mx = uint32_t( m % unitsX ), my = uint32_t( m / unitsX );
        for( auto &sc : scan )
        {
            if( !interleaved )
            {
                decodeInto( reader, sc, mx, my );
                continue;
            }

            for( unsigned j = 0; j < sc.state->info.vertical; ++j )
            {
                for( unsigned i = 0; i < sc.state->info.horizontal; ++i )
                    decodeInto( reader, sc, mx * sc.state->info.horizontal + i, my * sc.state->info.vertical + j );
            }
        }
    }

    if( reader.exhausted() )
        throw TruncatedDataError( "entropy-coded data ends early", atField( "SOS" ) );
}

// Dequantize, inverse DCT and level shift into a plane of the component's size
static Plane reconstructPlane( const ComponentState &state )
{
    Plane plane;
    plane.width = state.width;
    plane.height = state.height;
    plane.samples.resize( size_t( plane.width ) * plane.height );

    for( uint32_t by = 0; by < state.blocksY; ++by )
    {
        for( uint32_t bx = 0; bx < state.blocksX; ++bx )
        {
            if( bx * 8 >= plane.width || by * 8 >= plane.height )
                continue;

            auto natural = fromZigzag( state.coefficients[size_t( by ) * state.blocksX + bx] );

            Block quantized;
            for( size_t k = 0; k < 64; ++k )
                quantized[k] = natural[k];

            auto spatial = inverseDCT( dequantizeBlock( quantized, *state.quant ) );

            for( uint32_t y = 0; y < 8 && by * 8 + y < plane.height; ++y )
            {
                for( uint32_t x = 0; x < 8 && bx * 8 + x < plane.width; ++x )
                {
                    double value = Clamp( Round( spatial[y * 8 + x] + 128 ), 0.0, 255.0 );
                    plane.samples[size_t( by * 8 + y ) * plane.width + bx * 8 + x] = uint8_t( value );
                }
            }
        }
    }
    return plane;
}

// Adobe stores inverted inks
static uint8_t inkToRgb( int ink, int black, bool inverted )
{
    if( !inverted )
    {
        ink = 255 - ink;
        black = 255 - black;
    }
    return uint8_t( ( ink * black + 127 ) / 255 );
}

JpegImage decodeJPEG( const uint8_t *data, size_t size, const ColorConversionOptions &color )
{
    Log::debug( "decoding JPEG of " + std::to_string( size ) + " bytes", "jpeg" );

    auto jpeg = parseContainer( data, size );
    auto &sof = frameOf( jpeg );

    if( !sof.sequential() )
        throw StructuralError( std::string( "unsupported coding process: " ) + SegmentSOF::codingProcess( sof.marker ), atField( "SOF" ) );
    if( sof.header.samplePrecision != 8 )
        throw StructuralError( "unsupported sample precision " + std::to_string( sof.header.samplePrecision ), atField( "SOF" ) );
    if( sof.header.imageWidth == 0 || sof.header.imageHeight == 0 )
        throw StructuralError( "frame declares zero dimensions", atField( "SOF" ) );

    JpegImage image;
    image.width = sof.header.imageWidth;
    image.height = sof.header.imageHeight;
    collectMetadata( jpeg, sof, image.metadata );

    if( !image.metadata.colorModel )
        throw StructuralError( "unsupported component count " + std::to_string( sof.components.size() ), atField( "SOF" ) );

    for( auto &c : image.metadata.components )
    {
        if( c.horizontal < 1 || c.horizontal > 4 || c.vertical < 1 || c.vertical > 4 )
            throw StructuralError( "invalid sampling factors for component " + std::to_string( c.id ), atField( "SOF" ) );
    }

    auto geometry = frameGeometry( image.width, image.height, image.metadata.components );

    auto scans = jpeg.find<SegmentSOS>();
    if( scans.empty() )
        throw StructuralError( "missing SOS segment" );

    // A block costs at least a DC symbol and an AC symbol, one bit each
    uint64_t blocks = 0, codedBits = 0;
    for( auto &c : image.metadata.components )
        blocks += uint64_t( geometry.mcusX ) * c.horizontal * geometry.mcusY * c.vertical;
    for( auto scan : scans )
    {
        for( auto &interval : scan->intervals )
            codedBits += uint64_t( interval.data.size() ) * 8;
    }
    if( codedBits < 2 * blocks )
    {
        throw TruncatedDataError( "entropy-coded data holds " + std::to_string( codedBits ) + " bits, the frame's " +
                                  std::to_string( blocks ) + " blocks need at least " + std::to_string( 2 * blocks ), atField( "SOS" ) );
    }

    std::vector<ComponentState> states;
    for( auto &c : image.metadata.components )
    {
        ComponentState state;
        state.info = c;
        state.width = DivUp<uint32_t>( image.width * c.horizontal, geometry.maxH );
        state.height = DivUp<uint32_t>( image.height * c.vertical, geometry.maxV );
        state.blocksX = geometry.mcusX * c.horizontal;
        state.blocksY = geometry.mcusY * c.vertical;
        state.coefficients.resize( size_t( state.blocksX ) * state.blocksY, CoefficientBlock{} );
        states.push_back( std::move( state ) );
    }

    // Tables may be redefined between scans, so segments are applied in file order
    QuantSlots quant;
    HuffmanSlots dc, ac;
    uint16_t restartInterval = 0;

    for( auto &segment : jpeg.all() )
    {
        if( auto dqt = dynamic_cast<const SegmentDQT *>( segment.get() ) )
        {
            for( auto &t : dqt->tables )
                quant[tableId( t )] = naturalTable( t );
        }
        else if( auto dht = dynamic_cast<const SegmentDHT *>( segment.get() ) )
        {
            for( auto &t : dht->tables )
            {
                auto &slots = ( t.tc_th >> 4 ) == 0 ? dc : ac;
                slots[t.tc_th & 0x0F] = buildDecodeTable( t.spec );
            }
        }
        else if( auto dri = dynamic_cast<const SegmentDRI *>( segment.get() ) )
        {
            restartInterval = dri->restartInterval;
        }
        else if( auto sos = dynamic_cast<const SegmentSOS *>( segment.get() ) )
        {
            decodeScan( *sos, states, geometry, dc, ac, quant, restartInterval );
        }
    }

    std::vector<std::vector<uint8_t>> channels;
    for( auto &state : states )
    {
        if( !state.scanned )
            throw StructuralError( "component " + std::to_string( state.info.id ) + " is not covered by any scan" );

        double ratioX = double( state.info.horizontal ) / geometry.maxH;
        double ratioY = double( state.info.vertical ) / geometry.maxV;
        channels.push_back( upsample( reconstructPlane( state ), image.width, image.height, ratioX, ratioY ) );
    }

    bool inverted = image.metadata.adobeTransform.has_value();
    size_t count = size_t( image.width ) * image.height;
    image.pixels.resize( count * Raster::channels );

    for( size_t i = 0; i < count; ++i )
    {
        uint8_t *out = &image.pixels[i * Raster::channels];
        out[3] = 255;

        switch( *image.metadata.colorModel )
        {
        case JpegColorModel::Grayscale:
            out[0] = out[1] = out[2] = channels[0][i];
            break;
        case JpegColorModel::RGB:
            out[0] = channels[0][i];
            out[1] = channels[1][i];
            out[2] = channels[2][i];
            break;
        case JpegColorModel::YCbCr:
        {
            auto rgb = yCbCrToRgb( channels[0][i], channels[1][i], channels[2][i], color );
            out[0] = rgb.r;
            out[1] = rgb.g;
            out[2] = rgb.b;
            break;
        }
        case JpegColorModel::CMYK:
            out[0] = inkToRgb( channels[0][i], channels[3][i], inverted );
            out[1] = inkToRgb( channels[1][i], channels[3][i], inverted );
            out[2] = inkToRgb( channels[2][i], channels[3][i], inverted );
            break;
        case JpegColorModel::YCCK:
        {
            // YCC carries 255 - ink
            auto rgb = yCbCrToRgb( channels[0][i], channels[1][i], channels[2][i], color );
            out[0] = inkToRgb( 255 - rgb.r, channels[3][i], inverted );
            out[1] = inkToRgb( 255 - rgb.g, channels[3][i], inverted );
            out[2] = inkToRgb( 255 - rgb.b, channels[3][i], inverted );
            break;
        }
        }
    }

    return image;
}
}

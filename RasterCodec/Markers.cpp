#include "RasterCodec/Markers.h"

#include "RasterCodec/Errors.h"
#include "Log.h"

namespace RasterCodec
{
static std::string markerName( uint8_t marker )
{
    const char *digits = "0123456789ABCDEF";
    std::string name = "FF";
    name += digits[marker >> 4];
    name += digits[marker & 0x0F];
    return name;
}

// Skips to the next segment marker, false at the end of data or on a stray 0x00 or RSTn
static bool seekMarker( ReaderBase &r, uint8_t &marker )
{
    uint8_t byte = 0;
    while( byte != 0xFF )
    {
        if( !r.read( 1, &byte ) )
            return false;
    }

    // Any number of 0xFF fill bytes may precede the marker code
    while( byte == 0xFF )
    {
        if( !r.read( 1, &byte ) )
            return false;
    }

    if( byte == 0x00 || ( 0xD0 <= byte && byte <= 0xD7 ) )
        return false;

    marker = byte;
    return true;
}

// Marker, length field, then `head` and `body` back to back
static bool writeSegment( WriterBase &w, uint8_t marker, const void *head, size_t headSize, const void *body = nullptr, size_t bodySize = 0 )
{
    size_t total = headSize + bodySize + 2;
    if( total > 0xFFFF )
        return false;

    uint8_t prefix[4] = { 0xFF, marker, uint8_t( total >> 8 ), uint8_t( total ) };
    if( !w.write( sizeof( prefix ), prefix ) )
        return false;

    if( headSize && !w.write( headSize, head ) )
        return false;

    return !bodySize || w.write( bodySize, body );
}

static bool writeBareMarker( WriterBase &w, uint8_t marker )
{
    uint8_t bytes[] = { 0xFF, marker };
    return w.write( sizeof( bytes ), bytes );
}

// Fills `out` with the `size` bytes that follow
static bool readBytes( ReaderBase &r, size_t size, std::vector<uint8_t> &out )
{
    out.resize( size );
    return !size || r.read( size, out.data() );
}

SegmentGeneric::SegmentGeneric( uint8_t m ) : marker( m )
{}

bool SegmentGeneric::read( ReaderBase &r, uint16_t length )
{
    return readBytes( r, length, data );
}

bool SegmentGeneric::write( WriterBase &w ) const
{
    return writeSegment( w, marker, data.data(), data.size() );
}

bool SegmentSOI::read( ReaderBase &, uint16_t )
{
    return true;
}

bool SegmentSOI::write( WriterBase &w ) const
{
    return writeBareMarker( w, 0xD8 );
}

bool SegmentEOI::read( ReaderBase &, uint16_t )
{
    return true;
}

bool SegmentEOI::write( WriterBase &w ) const
{
    return writeBareMarker( w, 0xD9 );
}

SegmentJFIF::SegmentJFIF() : SegmentGeneric( 0xE0 )
{}

SegmentEXIF::SegmentEXIF() : SegmentGeneric( 0xE1 )
{}

std::vector<uint8_t> SegmentEXIF::tiff() const
{
    const size_t identifier = 6;
    if( data.size() < identifier )
        return {};
    return std::vector<uint8_t>( data.begin() + identifier, data.end() );
}

bool SegmentICC::read( ReaderBase &r, uint16_t length )
{
    if( length < sizeof( header ) || !r.read( sizeof( header ), &header ) )
        return false;
    return readBytes( r, length - sizeof( header ), profile );
}

bool SegmentICC::write( WriterBase &w ) const
{
    return writeSegment( w, 0xE2, &header, sizeof( header ), profile.data(), profile.size() );
}

bool SegmentAdobe::read( ReaderBase &r, uint16_t length )
{
    if( length < sizeof( header ) || !r.read( sizeof( header ), &header ) )
        return false;

    if( !compare( header.identifier, "Adobe", sizeof( header.identifier ) ) )
        return false;

    header.version = swapBe16( header.version );
    header.flags0 = swapBe16( header.flags0 );
    header.flags1 = swapBe16( header.flags1 );

    return readBytes( r, length - sizeof( header ), trailing );
}

bool SegmentAdobe::write( WriterBase &w ) const
{
    DataAdobe stored = header;
    stored.version = swapBe16( header.version );
    stored.flags0 = swapBe16( header.flags0 );
    stored.flags1 = swapBe16( header.flags1 );
    return writeSegment( w, 0xEE, &stored, sizeof( stored ), trailing.data(), trailing.size() );
}

bool SegmentCOM::read( ReaderBase &r, uint16_t length )
{
    std::vector<uint8_t> bytes;
    if( !readBytes( r, length, bytes ) )
        return false;
    text.assign( bytes.begin(), bytes.end() );
    return true;
}

bool SegmentCOM::write( WriterBase &w ) const
{
    return writeSegment( w, 0xFE, text.data(), text.size() );
}

bool SegmentSOF::read( ReaderBase &r, uint16_t length )
{
    if( length < sizeof( header ) || !r.read( sizeof( header ), &header ) )
        return false;

    header.imageHeight = swapBe16( header.imageHeight );
    header.imageWidth = swapBe16( header.imageWidth );

    size_t listSize = sizeof( DataSOF::Component ) * header.numComponents;
    if( header.numComponents == 0 || sizeof( header ) + listSize != length )
        return false;

    components.resize( header.numComponents );
    return r.read( listSize, components.data() );
}

bool SegmentSOF::write( WriterBase &w ) const
{
    DataSOF stored = header;
    stored.numComponents = uint8_t( components.size() );
    stored.imageHeight = swapBe16( header.imageHeight );
    stored.imageWidth = swapBe16( header.imageWidth );
    return writeSegment( w, marker, &stored, sizeof( stored ), components.data(), sizeof( DataSOF::Component ) * components.size() );
}

bool SegmentSOF::sequential() const
{
    return marker == 0xC0 || marker == 0xC1;
}

bool SegmentSOF::progressive() const
{
    // Bit 1 of the low nibble marks progressive in every family
    return isFrameMarker( marker ) && ( marker & 0x03 ) == 0x02;
}

bool SegmentSOF::isFrameMarker( uint8_t marker )
{
    // C4, C8 and CC in this range are DHT, JPG and DAC
    return ( marker & 0xF0 ) == 0xC0 && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
}

const char *SegmentSOF::codingProcess( uint8_t marker )
{
    if( !isFrameMarker( marker ) )
        return "unknown";

    static const char *const names[16] =
    {
        "baseline", "extended sequential", "progressive", "lossless",
        nullptr, "differential sequential", "differential progressive", "differential lossless",
        nullptr, "arithmetic sequential", "arithmetic progressive", "arithmetic lossless",
        nullptr, "arithmetic differential sequential", "arithmetic differential progressive", "arithmetic differential lossless"
    };
    return names[marker & 0x0F];
}

bool SegmentDQT::read( ReaderBase &r, uint16_t length )
{
    tables.clear();

    size_t left = length;
    while( left > 0 )
    {
        uint8_t pq_tq;
        if( !r.read( 1, &pq_tq ) )
            return false;
        --left;

        unsigned precision = pq_tq >> 4;
        if( precision > 1 || ( pq_tq & 0x0F ) > 3 )
            return false;

        size_t entry = precision + 1;
        if( left < 64 * entry )
            return false;
        left -= 64 * entry;

        Table table;
        if( precision )
            table = DataDQT::Table16();
        else
            table = DataDQT::Table8();

        bool ok = std::visit( [&]( auto & t )
        {
            t.pq_tq = pq_tq;
            if( !r.read( sizeof( t.values ), t.values ) )
                return false;
            if constexpr( sizeof( t.values[0] ) == 2 )
            {
                for( auto &v : t.values )
                    v = swapBe16( v );
            }
            return true;
        }, table );

        if( !ok )
            return false;
        tables.push_back( table );
    }

    return true;
}

bool SegmentDQT::write( WriterBase &w ) const
{
    std::vector<uint8_t> body;
    for( auto &table : tables )
    {
        std::visit( [&]( const auto & t )
        {
            body.push_back( t.pq_tq );
            for( auto v : t.values )
            {
                if( sizeof( v ) == 2 )
                    body.push_back( uint8_t( v >> 8 ) );
                body.push_back( uint8_t( v ) );
            }
        }, table );
    }

    return writeSegment( w, 0xDB, body.data(), body.size() );
}

bool SegmentDHT::read( ReaderBase &r, uint16_t length )
{
    tables.clear();

    size_t left = length;
    while( left > 0 )
    {
        Table table;
        if( left < 17 || !r.read( 1, &table.tc_th ) || !r.read( 16, table.spec.counts.data() ) )
            return false;
        left -= 17;

        if( ( table.tc_th >> 4 ) > 1 || ( table.tc_th & 0x0F ) > 3 )
            return false;

        size_t symbols = 0;
        for( auto count : table.spec.counts )
            symbols += count;

        if( symbols > 256 || symbols > left || !readBytes( r, symbols, table.spec.symbols ) )
            return false;
        left -= symbols;

        tables.push_back( std::move( table ) );
    }

    return true;
}

bool SegmentDHT::write( WriterBase &w ) const
{
    std::vector<uint8_t> body;
    for( auto &table : tables )
    {
        body.push_back( table.tc_th );
        body.insert( body.end(), table.spec.counts.begin(), table.spec.counts.end() );
        body.insert( body.end(), table.spec.symbols.begin(), table.spec.symbols.end() );
    }
    return writeSegment( w, 0xC4, body.data(), body.size() );
}

bool SegmentDRI::read( ReaderBase &r, uint16_t length )
{
    uint16_t stored;
    if( length != sizeof( stored ) || !r.read( sizeof( stored ), &stored ) )
        return false;
    restartInterval = swapBe16( stored );
    return true;
}

bool SegmentDRI::write( WriterBase &w ) const
{
    uint16_t stored = swapBe16( restartInterval );
    return writeSegment( w, 0xDD, &stored, sizeof( stored ) );
}

// Entropy-coded data up to the first marker that is neither stuffing nor RSTn
static bool readScanData( ReaderBase &r, SegmentSOS &sos )
{
    sos.intervals.assign( 1, SegmentSOS::Interval() );
    sos.coded.clear();
    sos.terminator.reset();

    uint8_t byte;
    while( r.read( 1, &byte ) )
    {
        if( byte != 0xFF )
        {
            sos.intervals.back().data.push_back( byte );
            sos.coded.push_back( byte );
            continue;
        }

        uint8_t code = 0xFF;
        while( code == 0xFF )
        {
            if( !r.read( 1, &code ) )
                return false;
        }

        if( code == 0x00 )
        {
            sos.intervals.back().data.push_back( 0xFF );
        }
        else if( 0xD0 <= code && code <= 0xD7 )
        {
            SegmentSOS::Interval next;
            next.restart = code;
            sos.intervals.push_back( std::move( next ) );
        }
        else
        {
            sos.terminator = code;
            return true;
        }

        sos.coded.push_back( 0xFF );
        sos.coded.push_back( code );
    }

    return false;
}

bool SegmentSOS::read( ReaderBase &r, uint16_t length )
{
    uint8_t count;
    if( !r.read( 1, &count ) || count < 1 || count > 4 )
        return false;

    size_t listSize = count * sizeof( DataSOS::Component );
    if( length != 1 + listSize + 3 )
        return false;

    components.resize( count );
    uint8_t selection[3];
    if( !r.read( listSize, components.data() ) || !r.read( sizeof( selection ), selection ) )
        return false;

    spectralStart = selection[0];
    spectralEnd = selection[1];
    successiveApproximation = selection[2];

    return readScanData( r, *this );
}

bool SegmentSOS::write( WriterBase &w ) const
{
    std::vector<uint8_t> head;
    head.push_back( uint8_t( components.size() ) );
    for( auto &c : components )
    {
        head.push_back( c.componentId );
        head.push_back( c.huffmanSelectors );
    }
    head.push_back( spectralStart );
    head.push_back( spectralEnd );
    head.push_back( successiveApproximation );

    if( !writeSegment( w, 0xDA, head.data(), head.size() ) )
        return false;

    return coded.empty() || w.write( coded.size(), coded.data() );
}

static bool startsWith( const SimpleReader &r, uint16_t length, const char *identifier, size_t size )
{
    return length >= size && r.remaining() >= size && compare( r.current(), identifier, size );
}

// Recognized APPn identifiers get their own type, anything unknown stays opaque
static std::shared_ptr<JpegFile::Segment> createSegment( uint8_t marker, const SimpleReader &r, uint16_t length )
{
    if( SegmentSOF::isFrameMarker( marker ) )
    {
        auto sof = std::make_shared<SegmentSOF>();
        sof->marker = marker;
        return sof;
    }

    switch( marker )
    {
    case 0xC4:
        return std::make_shared<SegmentDHT>();
    case 0xDA:
        return std::make_shared<SegmentSOS>();
    case 0xDB:
        return std::make_shared<SegmentDQT>();
    case 0xDD:
        return std::make_shared<SegmentDRI>();
    case 0xFE:
        return std::make_shared<SegmentCOM>();
    case 0xE0:
        if( startsWith( r, length, "JFIF", 5 ) )
            return std::make_shared<SegmentJFIF>();
        break;
    case 0xE1:
        if( startsWith( r, length, "Exif\0", 6 ) )
            return std::make_shared<SegmentEXIF>();
        break;
    case 0xE2:
        if( length >= sizeof( DataICC ) && startsWith( r, length, "ICC_PROFILE", 12 ) )
            return std::make_shared<SegmentICC>();
        break;
    case 0xEE:
        if( length >= sizeof( DataAdobe ) && startsWith( r, length, "Adobe", 5 ) )
            return std::make_shared<SegmentAdobe>();
        break;
    default:
        Log::debug( "keeping segment " + markerName( marker ) + " opaque", "jpeg" );
        break;
    }

    return std::make_shared<SegmentGeneric>( marker );
}

void JpegFile::read( SimpleReader &r )
{
    segments.clear();

    uint8_t soi[2];
    if( !r.read( sizeof( soi ), soi ) || soi[0] != 0xFF || soi[1] != 0xD8 )
        throw StructuralError( "missing SOI marker", atOffset( 0 ) );
    segments.push_back( std::make_shared<SegmentSOI>() );

    // A scan consumes the marker that ends it
    std::optional<uint8_t> pending;

    while( true )
    {
        size_t start = r.position();
        uint8_t marker;

        if( pending )
        {
            marker = *pending;
            pending.reset();
            start -= 2;
        }
        else if( !seekMarker( r, marker ) )
        {
            if( r.remaining() == 0 )
                throw TruncatedDataError( "data ends before EOI", atOffset( r.position() ) );
            throw StructuralError( "unexpected marker outside entropy-coded data", atOffset( r.position() ) );
        }

        if( marker == 0xD9 )
        {
            segments.push_back( std::make_shared<SegmentEOI>() );
            return;
        }

        if( marker == 0xD8 || marker == 0x01 )
            throw StructuralError( "unexpected marker " + markerName( marker ), atOffset( start ) );

        uint16_t field;
        if( !r.read( sizeof( field ), &field ) )
            throw TruncatedDataError( "data ends inside segment " + markerName( marker ), atOffset( start ) );

        field = swapBe16( field );
        if( field < 2 )
            throw StructuralError( "segment " + markerName( marker ) + " declares length " + std::to_string( field ), atOffset( start ) );

        uint16_t length = field - 2;
        if( length > r.remaining() )
            throw TruncatedDataError( "segment " + markerName( marker ) + " exceeds remaining buffer", atOffset( start ) );

        auto segment = createSegment( marker, r, length );
        if( !segment->read( r, length ) )
        {
            if( r.remaining() == 0 )
                throw TruncatedDataError( "data ends inside segment " + markerName( marker ), atOffset( start ) );
            throw StructuralError( "malformed segment " + markerName( marker ), atOffset( start ) );
        }

        if( auto sos = dynamic_cast<const SegmentSOS *>( segment.get() ) )
            pending = sos->terminator;

        segments.push_back( std::move( segment ) );
    }
}

void JpegFile::write( WriterBase &w ) const
{
    for( auto &segment : segments )
    {
        if( !segment->write( w ) )
            throw RangeError( "segment does not fit in a JPEG marker segment" );
    }
}

void JpegFile::add( std::shared_ptr<Segment> segment )
{
    makeException( segment != nullptr );
    segments.push_back( std::move( segment ) );
}
}

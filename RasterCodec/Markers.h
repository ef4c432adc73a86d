#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <memory>
#include <string>
#include <vector>

#include "RasterCodec/Huffman.h"
#include "BitIO.h"

// https://www.w3.org/Graphics/JPEG/itu-t81.pdf (Annex B)

namespace RasterCodec
{
// Ordered list of marker segments making up one JPEG file
class JpegFile
{
public:
    struct Segment
    {
        // `length` is the body size, the length field excluded
        virtual bool read( ReaderBase &r, uint16_t length ) = 0;

        // Marker, length field and body
        virtual bool write( WriterBase &w ) const = 0;

        virtual ~Segment() = default;
    };

    // Throws TruncatedDataError when the data ends before EOI, StructuralError for anything malformed
    void read( SimpleReader &r );
    void write( WriterBase &w ) const;

    void add( std::shared_ptr<Segment> segment );

    const std::vector<std::shared_ptr<Segment>> &all() const
    {
        return segments;
    }

    // Null unless exactly one segment of type S is present
    template<typename S>
    const S *unique() const
    {
        auto matches = find<S>();
        return matches.size() == 1 ? matches.front() : nullptr;
    }

    template<typename S>
    std::vector<const S*> find() const
    {
        std::vector<const S*> matches;
        for( auto &segment : segments )
        {
            if( auto typed = dynamic_cast<const S*>( segment.get() ) )
                matches.push_back( typed );
        }
        return matches;
    }

private:
    std::vector<std::shared_ptr<Segment>> segments;
};

// Any segment kept as an opaque body
struct SegmentGeneric : public JpegFile::Segment
{
    uint8_t marker;
    std::vector<uint8_t> data;

    explicit SegmentGeneric( uint8_t marker );
    bool read( ReaderBase &r, uint16_t length ) override;
    bool write( WriterBase &w ) const override;
};

struct SegmentSOI : public JpegFile::Segment
{
    bool read( ReaderBase &, uint16_t ) override;
    bool write( WriterBase &w ) const override;
};

struct SegmentEOI : public JpegFile::Segment
{
    bool read( ReaderBase &, uint16_t ) override;
    bool write( WriterBase &w ) const override;
};

// APP0 starting with "JFIF\0", see parseJfif
struct SegmentJFIF : public SegmentGeneric
{
    SegmentJFIF();
};

// APP1 starting with "Exif\0\0"
struct SegmentEXIF : public SegmentGeneric
{
    SegmentEXIF();

    std::vector<uint8_t> tiff() const;
};

#pragma pack(push,1)
struct DataICC
{
    char identifier[12]; // "ICC_PROFILE\0"
    uint8_t sequence;    // 1-based
    uint8_t count;
};
#pragma pack(pop)

// APP2, one piece of a profile
struct SegmentICC : public JpegFile::Segment
{
    DataICC header;
    std::vector<uint8_t> profile;

    bool read( ReaderBase &r, uint16_t length ) override;
    bool write( WriterBase &w ) const override;
};

#pragma pack(push,1)
struct DataAdobe
{
    char identifier[5]; // "Adobe"
    uint16_t version;
    uint16_t flags0;
    uint16_t flags1;
    uint8_t colorTransform; // 0 none or CMYK, 1 YCbCr, 2 YCCK
};
#pragma pack(pop)

// APP14
struct SegmentAdobe : public JpegFile::Segment
{
    DataAdobe header;
    std::vector<uint8_t> trailing;

    bool read( ReaderBase &r, uint16_t length ) override;
    bool write( WriterBase &w ) const override;
};

struct SegmentCOM : public JpegFile::Segment
{
    std::string text;

    bool read( ReaderBase &r, uint16_t length ) override;
    bool write( WriterBase &w ) const override;
};

#pragma pack(push,1)
struct DataSOF
{
    uint8_t samplePrecision;
    uint16_t imageHeight;
    uint16_t imageWidth;
    uint8_t numComponents;

    struct Component
    {
        uint8_t componentId;
        uint8_t samplingFactors; // Horizontal in the high nibble
        uint8_t quantTableId;
    };
};
#pragma pack(pop)

// Any of the 13 frame markers, fields in host byte order
struct SegmentSOF : public JpegFile::Segment
{
    uint8_t marker = 0xC0;
    DataSOF header{};
    std::vector<DataSOF::Component> components;

    bool read( ReaderBase &r, uint16_t length ) override;
    bool write( WriterBase &w ) const override;

    // Huffman coded SOF0 and SOF1
    bool sequential() const;
    bool progressive() const;

    static bool isFrameMarker( uint8_t marker );
    static const char *codingProcess( uint8_t marker );
};

#pragma pack(push,1)
struct DataDQT
{
    struct Table8
    {
        uint8_t pq_tq;
        uint8_t values[64]; // Zigzag order
    };

    struct Table16
    {
        uint8_t pq_tq;
        uint16_t values[64];
    };
};
#pragma pack(pop)

struct SegmentDQT : public JpegFile::Segment
{
    using Table = std::variant<DataDQT::Table8, DataDQT::Table16>;
    std::vector<Table> tables;

    bool read( ReaderBase &r, uint16_t length ) override;
    bool write( WriterBase &w ) const override;
};

struct SegmentDHT : public JpegFile::Segment
{
    struct Table
    {
        uint8_t tc_th; // Class (0 DC, 1 AC) in the high nibble, slot in the low
        HuffmanSpec spec;
    };

    std::vector<Table> tables;

    bool read( ReaderBase &r, uint16_t length ) override;
    bool write( WriterBase &w ) const override;
};

struct SegmentDRI : public JpegFile::Segment
{
    uint16_t restartInterval = 0;

    bool read( ReaderBase &r, uint16_t length ) override;
    bool write( WriterBase &w ) const override;
};

#pragma pack(push,1)
struct DataSOS
{
    struct Component
    {
        uint8_t componentId;
        uint8_t huffmanSelectors; // DC table in the high nibble
    };
};
#pragma pack(pop)

// Scan header followed by its entropy-coded data
struct SegmentSOS : public JpegFile::Segment
{
    std::vector<DataSOS::Component> components;

    uint8_t spectralStart = 0;
    uint8_t spectralEnd = 63;
    uint8_t successiveApproximation = 0;

    // Data between two restart markers, unstuffed
    struct Interval
    {
        std::optional<uint8_t> restart; // RSTn that opened it, none for the first
        std::vector<uint8_t> data;
    };

    std::vector<Interval> intervals;

    // Stuffed bytes as they appear in the file, restart markers included
    std::vector<uint8_t> coded;

    // Marker that ended the scan, already consumed by `read`
    std::optional<uint8_t> terminator;

    bool read( ReaderBase &r, uint16_t length ) override;

    // Writes `coded`, never `terminator`
    bool write( WriterBase &w ) const override;
};
}

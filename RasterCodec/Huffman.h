#pragma once

#include <cstdint>
#include <vector>
#include <array>

#include "BitIO.h"

namespace RasterCodec
{
// Quantized coefficients in zigzag order
using CoefficientBlock = std::array<int32_t, 64>;

// DHT payload, counts[i] codes of length i + 1
struct HuffmanSpec
{
    std::array<uint8_t, 16> counts{};
    std::vector<uint8_t> symbols;
};

// ITU T.81 Annex K.3
extern const HuffmanSpec standardDcLuminance;
extern const HuffmanSpec standardAcLuminance;
extern const HuffmanSpec standardDcChrominance;
extern const HuffmanSpec standardAcChrominance;

struct HuffmanCode
{
    uint16_t code = 0;
    uint8_t length = 0; // 0 when the symbol has no code
};

using HuffmanEncodeTable = std::array<HuffmanCode, 256>;

// Canonical decoding tables, ITU T.81 F.2.2.3
struct HuffmanDecodeTable
{
    int32_t minCode[17];
    int32_t maxCode[17]; // -1 for unused lengths
    int32_t valPtr[17];
    std::vector<uint8_t> symbols;
};

// Both throw StructuralError when the counts do not match the symbols or the code space overflows
HuffmanEncodeTable buildEncodeTable( const HuffmanSpec &spec );
HuffmanDecodeTable buildDecodeTable( const HuffmanSpec &spec );

// Code lengths from symbol frequencies, limited to 16 bits, ITU T.81 K.2
HuffmanSpec buildOptimizedSpec( const std::array<uint32_t, 256> &frequencies );

// Bits needed for |value|
unsigned magnitudeCategory( int32_t value );

// Negative values are stored as value - 1 in the low `size` bits
uint32_t encodeMagnitudeBits( int32_t value, unsigned size );
int32_t extendMagnitude( uint32_t bits, unsigned size );

// MSB-first entropy writer, stuffs 0x00 after every 0xFF
class BitWriter : public WriterBase
{
public:
    explicit BitWriter( std::vector<uint8_t> &target );

    bool write( long long unsigned bits, BitList value ) override;

    // Unstuffed bytes such as RSTn markers, the writer must be flushed
    bool write( long long unsigned bytes, const void *value ) override;

    // Pads the last byte with 1-bits
    void flush();
private:
    void emit( uint8_t byte );

    std::vector<uint8_t> &target;
    uint64_t accumulator;
    unsigned pending;
};

// MSB-first reader over unstuffed entropy bytes
// Reading past the end yields 1-bits and marks the reader exhausted
class BitReader : public ReaderBase
{
public:
    BitReader( const void *data, size_t bytes );

    bool read( long long unsigned bits, BitList &value ) override;
    bool read( long long unsigned bytes, void *value ) override;

    bool exhausted() const;
private:
    const uint8_t *p, *end;
    uint64_t accumulator;
    unsigned available;
    uint64_t consumed, volume;
};

void writeSymbol( BitWriter &writer, const HuffmanEncodeTable &table, uint8_t symbol );

// TruncatedDataError once the data is exhausted, StructuralError for codes absent from the table
uint8_t decodeSymbol( BitReader &reader, const HuffmanDecodeTable &table );

// DC difference, then AC run/size pairs with ZRL (0xF0) and EOB (0x00)
void encodeBlock( BitWriter &writer, const CoefficientBlock &block, int32_t &previousDc,
                  const HuffmanEncodeTable &dc, const HuffmanEncodeTable &ac );

CoefficientBlock decodeBlock( BitReader &reader, int32_t &previousDc, const HuffmanDecodeTable &dc, const HuffmanDecodeTable &ac );

// Symbol statistics of encodeBlock, for buildOptimizedSpec
void countBlockSymbols( const CoefficientBlock &block, int32_t &previousDc,
                        std::array<uint32_t, 256> &dcFrequencies, std::array<uint32_t, 256> &acFrequencies );
}

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "BitIO.h"

// https://www.w3.org/TR/png/#5Chunk-layout

namespace RasterCodec
{
struct PngSignature
{
    static constexpr uint8_t bytes[8] {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

    static bool read( ReaderBase &r );
    static bool write( WriterBase &w );
};

struct ParseOptions
{
    bool validateCRC = true;
    bool strictMode = true; // Throw on CRC mismatch and truncation instead of recording or stopping
};

struct Chunk
{
    std::string type;
    std::vector<uint8_t> data;
    uint32_t length = 0;
    uint32_t crc = 0;
    uint32_t offset = 0; // Of the length field, relative to the parsed buffer
    bool valid = true;
    std::optional<std::string> error;

    Chunk() = default;
    Chunk( std::string type, std::vector<uint8_t> data );

    bool is( const char *name ) const;

    // Uppercase first letter
    bool critical() const;

    void updateCrc();
    uint32_t calculateCrc() const;

    // Length, type, data and CRC
    size_t size() const;

    bool write( WriterBase &w ) const;
};

// Throws InvalidOptionError unless `type` is four ASCII letters
void validateChunkType( const std::string &type );

// Reads chunks until the buffer is exhausted
std::vector<Chunk> parseChunks( const uint8_t *bytes, size_t size, const ParseOptions &options = {}, size_t baseOffset = 0 );

inline std::vector<Chunk> parseChunks( const std::vector<uint8_t> &bytes, const ParseOptions &options = {} )
{
    return parseChunks( bytes.data(), bytes.size(), options );
}

// Length, type, data and a fresh CRC
std::vector<uint8_t> writeChunk( const std::string &type, const std::vector<uint8_t> &data );

std::vector<const Chunk *> findChunksByType( const std::vector<Chunk> &chunks, const std::string &type );

// Throws StructuralError naming the violated ordering rule
void validateChunkStructure( const std::vector<Chunk> &chunks );

// Splits a compressed stream into IDAT chunks of at most maxChunkSize bytes
std::vector<Chunk> splitIdat( const std::vector<uint8_t> &compressed, size_t maxChunkSize );
}

#pragma once

#include <optional>
#include <string>

#include "Exception.h"

namespace RasterCodec
{
enum class ErrorKind
{
    Structural,   // Bad signature, ordering, truncation, unsupported process
    Integrity,    // CRC mismatch, corrupt compressed stream
    Range,        // Field outside allowed range
    SizeMismatch, // Buffer length inconsistent with declared format
    Metadata      // Ancillary data, recovered locally by decoders
};

// Where an error was detected
struct ErrorContext
{
    std::optional<std::string> chunkType;
    std::optional<size_t> offset;
    std::optional<std::string> field;
};

class CodecError : public Exception
{
public:
    CodecError( ErrorKind kind, const std::string &text, ErrorContext context = {} );

    ErrorKind kind() const;

    // UTF-8 description including the context
    const std::string &text() const;
    const ErrorContext &context() const;
private:
    static std::string compose( const std::string &text, const ErrorContext &context );

    ErrorKind errorKind;
    std::string description;
    ErrorContext where;
};

class StructuralError : public CodecError
{
public:
    StructuralError( const std::string &text, ErrorContext context = {} );
};

class TruncatedChunkError : public StructuralError
{
public:
    TruncatedChunkError( const std::string &text, ErrorContext context = {} );
};

class TruncatedDataError : public StructuralError
{
public:
    TruncatedDataError( const std::string &text, ErrorContext context = {} );
};

class IntegrityError : public CodecError
{
public:
    IntegrityError( const std::string &text, ErrorContext context = {} );
};

class ChunkCrcError : public IntegrityError
{
public:
    ChunkCrcError( const std::string &text, ErrorContext context = {} );
};

class CompressionError : public IntegrityError
{
public:
    CompressionError( const std::string &text, ErrorContext context = {} );
};

class RangeError : public CodecError
{
public:
    RangeError( const std::string &text, ErrorContext context = {} );
};

class InvalidHeaderError : public RangeError
{
public:
    InvalidHeaderError( const std::string &text, ErrorContext context = {} );
};

class InvalidQualityError : public RangeError
{
public:
    InvalidQualityError( const std::string &text, ErrorContext context = {} );
};

class InvalidDimensionsError : public RangeError
{
public:
    InvalidDimensionsError( const std::string &text, ErrorContext context = {} );
};

class InvalidOptionError : public RangeError
{
public:
    InvalidOptionError( const std::string &text, ErrorContext context = {} );
};

class SizeMismatchError : public CodecError
{
public:
    SizeMismatchError( const std::string &text, ErrorContext context = {} );
};

class PixelDataSizeError : public SizeMismatchError
{
public:
    PixelDataSizeError( const std::string &text, ErrorContext context = {} );
};

class MetadataError : public CodecError
{
public:
    MetadataError( const std::string &text, ErrorContext context = {} );
};

class InvalidKeywordError : public MetadataError
{
public:
    InvalidKeywordError( const std::string &text, ErrorContext context = {} );
};

class InvalidMetadataError : public MetadataError
{
public:
    InvalidMetadataError( const std::string &text, ErrorContext context = {} );
};

ErrorContext atChunk( const std::string &type, std::optional<size_t> offset = {} );
ErrorContext atField( const std::string &field );
ErrorContext atOffset( size_t offset );
}

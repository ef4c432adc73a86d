#include "RasterCodec/Errors.h"

namespace RasterCodec
{
CodecError::CodecError( ErrorKind kind, const std::string &text, ErrorContext context )
    : Exception( Exception::extract( compose( text, context ) ) ), errorKind( kind ), description( compose( text, context ) ), where( std::move( context ) )
{}

ErrorKind CodecError::kind() const
{
    return errorKind;
}

const std::string &CodecError::text() const
{
    return description;
}

const ErrorContext &CodecError::context() const
{
    return where;
}

std::string CodecError::compose( const std::string &text, const ErrorContext &context )
{
    std::string details;
    auto add = [&details]( const std::string &part )
    {
        if( !details.empty() )
            details += ", ";
        details += part;
    };

    if( context.chunkType )
        add( "chunk " + *context.chunkType );
    if( context.offset )
        add( "offset " + std::to_string( *context.offset ) );
    if( context.field )
        add( "field " + *context.field );

    if( details.empty() )
        return text;
    return text + " (" + details + ")";
}

StructuralError::StructuralError( const std::string &text, ErrorContext context )
    : CodecError( ErrorKind::Structural, text, std::move( context ) )
{}

TruncatedChunkError::TruncatedChunkError( const std::string &text, ErrorContext context )
    : StructuralError( text, std::move( context ) )
{}

TruncatedDataError::TruncatedDataError( const std::string &text, ErrorContext context )
    : StructuralError( text, std::move( context ) )
{}

IntegrityError::IntegrityError( const std::string &text, ErrorContext context )
    : CodecError( ErrorKind::Integrity, text, std::move( context ) )
{}

ChunkCrcError::ChunkCrcError( const std::string &text, ErrorContext context )
    : IntegrityError( text, std::move( context ) )
{}

CompressionError::CompressionError( const std::string &text, ErrorContext context )
    : IntegrityError( text, std::move( context ) )
{}

RangeError::RangeError( const std::string &text, ErrorContext context )
    : CodecError( ErrorKind::Range, text, std::move( context ) )
{}

InvalidHeaderError::InvalidHeaderError( const std::string &text, ErrorContext context )
    : RangeError( text, std::move( context ) )
{}

InvalidQualityError::InvalidQualityError( const std::string &text, ErrorContext context )
    : RangeError( text, std::move( context ) )
{}

InvalidDimensionsError::InvalidDimensionsError( const std::string &text, ErrorContext context )
    : RangeError( text, std::move( context ) )
{}

InvalidOptionError::InvalidOptionError( const std::string &text, ErrorContext context )
    : RangeError( text, std::move( context ) )
{}

SizeMismatchError::SizeMismatchError( const std::string &text, ErrorContext context )
    : CodecError( ErrorKind::SizeMismatch, text, std::move( context ) )
{}

PixelDataSizeError::PixelDataSizeError( const std::string &text, ErrorContext context )
    : SizeMismatchError( text, std::move( context ) )
{}

MetadataError::MetadataError( const std::string &text, ErrorContext context )
    : CodecError( ErrorKind::Metadata, text, std::move( context ) )
{}

InvalidKeywordError::InvalidKeywordError( const std::string &text, ErrorContext context )
    : MetadataError( text, std::move( context ) )
{}

InvalidMetadataError::InvalidMetadataError( const std::string &text, ErrorContext context )
    : MetadataError( text, std::move( context ) )
{}

ErrorContext atChunk( const std::string &type, std::optional<size_t> offset )
{
    ErrorContext context;
    context.chunkType = type;
    context.offset = offset;
    return context;
}

ErrorContext atField( const std::string &field )
{
    ErrorContext context;
    context.field = field;
    return context;
}

ErrorContext atOffset( size_t offset )
{
    ErrorContext context;
    context.offset = offset;
    return context;
}
}

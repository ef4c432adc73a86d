#include "Exception.h"

#include "Basic.h"

const wchar_t error = L'?';

std::wstring Exception::extract( const char *bytes )
{
    if( !bytes )
        return std::wstring( 1, error );
    return extract( std::string( bytes, stringLength( bytes ) ) );
}

std::wstring Exception::extract( const std::string &bytes )
{
    std::wstring result;
    result.reserve( bytes.size() );

    size_t i = 0;
    while( i < bytes.size() )
    {
        auto lead = ( unsigned char )bytes[i];

        unsigned extra;
        char32_t code;
        if( lead < 0x80 )
        {
            extra = 0;
            code = lead;
        }
        else if( ( lead & 0xE0 ) == 0xC0 )
        {
            extra = 1;
            code = lead & 0x1F;
        }
        else if( ( lead & 0xF0 ) == 0xE0 )
        {
            extra = 2;
            code = lead & 0x0F;
        }
        else if( ( lead & 0xF8 ) == 0xF0 )
        {
            extra = 3;
            code = lead & 0x07;
        }
        else
        {
            result += error;
            ++i;
            continue;
        }

        if( i + extra >= bytes.size() )
        {
            result += error;
            break;
        }

        bool valid = true;
        for( unsigned k = 1; k <= extra; ++k )
        {
            auto next = ( unsigned char )bytes[i + k];
            if( ( next & 0xC0 ) != 0x80 )
            {
                valid = false;
                break;
            }
            code = ( code << 6 ) | ( next & 0x3F );
        }

        if( !valid )
        {
            result += error;
            ++i;
            continue;
        }

        i += extra + 1;

        if constexpr( sizeof( wchar_t ) == 2 )
        {
            if( code >= 0x10000 )
            {
                code -= 0x10000;
                result += wchar_t( 0xD800 + ( code >> 10 ) );
                result += wchar_t( 0xDC00 + ( code & 0x3FF ) );
                continue;
            }
        }

        result += wchar_t( code );
    }

    return result;
}

std::wstring Exception::extract( long long number )
{
    return std::to_wstring( number );
}

std::string Exception::encode( const std::wstring &text )
{
    std::string result;
    result.reserve( text.size() );

    for( size_t i = 0; i < text.size(); ++i )
    {
        char32_t code = ( char32_t )text[i];

        if constexpr( sizeof( wchar_t ) == 2 )
        {
            if( 0xD800 <= code && code < 0xDC00 && i + 1 < text.size() )
            {
                char32_t low = ( char32_t )text[i + 1];
                if( 0xDC00 <= low && low < 0xE000 )
                {
                    code = 0x10000 + ( ( code - 0xD800 ) << 10 ) + ( low - 0xDC00 );
                    ++i;
                }
            }
        }

        if( code < 0x80 )
        {
            result += char( code );
        }
        else if( code < 0x800 )
        {
            result += char( 0xC0 | ( code >> 6 ) );
            result += char( 0x80 | ( code & 0x3F ) );
        }
        else if( code < 0x10000 )
        {
            result += char( 0xE0 | ( code >> 12 ) );
            result += char( 0x80 | ( ( code >> 6 ) & 0x3F ) );
            result += char( 0x80 | ( code & 0x3F ) );
        }
        else
        {
            result += char( 0xF0 | ( code >> 18 ) );
            result += char( 0x80 | ( ( code >> 12 ) & 0x3F ) );
            result += char( 0x80 | ( ( code >> 6 ) & 0x3F ) );
            result += char( 0x80 | ( code & 0x3F ) );
        }
    }

    return result;
}

Exception::Exception( std::wstring m )
{
    msg = std::move( m );
}

Exception::Exception( const char *file, int line )
{
    msg = extract( file ) + L" : " + extract( ( long long )line );
}

Exception::~Exception()
{}

const std::wstring &Exception::message() const
{
    return msg;
}

#pragma once

#include <string>

class Exception
{
public:
    // UTF-8 to wide string, invalid sequences become '?'
    static std::wstring extract( const char *bytes );
    static std::wstring extract( const std::string &bytes );
    static std::wstring extract( long long number );

    // Wide string to UTF-8
    static std::string encode( const std::wstring &text );

    Exception( std::wstring message );
    Exception( const char *file, int line );
    virtual ~Exception();

    const std::wstring &message() const;
private:
    std::wstring msg;
};

#define makeException(X) do{if(!(X)){throw Exception(__FILE__,__LINE__);}}while(false)

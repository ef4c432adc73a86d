#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>
#include <stack>

#include "Exception.h"

// Indents every line by the current nesting depth
class ConsoleOutput
{
public:
    inline explicit ConsoleOutput( std::ostream &s ) : stream( s )
    {}

    inline ConsoleOutput &operator<<( const std::string &data )
    {
        put( data );
        return *this;
    }

    inline ConsoleOutput &operator<<( const char *data )
    {
        put( data );
        return *this;
    }

    inline ConsoleOutput &operator<<( const std::wstring &data )
    {
        put( Exception::encode( data ) );
        return *this;
    }

    template<typename T>
    inline ConsoleOutput &operator<<( const T &data )
    {
        std::ostringstream buffer;
        buffer << data;
        put( buffer.str() );
        return *this;
    }

    inline void operator++()
    {
        ++depth;
    }

    inline void operator--()
    {
        if( depth > 0 )
            --depth;
    }
private:
    void put( const std::string &data );

    std::ostream &stream;
    unsigned depth = 0;
    bool lineStart = true;
};

class Scope;

// Thrown by Scope when a filter excludes the test
struct Skip
{
    std::string reason;
};

class Context
{
public:
    // "Png_Chunk" -> "Png Chunk", "a__b" -> "a_b"
    static void Standard( const std::string &input, std::string &output );

    Context( std::ostream &stream, std::vector<std::string> whitelist, std::vector<std::string> blacklist );
    virtual ~Context();

    std::string Identity() const;
    std::string Standard() const;

    std::string Opening() const;
    std::string Closing() const;

    std::string Status() const;

    void Open();
    void Close();

    ConsoleOutput &output();

    Scope scope( std::string description );

    std::optional<std::wstring> error;
    bool skipped = false;
private:
    std::optional<std::string> description;
    std::stack<Scope *> scopes;
    std::vector<std::string> whitelist, blacklist;
    ConsoleOutput out;

    friend Scope;
};

class Scope
{
public:
    ~Scope();
private:
    Scope( Context &context, std::string description );

    std::string description;
    Context &context;

    friend Context;
};

#include "Context.h"

#include <algorithm>

void ConsoleOutput::put( const std::string &data )
{
    for( auto symbol : data )
    {
        if( lineStart && symbol != '\n' )
        {
            for( unsigned i = 0; i < depth; ++i )
                stream << "    ";
            lineStart = false;
        }
        stream << symbol;
        if( symbol == '\n' )
            lineStart = true;
    }
    stream.flush();
}

void Context::Standard( const std::string &input, std::string &output )
{
    bool underscore = false;
    for( auto symbol : input )
    {
        if( symbol == '_' )
        {
            if( underscore )
                output += '_';
            underscore = !underscore;
            continue;
        }
        if( underscore )
        {
            output += ' ';
            underscore = false;
        }
        output += symbol;
    }
}

Context::Context( std::ostream &stream, std::vector<std::string> w, std::vector<std::string> b )
    : whitelist( std::move( w ) ), blacklist( std::move( b ) ), out( stream )
{}

Context::~Context()
{}

std::string Context::Identity() const
{
    makeException( description );
    return *description;
}

std::string Context::Standard() const
{
    std::string result;
    Standard( Identity(), result );
    return result;
}

std::string Context::Opening() const
{
    return Standard() + ":\n{\n";
}

std::string Context::Closing() const
{
    return "}\n";
}

std::string Context::Status() const
{
    std::string result = skipped ? "Skipped " : error.has_value() ? "Failed " : "Passed ";
    result += Standard() + "\n";
    if( error && !error->empty() )
        result += "\t" + Exception::encode( *error ) + "\n";
    return result;
}

void Context::Open()
{
    out << Opening();
    ++out;
}

void Context::Close()
{
    --out;
    out << Closing();
}

ConsoleOutput &Context::output()
{
    return out;
}

Scope Context::scope( std::string d )
{
    return Scope( *this, std::move( d ) );
}

Scope::Scope( Context &c, std::string d )
    : description( std::move( d ) ), context( c )
{
    context.description = description;

    // Filters apply to top-level tests only
    if( context.scopes.empty() )
    {
        auto name = context.Standard();
        auto listed = []( const std::vector<std::string> &list, const std::string &n )
        {
            return std::find( list.begin(), list.end(), n ) != list.end();
        };

        if( !context.whitelist.empty() && !listed( context.whitelist, name ) )
            throw Skip{ "Is absent in whitelist." };
        if( listed( context.blacklist, name ) )
            throw Skip{ "Is present in blacklist." };
    }

    context.scopes.push( this );
    context.Open();
}

Scope::~Scope()
{
    context.description = description;
    context.Close();
    context.scopes.pop();
}

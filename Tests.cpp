#include "Tests.h"

#include <exception>

Tests::Tests( std::ostream &stream, std::vector<std::string> whitelist, std::vector<std::string> blacklist )
    : context( stream, std::move( whitelist ), std::move( blacklist ) )
{}

void Tests::operator()( std::function<void( Context & )> function )
{
    functions.emplace_back( std::move( function ) );
}

unsigned Tests::run()
{
    std::vector<std::string> results;
    unsigned failures = 0;

    for( const auto &function : functions )
    {
        try
        {
            function( context );
        }
        catch( const Skip & )
        {
            context.skipped = true;
        }
        catch( const Exception &e )
        {
            context.error = e.message();
        }
        catch( const std::exception &e )
        {
            context.error = Exception::extract( e.what() );
        }
        catch( ... )
        {
            context.error = L"Unknown exception";
        }

        if( context.skipped )
        {
            context.skipped = false;
            context.error.reset();
            continue;
        }

        if( context.error )
            ++failures;

        try
        {
            results.push_back( context.Status() );
        }
        catch( const Exception & )
        {
            results.push_back( "Can't determine test status.\n" );
        }
        context.error.reset();
    }

    if( !results.empty() )
        context.output() << "\n";

    for( const auto &result : results )
        context.output() << result;

    context.output() << results.size() - failures << " passed, " << failures << " failed\n";
    return failures;
}

void parseTestFilters( int argc, char **argv, std::vector<std::string> &whitelist, std::vector<std::string> &blacklist )
{
    for( int i = 1; i < argc; ++i )
    {
        std::string argument = argv[i];
        if( argument.empty() )
            continue;
        if( argument[0] == '-' )
            blacklist.push_back( argument.substr( 1 ) );
        else
            whitelist.push_back( argument );
    }
}

#include "Tests/Fixtures.h"

#include <sstream>

void logTests( Tests &tests )
{
    tests( []( Context &context )
    {
        auto s = context.scope( "Log_Levels" );

        makeException( std::string( Log::levelName( LogLevel::Debug ) ) == "DEBUG" );
        makeException( std::string( Log::levelName( LogLevel::Warning ) ) == "WARNING" );
        makeException( Log::levelFromName( "INFO" ) == LogLevel::Info );
        makeException( Log::levelFromName( "DEBUG" ) == LogLevel::Debug );

        // Case-sensitive, unknown names fall back to Error
        makeException( Log::levelFromName( "debug" ) == LogLevel::Error );
        makeException( Log::levelFromName( "" ) == LogLevel::Error );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Log_Threshold" );

        LogCapture capture;
        Log::debug( "hidden", "png" );
        Log::info( "hidden too", "png" );
        Log::warning( "shown", "jpeg" );
        Log::error( "also shown", "jpeg" );
        makeException( capture.warnings() == 1 );
        makeException( capture.logged( "shown" ) && !capture.logged( "hidden" ) );

        Log::threshold( LogLevel::Debug );
        Log::debug( "now visible", "png" );
        makeException( capture.logged( "now visible" ) );
    } );

    tests( []( Context &context )
    {
        auto s = context.scope( "Log_Sinks" );

        LogCapture capture;

        auto memory = std::make_shared<MemorySink>();
        std::ostringstream text;
        auto stream = std::make_shared<StreamSink>( text );
        Log::addSink( memory );
        Log::addSink( stream );

        Log::warning( "bad CRC", "png" );
        Log::removeSink( stream );
        Log::error( "truncated", "jpeg" );
        Log::removeSink( memory );
        Log::warning( "after removal" );

        auto entries = memory->entries();
        makeException( entries.size() == 2 );
        makeException( entries[0].level == LogLevel::Warning && entries[0].message == "bad CRC" && entries[0].tag == "png" );
        makeException( entries[1].level == LogLevel::Error && entries[1].tag == "jpeg" );
        makeException( memory->count( LogLevel::Error ) == 1 );

        makeException( text.str() == "[WARNING] png: bad CRC\n" );
        makeException( capture.logged( "after removal" ) );

        memory->clear();
        makeException( memory->entries().empty() );
    } );
}

#include "Log.h"

#include <iostream>
#include <cstdlib>

StreamSink::StreamSink( std::ostream &s ) : stream( s )
{}

void StreamSink::write( LogLevel level, std::string_view message, std::string_view tag )
{
    stream << "[" << Log::levelName( level ) << "] " << tag << ": " << message << "\n";
    stream.flush();
}

void MemorySink::write( LogLevel level, std::string_view message, std::string_view tag )
{
    std::lock_guard<std::mutex> lock( mtx );
    records.push_back( { level, std::string( message ), std::string( tag ) } );
}

std::vector<MemorySink::Entry> MemorySink::entries() const
{
    std::lock_guard<std::mutex> lock( mtx );
    return records;
}

size_t MemorySink::count( LogLevel level ) const
{
    std::lock_guard<std::mutex> lock( mtx );
    size_t result = 0;
    for( const auto &e : records )
    {
        if( e.level == level )
            ++result;
    }
    return result;
}

void MemorySink::clear()
{
    std::lock_guard<std::mutex> lock( mtx );
    records.clear();
}

struct Log::State
{
    std::mutex mtx;
    std::vector<std::shared_ptr<LogSink>> sinks;
    LogLevel threshold = LogLevel::Warning;
    bool defaultSink = true;

    State()
    {
        if( auto value = std::getenv( "RASTERCODEC_LOG_LEVEL" ) )
            threshold = Log::levelFromName( value );
        sinks.push_back( std::make_shared<StreamSink>( std::cerr ) );
    }
};

Log::State &Log::state()
{
    static State instance;
    return instance;
}

void Log::addSink( std::shared_ptr<LogSink> sink )
{
    auto &s = state();
    std::lock_guard<std::mutex> lock( s.mtx );
    if( s.defaultSink )
    {
        s.sinks.clear();
        s.defaultSink = false;
    }
    if( sink )
        s.sinks.push_back( std::move( sink ) );
}

void Log::removeSink( const std::shared_ptr<LogSink> &sink )
{
    auto &s = state();
    std::lock_guard<std::mutex> lock( s.mtx );
    for( auto i = s.sinks.begin(); i != s.sinks.end(); ++i )
    {
        if( *i == sink )
        {
            s.sinks.erase( i );
            break;
        }
    }
}

void Log::clearSinks()
{
    auto &s = state();
    std::lock_guard<std::mutex> lock( s.mtx );
    s.sinks.clear();
    s.defaultSink = false;
}

void Log::threshold( LogLevel level )
{
    auto &s = state();
    std::lock_guard<std::mutex> lock( s.mtx );
    s.threshold = level;
}

LogLevel Log::threshold()
{
    auto &s = state();
    std::lock_guard<std::mutex> lock( s.mtx );
    return s.threshold;
}

void Log::write( LogLevel level, std::string_view message, std::string_view tag )
{
    auto &s = state();
    std::lock_guard<std::mutex> lock( s.mtx );
    if( level < s.threshold )
        return;
    for( const auto &sink : s.sinks )
        sink->write( level, message, tag );
}

void Log::debug( std::string_view message, std::string_view tag )
{
    write( LogLevel::Debug, message, tag );
}

void Log::info( std::string_view message, std::string_view tag )
{
    write( LogLevel::Info, message, tag );
}

void Log::warning( std::string_view message, std::string_view tag )
{
    write( LogLevel::Warning, message, tag );
}

void Log::error( std::string_view message, std::string_view tag )
{
    write( LogLevel::Error, message, tag );
}

const char *Log::levelName( LogLevel level )
{
    switch( level )
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "";
}

LogLevel Log::levelFromName( std::string_view name )
{
    if( name == "DEBUG" )
        return LogLevel::Debug;
    if( name == "INFO" )
        return LogLevel::Info;
    if( name == "WARNING" )
        return LogLevel::Warning;
    return LogLevel::Error;
}

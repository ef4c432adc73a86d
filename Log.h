#pragma once

#include <string_view>
#include <ostream>
#include <memory>
#include <string>
#include <vector>
#include <mutex>

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

// Destination of log records, installed into Log
class LogSink
{
public:
    virtual void write( LogLevel level, std::string_view message, std::string_view tag ) = 0;
    virtual ~LogSink()
    {}
};

// Writes "[LEVEL] tag: message" lines
class StreamSink : public LogSink
{
public:
    explicit StreamSink( std::ostream &stream );
    void write( LogLevel level, std::string_view message, std::string_view tag ) override;
private:
    std::ostream &stream;
};

// Keeps records, mostly for tests
class MemorySink : public LogSink
{
public:
    struct Entry
    {
        LogLevel level;
        std::string message, tag;
    };

    void write( LogLevel level, std::string_view message, std::string_view tag ) override;

    std::vector<Entry> entries() const;
    size_t count( LogLevel level ) const;
    void clear();
private:
    mutable std::mutex mtx;
    std::vector<Entry> records;
};

// Static logging facade
// Records below the threshold are dropped, the initial threshold comes from RASTERCODEC_LOG_LEVEL or is Warning
// A stderr StreamSink is installed until the first call to clearSinks or addSink
class Log
{
public:
    static void addSink( std::shared_ptr<LogSink> sink );
    static void removeSink( const std::shared_ptr<LogSink> &sink );
    static void clearSinks();

    static void threshold( LogLevel level );
    static LogLevel threshold();

    static void write( LogLevel level, std::string_view message, std::string_view tag = "rastercodec" );

    static void debug( std::string_view message, std::string_view tag = "rastercodec" );
    static void info( std::string_view message, std::string_view tag = "rastercodec" );
    static void warning( std::string_view message, std::string_view tag = "rastercodec" );
    static void error( std::string_view message, std::string_view tag = "rastercodec" );

    static const char *levelName( LogLevel level );

    // Case-sensitive, unknown names give Error
    static LogLevel levelFromName( std::string_view name );
private:
    struct State;
    static State &state();
};

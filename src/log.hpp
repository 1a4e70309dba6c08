#ifndef LOG_HPP
#define LOG_HPP

#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <memory>
#include <mutex>

enum class LOGL: uint8_t {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    ALERT
};

enum class LOGS: uint8_t {
    MAIN,
    FSM,
    PACKET,
    RIB,
    CLI,
    CONF
};

std::ostream& operator<<( std::ostream &os, const LOGL &l );
std::ostream& operator<<( std::ostream &os, const LOGS &l );

class Logger;

// One log line. Text is collected locally and handed to the Logger on std::endl,
// so lines from different worker threads never interleave.
class LogLine {
public:
    LogLine( Logger &l, bool n ):
        logger( l ),
        noop( n )
    {}

    LogLine( LogLine&& ) = default;
    LogLine( const LogLine& ) = delete;
    LogLine& operator=( const LogLine& ) = delete;

    LogLine& operator<<( std::ostream& (*fun)( std::ostream& ) );

    template<typename T>
    LogLine& operator<<( const T& data ) {
        if( !noop ) {
            ss << data;
        }
        return *this;
    }

private:
    Logger &logger;
    bool noop;
    std::ostringstream ss;
};

class Logger {
private:
    std::ostream &os;
    LOGL minimum;
    std::mutex mutex;

    LogLine printTime( const LOGL &level ) {
        LogLine line { *this, minimum > level };
        auto in_time_t = std::chrono::system_clock::to_time_t( std::chrono::system_clock::now() );
        std::tm tm_buf;
        localtime_r( &in_time_t, &tm_buf );
        line << std::put_time( &tm_buf, "%Y-%m-%d %X: " ) << level;
        return line;
    }

public:
    Logger( std::ostream &o = std::cout ):
        os( o ),
        minimum( LOGL::INFO )
    {}

    void setLevel( const LOGL &level ) {
        minimum = level;
    }

    LOGL getLevel() const {
        return minimum;
    }

    void write( const std::string &line ) {
        std::lock_guard<std::mutex> lg { mutex };
        os << line << std::endl;
    }

    LogLine logTrace() {
        return printTime( LOGL::TRACE );
    }

    LogLine logDebug() {
        return printTime( LOGL::DEBUG );
    }

    LogLine logInfo() {
        return printTime( LOGL::INFO );
    }

    LogLine logWarn() {
        return printTime( LOGL::WARN );
    }

    LogLine logError() {
        return printTime( LOGL::ERROR );
    }

    LogLine logAlert() {
        return printTime( LOGL::ALERT );
    }
};

inline LogLine& LogLine::operator<<( std::ostream& (*fun)( std::ostream& ) ) {
    if( !noop ) {
        logger.write( ss.str() );
        ss.str( {} );
    }
    return *this;
}

extern std::unique_ptr<Logger> logger;

#endif

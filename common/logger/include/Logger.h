/***************************************************************************
 * NASA Glenn Research Center, Cleveland, OH
 * Released under the NASA Open Source Agreement (NOSA)
 * May  2021
 *
 ***************************************************************************
 */

#ifndef _BP7_LOG_H
#define _BP7_LOG_H

#include <iostream>
#include <string>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/thread/once.hpp>
#include "bp7_log_export.h"

// Compile time log levels, numbered like boost::log::trivial::severity_level.
// Anything below LOG_LEVEL is compiled out of the binary.
#define LOG_LEVEL_TRACE 0
#define LOG_LEVEL_DEBUG 1
#define LOG_LEVEL_INFO 2
#define LOG_LEVEL_WARNING 3
#define LOG_LEVEL_ERROR 4
#define LOG_LEVEL_FATAL 5

#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

// the else branch is never taken so the streamed expression is dropped
#define _NO_OP_STREAM_LOGGER if (true) {} else std::cout

#define _LOG_INTERNAL(subprocess, lvl)\
    bp7::Logger::ensureInitialized();\
    BOOST_LOG_STREAM_CHANNEL_SEV(bp7::Logger::m_severityChannelLogger, subprocess, lvl)\
        << boost::log::add_value("File", static_cast<const char *>(__FILE__))\
        << boost::log::add_value("Line", __LINE__)

#if LOG_LEVEL <= LOG_LEVEL_TRACE
    #define LOG_TRACE(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::trace)
#else
    #define LOG_TRACE(subprocess) _NO_OP_STREAM_LOGGER
#endif

#if LOG_LEVEL <= LOG_LEVEL_DEBUG
    #define LOG_DEBUG(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::debug)
#else
    #define LOG_DEBUG(subprocess) _NO_OP_STREAM_LOGGER
#endif

#if LOG_LEVEL <= LOG_LEVEL_INFO
    #define LOG_INFO(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::info)
#else
    #define LOG_INFO(subprocess) _NO_OP_STREAM_LOGGER
#endif

#if LOG_LEVEL <= LOG_LEVEL_WARNING
    #define LOG_WARNING(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::warning)
#else
    #define LOG_WARNING(subprocess) _NO_OP_STREAM_LOGGER
#endif

#if LOG_LEVEL <= LOG_LEVEL_ERROR
    #define LOG_ERROR(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::error)
#else
    #define LOG_ERROR(subprocess) _NO_OP_STREAM_LOGGER
#endif

#if LOG_LEVEL <= LOG_LEVEL_FATAL
    #define LOG_FATAL(subprocess) _LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::fatal)
#else
    #define LOG_FATAL(subprocess) _NO_OP_STREAM_LOGGER
#endif

namespace bp7 {

/**
 * Process wide Boost.Log setup shared by the bp7 libraries.
 *
 * Records carry a channel (the SubProcess that emitted them) and a Process attribute
 * naming the executable.  Sinks are chosen at compile time:
 *   LOG_TO_CONSOLE       stdout, "[ channel ][ severity]: message"
 *   LOG_TO_PROCESS_FILE  logs/<process>_NNNNN.log with a timestamp
 *   LOG_TO_ERROR_FILE    logs/error_NNNNN.log, error and fatal only, with source location
 */
class Logger
{
public:
    enum class Process {
        unittest,
        none
    };

    enum class SubProcess {
        codec,
        config,
        util,
        unittest,
        none
    };

    typedef boost::log::sources::severity_channel_logger_mt<
        boost::log::trivial::severity_level,
        Logger::SubProcess
    > severity_channel_logger_t;

    BP7_LOG_EXPORT static severity_channel_logger_t m_severityChannelLogger;

    /// "MAJOR.MINOR.PATCH" from Bp7Version.hpp
    BP7_LOG_EXPORT static const std::string& GetBp7VersionAsString();

    /// Sets the Process attribute, then sets up the sinks if no message was logged yet.
    BP7_LOG_EXPORT static void initializeWithProcess(Logger::Process process);

    /// Sets up the sinks exactly once.  Called by every LOG_* statement.
    BP7_LOG_EXPORT static void ensureInitialized();

    BP7_LOG_EXPORT static std::string toString(Logger::Process process);
    BP7_LOG_EXPORT static std::string toString(Logger::SubProcess subprocess);

private:
    Logger() = delete;

    static void SetupSinks();
    static void AddConsoleSink();
    static void AddProcessFileSink();
    static void AddErrorFileSink();

    static boost::once_flag s_setupOnceFlag;
};

BP7_LOG_EXPORT std::ostream& operator<<(std::ostream& os, Logger::Process process);
BP7_LOG_EXPORT std::ostream& operator<<(std::ostream& os, Logger::SubProcess subprocess);

} //namespace bp7

#endif //_BP7_LOG_H

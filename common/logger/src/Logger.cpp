/***************************************************************************
 * NASA Glenn Research Center, Cleveland, OH
 * Released under the NASA Open Source Agreement (NOSA)
 * May  2021
 *
 ****************************************************************************
 */

#include "Logger.h"
#include "Bp7Version.hpp"
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/attributes/mutable_constant.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <string>

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace attrs = boost::log::attributes;
namespace keywords = boost::log::keywords;

namespace bp7 {

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", logging::trivial::severity_level) //no ending ";"

typedef attrs::mutable_constant<
    Logger::Process,
    boost::shared_mutex,
    boost::unique_lock<boost::shared_mutex>,
    boost::shared_lock<boost::shared_mutex>
> process_attr_t;
typedef sinks::synchronous_sink<sinks::text_file_backend> file_sink_t;
typedef sinks::synchronous_sink<sinks::text_ostream_backend> ostream_sink_t;

static const uint64_t LOG_FILE_ROTATION_SIZE_BYTES = 5 * 1024 * 1024;
static const std::size_t SOURCE_COLUMN_WIDTH = 9;
static const std::size_t SEVERITY_COLUMN_WIDTH = 5;

static process_attr_t g_processAttr(Logger::Process::none);

Logger::severity_channel_logger_t Logger::m_severityChannelLogger(keywords::channel = Logger::SubProcess::none);
boost::once_flag Logger::s_setupOnceFlag = BOOST_ONCE_INIT;

std::ostream& operator<<(std::ostream& os, Logger::Process process) {
    return os << Logger::toString(process);
}

std::ostream& operator<<(std::ostream& os, Logger::SubProcess subprocess) {
    return os << Logger::toString(subprocess);
}

static std::string PadRight(std::string s, std::size_t width) {
    if (s.size() < width) {
        s.append(width - s.size(), ' ');
    }
    return s;
}

static Logger::Process ProcessOf(const logging::record_view& rec) {
    logging::value_ref<Logger::Process> p = logging::extract<Logger::Process>("Process", rec);
    return (p) ? p.get() : Logger::Process::none;
}

static Logger::SubProcess ChannelOf(const logging::record_view& rec) {
    logging::value_ref<Logger::SubProcess> c = logging::extract<Logger::SubProcess>("Channel", rec);
    return (c) ? c.get() : Logger::SubProcess::none;
}

//the sub-process name, or the process name when the record has no sub-process
static std::string SourceName(const logging::record_view& rec) {
    const Logger::SubProcess channel = ChannelOf(rec);
    if (channel != Logger::SubProcess::none) {
        return Logger::toString(channel);
    }
    return Logger::toString(ProcessOf(rec));
}

static std::string SeverityName(const logging::record_view& rec) {
    logging::value_ref<logging::trivial::severity_level> sev = logging::extract<logging::trivial::severity_level>("Severity", rec);
    if (!sev) {
        return "";
    }
    const char * const name = logging::trivial::to_string(sev.get());
    return (name) ? std::string(name) : std::string();
}

//"YYYY-MM-DD HH:MM:SS" local time
static std::string TimeStampText(const logging::record_view& rec) {
    logging::value_ref<boost::posix_time::ptime> ts = logging::extract<boost::posix_time::ptime>("TimeStamp", rec);
    if ((!ts) || ts.get().is_special()) {
        return "";
    }
    std::string text = boost::posix_time::to_iso_extended_string(ts.get());
    if (text.size() < 19) {
        return text;
    }
    text[10] = ' ';
    text.resize(19);
    return text;
}

//[ codec    ][ info ]: message
static void FormatConsoleRecord(const logging::record_view& rec, logging::formatting_ostream& strm) {
    strm << "[ " << PadRight(SourceName(rec), SOURCE_COLUMN_WIDTH) << "]"
        << "[ " << PadRight(SeverityName(rec), SEVERITY_COLUMN_WIDTH) << "]: "
        << rec[expr::smessage];
}

//[ codec    ][ 2021-05-01 10:00:00][ info]: message
static void FormatProcessFileRecord(const logging::record_view& rec, logging::formatting_ostream& strm) {
    strm << "[ " << PadRight(SourceName(rec), SOURCE_COLUMN_WIDTH) << "]"
        << "[ " << TimeStampText(rec) << "]"
        << "[ " << SeverityName(rec) << "]: "
        << rec[expr::smessage];
}

//[ unittest][ codec][ 2021-05-01 10:00:00][ error][ Bpv7Bundle.cpp:120]: message
static void FormatErrorFileRecord(const logging::record_view& rec, logging::formatting_ostream& strm) {
    const Logger::Process process = ProcessOf(rec);
    if (process != Logger::Process::none) {
        strm << "[ " << Logger::toString(process) << "]";
    }
    const Logger::SubProcess channel = ChannelOf(rec);
    if (channel != Logger::SubProcess::none) {
        strm << "[ " << Logger::toString(channel) << "]";
    }
    strm << "[ " << TimeStampText(rec) << "]"
        << "[ " << SeverityName(rec) << "]";
    logging::value_ref<const char *> file = logging::extract<const char *>("File", rec);
    logging::value_ref<int> line = logging::extract<int>("Line", rec);
    if (file && line) {
        strm << "[ " << boost::filesystem::path(file.get()).filename().string() << ":" << line.get() << "]";
    }
    strm << ": " << rec[expr::smessage];
}

static boost::shared_ptr<file_sink_t> MakeRotatingFileSink(const std::string& fileNamePattern) {
    boost::shared_ptr<sinks::text_file_backend> backend = boost::make_shared<sinks::text_file_backend>(
        keywords::file_name = fileNamePattern,
        keywords::rotation_size = LOG_FILE_ROTATION_SIZE_BYTES
    );
    backend->auto_flush(true);
    return boost::make_shared<file_sink_t>(backend);
}

const std::string& Logger::GetBp7VersionAsString() {
    static const std::string versionString =
        std::to_string(BP7_VERSION_MAJOR) + "." +
        std::to_string(BP7_VERSION_MINOR) + "." +
        std::to_string(BP7_VERSION_PATCH);
    return versionString;
}

void Logger::initializeWithProcess(Logger::Process process) {
    g_processAttr.set(process);
    ensureInitialized();
    LOG_INFO(Logger::SubProcess::none) << "bp7codec version " << GetBp7VersionAsString();
}

void Logger::ensureInitialized() {
    boost::call_once(s_setupOnceFlag, &Logger::SetupSinks);
}

void Logger::SetupSinks() {
    //avoids a crash in boost::filesystem at program exit when the global locale has been replaced
    boost::filesystem::path::imbue(std::locale("C"));

    logging::core::get()->add_global_attribute("Process", g_processAttr);
    logging::add_common_attributes(); //TimeStamp

#ifdef LOG_TO_PROCESS_FILE
    AddProcessFileSink();
#endif
#ifdef LOG_TO_ERROR_FILE
    AddErrorFileSink();
#endif
#ifdef LOG_TO_CONSOLE
    AddConsoleSink();
#endif
}

void Logger::AddConsoleSink() {
    boost::shared_ptr<sinks::text_ostream_backend> backend = boost::make_shared<sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::cout, boost::null_deleter()));
    backend->auto_flush(true);
    boost::shared_ptr<ostream_sink_t> sink = boost::make_shared<ostream_sink_t>(backend);
    sink->set_filter(expr::has_attr(severity));
    sink->set_formatter(&FormatConsoleRecord);
    logging::core::get()->add_sink(sink);
}

//one file per process, named by the process set before the first message
void Logger::AddProcessFileSink() {
    const Logger::Process process = g_processAttr.get();
    std::string name = toString(process);
    if (name.empty()) {
        name = "bp7";
    }
    boost::shared_ptr<file_sink_t> sink = MakeRotatingFileSink("logs/" + name + "_%5N.log");
    sink->set_filter(expr::attr<Logger::Process>("Process") == process);
    sink->set_formatter(&FormatProcessFileRecord);
    logging::core::get()->add_sink(sink);
}

void Logger::AddErrorFileSink() {
    boost::shared_ptr<file_sink_t> sink = MakeRotatingFileSink("logs/error_%5N.log");
    sink->set_filter(severity >= logging::trivial::severity_level::error);
    sink->set_formatter(&FormatErrorFileRecord);
    logging::core::get()->add_sink(sink);
}

std::string Logger::toString(Logger::Process process) {
    switch (process) {
        case Process::unittest: return "unittest";
        case Process::none: break;
    }
    return "";
}

std::string Logger::toString(Logger::SubProcess subprocess) {
    switch (subprocess) {
        case SubProcess::codec: return "codec";
        case SubProcess::config: return "config";
        case SubProcess::util: return "util";
        case SubProcess::unittest: return "unittest";
        case SubProcess::none: break;
    }
    return "";
}

} //namespace bp7

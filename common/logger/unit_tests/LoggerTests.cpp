/**
 * @file LoggerTests.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <sstream>
#include <iostream>
#include <string>
#include <deque>
#include <boost/regex.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/test/unit_test.hpp>
#include "Logger.h"

#if (defined(LOG_TO_PROCESS_FILE) || defined(LOG_TO_ERROR_FILE))
//the last maxLines lines of a log file, each terminated by '\n'
static std::string ReadLastLines(const boost::filesystem::path & path, std::size_t maxLines) {
    boost::filesystem::ifstream ifs(path);
    std::deque<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(line);
        if (lines.size() > maxLines) {
            lines.pop_front();
        }
    }
    std::string out;
    for (std::deque<std::string>::const_iterator it = lines.cbegin(); it != lines.cend(); ++it) {
        out += *it;
        out += '\n';
    }
    return out;
}
#endif

//swaps std::cout to a string buffer for the lifetime of the object
class ScopedCoutCapture {
public:
    ScopedCoutCapture() : m_savedBuf(std::cout.rdbuf(m_captured.rdbuf())) {}
    ~ScopedCoutCapture() {
        Restore();
    }
    void Restore() {
        if (m_savedBuf) {
            std::cout.rdbuf(m_savedBuf);
            m_savedBuf = NULL;
        }
    }
    std::string Str() const {
        return m_captured.str();
    }
private:
    std::ostringstream m_captured;
    std::streambuf * m_savedBuf;
};

static const std::string date_regex = "\\[ \\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}\\]";

BOOST_AUTO_TEST_CASE(LoggerToStringTestCase)
{
    // Process
    BOOST_REQUIRE_EQUAL(bp7::Logger::toString(bp7::Logger::Process::unittest), "unittest");
    BOOST_REQUIRE_EQUAL(bp7::Logger::toString(bp7::Logger::Process::none), "");

    // Subprocess
    BOOST_REQUIRE_EQUAL(bp7::Logger::toString(bp7::Logger::SubProcess::codec), "codec");
    BOOST_REQUIRE_EQUAL(bp7::Logger::toString(bp7::Logger::SubProcess::config), "config");
    BOOST_REQUIRE_EQUAL(bp7::Logger::toString(bp7::Logger::SubProcess::util), "util");
    BOOST_REQUIRE_EQUAL(bp7::Logger::toString(bp7::Logger::SubProcess::unittest), "unittest");
    BOOST_REQUIRE_EQUAL(bp7::Logger::toString(bp7::Logger::SubProcess::none), "");
}

BOOST_AUTO_TEST_CASE(LoggerVersionStringTestCase)
{
    BOOST_REQUIRE_EQUAL(bp7::Logger::GetBp7VersionAsString(), "1.0.0");
}

#ifdef LOG_TO_CONSOLE
BOOST_AUTO_TEST_CASE(LoggerConsoleFormatTestCase)
{
    ScopedCoutCapture capture;
    _LOG_INTERNAL(bp7::Logger::SubProcess::codec, boost::log::trivial::severity_level::trace) << "decode " << 5 << " blocks";
    _LOG_INTERNAL(bp7::Logger::SubProcess::config, boost::log::trivial::severity_level::debug) << "config loaded";
    _LOG_INTERNAL(bp7::Logger::SubProcess::util, boost::log::trivial::severity_level::info) << "dtn time ok";
    _LOG_INTERNAL(bp7::Logger::SubProcess::codec, boost::log::trivial::severity_level::warning) << "odd block";
    _LOG_INTERNAL(bp7::Logger::SubProcess::codec, boost::log::trivial::severity_level::error) << "bad bundle";
    _LOG_INTERNAL(bp7::Logger::SubProcess::config, boost::log::trivial::severity_level::fatal) << "giving up";
    capture.Restore();

    BOOST_REQUIRE_EQUAL(capture.Str(),
        "[ codec    ][ trace]: decode 5 blocks\n"
        "[ config   ][ debug]: config loaded\n"
        "[ util     ][ info ]: dtn time ok\n"
        "[ codec    ][ warning]: odd block\n"
        "[ codec    ][ error]: bad bundle\n"
        "[ config   ][ fatal]: giving up\n"
    );
}

BOOST_AUTO_TEST_CASE(LoggerNoSubProcessPrintsProcessTestCase)
{
    ScopedCoutCapture capture;
    _LOG_INTERNAL(bp7::Logger::SubProcess::none, boost::log::trivial::severity_level::info) << "from the process";
    capture.Restore();
    BOOST_REQUIRE_EQUAL(capture.Str(), "[ unittest ][ info ]: from the process\n");
}

#if LOG_LEVEL <= LOG_LEVEL_ERROR
BOOST_AUTO_TEST_CASE(LoggerLevelMacroTestCase)
{
    ScopedCoutCapture capture;
    LOG_ERROR(bp7::Logger::SubProcess::unittest) << "via macro";
    capture.Restore();
    BOOST_REQUIRE_EQUAL(capture.Str(), "[ unittest ][ error]: via macro\n");
}
#endif
#endif

#ifdef LOG_TO_PROCESS_FILE
BOOST_AUTO_TEST_CASE(LoggerProcessFileTestCase)
{
    {
        ScopedCoutCapture capture;
        _LOG_INTERNAL(bp7::Logger::SubProcess::codec, boost::log::trivial::severity_level::info) << "Codec file test case";
        _LOG_INTERNAL(bp7::Logger::SubProcess::config, boost::log::trivial::severity_level::error) << "Config file test case";
    }

    BOOST_REQUIRE(boost::filesystem::exists("logs/unittest_00000.log"));
    BOOST_TEST(boost::regex_match(
        ReadLastLines("logs/unittest_00000.log", 2),
        boost::regex("^\\[ codec    \\]" + date_regex + "\\[ info\\]: Codec file test case\n"
            "\\[ config   \\]" + date_regex + "\\[ error\\]: Config file test case\n$"))
    );
}
#endif

#ifdef LOG_TO_ERROR_FILE
BOOST_AUTO_TEST_CASE(LoggerErrorFileTestCase)
{
    {
        ScopedCoutCapture capture;
        _LOG_INTERNAL(bp7::Logger::SubProcess::codec, boost::log::trivial::severity_level::info) << "not an error";
        _LOG_INTERNAL(bp7::Logger::SubProcess::codec, boost::log::trivial::severity_level::error) << "Error file test case";
    }

    BOOST_REQUIRE(boost::filesystem::exists("logs/error_00000.log"));
    BOOST_TEST(boost::regex_match(
        ReadLastLines("logs/error_00000.log", 1),
        boost::regex("^\\[ unittest\\]\\[ codec\\]" + date_regex + "\\[ error\\]\\[ LoggerTests\\.cpp:\\d{2,3}\\]: Error file test case\n$"))
    );
}
#endif

/**
 * @file JsonSerializable.cpp
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include "JsonSerializable.h"
#include "Logger.h"
#include <sstream>
#include <boost/regex.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/filesystem/fstream.hpp>
//boost 1.73 through 1.75 json_parser includes the deprecated bind.hpp with global placeholders
#if (BOOST_VERSION < 107600) && (BOOST_VERSION >= 107300) && !defined(BOOST_BIND_GLOBAL_PLACEHOLDERS)
#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#endif
#include <boost/property_tree/json_parser.hpp>


static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::config;

//a quoted number, true, false, {} or [] that is a value (not followed by a colon)
static const boost::regex regexMatchInQuotes("\\\"(-?\\d*\\.{0,1}\\d+|true|false|\\{\\}|\\[\\])\\\"(?!:)");

//a quoted key followed by a colon, ignoring whitespace
static const boost::regex regexMatchAllJsonKeys("\\\"([^\"]+?)\\\"\\s*:");

JsonSerializable::JsonSerializable() {}
JsonSerializable::~JsonSerializable() {}

void JsonSerializable::GetAllJsonKeys(const std::string & jsonText, std::set<std::string> & jsonKeysNoQuotesSetToAppend) {
    for (boost::sregex_iterator it(jsonText.begin(), jsonText.end(), regexMatchAllJsonKeys), itEnd; it != itEnd; ++it) {
        jsonKeysNoQuotesSetToAppend.emplace((*it)[1].str());
    }
}

void JsonSerializable::GetAllJsonKeysLineByLine(std::istream & stream, std::set<std::string> & jsonKeysNoQuotesSetToAppend) {
    std::string line;
    while (std::getline(stream, line)) {
        GetAllJsonKeys(line, jsonKeysNoQuotesSetToAppend);
    }
}

bool JsonSerializable::HasUnusedJsonVariablesInFilePath(const JsonSerializable & config, const boost::filesystem::path & originalUserJsonFilePath, std::string & returnedErrorMessage) {
    boost::filesystem::ifstream ifs(originalUserJsonFilePath);
    if (!ifs.good()) {
        returnedErrorMessage = "cannot open " + originalUserJsonFilePath.string();
        return false;
    }
    return HasUnusedJsonVariablesInStream(config, ifs, returnedErrorMessage);
}

bool JsonSerializable::HasUnusedJsonVariablesInString(const JsonSerializable & config, const std::string & originalUserJsonString, std::string & returnedErrorMessage) {
    std::istringstream iss(originalUserJsonString);
    return HasUnusedJsonVariablesInStream(config, iss, returnedErrorMessage);
}

bool JsonSerializable::HasUnusedJsonVariablesInStream(const JsonSerializable & config, std::istream & originalUserJsonStream, std::string & returnedErrorMessage) {
    returnedErrorMessage.clear();

    std::set<std::string> validKeys;
    GetAllJsonKeys(config.ToJson(), validKeys);

    std::string line;
    unsigned int lineNumber = 0;
    while (std::getline(originalUserJsonStream, line)) {
        ++lineNumber;
        std::set<std::string> keysOnThisLine;
        GetAllJsonKeys(line, keysOnThisLine);
        for (std::set<std::string>::const_iterator it = keysOnThisLine.cbegin(); it != keysOnThisLine.cend(); ++it) {
            if (validKeys.count(*it) == 0) {
                returnedErrorMessage = "line " + boost::lexical_cast<std::string>(lineNumber) + ": unused JSON key: " + *it;
                return true;
            }
        }
    }
    return false;
}

bool JsonSerializable::LoadTextFileIntoString(const boost::filesystem::path & filePath, std::string & fileContentsAsString) {
    boost::filesystem::ifstream ifs(filePath, std::ifstream::in | std::ifstream::binary);
    if (!ifs.good()) {
        return false;
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    fileContentsAsString = oss.str();
    return true;
}

std::string JsonSerializable::PtToJsonString(const boost::property_tree::ptree & pt, bool pretty) {
    std::ostringstream oss;
    boost::property_tree::write_json(oss, pt, pretty);
    return boost::regex_replace(oss.str(), regexMatchInQuotes, "$1");
}

std::string JsonSerializable::ToJson(bool pretty) const {
    return PtToJsonString(GetNewPropertyTree(), pretty);
}

bool JsonSerializable::ToJsonFile(const boost::filesystem::path & filePath, bool pretty) const {
    boost::filesystem::ofstream out(filePath);
    if (!out.good()) {
        LOG_ERROR(subprocess) << "cannot open " << filePath << " for writing";
        return false;
    }
    out << ToJson(pretty);
    return out.good();
}

bool JsonSerializable::GetPropertyTreeFromJsonStream(std::istream & jsonStream, boost::property_tree::ptree & pt) {
    try {
        boost::property_tree::read_json(jsonStream, pt);
    }
    catch (const boost::property_tree::json_parser::json_parser_error & e) {
        LOG_ERROR(subprocess) << "error parsing JSON: " << e.what();
        return false;
    }
    return true;
}

bool JsonSerializable::GetPropertyTreeFromJsonString(const std::string & jsonStr, boost::property_tree::ptree & pt) {
    std::istringstream iss(jsonStr);
    return GetPropertyTreeFromJsonStream(iss, pt);
}

bool JsonSerializable::GetPropertyTreeFromJsonFilePath(const boost::filesystem::path & jsonFilePath, boost::property_tree::ptree & pt) {
    boost::filesystem::ifstream ifs(jsonFilePath);
    if (!ifs.good()) {
        LOG_ERROR(subprocess) << "cannot open JSON file " << jsonFilePath;
        return false;
    }
    return GetPropertyTreeFromJsonStream(ifs, pt);
}

bool JsonSerializable::SetValuesFromJson(const std::string & jsonString) {
    boost::property_tree::ptree pt;
    if (!GetPropertyTreeFromJsonString(jsonString, pt)) {
        return false; //logged
    }
    return SetValuesFromPropertyTree(pt);
}

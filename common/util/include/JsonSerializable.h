/**
 * @file JsonSerializable.h
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 *
 * @section DESCRIPTION
 *
 * This JsonSerializable virtual base class lets a configuration class be
 * read from and written to JSON through a boost::property_tree::ptree.
 * Numbers and booleans written by property_tree come out as JSON strings,
 * so ToJson() strips those quotes back off.
 */

#ifndef JSON_SERIALIZABLE_H
#define JSON_SERIALIZABLE_H 1

#include <string>
#include <set>
#include <istream>
#include <boost/property_tree/ptree.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/version.hpp>
#include "bp7_util_export.h"

//boost below 1.59 parses json with spirit classic, which is only thread safe with BOOST_SPIRIT_THREADSAFE
#if BOOST_VERSION < 105900 && !defined(BOOST_SPIRIT_THREADSAFE)
#error "Boost version is below 1.59.0 and BOOST_SPIRIT_THREADSAFE is not defined"
#endif


class BP7_UTIL_EXPORT JsonSerializable {
public:
    virtual ~JsonSerializable();

    static bool LoadTextFileIntoString(const boost::filesystem::path & filePath, std::string & fileContentsAsString);
    static void GetAllJsonKeys(const std::string & jsonText, std::set<std::string> & jsonKeysNoQuotesSetToAppend);
    static void GetAllJsonKeysLineByLine(std::istream & stream, std::set<std::string> & jsonKeysNoQuotesSetToAppend);

    //return true if the user's json has a key that config.ToJson() does not produce
    static bool HasUnusedJsonVariablesInFilePath(const JsonSerializable & config, const boost::filesystem::path & originalUserJsonFilePath, std::string & returnedErrorMessage);
    static bool HasUnusedJsonVariablesInString(const JsonSerializable & config, const std::string & originalUserJsonString, std::string & returnedErrorMessage);
    static bool HasUnusedJsonVariablesInStream(const JsonSerializable & config, std::istream & originalUserJsonStream, std::string & returnedErrorMessage);

    static std::string PtToJsonString(const boost::property_tree::ptree & pt, bool pretty = true);
    std::string ToJson(bool pretty = true) const;
    bool ToJsonFile(const boost::filesystem::path & filePath, bool pretty = true) const;

    static bool GetPropertyTreeFromJsonStream(std::istream & jsonStream, boost::property_tree::ptree & pt);
    static bool GetPropertyTreeFromJsonString(const std::string & jsonStr, boost::property_tree::ptree & pt);
    static bool GetPropertyTreeFromJsonFilePath(const boost::filesystem::path & jsonFilePath, boost::property_tree::ptree & pt);

    virtual boost::property_tree::ptree GetNewPropertyTree() const = 0;
    virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) = 0;
    bool SetValuesFromJson(const std::string & jsonString);

protected:
    JsonSerializable();
};

#endif // JSON_SERIALIZABLE_H

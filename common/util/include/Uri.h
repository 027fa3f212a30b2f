/**
 * @file Uri.h
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
 * This Uri static class converts between the text form of bundle protocol
 * endpoint IDs and their parts.  Two URI schemes are supported:
 *   "ipn:<nodeNumber>.<serviceNumber>" (decimal, no sign, no leading zeros)
 *   "dtn:none" and "dtn://<nodeName>[/<demux>]" (printable US-ASCII only)
 */

#ifndef URI_H
#define URI_H 1
#include <string>
#include <cstdint>
#include "bp7_util_export.h"

class BP7_UTIL_EXPORT Uri {
private:
    Uri();
    ~Uri();
public:
    static std::string GetIpnUriString(const uint64_t eidNodeNumber, const uint64_t eidServiceNumber);
    static bool ParseIpnUriString(const std::string & uri, uint64_t & eidNodeNumber, uint64_t & eidServiceNumber);
    //parse just the scheme specific part
    static bool ParseIpnSspString(const char * data, std::size_t length, uint64_t & eidNodeNumber, uint64_t & eidServiceNumber);

    static const std::string & GetDtnNoneUriString();
    //ssp must already be valid (see IsValidDtnSsp)
    static std::string GetDtnUriString(const std::string & dtnSsp);
    //on success, isDtnNone is set and dtnSsp holds "//node/demux" (cleared if isDtnNone)
    static bool ParseDtnUriString(const std::string & uri, std::string & dtnSsp, bool & isDtnNone);
    //"//" followed by a non-empty node name, then an optional "/" and demux, all VCHAR
    static bool IsValidDtnSsp(const char * data, std::size_t length);
    static bool IsValidDtnSsp(const std::string & dtnSsp);

    //true if the text is an unsigned decimal with no sign and no leading zeros that fits in 64 bits
    static bool ParseCanonicalUint64(const char * data, std::size_t length, uint64_t & value);
};

#endif //URI_H

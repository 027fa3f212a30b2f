/**
 * @file Uri.cpp
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

#include "Uri.h"
#include <cstring>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

static const std::string DTN_NONE_URI_STRING("dtn:none");
static const char IPN_SCHEME_PREFIX[] = "ipn:";
static const char DTN_SCHEME_PREFIX[] = "dtn:";
static constexpr std::size_t SCHEME_PREFIX_LENGTH = 4;

std::string Uri::GetIpnUriString(const uint64_t eidNodeNumber, const uint64_t eidServiceNumber) {
    static const boost::format fmtTemplate("ipn:%d.%d");
    boost::format fmt(fmtTemplate);
    fmt % eidNodeNumber % eidServiceNumber;
    return fmt.str();
}

bool Uri::ParseIpnUriString(const std::string & uri, uint64_t & eidNodeNumber, uint64_t & eidServiceNumber) {
    if ((uri.length() < 7) || (uri.compare(0, SCHEME_PREFIX_LENGTH, IPN_SCHEME_PREFIX) != 0)) { //shortest is ipn:1.1
        return false;
    }
    return ParseIpnSspString(uri.data() + SCHEME_PREFIX_LENGTH, uri.length() - SCHEME_PREFIX_LENGTH, eidNodeNumber, eidServiceNumber); //no string copies
}

bool Uri::ParseIpnSspString(const char * data, std::size_t length, uint64_t & eidNodeNumber, uint64_t & eidServiceNumber) {
    const char * const dotPosition = static_cast<const char *>(memchr(data, '.', length));
    if (dotPosition == NULL) {
        return false; //dot not found
    }
    const std::size_t sizeStr1 = static_cast<std::size_t>(dotPosition - data);
    const std::size_t sizeStr2 = length - sizeStr1 - 1;
    uint64_t nodeNumber;
    uint64_t serviceNumber;
    //a second dot fails ParseCanonicalUint64 of the service number
    if (!ParseCanonicalUint64(data, sizeStr1, nodeNumber)) {
        return false;
    }
    if (!ParseCanonicalUint64(dotPosition + 1, sizeStr2, serviceNumber)) {
        return false;
    }
    eidNodeNumber = nodeNumber;
    eidServiceNumber = serviceNumber;
    return true;
}

bool Uri::ParseCanonicalUint64(const char * data, std::size_t length, uint64_t & value) {
    if ((length == 0) || (length > 20)) { //UINT64_MAX has 20 digits
        return false;
    }
    //boost::lexical_cast accepts a sign (and wraps negatives), so screen the characters first
    for (std::size_t i = 0; i < length; ++i) {
        if ((data[i] < '0') || (data[i] > '9')) {
            return false;
        }
    }
    if ((length > 1) && (data[0] == '0')) {
        return false; //leading zero would not survive a round trip
    }
    try {
        value = boost::lexical_cast<uint64_t>(data, length);
    }
    catch (const boost::bad_lexical_cast &) {
        return false; //overflow
    }
    return true;
}

const std::string & Uri::GetDtnNoneUriString() {
    return DTN_NONE_URI_STRING;
}

std::string Uri::GetDtnUriString(const std::string & dtnSsp) {
    return std::string(DTN_SCHEME_PREFIX) + dtnSsp;
}

bool Uri::ParseDtnUriString(const std::string & uri, std::string & dtnSsp, bool & isDtnNone) {
    if (uri == DTN_NONE_URI_STRING) {
        isDtnNone = true;
        dtnSsp.clear();
        return true;
    }
    if ((uri.length() <= SCHEME_PREFIX_LENGTH) || (uri.compare(0, SCHEME_PREFIX_LENGTH, DTN_SCHEME_PREFIX) != 0)) {
        return false;
    }
    const char * const sspStart = uri.data() + SCHEME_PREFIX_LENGTH;
    const std::size_t sspLength = uri.length() - SCHEME_PREFIX_LENGTH;
    if (!IsValidDtnSsp(sspStart, sspLength)) {
        return false;
    }
    isDtnNone = false;
    dtnSsp.assign(sspStart, sspLength);
    return true;
}

//dtn-hier-part = "//" node-name name-delim demux
//node-name = 1*VCHAR
//name-delim = "/"
//demux = *VCHAR
bool Uri::IsValidDtnSsp(const char * data, std::size_t length) {
    if ((length < 3) || (data[0] != '/') || (data[1] != '/') || (data[2] == '/')) {
        return false; //missing "//" or empty node name
    }
    for (std::size_t i = 2; i < length; ++i) {
        const unsigned char c = static_cast<unsigned char>(data[i]);
        if ((c < 0x21) || (c > 0x7e)) { //VCHAR
            return false;
        }
    }
    return true;
}

bool Uri::IsValidDtnSsp(const std::string & dtnSsp) {
    return IsValidDtnSsp(dtnSsp.data(), dtnSsp.length());
}

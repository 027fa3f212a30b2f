/**
 * @file Bpv7Eid.cpp
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

#include "codec/Bpv7Eid.h"
#include "CborUint.h"
#include "Uri.h"
#include <cstring>
#include <boost/lexical_cast.hpp>

std::ostream& operator<<(std::ostream& os, const BPV7_EID_SCHEME scheme) {
    switch (scheme) {
        case BPV7_EID_SCHEME::DTN: os << "dtn"; break;
        case BPV7_EID_SCHEME::IPN: os << "ipn"; break;
        default: os << "unknown"; break;
    }
    return os;
}

bpv7_eid_t::bpv7_eid_t() : m_ipnNodeNumber(0), m_ipnServiceNumber(0), m_scheme(BPV7_EID_SCHEME::UNKNOWN) { } //a default constructor: X()
bpv7_eid_t::~bpv7_eid_t() { } //a destructor: ~X()
bpv7_eid_t::bpv7_eid_t(const bpv7_eid_t& o) :
    m_dtnSsp(o.m_dtnSsp),
    m_ipnNodeNumber(o.m_ipnNodeNumber),
    m_ipnServiceNumber(o.m_ipnServiceNumber),
    m_scheme(o.m_scheme) { } //a copy constructor: X(const X&)
bpv7_eid_t::bpv7_eid_t(bpv7_eid_t&& o) :
    m_dtnSsp(std::move(o.m_dtnSsp)),
    m_ipnNodeNumber(o.m_ipnNodeNumber),
    m_ipnServiceNumber(o.m_ipnServiceNumber),
    m_scheme(o.m_scheme) { } //a move constructor: X(X&&)
bpv7_eid_t& bpv7_eid_t::operator=(const bpv7_eid_t& o) { //a copy assignment: operator=(const X&)
    m_dtnSsp = o.m_dtnSsp;
    m_ipnNodeNumber = o.m_ipnNodeNumber;
    m_ipnServiceNumber = o.m_ipnServiceNumber;
    m_scheme = o.m_scheme;
    return *this;
}
bpv7_eid_t& bpv7_eid_t::operator=(bpv7_eid_t && o) { //a move assignment: operator=(X&&)
    m_dtnSsp = std::move(o.m_dtnSsp);
    m_ipnNodeNumber = o.m_ipnNodeNumber;
    m_ipnServiceNumber = o.m_ipnServiceNumber;
    m_scheme = o.m_scheme;
    return *this;
}
bool bpv7_eid_t::operator==(const bpv7_eid_t & o) const {
    return (m_scheme == o.m_scheme)
        && (m_ipnNodeNumber == o.m_ipnNodeNumber)
        && (m_ipnServiceNumber == o.m_ipnServiceNumber)
        && (m_dtnSsp == o.m_dtnSsp);
}
bool bpv7_eid_t::operator!=(const bpv7_eid_t & o) const {
    return !(*this == o);
}
bool bpv7_eid_t::operator<(const bpv7_eid_t & o) const {
    if (m_scheme != o.m_scheme) {
        return (m_scheme < o.m_scheme);
    }
    if (m_ipnNodeNumber != o.m_ipnNodeNumber) {
        return (m_ipnNodeNumber < o.m_ipnNodeNumber);
    }
    if (m_ipnServiceNumber != o.m_ipnServiceNumber) {
        return (m_ipnServiceNumber < o.m_ipnServiceNumber);
    }
    return (m_dtnSsp < o.m_dtnSsp);
}

bpv7_eid_t bpv7_eid_t::DtnNone() {
    bpv7_eid_t eid;
    eid.m_scheme = BPV7_EID_SCHEME::DTN;
    return eid;
}

bool bpv7_eid_t::CreateDtn(const std::string & dtnSsp, bpv7_eid_t & eid) {
    if (!Uri::IsValidDtnSsp(dtnSsp)) {
        return false;
    }
    eid.m_dtnSsp = dtnSsp;
    eid.m_ipnNodeNumber = 0;
    eid.m_ipnServiceNumber = 0;
    eid.m_scheme = BPV7_EID_SCHEME::DTN;
    return true;
}

bool bpv7_eid_t::CreateIpn(const uint64_t nodeNumber, const uint64_t serviceNumber, bpv7_eid_t & eid) {
    if (nodeNumber == 0) {
        return false;
    }
    eid.m_dtnSsp.clear();
    eid.m_ipnNodeNumber = nodeNumber;
    eid.m_ipnServiceNumber = serviceNumber;
    eid.m_scheme = BPV7_EID_SCHEME::IPN;
    return true;
}

bool bpv7_eid_t::ParseUri(const std::string & uri, bpv7_eid_t & eid, bpv7_codec_error_t & error) {
    if (uri.compare(0, 4, "dtn:") == 0) {
        std::string dtnSsp;
        bool isDtnNone;
        if (!Uri::ParseDtnUriString(uri, dtnSsp, isDtnNone)) {
            error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "invalid dtn uri: " + uri);
            return false;
        }
        if (isDtnNone) {
            eid = DtnNone();
            return true;
        }
        return CreateDtn(dtnSsp, eid); //already validated
    }
    else if (uri.compare(0, 4, "ipn:") == 0) {
        uint64_t nodeNumber;
        uint64_t serviceNumber;
        if (!Uri::ParseIpnUriString(uri, nodeNumber, serviceNumber)) {
            error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "invalid ipn uri: " + uri);
            return false;
        }
        if (!CreateIpn(nodeNumber, serviceNumber, eid)) {
            error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "ipn node number 0 is not allowed: " + uri);
            return false;
        }
        return true;
    }
    error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "uri is neither dtn nor ipn: " + uri);
    return false;
}

std::string bpv7_eid_t::ToUri() const {
    if (m_scheme == BPV7_EID_SCHEME::IPN) {
        return Uri::GetIpnUriString(m_ipnNodeNumber, m_ipnServiceNumber);
    }
    else if (m_scheme == BPV7_EID_SCHEME::DTN) {
        return (m_dtnSsp.empty()) ? Uri::GetDtnNoneUriString() : Uri::GetDtnUriString(m_dtnSsp);
    }
    return std::string();
}

BPV7_EID_SCHEME bpv7_eid_t::GetScheme() const {
    return m_scheme;
}
bool bpv7_eid_t::IsUnknown() const {
    return (m_scheme == BPV7_EID_SCHEME::UNKNOWN);
}
bool bpv7_eid_t::IsDtnNone() const {
    return (m_scheme == BPV7_EID_SCHEME::DTN) && m_dtnSsp.empty();
}
const std::string & bpv7_eid_t::GetDtnSsp() const {
    return m_dtnSsp;
}
uint64_t bpv7_eid_t::GetIpnNodeNumber() const {
    return m_ipnNodeNumber;
}
uint64_t bpv7_eid_t::GetIpnServiceNumber() const {
    return m_ipnServiceNumber;
}

//4.2.5.1 Endpoint ID
//Each BP endpoint ID (EID) SHALL be represented as a CBOR array
//comprising two items.
//The first item of the array SHALL be the code number identifying the
//endpoint ID's URI scheme, as defined in the registry of URI scheme
//code numbers for Bundle Protocol.  Each URI scheme code number SHALL
//be represented as a CBOR unsigned integer.
//The second item of the array SHALL be the applicable CBOR encoding of
//the scheme-specific part of the EID, defined as noted in the
//references(s) for the URI scheme code number registry entry for the
//EID's URI scheme.
uint64_t bpv7_eid_t::SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const {
    uint8_t * const serializationBase = serialization;
    if ((m_scheme == BPV7_EID_SCHEME::UNKNOWN) || (bufferSize < 3)) { //initialCborByte + uriCodeByte + [sspCodeZeroForDtnScheme | atLeastOneByteForOtherSsp]
        return 0;
    }
    *serialization++ = (4U << 5) | 2; //major type 4, additional information 2
    *serialization++ = static_cast<uint8_t>(m_scheme); //uri-code (cbor uint's < 24 are the value itself)
    bufferSize -= 2;
    if (m_scheme == BPV7_EID_SCHEME::IPN) {
        const uint64_t sizeSerialized = CborTwoUint64ArraySerialize(serialization, m_ipnNodeNumber, m_ipnServiceNumber, bufferSize);
        if (sizeSerialized == 0) {
            return 0;
        }
        serialization += sizeSerialized;
    }
    else if (m_dtnSsp.empty()) {
        //if SSP is "none", the SSP SHALL be represented as a CBOR unsigned integer with the value zero.
        *serialization++ = 0;
    }
    else {
        const unsigned int headSize = CborEncodeHead(serialization, CBOR_MAJOR_TYPE::TEXT_STRING, m_dtnSsp.size(), bufferSize);
        if ((headSize == 0) || ((headSize + m_dtnSsp.size()) > bufferSize)) {
            return 0;
        }
        serialization += headSize;
        memcpy(serialization, m_dtnSsp.data(), m_dtnSsp.size());
        serialization += m_dtnSsp.size();
    }
    return serialization - serializationBase;
}

uint64_t bpv7_eid_t::GetSerializationSizeBpv7() const {
    if (m_scheme == BPV7_EID_SCHEME::IPN) {
        return 2 + CborTwoUint64ArraySerializationSize(m_ipnNodeNumber, m_ipnServiceNumber); //2 => outer array byte + uri-code byte
    }
    else if (m_scheme == BPV7_EID_SCHEME::DTN) {
        if (m_dtnSsp.empty()) {
            return 3; //dtn:none ... initialCborByte + uriCodeByte + sspCodeZeroForDtnScheme
        }
        return 2 + CborGetEncodingSizeU64(m_dtnSsp.size()) + m_dtnSsp.size();
    }
    return 0;
}

// eid-structure = [
//   uri-code: uint,
//   SSP: any
// ]
// $eid /= [
//   uri-code: 1,
//   SSP: (tstr / 0)
// ]
// $eid /= [
//   uri-code: 2,
//   SSP: [
//     nodenum: uint,
//     servicenum: uint
//   ]
// ]
bool bpv7_eid_t::DeserializeBpv7(const uint8_t * serialization, uint64_t & numBytesTakenToDecode, uint64_t bufferSize, bpv7_codec_error_t & error) {
    const uint8_t * const serializationBase = serialization;
    uint8_t cborSizeDecoded;
    bool isIndefiniteLength;

    const uint64_t arrayLength = CborDecodeArrayHeader(serialization, &cborSizeDecoded, bufferSize, isIndefiniteLength);
    if (cborSizeDecoded == 0) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "endpoint id is not an array");
        return false;
    }
    if ((!isIndefiniteLength) && (arrayLength != 2)) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "endpoint id array length " + boost::lexical_cast<std::string>(arrayLength));
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;

    const uint64_t uriCode = CborDecodeU64(serialization, &cborSizeDecoded, bufferSize);
    if (cborSizeDecoded == 0) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "endpoint id uri-code is not an unsigned integer");
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;

    bpv7_eid_t decoded;
    if (uriCode == static_cast<uint64_t>(BPV7_EID_SCHEME::DTN)) {
        //4.2.5.1.1.  The dtn URI Scheme
        //Encoding considerations:  For transmission as a BP endpoint ID, the
        //scheme-specific part of a URI of the dtn scheme SHALL be
        //represented as a CBOR text string unless the EID's SSP is "none",
        //in which case the SSP SHALL be represented as a CBOR unsigned
        //integer with the value zero.
        if (bufferSize == 0) {
            error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "dtn endpoint id truncated");
            return false;
        }
        const CBOR_MAJOR_TYPE sspMajorType = CborGetMajorType(*serialization);
        if (sspMajorType == CBOR_MAJOR_TYPE::UNSIGNED_INTEGER) {
            const uint64_t sspValue = CborDecodeU64(serialization, &cborSizeDecoded, bufferSize);
            if ((cborSizeDecoded == 0) || (sspValue != 0)) {
                error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "dtn endpoint id integer ssp must be 0");
                return false;
            }
            serialization += cborSizeDecoded;
            bufferSize -= cborSizeDecoded;
            decoded = DtnNone();
        }
        else if (sspMajorType == CBOR_MAJOR_TYPE::TEXT_STRING) {
            const uint64_t sspLength = CborDecodeHead(serialization, CBOR_MAJOR_TYPE::TEXT_STRING, &cborSizeDecoded, bufferSize);
            if (cborSizeDecoded == 0) {
                error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "dtn endpoint id text string header");
                return false;
            }
            serialization += cborSizeDecoded;
            bufferSize -= cborSizeDecoded;
            if (sspLength > bufferSize) {
                error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "dtn endpoint id text string truncated");
                return false;
            }
            const std::string dtnSsp(reinterpret_cast<const char *>(serialization), static_cast<std::size_t>(sspLength));
            if (!CreateDtn(dtnSsp, decoded)) {
                error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "invalid dtn scheme specific part");
                return false;
            }
            serialization += sspLength;
            bufferSize -= sspLength;
        }
        else {
            error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "dtn endpoint id ssp is neither 0 nor a text string");
            return false;
        }
    }
    else if (uriCode == static_cast<uint64_t>(BPV7_EID_SCHEME::IPN)) {
        uint64_t nodeNumber;
        uint64_t serviceNumber;
        if (!CborTwoUint64ArrayDeserialize(serialization, &cborSizeDecoded, bufferSize, nodeNumber, serviceNumber)) {
            error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "ipn endpoint id ssp is not an array of two unsigned integers");
            return false;
        }
        if (!CreateIpn(nodeNumber, serviceNumber, decoded)) {
            error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "ipn endpoint id node number 0");
            return false;
        }
        serialization += cborSizeDecoded;
        bufferSize -= cborSizeDecoded;
    }
    else {
        error.Set(BPV7_CODEC_ERROR::UNSUPPORTED_SCHEME, "endpoint id uri-code " + boost::lexical_cast<std::string>(uriCode));
        return false;
    }

    if (isIndefiniteLength) {
        if ((bufferSize == 0) || (*serialization != CBOR_BREAK_STOP_CODE)) {
            error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "indefinite length endpoint id does not end after two items");
            return false;
        }
        ++serialization;
    }

    *this = std::move(decoded);
    numBytesTakenToDecode = serialization - serializationBase;
    return true;
}

std::ostream& operator<<(std::ostream& os, const bpv7_eid_t& o) {
    if (o.IsUnknown()) {
        os << "<unknown eid>";
    }
    else {
        os << o.ToUri();
    }
    return os;
}

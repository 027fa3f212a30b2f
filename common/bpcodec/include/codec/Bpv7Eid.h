/**
 * @file Bpv7Eid.h
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
 * A Bundle Protocol version 7 endpoint ID of either the dtn or the ipn URI scheme.
 * The value can only be built through the factory functions, which validate it,
 * so any bpv7_eid_t other than a default constructed one is encodable.
 */

#ifndef BPV7_EID_H
#define BPV7_EID_H 1

#include <cstdint>
#include <string>
#include <ostream>
#include "codec/Bpv7CodecError.h"
#include "bp7_codec_export.h"
#ifndef CLASS_VISIBILITY_BP7_CODEC
#  ifdef _WIN32
#    define CLASS_VISIBILITY_BP7_CODEC
#  else
#    define CLASS_VISIBILITY_BP7_CODEC BP7_CODEC_EXPORT
#  endif
#endif

//the uri-code of the CBOR encoding
enum class BPV7_EID_SCHEME : uint8_t {
    UNKNOWN = 0,
    DTN = 1,
    IPN = 2
};
BP7_CODEC_EXPORT std::ostream& operator<<(std::ostream& os, const BPV7_EID_SCHEME scheme);

class CLASS_VISIBILITY_BP7_CODEC bpv7_eid_t {
public:
    BP7_CODEC_EXPORT bpv7_eid_t(); //a default constructor: X() (scheme UNKNOWN)
    BP7_CODEC_EXPORT ~bpv7_eid_t(); //a destructor: ~X()
    BP7_CODEC_EXPORT bpv7_eid_t(const bpv7_eid_t& o); //a copy constructor: X(const X&)
    BP7_CODEC_EXPORT bpv7_eid_t(bpv7_eid_t&& o); //a move constructor: X(X&&)
    BP7_CODEC_EXPORT bpv7_eid_t& operator=(const bpv7_eid_t& o); //a copy assignment: operator=(const X&)
    BP7_CODEC_EXPORT bpv7_eid_t& operator=(bpv7_eid_t&& o); //a move assignment: operator=(X&&)
    BP7_CODEC_EXPORT bool operator==(const bpv7_eid_t & o) const; //operator ==
    BP7_CODEC_EXPORT bool operator!=(const bpv7_eid_t & o) const; //operator !=
    BP7_CODEC_EXPORT bool operator<(const bpv7_eid_t & o) const; //operator < so it can be used as a map key

    BP7_CODEC_EXPORT static bpv7_eid_t DtnNone();
    //dtnSsp is the scheme specific part including the leading "//"
    BP7_CODEC_EXPORT static bool CreateDtn(const std::string & dtnSsp, bpv7_eid_t & eid);
    //fails if nodeNumber is 0
    BP7_CODEC_EXPORT static bool CreateIpn(const uint64_t nodeNumber, const uint64_t serviceNumber, bpv7_eid_t & eid);
    //accepts "dtn:none", "dtn://node[/demux]" and "ipn:N.S", eid is untouched on failure
    BP7_CODEC_EXPORT static bool ParseUri(const std::string & uri, bpv7_eid_t & eid, bpv7_codec_error_t & error);
    //empty string if UNKNOWN
    BP7_CODEC_EXPORT std::string ToUri() const;

    BP7_CODEC_EXPORT BPV7_EID_SCHEME GetScheme() const;
    BP7_CODEC_EXPORT bool IsUnknown() const;
    BP7_CODEC_EXPORT bool IsDtnNone() const;
    BP7_CODEC_EXPORT const std::string & GetDtnSsp() const;
    BP7_CODEC_EXPORT uint64_t GetIpnNodeNumber() const;
    BP7_CODEC_EXPORT uint64_t GetIpnServiceNumber() const;

    //return 0 if the buffer is too small or the scheme is UNKNOWN
    BP7_CODEC_EXPORT uint64_t SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const;
    BP7_CODEC_EXPORT uint64_t GetSerializationSizeBpv7() const;
    //this is untouched on failure
    BP7_CODEC_EXPORT bool DeserializeBpv7(const uint8_t * serialization, uint64_t & numBytesTakenToDecode, uint64_t bufferSize, bpv7_codec_error_t & error);

    BP7_CODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const bpv7_eid_t& o);

private:
    std::string m_dtnSsp; //empty for dtn:none
    uint64_t m_ipnNodeNumber;
    uint64_t m_ipnServiceNumber;
    BPV7_EID_SCHEME m_scheme;
};

#endif //BPV7_EID_H

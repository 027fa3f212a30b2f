/**
 * @file bpv7.h
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
 * The bpv7.h file defines the flags, type codes and blocks of Bundle Protocol Version 7.
 * Only the primary block and the payload block are supported; a block of
 * any other type, a CRC, or a fragment is rejected with a BPV7_CODEC_ERROR.
 */

#ifndef BPV7_H
#define BPV7_H 1
#include <cstdint>
#include <cstddef>
#include <vector>
#include <ostream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "codec/Bpv7Eid.h"
#include "codec/Bpv7CodecError.h"
#include "TimestampUtil.h"
#include "EnumAsFlagsMacro.h"
#include "bp7_codec_export.h"
#ifndef CLASS_VISIBILITY_BP7_CODEC
#  ifdef _WIN32
#    define CLASS_VISIBILITY_BP7_CODEC
#  else
#    define CLASS_VISIBILITY_BP7_CODEC BP7_CODEC_EXPORT
#  endif
#endif

enum class BPV7_CRC_TYPE : uint8_t {
    NONE       = 0,
    CRC16_X25  = 1,
    CRC32C     = 2
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_CRC_TYPE);

enum class BPV7_BUNDLEFLAG : uint64_t {
    NO_FLAGS_SET =                        0,
    ISFRAGMENT =                          1 << 0, //(0x0001)
    ADMINRECORD =                         1 << 1, //(0x0002)
    NOFRAGMENT =                          1 << 2, //(0x0004)
    USER_APP_ACK_REQUESTED =              1 << 5, //(0x0020)
    STATUSTIME_REQUESTED =                1 << 6, //(0x0040)
    RECEPTION_STATUS_REPORTS_REQUESTED =  1 << 14,//(0x4000)
    FORWARDING_STATUS_REPORTS_REQUESTED = 1 << 16,//(0x10000)
    DELIVERY_STATUS_REPORTS_REQUESTED =   1 << 17,//(0x20000)
    DELETION_STATUS_REPORTS_REQUESTED =   1 << 18 //(0x40000)
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(BPV7_BUNDLEFLAG);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_BUNDLEFLAG);

enum class BPV7_BLOCKFLAG : uint64_t {
    NO_FLAGS_SET =                                       0,
    MUST_BE_REPLICATED =                                 1 << 0, //(0x01)
    STATUS_REPORT_REQUESTED_IF_BLOCK_CANT_BE_PROCESSED = 1 << 1, //(0x02)
    DELETE_BUNDLE_IF_BLOCK_CANT_BE_PROCESSED =           1 << 2, //(0x04)
    REMOVE_BLOCK_IF_IT_CANT_BE_PROCESSED =               1 << 4  //(0x10)
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(BPV7_BLOCKFLAG);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_BLOCKFLAG);

// https://www.iana.org/assignments/bundle/bundle.xhtml#block-types
enum class BPV7_BLOCK_TYPE_CODE : uint8_t {
    PRIMARY_IMPLICIT_ZERO       = 0,
    PAYLOAD                     = 1,
    PREVIOUS_NODE               = 6,
    BUNDLE_AGE                  = 7,
    HOP_COUNT                   = 10
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_BLOCK_TYPE_CODE);


struct CLASS_VISIBILITY_BP7_CODEC Bpv7PrimaryBlock {
    static constexpr uint64_t BPV7_VERSION = 7;

    BPV7_BUNDLEFLAG m_bundleProcessingControlFlags;
    bpv7_eid_t m_destinationEid;
    bpv7_eid_t m_sourceNodeId; //A "node ID" is an EID that identifies the administrative endpoint of a node (uses eid data type).
    bpv7_eid_t m_reportToEid;
    TimestampUtil::bpv7_creation_timestamp_t m_creationTimestamp;
    uint64_t m_lifetimeMilliseconds;
    uint64_t m_fragmentOffset; //only encoded if ISFRAGMENT
    uint64_t m_totalApplicationDataUnitLength; //only encoded if ISFRAGMENT
    BPV7_CRC_TYPE m_crcType;

    BP7_CODEC_EXPORT Bpv7PrimaryBlock(); //a default constructor: X()
    BP7_CODEC_EXPORT ~Bpv7PrimaryBlock(); //a destructor: ~X()
    BP7_CODEC_EXPORT Bpv7PrimaryBlock(const Bpv7PrimaryBlock& o); //a copy constructor: X(const X&)
    BP7_CODEC_EXPORT Bpv7PrimaryBlock(Bpv7PrimaryBlock&& o); //a move constructor: X(X&&)
    BP7_CODEC_EXPORT Bpv7PrimaryBlock& operator=(const Bpv7PrimaryBlock& o); //a copy assignment: operator=(const X&)
    BP7_CODEC_EXPORT Bpv7PrimaryBlock& operator=(Bpv7PrimaryBlock&& o); //a move assignment: operator=(X&&)
    BP7_CODEC_EXPORT bool operator==(const Bpv7PrimaryBlock & o) const; //operator ==
    BP7_CODEC_EXPORT bool operator!=(const Bpv7PrimaryBlock & o) const; //operator !=
    BP7_CODEC_EXPORT void SetZero();
    //return 0 if the buffer is too small or an eid is unset
    BP7_CODEC_EXPORT uint64_t SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const;
    BP7_CODEC_EXPORT uint64_t GetSerializationSize() const;
    //this is untouched on failure
    BP7_CODEC_EXPORT bool DeserializeBpv7(const uint8_t * serialization, uint64_t & numBytesTakenToDecode, uint64_t bufferSize, bpv7_codec_error_t & error);
    //true if this block is one the codec will put in a bundle (no crc, not a fragment, all eids set)
    BP7_CODEC_EXPORT bool Validate(bpv7_codec_error_t & error) const;

    BP7_CODEC_EXPORT bool HasBundleFlag(const BPV7_BUNDLEFLAG flag) const;
    BP7_CODEC_EXPORT bool IsFragment() const;
    BP7_CODEC_EXPORT bool IsAdminRecord() const;
    //creation time + lifetime (meaningless if the creation time is unknown)
    //creation time + lifetime, saturating at UINT64_MAX
    BP7_CODEC_EXPORT uint64_t GetExpirationMilliseconds() const;
    //not_a_date_time when the expiration is beyond what a ptime can hold
    BP7_CODEC_EXPORT boost::posix_time::ptime GetExpirationPtime() const;
    BP7_CODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const Bpv7PrimaryBlock& o);
};

struct CLASS_VISIBILITY_BP7_CODEC Bpv7CanonicalBlock {
    std::vector<uint8_t> m_data;
    uint64_t m_blockNumber;
    BPV7_BLOCKFLAG m_blockProcessingControlFlags;
    BPV7_BLOCK_TYPE_CODE m_blockTypeCode;
    BPV7_CRC_TYPE m_crcType;

    BP7_CODEC_EXPORT Bpv7CanonicalBlock(); //a default constructor: X()
    BP7_CODEC_EXPORT ~Bpv7CanonicalBlock(); //a destructor: ~X()
    BP7_CODEC_EXPORT Bpv7CanonicalBlock(const Bpv7CanonicalBlock& o); //a copy constructor: X(const X&)
    BP7_CODEC_EXPORT Bpv7CanonicalBlock(Bpv7CanonicalBlock&& o); //a move constructor: X(X&&)
    BP7_CODEC_EXPORT Bpv7CanonicalBlock& operator=(const Bpv7CanonicalBlock& o); //a copy assignment: operator=(const X&)
    BP7_CODEC_EXPORT Bpv7CanonicalBlock& operator=(Bpv7CanonicalBlock&& o); //a move assignment: operator=(X&&)
    BP7_CODEC_EXPORT bool operator==(const Bpv7CanonicalBlock & o) const; //operator ==
    BP7_CODEC_EXPORT bool operator!=(const Bpv7CanonicalBlock & o) const; //operator !=
    BP7_CODEC_EXPORT void SetZero();
    //return 0 if the buffer is too small
    BP7_CODEC_EXPORT uint64_t SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const;
    BP7_CODEC_EXPORT uint64_t GetSerializationSize() const;
    //this is untouched on failure
    BP7_CODEC_EXPORT bool DeserializeBpv7(const uint8_t * serialization, uint64_t & numBytesTakenToDecode, uint64_t bufferSize, bpv7_codec_error_t & error);
    //true if this is a payload block with no crc and a nonzero block number
    BP7_CODEC_EXPORT bool Validate(bpv7_codec_error_t & error) const;
    BP7_CODEC_EXPORT bool HasBlockFlag(const BPV7_BLOCKFLAG flag) const;
    BP7_CODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const Bpv7CanonicalBlock& o);
};

#endif //BPV7_H

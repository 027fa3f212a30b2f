/**
 * @file TimestampUtil.h
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
 * This TimestampUtil static class converts between "DTN time" (milliseconds since
 * the start of the year 2000 UTC) and boost::posix_time, and defines the
 * Bundle Protocol version 7 creation timestamp.
 */

#ifndef TIMESTAMP_UTIL_H
#define TIMESTAMP_UTIL_H 1

#include <string>
#include <cstdint>
#include <ostream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "bp7_util_export.h"

class BP7_UTIL_EXPORT TimestampUtil {
private:
    TimestampUtil();

public:

    //DTN time zero means the time is unknown (no clock at the source node)
    static constexpr uint64_t DTN_TIME_UNKNOWN = 0;

    //[creation time, sequence number]; encoded as a 2 item cbor array of unsigned integers
    struct bpv7_creation_timestamp_t {
        uint64_t creationTimeMilliseconds;
        uint64_t sequenceNumber;

        //largest encoding: an indefinite array head, two 9 byte integers and a break
        static constexpr unsigned int MAX_BUFFER_SIZE = 20;

        bpv7_creation_timestamp_t() : creationTimeMilliseconds(0), sequenceNumber(0) {}
        bpv7_creation_timestamp_t(uint64_t paramCreationTimeMilliseconds, uint64_t paramSequenceNumber) :
            creationTimeMilliseconds(paramCreationTimeMilliseconds), sequenceNumber(paramSequenceNumber) {}

        BP7_UTIL_EXPORT bool operator==(const bpv7_creation_timestamp_t & o) const;
        BP7_UTIL_EXPORT bool operator!=(const bpv7_creation_timestamp_t & o) const;
        //orders by creation time, then sequence number
        BP7_UTIL_EXPORT bool operator<(const bpv7_creation_timestamp_t & o) const;
        BP7_UTIL_EXPORT friend std::ostream& operator<<(std::ostream& os, const bpv7_creation_timestamp_t& o);

        BP7_UTIL_EXPORT uint64_t SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const;
        BP7_UTIL_EXPORT uint64_t GetSerializationSize() const;
        //leaves the timestamp unmodified on failure
        BP7_UTIL_EXPORT bool DeserializeBpv7(const uint8_t * serialization, uint8_t * numBytesTakenToDecode, uint64_t bufferSize);

        BP7_UTIL_EXPORT void SetZero();
        BP7_UTIL_EXPORT bool IsTimeUnknown() const;
        BP7_UTIL_EXPORT boost::posix_time::ptime GetPtime() const;
        BP7_UTIL_EXPORT bool SetFromPtime(const boost::posix_time::ptime & posixTimeValue);
        BP7_UTIL_EXPORT std::string GetUtcTimestampString(bool forFileName) const;
    };

    static const boost::posix_time::ptime & GetDtnEpoch();

    //return false if posixTimeValue is not a valid time at or after the DTN epoch
    static bool GetMillisecondsSinceDtnEpoch(const boost::posix_time::ptime & posixTimeValue, uint64_t & millisecondsSinceDtnEpoch);
    //largest DTN time a ptime can hold (9999-12-31T23:59:59.999Z)
    static uint64_t GetMaxPtimeDtnTimeMilliseconds();
    //not_a_date_time if millisecondsSinceDtnEpoch is above GetMaxPtimeDtnTimeMilliseconds()
    static boost::posix_time::ptime DtnTimeToPtime(const uint64_t millisecondsSinceDtnEpoch);

    static std::string GetUtcTimestampStringFromPtime(const boost::posix_time::ptime & posixTimeValue, bool forFileName);
    static bool SetPtimeFromUtcTimestampString(const std::string & stringvalue, boost::posix_time::ptime & pt);
};

#endif // TIMESTAMP_UTIL_H

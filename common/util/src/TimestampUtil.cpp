/**
 * @file TimestampUtil.cpp
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

#include <sstream>
#include <locale>
#include "TimestampUtil.h"
#include "CborUint.h"

static const boost::posix_time::ptime DTN_EPOCH(boost::gregorian::date(2000, 1, 1));

constexpr uint64_t TimestampUtil::DTN_TIME_UNKNOWN;
constexpr unsigned int TimestampUtil::bpv7_creation_timestamp_t::MAX_BUFFER_SIZE;

const boost::posix_time::ptime & TimestampUtil::GetDtnEpoch() {
    return DTN_EPOCH;
}

bool TimestampUtil::GetMillisecondsSinceDtnEpoch(const boost::posix_time::ptime & posixTimeValue, uint64_t & millisecondsSinceDtnEpoch) {
    if (posixTimeValue.is_special() || (posixTimeValue < DTN_EPOCH)) {
        return false;
    }
    const boost::posix_time::time_duration diff = posixTimeValue - DTN_EPOCH;
    millisecondsSinceDtnEpoch = static_cast<uint64_t>(diff.total_milliseconds());
    return true;
}

uint64_t TimestampUtil::GetMaxPtimeDtnTimeMilliseconds() {
    static const uint64_t maxMs = static_cast<uint64_t>(
        (boost::posix_time::ptime(boost::gregorian::date(9999, 12, 31), boost::posix_time::time_duration(23, 59, 59))
            - DTN_EPOCH).total_milliseconds()) + 999;
    return maxMs;
}

boost::posix_time::ptime TimestampUtil::DtnTimeToPtime(const uint64_t millisecondsSinceDtnEpoch) {
    if (millisecondsSinceDtnEpoch > GetMaxPtimeDtnTimeMilliseconds()) {
        return boost::posix_time::ptime(boost::posix_time::not_a_date_time);
    }
    //whole hours first so each duration argument fits a 32-bit long
    static const uint64_t MS_PER_HOUR = 3600000;
    return DTN_EPOCH
        + boost::posix_time::hours(static_cast<long>(millisecondsSinceDtnEpoch / MS_PER_HOUR))
        + boost::posix_time::milliseconds(static_cast<long>(millisecondsSinceDtnEpoch % MS_PER_HOUR));
}

//"2018-02-28T09:43:41.688000Z" or "2018_02_28T09_43_41.688000Z" for file names
std::string TimestampUtil::GetUtcTimestampStringFromPtime(const boost::posix_time::ptime & posixTimeValue, bool forFileName) {
    static const std::locale utcLocale(std::locale::classic(), new boost::posix_time::time_facet("%Y-%m-%dT%H:%M:%sZ"));
    static const std::locale utcFileNameLocale(std::locale::classic(), new boost::posix_time::time_facet("%Y_%m_%dT%H_%M_%sZ"));
    std::ostringstream os;
    os.imbue(forFileName ? utcFileNameLocale : utcLocale);
    os << posixTimeValue;
    return os.str();
}

bool TimestampUtil::SetPtimeFromUtcTimestampString(const std::string & stringvalue, boost::posix_time::ptime & pt) {
    static const std::locale utcInputLocale(std::locale::classic(), new boost::posix_time::time_input_facet("%Y-%m-%dT%H:%M:%sZ"));
    std::istringstream is(stringvalue);
    is.imbue(utcInputLocale);
    boost::posix_time::ptime parsed(boost::posix_time::not_a_date_time);
    is >> parsed;
    pt = parsed;
    return !parsed.is_not_a_date_time();
}


bool TimestampUtil::bpv7_creation_timestamp_t::operator==(const bpv7_creation_timestamp_t & o) const {
    return (creationTimeMilliseconds == o.creationTimeMilliseconds) && (sequenceNumber == o.sequenceNumber);
}
bool TimestampUtil::bpv7_creation_timestamp_t::operator!=(const bpv7_creation_timestamp_t & o) const {
    return !(*this == o);
}
bool TimestampUtil::bpv7_creation_timestamp_t::operator<(const bpv7_creation_timestamp_t & o) const {
    return (creationTimeMilliseconds < o.creationTimeMilliseconds)
        || ((creationTimeMilliseconds == o.creationTimeMilliseconds) && (sequenceNumber < o.sequenceNumber));
}
std::ostream& operator<<(std::ostream& os, const TimestampUtil::bpv7_creation_timestamp_t & o) {
    return os << "[" << o.creationTimeMilliseconds << ", " << o.sequenceNumber << "]";
}

uint64_t TimestampUtil::bpv7_creation_timestamp_t::SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const {
    return CborTwoUint64ArraySerialize(serialization, creationTimeMilliseconds, sequenceNumber, bufferSize);
}
uint64_t TimestampUtil::bpv7_creation_timestamp_t::GetSerializationSize() const {
    return CborTwoUint64ArraySerializationSize(creationTimeMilliseconds, sequenceNumber);
}
bool TimestampUtil::bpv7_creation_timestamp_t::DeserializeBpv7(const uint8_t * serialization, uint8_t * numBytesTakenToDecode, uint64_t bufferSize) {
    uint64_t t;
    uint64_t seq;
    if (!CborTwoUint64ArrayDeserialize(serialization, numBytesTakenToDecode, bufferSize, t, seq)) {
        return false;
    }
    creationTimeMilliseconds = t;
    sequenceNumber = seq;
    return true;
}
void TimestampUtil::bpv7_creation_timestamp_t::SetZero() {
    *this = bpv7_creation_timestamp_t();
}
bool TimestampUtil::bpv7_creation_timestamp_t::IsTimeUnknown() const {
    return (creationTimeMilliseconds == DTN_TIME_UNKNOWN);
}
boost::posix_time::ptime TimestampUtil::bpv7_creation_timestamp_t::GetPtime() const {
    return DtnTimeToPtime(creationTimeMilliseconds);
}
bool TimestampUtil::bpv7_creation_timestamp_t::SetFromPtime(const boost::posix_time::ptime & posixTimeValue) {
    return GetMillisecondsSinceDtnEpoch(posixTimeValue, creationTimeMilliseconds);
}
std::string TimestampUtil::bpv7_creation_timestamp_t::GetUtcTimestampString(bool forFileName) const {
    return GetUtcTimestampStringFromPtime(GetPtime(), forFileName);
}

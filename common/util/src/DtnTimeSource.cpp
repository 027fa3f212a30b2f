/**
 * @file DtnTimeSource.cpp
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

#include "DtnTimeSource.h"
#include "TimestampUtil.h"
#include "Logger.h"

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::util;

DtnTimeSource::DtnTimeSource() {}
DtnTimeSource::~DtnTimeSource() {}

SystemDtnTimeSource::SystemDtnTimeSource() {}
SystemDtnTimeSource::~SystemDtnTimeSource() {}

bool SystemDtnTimeSource::GetDtnTimeMilliseconds(uint64_t & millisecondsSinceDtnEpoch) {
    const boost::posix_time::ptime nowUtc = boost::posix_time::microsec_clock::universal_time();
    uint64_t ms;
    //a clock reading before 2000 means the clock was never set
    if ((!TimestampUtil::GetMillisecondsSinceDtnEpoch(nowUtc, ms)) || (ms == TimestampUtil::DTN_TIME_UNKNOWN)) {
        LOG_WARNING(subprocess) << "system clock reads " << nowUtc << " which is before the DTN epoch, no reliable time available";
        return false;
    }
    millisecondsSinceDtnEpoch = ms;
    return true;
}

FixedDtnTimeSource::FixedDtnTimeSource() :
    m_millisecondsSinceDtnEpoch(0),
    m_timeAvailable(false) {}

FixedDtnTimeSource::FixedDtnTimeSource(const uint64_t millisecondsSinceDtnEpoch) :
    m_millisecondsSinceDtnEpoch(millisecondsSinceDtnEpoch),
    m_timeAvailable(millisecondsSinceDtnEpoch != TimestampUtil::DTN_TIME_UNKNOWN) {}

FixedDtnTimeSource::~FixedDtnTimeSource() {}

bool FixedDtnTimeSource::GetDtnTimeMilliseconds(uint64_t & millisecondsSinceDtnEpoch) {
    if (!m_timeAvailable) {
        return false;
    }
    millisecondsSinceDtnEpoch = m_millisecondsSinceDtnEpoch;
    return true;
}

void FixedDtnTimeSource::SetDtnTimeMilliseconds(const uint64_t millisecondsSinceDtnEpoch) {
    m_millisecondsSinceDtnEpoch = millisecondsSinceDtnEpoch;
    m_timeAvailable = (millisecondsSinceDtnEpoch != TimestampUtil::DTN_TIME_UNKNOWN);
}

void FixedDtnTimeSource::SetTimeUnavailable() {
    m_millisecondsSinceDtnEpoch = 0;
    m_timeAvailable = false;
}

void FixedDtnTimeSource::AdvanceMilliseconds(const uint64_t milliseconds) {
    m_millisecondsSinceDtnEpoch += milliseconds;
    m_timeAvailable = (m_millisecondsSinceDtnEpoch != TimestampUtil::DTN_TIME_UNKNOWN);
}

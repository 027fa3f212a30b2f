/**
 * @file DtnTimeSource.h
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
 * A DtnTimeSource supplies the current DTN time to whatever creates bundles.
 * The SystemDtnTimeSource reads the UTC wall clock, while the FixedDtnTimeSource
 * returns a settable value (or reports that no time is available), which makes
 * bundle creation deterministic for replay and unit tests.
 */

#ifndef DTN_TIME_SOURCE_H
#define DTN_TIME_SOURCE_H 1

#include <cstdint>
#include "bp7_util_export.h"

class BP7_UTIL_EXPORT DtnTimeSource {
public:
    virtual ~DtnTimeSource();
    //return false if the node has no reliable time, in which case millisecondsSinceDtnEpoch is untouched
    virtual bool GetDtnTimeMilliseconds(uint64_t & millisecondsSinceDtnEpoch) = 0;
protected:
    DtnTimeSource();
};

class BP7_UTIL_EXPORT SystemDtnTimeSource : public DtnTimeSource {
public:
    SystemDtnTimeSource();
    virtual ~SystemDtnTimeSource() override;
    virtual bool GetDtnTimeMilliseconds(uint64_t & millisecondsSinceDtnEpoch) override;
};

class BP7_UTIL_EXPORT FixedDtnTimeSource : public DtnTimeSource {
public:
    //time unavailable
    FixedDtnTimeSource();
    explicit FixedDtnTimeSource(const uint64_t millisecondsSinceDtnEpoch);
    virtual ~FixedDtnTimeSource() override;
    virtual bool GetDtnTimeMilliseconds(uint64_t & millisecondsSinceDtnEpoch) override;
    void SetDtnTimeMilliseconds(const uint64_t millisecondsSinceDtnEpoch);
    void SetTimeUnavailable();
    void AdvanceMilliseconds(const uint64_t milliseconds);
private:
    uint64_t m_millisecondsSinceDtnEpoch;
    bool m_timeAvailable;
};

#endif // DTN_TIME_SOURCE_H

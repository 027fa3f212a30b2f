/**
 * @file BundleSourceConfig.h
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
 * The BundleSourceConfig class contains the parameters a bundle source
 * needs to fill in the primary block of every bundle it creates
 * (source, report-to, lifetime and flags), and it
 * provides JSON serialization and deserialization capability.
 * Example:
 * {
 *     "sourceEid": "dtn://box1/",
 *     "reportToEid": "",
 *     "lifetimeMilliseconds": 86400000,
 *     "bundleFlags": 4,
 *     "payloadBlockFlags": 0
 * }
 * An empty reportToEid means reports go to the source.
 */

#ifndef BUNDLE_SOURCE_CONFIG_H
#define BUNDLE_SOURCE_CONFIG_H 1

#include <string>
#include <memory>
#include "JsonSerializable.h"
#include "codec/bpv7.h"
#include "codec/Bpv7Eid.h"
#include "bp7_config_export.h"

class BundleSourceConfig;
typedef std::shared_ptr<BundleSourceConfig> BundleSourceConfig_ptr;

class BundleSourceConfig : public JsonSerializable {
public:
    static constexpr uint64_t DEFAULT_LIFETIME_MILLISECONDS = 86400000; //one day

    BP7_CONFIG_EXPORT BundleSourceConfig();
    BP7_CONFIG_EXPORT virtual ~BundleSourceConfig() override;

    //a copy constructor: X(const X&)
    BP7_CONFIG_EXPORT BundleSourceConfig(const BundleSourceConfig& o);

    //a move constructor: X(X&&)
    BP7_CONFIG_EXPORT BundleSourceConfig(BundleSourceConfig&& o) noexcept;

    //a copy assignment: operator=(const X&)
    BP7_CONFIG_EXPORT BundleSourceConfig& operator=(const BundleSourceConfig& o);

    //a move assignment: operator=(X&&)
    BP7_CONFIG_EXPORT BundleSourceConfig& operator=(BundleSourceConfig&& o) noexcept;

    BP7_CONFIG_EXPORT bool operator==(const BundleSourceConfig & other) const;

    BP7_CONFIG_EXPORT static BundleSourceConfig_ptr CreateFromPtree(const boost::property_tree::ptree & pt);
    BP7_CONFIG_EXPORT static BundleSourceConfig_ptr CreateFromJson(const std::string & jsonString, bool verifyNoUnusedJsonKeys = true);
    BP7_CONFIG_EXPORT static BundleSourceConfig_ptr CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys = true);
    BP7_CONFIG_EXPORT virtual boost::property_tree::ptree GetNewPropertyTree() const override;
    BP7_CONFIG_EXPORT virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) override;

    //the report-to eid a bundle should carry (the source if none was configured)
    BP7_CONFIG_EXPORT const bpv7_eid_t & GetEffectiveReportToEid() const;

public:
    bpv7_eid_t m_sourceEid;
    bpv7_eid_t m_reportToEid; //unknown (default constructed) means the source
    uint64_t m_lifetimeMilliseconds;
    BPV7_BUNDLEFLAG m_bundleFlags;
    BPV7_BLOCKFLAG m_payloadBlockFlags;
};

#endif // BUNDLE_SOURCE_CONFIG_H

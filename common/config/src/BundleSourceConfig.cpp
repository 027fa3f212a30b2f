/**
 * @file BundleSourceConfig.cpp
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

#include "BundleSourceConfig.h"
#include "Logger.h"
#include "Uri.h"
#include <memory>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::config;

constexpr uint64_t BundleSourceConfig::DEFAULT_LIFETIME_MILLISECONDS;

//optional unsigned decimal key, no sign or fraction
static bool GetOptionalUint64(const boost::property_tree::ptree & pt, const char * key, const uint64_t defaultValue, uint64_t & value) {
    const boost::optional<std::string> text = pt.get_optional<std::string>(key);
    if (!text) {
        value = defaultValue;
        return true;
    }
    if (!Uri::ParseCanonicalUint64(text->data(), text->size(), value)) {
        LOG_ERROR(subprocess) << "error parsing JSON bundle source config: " << key << " must be an unsigned 64-bit integer, got \"" << *text << "\"";
        return false;
    }
    return true;
}

BundleSourceConfig::BundleSourceConfig() :
    m_sourceEid(),
    m_reportToEid(),
    m_lifetimeMilliseconds(DEFAULT_LIFETIME_MILLISECONDS),
    m_bundleFlags(BPV7_BUNDLEFLAG::NO_FLAGS_SET),
    m_payloadBlockFlags(BPV7_BLOCKFLAG::NO_FLAGS_SET) { }

BundleSourceConfig::~BundleSourceConfig() {
}

//a copy constructor: X(const X&)
BundleSourceConfig::BundleSourceConfig(const BundleSourceConfig& o) :
    m_sourceEid(o.m_sourceEid),
    m_reportToEid(o.m_reportToEid),
    m_lifetimeMilliseconds(o.m_lifetimeMilliseconds),
    m_bundleFlags(o.m_bundleFlags),
    m_payloadBlockFlags(o.m_payloadBlockFlags) { }

//a move constructor: X(X&&)
BundleSourceConfig::BundleSourceConfig(BundleSourceConfig&& o) noexcept :
    m_sourceEid(std::move(o.m_sourceEid)),
    m_reportToEid(std::move(o.m_reportToEid)),
    m_lifetimeMilliseconds(o.m_lifetimeMilliseconds),
    m_bundleFlags(o.m_bundleFlags),
    m_payloadBlockFlags(o.m_payloadBlockFlags) { }

//a copy assignment: operator=(const X&)
BundleSourceConfig& BundleSourceConfig::operator=(const BundleSourceConfig& o) {
    m_sourceEid = o.m_sourceEid;
    m_reportToEid = o.m_reportToEid;
    m_lifetimeMilliseconds = o.m_lifetimeMilliseconds;
    m_bundleFlags = o.m_bundleFlags;
    m_payloadBlockFlags = o.m_payloadBlockFlags;
    return *this;
}

//a move assignment: operator=(X&&)
BundleSourceConfig& BundleSourceConfig::operator=(BundleSourceConfig&& o) noexcept {
    m_sourceEid = std::move(o.m_sourceEid);
    m_reportToEid = std::move(o.m_reportToEid);
    m_lifetimeMilliseconds = o.m_lifetimeMilliseconds;
    m_bundleFlags = o.m_bundleFlags;
    m_payloadBlockFlags = o.m_payloadBlockFlags;
    return *this;
}

bool BundleSourceConfig::operator==(const BundleSourceConfig & other) const {
    return
        (m_sourceEid == other.m_sourceEid) &&
        (m_reportToEid == other.m_reportToEid) &&
        (m_lifetimeMilliseconds == other.m_lifetimeMilliseconds) &&
        (m_bundleFlags == other.m_bundleFlags) &&
        (m_payloadBlockFlags == other.m_payloadBlockFlags);
}

const bpv7_eid_t & BundleSourceConfig::GetEffectiveReportToEid() const {
    return (m_reportToEid.IsUnknown()) ? m_sourceEid : m_reportToEid;
}

bool BundleSourceConfig::SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) {
    std::string sourceEidUri;
    std::string reportToEidUri;
    uint64_t lifetimeMilliseconds;
    uint64_t bundleFlags;
    uint64_t payloadBlockFlags;
    try {
        sourceEidUri = pt.get<std::string>("sourceEid");
        reportToEidUri = pt.get<std::string>("reportToEid", "");
    }
    catch (const boost::property_tree::ptree_error & e) {
        LOG_ERROR(subprocess) << "error parsing JSON bundle source config: " << e.what();
        return false;
    }
    if ((!GetOptionalUint64(pt, "lifetimeMilliseconds", DEFAULT_LIFETIME_MILLISECONDS, lifetimeMilliseconds))
        || (!GetOptionalUint64(pt, "bundleFlags", 0, bundleFlags))
        || (!GetOptionalUint64(pt, "payloadBlockFlags", 0, payloadBlockFlags)))
    {
        return false; //logged
    }

    bpv7_codec_error_t error;
    if (!bpv7_eid_t::ParseUri(sourceEidUri, m_sourceEid, error)) {
        LOG_ERROR(subprocess) << "error parsing JSON bundle source config: sourceEid: " << error;
        return false;
    }
    if (reportToEidUri.empty()) {
        m_reportToEid = bpv7_eid_t();
    }
    else if (!bpv7_eid_t::ParseUri(reportToEidUri, m_reportToEid, error)) {
        LOG_ERROR(subprocess) << "error parsing JSON bundle source config: reportToEid: " << error;
        return false;
    }

    m_lifetimeMilliseconds = lifetimeMilliseconds;
    m_bundleFlags = static_cast<BPV7_BUNDLEFLAG>(bundleFlags);
    if (EnumHasAnyFlag(m_bundleFlags, BPV7_BUNDLEFLAG::ISFRAGMENT)) {
        LOG_ERROR(subprocess) << "error parsing JSON bundle source config: bundleFlags must not have the is-fragment flag (0x1) set";
        return false;
    }
    m_payloadBlockFlags = static_cast<BPV7_BLOCKFLAG>(payloadBlockFlags);
    return true;
}

BundleSourceConfig_ptr BundleSourceConfig::CreateFromJson(const std::string& jsonString, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    BundleSourceConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonString(jsonString, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        //verify that there are no unused variables within the original json
        if (config && verifyNoUnusedJsonKeys) {
            std::string returnedErrorMessage;
            if (JsonSerializable::HasUnusedJsonVariablesInString(*config, jsonString, returnedErrorMessage)) {
                LOG_ERROR(subprocess) << returnedErrorMessage;
                config.reset(); //NULL
            }
        }
    }
    return config;
}

BundleSourceConfig_ptr BundleSourceConfig::CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    BundleSourceConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonFilePath(jsonFilePath, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        if (config && verifyNoUnusedJsonKeys) {
            std::string returnedErrorMessage;
            if (JsonSerializable::HasUnusedJsonVariablesInFilePath(*config, jsonFilePath, returnedErrorMessage)) {
                LOG_ERROR(subprocess) << returnedErrorMessage;
                config.reset(); //NULL
            }
        }
    }
    return config;
}

BundleSourceConfig_ptr BundleSourceConfig::CreateFromPtree(const boost::property_tree::ptree & pt) {
    BundleSourceConfig_ptr ptrConfig = std::make_shared<BundleSourceConfig>();
    if (!ptrConfig->SetValuesFromPropertyTree(pt)) {
        ptrConfig = BundleSourceConfig_ptr(); //failed, so delete and set it NULL
    }
    return ptrConfig;
}

boost::property_tree::ptree BundleSourceConfig::GetNewPropertyTree() const {
    boost::property_tree::ptree pt;
    pt.put("sourceEid", m_sourceEid.ToUri());
    pt.put("reportToEid", m_reportToEid.ToUri()); //"" if unknown
    pt.put("lifetimeMilliseconds", m_lifetimeMilliseconds);
    pt.put("bundleFlags", static_cast<uint64_t>(m_bundleFlags));
    pt.put("payloadBlockFlags", static_cast<uint64_t>(m_payloadBlockFlags));
    return pt;
}

/**
 * @file Bpv7CodecError.cpp
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

#include "codec/Bpv7CodecError.h"
#include <sstream>

const char * Bpv7CodecErrorToString(const BPV7_CODEC_ERROR code) {
    switch (code) {
        case BPV7_CODEC_ERROR::NONE: return "none";
        case BPV7_CODEC_ERROR::MALFORMED_BUNDLE: return "malformed bundle";
        case BPV7_CODEC_ERROR::MALFORMED_PRIMARY_BLOCK: return "malformed primary block";
        case BPV7_CODEC_ERROR::MALFORMED_CANONICAL_BLOCK: return "malformed canonical block";
        case BPV7_CODEC_ERROR::MALFORMED_EID: return "malformed endpoint id";
        case BPV7_CODEC_ERROR::MALFORMED_TIMESTAMP: return "malformed creation timestamp";
        case BPV7_CODEC_ERROR::UNSUPPORTED_VERSION: return "unsupported bundle protocol version";
        case BPV7_CODEC_ERROR::UNSUPPORTED_CRC: return "unsupported crc type";
        case BPV7_CODEC_ERROR::FRAGMENTATION_UNSUPPORTED: return "fragmentation unsupported";
        case BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK: return "missing payload block";
        case BPV7_CODEC_ERROR::UNSUPPORTED_BLOCK_TYPE: return "unsupported block type";
        case BPV7_CODEC_ERROR::UNSUPPORTED_SCHEME: return "unsupported eid scheme";
        case BPV7_CODEC_ERROR::INVALID_BLOCK_NUMBER: return "invalid block number";
        case BPV7_CODEC_ERROR::INVARIANT_VIOLATION: return "invariant violation";
    }
    return "unknown error";
}

std::ostream& operator<<(std::ostream& os, const BPV7_CODEC_ERROR code) {
    os << Bpv7CodecErrorToString(code);
    return os;
}

bpv7_codec_error_t::bpv7_codec_error_t() : code(BPV7_CODEC_ERROR::NONE) {} //a default constructor: X()
bpv7_codec_error_t::bpv7_codec_error_t(const BPV7_CODEC_ERROR paramCode, const std::string & paramDetail) :
    code(paramCode), detail(paramDetail) {}

void bpv7_codec_error_t::Set(const BPV7_CODEC_ERROR paramCode, const std::string & paramDetail) {
    code = paramCode;
    detail = paramDetail;
}

void bpv7_codec_error_t::Clear() {
    code = BPV7_CODEC_ERROR::NONE;
    detail.clear();
}

bool bpv7_codec_error_t::IsError() const {
    return (code != BPV7_CODEC_ERROR::NONE);
}

bool bpv7_codec_error_t::IsStructural() const {
    return (code >= BPV7_CODEC_ERROR::MALFORMED_BUNDLE) && (code <= BPV7_CODEC_ERROR::MALFORMED_TIMESTAMP);
}

bool bpv7_codec_error_t::IsSemantic() const {
    return (code >= BPV7_CODEC_ERROR::UNSUPPORTED_VERSION) && (code <= BPV7_CODEC_ERROR::INVARIANT_VIOLATION);
}

std::string bpv7_codec_error_t::ToString() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const bpv7_codec_error_t & o) {
    os << o.code;
    if (!o.detail.empty()) {
        os << ": " << o.detail;
    }
    return os;
}

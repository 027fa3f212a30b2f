/**
 * @file Bpv7CodecError.h
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
 * The error filled in by every Bundle Protocol version 7 encode, decode and
 * construction function that returns false.  Structural errors mean the bytes
 * are not the expected CBOR shape.  Semantic errors mean the shape is fine but
 * the content is a feature or value this codec does not accept.
 */

#ifndef BPV7_CODEC_ERROR_H
#define BPV7_CODEC_ERROR_H 1

#include <cstdint>
#include <string>
#include <ostream>
#include "bp7_codec_export.h"

enum class BPV7_CODEC_ERROR : uint8_t {
    NONE = 0,

    //structural
    MALFORMED_BUNDLE,
    MALFORMED_PRIMARY_BLOCK,
    MALFORMED_CANONICAL_BLOCK,
    MALFORMED_EID,
    MALFORMED_TIMESTAMP,

    //semantic
    UNSUPPORTED_VERSION,
    UNSUPPORTED_CRC,
    FRAGMENTATION_UNSUPPORTED,
    MISSING_PAYLOAD_BLOCK,
    UNSUPPORTED_BLOCK_TYPE,
    UNSUPPORTED_SCHEME,
    INVALID_BLOCK_NUMBER,
    INVARIANT_VIOLATION
};
BP7_CODEC_EXPORT const char * Bpv7CodecErrorToString(const BPV7_CODEC_ERROR code);
BP7_CODEC_EXPORT std::ostream& operator<<(std::ostream& os, const BPV7_CODEC_ERROR code);

struct bpv7_codec_error_t {
    BPV7_CODEC_ERROR code;
    std::string detail;

    BP7_CODEC_EXPORT bpv7_codec_error_t(); //a default constructor: X()
    BP7_CODEC_EXPORT bpv7_codec_error_t(const BPV7_CODEC_ERROR paramCode, const std::string & paramDetail);
    BP7_CODEC_EXPORT void Set(const BPV7_CODEC_ERROR paramCode, const std::string & paramDetail);
    BP7_CODEC_EXPORT void Clear();
    BP7_CODEC_EXPORT bool IsError() const;
    BP7_CODEC_EXPORT bool IsStructural() const;
    BP7_CODEC_EXPORT bool IsSemantic() const;
    BP7_CODEC_EXPORT std::string ToString() const;
    BP7_CODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const bpv7_codec_error_t & o);
};

#endif //BPV7_CODEC_ERROR_H

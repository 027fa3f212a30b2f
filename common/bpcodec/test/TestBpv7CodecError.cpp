/**
 * @file TestBpv7CodecError.cpp
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

#include <boost/test/unit_test.hpp>
#include "codec/Bpv7CodecError.h"
#include <string>
#include <vector>

BOOST_AUTO_TEST_CASE(Bpv7CodecErrorTestCase)
{
    bpv7_codec_error_t error;
    BOOST_REQUIRE(!error.IsError());
    BOOST_REQUIRE(!error.IsStructural());
    BOOST_REQUIRE(!error.IsSemantic());
    BOOST_REQUIRE_EQUAL(error.ToString(), "none");

    error.Set(BPV7_CODEC_ERROR::UNSUPPORTED_VERSION, "bundle protocol version 6");
    BOOST_REQUIRE(error.IsError());
    BOOST_REQUIRE_EQUAL(error.ToString(), "unsupported bundle protocol version: bundle protocol version 6");
    error.Clear();
    BOOST_REQUIRE(!error.IsError());
    BOOST_REQUIRE(error.detail.empty());

    static const std::vector<BPV7_CODEC_ERROR> structuralCodes = {
        BPV7_CODEC_ERROR::MALFORMED_BUNDLE,
        BPV7_CODEC_ERROR::MALFORMED_PRIMARY_BLOCK,
        BPV7_CODEC_ERROR::MALFORMED_CANONICAL_BLOCK,
        BPV7_CODEC_ERROR::MALFORMED_EID,
        BPV7_CODEC_ERROR::MALFORMED_TIMESTAMP
    };
    static const std::vector<BPV7_CODEC_ERROR> semanticCodes = {
        BPV7_CODEC_ERROR::UNSUPPORTED_VERSION,
        BPV7_CODEC_ERROR::UNSUPPORTED_CRC,
        BPV7_CODEC_ERROR::FRAGMENTATION_UNSUPPORTED,
        BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK,
        BPV7_CODEC_ERROR::UNSUPPORTED_BLOCK_TYPE,
        BPV7_CODEC_ERROR::UNSUPPORTED_SCHEME,
        BPV7_CODEC_ERROR::INVALID_BLOCK_NUMBER,
        BPV7_CODEC_ERROR::INVARIANT_VIOLATION
    };
    for (std::size_t i = 0; i < structuralCodes.size(); ++i) {
        const bpv7_codec_error_t e(structuralCodes[i], "");
        BOOST_TEST_CONTEXT(e) {
            BOOST_REQUIRE(e.IsError());
            BOOST_REQUIRE(e.IsStructural());
            BOOST_REQUIRE(!e.IsSemantic());
            BOOST_REQUIRE_NE(std::string(Bpv7CodecErrorToString(e.code)), "unknown error");
        }
    }
    for (std::size_t i = 0; i < semanticCodes.size(); ++i) {
        const bpv7_codec_error_t e(semanticCodes[i], "");
        BOOST_TEST_CONTEXT(e) {
            BOOST_REQUIRE(e.IsError());
            BOOST_REQUIRE(!e.IsStructural());
            BOOST_REQUIRE(e.IsSemantic());
            BOOST_REQUIRE_NE(std::string(Bpv7CodecErrorToString(e.code)), "unknown error");
        }
    }
}

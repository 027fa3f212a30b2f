/**
 * @file TestBpv7Bundle.cpp
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
#include "codec/Bpv7Bundle.h"
#include "DtnTimeSource.h"
#include <string>
#include <vector>
#include <sstream>
#include <initializer_list>
#include <algorithm>

static std::vector<uint8_t> ConcatBundleBytes(std::initializer_list<std::vector<uint8_t> > parts) {
    std::vector<uint8_t> result;
    for (std::initializer_list<std::vector<uint8_t> >::const_iterator it = parts.begin(); it != parts.end(); ++it) {
        result.insert(result.end(), it->begin(), it->end());
    }
    return result;
}

static std::vector<uint8_t> StringToBytes(const std::string & s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

//[7, 0, 0, ipn:2.1, ipn:1.1, ipn:1.1, [0, 0], 1000]
static const std::vector<uint8_t> SMALL_PRIMARY = {
    0x88, 0x07, 0x00, 0x00,
    0x82, 0x02, 0x82, 0x02, 0x01,
    0x82, 0x02, 0x82, 0x01, 0x01,
    0x82, 0x02, 0x82, 0x01, 0x01,
    0x82, 0x00, 0x00,
    0x19, 0x03, 0xe8
};
//[1, 1, 0, 0, h'6869']
static const std::vector<uint8_t> SMALL_PAYLOAD_BLOCK = { 0x85, 0x01, 0x01, 0x00, 0x00, 0x42, 'h', 'i' };

static bpv7_eid_t MustParseEid(const std::string & uri) {
    bpv7_eid_t eid;
    bpv7_codec_error_t error;
    BOOST_REQUIRE_MESSAGE(bpv7_eid_t::ParseUri(uri, eid, error), error);
    return eid;
}

static Bpv7Bundle MakeSmallBundle() {
    FixedDtnTimeSource noTime;
    Bpv7Bundle bundle;
    bpv7_codec_error_t error;
    BOOST_REQUIRE(Bpv7Bundle::Create(bundle, error, MustParseEid("ipn:2.1"), MustParseEid("ipn:1.1"), bpv7_eid_t(), 1000,
        BPV7_BUNDLEFLAG::NO_FLAGS_SET, BPV7_BLOCKFLAG::NO_FLAGS_SET, StringToBytes("hi"), noTime, 0));
    return bundle;
}

static void CheckBundleDecodeFails(const std::vector<uint8_t> & serialization, const BPV7_CODEC_ERROR expectedCode) {
    Bpv7Bundle bundle = MakeSmallBundle();
    const Bpv7Bundle bundleBefore(bundle);
    bpv7_codec_error_t error;
    BOOST_REQUIRE(!bundle.DeserializeBpv7(serialization, error));
    BOOST_REQUIRE_EQUAL(error.code, expectedCode);
    BOOST_REQUIRE_EQUAL(bundle, bundleBefore);
}

BOOST_AUTO_TEST_CASE(Bpv7BundleScenarioTestCase)
{
    static const std::string payloadString("Is there anybody out there?");
    BOOST_REQUIRE_EQUAL(payloadString.size(), 27);

    FixedDtnTimeSource noTime;
    Bpv7Bundle bundle;
    bpv7_codec_error_t error;
    BOOST_REQUIRE(Bpv7Bundle::Create(bundle, error,
        MustParseEid("dtn://greatunknown/incoming"), MustParseEid("dtn://box1/"), bpv7_eid_t(),
        3600000, BPV7_BUNDLEFLAG::NO_FLAGS_SET, BPV7_BLOCKFLAG::NO_FLAGS_SET,
        StringToBytes(payloadString), noTime, 0));
    BOOST_REQUIRE(!bundle.IsEmpty());

    std::vector<uint8_t> serialization;
    BOOST_REQUIRE(bundle.SerializeBpv7(serialization));
    const std::vector<uint8_t> expected = ConcatBundleBytes({
        { 0x82 },
        { 0x88, 0x07, 0x00, 0x00 },
        { 0x82, 0x01, 0x77 }, StringToBytes("//greatunknown/incoming"),
        { 0x82, 0x01, 0x67 }, StringToBytes("//box1/"),
        { 0x82, 0x01, 0x67 }, StringToBytes("//box1/"), //report-to defaults to the source
        { 0x82, 0x00, 0x00 },
        { 0x1a, 0x00, 0x36, 0xee, 0x80 },
        { 0x85, 0x01, 0x01, 0x00, 0x00, 0x58, 0x1b }, StringToBytes(payloadString)
    });
    BOOST_REQUIRE_EQUAL_COLLECTIONS(serialization.begin(), serialization.end(), expected.begin(), expected.end());
    BOOST_REQUIRE_EQUAL(bundle.GetSerializationSize(), expected.size());

    Bpv7Bundle decoded;
    BOOST_REQUIRE(decoded.DeserializeBpv7(serialization, error));
    BOOST_REQUIRE(!error.IsError());
    BOOST_REQUIRE_EQUAL(decoded, bundle);
    const std::vector<uint8_t> & payload = decoded.GetPayload();
    BOOST_REQUIRE_EQUAL(std::string(payload.begin(), payload.end()), payloadString);
    BOOST_REQUIRE_EQUAL(payload.size(), 27);
    BOOST_REQUIRE_EQUAL(decoded.GetPrimaryBlock().m_sourceNodeId.ToUri(), "dtn://box1/");
    BOOST_REQUIRE_EQUAL(decoded.GetPrimaryBlock().m_destinationEid.ToUri(), "dtn://greatunknown/incoming");
    BOOST_REQUIRE_EQUAL(decoded.GetPrimaryBlock().m_lifetimeMilliseconds, 3600000);
    BOOST_REQUIRE(decoded.GetPrimaryBlock().m_creationTimestamp.IsTimeUnknown());
    BOOST_REQUIRE_EQUAL(decoded.GetCanonicalBlocks().size(), 1);
    BOOST_REQUIRE(decoded.GetPayloadBlock() != NULL);
    BOOST_REQUIRE_EQUAL(decoded.GetPayloadBlock()->m_blockNumber, 1);

    //re-encoding the decoded bundle gives the same bytes
    std::vector<uint8_t> serialization2;
    BOOST_REQUIRE(decoded.SerializeBpv7(serialization2));
    BOOST_REQUIRE(serialization2 == serialization);
}

BOOST_AUTO_TEST_CASE(Bpv7BundleCreateTestCase)
{
    //small bundle, byte exact
    {
        const Bpv7Bundle bundle = MakeSmallBundle();
        const std::vector<uint8_t> expected = ConcatBundleBytes({ { 0x82 }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK });
        std::vector<uint8_t> serialization;
        BOOST_REQUIRE(bundle.SerializeBpv7(serialization));
        BOOST_REQUIRE(serialization == expected);

        //raw buffer path
        std::vector<uint8_t> buffer(expected.size() + 5, 0xee);
        BOOST_REQUIRE_EQUAL(bundle.SerializeBpv7(buffer.data(), buffer.size()), expected.size());
        BOOST_REQUIRE(std::vector<uint8_t>(buffer.begin(), buffer.begin() + expected.size()) == expected);
        BOOST_REQUIRE_EQUAL(buffer.back(), 0xee);
        BOOST_REQUIRE_EQUAL(bundle.SerializeBpv7(buffer.data(), expected.size() - 1), 0);
    }

    //creation time from the time source, explicit report-to, flags and sequence number
    {
        FixedDtnTimeSource timeSource(5000);
        const std::vector<uint8_t> payload = StringToBytes("abc");
        Bpv7Bundle bundle;
        bpv7_codec_error_t error;
        BOOST_REQUIRE(Bpv7Bundle::Create(bundle, error, MustParseEid("dtn:none"), MustParseEid("ipn:1.1"), MustParseEid("ipn:3.0"), 86400000,
            BPV7_BUNDLEFLAG::NOFRAGMENT, BPV7_BLOCKFLAG::MUST_BE_REPLICATED, payload.data(), payload.size(), timeSource, 3));
        const Bpv7PrimaryBlock & primary = bundle.GetPrimaryBlock();
        BOOST_REQUIRE_EQUAL(primary.m_creationTimestamp.creationTimeMilliseconds, 5000);
        BOOST_REQUIRE_EQUAL(primary.m_creationTimestamp.sequenceNumber, 3);
        BOOST_REQUIRE_EQUAL(primary.m_reportToEid.ToUri(), "ipn:3.0");
        BOOST_REQUIRE(primary.m_destinationEid.IsDtnNone());
        BOOST_REQUIRE(primary.HasBundleFlag(BPV7_BUNDLEFLAG::NOFRAGMENT));
        BOOST_REQUIRE(bundle.GetPayloadBlock()->HasBlockFlag(BPV7_BLOCKFLAG::MUST_BE_REPLICATED));
        BOOST_REQUIRE(bundle.GetPayload() == payload);
        BOOST_REQUIRE_EQUAL(bundle.GetBundleIdString(), "ipn:1.1-5000-3");

        //dtn:none destination is encoded as [1, 0]
        std::vector<uint8_t> serialization;
        BOOST_REQUIRE(bundle.SerializeBpv7(serialization));
        static const std::vector<uint8_t> expectedStart = { 0x82, 0x88, 0x07, 0x04, 0x00, 0x82, 0x01, 0x00 };
        BOOST_REQUIRE(std::vector<uint8_t>(serialization.begin(), serialization.begin() + expectedStart.size()) == expectedStart);

        Bpv7Bundle decoded;
        BOOST_REQUIRE(decoded.DeserializeBpv7(serialization, error));
        BOOST_REQUIRE_EQUAL(decoded, bundle);
        BOOST_REQUIRE_EQUAL(decoded.GetBundleIdString(), "ipn:1.1-5000-3");
    }

    //empty and large payloads
    {
        FixedDtnTimeSource timeSource(1);
        Bpv7Bundle bundle;
        bpv7_codec_error_t error;
        BOOST_REQUIRE(Bpv7Bundle::Create(bundle, error, MustParseEid("ipn:2.1"), MustParseEid("ipn:1.1"), bpv7_eid_t(), 1000,
            BPV7_BUNDLEFLAG::NO_FLAGS_SET, BPV7_BLOCKFLAG::NO_FLAGS_SET, std::vector<uint8_t>(), timeSource, 0));
        BOOST_REQUIRE(bundle.GetPayload().empty());
        std::vector<uint8_t> serialization;
        BOOST_REQUIRE(bundle.SerializeBpv7(serialization));
        Bpv7Bundle decoded;
        BOOST_REQUIRE(decoded.DeserializeBpv7(serialization, error));
        BOOST_REQUIRE(decoded.GetPayload().empty());

        std::vector<uint8_t> largePayload(70000);
        for (std::size_t i = 0; i < largePayload.size(); ++i) {
            largePayload[i] = static_cast<uint8_t>(i);
        }
        const std::vector<uint8_t> largePayloadCopy(largePayload);
        BOOST_REQUIRE(Bpv7Bundle::Create(bundle, error, MustParseEid("ipn:2.1"), MustParseEid("ipn:1.1"), bpv7_eid_t(), 1000,
            BPV7_BUNDLEFLAG::NO_FLAGS_SET, BPV7_BLOCKFLAG::NO_FLAGS_SET, std::move(largePayload), timeSource, 1));
        BOOST_REQUIRE(bundle.SerializeBpv7(serialization));
        static const std::vector<uint8_t> largeByteStringHead = { 0x5a, 0x00, 0x01, 0x11, 0x70 };
        BOOST_REQUIRE(std::search(serialization.begin(), serialization.end(), largeByteStringHead.begin(), largeByteStringHead.end()) != serialization.end());
        BOOST_REQUIRE(decoded.DeserializeBpv7(serialization, error));
        BOOST_REQUIRE(decoded.GetPayload() == largePayloadCopy);
    }

    //rejected, bundle untouched
    {
        FixedDtnTimeSource timeSource(1);
        Bpv7Bundle bundle = MakeSmallBundle();
        const Bpv7Bundle bundleBefore(bundle);
        bpv7_codec_error_t error;
        BOOST_REQUIRE(!Bpv7Bundle::Create(bundle, error, MustParseEid("ipn:2.1"), MustParseEid("ipn:1.1"), bpv7_eid_t(), 1000,
            BPV7_BUNDLEFLAG::ISFRAGMENT, BPV7_BLOCKFLAG::NO_FLAGS_SET, StringToBytes("x"), timeSource, 0));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::FRAGMENTATION_UNSUPPORTED);
        BOOST_REQUIRE(!Bpv7Bundle::Create(bundle, error, bpv7_eid_t(), MustParseEid("ipn:1.1"), bpv7_eid_t(), 1000,
            BPV7_BUNDLEFLAG::NO_FLAGS_SET, BPV7_BLOCKFLAG::NO_FLAGS_SET, StringToBytes("x"), timeSource, 0));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::MALFORMED_EID);
        BOOST_REQUIRE(!Bpv7Bundle::Create(bundle, error, MustParseEid("ipn:2.1"), bpv7_eid_t(), bpv7_eid_t(), 1000,
            BPV7_BUNDLEFLAG::NO_FLAGS_SET, BPV7_BLOCKFLAG::NO_FLAGS_SET, StringToBytes("x"), timeSource, 0));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::MALFORMED_EID);
        BOOST_REQUIRE_EQUAL(bundle, bundleBefore);
    }

    //an empty bundle is not encodable
    {
        const Bpv7Bundle bundle;
        BOOST_REQUIRE(bundle.IsEmpty());
        BOOST_REQUIRE(bundle.GetPayloadBlock() == NULL);
        BOOST_REQUIRE(bundle.GetPayload().empty());
        BOOST_REQUIRE_EQUAL(bundle.GetSerializationSize(), 0);
        std::vector<uint8_t> serialization(10);
        BOOST_REQUIRE_EQUAL(bundle.SerializeBpv7(serialization.data(), serialization.size()), 0);
        BOOST_REQUIRE(!bundle.SerializeBpv7(serialization));
        BOOST_REQUIRE(serialization.empty());
        std::ostringstream oss;
        oss << bundle;
        BOOST_REQUIRE_EQUAL(oss.str(), "empty bundle");
    }
}

BOOST_AUTO_TEST_CASE(Bpv7BundleAssembleTestCase)
{
    Bpv7PrimaryBlock primary;
    primary.m_destinationEid = MustParseEid("ipn:2.1");
    primary.m_sourceNodeId = MustParseEid("ipn:1.1");
    primary.m_reportToEid = MustParseEid("ipn:1.1");
    primary.m_lifetimeMilliseconds = 1000;
    std::vector<Bpv7CanonicalBlock> blocks(1);
    blocks[0].m_blockNumber = 1;
    blocks[0].m_data = StringToBytes("hi");

    //the payload block does not have to be number 1
    {
        Bpv7Bundle bundle;
        bpv7_codec_error_t error;
        BOOST_REQUIRE(Bpv7Bundle::Assemble(bundle, error, primary, blocks));
        BOOST_REQUIRE_EQUAL(bundle, MakeSmallBundle());
        std::vector<Bpv7CanonicalBlock> blocks5(blocks);
        blocks5[0].m_blockNumber = 5;
        BOOST_REQUIRE(Bpv7Bundle::Assemble(bundle, error, primary, blocks5));
        BOOST_REQUIRE_EQUAL(bundle.GetPayloadBlock()->m_blockNumber, 5);
    }

    Bpv7Bundle bundle = MakeSmallBundle();
    const Bpv7Bundle bundleBefore(bundle);
    bpv7_codec_error_t error;

    BOOST_REQUIRE(!Bpv7Bundle::Assemble(bundle, error, primary, std::vector<Bpv7CanonicalBlock>()));
    BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK);

    {
        std::vector<Bpv7CanonicalBlock> duplicates(2, blocks[0]);
        BOOST_REQUIRE(!Bpv7Bundle::Assemble(bundle, error, primary, duplicates));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::INVARIANT_VIOLATION);
        BOOST_REQUIRE_EQUAL(error.detail, "duplicate block number 1");

        duplicates[1].m_blockNumber = 2;
        BOOST_REQUIRE(!Bpv7Bundle::Assemble(bundle, error, primary, duplicates));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::INVARIANT_VIOLATION); //two payload blocks
    }
    {
        std::vector<Bpv7CanonicalBlock> badBlocks(blocks);
        badBlocks[0].m_blockNumber = 0;
        BOOST_REQUIRE(!Bpv7Bundle::Assemble(bundle, error, primary, badBlocks));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::INVALID_BLOCK_NUMBER);
        badBlocks[0].m_blockNumber = 1;
        badBlocks[0].m_crcType = BPV7_CRC_TYPE::CRC32C;
        BOOST_REQUIRE(!Bpv7Bundle::Assemble(bundle, error, primary, badBlocks));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::UNSUPPORTED_CRC);
        badBlocks[0].m_crcType = BPV7_CRC_TYPE::NONE;
        badBlocks[0].m_blockTypeCode = BPV7_BLOCK_TYPE_CODE::BUNDLE_AGE;
        BOOST_REQUIRE(!Bpv7Bundle::Assemble(bundle, error, primary, badBlocks));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::UNSUPPORTED_BLOCK_TYPE);
    }
    {
        Bpv7PrimaryBlock badPrimary(primary);
        badPrimary.m_crcType = BPV7_CRC_TYPE::CRC16_X25;
        BOOST_REQUIRE(!Bpv7Bundle::Assemble(bundle, error, badPrimary, blocks));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::UNSUPPORTED_CRC);
        badPrimary = primary;
        badPrimary.m_bundleProcessingControlFlags = BPV7_BUNDLEFLAG::ISFRAGMENT;
        BOOST_REQUIRE(!Bpv7Bundle::Assemble(bundle, error, badPrimary, blocks));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::FRAGMENTATION_UNSUPPORTED);
        badPrimary = primary;
        badPrimary.m_reportToEid = bpv7_eid_t();
        BOOST_REQUIRE(!Bpv7Bundle::Assemble(bundle, error, badPrimary, blocks));
        BOOST_REQUIRE_EQUAL(error.code, BPV7_CODEC_ERROR::MALFORMED_EID);
    }
    BOOST_REQUIRE_EQUAL(bundle, bundleBefore);
}

BOOST_AUTO_TEST_CASE(Bpv7BundleDecodeTestCase)
{
    const Bpv7Bundle smallBundle = MakeSmallBundle();

    //indefinite length outer array is accepted, and re-encoded as definite
    {
        const std::vector<uint8_t> indefinite = ConcatBundleBytes({ { 0x9f }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK, { 0xff } });
        Bpv7Bundle bundle;
        bpv7_codec_error_t error;
        BOOST_REQUIRE(bundle.DeserializeBpv7(indefinite, error));
        BOOST_REQUIRE_EQUAL(bundle, smallBundle);
        std::vector<uint8_t> serialization;
        BOOST_REQUIRE(bundle.SerializeBpv7(serialization));
        BOOST_REQUIRE(serialization == ConcatBundleBytes({ { 0x82 }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK }));
    }

    //unknown bundle flag bits survive decode and re-encode
    {
        std::vector<uint8_t> primaryWithUnknownFlag(SMALL_PRIMARY);
        primaryWithUnknownFlag[2] = 0x10; //bit 4 is reserved
        const std::vector<uint8_t> serialization = ConcatBundleBytes({ { 0x82 }, primaryWithUnknownFlag, SMALL_PAYLOAD_BLOCK });
        Bpv7Bundle bundle;
        bpv7_codec_error_t error;
        BOOST_REQUIRE(bundle.DeserializeBpv7(serialization, error));
        BOOST_REQUIRE_EQUAL(static_cast<uint64_t>(bundle.GetPrimaryBlock().m_bundleProcessingControlFlags), 0x10);
        std::vector<uint8_t> serialization2;
        BOOST_REQUIRE(bundle.SerializeBpv7(serialization2));
        BOOST_REQUIRE(serialization2 == serialization);
    }

    //missing payload
    CheckBundleDecodeFails({ 0x80 }, BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK);
    CheckBundleDecodeFails({ 0x9f, 0xff }, BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK);
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x81 }, SMALL_PRIMARY }), BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK);
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x9f }, SMALL_PRIMARY, { 0xff } }), BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK);

    //block numbers
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x83 }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK, SMALL_PAYLOAD_BLOCK }),
        BPV7_CODEC_ERROR::INVARIANT_VIOLATION);
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x83 }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK, { 0x85, 0x01, 0x02, 0x00, 0x00, 0x40 } }),
        BPV7_CODEC_ERROR::INVARIANT_VIOLATION);
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x82 }, SMALL_PRIMARY, { 0x85, 0x01, 0x00, 0x00, 0x00, 0x40 } }),
        BPV7_CODEC_ERROR::INVALID_BLOCK_NUMBER);

    //extension blocks
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x83 }, SMALL_PRIMARY, { 0x85, 0x0a, 0x02, 0x00, 0x00, 0x43, 0x82, 0x10, 0x00 }, SMALL_PAYLOAD_BLOCK }),
        BPV7_CODEC_ERROR::UNSUPPORTED_BLOCK_TYPE);
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x83 }, SMALL_PRIMARY, { 0x85, 0x07, 0x02, 0x00, 0x00, 0x41, 0x00 }, SMALL_PAYLOAD_BLOCK }),
        BPV7_CODEC_ERROR::UNSUPPORTED_BLOCK_TYPE);
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x83 }, SMALL_PRIMARY, { 0x85, 0x06, 0x02, 0x00, 0x00, 0x43, 0x82, 0x01, 0x00 }, SMALL_PAYLOAD_BLOCK }),
        BPV7_CODEC_ERROR::UNSUPPORTED_BLOCK_TYPE);

    //primary block
    {
        std::vector<uint8_t> badVersion = ConcatBundleBytes({ { 0x82, 0x88, 0x19, 0x05, 0x39 },
            std::vector<uint8_t>(SMALL_PRIMARY.begin() + 2, SMALL_PRIMARY.end()), SMALL_PAYLOAD_BLOCK });
        CheckBundleDecodeFails(badVersion, BPV7_CODEC_ERROR::UNSUPPORTED_VERSION);
        std::vector<uint8_t> crc = ConcatBundleBytes({ { 0x82 }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK });
        crc[4] = 0x02;
        CheckBundleDecodeFails(crc, BPV7_CODEC_ERROR::UNSUPPORTED_CRC);
        std::vector<uint8_t> fragment = ConcatBundleBytes({ { 0x82 }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK });
        fragment[3] = 0x01;
        CheckBundleDecodeFails(fragment, BPV7_CODEC_ERROR::FRAGMENTATION_UNSUPPORTED);
    }

    //outer structure
    CheckBundleDecodeFails({}, BPV7_CODEC_ERROR::MALFORMED_BUNDLE);
    CheckBundleDecodeFails({ 0x01 }, BPV7_CODEC_ERROR::MALFORMED_BUNDLE);
    CheckBundleDecodeFails({ 0xa2, 0x01, 0x02, 0x03, 0x04 }, BPV7_CODEC_ERROR::MALFORMED_BUNDLE); //map
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x82 }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK, { 0x00 } }), BPV7_CODEC_ERROR::MALFORMED_BUNDLE); //trailing byte
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x9f }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK, { 0xff, 0xff } }), BPV7_CODEC_ERROR::MALFORMED_BUNDLE);
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x9f }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK }), BPV7_CODEC_ERROR::MALFORMED_BUNDLE); //no break
    CheckBundleDecodeFails(ConcatBundleBytes({ { 0x83 }, SMALL_PRIMARY, SMALL_PAYLOAD_BLOCK }), BPV7_CODEC_ERROR::MALFORMED_CANONICAL_BLOCK); //one block short

    //every truncation is a structural error
    {
        std::vector<uint8_t> serialization;
        BOOST_REQUIRE(smallBundle.SerializeBpv7(serialization));
        for (std::size_t len = 0; len < serialization.size(); ++len) {
            BOOST_TEST_CONTEXT("truncated to " << len) {
                Bpv7Bundle bundle;
                bpv7_codec_error_t error;
                BOOST_REQUIRE(!bundle.DeserializeBpv7(serialization.data(), len, error));
                BOOST_REQUIRE(error.IsStructural());
                BOOST_REQUIRE(bundle.IsEmpty());
            }
        }
    }

    //a successful decode clears a previous error
    {
        std::vector<uint8_t> serialization;
        BOOST_REQUIRE(smallBundle.SerializeBpv7(serialization));
        Bpv7Bundle bundle;
        bpv7_codec_error_t error;
        error.Set(BPV7_CODEC_ERROR::MALFORMED_BUNDLE, "stale");
        BOOST_REQUIRE(bundle.DeserializeBpv7(serialization, error));
        BOOST_REQUIRE(!error.IsError());
        BOOST_REQUIRE(error.detail.empty());
    }

    //printable
    {
        std::ostringstream oss;
        oss << smallBundle;
        BOOST_REQUIRE_EQUAL(oss.str().compare(0, 20, "bundle ipn:1.1-0-0\n "), 0);
    }
}

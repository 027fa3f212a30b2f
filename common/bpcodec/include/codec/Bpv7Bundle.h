/**
 * @file Bpv7Bundle.h
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
 * This Bpv7Bundle class owns a primary block and its canonical blocks, and
 * converts the whole bundle to and from the CBOR encoding of RFC 9171.
 * A Bpv7Bundle only holds blocks after Create(), Assemble() or
 * DeserializeBpv7() succeeded, so every non-empty Bpv7Bundle satisfies:
 *   - exactly one payload block, and no other block types
 *   - unique, nonzero block numbers
 *   - no CRCs and no fragmentation
 * The class keeps no state between calls and all functions are reentrant.
 */

#ifndef BPV7_BUNDLE_H
#define BPV7_BUNDLE_H 1

#include <cstdint>
#include <vector>
#include <string>
#include <ostream>
#include "codec/bpv7.h"
#include "DtnTimeSource.h"
#include "bp7_codec_export.h"

class CLASS_VISIBILITY_BP7_CODEC Bpv7Bundle {
public:
    BP7_CODEC_EXPORT Bpv7Bundle(); //a default constructor: X() (empty, not encodable)
    BP7_CODEC_EXPORT ~Bpv7Bundle(); //a destructor: ~X()
    BP7_CODEC_EXPORT Bpv7Bundle(const Bpv7Bundle& o); //a copy constructor: X(const X&)
    BP7_CODEC_EXPORT Bpv7Bundle(Bpv7Bundle&& o); //a move constructor: X(X&&)
    BP7_CODEC_EXPORT Bpv7Bundle& operator=(const Bpv7Bundle& o); //a copy assignment: operator=(const X&)
    BP7_CODEC_EXPORT Bpv7Bundle& operator=(Bpv7Bundle&& o); //a move assignment: operator=(X&&)
    BP7_CODEC_EXPORT bool operator==(const Bpv7Bundle & o) const; //operator ==
    BP7_CODEC_EXPORT bool operator!=(const Bpv7Bundle & o) const; //operator !=

    /**
     * Build a bundle with a single payload block (block number 1, no crc).
     * The creation time comes from timeSource, or is 0 (unknown) if timeSource has no time.
     * If reportTo is a default constructed (unknown) eid, the source is used.
     * Fails with FRAGMENTATION_UNSUPPORTED if bundleFlags has ISFRAGMENT,
     * or MALFORMED_EID if destination or source is unknown.
     * bundle is untouched on failure.
     */
    BP7_CODEC_EXPORT static bool Create(Bpv7Bundle & bundle, bpv7_codec_error_t & error,
        const bpv7_eid_t & destination, const bpv7_eid_t & source, const bpv7_eid_t & reportTo,
        const uint64_t lifetimeMilliseconds, const BPV7_BUNDLEFLAG bundleFlags, const BPV7_BLOCKFLAG payloadBlockFlags,
        std::vector<uint8_t> && payload, DtnTimeSource & timeSource, const uint64_t sequenceNumber);
    BP7_CODEC_EXPORT static bool Create(Bpv7Bundle & bundle, bpv7_codec_error_t & error,
        const bpv7_eid_t & destination, const bpv7_eid_t & source, const bpv7_eid_t & reportTo,
        const uint64_t lifetimeMilliseconds, const BPV7_BUNDLEFLAG bundleFlags, const BPV7_BLOCKFLAG payloadBlockFlags,
        const uint8_t * payload, const uint64_t payloadLength, DtnTimeSource & timeSource, const uint64_t sequenceNumber);

    //build from parts with the same checks as DeserializeBpv7, bundle is untouched on failure
    BP7_CODEC_EXPORT static bool Assemble(Bpv7Bundle & bundle, bpv7_codec_error_t & error,
        const Bpv7PrimaryBlock & primary, const std::vector<Bpv7CanonicalBlock> & canonicalBlocks);

    BP7_CODEC_EXPORT uint64_t GetSerializationSize() const;
    //return bytes written, 0 if the buffer is too small or this bundle is empty
    BP7_CODEC_EXPORT uint64_t SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const;
    //return false only if this bundle is empty
    BP7_CODEC_EXPORT bool SerializeBpv7(std::vector<uint8_t> & serialization) const;
    //the whole buffer must be exactly one bundle, this is untouched on failure
    BP7_CODEC_EXPORT bool DeserializeBpv7(const uint8_t * serialization, uint64_t bufferSize, bpv7_codec_error_t & error);
    BP7_CODEC_EXPORT bool DeserializeBpv7(const std::vector<uint8_t> & serialization, bpv7_codec_error_t & error);

    BP7_CODEC_EXPORT bool IsEmpty() const;
    BP7_CODEC_EXPORT const Bpv7PrimaryBlock & GetPrimaryBlock() const;
    BP7_CODEC_EXPORT const std::vector<Bpv7CanonicalBlock> & GetCanonicalBlocks() const;
    //the last payload block, NULL if empty
    BP7_CODEC_EXPORT const Bpv7CanonicalBlock * GetPayloadBlock() const;
    BP7_CODEC_EXPORT const std::vector<uint8_t> & GetPayload() const;
    //"<source uri>-<creation dtn time>-<sequence number>"
    BP7_CODEC_EXPORT std::string GetBundleIdString() const;

    BP7_CODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const Bpv7Bundle& o);

private:
    BP7_CODEC_NO_EXPORT static bool CheckCanonicalBlocks(const std::vector<Bpv7CanonicalBlock> & canonicalBlocks, bpv7_codec_error_t & error);
    BP7_CODEC_NO_EXPORT bool DeserializeBpv7Internal(const uint8_t * serialization, uint64_t bufferSize, bpv7_codec_error_t & error);

    Bpv7PrimaryBlock m_primaryBlock;
    std::vector<Bpv7CanonicalBlock> m_canonicalBlocks;
};

#endif //BPV7_BUNDLE_H

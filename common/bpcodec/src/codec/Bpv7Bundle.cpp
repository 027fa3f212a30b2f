/**
 * @file Bpv7Bundle.cpp
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

#include "codec/Bpv7Bundle.h"
#include "CborUint.h"
#include "Logger.h"
#include <set>
#include <boost/lexical_cast.hpp>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::codec;

Bpv7Bundle::Bpv7Bundle() { } //a default constructor: X()
Bpv7Bundle::~Bpv7Bundle() { } //a destructor: ~X()
Bpv7Bundle::Bpv7Bundle(const Bpv7Bundle& o) :
    m_primaryBlock(o.m_primaryBlock),
    m_canonicalBlocks(o.m_canonicalBlocks) { } //a copy constructor: X(const X&)
Bpv7Bundle::Bpv7Bundle(Bpv7Bundle&& o) :
    m_primaryBlock(std::move(o.m_primaryBlock)),
    m_canonicalBlocks(std::move(o.m_canonicalBlocks)) { } //a move constructor: X(X&&)
Bpv7Bundle& Bpv7Bundle::operator=(const Bpv7Bundle& o) { //a copy assignment: operator=(const X&)
    m_primaryBlock = o.m_primaryBlock;
    m_canonicalBlocks = o.m_canonicalBlocks;
    return *this;
}
Bpv7Bundle& Bpv7Bundle::operator=(Bpv7Bundle && o) { //a move assignment: operator=(X&&)
    m_primaryBlock = std::move(o.m_primaryBlock);
    m_canonicalBlocks = std::move(o.m_canonicalBlocks);
    return *this;
}
bool Bpv7Bundle::operator==(const Bpv7Bundle & o) const {
    return (m_primaryBlock == o.m_primaryBlock)
        && (m_canonicalBlocks == o.m_canonicalBlocks);
}
bool Bpv7Bundle::operator!=(const Bpv7Bundle & o) const {
    return !(*this == o);
}

bool Bpv7Bundle::Create(Bpv7Bundle & bundle, bpv7_codec_error_t & error,
    const bpv7_eid_t & destination, const bpv7_eid_t & source, const bpv7_eid_t & reportTo,
    const uint64_t lifetimeMilliseconds, const BPV7_BUNDLEFLAG bundleFlags, const BPV7_BLOCKFLAG payloadBlockFlags,
    std::vector<uint8_t> && payload, DtnTimeSource & timeSource, const uint64_t sequenceNumber)
{
    if (EnumHasAnyFlag(bundleFlags, BPV7_BUNDLEFLAG::ISFRAGMENT)) {
        error.Set(BPV7_CODEC_ERROR::FRAGMENTATION_UNSUPPORTED, "cannot create a bundle with the is-fragment flag set");
        LOG_ERROR(subprocess) << "Bpv7Bundle::Create: " << error;
        return false;
    }
    if (destination.IsUnknown() || source.IsUnknown()) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, (destination.IsUnknown()) ? "destination eid is unset" : "source node id is unset");
        LOG_ERROR(subprocess) << "Bpv7Bundle::Create: " << error;
        return false;
    }

    std::vector<Bpv7CanonicalBlock> canonicalBlocks(1);
    Bpv7CanonicalBlock & payloadBlock = canonicalBlocks[0];
    payloadBlock.m_blockTypeCode = BPV7_BLOCK_TYPE_CODE::PAYLOAD;
    payloadBlock.m_blockNumber = 1; //The block number of the payload block is always 1.
    payloadBlock.m_blockProcessingControlFlags = payloadBlockFlags;
    payloadBlock.m_crcType = BPV7_CRC_TYPE::NONE;
    payloadBlock.m_data = std::move(payload);

    Bpv7PrimaryBlock primary;
    primary.m_bundleProcessingControlFlags = bundleFlags;
    primary.m_destinationEid = destination;
    primary.m_sourceNodeId = source;
    primary.m_reportToEid = (reportTo.IsUnknown()) ? source : reportTo;
    uint64_t creationTime;
    if (!timeSource.GetDtnTimeMilliseconds(creationTime)) {
        creationTime = TimestampUtil::DTN_TIME_UNKNOWN;
    }
    primary.m_creationTimestamp.creationTimeMilliseconds = creationTime;
    primary.m_creationTimestamp.sequenceNumber = sequenceNumber;
    primary.m_lifetimeMilliseconds = lifetimeMilliseconds;
    primary.m_crcType = BPV7_CRC_TYPE::NONE;

    return Assemble(bundle, error, primary, canonicalBlocks);
}

bool Bpv7Bundle::Create(Bpv7Bundle & bundle, bpv7_codec_error_t & error,
    const bpv7_eid_t & destination, const bpv7_eid_t & source, const bpv7_eid_t & reportTo,
    const uint64_t lifetimeMilliseconds, const BPV7_BUNDLEFLAG bundleFlags, const BPV7_BLOCKFLAG payloadBlockFlags,
    const uint8_t * payload, const uint64_t payloadLength, DtnTimeSource & timeSource, const uint64_t sequenceNumber)
{
    std::vector<uint8_t> payloadCopy(payload, payload + payloadLength);
    return Create(bundle, error, destination, source, reportTo, lifetimeMilliseconds, bundleFlags, payloadBlockFlags,
        std::move(payloadCopy), timeSource, sequenceNumber);
}

bool Bpv7Bundle::Assemble(Bpv7Bundle & bundle, bpv7_codec_error_t & error,
    const Bpv7PrimaryBlock & primary, const std::vector<Bpv7CanonicalBlock> & canonicalBlocks)
{
    if ((!primary.Validate(error)) || (!CheckCanonicalBlocks(canonicalBlocks, error))) {
        LOG_ERROR(subprocess) << "Bpv7Bundle::Assemble: " << error;
        return false;
    }
    bundle.m_primaryBlock = primary;
    bundle.m_canonicalBlocks = canonicalBlocks;
    return true;
}

bool Bpv7Bundle::CheckCanonicalBlocks(const std::vector<Bpv7CanonicalBlock> & canonicalBlocks, bpv7_codec_error_t & error) {
    if (canonicalBlocks.empty()) {
        error.Set(BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK, "bundle has no canonical blocks");
        return false;
    }
    std::set<uint64_t> blockNumbersInUse;
    std::size_t payloadBlockCount = 0;
    for (std::size_t i = 0; i < canonicalBlocks.size(); ++i) {
        const Bpv7CanonicalBlock & block = canonicalBlocks[i];
        if (!block.Validate(error)) {
            return false;
        }
        if (!blockNumbersInUse.insert(block.m_blockNumber).second) {
            error.Set(BPV7_CODEC_ERROR::INVARIANT_VIOLATION, "duplicate block number " + boost::lexical_cast<std::string>(block.m_blockNumber));
            return false;
        }
        payloadBlockCount += (block.m_blockTypeCode == BPV7_BLOCK_TYPE_CODE::PAYLOAD);
    }
    if (payloadBlockCount != 1) {
        error.Set(BPV7_CODEC_ERROR::INVARIANT_VIOLATION, "bundle must have exactly one payload block but has " + boost::lexical_cast<std::string>(payloadBlockCount));
        return false;
    }
    return true;
}

bool Bpv7Bundle::IsEmpty() const {
    return m_canonicalBlocks.empty();
}

uint64_t Bpv7Bundle::GetSerializationSize() const {
    if (IsEmpty()) {
        return 0;
    }
    uint64_t serializationSize = CborGetEncodingSizeU64(1 + m_canonicalBlocks.size()); //outer array head
    serializationSize += m_primaryBlock.GetSerializationSize();
    for (std::size_t i = 0; i < m_canonicalBlocks.size(); ++i) {
        serializationSize += m_canonicalBlocks[i].GetSerializationSize();
    }
    return serializationSize;
}

//4.1 Bundle Structure
//Each bundle SHALL be a concatenated sequence of at least two blocks,
//represented as a CBOR indefinite-length array.
//An implementation of the Bundle Protocol MAY accept a sequence of
//bytes that does not conform to the Bundle Protocol specification
//(e.g., one that represents data elements in fixed-length arrays
//rather than indefinite-length arrays) and transform it into
//conformant BP structure before processing it.
//(always encoded here as a definite length array with minimal width integers)
uint64_t Bpv7Bundle::SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const {
    if (IsEmpty() || (bufferSize < GetSerializationSize())) {
        return 0;
    }
    uint8_t * const serializationBase = serialization;
    serialization += CborEncodeHead(serialization, CBOR_MAJOR_TYPE::ARRAY, 1 + m_canonicalBlocks.size(), bufferSize);
    serialization += m_primaryBlock.SerializeBpv7(serialization, bufferSize - (serialization - serializationBase));
    for (std::size_t i = 0; i < m_canonicalBlocks.size(); ++i) {
        serialization += m_canonicalBlocks[i].SerializeBpv7(serialization, bufferSize - (serialization - serializationBase));
    }
    return serialization - serializationBase;
}

bool Bpv7Bundle::SerializeBpv7(std::vector<uint8_t> & serialization) const {
    const uint64_t serializationSize = GetSerializationSize();
    if (serializationSize == 0) {
        serialization.clear();
        return false;
    }
    serialization.resize(serializationSize);
    return (SerializeBpv7(serialization.data(), serialization.size()) == serializationSize);
}

bool Bpv7Bundle::DeserializeBpv7(const uint8_t * serialization, uint64_t bufferSize, bpv7_codec_error_t & error) {
    error.Clear();
    if (!DeserializeBpv7Internal(serialization, bufferSize, error)) {
        LOG_DEBUG(subprocess) << "bundle of " << bufferSize << " bytes rejected: " << error;
        return false;
    }
    return true;
}

bool Bpv7Bundle::DeserializeBpv7(const std::vector<uint8_t> & serialization, bpv7_codec_error_t & error) {
    return DeserializeBpv7(serialization.data(), serialization.size(), error);
}

bool Bpv7Bundle::DeserializeBpv7Internal(const uint8_t * serialization, uint64_t bufferSize, bpv7_codec_error_t & error) {
    uint8_t cborSizeDecoded;
    bool isIndefiniteLength;

    const uint64_t cborArraySize = CborDecodeArrayHeader(serialization, &cborSizeDecoded, bufferSize, isIndefiniteLength);
    if (cborSizeDecoded == 0) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_BUNDLE, "bundle is not a cbor array");
        return false;
    }
    if ((!isIndefiniteLength) && (cborArraySize < 2)) {
        error.Set(BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK, "bundle array has " + boost::lexical_cast<std::string>(cborArraySize) + " items");
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;

    if (isIndefiniteLength && (bufferSize != 0) && (*serialization == CBOR_BREAK_STOP_CODE)) {
        error.Set(BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK, "bundle array has 0 items");
        return false;
    }

    Bpv7PrimaryBlock primary;
    uint64_t blockSize;
    if (!primary.DeserializeBpv7(serialization, blockSize, bufferSize, error)) {
        return false;
    }
    serialization += blockSize;
    bufferSize -= blockSize;

    std::vector<Bpv7CanonicalBlock> canonicalBlocks;
    for (uint64_t blockIndex = 1; isIndefiniteLength || (blockIndex < cborArraySize); ++blockIndex) {
        if (isIndefiniteLength) {
            if (bufferSize == 0) {
                error.Set(BPV7_CODEC_ERROR::MALFORMED_BUNDLE, "indefinite length bundle array has no break stop code");
                return false;
            }
            if (*serialization == CBOR_BREAK_STOP_CODE) {
                ++serialization;
                --bufferSize;
                break;
            }
        }
        canonicalBlocks.emplace_back();
        if (!canonicalBlocks.back().DeserializeBpv7(serialization, blockSize, bufferSize, error)) {
            return false;
        }
        serialization += blockSize;
        bufferSize -= blockSize;
    }
    if (canonicalBlocks.empty()) {
        error.Set(BPV7_CODEC_ERROR::MISSING_PAYLOAD_BLOCK, "bundle array has only a primary block");
        return false;
    }
    if (bufferSize != 0) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_BUNDLE, boost::lexical_cast<std::string>(bufferSize) + " trailing bytes after the bundle");
        return false;
    }
    if (!CheckCanonicalBlocks(canonicalBlocks, error)) {
        return false;
    }

    m_primaryBlock = std::move(primary);
    m_canonicalBlocks = std::move(canonicalBlocks);
    return true;
}

const Bpv7PrimaryBlock & Bpv7Bundle::GetPrimaryBlock() const {
    return m_primaryBlock;
}

const std::vector<Bpv7CanonicalBlock> & Bpv7Bundle::GetCanonicalBlocks() const {
    return m_canonicalBlocks;
}

const Bpv7CanonicalBlock * Bpv7Bundle::GetPayloadBlock() const {
    for (std::vector<Bpv7CanonicalBlock>::const_reverse_iterator it = m_canonicalBlocks.crbegin(); it != m_canonicalBlocks.crend(); ++it) {
        if (it->m_blockTypeCode == BPV7_BLOCK_TYPE_CODE::PAYLOAD) {
            return &(*it);
        }
    }
    return NULL;
}

const std::vector<uint8_t> & Bpv7Bundle::GetPayload() const {
    static const std::vector<uint8_t> EMPTY_PAYLOAD;
    const Bpv7CanonicalBlock * const payloadBlock = GetPayloadBlock();
    return (payloadBlock) ? payloadBlock->m_data : EMPTY_PAYLOAD;
}

std::string Bpv7Bundle::GetBundleIdString() const {
    return m_primaryBlock.m_sourceNodeId.ToUri()
        + "-" + boost::lexical_cast<std::string>(m_primaryBlock.m_creationTimestamp.creationTimeMilliseconds)
        + "-" + boost::lexical_cast<std::string>(m_primaryBlock.m_creationTimestamp.sequenceNumber);
}

std::ostream& operator<<(std::ostream& os, const Bpv7Bundle& o) {
    if (o.IsEmpty()) {
        os << "empty bundle";
        return os;
    }
    os << "bundle " << o.GetBundleIdString() << "\n  " << o.m_primaryBlock;
    for (std::size_t i = 0; i < o.m_canonicalBlocks.size(); ++i) {
        os << "\n  " << o.m_canonicalBlocks[i];
    }
    return os;
}

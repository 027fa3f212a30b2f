/***************************************************************************
 * NASA Glenn Research Center, Cleveland, OH
 * Released under the NASA Open Source Agreement (NOSA)
 * May  2021
 *
 ****************************************************************************
 */
#include "codec/bpv7.h"
#include "CborUint.h"
#include <boost/lexical_cast.hpp>

constexpr uint64_t Bpv7PrimaryBlock::BPV7_VERSION;

Bpv7PrimaryBlock::Bpv7PrimaryBlock() :
    m_bundleProcessingControlFlags(BPV7_BUNDLEFLAG::NO_FLAGS_SET),
    m_lifetimeMilliseconds(0),
    m_fragmentOffset(0),
    m_totalApplicationDataUnitLength(0),
    m_crcType(BPV7_CRC_TYPE::NONE) { } //a default constructor: X()
Bpv7PrimaryBlock::~Bpv7PrimaryBlock() { } //a destructor: ~X()
Bpv7PrimaryBlock::Bpv7PrimaryBlock(const Bpv7PrimaryBlock& o) :
    m_bundleProcessingControlFlags(o.m_bundleProcessingControlFlags),
    m_destinationEid(o.m_destinationEid),
    m_sourceNodeId(o.m_sourceNodeId),
    m_reportToEid(o.m_reportToEid),
    m_creationTimestamp(o.m_creationTimestamp),
    m_lifetimeMilliseconds(o.m_lifetimeMilliseconds),
    m_fragmentOffset(o.m_fragmentOffset),
    m_totalApplicationDataUnitLength(o.m_totalApplicationDataUnitLength),
    m_crcType(o.m_crcType) { } //a copy constructor: X(const X&)
Bpv7PrimaryBlock::Bpv7PrimaryBlock(Bpv7PrimaryBlock&& o) :
    m_bundleProcessingControlFlags(o.m_bundleProcessingControlFlags),
    m_destinationEid(std::move(o.m_destinationEid)),
    m_sourceNodeId(std::move(o.m_sourceNodeId)),
    m_reportToEid(std::move(o.m_reportToEid)),
    m_creationTimestamp(std::move(o.m_creationTimestamp)),
    m_lifetimeMilliseconds(o.m_lifetimeMilliseconds),
    m_fragmentOffset(o.m_fragmentOffset),
    m_totalApplicationDataUnitLength(o.m_totalApplicationDataUnitLength),
    m_crcType(o.m_crcType) { } //a move constructor: X(X&&)
Bpv7PrimaryBlock& Bpv7PrimaryBlock::operator=(const Bpv7PrimaryBlock& o) { //a copy assignment: operator=(const X&)
    m_bundleProcessingControlFlags = o.m_bundleProcessingControlFlags;
    m_destinationEid = o.m_destinationEid;
    m_sourceNodeId = o.m_sourceNodeId;
    m_reportToEid = o.m_reportToEid;
    m_creationTimestamp = o.m_creationTimestamp;
    m_lifetimeMilliseconds = o.m_lifetimeMilliseconds;
    m_fragmentOffset = o.m_fragmentOffset;
    m_totalApplicationDataUnitLength = o.m_totalApplicationDataUnitLength;
    m_crcType = o.m_crcType;
    return *this;
}
Bpv7PrimaryBlock& Bpv7PrimaryBlock::operator=(Bpv7PrimaryBlock && o) { //a move assignment: operator=(X&&)
    m_bundleProcessingControlFlags = o.m_bundleProcessingControlFlags;
    m_destinationEid = std::move(o.m_destinationEid);
    m_sourceNodeId = std::move(o.m_sourceNodeId);
    m_reportToEid = std::move(o.m_reportToEid);
    m_creationTimestamp = std::move(o.m_creationTimestamp);
    m_lifetimeMilliseconds = o.m_lifetimeMilliseconds;
    m_fragmentOffset = o.m_fragmentOffset;
    m_totalApplicationDataUnitLength = o.m_totalApplicationDataUnitLength;
    m_crcType = o.m_crcType;
    return *this;
}
bool Bpv7PrimaryBlock::operator==(const Bpv7PrimaryBlock & o) const {
    return (m_bundleProcessingControlFlags == o.m_bundleProcessingControlFlags)
        && (m_destinationEid == o.m_destinationEid)
        && (m_sourceNodeId == o.m_sourceNodeId)
        && (m_reportToEid == o.m_reportToEid)
        && (m_creationTimestamp == o.m_creationTimestamp)
        && (m_lifetimeMilliseconds == o.m_lifetimeMilliseconds)
        && (m_fragmentOffset == o.m_fragmentOffset)
        && (m_totalApplicationDataUnitLength == o.m_totalApplicationDataUnitLength)
        && (m_crcType == o.m_crcType);
}
bool Bpv7PrimaryBlock::operator!=(const Bpv7PrimaryBlock & o) const {
    return !(*this == o);
}
void Bpv7PrimaryBlock::SetZero() {
    m_bundleProcessingControlFlags = BPV7_BUNDLEFLAG::NO_FLAGS_SET;
    m_destinationEid = bpv7_eid_t();
    m_sourceNodeId = bpv7_eid_t();
    m_reportToEid = bpv7_eid_t();
    m_creationTimestamp.SetZero();
    m_lifetimeMilliseconds = 0;
    m_fragmentOffset = 0;
    m_totalApplicationDataUnitLength = 0;
    m_crcType = BPV7_CRC_TYPE::NONE;
}

bool Bpv7PrimaryBlock::HasBundleFlag(const BPV7_BUNDLEFLAG flag) const {
    return EnumHasAnyFlag(m_bundleProcessingControlFlags, flag);
}
bool Bpv7PrimaryBlock::IsFragment() const {
    return HasBundleFlag(BPV7_BUNDLEFLAG::ISFRAGMENT);
}
bool Bpv7PrimaryBlock::IsAdminRecord() const {
    return HasBundleFlag(BPV7_BUNDLEFLAG::ADMINRECORD);
}
//saturates at UINT64_MAX
uint64_t Bpv7PrimaryBlock::GetExpirationMilliseconds() const {
    const uint64_t creation = m_creationTimestamp.creationTimeMilliseconds;
    if (m_lifetimeMilliseconds > (UINT64_MAX - creation)) {
        return UINT64_MAX;
    }
    return creation + m_lifetimeMilliseconds;
}
boost::posix_time::ptime Bpv7PrimaryBlock::GetExpirationPtime() const {
    return TimestampUtil::DtnTimeToPtime(GetExpirationMilliseconds());
}

bool Bpv7PrimaryBlock::Validate(bpv7_codec_error_t & error) const {
    if (m_crcType != BPV7_CRC_TYPE::NONE) {
        error.Set(BPV7_CODEC_ERROR::UNSUPPORTED_CRC, "primary block crc type " + boost::lexical_cast<std::string>(static_cast<unsigned int>(m_crcType)));
        return false;
    }
    if (IsFragment()) {
        error.Set(BPV7_CODEC_ERROR::FRAGMENTATION_UNSUPPORTED, "primary block has the is-fragment flag set");
        return false;
    }
    if (m_destinationEid.IsUnknown()) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "destination eid is unset");
        return false;
    }
    if (m_sourceNodeId.IsUnknown()) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "source node id is unset");
        return false;
    }
    if (m_reportToEid.IsUnknown()) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_EID, "report-to eid is unset");
        return false;
    }
    return true;
}

uint64_t Bpv7PrimaryBlock::SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const {
    uint8_t * const serializationBase = serialization;
    if (bufferSize < GetSerializationSize()) {
        return 0;
    }

    //Each primary block SHALL be represented as a CBOR array; the number
    //of elements in the array SHALL be 8 (if the bundle is not a fragment
    //and the block has no CRC), 9 (if the block has a CRC and the bundle
    //is not a fragment), 10 (if the bundle is a fragment and the block
    //has no CRC), or 11 (if the bundle is a fragment and the block has a
    //CRC).
    //(a crc is never written, see Validate)
    const bool isFragment = IsFragment();
    *serialization++ = (4U << 5) | (isFragment ? 10U : 8U); //major type 4, additional information [8,10]

    //Version: An unsigned integer value indicating the version of the
    //bundle protocol that constructed this block.
    //(cbor uint's < 24 are the value itself)
    *serialization++ = static_cast<uint8_t>(BPV7_VERSION);

    //Bundle Processing Control Flags
    serialization += CborEncodeU64BufSize9(serialization, static_cast<uint64_t>(m_bundleProcessingControlFlags));

    //CRC Type
    *serialization++ = static_cast<uint8_t>(m_crcType);

    //Destination EID, Source node ID, Report-to EID
    //(all three have been size checked by GetSerializationSize)
    uint64_t eidSize = m_destinationEid.SerializeBpv7(serialization, bufferSize - (serialization - serializationBase));
    if (eidSize == 0) {
        return 0;
    }
    serialization += eidSize;
    eidSize = m_sourceNodeId.SerializeBpv7(serialization, bufferSize - (serialization - serializationBase));
    if (eidSize == 0) {
        return 0;
    }
    serialization += eidSize;
    eidSize = m_reportToEid.SerializeBpv7(serialization, bufferSize - (serialization - serializationBase));
    if (eidSize == 0) {
        return 0;
    }
    serialization += eidSize;

    //Creation Timestamp
    serialization += m_creationTimestamp.SerializeBpv7(serialization, bufferSize - (serialization - serializationBase));

    //Lifetime: milliseconds past the creation time
    serialization += CborEncodeU64BufSize9(serialization, m_lifetimeMilliseconds);

    if (isFragment) {
        //Fragment offset, then Total Application Data Unit Length
        serialization += CborEncodeU64BufSize9(serialization, m_fragmentOffset);
        serialization += CborEncodeU64BufSize9(serialization, m_totalApplicationDataUnitLength);
    }
    return serialization - serializationBase;
}

uint64_t Bpv7PrimaryBlock::GetSerializationSize() const {
    uint64_t serializationSize = 3; //cbor byte (major type 4, additional information [8,10]) + version7 + crcType
    serializationSize += CborGetEncodingSizeU64(static_cast<uint64_t>(m_bundleProcessingControlFlags));
    serializationSize += m_destinationEid.GetSerializationSizeBpv7();
    serializationSize += m_sourceNodeId.GetSerializationSizeBpv7();
    serializationSize += m_reportToEid.GetSerializationSizeBpv7();
    serializationSize += m_creationTimestamp.GetSerializationSize();
    serializationSize += CborGetEncodingSizeU64(m_lifetimeMilliseconds);
    if (IsFragment()) {
        serializationSize += CborGetEncodingSizeU64(m_fragmentOffset);
        serializationSize += CborGetEncodingSizeU64(m_totalApplicationDataUnitLength);
    }
    return serializationSize;
}

bool Bpv7PrimaryBlock::DeserializeBpv7(const uint8_t * serialization, uint64_t & numBytesTakenToDecode, uint64_t bufferSize, bpv7_codec_error_t & error) {
    const uint8_t * const serializationBase = serialization;
    uint8_t cborSizeDecoded;
    bool isIndefiniteLength;

    const uint64_t cborArraySize = CborDecodeArrayHeader(serialization, &cborSizeDecoded, bufferSize, isIndefiniteLength);
    if ((cborSizeDecoded == 0) || isIndefiniteLength) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_PRIMARY_BLOCK, "primary block is not a definite length array");
        return false;
    }
    //8 or 10 (no crc support, so 9 and 11 are not accepted)
    if ((cborArraySize != 8) && (cborArraySize != 10)) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_PRIMARY_BLOCK, "primary block array length " + boost::lexical_cast<std::string>(cborArraySize));
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;

    //Version
    const uint64_t bpVersion = CborDecodeU64(serialization, &cborSizeDecoded, bufferSize);
    if (cborSizeDecoded == 0) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_PRIMARY_BLOCK, "version is not an unsigned integer");
        return false;
    }
    if (bpVersion != BPV7_VERSION) {
        error.Set(BPV7_CODEC_ERROR::UNSUPPORTED_VERSION, "bundle protocol version " + boost::lexical_cast<std::string>(bpVersion));
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;

    //Bundle Processing Control Flags (unknown bits are kept)
    const uint64_t flags = CborDecodeU64(serialization, &cborSizeDecoded, bufferSize);
    if (cborSizeDecoded == 0) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_PRIMARY_BLOCK, "bundle processing control flags is not an unsigned integer");
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;
    const BPV7_BUNDLEFLAG bundleFlags = static_cast<BPV7_BUNDLEFLAG>(flags);

    //CRC Type
    const uint64_t crcType = CborDecodeU64(serialization, &cborSizeDecoded, bufferSize);
    if (cborSizeDecoded == 0) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_PRIMARY_BLOCK, "crc type is not an unsigned integer");
        return false;
    }
    if (crcType != static_cast<uint64_t>(BPV7_CRC_TYPE::NONE)) {
        error.Set(BPV7_CODEC_ERROR::UNSUPPORTED_CRC, "primary block crc type " + boost::lexical_cast<std::string>(crcType));
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;

    if (EnumHasAnyFlag(bundleFlags, BPV7_BUNDLEFLAG::ISFRAGMENT)) {
        error.Set(BPV7_CODEC_ERROR::FRAGMENTATION_UNSUPPORTED, "primary block has the is-fragment flag set");
        return false;
    }
    if (cborArraySize == 10) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_PRIMARY_BLOCK, "primary block array length 10 without the is-fragment flag");
        return false;
    }

    //Destination EID, Source node ID, Report-to EID
    bpv7_eid_t eids[3];
    static const char * const EID_FIELD_NAMES[3] = { "destination eid: ", "source node id: ", "report-to eid: " };
    for (unsigned int i = 0; i < 3; ++i) {
        uint64_t eidSize;
        if (!eids[i].DeserializeBpv7(serialization, eidSize, bufferSize, error)) {
            error.detail.insert(0, EID_FIELD_NAMES[i]);
            return false;
        }
        serialization += eidSize;
        bufferSize -= eidSize;
    }

    //Creation Timestamp
    TimestampUtil::bpv7_creation_timestamp_t creationTimestamp;
    if (!creationTimestamp.DeserializeBpv7(serialization, &cborSizeDecoded, bufferSize)) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_TIMESTAMP, "creation timestamp is not an array of two unsigned integers");
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;

    //Lifetime
    const uint64_t lifetimeMilliseconds = CborDecodeU64(serialization, &cborSizeDecoded, bufferSize);
    if (cborSizeDecoded == 0) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_PRIMARY_BLOCK, "lifetime is not an unsigned integer");
        return false;
    }
    serialization += cborSizeDecoded;

    m_bundleProcessingControlFlags = bundleFlags;
    m_destinationEid = std::move(eids[0]);
    m_sourceNodeId = std::move(eids[1]);
    m_reportToEid = std::move(eids[2]);
    m_creationTimestamp = creationTimestamp;
    m_lifetimeMilliseconds = lifetimeMilliseconds;
    m_fragmentOffset = 0;
    m_totalApplicationDataUnitLength = 0;
    m_crcType = BPV7_CRC_TYPE::NONE;
    numBytesTakenToDecode = serialization - serializationBase;
    return true;
}

std::ostream& operator<<(std::ostream& os, const Bpv7PrimaryBlock& o) {
    os << "primary block: flags=" << o.m_bundleProcessingControlFlags
        << " destination=" << o.m_destinationEid
        << " source=" << o.m_sourceNodeId
        << " reportTo=" << o.m_reportToEid
        << " creationTimestamp=[" << o.m_creationTimestamp.creationTimeMilliseconds << ", " << o.m_creationTimestamp.sequenceNumber << "]"
        << " lifetimeMs=" << o.m_lifetimeMilliseconds
        << " crcType=" << o.m_crcType;
    return os;
}

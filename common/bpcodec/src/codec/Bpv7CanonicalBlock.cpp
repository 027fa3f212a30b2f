/***************************************************************************
 * NASA Glenn Research Center, Cleveland, OH
 * Released under the NASA Open Source Agreement (NOSA)
 * May  2021
 *
 ****************************************************************************
 */
#include "codec/bpv7.h"
#include "CborUint.h"
#include <cstring>
#include <boost/lexical_cast.hpp>

Bpv7CanonicalBlock::Bpv7CanonicalBlock() :
    m_blockNumber(0),
    m_blockProcessingControlFlags(BPV7_BLOCKFLAG::NO_FLAGS_SET),
    m_blockTypeCode(BPV7_BLOCK_TYPE_CODE::PAYLOAD),
    m_crcType(BPV7_CRC_TYPE::NONE) { } //a default constructor: X()
Bpv7CanonicalBlock::~Bpv7CanonicalBlock() { } //a destructor: ~X()
Bpv7CanonicalBlock::Bpv7CanonicalBlock(const Bpv7CanonicalBlock& o) :
    m_data(o.m_data),
    m_blockNumber(o.m_blockNumber),
    m_blockProcessingControlFlags(o.m_blockProcessingControlFlags),
    m_blockTypeCode(o.m_blockTypeCode),
    m_crcType(o.m_crcType) { } //a copy constructor: X(const X&)
Bpv7CanonicalBlock::Bpv7CanonicalBlock(Bpv7CanonicalBlock&& o) :
    m_data(std::move(o.m_data)),
    m_blockNumber(o.m_blockNumber),
    m_blockProcessingControlFlags(o.m_blockProcessingControlFlags),
    m_blockTypeCode(o.m_blockTypeCode),
    m_crcType(o.m_crcType) { } //a move constructor: X(X&&)
Bpv7CanonicalBlock& Bpv7CanonicalBlock::operator=(const Bpv7CanonicalBlock& o) { //a copy assignment: operator=(const X&)
    m_data = o.m_data;
    m_blockNumber = o.m_blockNumber;
    m_blockProcessingControlFlags = o.m_blockProcessingControlFlags;
    m_blockTypeCode = o.m_blockTypeCode;
    m_crcType = o.m_crcType;
    return *this;
}
Bpv7CanonicalBlock& Bpv7CanonicalBlock::operator=(Bpv7CanonicalBlock && o) { //a move assignment: operator=(X&&)
    m_data = std::move(o.m_data);
    m_blockNumber = o.m_blockNumber;
    m_blockProcessingControlFlags = o.m_blockProcessingControlFlags;
    m_blockTypeCode = o.m_blockTypeCode;
    m_crcType = o.m_crcType;
    return *this;
}
bool Bpv7CanonicalBlock::operator==(const Bpv7CanonicalBlock & o) const {
    return (m_blockNumber == o.m_blockNumber)
        && (m_blockProcessingControlFlags == o.m_blockProcessingControlFlags)
        && (m_blockTypeCode == o.m_blockTypeCode)
        && (m_crcType == o.m_crcType)
        && (m_data == o.m_data);
}
bool Bpv7CanonicalBlock::operator!=(const Bpv7CanonicalBlock & o) const {
    return !(*this == o);
}
void Bpv7CanonicalBlock::SetZero() {
    m_data.clear();
    m_blockNumber = 0;
    m_blockProcessingControlFlags = BPV7_BLOCKFLAG::NO_FLAGS_SET;
    m_blockTypeCode = BPV7_BLOCK_TYPE_CODE::PRIMARY_IMPLICIT_ZERO;
    m_crcType = BPV7_CRC_TYPE::NONE;
}

bool Bpv7CanonicalBlock::HasBlockFlag(const BPV7_BLOCKFLAG flag) const {
    return EnumHasAnyFlag(m_blockProcessingControlFlags, flag);
}

bool Bpv7CanonicalBlock::Validate(bpv7_codec_error_t & error) const {
    if (m_blockTypeCode != BPV7_BLOCK_TYPE_CODE::PAYLOAD) {
        error.Set(BPV7_CODEC_ERROR::UNSUPPORTED_BLOCK_TYPE, "block type " + boost::lexical_cast<std::string>(static_cast<unsigned int>(m_blockTypeCode)));
        return false;
    }
    if (m_crcType != BPV7_CRC_TYPE::NONE) {
        error.Set(BPV7_CODEC_ERROR::UNSUPPORTED_CRC, "canonical block crc type " + boost::lexical_cast<std::string>(static_cast<unsigned int>(m_crcType)));
        return false;
    }
    if (m_blockNumber == 0) {
        //block number 0 is the implicit number of the primary block
        error.Set(BPV7_CODEC_ERROR::INVALID_BLOCK_NUMBER, "canonical block number 0");
        return false;
    }
    return true;
}

uint64_t Bpv7CanonicalBlock::SerializeBpv7(uint8_t * serialization, uint64_t bufferSize) const {
    uint8_t * const serializationBase = serialization;
    if (bufferSize < GetSerializationSize()) {
        return 0;
    }

    //Every block other than the primary block (all such blocks are termed
    //"canonical" blocks) SHALL be represented as a CBOR array; the number
    //of elements in the array SHALL be 5 (if CRC type is zero) or 6
    //(otherwise).
    //(a crc is never written, see Validate)
    *serialization++ = (4U << 5) | 5U; //major type 4, additional information 5

    //Block type code (cbor uint's < 24 are the value itself, but private use codes go up to 255)
    serialization += CborEncodeU64BufSize9(serialization, static_cast<uint64_t>(m_blockTypeCode));

    //Block number, an unsigned integer as discussed in 4.1 above.
    serialization += CborEncodeU64BufSize9(serialization, m_blockNumber);

    //Block processing control flags as discussed in Section 4.2.4 above.
    serialization += CborEncodeU64BufSize9(serialization, static_cast<uint64_t>(m_blockProcessingControlFlags));

    //CRC type as discussed in Section 4.2.1 above.
    *serialization++ = static_cast<uint8_t>(m_crcType);

    //Block-type-specific data represented as a single definite-length
    //CBOR byte string, i.e., a CBOR byte string that is not of
    //indefinite length.
    serialization += CborEncodeHead(serialization, CBOR_MAJOR_TYPE::BYTE_STRING, m_data.size(), 9);
    if (!m_data.empty()) {
        memcpy(serialization, m_data.data(), m_data.size());
        serialization += m_data.size();
    }
    return serialization - serializationBase;
}

uint64_t Bpv7CanonicalBlock::GetSerializationSize() const {
    uint64_t serializationSize = 2; //cbor byte (major type 4, additional information 5) + crcType
    serializationSize += CborGetEncodingSizeU64(static_cast<uint64_t>(m_blockTypeCode));
    serializationSize += CborGetEncodingSizeU64(m_blockNumber);
    serializationSize += CborGetEncodingSizeU64(static_cast<uint64_t>(m_blockProcessingControlFlags));
    serializationSize += CborGetEncodingSizeU64(m_data.size());
    serializationSize += m_data.size();
    return serializationSize;
}

bool Bpv7CanonicalBlock::DeserializeBpv7(const uint8_t * serialization, uint64_t & numBytesTakenToDecode, uint64_t bufferSize, bpv7_codec_error_t & error) {
    const uint8_t * const serializationBase = serialization;
    uint8_t cborSizeDecoded;
    bool isIndefiniteLength;

    //structure first, then semantics (crc type is refused as soon as it is read)
    const uint64_t cborArraySize = CborDecodeArrayHeader(serialization, &cborSizeDecoded, bufferSize, isIndefiniteLength);
    if ((cborSizeDecoded == 0) || isIndefiniteLength) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_CANONICAL_BLOCK, "canonical block is not a definite length array");
        return false;
    }
    if ((cborArraySize != 5) && (cborArraySize != 6)) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_CANONICAL_BLOCK, "canonical block array length " + boost::lexical_cast<std::string>(cborArraySize));
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;

    //block type code, block number, block processing control flags, crc type
    static const char * const UINT_FIELD_NAMES[4] = { "block type code", "block number", "block processing control flags", "crc type" };
    uint64_t uintFields[4];
    for (unsigned int i = 0; i < 4; ++i) {
        uintFields[i] = CborDecodeU64(serialization, &cborSizeDecoded, bufferSize);
        if (cborSizeDecoded == 0) {
            error.Set(BPV7_CODEC_ERROR::MALFORMED_CANONICAL_BLOCK, std::string(UINT_FIELD_NAMES[i]) + " is not an unsigned integer");
            return false;
        }
        serialization += cborSizeDecoded;
        bufferSize -= cborSizeDecoded;
    }
    const uint64_t blockTypeCode = uintFields[0];
    const uint64_t blockNumber = uintFields[1];
    const uint64_t blockFlags = uintFields[2];
    const uint64_t crcType = uintFields[3];
    //no crc support, so any crc type is refused whether or not the crc field is present
    if (crcType != static_cast<uint64_t>(BPV7_CRC_TYPE::NONE)) {
        error.Set(BPV7_CODEC_ERROR::UNSUPPORTED_CRC, "canonical block crc type " + boost::lexical_cast<std::string>(crcType));
        return false;
    }
    if (cborArraySize == 6) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_CANONICAL_BLOCK, "crc field present with crc type 0");
        return false;
    }

    //Block-type-specific data
    const uint64_t dataLength = CborDecodeHead(serialization, CBOR_MAJOR_TYPE::BYTE_STRING, &cborSizeDecoded, bufferSize);
    if (cborSizeDecoded == 0) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_CANONICAL_BLOCK, "block-type-specific data is not a definite length byte string");
        return false;
    }
    serialization += cborSizeDecoded;
    bufferSize -= cborSizeDecoded;
    if (dataLength > bufferSize) {
        error.Set(BPV7_CODEC_ERROR::MALFORMED_CANONICAL_BLOCK, "block-type-specific data truncated");
        return false;
    }
    const uint8_t * const dataPtr = serialization;
    serialization += dataLength;
    bufferSize -= dataLength;

    //semantics
    if (blockTypeCode != static_cast<uint64_t>(BPV7_BLOCK_TYPE_CODE::PAYLOAD)) {
        error.Set(BPV7_CODEC_ERROR::UNSUPPORTED_BLOCK_TYPE, "block type " + boost::lexical_cast<std::string>(blockTypeCode));
        return false;
    }
    if (blockNumber == 0) {
        error.Set(BPV7_CODEC_ERROR::INVALID_BLOCK_NUMBER, "canonical block number 0");
        return false;
    }

    m_data.assign(dataPtr, dataPtr + dataLength);
    m_blockNumber = blockNumber;
    m_blockProcessingControlFlags = static_cast<BPV7_BLOCKFLAG>(blockFlags);
    m_blockTypeCode = BPV7_BLOCK_TYPE_CODE::PAYLOAD;
    m_crcType = BPV7_CRC_TYPE::NONE;
    numBytesTakenToDecode = serialization - serializationBase;
    return true;
}

std::ostream& operator<<(std::ostream& os, const Bpv7CanonicalBlock& o) {
    os << "canonical block: type=" << static_cast<unsigned int>(o.m_blockTypeCode)
        << " number=" << o.m_blockNumber
        << " flags=" << o.m_blockProcessingControlFlags
        << " crcType=" << o.m_crcType
        << " dataLength=" << o.m_data.size();
    return os;
}

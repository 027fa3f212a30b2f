/**
 * @file CborUint.cpp
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

#include "CborUint.h"
#include <cstring>
#include <boost/endian/conversion.hpp>

#define CBOR_UINT8_TYPE   (24)
#define CBOR_UINT16_TYPE  (25)
#define CBOR_UINT32_TYPE  (26)
#define CBOR_UINT64_TYPE  (27)
#define CBOR_ADDITIONAL_INFORMATION_MASK (0x1f)

CBOR_MAJOR_TYPE CborGetMajorType(const uint8_t initialByte) {
    return static_cast<CBOR_MAJOR_TYPE>(initialByte >> 5);
}

//return output size
unsigned int CborEncodeU64(uint8_t * const outputEncoded, const uint64_t valToEncodeU64, const uint64_t bufferSize) {
    const unsigned int encodingSize = CborGetEncodingSizeU64(valToEncodeU64);
    if (bufferSize < encodingSize) {
        return 0;
    }
    return CborEncodeU64BufSize9(outputEncoded, valToEncodeU64);
}

//return output size
unsigned int CborEncodeU64BufSize9(uint8_t * const outputEncoded, const uint64_t valToEncodeU64) {
    if (valToEncodeU64 < CBOR_UINT8_TYPE) {
        outputEncoded[0] = static_cast<uint8_t>(valToEncodeU64);
        return 1;
    }
    else if (valToEncodeU64 <= UINT8_MAX) {
        outputEncoded[0] = CBOR_UINT8_TYPE;
        outputEncoded[1] = static_cast<uint8_t>(valToEncodeU64);
        return 2;
    }
    else if (valToEncodeU64 <= UINT16_MAX) {
        outputEncoded[0] = CBOR_UINT16_TYPE;
        const uint16_t be16 = boost::endian::native_to_big(static_cast<uint16_t>(valToEncodeU64));
        memcpy(&outputEncoded[1], &be16, sizeof(be16));
        return 3;
    }
    else if (valToEncodeU64 <= UINT32_MAX) {
        outputEncoded[0] = CBOR_UINT32_TYPE;
        const uint32_t be32 = boost::endian::native_to_big(static_cast<uint32_t>(valToEncodeU64));
        memcpy(&outputEncoded[1], &be32, sizeof(be32));
        return 5;
    }
    else {
        outputEncoded[0] = CBOR_UINT64_TYPE;
        const uint64_t be64 = boost::endian::native_to_big(valToEncodeU64);
        memcpy(&outputEncoded[1], &be64, sizeof(be64));
        return 9;
    }
}

//return output size
unsigned int CborGetEncodingSizeU64(const uint64_t valToEncodeU64) {
    if (valToEncodeU64 < CBOR_UINT8_TYPE) {
        return 1;
    }
    else if (valToEncodeU64 <= UINT8_MAX) {
        return 2;
    }
    else if (valToEncodeU64 <= UINT16_MAX) {
        return 3;
    }
    else if (valToEncodeU64 <= UINT32_MAX) {
        return 5;
    }
    return 9;
}

//the argument decoder shared by all major types
//(non-preferred, i.e. longer than necessary, serializations are accepted)
static uint64_t DecodeArgument(const uint8_t * const inputEncoded, uint8_t * numBytes, const uint64_t bufferSize) {
    *numBytes = 0; //initialize to invalid
    if (bufferSize == 0) {
        return 0;
    }
    uint64_t result = 0;
    const uint8_t additionalInformation = inputEncoded[0] & CBOR_ADDITIONAL_INFORMATION_MASK;
    if (additionalInformation < CBOR_UINT8_TYPE) {
        result = additionalInformation;
        *numBytes = 1;
    }
    else if (additionalInformation == CBOR_UINT8_TYPE) {
        if (bufferSize >= 2) {
            result = inputEncoded[1];
            *numBytes = 2;
        }
    }
    else if (additionalInformation == CBOR_UINT16_TYPE) {
        if (bufferSize >= 3) {
            uint16_t result16Be;
            memcpy(&result16Be, &inputEncoded[1], sizeof(result16Be));
            result = boost::endian::big_to_native(result16Be);
            *numBytes = 3;
        }
    }
    else if (additionalInformation == CBOR_UINT32_TYPE) {
        if (bufferSize >= 5) {
            uint32_t result32Be;
            memcpy(&result32Be, &inputEncoded[1], sizeof(result32Be));
            result = boost::endian::big_to_native(result32Be);
            *numBytes = 5;
        }
    }
    else if (additionalInformation == CBOR_UINT64_TYPE) {
        if (bufferSize >= 9) {
            uint64_t result64Be;
            memcpy(&result64Be, &inputEncoded[1], sizeof(result64Be));
            result = boost::endian::big_to_native(result64Be);
            *numBytes = 9;
        }
    }
    //28, 29, 30 are reserved and 31 (indefinite length) has no argument, leave numBytes at 0

    return result;
}

uint64_t CborDecodeU64(const uint8_t * const inputEncoded, uint8_t * numBytes, const uint64_t bufferSize) {
    return CborDecodeHead(inputEncoded, CBOR_MAJOR_TYPE::UNSIGNED_INTEGER, numBytes, bufferSize);
}

unsigned int CborEncodeHead(uint8_t * const outputEncoded, const CBOR_MAJOR_TYPE majorType, const uint64_t argument, const uint64_t bufferSize) {
    const unsigned int encodingSize = CborEncodeU64(outputEncoded, argument, bufferSize);
    if (encodingSize) {
        //change from major type 0 (unsigned integer) to the requested major type
        outputEncoded[0] |= static_cast<uint8_t>((static_cast<uint8_t>(majorType)) << 5);
    }
    return encodingSize;
}

uint64_t CborDecodeHead(const uint8_t * const inputEncoded, const CBOR_MAJOR_TYPE expectedMajorType, uint8_t * numBytes, const uint64_t bufferSize) {
    *numBytes = 0;
    if ((bufferSize == 0) || (CborGetMajorType(inputEncoded[0]) != expectedMajorType)) {
        return 0;
    }
    return DecodeArgument(inputEncoded, numBytes, bufferSize);
}

uint64_t CborDecodeArrayHeader(const uint8_t * const inputEncoded, uint8_t * numBytes, const uint64_t bufferSize, bool & isIndefiniteLength) {
    isIndefiniteLength = false;
    if ((bufferSize != 0) && (inputEncoded[0] == CBOR_INDEFINITE_LENGTH_ARRAY_BYTE)) {
        isIndefiniteLength = true;
        *numBytes = 1;
        return 0;
    }
    return CborDecodeHead(inputEncoded, CBOR_MAJOR_TYPE::ARRAY, numBytes, bufferSize);
}

uint64_t CborTwoUint64ArraySerialize(uint8_t * serialization, const uint64_t element1, const uint64_t element2, uint64_t bufferSize) {
    if (bufferSize < CborTwoUint64ArraySerializationSize(element1, element2)) {
        return 0;
    }
    uint8_t * const serializationBase = serialization;
    *serialization++ = (4U << 5) | 2; //major type 4, additional information 2
    serialization += CborEncodeU64BufSize9(serialization, element1);
    serialization += CborEncodeU64BufSize9(serialization, element2);
    return serialization - serializationBase;
}

uint64_t CborTwoUint64ArraySerializationSize(const uint64_t element1, const uint64_t element2) {
    uint64_t serializationSize = 1; //cbor first byte major type 4, additional information 2
    serializationSize += CborGetEncodingSizeU64(element1);
    serializationSize += CborGetEncodingSizeU64(element2);
    return serializationSize;
}

bool CborTwoUint64ArrayDeserialize(const uint8_t * serialization, uint8_t * numBytesTakenToDecode, uint64_t bufferSize, uint64_t & element1, uint64_t & element2) {
    uint8_t cborUintSize;
    const uint8_t * const serializationBase = serialization;

    if (bufferSize == 0) {
        return false;
    }
    --bufferSize;
    const uint8_t initialCborByte = *serialization++;
    if ((initialCborByte != ((4U << 5) | 2U)) && //major type 4, additional information 2 (array of length 2)
        (initialCborByte != CBOR_INDEFINITE_LENGTH_ARRAY_BYTE)) {
        return false;
    }

    element1 = CborDecodeU64(serialization, &cborUintSize, bufferSize);
    if (cborUintSize == 0) {
        return false; //failure
    }
    serialization += cborUintSize;
    bufferSize -= cborUintSize;

    element2 = CborDecodeU64(serialization, &cborUintSize, bufferSize);
    if (cborUintSize == 0) {
        return false; //failure
    }
    serialization += cborUintSize;
    bufferSize -= cborUintSize;

    //An implementation of the Bundle Protocol MAY accept a sequence of
    //bytes that does not conform to the Bundle Protocol specification
    //(e.g., one that represents data elements in fixed-length arrays
    //rather than indefinite-length arrays) and transform it into
    //conformant BP structure before processing it.
    if (initialCborByte == CBOR_INDEFINITE_LENGTH_ARRAY_BYTE) {
        if ((bufferSize == 0) || (*serialization++ != CBOR_BREAK_STOP_CODE)) {
            return false; //a third element or no break
        }
    }

    *numBytesTakenToDecode = static_cast<uint8_t>(serialization - serializationBase);
    return true;
}

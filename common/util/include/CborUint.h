/**
 * @file CborUint.h
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
 * Implementation of https://datatracker.ietf.org/doc/html/rfc8949 for the subset of CBOR
 * needed by Bundle Protocol version 7: unsigned integers, the initial "head" of
 * byte strings, text strings and arrays, and indefinite-length array framing.
 * All encoders produce the shortest (preferred) form of the argument.
 */

#ifndef _CBOR_UINT_H
#define _CBOR_UINT_H 1

#include <stdlib.h>
#include <stdint.h>
#include <vector>
#include "bp7_util_export.h"

enum class CBOR_MAJOR_TYPE : uint8_t {
    UNSIGNED_INTEGER = 0,
    NEGATIVE_INTEGER = 1,
    BYTE_STRING = 2,
    TEXT_STRING = 3,
    ARRAY = 4,
    MAP = 5,
    TAG = 6,
    SIMPLE_OR_FLOAT = 7
};

//major type 4, additional information 31
#define CBOR_INDEFINITE_LENGTH_ARRAY_BYTE (static_cast<uint8_t>((4U << 5) | 31U))
#define CBOR_BREAK_STOP_CODE (static_cast<uint8_t>(0xff))

BP7_UTIL_EXPORT CBOR_MAJOR_TYPE CborGetMajorType(const uint8_t initialByte);

//return output size (0 if bufferSize too small)
BP7_UTIL_EXPORT unsigned int CborEncodeU64(uint8_t * const outputEncoded, const uint64_t valToEncodeU64, const uint64_t bufferSize);

//return output size (outputEncoded must have at least 9 bytes available)
BP7_UTIL_EXPORT unsigned int CborEncodeU64BufSize9(uint8_t * const outputEncoded, const uint64_t valToEncodeU64);

//return output size
BP7_UTIL_EXPORT unsigned int CborGetEncodingSizeU64(const uint64_t valToEncodeU64);

//return decoded value (return invalid number that must be ignored on failure)
//  also sets parameter numBytes taken to decode (set to 0 on failure)
//  fails if the item is not major type 0
BP7_UTIL_EXPORT uint64_t CborDecodeU64(const uint8_t * const inputEncoded, uint8_t * numBytes, const uint64_t bufferSize);

//encode the head (major type + argument) of any item, return output size (0 if bufferSize too small)
BP7_UTIL_EXPORT unsigned int CborEncodeHead(uint8_t * const outputEncoded, const CBOR_MAJOR_TYPE majorType, const uint64_t argument, const uint64_t bufferSize);

//return decoded argument of the head (return invalid number that must be ignored on failure)
//  also sets parameter numBytes taken to decode (set to 0 on failure)
//  fails if the major type doesn't match or if the item has an indefinite length
BP7_UTIL_EXPORT uint64_t CborDecodeHead(const uint8_t * const inputEncoded, const CBOR_MAJOR_TYPE expectedMajorType, uint8_t * numBytes, const uint64_t bufferSize);

//return the number of array elements (undefined if isIndefiniteLength is set)
//  also sets parameter numBytes taken to decode (set to 0 on failure)
BP7_UTIL_EXPORT uint64_t CborDecodeArrayHeader(const uint8_t * const inputEncoded, uint8_t * numBytes, const uint64_t bufferSize, bool & isIndefiniteLength);

//array ops
BP7_UTIL_EXPORT uint64_t CborTwoUint64ArraySerialize(uint8_t * serialization, const uint64_t element1, const uint64_t element2, uint64_t bufferSize);
BP7_UTIL_EXPORT uint64_t CborTwoUint64ArraySerializationSize(const uint64_t element1, const uint64_t element2);
BP7_UTIL_EXPORT bool CborTwoUint64ArrayDeserialize(const uint8_t * serialization, uint8_t * numBytesTakenToDecode, uint64_t bufferSize, uint64_t & element1, uint64_t & element2);

#endif      // _CBOR_UINT_H

/**
 * @file EnumAsFlagsMacro.h
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
 * This EnumAsFlagsMacro include file gives strongly-typed enums (new in C++11)
 * inlined bitwise operators and the ostream operator, so that bundle and block
 * control flags can be combined and tested without casting at every call site.
 */

#ifndef _ENUM_AS_FLAGS_MACRO_H
#define _ENUM_AS_FLAGS_MACRO_H 1
#include <stdint.h>
#include <type_traits>
#include <ostream>
#include <boost/config/detail/suffix.hpp>

template <typename ENUMTYPE>
BOOST_FORCEINLINE typename std::underlying_type<ENUMTYPE>::type EnumToUnderlying(const ENUMTYPE a) {
    return static_cast<typename std::underlying_type<ENUMTYPE>::type>(a);
}

//true if any of the bits in mask are set in value
template <typename ENUMTYPE>
BOOST_FORCEINLINE bool EnumHasAnyFlag(const ENUMTYPE value, const ENUMTYPE mask) {
    return (EnumToUnderlying(value) & EnumToUnderlying(mask)) != 0;
}

//note: static_assert(true, "") is to require a semicolon after the macro to eliminate warnings when -Wpedantic is enabled as a compiler warning
#define MAKE_ENUM_SUPPORT_FLAG_OPERATORS(ENUMTYPE) \
BOOST_FORCEINLINE ENUMTYPE operator | (ENUMTYPE a, ENUMTYPE b) { return static_cast<ENUMTYPE>(EnumToUnderlying(a) | EnumToUnderlying(b)); } \
BOOST_FORCEINLINE ENUMTYPE operator & (ENUMTYPE a, ENUMTYPE b) { return static_cast<ENUMTYPE>(EnumToUnderlying(a) & EnumToUnderlying(b)); } \
BOOST_FORCEINLINE ENUMTYPE operator ^ (ENUMTYPE a, ENUMTYPE b) { return static_cast<ENUMTYPE>(EnumToUnderlying(a) ^ EnumToUnderlying(b)); } \
BOOST_FORCEINLINE ENUMTYPE operator ~ (ENUMTYPE a) { return static_cast<ENUMTYPE>(~EnumToUnderlying(a)); } \
BOOST_FORCEINLINE ENUMTYPE & operator |= (ENUMTYPE & a, ENUMTYPE b) { a = a | b; return a; } \
BOOST_FORCEINLINE ENUMTYPE & operator &= (ENUMTYPE & a, ENUMTYPE b) { a = a & b; return a; } \
BOOST_FORCEINLINE ENUMTYPE & operator ^= (ENUMTYPE & a, ENUMTYPE b) { a = a ^ b; return a; } static_assert(true, "")

#define MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(ENUMTYPE) \
BOOST_FORCEINLINE std::ostream& operator<<(std::ostream& os, const ENUMTYPE & a) { os << std::hex << "0x" << static_cast<uint64_t>(EnumToUnderlying(a)) << std::dec; return os; } static_assert(true, "")

#endif      // _ENUM_AS_FLAGS_MACRO_H

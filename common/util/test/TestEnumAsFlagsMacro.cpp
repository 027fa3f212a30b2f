/**
 * @file TestEnumAsFlagsMacro.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <boost/test/unit_test.hpp>
#include <sstream>
#include "EnumAsFlagsMacro.h"

enum class TestFlags : uint64_t {
    none = 0,
    flag0 = 1 << 0,
    flag1 = 1 << 1,
    flag2 = 1 << 2,
    flag4 = 1 << 4,
    flag14 = 1 << 14,
    flag18 = 1 << 18
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(TestFlags);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(TestFlags);

enum class TestSmallFlags : uint8_t {
    none = 0,
    low = 0x01,
    high = 0x80
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(TestSmallFlags);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(TestSmallFlags);

BOOST_AUTO_TEST_CASE(EnumAsFlagsMacroTestCase)
{
    TestFlags f = TestFlags::none;
    BOOST_REQUIRE_EQUAL(f, TestFlags::none);
    BOOST_REQUIRE_EQUAL(f | TestFlags::flag0, TestFlags::flag0);
    f |= TestFlags::flag18;
    BOOST_REQUIRE_EQUAL(f, TestFlags::flag18);
    f |= TestFlags::flag0 | TestFlags::flag1 | TestFlags::flag2;
    BOOST_REQUIRE_EQUAL(EnumToUnderlying(f), 0x40007U);
    f &= TestFlags::flag1 | TestFlags::flag2 | TestFlags::flag4;
    BOOST_REQUIRE_EQUAL(f, TestFlags::flag1 | TestFlags::flag2);
    f &= ~TestFlags::flag2;
    BOOST_REQUIRE_EQUAL(f, TestFlags::flag1);
    f ^= TestFlags::flag14;
    BOOST_REQUIRE_EQUAL(f, TestFlags::flag1 | TestFlags::flag14);
    f ^= TestFlags::flag14;
    BOOST_REQUIRE_EQUAL(f, TestFlags::flag1);
    BOOST_REQUIRE_EQUAL(TestFlags::flag0 & TestFlags::flag1, TestFlags::none);
    BOOST_REQUIRE_EQUAL(TestFlags::flag0 ^ TestFlags::flag1, TestFlags::flag0 | TestFlags::flag1);

    BOOST_REQUIRE_EQUAL(~TestSmallFlags::none, TestSmallFlags::low | TestSmallFlags::high | static_cast<TestSmallFlags>(0x7e));
}

BOOST_AUTO_TEST_CASE(EnumHasAnyFlagTestCase)
{
    const TestFlags f = TestFlags::flag2 | TestFlags::flag14;
    BOOST_REQUIRE(EnumHasAnyFlag(f, TestFlags::flag2));
    BOOST_REQUIRE(EnumHasAnyFlag(f, TestFlags::flag14));
    BOOST_REQUIRE(EnumHasAnyFlag(f, TestFlags::flag0 | TestFlags::flag14));
    BOOST_REQUIRE(!EnumHasAnyFlag(f, TestFlags::flag0));
    BOOST_REQUIRE(!EnumHasAnyFlag(f, TestFlags::none));
}

BOOST_AUTO_TEST_CASE(EnumAsFlagsOstreamTestCase)
{
    std::ostringstream oss;
    oss << (TestFlags::flag14 | TestFlags::flag0) << " " << TestSmallFlags::high << " " << 10;
    BOOST_REQUIRE_EQUAL(oss.str(), "0x4001 0x80 10");
}

/// @file BigIntTest.cpp
/// @brief Tests for RILL::Math::BigInt using Catch2
///
/// Covers construction, comparison, conversion and malformed input.

#include <RILL/Math/BigInt.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

using namespace RILL;
using namespace RILL::Math;

TEST_CASE("RILL::Math::BigInt", "[Math][BigInt]")
{
    SECTION("DefaultConstruction")
    {
        BigInt a;
        CHECK(a == BigInt("0"));
        CHECK(a.IsZero());
        CHECK_FALSE(a.IsNegative());
    }

    SECTION("StringConstruction")
    {
        BigInt a("12345");
        BigInt b("-67890");
        CHECK(a == BigInt("12345"));
        CHECK(b == BigInt("-67890"));
        CHECK(a != b);
        CHECK(b.IsNegative());
        CHECK(BigInt("000123") == BigInt("123"));
        CHECK(BigInt("-0") == BigInt());
        CHECK_FALSE(BigInt("-000").IsNegative());
    }

    SECTION("IntegerConstruction")
    {
        CHECK(BigInt(static_cast<UInt64>(1234567890123ULL)).ToString() == "1234567890123");
        CHECK(BigInt(std::numeric_limits<UInt64>::max()).ToString() == "18446744073709551615");
        CHECK(BigInt(static_cast<Int64>(-42)).ToString() == "-42");
        CHECK(BigInt(std::numeric_limits<Int64>::min()).ToString() == "-9223372036854775808");
        CHECK(BigInt(static_cast<Int64>(0)).IsZero());
    }

    SECTION("Comparison")
    {
        CHECK(BigInt("123") < BigInt("456"));
        CHECK(BigInt("-456") < BigInt("-123"));
        CHECK(BigInt("-1") < BigInt("0"));
        CHECK(BigInt("999999999") < BigInt("1000000000"));
        CHECK(BigInt("100000000000000000000") > BigInt(std::numeric_limits<UInt64>::max()));
        CHECK(BigInt("5") >= BigInt("5"));
        CHECK(BigInt("5") <= BigInt("5"));
    }

    SECTION("Negation")
    {
        CHECK(-BigInt("17") == BigInt("-17"));
        CHECK(-BigInt("-17") == BigInt("17"));
        CHECK_FALSE((-BigInt()).IsNegative());
    }

    SECTION("ToString keeps inner zero limbs")
    {
        CHECK(BigInt("1000000000000000000001").ToString() == "1000000000000000000001");
        CHECK(BigInt("-18446744073709551616").ToString() == "-18446744073709551616");

        std::ostringstream os;
        os << BigInt("123456789012345678901234567890");
        CHECK(os.str() == "123456789012345678901234567890");
    }

    SECTION("ToDouble")
    {
        CHECK(BigInt("100000000000000000000").ToDouble() == 1e20);
        CHECK(BigInt("-18446744073709551616").ToDouble() == Catch::Approx(-1.8446744073709552e19));
        CHECK(BigInt(std::string(400, '9')).ToDouble() == std::numeric_limits<F64>::infinity());
        CHECK(BigInt("-" + std::string(400, '9')).ToDouble() == -std::numeric_limits<F64>::infinity());
    }

    SECTION("MalformedInput")
    {
        CHECK_THROWS_AS(BigInt(""), Exceptions::Exception);
        CHECK_THROWS_AS(BigInt("-"), Exceptions::Exception);
        CHECK_THROWS_AS(BigInt("12a4"), Exceptions::Exception);
        CHECK_THROWS_AS(BigInt("+5"), Exceptions::Exception);
    }
}

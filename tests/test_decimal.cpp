#include <gtest/gtest.h>
#include <stdexcept>
#include "core/decimal.hpp"

using arbx::Decimal;

namespace {
Decimal d(const char* text) { return Decimal::from_string(text); }
}

TEST(DecimalTest, ParsesAndPrintsCanonicalForm) {
    EXPECT_EQ(d("170.12").to_string(), "170.12");
    EXPECT_EQ(d("-0.000000000001").to_string(), "-0.000000000001");
    EXPECT_EQ(d("42").to_string(), "42");
    EXPECT_EQ(d("1.500").to_string(), "1.5");
    EXPECT_EQ(d("+3").to_string(), "3");
    EXPECT_EQ(d(".25").to_string(), "0.25");
}

TEST(DecimalTest, RejectsMalformedInput) {
    EXPECT_THROW(d(""), std::invalid_argument);
    EXPECT_THROW(d("abc"), std::invalid_argument);
    EXPECT_THROW(d("1.2.3"), std::invalid_argument);
    EXPECT_THROW(d("-"), std::invalid_argument);
    EXPECT_THROW(d("0.0000000000001"), std::invalid_argument);
    EXPECT_THROW(d("10000000000000000000000000"), std::overflow_error);
}

TEST(DecimalTest, AdditionIsExact) {
    EXPECT_EQ(d("0.1") + d("0.2"), d("0.3"));
    EXPECT_EQ(d("1") - d("0.999999999999"), d("0.000000000001"));
}

TEST(DecimalTest, DivisionRoundsHalfToEven) {
    EXPECT_EQ(Decimal::one() / Decimal::from_int(3), d("0.333333333333"));
    EXPECT_EQ(d("2") / Decimal::from_int(3), d("0.666666666667"));
    // 0.0000000000025 rounds to ...002, 0.0000000000035 to ...004
    EXPECT_EQ(d("0.000000000005") / Decimal::from_int(2), d("0.000000000002"));
    EXPECT_EQ(d("0.000000000007") / Decimal::from_int(2), d("0.000000000004"));
}

TEST(DecimalTest, MultiplicationIsDeterministic) {
    Decimal price = d("60125.5");
    Decimal quantity = d("0.01");
    EXPECT_EQ(price * quantity, d("601.255"));
    EXPECT_EQ(price * quantity, quantity * price);
}

TEST(DecimalTest, LargeBalancesStayExact) {
    // 10M USDT and 150 BTC at 65000 are ordinary venue balances.
    EXPECT_EQ(d("10000000") + d("0.000000000001"), d("10000000.000000000001"));
    EXPECT_EQ(d("150") * d("65004.5"), d("9750675"));
    EXPECT_EQ(d("10000000") * d("65004.5"), d("650045000000"));
    EXPECT_EQ(d("150") / d("0.000015"), d("10000000"));
    EXPECT_EQ(d("650045000000") / d("65004.5"), d("10000000"));
    EXPECT_EQ(d("123456789012345678901").to_string(), "123456789012345678901");
    EXPECT_EQ(d("-98765432109876.123456789012").to_string(), "-98765432109876.123456789012");
}

TEST(DecimalTest, ProductsRoundOnTheFullValue) {
    // 1234567.000000000001 * 2.5 = 3086417.5000000000025 -> ...002
    EXPECT_EQ(d("1234567.000000000001") * d("2.5"), d("3086417.500000000002"));
    EXPECT_EQ(d("-1234567.000000000001") * d("2.5"), d("-3086417.500000000002"));
    EXPECT_EQ(d("1000000.000000000003") * d("0.5"), d("500000.000000000002"));
}

TEST(DecimalTest, OverflowBeyondRange) {
    EXPECT_THROW(d("10000000000000") * d("10000000000000"), std::overflow_error);
    EXPECT_THROW(d("100000000000000000000000") / d("0.01"), std::overflow_error);
    EXPECT_THROW(Decimal::max_value() + Decimal::one(), std::overflow_error);
    EXPECT_NO_THROW(Decimal::max_value() - Decimal::one());
}

TEST(DecimalTest, DivisionByZeroThrows) {
    EXPECT_THROW(Decimal::one() / Decimal::zero(), std::domain_error);
}

TEST(DecimalTest, TruncateRoundsTowardZero) {
    EXPECT_EQ(d("1.123456789").truncate(8), d("1.12345678"));
    EXPECT_EQ(d("-1.123456789").truncate(8), d("-1.12345678"));
    EXPECT_EQ(d("1.5").truncate(0), Decimal::one());
}

TEST(DecimalTest, JsonAcceptsStringsAndNumbers) {
    nlohmann::json j = d("0.001");
    EXPECT_EQ(j, nlohmann::json("0.001"));

    EXPECT_EQ(nlohmann::json("2.5").get<Decimal>(), d("2.5"));
    EXPECT_EQ(nlohmann::json(7).get<Decimal>(), Decimal::from_int(7));
    EXPECT_EQ(nlohmann::json(0.5).get<Decimal>(), d("0.5"));
    EXPECT_THROW(nlohmann::json(true).get<Decimal>(), std::invalid_argument);
}

TEST(DecimalTest, MinMaxAndSign) {
    EXPECT_EQ(arbx::min(d("1"), d("2")), d("1"));
    EXPECT_EQ(arbx::max(d("1"), d("2")), d("2"));
    EXPECT_TRUE(d("-0.5").is_negative());
    EXPECT_EQ(d("-0.5").abs(), d("0.5"));
    EXPECT_TRUE(Decimal().is_zero());
}

#include "amount.h"

#include <gtest/gtest.h>

#include <limits>
#include <string>

TEST(NormalizeAmount, StripsCurrencyAndSeparators) {
    EXPECT_DOUBLE_EQ(normalizeAmount("₹500.00"), 500.0);
    EXPECT_DOUBLE_EQ(normalizeAmount("$1,234.50"), 1234.5);
    EXPECT_DOUBLE_EQ(normalizeAmount(" 300 "), 300.0);
    EXPECT_DOUBLE_EQ(normalizeAmount("AED-12.5"), -12.5);
}

TEST(NormalizeAmount, UnparsableIsZero) {
    EXPECT_DOUBLE_EQ(normalizeAmount(""), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAmount("abc"), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAmount("1.2.3"), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAmount("--5"), 0.0);
    EXPECT_DOUBLE_EQ(normalizeAmount("5-"), 0.0);
}

TEST(NormalizeAmount, Idempotent) {
    for (const char *s : {"₹500.00", "$1,234.50", "abc", "-7.25", "€ 0.10"}) {
        double once = normalizeAmount(s);
        EXPECT_DOUBLE_EQ(normalizeAmount(formatAmount("", once)), once) << s;
    }
}

TEST(FormatAmount, FixedTwoDecimals) {
    EXPECT_EQ(formatAmount("$", 12.5), "$12.50");
    EXPECT_EQ(formatAmount("₹", 500), "₹500.00");
}

TEST(FormatMoney, GroupsThousands) {
    EXPECT_EQ(formatMoney("₹", 12809.328), "₹12,809.33");
    EXPECT_EQ(formatMoney("$", 1234567.0), "$1,234,567.00");
    EXPECT_EQ(formatMoney("$", 999.999), "$1,000.00");
    EXPECT_EQ(formatMoney("$", -1500), "$-1,500.00");
    EXPECT_EQ(formatMoney("$", 0), "$0.00");
}

TEST(TryParseNumber, AcceptsPlainDecimals) {
    double v = 0;
    EXPECT_TRUE(tryParseNumber(" 42 ", v));
    EXPECT_DOUBLE_EQ(v, 42.0);
    EXPECT_TRUE(tryParseNumber("-3.5", v));
    EXPECT_DOUBLE_EQ(v, -3.5);
    EXPECT_TRUE(tryParseNumber("1e3", v));
    EXPECT_DOUBLE_EQ(v, 1000.0);
}

TEST(TryParseNumber, RejectsEverythingElse) {
    double v = 7;
    EXPECT_FALSE(tryParseNumber("", v));
    EXPECT_FALSE(tryParseNumber("12abc", v));
    EXPECT_FALSE(tryParseNumber("$12", v));
    EXPECT_FALSE(tryParseNumber("nan", v));
    EXPECT_FALSE(tryParseNumber("inf", v));
    EXPECT_FALSE(tryParseNumber("0x10", v));
    EXPECT_FALSE(tryParseNumber("1e999", v));
    EXPECT_DOUBLE_EQ(v, 7.0);
}

TEST(FormatMoney, NonFiniteValuesDoNotThrow) {
    EXPECT_EQ(formatMoney("$", std::numeric_limits<double>::infinity()), "$inf");
    EXPECT_EQ(formatMoney("$", -std::numeric_limits<double>::infinity()), "$-inf");
    std::string nan;
    EXPECT_NO_THROW(nan = formatMoney("$", std::numeric_limits<double>::quiet_NaN()));
    EXPECT_NE(nan.find("nan"), std::string::npos);
}

TEST(TryParseNumberOr, BlankKeepsCurrentValueExactly) {
    double out = 0;
    ASSERT_TRUE(tryParseNumberOr("", 1234567.5, out));
    EXPECT_EQ(out, 1234567.5);
    ASSERT_TRUE(tryParseNumberOr("   ", 0.1, out));
    EXPECT_EQ(out, 0.1);
    ASSERT_TRUE(tryParseNumberOr(" 250 ", 1234567.5, out));
    EXPECT_DOUBLE_EQ(out, 250.0);
    EXPECT_FALSE(tryParseNumberOr("lots", 1234567.5, out));
}

TEST(ParseChoice, ChecksRangeBeforeConverting) {
    size_t index = 99;
    EXPECT_EQ(parseChoice("1", 3, index), ChoiceStatus::Ok);
    EXPECT_EQ(index, 0u);
    EXPECT_EQ(parseChoice(" 3 ", 3, index), ChoiceStatus::Ok);
    EXPECT_EQ(index, 2u);

    index = 99;
    EXPECT_EQ(parseChoice("4", 3, index), ChoiceStatus::OutOfRange);
    EXPECT_EQ(parseChoice("1e300", 3, index), ChoiceStatus::OutOfRange);
    EXPECT_EQ(parseChoice("0", 3, index), ChoiceStatus::Invalid);
    EXPECT_EQ(parseChoice("-2", 3, index), ChoiceStatus::Invalid);
    EXPECT_EQ(parseChoice("1.5", 3, index), ChoiceStatus::Invalid);
    EXPECT_EQ(parseChoice("two", 3, index), ChoiceStatus::Invalid);
    EXPECT_EQ(parseChoice("1", 0, index), ChoiceStatus::OutOfRange);
    EXPECT_EQ(index, 99u);
}

#include "dates.h"

#include <gtest/gtest.h>

static std::string keyOf(const std::string &date) {
    std::string out;
    return tryMonthKey(date, out) ? out : std::string("<none>");
}

TEST(MonthKey, StrictDates) {
    EXPECT_EQ(keyOf("2024-03-15"), "2024-03");
    EXPECT_EQ(keyOf("2024-3-5"), "2024-03");
    EXPECT_EQ(keyOf("2024-02-29"), "2024-02");
}

TEST(MonthKey, IsoDateTimes) {
    EXPECT_EQ(keyOf("2024-03-15T10:20:30Z"), "2024-03");
    EXPECT_EQ(keyOf("2024-03-15 10:20"), "2024-03");
    EXPECT_EQ(keyOf("2024-12-01T23:59:59.123+05:30"), "2024-12");
    EXPECT_EQ(keyOf("20240704"), "2024-07");
}

TEST(MonthKey, SegmentFallback) {
    EXPECT_EQ(keyOf("2024-03"), "2024-03");
    EXPECT_EQ(keyOf("2024--7"), "2024-07");
    EXPECT_EQ(keyOf("2023-02-30"), "2023-02");
}

TEST(MonthKey, NoKey) {
    EXPECT_EQ(keyOf("not-a-date"), "<none>");
    EXPECT_EQ(keyOf(""), "<none>");
    EXPECT_EQ(keyOf("2024"), "<none>");
    EXPECT_EQ(keyOf("15/03/2024"), "<none>");
}

TEST(MonthKey, FallbackMonth) {
    EXPECT_EQ(monthKeyOr("garbage", "1999-12"), "1999-12");
    EXPECT_EQ(monthKeyOr("2024-01-01", "1999-12"), "2024-01");
}

TEST(NormalizeDate, PadsAndValidates) {
    std::string out;
    ASSERT_TRUE(tryNormalizeDate("2024-3-5", out));
    EXPECT_EQ(out, "2024-03-05");
    EXPECT_FALSE(tryNormalizeDate("2023-02-29", out));
    EXPECT_FALSE(tryNormalizeDate("2024-03", out));
    EXPECT_FALSE(tryNormalizeDate("2024-03-15T10:00", out));
}

TEST(Today, MatchesCurrentMonth) {
    std::string today = todayString();
    ASSERT_EQ(today.size(), 10u);
    std::string month;
    ASSERT_TRUE(tryMonthKey(today, month));
    // both read the clock; allow for a month boundary between the calls
    std::string now = currentMonthKey();
    EXPECT_TRUE(month == now || month < now);
}

TEST(ValidDate, LeapYears) {
    EXPECT_TRUE(isValidDate(2000, 2, 29));
    EXPECT_FALSE(isValidDate(1900, 2, 29));
    EXPECT_FALSE(isValidDate(2024, 13, 1));
    EXPECT_FALSE(isValidDate(2024, 4, 31));
}

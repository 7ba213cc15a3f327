#include "csv.h"

#include <gtest/gtest.h>

#include <sstream>

TEST(Csv, EscapesOnlyWhenNeeded) {
    EXPECT_EQ(csvEscapeField("plain"), "plain");
    EXPECT_EQ(csvEscapeField("a,b"), "\"a,b\"");
    EXPECT_EQ(csvEscapeField("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(csvFormatRow({"a", "", "c"}), "a,,c\r\n");
}

TEST(Csv, ReadsQuotedFieldsAcrossLines) {
    std::vector<std::string> in = {"2024-03-01", "Food, dining", "₹10.00", "line one\nline \"two\""};
    std::istringstream iss(csvFormatRow(in) + csvFormatRow({"x", "y"}));
    std::vector<std::string> out;
    ASSERT_TRUE(csvReadRow(iss, out));
    EXPECT_EQ(out, in);
    ASSERT_TRUE(csvReadRow(iss, out));
    EXPECT_EQ(out, (std::vector<std::string>{"x", "y"}));
    EXPECT_FALSE(csvReadRow(iss, out));
}

TEST(Csv, AcceptsLfAndStrayQuotes) {
    std::istringstream iss("a,b 5\" tall,c\n\n");
    std::vector<std::string> out;
    ASSERT_TRUE(csvReadRow(iss, out));
    EXPECT_EQ(out, (std::vector<std::string>{"a", "b 5\" tall", "c"}));
    ASSERT_TRUE(csvReadRow(iss, out));
    EXPECT_TRUE(out.empty());
}

TEST(Csv, HeaderLookup) {
    CsvHeader h{{"Date", "Category", "Amount"}};
    std::vector<std::string> row = {"2024-01-01", "Rent"};
    EXPECT_EQ(h.indexOf("Amount"), 2);
    EXPECT_EQ(h.indexOf("Note"), -1);
    EXPECT_EQ(h.field(row, "Category"), "Rent");
    EXPECT_EQ(h.field(row, "Amount", "0"), "0");
    EXPECT_EQ(h.field(row, "Note"), "");
}

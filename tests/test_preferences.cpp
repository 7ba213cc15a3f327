#include "preferences.h"

#include "test_utils.h"

#include <gtest/gtest.h>

TEST(Preferences, CreatedWithDefaultsWhenMissing) {
    TempDir tmp;
    auto path = tmp.path() / "nested" / "preferences.json";
    Preferences p = loadPreferences(path);
    EXPECT_EQ(p.currencySymbol, "₹");
    EXPECT_DOUBLE_EQ(p.defaultMonthlyBudget, 0.0);
    EXPECT_EQ(p.language, "EN");
    ASSERT_TRUE(std::filesystem::exists(path));

    auto j = nlohmann::json::parse(readFile(path));
    EXPECT_EQ(j.at("currency_symbol"), "₹");
    EXPECT_EQ(j.at("default_monthly_budget"), 0.0);
}

TEST(Preferences, SaveThenLoad) {
    TempDir tmp;
    auto path = tmp.path() / "preferences.json";
    Preferences p;
    p.currencySymbol = "$";
    p.defaultMonthlyBudget = 2500.5;
    p.language = "EN";
    ASSERT_TRUE(savePreferences(path, p));
    Preferences q = loadPreferences(path);
    EXPECT_EQ(q.currencySymbol, "$");
    EXPECT_DOUBLE_EQ(q.defaultMonthlyBudget, 2500.5);
    // two-space indentation
    EXPECT_NE(readFile(path).find("\n  \"currency_symbol\": \"$\""), std::string::npos);
}

TEST(Preferences, CorruptFileFallsBackToDefaults) {
    TempDir tmp;
    auto path = tmp.path() / "preferences.json";
    writeFile(path, "{ not json");
    Preferences p = loadPreferences(path);
    EXPECT_EQ(p.currencySymbol, "₹");

    writeFile(path, "[1, 2, 3]");
    EXPECT_EQ(loadPreferences(path).language, "EN");
}

TEST(Preferences, MissingKeysTakeDefaults) {
    TempDir tmp;
    auto path = tmp.path() / "preferences.json";
    writeFile(path, "{\"default_monthly_budget\": 900}");
    Preferences p = loadPreferences(path);
    EXPECT_EQ(p.currencySymbol, "₹");
    EXPECT_DOUBLE_EQ(p.defaultMonthlyBudget, 900.0);
    EXPECT_EQ(p.language, "EN");
}

TEST(Preferences, CurrencyOptionsStartWithRupee) {
    ASSERT_EQ(kCurrencyOptionCount, 9u);
    EXPECT_STREQ(kCurrencyOptions[0], "₹");
    EXPECT_STREQ(kCurrencyOptions[8], "SGD");
}

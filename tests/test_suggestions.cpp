#include "suggestions.h"

#include <gtest/gtest.h>

TEST(Suggestions, Overspend) {
    std::vector<ExpenseRecord> rows = {
        {"2024-03-01", "Rent", "₹900", ""},
        {"2024-03-05", "Food", "₹300", ""},
    };
    IncomeTable incomes;
    incomes.set("2024-03", 1000);
    SuggestionSummary s = buildSuggestion("2024-03", rows, incomes);
    EXPECT_EQ(s.verdict, SuggestionVerdict::Overspend);
    EXPECT_DOUBLE_EQ(s.overage, 200.0);
    EXPECT_DOUBLE_EQ(s.balance, -200.0);
    EXPECT_FALSE(s.incomeMissing);
    ASSERT_EQ(s.topCategories.size(), 2u);
    EXPECT_EQ(s.topCategories[0].first, "Rent");
    EXPECT_EQ(s.tipKeys.size(), 3u);
}

TEST(Suggestions, SavingsOpportunityAtThreshold) {
    std::vector<ExpenseRecord> rows = {{"2024-03-01", "Food", "500", ""}};
    IncomeTable incomes;
    incomes.set("2024-03", 1500);
    EXPECT_EQ(buildSuggestion("2024-03", rows, incomes).verdict, SuggestionVerdict::SavingsOpportunity);

    incomes.set("2024-03", 1499.99);
    EXPECT_EQ(buildSuggestion("2024-03", rows, incomes).verdict, SuggestionVerdict::None);
}

TEST(Suggestions, NoIncomeNeverOverspends) {
    std::vector<ExpenseRecord> rows = {{"2024-03-01", "Food", "500", ""}};
    SuggestionSummary s = buildSuggestion("2024-03", rows, IncomeTable());
    EXPECT_TRUE(s.incomeMissing);
    EXPECT_EQ(s.verdict, SuggestionVerdict::None);
    EXPECT_DOUBLE_EQ(s.balance, -500.0);
}

TEST(Suggestions, UnparseableDatesCountButAreNotListed) {
    std::vector<ExpenseRecord> rows = {
        {"someday", "Gift", "200", ""},
        {"2024-03-02", "Food", "100", ""},
        {"2024-02-02", "Food", "999", ""},
    };
    SuggestionSummary s = buildSuggestion("2024-03", rows, IncomeTable());
    EXPECT_DOUBLE_EQ(s.expenditure, 300.0);
    ASSERT_EQ(s.topCategories.size(), 1u);
    EXPECT_EQ(s.topCategories[0].first, "Food");
    EXPECT_DOUBLE_EQ(s.topCategories[0].second, 100.0);
}

TEST(Suggestions, AtMostSixTopCategories) {
    std::vector<ExpenseRecord> rows;
    for (int i = 0; i < 9; ++i) rows.push_back({"2024-03-01", "c" + std::to_string(i), std::to_string(i + 1), ""});
    SuggestionSummary s = buildSuggestion("2024-03", rows, IncomeTable());
    ASSERT_EQ(s.topCategories.size(), kSuggestionTopCategories);
    EXPECT_EQ(s.topCategories[0].first, "c8");
}

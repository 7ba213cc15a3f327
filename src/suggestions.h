// Bling - monthly budget suggestions

#pragma once

#include "aggregator.h"
#include "records.h"

#include <string>
#include <vector>

// Absolute balance above which a month is flagged as a savings opportunity.
// Not scaled by currency.
const double kSavingsThreshold = 1000.0;
const size_t kSuggestionTopCategories = 6;

enum class SuggestionVerdict { None, Overspend, SavingsOpportunity };

struct SuggestionSummary {
    std::string month;
    double income = 0.0;
    double expenditure = 0.0;
    double balance = 0.0;          // income - expenditure
    bool incomeMissing = false;    // no income recorded (or zero) for the month
    SuggestionVerdict verdict = SuggestionVerdict::None;
    double overage = 0.0;          // expenditure - income when overspent
    std::vector<CategoryTotal> topCategories;
    std::vector<std::string> tipKeys;   // translation keys of the quick-action tips
};

// buildSuggestion: Summarize month from the current rows and incomes
// Rows with an unparseable date are counted in month's expenditure but not in its top categories.
SuggestionSummary buildSuggestion(const std::string &month, const std::vector<ExpenseRecord> &rows,
                                  const IncomeTable &incomes);

#include "suggestions.h"

using namespace std;

SuggestionSummary buildSuggestion(const string &month, const vector<ExpenseRecord> &rows,
                                  const IncomeTable &incomes) {
    SuggestionSummary s;
    s.month = month;
    s.income = incomes.get(month, 0.0);
    s.expenditure = totalsByMonth(rows, month).get(month, 0.0);
    s.balance = s.income - s.expenditure;
    s.incomeMissing = (s.income == 0.0);

    if (s.income > 0.0 && s.expenditure > s.income) {
        s.verdict = SuggestionVerdict::Overspend;
        s.overage = s.expenditure - s.income;
    } else if (s.balance >= kSavingsThreshold) {
        s.verdict = SuggestionVerdict::SavingsOpportunity;
    }

    s.topCategories = topCategories(kSuggestionTopCategories, rowsForMonth(rows, month));
    s.tipKeys = {"tip_start_sip", "tip_set_income", "tip_monthly_report"};
    return s;
}

// Bling - grouping and summing over the expense list
//
// Everything here is recomputed from the rows passed in; nothing is cached.

#pragma once

#include "records.h"

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using CategoryTotal = std::pair<std::string, double>;

// Pie charts show this many categories before collapsing the rest into "Others"
const size_t kPieTopSlices = 6;

// Totals: key -> summed amount, keys kept in first-seen order
class Totals {
public:
    void add(const std::string &key, double amount);
    double get(const std::string &key, double fallback = 0.0) const;
    bool contains(const std::string &key) const { return index_.count(key) != 0; }
    double sum() const;

    const std::vector<CategoryTotal> &entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<CategoryTotal> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// categoryLabel: Category text of a row, "Uncategorized" when blank
std::string categoryLabel(const ExpenseRecord &row);

// totalsByCategory: all-time sum per category (case-sensitive)
Totals totalsByCategory(const std::vector<ExpenseRecord> &rows);

// totalsByMonth: sum per month key; rows with an unparseable date count toward fallbackMonth
Totals totalsByMonth(const std::vector<ExpenseRecord> &rows, const std::string &fallbackMonth);

// totalsByMonthCategory: month key -> category -> sum, same month rules as totalsByMonth
std::map<std::string, Totals> totalsByMonthCategory(const std::vector<ExpenseRecord> &rows,
                                                    const std::string &fallbackMonth);

// topCategories: at most n (category, sum) pairs, largest first, ties in first-seen order
std::vector<CategoryTotal> topCategories(size_t n, const Totals &totals);
std::vector<CategoryTotal> topCategories(size_t n, const std::vector<ExpenseRecord> &rows);

// pieSlices: chart input only. Top kPieTopSlices categories plus an "Others" slice holding the
// residual; a single ("No data", 1) slice when the slices sum to exactly zero.
std::vector<CategoryTotal> pieSlices(const Totals &totals);

// rowsForMonth: rows whose date yields exactly month (unparseable dates never match)
std::vector<ExpenseRecord> rowsForMonth(const std::vector<ExpenseRecord> &rows, const std::string &month);

// chartMonths: sorted union of expense and income months, or {currentMonth} when both are empty
std::vector<std::string> chartMonths(const Totals &monthTotals, const IncomeTable &incomes,
                                     const std::string &currentMonth);

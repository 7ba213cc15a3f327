#include "aggregator.h"

#include "amount.h"
#include "dates.h"

#include <algorithm>
#include <set>

using namespace std;

void Totals::add(const string &key, double amount) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        index_[key] = entries_.size();
        entries_.emplace_back(key, amount);
        return;
    }
    entries_[it->second].second += amount;
}

double Totals::get(const string &key, double fallback) const {
    auto it = index_.find(key);
    return it == index_.end() ? fallback : entries_[it->second].second;
}

double Totals::sum() const {
    double s = 0.0;
    for (auto &e : entries_) s += e.second;
    return s;
}

string categoryLabel(const ExpenseRecord &row) {
    return row.category.empty() ? string("Uncategorized") : row.category;
}

Totals totalsByCategory(const vector<ExpenseRecord> &rows) {
    Totals totals;
    for (auto &r : rows) totals.add(categoryLabel(r), normalizeAmount(r.amount));
    return totals;
}

Totals totalsByMonth(const vector<ExpenseRecord> &rows, const string &fallbackMonth) {
    Totals totals;
    for (auto &r : rows) totals.add(monthKeyOr(r.date, fallbackMonth), normalizeAmount(r.amount));
    return totals;
}

map<string, Totals> totalsByMonthCategory(const vector<ExpenseRecord> &rows, const string &fallbackMonth) {
    map<string, Totals> out;
    for (auto &r : rows) {
        out[monthKeyOr(r.date, fallbackMonth)].add(categoryLabel(r), normalizeAmount(r.amount));
    }
    return out;
}

vector<CategoryTotal> topCategories(size_t n, const Totals &totals) {
    vector<CategoryTotal> sorted = totals.entries();
    stable_sort(sorted.begin(), sorted.end(), [](const CategoryTotal &a, const CategoryTotal &b) {
        return a.second > b.second;
    });
    if (sorted.size() > n) sorted.resize(n);
    return sorted;
}

vector<CategoryTotal> topCategories(size_t n, const vector<ExpenseRecord> &rows) {
    return topCategories(n, totalsByCategory(rows));
}

vector<CategoryTotal> pieSlices(const Totals &totals) {
    vector<CategoryTotal> ranked = topCategories(totals.size(), totals);
    vector<CategoryTotal> slices(ranked.begin(), ranked.begin() + (ptrdiff_t)min(kPieTopSlices, ranked.size()));
    if (ranked.size() > kPieTopSlices) {
        double others = 0.0;
        for (size_t i = kPieTopSlices; i < ranked.size(); ++i) others += ranked[i].second;
        slices.emplace_back("Others", others);
    }
    double total = 0.0;
    for (auto &s : slices) total += s.second;
    if (total == 0.0) return {{"No data", 1.0}};
    return slices;
}

vector<ExpenseRecord> rowsForMonth(const vector<ExpenseRecord> &rows, const string &month) {
    vector<ExpenseRecord> out;
    string key;
    for (auto &r : rows) {
        if (tryMonthKey(r.date, key) && key == month) out.push_back(r);
    }
    return out;
}

vector<string> chartMonths(const Totals &monthTotals, const IncomeTable &incomes, const string &currentMonth) {
    set<string> months;
    for (auto &e : monthTotals.entries()) months.insert(e.first);
    for (auto &e : incomes.entries()) months.insert(e.first);
    if (months.empty()) return {currentMonth};
    return vector<string>(months.begin(), months.end());
}

// Bling - persisted record types

#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// ExpenseRecord: one row of expenses.csv
// amount is display text (e.g. "₹500.00"), re-parse it with normalizeAmount() before any arithmetic.
// Rows have no identifier; a row is addressed by its position in the file.
struct ExpenseRecord {
    std::string date;
    std::string category;
    std::string amount;
    std::string note;
};

inline bool operator==(const ExpenseRecord &a, const ExpenseRecord &b) {
    return a.date == b.date && a.category == b.category && a.amount == b.amount && a.note == b.note;
}

// IncomeTable: month key ("YYYY-MM") -> income, at most one figure per month
// Months keep the order they were first seen in; setting a month again overwrites in place.
class IncomeTable {
public:
    using Entry = std::pair<std::string, double>;

    void set(const std::string &month, double amount) {
        auto it = index_.find(month);
        if (it != index_.end()) {
            entries_[it->second].second = amount;
            return;
        }
        index_[month] = entries_.size();
        entries_.emplace_back(month, amount);
    }

    double get(const std::string &month, double fallback = 0.0) const {
        auto it = index_.find(month);
        return it == index_.end() ? fallback : entries_[it->second].second;
    }

    bool contains(const std::string &month) const { return index_.count(month) != 0; }
    const std::vector<Entry> &entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

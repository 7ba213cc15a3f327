// Bling - flat-file record store
//
// expenses.csv (Date,Category,Amount,Note) and income.csv (Month,Income) live in one
// data directory. Every read re-parses the file; every edit rewrites the whole file.
// There is no cross-process locking: the last writer wins.

#pragma once

#include "records.h"

#include <filesystem>
#include <string>
#include <vector>

enum class StoreStatus { Ok, RowUnavailable, WriteFailed };

class RecordStore {
public:
    explicit RecordStore(std::filesystem::path dataDir);

    const std::filesystem::path &dataDir() const { return dataDir_; }
    std::filesystem::path expensesPath() const { return dataDir_ / "expenses.csv"; }
    std::filesystem::path incomesPath() const { return dataDir_ / "income.csv"; }
    std::filesystem::path preferencesPath() const { return dataDir_ / "preferences.json"; }

    // ---- Expenses ----
    // Rows come back in file order with every field trimmed; a missing Amount reads as "0"
    std::vector<ExpenseRecord> readExpenses() const;
    bool writeExpenses(const std::vector<ExpenseRecord> &rows) const;
    bool appendExpense(const ExpenseRecord &row) const;

    // Positional edit/delete: RowUnavailable when index is past the end of the current file
    StoreStatus updateExpense(size_t index, const ExpenseRecord &row) const;
    StoreStatus deleteExpense(size_t index) const;

    // ---- Incomes ----
    // An Income cell that is not a number reads as 0
    IncomeTable readIncomes() const;
    bool writeIncomes(const IncomeTable &incomes) const;
    bool setIncomeForMonth(const std::string &month, double amount) const;

private:
    bool ensureCsvExists(const std::filesystem::path &path, const std::vector<std::string> &header) const;

    std::filesystem::path dataDir_;
};

// Header rows of the two tables
extern const std::vector<std::string> kExpenseHeader;
extern const std::vector<std::string> kIncomeHeader;

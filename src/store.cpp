#include "store.h"

#include "amount.h"
#include "csv.h"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

using namespace std;

const vector<string> kExpenseHeader = {"Date", "Category", "Amount", "Note"};
const vector<string> kIncomeHeader = {"Month", "Income"};

static inline string trimmed(const string &s) {
    size_t a = 0, b = s.size();
    while (a < b && isspace((unsigned char)s[a])) ++a;
    while (b > a && isspace((unsigned char)s[b - 1])) --b;
    return s.substr(a, b - a);
}

RecordStore::RecordStore(filesystem::path dataDir) : dataDir_(std::move(dataDir)) {}

// ensureCsvExists: Create the data directory and an empty table (header only) if missing
bool RecordStore::ensureCsvExists(const filesystem::path &path, const vector<string> &header) const {
    error_code ec;
    if (filesystem::exists(path, ec)) return true;
    if (!path.parent_path().empty()) {
        filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            cerr << "Warning: cannot create data directory " << path.parent_path().string() << ": " << ec.message() << "\n";
            return false;
        }
    }
    ofstream ofs(path, ios::binary);
    if (!ofs) {
        cerr << "Warning: cannot create " << path.string() << "\n";
        return false;
    }
    ofs << csvFormatRow(header);
    return static_cast<bool>(ofs);
}

// -------------------- Expenses --------------------

vector<ExpenseRecord> RecordStore::readExpenses() const {
    vector<ExpenseRecord> rows;
    ensureCsvExists(expensesPath(), kExpenseHeader);
    ifstream ifs(expensesPath(), ios::binary);
    if (!ifs) return rows;

    CsvHeader header;
    if (!csvReadRow(ifs, header.names)) return rows;

    vector<string> fields;
    while (csvReadRow(ifs, fields)) {
        if (fields.empty()) continue; // blank line
        ExpenseRecord r;
        r.date = trimmed(header.field(fields, "Date"));
        r.category = trimmed(header.field(fields, "Category"));
        r.amount = trimmed(header.field(fields, "Amount"));
        if (r.amount.empty()) r.amount = "0";
        r.note = trimmed(header.field(fields, "Note"));
        rows.push_back(std::move(r));
    }
    return rows;
}

bool RecordStore::writeExpenses(const vector<ExpenseRecord> &rows) const {
    if (!ensureCsvExists(expensesPath(), kExpenseHeader)) return false;
    ofstream ofs(expensesPath(), ios::binary | ios::trunc);
    if (!ofs) {
        cerr << "Warning: cannot open " << expensesPath().string() << " for writing\n";
        return false;
    }
    ofs << csvFormatRow(kExpenseHeader);
    for (auto &r : rows) ofs << csvFormatRow({r.date, r.category, r.amount, r.note});
    return static_cast<bool>(ofs);
}

bool RecordStore::appendExpense(const ExpenseRecord &row) const {
    if (!ensureCsvExists(expensesPath(), kExpenseHeader)) return false;
    ofstream ofs(expensesPath(), ios::binary | ios::app);
    if (!ofs) {
        cerr << "Warning: cannot open " << expensesPath().string() << " for appending\n";
        return false;
    }
    ofs << csvFormatRow({row.date, row.category, row.amount, row.note});
    return static_cast<bool>(ofs);
}

StoreStatus RecordStore::updateExpense(size_t index, const ExpenseRecord &row) const {
    auto rows = readExpenses();
    if (index >= rows.size()) return StoreStatus::RowUnavailable;
    rows[index] = row;
    return writeExpenses(rows) ? StoreStatus::Ok : StoreStatus::WriteFailed;
}

StoreStatus RecordStore::deleteExpense(size_t index) const {
    auto rows = readExpenses();
    if (index >= rows.size()) return StoreStatus::RowUnavailable;
    rows.erase(rows.begin() + (ptrdiff_t)index);
    return writeExpenses(rows) ? StoreStatus::Ok : StoreStatus::WriteFailed;
}

// -------------------- Incomes --------------------

IncomeTable RecordStore::readIncomes() const {
    IncomeTable incomes;
    ensureCsvExists(incomesPath(), kIncomeHeader);
    ifstream ifs(incomesPath(), ios::binary);
    if (!ifs) return incomes;

    CsvHeader header;
    if (!csvReadRow(ifs, header.names)) return incomes;

    vector<string> fields;
    while (csvReadRow(ifs, fields)) {
        if (fields.empty()) continue;
        string month = trimmed(header.field(fields, "Month"));
        string raw = trimmed(header.field(fields, "Income", "0"));
        double v = 0.0;
        if (!tryParseNumber(raw, v)) {
            cerr << "Warning: invalid income '" << raw << "' for " << month << ", using 0\n";
            v = 0.0;
        }
        incomes.set(month, v);
    }
    return incomes;
}

bool RecordStore::writeIncomes(const IncomeTable &incomes) const {
    if (!ensureCsvExists(incomesPath(), kIncomeHeader)) return false;
    ofstream ofs(incomesPath(), ios::binary | ios::trunc);
    if (!ofs) {
        cerr << "Warning: cannot open " << incomesPath().string() << " for writing\n";
        return false;
    }
    ofs << csvFormatRow(kIncomeHeader);
    for (auto &e : incomes.entries()) {
        ostringstream amt;
        amt << fixed << setprecision(2) << e.second;
        ofs << csvFormatRow({e.first, amt.str()});
    }
    return static_cast<bool>(ofs);
}

bool RecordStore::setIncomeForMonth(const string &month, double amount) const {
    IncomeTable incomes = readIncomes();
    incomes.set(month, amount);
    return writeIncomes(incomes);
}

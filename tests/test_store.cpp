#include "store.h"

#include "test_utils.h"

#include <gtest/gtest.h>

namespace {

std::vector<ExpenseRecord> sampleRows() {
    return {
        {"2024-03-01", "Food", "₹500.00", "lunch, with team"},
        {"2024-03-02", "Rent", "$1,200.00", ""},
        {"2024-03-03", "Travel", "€45.10", "cab \"airport\""},
        {"2024-04-01", "", "12", "multi\nline"},
    };
}

}  // namespace

TEST(RecordStore, CreatesFilesWithHeaders) {
    TempDir tmp;
    RecordStore store(tmp.path() / "data");
    EXPECT_TRUE(store.readExpenses().empty());
    EXPECT_TRUE(store.readIncomes().empty());
    EXPECT_EQ(readFile(store.expensesPath()), "Date,Category,Amount,Note\r\n");
    EXPECT_EQ(readFile(store.incomesPath()), "Month,Income\r\n");
}

TEST(RecordStore, RoundTripKeepsOrderAndAmountText) {
    TempDir tmp;
    RecordStore store(tmp.path());
    auto rows = sampleRows();
    for (auto &r : rows) ASSERT_TRUE(store.appendExpense(r));
    EXPECT_EQ(store.readExpenses(), rows);

    ASSERT_TRUE(store.writeExpenses(rows));
    EXPECT_EQ(store.readExpenses(), rows);
}

TEST(RecordStore, ReadTrimsFieldsAndDefaultsAmount) {
    TempDir tmp;
    RecordStore store(tmp.path());
    writeFile(store.expensesPath(), "Date,Category,Note\n 2024-01-05 , Books ,  paperback \n");
    auto rows = store.readExpenses();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (ExpenseRecord{"2024-01-05", "Books", "0", "paperback"}));
}

TEST(RecordStore, UpdateAndDeleteByIndex) {
    TempDir tmp;
    RecordStore store(tmp.path());
    auto rows = sampleRows();
    ASSERT_TRUE(store.writeExpenses(rows));

    ExpenseRecord edited{"2024-03-02", "Rent", "$1,300.00", "raised"};
    EXPECT_EQ(store.updateExpense(1, edited), StoreStatus::Ok);
    rows[1] = edited;
    EXPECT_EQ(store.readExpenses(), rows);

    EXPECT_EQ(store.deleteExpense(0), StoreStatus::Ok);
    rows.erase(rows.begin());
    EXPECT_EQ(store.readExpenses(), rows);
}

TEST(RecordStore, StaleIndexWritesNothing) {
    TempDir tmp;
    RecordStore store(tmp.path());
    ASSERT_TRUE(store.writeExpenses(sampleRows()));
    std::string before = readFile(store.expensesPath());

    EXPECT_EQ(store.updateExpense(4, ExpenseRecord{"2024-01-01", "X", "1", ""}), StoreStatus::RowUnavailable);
    EXPECT_EQ(store.deleteExpense(99), StoreStatus::RowUnavailable);
    EXPECT_EQ(readFile(store.expensesPath()), before);
}

TEST(RecordStore, IncomeOverwriteKeepsOrder) {
    TempDir tmp;
    RecordStore store(tmp.path());
    ASSERT_TRUE(store.setIncomeForMonth("2024-03", 50000));
    ASSERT_TRUE(store.setIncomeForMonth("2024-01", 42000.5));
    ASSERT_TRUE(store.setIncomeForMonth("2024-03", 55000));

    IncomeTable incomes = store.readIncomes();
    ASSERT_EQ(incomes.size(), 2u);
    EXPECT_EQ(incomes.entries()[0].first, "2024-03");
    EXPECT_DOUBLE_EQ(incomes.get("2024-03"), 55000.0);
    EXPECT_DOUBLE_EQ(incomes.get("2024-01"), 42000.5);
    EXPECT_EQ(readFile(store.incomesPath()), "Month,Income\r\n2024-03,55000.00\r\n2024-01,42000.50\r\n");
}

TEST(RecordStore, InvalidIncomeReadsAsZero) {
    TempDir tmp;
    RecordStore store(tmp.path());
    writeFile(store.incomesPath(), "Month,Income\n2024-02,lots\n2024-03,100\n");
    IncomeTable incomes = store.readIncomes();
    EXPECT_TRUE(incomes.contains("2024-02"));
    EXPECT_DOUBLE_EQ(incomes.get("2024-02", -1), 0.0);
    EXPECT_DOUBLE_EQ(incomes.get("2024-03"), 100.0);
}

TEST(RecordStore, EmptyAmountCellReadsAsZero) {
    TempDir tmp;
    RecordStore store(tmp.path());
    writeFile(store.expensesPath(), "Date,Category,Amount,Note\r\n2024-01-05,Books,,gift\r\n2024-01-06,Tea,  ,\r\n");
    auto rows = store.readExpenses();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].amount, "0");
    EXPECT_EQ(rows[1].amount, "0");
}

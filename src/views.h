// Bling - terminal views (Entry, Charts, Suggestions) and their dialogs
//
// Views keep a snapshot of what they display and rebuild it in refresh(); every action
// re-reads the files before writing, so the snapshot is only used for display and for
// picking a row number.

#pragma once

#include "aggregator.h"
#include "preferences.h"
#include "records.h"
#include "store.h"
#include "suggestions.h"
#include "view_registry.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// AppContext: collaborators shared by the shell and every view
struct AppContext {
    RecordStore &store;
    ViewRegistry &registry;
    Preferences prefs;
    bool pdfEnabled = true;

    AppContext(RecordStore &s, ViewRegistry &r) : store(s), registry(r) {}
};

// tr / trf: translated UI text in the preferred language ({NAME} placeholders for trf)
std::string tr(const AppContext &ctx, const std::string &id);
std::string trf(const AppContext &ctx, const std::string &id,
                const std::vector<std::pair<std::string, std::string>> &values);

// View ids
extern const char *const kEntryViewId;
extern const char *const kChartsViewId;
extern const char *const kSuggestionsViewId;

// makeView: new view for id, nullptr for an unknown id
std::shared_ptr<View> makeView(const std::string &id, AppContext &ctx);

// selectedMonth: month picked in the open Entry view, else the current month
std::string selectedMonth(const AppContext &ctx);

// ---- Entry window: add/list/edit expenses, set monthly income ----
class EntryView : public View {
public:
    explicit EntryView(AppContext &ctx);

    std::string id() const override { return kEntryViewId; }
    void refresh() override;
    std::string show() override;

    const std::string &selectedDate() const { return selectedDate_; }
    std::string selectedMonth() const;

private:
    void printTable() const;
    void addExpense();
    void editExpense();
    void setIncome();
    void changeDate();

    AppContext &ctx_;
    std::string selectedDate_;
    std::vector<ExpenseRecord> rows_;
    IncomeTable incomes_;
};

// ---- Charts window ----
class ChartsView : public View {
public:
    explicit ChartsView(AppContext &ctx);

    std::string id() const override { return kChartsViewId; }
    void refresh() override;
    std::string show() override;

private:
    void render() const;
    void saveImage() const;

    AppContext &ctx_;
    std::vector<std::string> months_;
    std::vector<double> incomeValues_;
    std::vector<double> expenseValues_;
    std::vector<CategoryTotal> topAllTime_;
    std::vector<CategoryTotal> slices_;
    std::map<std::string, Totals> monthCategory_;
};

// ---- Suggestions window: summary plus SIP, preferences, report and CSV actions ----
class SuggestionsView : public View {
public:
    explicit SuggestionsView(AppContext &ctx);

    std::string id() const override { return kSuggestionsViewId; }
    void refresh() override;
    std::string show() override;

    const SuggestionSummary &summary() const { return summary_; }

private:
    void printSummary() const;

    AppContext &ctx_;
    SuggestionSummary summary_;
};

// ---- Dialogs ----
void runEditExpenseDialog(AppContext &ctx, size_t index, const ExpenseRecord &shown);
void runSipDialog(AppContext &ctx);
void runPreferencesDialog(AppContext &ctx);
void runReportExport(AppContext &ctx);
void openExpensesCsv(AppContext &ctx);

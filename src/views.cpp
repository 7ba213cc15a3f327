#include "views.h"

#include "amount.h"
#include "chart.h"
#include "console.h"
#include "dates.h"
#include "planner.h"
#include "report.h"
#include "system_open.h"

#include "../config/i18n.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

using namespace std;

const char *const kEntryViewId = "entry";
const char *const kChartsViewId = "charts";
const char *const kSuggestionsViewId = "suggestions";

string tr(const AppContext &ctx, const string &id) {
    string out = i18n.get(ctx.prefs.language, id);
    return out.empty() ? id : out;
}

string trf(const AppContext &ctx, const string &id, const vector<pair<string, string>> &values) {
    return i18n.format(ctx.prefs.language, id, values);
}

shared_ptr<View> makeView(const string &id, AppContext &ctx) {
    if (id == kEntryViewId) return make_shared<EntryView>(ctx);
    if (id == kChartsViewId) return make_shared<ChartsView>(ctx);
    if (id == kSuggestionsViewId) return make_shared<SuggestionsView>(ctx);
    return nullptr;
}

string selectedMonth(const AppContext &ctx) {
    auto entry = dynamic_pointer_cast<EntryView>(ctx.registry.find(kEntryViewId));
    if (entry) return entry->selectedMonth();
    return currentMonthKey();
}

// money: amount with the preferred currency prefix
static inline string money(const AppContext &ctx, double v) {
    return formatAmount(ctx.prefs.currencySymbol, v);
}

// afterChange: every mutating action ends here so all open views reload
static inline void afterChange(AppContext &ctx) {
    ctx.registry.broadcastRefresh();
}

// navigation keys shared by all windows; returns true when the loop should end
static bool handleNavigation(AppContext &ctx, const View &view, const string &choice, string &next) {
    if (choice == "b" || choice == "B") { next.clear(); return true; }
    if (choice == "x" || choice == "X") {
        ctx.registry.unregisterView(view.id());
        next.clear();
        return true;
    }
    if ((choice == "e" || choice == "E") && view.id() != kEntryViewId) { next = kEntryViewId; return true; }
    if ((choice == "c" || choice == "C") && view.id() != kChartsViewId) { next = kChartsViewId; return true; }
    if ((choice == "s" || choice == "S") && view.id() != kSuggestionsViewId) { next = kSuggestionsViewId; return true; }
    return false;
}

// ============================================================
// ENTRY WINDOW
// ============================================================

EntryView::EntryView(AppContext &ctx) : ctx_(ctx), selectedDate_(todayString()) {
    refresh();
}

void EntryView::refresh() {
    rows_ = ctx_.store.readExpenses();
    incomes_ = ctx_.store.readIncomes();
}

string EntryView::selectedMonth() const {
    return monthKeyOr(selectedDate_, currentMonthKey());
}

void EntryView::printTable() const {
    size_t wDate = 10, wCat = 8, wAmt = 6;
    for (auto &r : rows_) {
        wDate = max(wDate, r.date.size());
        wCat = max(wCat, r.category.size());
        wAmt = max(wAmt, r.amount.size());
    }
    cout << "  " << setw(4) << "#" << "  " << left << setw((int)wDate) << tr(ctx_, "col_date") << "  "
         << setw((int)wCat) << tr(ctx_, "col_category") << "  " << setw((int)wAmt) << tr(ctx_, "col_amount") << "  "
         << tr(ctx_, "col_note") << right << "\n";
    for (size_t i = 0; i < rows_.size(); ++i) {
        const ExpenseRecord &r = rows_[i];
        cout << "  " << setw(4) << (i + 1) << "  " << left << setw((int)wDate) << r.date << "  " << setw((int)wCat)
             << r.category << "  " << setw((int)wAmt) << r.amount << "  " << r.note << right << "\n";
    }
    if (rows_.empty()) cout << "  " << tr(ctx_, "table_empty") << "\n";
}

string EntryView::show() {
    while (true) {
        clearScreen();
        cout << "\n" << tr(ctx_, "entry_title") << "\n" << tr(ctx_, "entry_subtitle") << "\n\n";
        string month = selectedMonth();
        cout << trf(ctx_, "entry_selected", {{"DATE", selectedDate_}, {"MONTH", month},
                                              {"AMOUNT", money(ctx_, incomes_.get(month, 0.0))}}) << "\n\n";
        printTable();
        cout << "\n" << tr(ctx_, "entry_menu") << "\n";

        string choice;
        if (!readLine(tr(ctx_, "choice"), choice)) return string();
        string next;
        if (handleNavigation(ctx_, *this, choice, next)) return next;

        if (choice == "1") runAction(tr(ctx_, "action_add_expense"), [&] { addExpense(); });
        else if (choice == "2") runAction(tr(ctx_, "action_edit_expense"), [&] { editExpense(); });
        else if (choice == "3") runAction(tr(ctx_, "action_set_income"), [&] { setIncome(); });
        else if (choice == "4") runAction(tr(ctx_, "action_change_date"), [&] { changeDate(); });
        else if (choice == "r" || choice == "R") refresh();
        else if (!choice.empty()) showNotice(tr(ctx_, "notice_title"), tr(ctx_, "invalid_choice"));
    }
}

void EntryView::addExpense() {
    string category, amountText, note;
    if (!readLine(tr(ctx_, "prompt_category"), category)) return;
    if (!readLine(tr(ctx_, "prompt_amount"), amountText)) return;
    if (category.empty() || amountText.empty()) {
        showNotice(tr(ctx_, "missing_fields_title"), tr(ctx_, "missing_category_amount"));
        return;
    }
    double amount = 0.0;
    if (!tryParseNumber(amountText, amount)) {
        showNotice(tr(ctx_, "invalid_amount_title"), tr(ctx_, "invalid_amount"));
        return;
    }

    // currency dropdown, preselected with the preferred symbol
    size_t defaultIdx = 0;
    for (size_t i = 0; i < kCurrencyOptionCount; ++i) {
        if (ctx_.prefs.currencySymbol == kCurrencyOptions[i]) { defaultIdx = i; break; }
    }
    cout << tr(ctx_, "currency_options") << "\n";
    for (size_t i = 0; i < kCurrencyOptionCount; ++i) {
        cout << "  " << (i + 1) << ") " << kCurrencyOptions[i] << (i == defaultIdx ? " *" : "") << "\n";
    }
    string pick;
    if (!readLine(tr(ctx_, "prompt_currency"), pick)) return;
    size_t idx = defaultIdx;
    if (!pick.empty() && parseChoice(pick, kCurrencyOptionCount, idx) != ChoiceStatus::Ok) {
        showNotice(tr(ctx_, "notice_title"), tr(ctx_, "invalid_choice"));
        return;
    }
    if (!readLine(tr(ctx_, "prompt_note"), note)) return;

    ExpenseRecord row{selectedDate_, category, formatAmount(kCurrencyOptions[idx], amount), note};
    if (!ctx_.store.appendExpense(row)) {
        showNotice(tr(ctx_, "error_title"), trf(ctx_, "write_failed", {{"PATH", ctx_.store.expensesPath().string()}}));
        return;
    }
    afterChange(ctx_);
}

void EntryView::editExpense() {
    if (rows_.empty()) {
        showNotice(tr(ctx_, "notice_title"), tr(ctx_, "table_empty"));
        return;
    }
    string pick;
    if (!readLine(tr(ctx_, "prompt_row"), pick) || pick.empty()) return;
    // the row number refers to the table as last displayed
    size_t index = 0;
    ChoiceStatus picked = parseChoice(pick, rows_.size(), index);
    if (picked == ChoiceStatus::Invalid) {
        showNotice(tr(ctx_, "notice_title"), tr(ctx_, "invalid_choice"));
        return;
    }
    if (picked == ChoiceStatus::OutOfRange) {
        showNotice(tr(ctx_, "error_title"), tr(ctx_, "row_unavailable"));
        return;
    }
    ExpenseRecord shown = rows_[index];
    runEditExpenseDialog(ctx_, index, shown);
}

void EntryView::setIncome() {
    string month = selectedMonth();
    string text;
    if (!readLine(trf(ctx_, "prompt_income", {{"MONTH", month}}), text)) return;
    if (text.empty()) {
        showNotice(tr(ctx_, "missing_title"), tr(ctx_, "missing_income"));
        return;
    }
    double amount = 0.0;
    if (!tryParseNumber(text, amount)) {
        showNotice(tr(ctx_, "invalid_title"), tr(ctx_, "income_not_numeric"));
        return;
    }
    if (amount < 0.0) {
        showNotice(tr(ctx_, "invalid_title"), tr(ctx_, "income_negative"));
        return;
    }
    if (!ctx_.store.setIncomeForMonth(month, amount)) {
        showNotice(tr(ctx_, "error_title"), trf(ctx_, "write_failed", {{"PATH", ctx_.store.incomesPath().string()}}));
        return;
    }
    showNotice(tr(ctx_, "saved_title"), trf(ctx_, "income_saved", {{"MONTH", month}, {"AMOUNT", money(ctx_, amount)}}));
    afterChange(ctx_);
}

void EntryView::changeDate() {
    string text;
    if (!readLine(trf(ctx_, "prompt_date", {{"DATE", selectedDate_}}), text) || text.empty()) return;
    string normalized;
    if (!tryNormalizeDate(text, normalized)) {
        showNotice(tr(ctx_, "invalid_title"), tr(ctx_, "invalid_date"));
        return;
    }
    selectedDate_ = normalized;
    // suggestions follow the selected month
    afterChange(ctx_);
}

// ============================================================
// EDIT EXPENSE DIALOG
// ============================================================

void runEditExpenseDialog(AppContext &ctx, size_t index, const ExpenseRecord &shown) {
    cout << "\n" << tr(ctx, "edit_title") << "\n" << tr(ctx, "edit_keep_hint") << "\n";
    ExpenseRecord edited;
    if (!readLineOr(trf(ctx, "edit_prompt_date", {{"VALUE", shown.date}}), shown.date, edited.date)) return;
    if (!readLineOr(trf(ctx, "edit_prompt_category", {{"VALUE", shown.category}}), shown.category, edited.category)) return;
    if (!readLineOr(trf(ctx, "edit_prompt_amount", {{"VALUE", shown.amount}}), shown.amount, edited.amount)) return;
    if (!readLineOr(trf(ctx, "edit_prompt_note", {{"VALUE", shown.note}}), shown.note, edited.note)) return;

    string action;
    if (!readLine(tr(ctx, "edit_actions"), action)) return;
    if (action == "s" || action == "S") {
        if (edited.date.empty() || edited.category.empty() || edited.amount.empty()) {
            showNotice(tr(ctx, "missing_title"), tr(ctx, "edit_required"));
            return;
        }
        StoreStatus st = ctx.store.updateExpense(index, edited);
        if (st == StoreStatus::RowUnavailable) {
            showNotice(tr(ctx, "error_title"), tr(ctx, "row_unavailable"));
            return;
        }
        if (st == StoreStatus::WriteFailed) {
            showNotice(tr(ctx, "error_title"), trf(ctx, "write_failed", {{"PATH", ctx.store.expensesPath().string()}}));
            return;
        }
        showNotice(tr(ctx, "saved_title"), tr(ctx, "saved"));
        afterChange(ctx);
    } else if (action == "d" || action == "D") {
        if (!confirm(tr(ctx, "confirm_delete"))) return;
        StoreStatus st = ctx.store.deleteExpense(index);
        if (st == StoreStatus::RowUnavailable) {
            showNotice(tr(ctx, "error_title"), tr(ctx, "row_unavailable"));
            return;
        }
        if (st == StoreStatus::WriteFailed) {
            showNotice(tr(ctx, "error_title"), trf(ctx, "write_failed", {{"PATH", ctx.store.expensesPath().string()}}));
            return;
        }
        showNotice(tr(ctx, "deleted_title"), tr(ctx, "deleted"));
        afterChange(ctx);
    }
}

// ============================================================
// CHARTS WINDOW
// ============================================================

ChartsView::ChartsView(AppContext &ctx) : ctx_(ctx) {
    refresh();
}

void ChartsView::refresh() {
    auto rows = ctx_.store.readExpenses();
    IncomeTable incomes = ctx_.store.readIncomes();
    string now = currentMonthKey();

    Totals monthTotals = totalsByMonth(rows, now);
    Totals categoryTotals = totalsByCategory(rows);

    months_ = chartMonths(monthTotals, incomes, now);
    incomeValues_.clear();
    expenseValues_.clear();
    for (auto &m : months_) {
        incomeValues_.push_back(incomes.get(m, 0.0));
        expenseValues_.push_back(monthTotals.get(m, 0.0));
    }
    topAllTime_ = topCategories(10, categoryTotals);
    slices_ = pieSlices(categoryTotals);
    monthCategory_ = totalsByMonthCategory(rows, now);
}

void ChartsView::render() const {
    TextChartRenderer text(cout);
    text.groupedBarChart(tr(ctx_, "chart_income_vs_expense"), months_,
                         {{tr(ctx_, "series_income"), incomeValues_}, {tr(ctx_, "series_expenditure"), expenseValues_}});

    vector<string> labels;
    vector<double> values;
    for (auto &c : topAllTime_) { labels.push_back(c.first); values.push_back(c.second); }
    if (labels.empty()) { labels.push_back("No data"); values.push_back(0.0); }
    text.barChart(tr(ctx_, "chart_top_categories"), labels, values);

    labels.clear();
    values.clear();
    for (auto &s : slices_) { labels.push_back(s.first); values.push_back(s.second); }
    text.pieChart(tr(ctx_, "chart_category_share"), labels, values);

    string month = selectedMonth(ctx_);
    cout << "\n" << trf(ctx_, "chart_month_breakdown", {{"MONTH", month}}) << "\n";
    auto it = monthCategory_.find(month);
    if (it == monthCategory_.end() || it->second.empty()) {
        cout << "  " << tr(ctx_, "table_empty") << "\n";
    } else {
        for (auto &c : it->second.entries()) cout << "  - " << c.first << ": " << money(ctx_, c.second) << "\n";
    }
}

void ChartsView::saveImage() const {
    SvgChartRenderer svg;
    svg.groupedBarChart(tr(ctx_, "chart_income_vs_expense"), months_,
                        {{tr(ctx_, "series_income"), incomeValues_}, {tr(ctx_, "series_expenditure"), expenseValues_}});
    vector<string> labels;
    vector<double> values;
    for (auto &c : topAllTime_) { labels.push_back(c.first); values.push_back(c.second); }
    svg.barChart(tr(ctx_, "chart_top_categories"), labels, values);
    labels.clear();
    values.clear();
    for (auto &s : slices_) { labels.push_back(s.first); values.push_back(s.second); }
    svg.pieChart(tr(ctx_, "chart_category_share"), labels, values);

    auto path = ctx_.store.dataDir() / "charts.svg";
    if (!svg.save(path)) {
        showNotice(tr(ctx_, "error_title"), trf(ctx_, "write_failed", {{"PATH", path.string()}}));
        return;
    }
    showNotice(tr(ctx_, "saved_title"), trf(ctx_, "chart_image_saved", {{"PATH", path.string()}}));
}

string ChartsView::show() {
    while (true) {
        clearScreen();
        cout << "\n" << tr(ctx_, "charts_title") << "\n" << tr(ctx_, "charts_subtitle") << "\n";
        render();
        cout << "\n" << tr(ctx_, "charts_menu") << "\n";

        string choice;
        if (!readLine(tr(ctx_, "choice"), choice)) return string();
        string next;
        if (handleNavigation(ctx_, *this, choice, next)) return next;

        if (choice == "r" || choice == "R") refresh();
        else if (choice == "v" || choice == "V") runAction(tr(ctx_, "action_save_image"), [&] { saveImage(); });
        else if (!choice.empty()) showNotice(tr(ctx_, "notice_title"), tr(ctx_, "invalid_choice"));
    }
}

// ============================================================
// SUGGESTIONS WINDOW
// ============================================================

SuggestionsView::SuggestionsView(AppContext &ctx) : ctx_(ctx) {
    refresh();
}

void SuggestionsView::refresh() {
    summary_ = buildSuggestion(selectedMonth(ctx_), ctx_.store.readExpenses(), ctx_.store.readIncomes());
}

void SuggestionsView::printSummary() const {
    const SuggestionSummary &s = summary_;
    cout << trf(ctx_, "sugg_month", {{"MONTH", s.month}}) << "\n";
    cout << trf(ctx_, "sugg_income", {{"AMOUNT", money(ctx_, s.income)}}) << "\n";
    cout << trf(ctx_, "sugg_expenditure", {{"AMOUNT", money(ctx_, s.expenditure)}}) << "\n";
    cout << trf(ctx_, "sugg_balance", {{"AMOUNT", money(ctx_, s.balance)}}) << "\n\n";

    if (s.incomeMissing) cout << tr(ctx_, "sugg_no_income") << "\n\n";

    if (!s.topCategories.empty()) {
        cout << tr(ctx_, "sugg_top_categories") << "\n";
        for (auto &c : s.topCategories) cout << "  - " << c.first << ": " << money(ctx_, c.second) << "\n";
    }

    if (s.verdict == SuggestionVerdict::Overspend) {
        cout << "\n" << trf(ctx_, "sugg_overspend", {{"AMOUNT", money(ctx_, s.overage)}}) << "\n\n";
    } else if (s.verdict == SuggestionVerdict::SavingsOpportunity) {
        cout << "\n" << trf(ctx_, "sugg_savings", {{"AMOUNT", money(ctx_, s.balance)}}) << "\n\n";
    }

    cout << tr(ctx_, "sugg_quick_actions") << "\n";
    for (auto &k : s.tipKeys) cout << "  - " << tr(ctx_, k) << "\n";
}

string SuggestionsView::show() {
    while (true) {
        clearScreen();
        cout << "\n" << tr(ctx_, "suggestions_title") << "\n" << tr(ctx_, "suggestions_subtitle") << "\n\n";
        printSummary();
        cout << "\n" << tr(ctx_, "suggestions_menu") << "\n";

        string choice;
        if (!readLine(tr(ctx_, "choice"), choice)) return string();
        string next;
        if (handleNavigation(ctx_, *this, choice, next)) return next;

        if (choice == "1") runAction(tr(ctx_, "action_sip"), [&] { runSipDialog(ctx_); });
        else if (choice == "2") runAction(tr(ctx_, "action_preferences"), [&] { runPreferencesDialog(ctx_); });
        else if (choice == "3") runAction(tr(ctx_, "action_report"), [&] { runReportExport(ctx_); });
        else if (choice == "4") runAction(tr(ctx_, "action_open_csv"), [&] { openExpensesCsv(ctx_); });
        else if (choice == "r" || choice == "R") refresh();
        else if (!choice.empty()) showNotice(tr(ctx_, "notice_title"), tr(ctx_, "invalid_choice"));
    }
}

// ============================================================
// SIP DIALOG
// ============================================================

void runSipDialog(AppContext &ctx) {
    cout << "\n" << tr(ctx, "sip_title") << "\n";
    string monthly, rate, years, goal;
    if (!readLine(trf(ctx, "sip_prompt_monthly", {{"SYMBOL", ctx.prefs.currencySymbol}}), monthly)) return;
    if (!readLineOr(tr(ctx, "sip_prompt_rate"), "12", rate)) return;
    if (!readLineOr(tr(ctx, "sip_prompt_years"), "10", years)) return;
    if (!readLine(trf(ctx, "sip_prompt_goal", {{"SYMBOL", ctx.prefs.currencySymbol}}), goal)) return;

    SipPlan plan;
    if (!tryBuildSipPlan(monthly, rate, years, goal, plan)) {
        showNotice(tr(ctx, "invalid_input_title"), tr(ctx, "sip_invalid"));
        return;
    }

    const string &sym = ctx.prefs.currencySymbol;
    ostringstream pct, yrs;
    pct << fixed << setprecision(2) << plan.annualRatePct;
    yrs << fixed << setprecision(1) << plan.years;

    ostringstream text;
    text << trf(ctx, "sip_line_monthly", {{"AMOUNT", formatAmount(sym, plan.monthly)}}) << "\n";
    text << trf(ctx, "sip_line_rate", {{"PCT", pct.str()}}) << "\n";
    text << trf(ctx, "sip_line_period", {{"YEARS", yrs.str()}, {"MONTHS", to_string(plan.periods)}}) << "\n\n";
    text << trf(ctx, "sip_line_corpus", {{"AMOUNT", formatMoney(sym, plan.futureValue)}}) << "\n";
    if (plan.hasGoal) {
        text << trf(ctx, "sip_line_goal", {{"GOAL", formatMoney(sym, plan.goal)},
                                           {"AMOUNT", formatMoney(sym, plan.requiredMonthly)}}) << "\n";
    }
    text << "\n" << tr(ctx, "sip_tip");
    showNotice(tr(ctx, "sip_title"), text.str());
}

// ============================================================
// PREFERENCES DIALOG
// ============================================================

void runPreferencesDialog(AppContext &ctx) {
    const Preferences current = loadPreferences(ctx.store.preferencesPath());
    cout << "\n" << tr(ctx, "prefs_title") << "\n" << tr(ctx, "edit_keep_hint") << "\n";

    string symbol, budgetText, language;
    ostringstream budgetNow;
    budgetNow << fixed << setprecision(2) << current.defaultMonthlyBudget;
    if (!readLineOr(trf(ctx, "prefs_prompt_currency", {{"VALUE", current.currencySymbol}}), current.currencySymbol, symbol)) return;
    // blank keeps the stored double as is; the prompt only shows a rounded copy
    if (!readLine(trf(ctx, "prefs_prompt_budget", {{"VALUE", budgetNow.str()}}), budgetText)) return;
    if (!readLineOr(trf(ctx, "prefs_prompt_language", {{"VALUE", current.language}}), current.language, language)) return;

    Preferences updated = current;
    updated.currencySymbol = symbol.empty() ? Preferences().currencySymbol : symbol;
    if (!tryParseNumberOr(budgetText, current.defaultMonthlyBudget, updated.defaultMonthlyBudget)) {
        showNotice(tr(ctx, "invalid_title"), tr(ctx, "budget_not_numeric"));
        return;
    }
    for (auto &c : language) c = (char)toupper((unsigned char)c);
    if (!i18n.hasLanguage(language)) {
        showNotice(tr(ctx, "invalid_title"), trf(ctx, "unknown_language", {{"LANG", language}}));
        return;
    }
    updated.language = language;

    if (!savePreferences(ctx.store.preferencesPath(), updated)) {
        showNotice(tr(ctx, "error_title"), trf(ctx, "write_failed", {{"PATH", ctx.store.preferencesPath().string()}}));
        return;
    }
    ctx.prefs = loadPreferences(ctx.store.preferencesPath());
    setNoticePrompt(tr(ctx, "press_enter"));
    showNotice(tr(ctx, "saved_title"), tr(ctx, "prefs_saved"));
    afterChange(ctx);
}

// ============================================================
// REPORT EXPORT
// ============================================================

void runReportExport(AppContext &ctx) {
    string month = selectedMonth(ctx);
    ReportData data;
    if (!buildReportData(month, ctx.store.readExpenses(), ctx.store.readIncomes(), data)) {
        showNotice(tr(ctx, "no_data_title"), trf(ctx, "report_no_rows", {{"MONTH", month}}));
        return;
    }

    string defaultPath = (ctx.store.dataDir() / ("report-" + month + ".pdf")).string();
    string chosen;
    if (!readLineOr(trf(ctx, "report_prompt_path", {{"PATH", defaultPath}}), defaultPath, chosen)) return;
    filesystem::path path = withPdfSuffix(chosen);
    error_code ec;
    if (filesystem::exists(path, ec) && !confirm(trf(ctx, "confirm_overwrite", {{"PATH", path.string()}}))) return;

    ReportLabels labels;
    labels.title = trf(ctx, "report_title", {{"MONTH", month}});
    labels.income = tr(ctx, "series_income");
    labels.expenditure = tr(ctx, "series_expenditure");
    labels.topExpenses = tr(ctx, "report_top_expenses");
    labels.categoryShare = tr(ctx, "chart_category_share");
    ExportResult result = exportMonthlyReport(data, path, ctx.prefs.currencySymbol, ctx.pdfEnabled, labels);
    switch (result.mode) {
        case ExportMode::Pdf:
            showNotice(tr(ctx, "saved_title"), trf(ctx, "report_saved_pdf", {{"PATH", path.string()}}));
            break;
        case ExportMode::ImageAndCsv: {
            string files;
            for (auto &f : result.files) files += f.string() + "\n";
            showNotice(tr(ctx, "saved_title"), trf(ctx, "report_saved_fallback", {{"FILES", files}}));
            break;
        }
        case ExportMode::Failed:
            showNotice(tr(ctx, "error_title"), trf(ctx, "report_failed", {{"ERROR", result.error}}));
            break;
    }
}

// ============================================================
// OPEN CSV
// ============================================================

void openExpensesCsv(AppContext &ctx) {
    auto path = ctx.store.expensesPath();
    error_code ec;
    if (!filesystem::exists(path, ec)) {
        showNotice(tr(ctx, "csv_not_found_title"), trf(ctx, "csv_not_found", {{"PATH", path.string()}}));
        return;
    }
    string error;
    if (!openWithDefaultApp(path, error)) {
        showNotice(tr(ctx, "csv_open_error_title"), trf(ctx, "csv_open_error", {{"PATH", path.string()}, {"ERROR", error}}));
    }
}

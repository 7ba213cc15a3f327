// Bling - monthly report export
//
// The report is a one-page PDF. When PDF output is switched off or cannot be written,
// the export falls back to an SVG chart plus a CSV extract of the month's rows.

#pragma once

#include "aggregator.h"
#include "records.h"

#include <filesystem>
#include <string>
#include <vector>

const size_t kReportRankedCategories = 10;

struct ReportData {
    std::string month;
    double income = 0.0;
    double expenditure = 0.0;                // sum of the month's rows
    std::vector<ExpenseRecord> rows;         // rows dated in month, file order
    std::vector<CategoryTotal> ranked;       // top categories, largest first
    std::vector<CategoryTotal> slices;       // pie chart input
};

// buildReportData: Collect everything the report shows for month; false when the month has no rows
bool buildReportData(const std::string &month, const std::vector<ExpenseRecord> &rows,
                     const IncomeTable &incomes, ReportData &out);

enum class ExportMode { Pdf, ImageAndCsv, Failed };

struct ExportResult {
    ExportMode mode = ExportMode::Failed;
    std::vector<std::filesystem::path> files;   // files written, in order
    std::string error;
};

// withPdfSuffix: chosen path with ".pdf" appended unless it already ends in it (any case)
std::filesystem::path withPdfSuffix(const std::string &chosen);

// reportTitle: "Monthly Expense Report — <month>"
std::string reportTitle(const std::string &month);

// Text printed in the report; callers pass the translated strings
struct ReportLabels {
    std::string title;                          // empty: reportTitle(month)
    std::string income = "Income";
    std::string expenditure = "Expenditure";
    std::string topExpenses = "Top expenses";
    std::string categoryShare = "Category share";
};

// exportMonthlyReport: Write the PDF at pdfPath, or the SVG + CSV fallback beside it
ExportResult exportMonthlyReport(const ReportData &data, const std::filesystem::path &pdfPath,
                                 const std::string &currencySymbol, bool pdfEnabled,
                                 const ReportLabels &labels = ReportLabels());

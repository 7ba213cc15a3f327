#include "report.h"

#include "amount.h"
#include "chart.h"
#include "csv.h"
#include "pdf_document.h"
#include "store.h"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace std;

bool buildReportData(const string &month, const vector<ExpenseRecord> &rows, const IncomeTable &incomes,
                     ReportData &out) {
    ReportData data;
    data.month = month;
    data.rows = rowsForMonth(rows, month);
    if (data.rows.empty()) return false;

    Totals cats = totalsByCategory(data.rows);
    data.income = incomes.get(month, 0.0);
    for (auto &r : data.rows) data.expenditure += normalizeAmount(r.amount);
    data.ranked = topCategories(kReportRankedCategories, cats);
    data.slices = pieSlices(cats);
    out = std::move(data);
    return true;
}

filesystem::path withPdfSuffix(const string &chosen) {
    string lower;
    for (char c : chosen) lower.push_back((char)tolower((unsigned char)c));
    if (lower.size() >= 4 && lower.compare(lower.size() - 4, 4, ".pdf") == 0) return filesystem::path(chosen);
    return filesystem::path(chosen + ".pdf");
}

string reportTitle(const string &month) {
    return "Monthly Expense Report \xE2\x80\x94 " + month;
}

// -------------------- PDF --------------------

static bool writePdfReport(const ReportData &data, const filesystem::path &path, const string &symbol,
                           const ReportLabels &text) {
    PdfDocument doc;
    const double h = doc.height();

    doc.setFillColor(0, 0, 0);
    doc.setFont(true, 14);
    doc.drawText(40, h - 60, text.title.empty() ? reportTitle(data.month) : text.title);
    doc.setFont(false, 10);
    doc.drawText(40, h - 90, text.income + ": " + formatAmount(symbol, data.income));
    doc.drawText(200, h - 90, text.expenditure + ": " + formatAmount(symbol, data.expenditure));

    // category share pie with a legend on the right
    const double cx = 180, cy = h - 270, radius = 130;
    vector<string> labels;
    vector<double> values;
    for (auto &s : data.slices) { labels.push_back(s.first); values.push_back(s.second); }
    auto wedges = layoutPie(labels, values, 90.0);
    for (size_t i = 0; i < wedges.size(); ++i) {
        Rgb c = paletteColor(i);
        doc.setFillColor(c.r, c.g, c.b);
        doc.fillWedge(cx, cy, radius, wedges[i].startDeg, wedges[i].endDeg);
        double ly = h - 160 - 18.0 * i;
        doc.fillPolygon({{340, ly}, {350, ly}, {350, ly + 10}, {340, ly + 10}});
        doc.setFillColor(0, 0, 0);
        char pct[32];
        snprintf(pct, sizeof(pct), " (%.1f%%)", wedges[i].fraction * 100.0);
        doc.drawText(356, ly + 1, wedges[i].label + pct);
    }

    doc.setFillColor(0, 0, 0);
    doc.setFont(false, 10);
    doc.drawText(40, h - 440, text.topExpenses + ":");
    for (size_t i = 0; i < data.ranked.size(); ++i) {
        doc.drawText(50, h - 460 - 20.0 * (double)(i + 1),
                     to_string(i + 1) + ". " + data.ranked[i].first + ": " + formatAmount(symbol, data.ranked[i].second));
    }
    return doc.save(path);
}

// -------------------- Fallback: SVG + CSV --------------------

static bool writeFallbackReport(const ReportData &data, const filesystem::path &pdfPath, const ReportLabels &text,
                                ExportResult &result) {
    filesystem::path svgPath = pdfPath;
    svgPath.replace_extension(".svg");
    filesystem::path csvPath = pdfPath;
    csvPath.replace_extension(".csv");

    SvgChartRenderer svg;
    vector<string> labels;
    vector<double> values;
    for (auto &s : data.slices) { labels.push_back(s.first); values.push_back(s.second); }
    svg.pieChart(text.categoryShare + " \xE2\x80\x94 " + data.month, labels, values);
    if (!svg.save(svgPath)) {
        result.error = "cannot write " + svgPath.string();
        return false;
    }
    result.files.push_back(svgPath);

    ofstream ofs(csvPath, ios::binary | ios::trunc);
    if (!ofs) {
        result.error = "cannot write " + csvPath.string();
        return false;
    }
    ofs << csvFormatRow(kExpenseHeader);
    for (auto &r : data.rows) ofs << csvFormatRow({r.date, r.category, r.amount, r.note});
    if (!ofs) {
        result.error = "cannot write " + csvPath.string();
        return false;
    }
    result.files.push_back(csvPath);
    return true;
}

ExportResult exportMonthlyReport(const ReportData &data, const filesystem::path &pdfPath,
                                 const string &currencySymbol, bool pdfEnabled, const ReportLabels &labels) {
    ExportResult result;
    if (pdfEnabled) {
        if (writePdfReport(data, pdfPath, currencySymbol, labels)) {
            result.mode = ExportMode::Pdf;
            result.files.push_back(pdfPath);
            return result;
        }
        cerr << "Warning: PDF report could not be written to " << pdfPath.string() << ", saving chart and CSV instead\n";
    }
    if (writeFallbackReport(data, pdfPath, labels, result)) {
        result.mode = ExportMode::ImageAndCsv;
    } else {
        result.mode = ExportMode::Failed;
    }
    return result;
}

#include "chart.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

using namespace std;

static const double kPi = 3.14159265358979323846;

Rgb paletteColor(size_t index) {
    static const Rgb palette[] = {
        {31, 119, 180}, {255, 127, 14}, {44, 160, 44}, {214, 39, 40},
        {148, 103, 189}, {140, 86, 75}, {227, 119, 194}, {127, 127, 127},
    };
    return palette[index % (sizeof(palette) / sizeof(palette[0]))];
}

vector<PieWedge> layoutPie(const vector<string> &labels, const vector<double> &values, double startDeg) {
    vector<PieWedge> wedges;
    double total = 0.0;
    for (double v : values) if (v > 0.0) total += v;
    if (total <= 0.0) return wedges;
    double angle = startDeg;
    for (size_t i = 0; i < values.size(); ++i) {
        PieWedge w;
        w.label = i < labels.size() ? labels[i] : string();
        w.value = values[i];
        w.fraction = values[i] > 0.0 ? values[i] / total : 0.0;
        w.startDeg = angle;
        w.endDeg = angle + w.fraction * 360.0;
        angle = w.endDeg;
        wedges.push_back(w);
    }
    return wedges;
}

// ============================================================
// Text renderer
// ============================================================

string TextChartRenderer::bar(double value, double maxAbs, char fill) const {
    if (maxAbs <= 0.0) return string();
    int len = (int)lround(fabs(value) / maxAbs * barWidth_);
    return string((size_t)len, value < 0 ? '-' : fill);
}

static inline size_t labelWidth(const vector<string> &labels) {
    size_t w = 0;
    for (auto &l : labels) w = max(w, l.size());
    return w;
}

void TextChartRenderer::barChart(const string &title, const vector<string> &labels, const vector<double> &values) {
    out_ << "\n" << title << "\n" << string(title.size(), '-') << "\n";
    double maxAbs = 0.0;
    for (double v : values) maxAbs = max(maxAbs, fabs(v));
    size_t w = labelWidth(labels);
    for (size_t i = 0; i < labels.size() && i < values.size(); ++i) {
        out_ << "  " << left << setw((int)w) << labels[i] << " | " << bar(values[i], maxAbs, '#')
             << " " << fixed << setprecision(2) << values[i] << "\n";
    }
    out_ << right;
}

void TextChartRenderer::groupedBarChart(const string &title, const vector<string> &labels,
                                        const vector<ChartSeries> &series) {
    out_ << "\n" << title << "\n" << string(title.size(), '-') << "\n";
    double maxAbs = 0.0;
    for (auto &s : series) for (double v : s.values) maxAbs = max(maxAbs, fabs(v));
    vector<string> names;
    for (auto &s : series) names.push_back(s.name);
    size_t w = max(labelWidth(labels), labelWidth(names));
    static const char fills[] = {'#', '=', '*', '+'};
    for (size_t i = 0; i < labels.size(); ++i) {
        out_ << "  " << labels[i] << "\n";
        for (size_t k = 0; k < series.size(); ++k) {
            double v = i < series[k].values.size() ? series[k].values[i] : 0.0;
            out_ << "    " << left << setw((int)w) << series[k].name << " | "
                 << bar(v, maxAbs, fills[k % sizeof(fills)]) << " " << fixed << setprecision(2) << v << "\n";
        }
    }
    out_ << right;
}

void TextChartRenderer::pieChart(const string &title, const vector<string> &labels, const vector<double> &values) {
    out_ << "\n" << title << "\n" << string(title.size(), '-') << "\n";
    size_t w = labelWidth(labels);
    for (auto &wedge : layoutPie(labels, values)) {
        double pct = wedge.fraction * 100.0;
        out_ << "  " << left << setw((int)w) << wedge.label << " | " << bar(pct, 100.0, '*')
             << " " << fixed << setprecision(1) << pct << "%\n";
    }
    out_ << right;
}

// ============================================================
// SVG renderer
// ============================================================

static string xmlEscape(const string &s) {
    string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

static string rgbText(const Rgb &c) {
    ostringstream oss;
    oss << "rgb(" << c.r << "," << c.g << "," << c.b << ")";
    return oss.str();
}

void SvgChartRenderer::beginPanel(const string &title) {
    int top = panels_ * kPanelHeight;
    ostringstream oss;
    oss << "<text x=\"" << kPanelWidth / 2 << "\" y=\"" << top + 28
        << "\" text-anchor=\"middle\" font-family=\"Helvetica, Arial, sans-serif\" font-size=\"16\" font-weight=\"bold\">"
        << xmlEscape(title) << "</text>\n";
    body_ += oss.str();
    ++panels_;
}

void SvgChartRenderer::barChart(const string &title, const vector<string> &labels, const vector<double> &values) {
    ChartSeries s;
    s.values = values;
    groupedBarChart(title, labels, {s});
}

void SvgChartRenderer::groupedBarChart(const string &title, const vector<string> &labels,
                                       const vector<ChartSeries> &series) {
    int top = panels_ * kPanelHeight;
    beginPanel(title);
    const double plotLeft = 60, plotRight = kPanelWidth - 20, plotTop = top + 50, plotBottom = top + kPanelHeight - 70;
    double maxV = 0.0;
    for (auto &s : series) for (double v : s.values) maxV = max(maxV, v);
    if (maxV <= 0.0) maxV = 1.0;

    ostringstream oss;
    oss << fixed << setprecision(2);
    oss << "<line x1=\"" << plotLeft << "\" y1=\"" << plotBottom << "\" x2=\"" << plotRight << "\" y2=\"" << plotBottom
        << "\" stroke=\"black\"/>\n";
    size_t n = max<size_t>(labels.size(), 1);
    double slot = (plotRight - plotLeft) / n;
    double barW = slot * 0.7 / max<size_t>(series.size(), 1);
    for (size_t i = 0; i < labels.size(); ++i) {
        double x0 = plotLeft + slot * i + slot * 0.15;
        for (size_t k = 0; k < series.size(); ++k) {
            double v = i < series[k].values.size() ? max(0.0, series[k].values[i]) : 0.0;
            double h = (plotBottom - plotTop) * v / maxV;
            oss << "<rect x=\"" << x0 + barW * k << "\" y=\"" << plotBottom - h << "\" width=\"" << barW
                << "\" height=\"" << h << "\" fill=\"" << rgbText(paletteColor(k)) << "\"/>\n";
        }
        oss << "<text x=\"" << plotLeft + slot * i + slot / 2 << "\" y=\"" << plotBottom + 16
            << "\" text-anchor=\"middle\" font-family=\"Helvetica, Arial, sans-serif\" font-size=\"10\">"
            << xmlEscape(labels[i]) << "</text>\n";
    }
    // legend only when series are named
    for (size_t k = 0; k < series.size(); ++k) {
        if (series[k].name.empty()) continue;
        double ly = top + kPanelHeight - 30;
        double lx = plotLeft + 120.0 * k;
        oss << "<rect x=\"" << lx << "\" y=\"" << ly - 10 << "\" width=\"10\" height=\"10\" fill=\""
            << rgbText(paletteColor(k)) << "\"/>\n";
        oss << "<text x=\"" << lx + 14 << "\" y=\"" << ly
            << "\" font-family=\"Helvetica, Arial, sans-serif\" font-size=\"11\">" << xmlEscape(series[k].name)
            << "</text>\n";
    }
    body_ += oss.str();
}

void SvgChartRenderer::pieChart(const string &title, const vector<string> &labels, const vector<double> &values) {
    int top = panels_ * kPanelHeight;
    beginPanel(title);
    const double cx = 220, cy = top + 230, radius = 150;

    ostringstream oss;
    oss << fixed << setprecision(2);
    auto wedges = layoutPie(labels, values);
    for (size_t i = 0; i < wedges.size(); ++i) {
        const PieWedge &w = wedges[i];
        if (w.fraction <= 0.0) continue;
        string fill = rgbText(paletteColor(i));
        if (w.fraction >= 1.0) {
            oss << "<circle cx=\"" << cx << "\" cy=\"" << cy << "\" r=\"" << radius << "\" fill=\"" << fill << "\"/>\n";
        } else {
            // SVG y grows downwards, so angles are negated
            double a0 = w.startDeg * kPi / 180.0, a1 = w.endDeg * kPi / 180.0;
            double x0 = cx + radius * cos(a0), y0 = cy - radius * sin(a0);
            double x1 = cx + radius * cos(a1), y1 = cy - radius * sin(a1);
            int largeArc = (w.endDeg - w.startDeg) > 180.0 ? 1 : 0;
            oss << "<path d=\"M " << cx << " " << cy << " L " << x0 << " " << y0 << " A " << radius << " " << radius
                << " 0 " << largeArc << " 0 " << x1 << " " << y1 << " Z\" fill=\"" << fill << "\" stroke=\"white\"/>\n";
        }
        double ly = top + 70 + 22.0 * i;
        oss << "<rect x=\"400\" y=\"" << ly - 10 << "\" width=\"12\" height=\"12\" fill=\"" << fill << "\"/>\n";
        oss << "<text x=\"418\" y=\"" << ly << "\" font-family=\"Helvetica, Arial, sans-serif\" font-size=\"12\">"
            << xmlEscape(w.label) << " (" << setprecision(1) << w.fraction * 100.0 << "%)</text>\n"
            << setprecision(2);
    }
    body_ += oss.str();
}

string SvgChartRenderer::document() const {
    int height = max(panels_, 1) * kPanelHeight;
    ostringstream oss;
    oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << kPanelWidth << "\" height=\"" << height
        << "\" viewBox=\"0 0 " << kPanelWidth << " " << height << "\">\n"
        << "<rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n"
        << body_ << "</svg>\n";
    return oss.str();
}

bool SvgChartRenderer::save(const filesystem::path &path) const {
    ofstream ofs(path, ios::binary | ios::trunc);
    if (!ofs) return false;
    ofs << document();
    return static_cast<bool>(ofs);
}

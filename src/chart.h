// Bling - chart rendering seam
//
// Views and the report only hand labels and values to a ChartRenderer; how the chart
// is drawn (terminal text, SVG image) is up to the implementation.

#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

struct ChartSeries {
    std::string name;
    std::vector<double> values;   // one value per label
};

class ChartRenderer {
public:
    virtual ~ChartRenderer() = default;

    virtual void barChart(const std::string &title, const std::vector<std::string> &labels,
                          const std::vector<double> &values) = 0;
    virtual void groupedBarChart(const std::string &title, const std::vector<std::string> &labels,
                                 const std::vector<ChartSeries> &series) = 0;
    virtual void pieChart(const std::string &title, const std::vector<std::string> &labels,
                          const std::vector<double> &values) = 0;
};

// PieWedge: one slice of a pie, angles in degrees counter-clockwise from 3 o'clock
struct PieWedge {
    std::string label;
    double value = 0.0;
    double fraction = 0.0;
    double startDeg = 0.0;
    double endDeg = 0.0;
};

// layoutPie: Turn values into wedges starting at startDeg
// Negative values are drawn as empty slices; no wedges when nothing is positive.
std::vector<PieWedge> layoutPie(const std::vector<std::string> &labels, const std::vector<double> &values,
                                double startDeg = 0.0);

// TextChartRenderer: horizontal bar charts for the terminal
class TextChartRenderer : public ChartRenderer {
public:
    explicit TextChartRenderer(std::ostream &out, int barWidth = 40) : out_(out), barWidth_(barWidth) {}

    void barChart(const std::string &title, const std::vector<std::string> &labels,
                  const std::vector<double> &values) override;
    void groupedBarChart(const std::string &title, const std::vector<std::string> &labels,
                         const std::vector<ChartSeries> &series) override;
    void pieChart(const std::string &title, const std::vector<std::string> &labels,
                  const std::vector<double> &values) override;

private:
    std::string bar(double value, double maxAbs, char fill) const;

    std::ostream &out_;
    int barWidth_;
};

// SvgChartRenderer: stacks every chart as a panel of one SVG image
class SvgChartRenderer : public ChartRenderer {
public:
    static constexpr int kPanelWidth = 640;
    static constexpr int kPanelHeight = 420;

    void barChart(const std::string &title, const std::vector<std::string> &labels,
                  const std::vector<double> &values) override;
    void groupedBarChart(const std::string &title, const std::vector<std::string> &labels,
                         const std::vector<ChartSeries> &series) override;
    void pieChart(const std::string &title, const std::vector<std::string> &labels,
                  const std::vector<double> &values) override;

    std::string document() const;
    bool save(const std::filesystem::path &path) const;
    int panelCount() const { return panels_; }

private:
    void beginPanel(const std::string &title);

    std::string body_;
    int panels_ = 0;
};

// Palette shared by the SVG and PDF renderers (r, g, b in 0..255)
struct Rgb { int r, g, b; };
Rgb paletteColor(size_t index);

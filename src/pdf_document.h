// Bling - single-page PDF writer
//
// Just enough of PDF 1.4 for the monthly report: the two standard Helvetica fonts
// (WinAnsi encoded, nothing embedded), filled polygons, lines and text.
// Coordinates are PDF points with the origin at the bottom-left corner.

#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

class PdfDocument {
public:
    // A4 portrait by default
    explicit PdfDocument(double width = 595.28, double height = 841.89);

    double width() const { return width_; }
    double height() const { return height_; }

    void setFont(bool bold, double size);
    void setFillColor(int r, int g, int b);
    void setStrokeColor(int r, int g, int b);

    void drawText(double x, double y, const std::string &utf8);
    void drawLine(double x0, double y0, double x1, double y1);
    void fillPolygon(const std::vector<std::pair<double, double>> &points);
    // fillWedge: pie slice around (cx, cy), angles in degrees counter-clockwise from 3 o'clock
    void fillWedge(double cx, double cy, double radius, double startDeg, double endDeg);

    // render: complete file contents (header, objects, xref, trailer)
    std::string render() const;
    bool save(const std::filesystem::path &path) const;

private:
    double width_;
    double height_;
    std::string content_;
};

// toWinAnsi: UTF-8 -> WinAnsiEncoding bytes; characters the standard fonts cannot show become '?'
// (the rupee sign is spelled "Rs.")
std::string toWinAnsi(const std::string &utf8);

#include "pdf_document.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <locale>
#include <sstream>

using namespace std;

static const double kPi = 3.14159265358979323846;

// num: PDF number text, fixed 2 decimals, locale independent
static string num(double v) {
    ostringstream oss;
    oss.imbue(locale::classic());
    oss.setf(ios::fixed);
    oss.precision(2);
    oss << v;
    return oss.str();
}

PdfDocument::PdfDocument(double width, double height) : width_(width), height_(height) {}

void PdfDocument::setFont(bool bold, double size) {
    content_ += string(bold ? "/F2 " : "/F1 ") + num(size) + " Tf\n";
}

void PdfDocument::setFillColor(int r, int g, int b) {
    content_ += num(r / 255.0) + " " + num(g / 255.0) + " " + num(b / 255.0) + " rg\n";
}

void PdfDocument::setStrokeColor(int r, int g, int b) {
    content_ += num(r / 255.0) + " " + num(g / 255.0) + " " + num(b / 255.0) + " RG\n";
}

// -------------------- UTF-8 -> WinAnsi --------------------

// nextCodepoint: decode one UTF-8 sequence; malformed bytes decode as U+FFFD
static unsigned nextCodepoint(const string &s, size_t &i) {
    unsigned char c = (unsigned char)s[i++];
    if (c < 0x80) return c;
    int extra = 0;
    unsigned cp = 0;
    if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return 0xFFFD;
    for (int k = 0; k < extra; ++k) {
        if (i >= s.size() || ((unsigned char)s[i] & 0xC0) != 0x80) return 0xFFFD;
        cp = (cp << 6) | ((unsigned char)s[i++] & 0x3F);
    }
    return cp;
}

string toWinAnsi(const string &utf8) {
    string out;
    size_t i = 0;
    while (i < utf8.size()) {
        unsigned cp = nextCodepoint(utf8, i);
        if (cp < 0x80 || (cp >= 0xA0 && cp <= 0xFF)) { out.push_back((char)cp); continue; }
        switch (cp) {
            case 0x20AC: out.push_back((char)0x80); break; // euro
            case 0x2013: out.push_back((char)0x96); break; // en dash
            case 0x2014: out.push_back((char)0x97); break; // em dash
            case 0x2022: out.push_back((char)0x95); break; // bullet
            case 0x2018: out.push_back((char)0x91); break;
            case 0x2019: out.push_back((char)0x92); break;
            case 0x201C: out.push_back((char)0x93); break;
            case 0x201D: out.push_back((char)0x94); break;
            case 0x20B9: out += "Rs."; break;              // rupee
            default: out.push_back('?');
        }
    }
    return out;
}

// pdfString: literal string operand, parentheses/backslash escaped, high bytes as octal
static string pdfString(const string &bytes) {
    string out = "(";
    for (char ch : bytes) {
        unsigned char c = (unsigned char)ch;
        if (c == '(' || c == ')' || c == '\\') {
            out.push_back('\\');
            out.push_back((char)c);
        } else if (c < 0x20 || c >= 0x80) {
            char buf[8];
            snprintf(buf, sizeof(buf), "\\%03o", c);
            out += buf;
        } else out.push_back((char)c);
    }
    out.push_back(')');
    return out;
}

// -------------------- Drawing --------------------

void PdfDocument::drawText(double x, double y, const string &utf8) {
    content_ += "BT " + num(x) + " " + num(y) + " Td " + pdfString(toWinAnsi(utf8)) + " Tj ET\n";
}

void PdfDocument::drawLine(double x0, double y0, double x1, double y1) {
    content_ += num(x0) + " " + num(y0) + " m " + num(x1) + " " + num(y1) + " l S\n";
}

void PdfDocument::fillPolygon(const vector<pair<double, double>> &points) {
    if (points.size() < 3) return;
    content_ += num(points[0].first) + " " + num(points[0].second) + " m\n";
    for (size_t i = 1; i < points.size(); ++i) {
        content_ += num(points[i].first) + " " + num(points[i].second) + " l\n";
    }
    content_ += "h f\n";
}

void PdfDocument::fillWedge(double cx, double cy, double radius, double startDeg, double endDeg) {
    double sweep = endDeg - startDeg;
    if (sweep <= 0.0) return;
    vector<pair<double, double>> pts;
    if (sweep < 360.0) pts.emplace_back(cx, cy);
    // arc approximated by segments of at most 2 degrees
    int steps = max(1, (int)ceil(sweep / 2.0));
    for (int k = 0; k <= steps; ++k) {
        double a = (startDeg + sweep * k / steps) * kPi / 180.0;
        pts.emplace_back(cx + radius * cos(a), cy + radius * sin(a));
    }
    fillPolygon(pts);
}

// -------------------- Serialization --------------------

string PdfDocument::render() const {
    vector<string> objects;
    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    objects.push_back("<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " + num(width_) + " " + num(height_) +
                      "] /Resources << /Font << /F1 4 0 R /F2 5 0 R >> >> /Contents 6 0 R >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>");
    objects.push_back("<< /Length " + to_string(content_.size()) + " >>\nstream\n" + content_ + "\nendstream");

    string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(out.size());
        out += to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }
    size_t xref = out.size();
    out += "xref\n0 " + to_string(objects.size() + 1) + "\n";
    out += "0000000000 65535 f \n";
    for (size_t off : offsets) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%010zu 00000 n \n", off);
        out += buf;
    }
    out += "trailer\n<< /Size " + to_string(objects.size() + 1) + " /Root 1 0 R >>\n";
    out += "startxref\n" + to_string(xref) + "\n%%EOF\n";
    return out;
}

bool PdfDocument::save(const filesystem::path &path) const {
    ofstream ofs(path, ios::binary | ios::trunc);
    if (!ofs) return false;
    ofs << render();
    return static_cast<bool>(ofs);
}

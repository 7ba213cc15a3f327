#include "amount.h"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std;

// parseWhole: stod that must consume the whole token
static inline bool parseWhole(const string &s, double &out) {
    if (s.empty()) return false;
    try {
        size_t pos = 0;
        double v = stod(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (const invalid_argument &) {
        return false;
    } catch (const out_of_range &) {
        return false;
    }
}

double normalizeAmount(const string &text) {
    string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (isdigit((unsigned char)c) || c == '.' || c == '-') cleaned.push_back(c);
    }
    double v = 0.0;
    if (!parseWhole(cleaned, v)) return 0.0;
    return v;
}

string formatAmount(const string &symbol, double value) {
    ostringstream oss;
    oss << symbol << fixed << setprecision(2) << value;
    return oss.str();
}

string formatMoney(const string &symbol, double value) {
    ostringstream oss;
    if (!isfinite(value)) {
        oss << value;
        return symbol + oss.str();
    }
    oss << fixed << setprecision(2) << fabs(value);
    string digits = oss.str();
    size_t dot = digits.find('.');
    string intPart = digits.substr(0, dot);
    string frac = digits.substr(dot);

    // group the integer part in threes from the right
    string grouped;
    int count = 0;
    for (size_t i = intPart.size(); i > 0; --i) {
        if (count == 3) { grouped.insert(grouped.begin(), ','); count = 0; }
        grouped.insert(grouped.begin(), intPart[i - 1]);
        ++count;
    }
    string sign = (value < 0 && digits != "0.00") ? "-" : "";
    return symbol + sign + grouped + frac;
}

bool tryParseNumber(const string &text, double &out) {
    size_t a = 0, b = text.size();
    while (a < b && isspace((unsigned char)text[a])) ++a;
    while (b > a && isspace((unsigned char)text[b - 1])) --b;
    string s = text.substr(a, b - a);
    // stod also accepts hex, "inf" and "nan"; plain decimals only here
    for (char c : s) {
        if (!(isdigit((unsigned char)c) || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E')) return false;
    }
    double v = 0.0;
    if (!parseWhole(s, v)) return false;
    if (!isfinite(v)) return false;
    out = v;
    return true;
}

bool tryParseNumberOr(const string &text, double current, double &out) {
    for (char c : text) {
        if (!isspace((unsigned char)c)) return tryParseNumber(text, out);
    }
    out = current;
    return true;
}

ChoiceStatus parseChoice(const string &text, size_t count, size_t &index) {
    double n = 0.0;
    if (!tryParseNumber(text, n) || n < 1) return ChoiceStatus::Invalid;
    if (n > (double)count) return ChoiceStatus::OutOfRange;
    if (n != floor(n)) return ChoiceStatus::Invalid;
    index = (size_t)n - 1;
    return ChoiceStatus::Ok;
}

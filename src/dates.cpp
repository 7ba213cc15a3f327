#include "dates.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <vector>

using namespace std;

// -------------------- safe localtime --------------------
static inline tm safeLocaltime(time_t tt) {
    tm result{};
#if defined(_MSC_VER) || defined(__MINGW32__) || defined(__MINGW64__)
    localtime_s(&result, &tt);
#elif defined(__APPLE__) || defined(__linux__) || defined(__unix__)
    localtime_r(&tt, &result);
#else
    tm *tmp = localtime(&tt);
    if (tmp) result = *tmp;
#endif
    return result;
}

static inline string formatKey(long long year, long long month) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%04lld-%02lld", year, month);
    return string(buf);
}

static inline int daysInMonth(int year, int month) {
    static const int mdays[] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && (year % 100 != 0 || year % 400 == 0));
        return 28 + (leap ? 1 : 0);
    }
    return mdays[month - 1];
}

bool isValidDate(int year, int month, int day) {
    if (year < 1 || year > 9999) return false;
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= daysInMonth(year, month);
}

// readDigits: Read between minLen and maxLen ASCII digits starting at pos
static inline bool readDigits(const string &s, size_t &pos, size_t minLen, size_t maxLen, int &out) {
    size_t start = pos;
    int v = 0;
    while (pos < s.size() && pos - start < maxLen && isdigit((unsigned char)s[pos])) {
        v = v * 10 + (s[pos] - '0');
        ++pos;
    }
    if (pos - start < minLen) return false;
    out = v;
    return true;
}

// -------------------- Stage 1: strict YYYY-MM-DD --------------------
// Month and day may drop their leading zero ("2024-3-5"), nothing may follow the day
static bool tryStrictDate(const string &s, int &year, int &month, int &day) {
    size_t pos = 0;
    int y = 0, m = 0, d = 0;
    if (!readDigits(s, pos, 4, 4, y)) return false;
    if (pos >= s.size() || s[pos] != '-') return false;
    ++pos;
    if (!readDigits(s, pos, 1, 2, m)) return false;
    if (pos >= s.size() || s[pos] != '-') return false;
    ++pos;
    if (!readDigits(s, pos, 1, 2, d)) return false;
    if (pos != s.size()) return false;
    if (!isValidDate(y, m, d)) return false;
    year = y; month = m; day = d;
    return true;
}

// -------------------- Stage 2: ISO-8601 --------------------
// Accepts YYYY-MM-DD or YYYYMMDD, optionally followed by 'T' or ' ' and a time
// HH[:MM[:SS[.fff]]] with an optional 'Z' or +HH:MM / -HH:MM offset
static bool tryIsoDate(const string &s, int &year, int &month) {
    size_t pos = 0;
    int y = 0, m = 0, d = 0;
    if (!readDigits(s, pos, 4, 4, y)) return false;
    if (pos < s.size() && s[pos] == '-') {
        ++pos;
        if (!readDigits(s, pos, 2, 2, m)) return false;
        if (pos >= s.size() || s[pos] != '-') return false;
        ++pos;
        if (!readDigits(s, pos, 2, 2, d)) return false;
    } else {
        if (!readDigits(s, pos, 2, 2, m)) return false;
        if (!readDigits(s, pos, 2, 2, d)) return false;
    }
    if (!isValidDate(y, m, d)) return false;

    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != ' ') return false;
        ++pos;
        int hh = 0, mm = 0, ss = 0;
        if (!readDigits(s, pos, 2, 2, hh) || hh > 23) return false;
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
            if (!readDigits(s, pos, 2, 2, mm) || mm > 59) return false;
            if (pos < s.size() && s[pos] == ':') {
                ++pos;
                if (!readDigits(s, pos, 2, 2, ss) || ss > 59) return false;
                if (pos < s.size() && s[pos] == '.') {
                    ++pos;
                    int frac = 0;
                    if (!readDigits(s, pos, 1, 6, frac)) return false;
                }
            }
        }
        if (pos < s.size()) {
            if (s[pos] == 'Z') {
                ++pos;
            } else if (s[pos] == '+' || s[pos] == '-') {
                ++pos;
                int oh = 0, om = 0;
                if (!readDigits(s, pos, 2, 2, oh) || oh > 23) return false;
                if (pos < s.size() && s[pos] == ':') ++pos;
                if (!readDigits(s, pos, 2, 2, om) || om > 59) return false;
            } else {
                return false;
            }
        }
        if (pos != s.size()) return false;
    }
    year = y; month = m;
    return true;
}

// -------------------- Stage 3: numeric segments --------------------
// Split on '-', drop blank segments; every remaining segment must be an integer
static bool trySegments(const string &s, long long &year, long long &month) {
    vector<long long> parts;
    string cur;
    auto flush = [&](const string &seg) {
        size_t a = 0, b = seg.size();
        while (a < b && isspace((unsigned char)seg[a])) ++a;
        while (b > a && isspace((unsigned char)seg[b - 1])) --b;
        if (a == b) return true; // blank segment, skipped
        string t = seg.substr(a, b - a);
        size_t i = (t[0] == '+') ? 1 : 0;
        if (i == t.size()) return false;
        for (size_t k = i; k < t.size(); ++k) if (!isdigit((unsigned char)t[k])) return false;
        try {
            parts.push_back(stoll(t.substr(i)));
        } catch (const out_of_range &) {
            return false;
        }
        return true;
    };
    for (char c : s) {
        if (c == '-') {
            if (!flush(cur)) return false;
            cur.clear();
        } else cur.push_back(c);
    }
    if (!flush(cur)) return false;
    if (parts.size() < 2) return false;
    year = parts[0];
    month = parts[1];
    return true;
}

bool tryMonthKey(const string &date, string &out) {
    int y = 0, m = 0, d = 0;
    if (tryStrictDate(date, y, m, d) || tryIsoDate(date, y, m)) {
        out = formatKey(y, m);
        return true;
    }
    long long ly = 0, lm = 0;
    if (trySegments(date, ly, lm)) {
        out = formatKey(ly, lm);
        return true;
    }
    return false;
}

string monthKeyOr(const string &date, const string &fallback) {
    string key;
    if (tryMonthKey(date, key)) return key;
    return fallback;
}

bool tryNormalizeDate(const string &text, string &out) {
    int y = 0, m = 0, d = 0;
    if (!tryStrictDate(text, y, m, d)) return false;
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    out = buf;
    return true;
}

string currentMonthKey() {
    tm t = safeLocaltime(time(nullptr));
    char buf[16];
    strftime(buf, sizeof(buf), "%Y-%m", &t);
    return string(buf);
}

string todayString() {
    tm t = safeLocaltime(time(nullptr));
    char buf[16];
    strftime(buf, sizeof(buf), "%Y-%m-%d", &t);
    return string(buf);
}

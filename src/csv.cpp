#include "csv.h"

using namespace std;

string csvEscapeField(const string &field) {
    bool needsQuotes = false;
    for (char c : field) {
        if (c == ',' || c == '"' || c == '\r' || c == '\n') { needsQuotes = true; break; }
    }
    if (!needsQuotes) return field;
    string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

string csvFormatRow(const vector<string> &fields) {
    string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) line.push_back(',');
        line += csvEscapeField(fields[i]);
    }
    line += "\r\n";
    return line;
}

bool csvReadRow(istream &in, vector<string> &fields) {
    fields.clear();
    string line;
    if (!getline(in, line)) return false;

    string cur;
    bool quoted = false;     // inside a quoted section
    bool sawField = false;   // current row has at least one field started
    size_t i = 0;
    while (true) {
        if (i >= line.size()) {
            if (quoted) {
                // quoted field continues on the next physical line
                string next;
                if (!getline(in, next)) break; // unterminated quote at EOF: keep what we have
                cur.push_back('\n');
                line = next;
                i = 0;
                continue;
            }
            break;
        }
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); i += 2; continue; }
                quoted = false;
            } else if (c == '\r' && i + 1 == line.size()) {
                // CR of a CRLF terminator inside a multi-line field
                cur.push_back('\r');
            } else cur.push_back(c);
            ++i;
            continue;
        }
        if (c == '"' && cur.empty()) {
            quoted = true;
            sawField = true;
        } else if (c == ',') {
            fields.push_back(cur);
            cur.clear();
            sawField = true;
        } else if (c == '\r' && i + 1 == line.size()) {
            // trailing CR of a CRLF row terminator
        } else {
            cur.push_back(c);
            sawField = true;
        }
        ++i;
    }
    if (sawField || !cur.empty()) fields.push_back(cur);
    return true;
}

int CsvHeader::indexOf(const string &name) const {
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return (int)i;
    }
    return -1;
}

string CsvHeader::field(const vector<string> &row, const string &name, const string &fallback) const {
    int idx = indexOf(name);
    if (idx < 0 || (size_t)idx >= row.size()) return fallback;
    return row[idx];
}

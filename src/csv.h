// Bling - minimal CSV reading/writing (comma separated, '"' quoted, CRLF rows)

#pragma once

#include <istream>
#include <string>
#include <vector>

// csvEscapeField: Quote a field when it holds ',', '"', CR or LF; inner quotes are doubled
std::string csvEscapeField(const std::string &field);

// csvFormatRow: Join escaped fields with ',' and terminate the row with "\r\n"
std::string csvFormatRow(const std::vector<std::string> &fields);

// csvReadRow: Read one logical row (quoted fields may span lines)
// Returns false at end of input. Blank physical lines come back as an empty row.
bool csvReadRow(std::istream &in, std::vector<std::string> &fields);

// CsvHeader: column lookup by name for the header row of a table
struct CsvHeader {
    std::vector<std::string> names;

    // indexOf: column index of name, or -1 when the column is missing
    int indexOf(const std::string &name) const;

    // field: value of the named column in row, or fallback when missing
    std::string field(const std::vector<std::string> &row, const std::string &name,
                      const std::string &fallback = std::string()) const;
};

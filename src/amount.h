// Bling - amount parsing and formatting
//
// Amounts are persisted as display text (currency symbol + fixed 2 decimals),
// so every calculation goes through normalizeAmount() first.

#pragma once

#include <cstddef>
#include <string>

// normalizeAmount: Keep only digits, '.' and '-' from the text and parse the rest
// Returns 0.0 when nothing usable is left; never throws
// Examples: "₹500.00" -> 500, "$1,234.50" -> 1234.5, "abc" -> 0
double normalizeAmount(const std::string &text);

// formatAmount: Persisted amount text, e.g. ("$", 12.5) -> "$12.50"
std::string formatAmount(const std::string &symbol, double value);

// formatMoney: Same as formatAmount but with thousands separators ("₹12,809.33")
std::string formatMoney(const std::string &symbol, double value);

// tryParseNumber: Strict parse of user-entered numbers
// Surrounding whitespace is allowed, everything else must be consumed and the value must be finite
bool tryParseNumber(const std::string &text, double &out);

// tryParseNumberOr: tryParseNumber, except that blank text keeps `current` unchanged
bool tryParseNumberOr(const std::string &text, double current, double &out);

enum class ChoiceStatus { Ok, Invalid, OutOfRange };

// parseChoice: 1-based item number out of `count`, stored 0-based in index
// Range is checked on the double before any integer conversion ("1e300" is OutOfRange)
ChoiceStatus parseChoice(const std::string &text, size_t count, size_t &index);

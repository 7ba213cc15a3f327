// Bling - date helpers and month-key derivation

#pragma once

#include <string>

// tryMonthKey: Derive a "YYYY-MM" key from a loosely formatted date
// Tries, in order: strict YYYY-MM-DD, ISO-8601 date/date-time, then the first two
// numeric '-' separated segments. Returns false ("no key") when all of them fail.
bool tryMonthKey(const std::string &date, std::string &out);

// monthKeyOr: tryMonthKey with a caller supplied fallback key
std::string monthKeyOr(const std::string &date, const std::string &fallback);

// tryNormalizeDate: Accept a strict YYYY-M-D date and return it zero-padded as YYYY-MM-DD
bool tryNormalizeDate(const std::string &text, std::string &out);

// currentMonthKey / todayString: local calendar month ("YYYY-MM") and date ("YYYY-MM-DD")
std::string currentMonthKey();
std::string todayString();

// isValidDate: Gregorian range check for a year/month/day triple
bool isValidDate(int year, int month, int day);

// Bling - user preferences (preferences.json)

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

// Preferences: display settings only, no calculation depends on them
struct Preferences {
    std::string currencySymbol = "₹";   // display prefix for amounts
    double defaultMonthlyBudget = 0.0;        // shown and prefilled, not enforced
    std::string language = "EN";              // UI locale code
};

void to_json(nlohmann::json &j, const Preferences &p);
// Missing keys keep their defaults
void from_json(const nlohmann::json &j, Preferences &p);

// loadPreferences: Read preferences from path
// A missing file is created with defaults. An unreadable or corrupt file falls back to
// the defaults (with a warning) and is left untouched.
Preferences loadPreferences(const std::filesystem::path &path);

// savePreferences: Pretty-print preferences to path; false when the file cannot be written
bool savePreferences(const std::filesystem::path &path, const Preferences &prefs);

// Currencies offered when adding an expense
extern const char *const kCurrencyOptions[];
extern const size_t kCurrencyOptionCount;

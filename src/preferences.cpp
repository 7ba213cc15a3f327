#include "preferences.h"

#include <fstream>
#include <iostream>
#include <system_error>

using namespace std;
using json = nlohmann::json;

const char *const kCurrencyOptions[] = {"₹", "$", "€", "£", "¥", "AED", "AUD", "CAD", "SGD"};
const size_t kCurrencyOptionCount = sizeof(kCurrencyOptions) / sizeof(kCurrencyOptions[0]);

void to_json(json &j, const Preferences &p) {
    j = json{
        {"currency_symbol", p.currencySymbol},
        {"default_monthly_budget", p.defaultMonthlyBudget},
        {"language", p.language},
    };
}

void from_json(const json &j, Preferences &p) {
    Preferences defaults;
    p.currencySymbol = j.value("currency_symbol", defaults.currencySymbol);
    p.defaultMonthlyBudget = j.value("default_monthly_budget", defaults.defaultMonthlyBudget);
    p.language = j.value("language", defaults.language);
}

Preferences loadPreferences(const filesystem::path &path) {
    error_code ec;
    if (!filesystem::exists(path, ec)) {
        Preferences defaults;
        if (!savePreferences(path, defaults)) {
            cerr << "Warning: cannot create " << path.string() << ", using default preferences\n";
        }
        return defaults;
    }
    ifstream ifs(path);
    if (!ifs) {
        cerr << "Warning: cannot read " << path.string() << ", using default preferences\n";
        return Preferences();
    }
    try {
        json j = json::parse(ifs);
        if (!j.is_object()) {
            cerr << "Warning: " << path.string() << " is not a JSON object, using default preferences\n";
            return Preferences();
        }
        return j.get<Preferences>();
    } catch (const json::exception &e) {
        cerr << "Warning: corrupt preferences file " << path.string() << " (" << e.what() << "), using defaults\n";
        return Preferences();
    }
}

bool savePreferences(const filesystem::path &path, const Preferences &prefs) {
    error_code ec;
    if (!path.parent_path().empty()) filesystem::create_directories(path.parent_path(), ec);
    ofstream ofs(path, ios::trunc);
    if (!ofs) {
        cerr << "Warning: cannot open " << path.string() << " for writing\n";
        return false;
    }
    ofs << json(prefs).dump(2) << "\n";
    return static_cast<bool>(ofs);
}

#pragma once

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

// Header-only loader for the UI strings.
// - Every `*.lang` file in the locale folders is read as `key=value` lines; blank lines and
//   lines starting with `#` are skipped, `\n` in a value becomes a newline.
// - The locale code is the file stem up to the first underscore, upper-cased, so
//   `en_extra.lang` merges into `EN`.
// - A locale missing one of the required keys is rejected as a whole, so a stray file
//   cannot blank out the UI.
// - Values may carry `{NAME}` placeholders filled in by format().

class I18n {
public:
    using LocaleMap = std::unordered_map<std::string, std::string>;

    std::string fallback = "EN";

    const std::vector<std::string> requiredKeys = {"LANGUAGE_NAME", "launcher_title", "choice", "press_enter", "notice_title"};

    // Folders searched by reload(): working directory first, then next to this header
    static std::vector<std::filesystem::path> defaultFolders() {
        std::filesystem::path headerDir = std::filesystem::path(__FILE__).parent_path();
        return {"locales", "config/locales", headerDir / "locales"};
    }

    I18n() { reload(); }

    void reload() {
        locales.clear();
        diagnostics.clear();
        for (auto &folder : defaultFolders()) loadFolder(folder);
    }

    static std::string trim(const std::string &s) {
        size_t a = 0, b = s.size();
        while (a < b && isspace((unsigned char)s[a])) ++a;
        while (b > a && isspace((unsigned char)s[b - 1])) --b;
        return s.substr(a, b - a);
    }

    static std::string unescape(const std::string &s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\\' && i + 1 < s.size()) {
                char n = s[++i];
                out.push_back(n == 'n' ? '\n' : n);
            } else out.push_back(s[i]);
        }
        return out;
    }

    static std::string codeOf(const std::filesystem::path &file) {
        std::string code = file.stem().string();
        auto us = code.find('_');
        if (us != std::string::npos) code = code.substr(0, us);
        for (auto &c : code) c = (char)toupper((unsigned char)c);
        return code;
    }

    // parseFile: merge the key=value lines of one file into map
    static bool parseFile(const std::filesystem::path &file, LocaleMap &map) {
        std::ifstream ifs(file);
        if (!ifs) return false;
        std::string line;
        while (std::getline(ifs, line)) {
            std::string t = trim(line);
            if (t.empty() || t[0] == '#') continue;
            auto eq = t.find('=');
            if (eq == std::string::npos) continue;
            map[trim(t.substr(0, eq))] = unescape(trim(t.substr(eq + 1)));
        }
        return true;
    }

    void loadFolder(const std::filesystem::path &folder) {
        std::error_code ec;
        if (!std::filesystem::is_directory(folder, ec)) return;

        std::unordered_map<std::string, std::vector<std::filesystem::path>> filesByCode;
        for (std::filesystem::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec) || it->path().extension() != ".lang") continue;
            filesByCode[codeOf(it->path())].push_back(it->path());
        }
        if (ec) {
            note("i18n: cannot list " + folder.string() + ": " + ec.message());
            return;
        }

        for (auto &kv : filesByCode) {
            LocaleMap merged;
            auto existing = locales.find(kv.first);
            if (existing != locales.end()) merged = existing->second;
            for (auto &file : kv.second) {
                if (!parseFile(file, merged)) note("i18n: cannot read " + file.string());
            }

            std::vector<std::string> missing;
            for (auto &k : requiredKeys) {
                auto f = merged.find(k);
                if (f == merged.end() || f->second.empty()) missing.push_back(k);
            }
            if (!missing.empty()) {
                std::ostringstream oss;
                oss << "i18n: skipped '" << kv.first << "' from " << folder.string() << " - missing keys:";
                for (size_t i = 0; i < missing.size(); ++i) oss << (i ? ", " : " ") << missing[i];
                note(oss.str());
                continue;
            }
            locales[kv.first] = std::move(merged);
            for (auto &file : kv.second) diagnostics.push_back("i18n: loaded '" + kv.first + "' from " + file.string());
        }
    }

    // get: text for id in code, else in the fallback locale, else empty
    std::string get(const std::string &code, const std::string &id) const {
        std::string c = code;
        for (auto &ch : c) ch = (char)toupper((unsigned char)ch);
        for (const std::string &candidate : {c, fallback}) {
            auto it = locales.find(candidate);
            if (it == locales.end()) continue;
            auto v = it->second.find(id);
            if (v != it->second.end() && !v->second.empty()) return v->second;
        }
        return std::string();
    }

    // format: get() with every {NAME} replaced by its value
    std::string format(const std::string &code, const std::string &id,
                       const std::vector<std::pair<std::string, std::string>> &values) const {
        std::string out = get(code, id);
        if (out.empty()) out = id;
        for (auto &kv : values) {
            const std::string placeholder = "{" + kv.first + "}";
            size_t pos = 0;
            while ((pos = out.find(placeholder, pos)) != std::string::npos) {
                out.replace(pos, placeholder.size(), kv.second);
                pos += kv.second.size();
            }
        }
        return out;
    }

    std::vector<std::pair<std::string, std::string>> availableLanguages() const {
        std::vector<std::pair<std::string, std::string>> out;
        for (auto &p : locales) {
            auto name = p.second.find("LANGUAGE_NAME");
            out.emplace_back(p.first, name != p.second.end() ? name->second : p.first);
        }
        return out;
    }

    bool hasLanguage(const std::string &code) const { return locales.count(code) != 0; }
    const std::vector<std::string> &loadDiagnostics() const { return diagnostics; }

private:
    void note(const std::string &msg) {
        std::cerr << msg << "\n";
        diagnostics.push_back(msg);
    }

    std::unordered_map<std::string, LocaleMap> locales;   // code -> (id -> text)
    std::vector<std::string> diagnostics;
};

// Single global instance, reloaded by main() once the working directory is settled
inline I18n i18n;

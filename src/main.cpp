#include "console.h"
#include "preferences.h"
#include "store.h"
#include "view_registry.h"
#include "views.h"

#include "../config/i18n.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

using namespace std;

////////////////////////////////////////////////////////////
// Command line
////////////////////////////////////////////////////////////

struct CommandLine {
    filesystem::path dataDir;      // empty: <project root>/data
    bool noPdf = false;
    bool listLocales = false;
    bool dumpPrefs = false;
    bool help = false;
    string error;
};

static CommandLine parseCommandLine(int argc, char **argv) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if (arg == "--data-dir") {
            if (i + 1 >= argc) { cl.error = "--data-dir needs a directory"; return cl; }
            cl.dataDir = argv[++i];
        } else if (arg == "--no-pdf") cl.noPdf = true;
        else if (arg == "--list-locales") cl.listLocales = true;
        else if (arg == "--dump-prefs") cl.dumpPrefs = true;
        else if (arg == "--help" || arg == "-h") cl.help = true;
        else { cl.error = "unknown option '" + arg + "'"; return cl; }
    }
    return cl;
}

static void printUsage(const char *prog) {
    cout << "Usage: " << prog << " [options]\n"
         << "  --data-dir <dir>  folder holding expenses.csv, income.csv and preferences.json\n"
         << "  --no-pdf          export reports as SVG chart + CSV instead of PDF\n"
         << "  --list-locales    show locale load diagnostics and available languages\n"
         << "  --dump-prefs      print the effective preferences as JSON\n"
         << "  --help            show this text\n";
}

////////////////////////////////////////////////////////////
// Launcher
////////////////////////////////////////////////////////////

// openView: show id and keep following the view ids it hands back until one returns to the launcher
static void openView(AppContext &ctx, string id) {
    while (!id.empty()) {
        auto view = ctx.registry.getOrCreate(id, [&] { return makeView(id, ctx); });
        if (!view) {
            cerr << "Warning: no view named '" << id << "'\n";
            return;
        }
        id = view->show();
    }
}

static void showGuide(const AppContext &ctx) {
    showNotice(tr(ctx, "guide_title"), tr(ctx, "guide_text"));
}

static void runLauncher(AppContext &ctx) {
    while (true) {
        clearScreen();
        cout << "\n" << tr(ctx, "launcher_title") << "\n" << tr(ctx, "launcher_subtitle") << "\n\n";
        cout << tr(ctx, "launcher_menu") << "\n";
        auto open = ctx.registry.openIds();
        if (!open.empty()) {
            string list;
            for (auto &id : open) list += (list.empty() ? "" : ", ") + id;
            cout << "\n" << trf(ctx, "launcher_open_views", {{"VIEWS", list}}) << "\n";
        }

        string choice;
        if (!readLine(tr(ctx, "choice"), choice)) return;
        if (choice == "0") return;

        if (choice == "1") runAction(tr(ctx, "launcher_entry"), [&] { openView(ctx, kEntryViewId); });
        else if (choice == "2") runAction(tr(ctx, "launcher_charts"), [&] { openView(ctx, kChartsViewId); });
        else if (choice == "3") runAction(tr(ctx, "launcher_suggestions"), [&] { openView(ctx, kSuggestionsViewId); });
        else if (choice == "h" || choice == "H") showGuide(ctx);
        else if (!choice.empty()) showNotice(tr(ctx, "notice_title"), tr(ctx, "invalid_choice"));
    }
}

int main(int argc, char **argv) {
    CommandLine cl = parseCommandLine(argc, argv);
    if (!cl.error.empty()) {
        cerr << "Error: " << cl.error << "\n";
        printUsage(argv[0]);
        return 2;
    }
    if (cl.help) {
        printUsage(argv[0]);
        return 0;
    }

    error_code ec;
    // a relative --data-dir is taken relative to where the program was started
    if (!cl.dataDir.empty()) cl.dataDir = filesystem::absolute(cl.dataDir, ec);

    // argv[0] points to the executable in build/ or bin/; the project root is its parent
    filesystem::path exePath = filesystem::canonical(filesystem::path(argv[0]), ec);
    if (ec) exePath = filesystem::absolute(filesystem::path(argv[0]), ec);
    filesystem::path projectRoot = exePath.parent_path().parent_path();
    filesystem::current_path(projectRoot, ec);
    if (ec) cerr << "Warning: cannot change to " << projectRoot << ": " << ec.message() << "\n";

    // reload now that the working directory is correct
    i18n.reload();

    RecordStore store(cl.dataDir.empty() ? projectRoot / "data" : cl.dataDir);
    ViewRegistry registry;
    AppContext ctx(store, registry);
    ctx.prefs = loadPreferences(store.preferencesPath());
    ctx.pdfEnabled = !cl.noPdf;
    if (!i18n.hasLanguage(ctx.prefs.language)) {
        cerr << "Warning: language '" << ctx.prefs.language << "' not available, using " << i18n.fallback << "\n";
    }

    if (cl.listLocales) {
        auto d = i18n.loadDiagnostics();
        if (d.empty()) cout << "No locale diagnostics recorded.\n";
        for (auto &s : d) cout << s << "\n";
        cout << "\nAvailable locales (codes):\n";
        for (auto &p : i18n.availableLanguages()) cout << " - " << p.first << " : " << p.second << "\n";
        return 0;
    }

    if (cl.dumpPrefs) {
        nlohmann::json j = ctx.prefs;
        cout << "# " << store.preferencesPath().string() << "\n" << j.dump(2) << "\n";
        return 0;
    }

    setNoticePrompt(tr(ctx, "press_enter"));
    initTerminalANSI();
    enterAlternateScreen();
    runLauncher(ctx);
    exitAlternateScreen();
    return 0;
}

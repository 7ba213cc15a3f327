#include "console.h"

#ifdef _WIN32
#include <windows.h>
#endif

#include <cctype>
#include <exception>
#include <iostream>

using namespace std;

void initTerminalANSI() {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE) return;

    DWORD mode = 0;
    if (!GetConsoleMode(hOut, &mode)) return;

    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    SetConsoleMode(hOut, mode);
    SetConsoleOutputCP(CP_UTF8);
#endif
}

// \033[2J = clear screen, \033[H = cursor to home (1,1)
void clearScreen() {
    cout << "\033[2J\033[H" << flush;
}

void enterAlternateScreen() {
    cout << "\033[?1049h" << flush;
}

void exitAlternateScreen() {
    cout << "\033[?1049l" << flush;
}

void trim_inplace(string &s) {
    while (!s.empty() && isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && isspace((unsigned char)s.back())) s.pop_back();
}

bool readLine(const string &prompt, string &out) {
    // locale values are trimmed, so the separating space is added here
    cout << prompt;
    if (!prompt.empty() && prompt.back() != ' ') cout << ' ';
    cout << flush;
    string line;
    if (!getline(cin, line)) return false;
    trim_inplace(line);
    out = line;
    return true;
}

bool readLineOr(const string &prompt, const string &fallback, string &out) {
    if (!readLine(prompt, out)) return false;
    if (out.empty()) out = fallback;
    return true;
}

bool confirm(const string &prompt) {
    string resp;
    if (!readLine(prompt, resp)) return false;
    return !resp.empty() && (resp[0] == 'y' || resp[0] == 'Y');
}

static string noticePrompt = "(Enter)";

void setNoticePrompt(const string &prompt) {
    noticePrompt = prompt.empty() ? string("(Enter)") : prompt;
}

void showNotice(const string &title, const string &message) {
    cout << "\n[" << title << "]\n" << message << "\n";
    cout << noticePrompt << " " << flush;
    string ignored;
    getline(cin, ignored);
}

void runAction(const string &title, const function<void()> &action) {
    try {
        action();
    } catch (const exception &e) {
        cerr << "Warning: action '" << title << "' failed: " << e.what() << "\n";
        showNotice(title, e.what());
    }
}

// Bling - terminal helpers shared by the views

#pragma once

#include <functional>
#include <string>

// ---- ANSI terminal helpers ----
void initTerminalANSI();
void clearScreen();
void enterAlternateScreen();
void exitAlternateScreen();

// ---- Input ----
void trim_inplace(std::string &s);

// readLine: print prompt and read one trimmed line; false on end of input
bool readLine(const std::string &prompt, std::string &out);

// readLineOr: like readLine, but an empty answer yields fallback
bool readLineOr(const std::string &prompt, const std::string &fallback, std::string &out);

// confirm: yes/no question, true only for an answer starting with 'y'
bool confirm(const std::string &prompt);

// ---- Notices ----
// showNotice: blocking message box; waits for Enter
// setNoticePrompt: text showNotice() prints before waiting for Enter
void setNoticePrompt(const std::string &prompt);

void showNotice(const std::string &title, const std::string &message);

// runAction: run one user-triggered action; an escaping exception becomes a notice
void runAction(const std::string &title, const std::function<void()> &action);

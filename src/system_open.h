// Bling - hand a file to the desktop's default application

#pragma once

#include <filesystem>
#include <string>

// openWithDefaultApp: xdg-open on Linux, open on macOS, the shell on Windows
// Returns false with a message in error when the handler cannot be started or reports failure.
bool openWithDefaultApp(const std::filesystem::path &path, std::string &error);

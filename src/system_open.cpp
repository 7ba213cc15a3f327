#include "system_open.h"

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
extern char **environ;
#endif

using namespace std;

bool openWithDefaultApp(const filesystem::path &path, string &error) {
#ifdef _WIN32
    HINSTANCE rc = ShellExecuteA(nullptr, "open", path.string().c_str(), nullptr, nullptr, SW_SHOWNORMAL);
    if ((INT_PTR)rc <= 32) {
        error = "ShellExecute failed with code " + to_string((INT_PTR)rc);
        return false;
    }
    return true;
#else
#if defined(__APPLE__)
    const char *handler = "open";
#else
    const char *handler = "xdg-open";
#endif
    string target = path.string();
    char *argv[] = {const_cast<char *>(handler), const_cast<char *>(target.c_str()), nullptr};
    pid_t pid = 0;
    int rc = posix_spawnp(&pid, handler, nullptr, nullptr, argv, environ);
    if (rc != 0) {
        error = string(handler) + ": " + strerror(rc);
        return false;
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = string("waitpid: ") + strerror(errno);
            return false;
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        error = string(handler) + " exited with status " + to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        return false;
    }
    return true;
#endif
}

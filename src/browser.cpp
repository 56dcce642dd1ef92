#include "costtracker/browser.hpp"

#if defined(_WIN32)
#include <windows.h>
#include <shellapi.h>
#else
#include <spawn.h>
#include <sys/wait.h>
#include <cerrno>

extern char** environ;
#endif

#include <string>

namespace costtracker {
namespace {

#if defined(__APPLE__)
constexpr const char* kOpenCommand = "open";
#else
constexpr const char* kOpenCommand = "xdg-open";
#endif

class SystemBrowserLauncher final : public BrowserLauncher {
public:
  bool open(const std::string& url) override {
#if defined(_WIN32)
    auto result = reinterpret_cast<INT_PTR>(
        ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr, SW_SHOWNORMAL));
    return result > 32;
#else
    // argv is passed straight to exec, so the URL is never seen by a shell.
    std::string command = kOpenCommand;
    std::string argument = url;
    char* argv[] = {command.data(), argument.data(), nullptr};

    pid_t pid = 0;
    if (posix_spawnp(&pid, command.c_str(), nullptr, nullptr, argv, environ) != 0) {
      return false;
    }
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
      if (errno != EINTR) {
        return false;
      }
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
#endif
  }
};

}  // namespace

std::unique_ptr<BrowserLauncher> make_system_browser_launcher() {
  return std::make_unique<SystemBrowserLauncher>();
}

}  // namespace costtracker

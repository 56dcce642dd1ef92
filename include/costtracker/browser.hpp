#pragma once

#include <memory>
#include <string>

namespace costtracker {

class BrowserLauncher {
public:
  virtual ~BrowserLauncher() = default;

  // Returns false when no browser could be started.
  virtual bool open(const std::string& url) = 0;
};

/**
 * Uses `xdg-open` on Linux/BSD, `open` on macOS and ShellExecute on Windows.
 */
std::unique_ptr<BrowserLauncher> make_system_browser_launcher();

}  // namespace costtracker

#pragma once

#include <ostream>

#include "costtracker/authorization_receiver.hpp"
#include "costtracker/browser.hpp"
#include "costtracker/cancellation.hpp"
#include "costtracker/config.hpp"
#include "costtracker/http_client.hpp"
#include "costtracker/logging.hpp"

namespace costtracker {

enum class ExitCode : int {
  Success = 0,
  Unexpected = 1,
  ConfigFailure = 2,
  AuthFailure = 3,
  FetchFailure = 4,
  ParseFailure = 5,
  Usage = 64,
};

/**
 * Sign in, fetch the usage details of the configured subscription and print
 * them. The collaborators are borrowed and must outlive the Application.
 */
class Application {
public:
  Application(const Config& config,
              HttpClient& http,
              BrowserLauncher& browser,
              ReceiverFactory receivers,
              Logger logger = {});

  /**
   * Writes the table (or the fetch error) to `out` and sign-in prompts and
   * other failures to `err`. The config is validated first, so out-of-range
   * values end the run before any sign-in. Returns the process exit status.
   */
  int run(std::ostream& out, std::ostream& err, const CancellationToken& cancel = {}) const;

private:
  const Config& config_;
  HttpClient& http_;
  BrowserLauncher& browser_;
  ReceiverFactory receivers_;
  Logger logger_;
};

}  // namespace costtracker

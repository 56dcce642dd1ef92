#include "costtracker/app.hpp"
#include "costtracker/authorization_receiver.hpp"
#include "costtracker/browser.hpp"
#include "costtracker/cancellation.hpp"
#include "costtracker/config.hpp"
#include "costtracker/error.hpp"
#include "costtracker/http_client.hpp"
#include "costtracker/logging.hpp"

#include <csignal>
#include <exception>
#include <iostream>

namespace {

costtracker::CancellationSource& interrupt_source() {
  static costtracker::CancellationSource source;
  return source;
}

void handle_interrupt(int) {
  interrupt_source().cancel();
  // A second Ctrl-C terminates right away.
  std::signal(SIGINT, SIG_DFL);
}

}  // namespace

int main(int argc, char** argv)
{
  using costtracker::ExitCode;

  if (argc > 1)
  {
    std::cerr << "usage: " << argv[0] << "\n"
              << "cost-tracker takes no arguments. Configure it with COST_TRACKER_CLIENT_ID,\n"
              << "COST_TRACKER_TENANT_ID and COST_TRACKER_SUBSCRIPTION_ID, or a JSON file named\n"
              << "by COST_TRACKER_CONFIG.\n";
    return static_cast<int>(ExitCode::Usage);
  }

  costtracker::Config config;
  try
  {
    config = costtracker::load_config();
  }
  catch (const costtracker::ConfigError &error)
  {
    std::cerr << "Configuration error: " << error.what() << '\n';
    return static_cast<int>(ExitCode::ConfigFailure);
  }

  const costtracker::Logger logger(config.log_level, costtracker::make_stream_logger(std::cerr));

  (void)interrupt_source();
  std::signal(SIGINT, handle_interrupt);

  try
  {
    auto http = costtracker::make_default_http_client();
    auto browser = costtracker::make_system_browser_launcher();
    auto receivers = [logger](const std::string &redirect_uri) {
      return costtracker::make_loopback_receiver(redirect_uri, logger);
    };

    costtracker::Application app(config, *http, *browser, receivers, logger);
    return app.run(std::cout, std::cerr, interrupt_source().token());
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error: " << ex.what() << std::endl;
    return static_cast<int>(ExitCode::Unexpected);
  }
}

#include "costtracker/app.hpp"

#include "costtracker/authenticator.hpp"
#include "costtracker/cost_fetcher.hpp"
#include "costtracker/error.hpp"
#include "costtracker/presenter.hpp"
#include "costtracker/usage.hpp"

#include <utility>

namespace costtracker {
namespace {

int status(ExitCode code) {
  return static_cast<int>(code);
}

}  // namespace

Application::Application(const Config& config,
                         HttpClient& http,
                         BrowserLauncher& browser,
                         ReceiverFactory receivers,
                         Logger logger)
    : config_(config),
      http_(http),
      browser_(browser),
      receivers_(std::move(receivers)),
      logger_(std::move(logger)) {}

int Application::run(std::ostream& out, std::ostream& err, const CancellationToken& cancel) const {
  try {
    validate_config(config_);
  } catch (const ConfigError& error) {
    err << "Configuration error: " << error.what() << '\n';
    return status(ExitCode::ConfigFailure);
  }

  AuthenticatorOptions auth_options;
  auth_options.authority_host = config_.authority_host;
  if (config_.login_timeout) {
    auth_options.login_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*config_.login_timeout);
  }
  auth_options.request_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.request_timeout);
  auth_options.on_authorize_url = [&err](const std::string& url) {
    err << "Sign in to Azure in the browser window that opens. If none opens, visit:\n  " << url << '\n';
    err.flush();
  };
  Authenticator authenticator(http_, browser_, receivers_, std::move(auth_options), logger_);

  CostFetcherOptions fetch_options;
  fetch_options.management_endpoint = config_.management_endpoint;
  fetch_options.api_version = config_.api_version;
  fetch_options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.request_timeout);
  CostFetcher fetcher(http_, std::move(fetch_options), logger_);

  CostPresenter presenter(out);

  std::string token;
  try {
    token = authenticator.acquire_token(config_, cancel);
  } catch (const AuthCancelledError& error) {
    err << error.what() << '\n';
    return status(ExitCode::AuthFailure);
  } catch (const AuthError& error) {
    err << "Authentication failed: " << error.what() << '\n';
    return status(ExitCode::AuthFailure);
  }

  if (config_.show_token) {
    presenter.render_token(token);
  }

  nlohmann::json document;
  try {
    document = fetcher.fetch_usage(token, config_.subscription_id);
  } catch (const FetchError& error) {
    presenter.render_fetch_error(error);
    return status(config_.legacy_exit_status ? ExitCode::Success : ExitCode::FetchFailure);
  } catch (const ParseError& error) {
    err << "Error: " << error.what() << '\n';
    return status(ExitCode::ParseFailure);
  }

  const UsageReport report = parse_usage_report(document);
  if (report.value_malformed) {
    logger_.log(LogLevel::Warn, "usage response \"value\" is not an array, treating it as empty");
  }
  presenter.render(report);
  return status(ExitCode::Success);
}

}  // namespace costtracker

#include "costtracker/authorization_receiver.hpp"

#include "costtracker/error.hpp"
#include "costtracker/utils/qs.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace costtracker {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr std::chrono::milliseconds kPollInterval{100};
constexpr std::chrono::seconds kRequestReadTimeout{10};

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// `localhost` listens on 127.0.0.1. Any other host must be a loopback IP literal.
std::optional<net::ip::address> loopback_bind_address(const std::string& host) {
  if (host == "localhost") {
    return net::ip::address(net::ip::address_v4::loopback());
  }
  beast::error_code ec;
  const auto address = net::ip::make_address(host, ec);
  if (ec || !address.is_loopback()) {
    return std::nullopt;
  }
  return address;
}

std::string html_escape(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        escaped += "&amp;";
        break;
      case '<':
        escaped += "&lt;";
        break;
      case '>':
        escaped += "&gt;";
        break;
      case '"':
        escaped += "&quot;";
        break;
      default:
        escaped.push_back(c);
    }
  }
  return escaped;
}

std::string html_page(const std::string& title, const std::string& message) {
  return "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>" + html_escape(title) +
         "</title></head><body><h1>" + html_escape(title) + "</h1><p>" + html_escape(message) +
         "</p></body></html>";
}

std::optional<std::string> find_param(const std::map<std::string, std::string>& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end()) {
    return std::nullopt;
  }
  return it->second;
}

struct Session {
  explicit Session(tcp::socket socket) : stream(std::move(socket)) {}

  beast::tcp_stream stream;
  beast::flat_buffer buffer;
  http::request<http::string_body> request;
  http::response<http::string_body> response;
};

class LoopbackReceiver final : public AuthorizationCodeReceiver {
public:
  LoopbackReceiver(LoopbackAddress address, Logger logger)
      : address_(std::move(address)), logger_(std::move(logger)), acceptor_(io_) {
    beast::error_code ec;
    const auto bind_address = loopback_bind_address(address_.host);
    if (!bind_address) {
      throw AuthError("Redirect URI host must be a loopback address: " + address_.host);
    }
    tcp::endpoint endpoint(*bind_address, address_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
      throw AuthError("Unable to listen for the sign-in redirect on port " + std::to_string(address_.port) +
                      ": " + ec.message());
    }
    port_ = acceptor_.local_endpoint().port();
    logger_.log(LogLevel::Debug, "redirect listener bound", {{"port", port_}});
  }

  ~LoopbackReceiver() override {
    beast::error_code ignored;
    acceptor_.close(ignored);
  }

  std::string redirect_uri() const override {
    const bool ipv6 = address_.host.find(':') != std::string::npos;
    const std::string host = ipv6 ? "[" + address_.host + "]" : address_.host;
    std::string uri = "http://" + host + ":" + std::to_string(port_);
    if (address_.path != "/") {
      uri += address_.path;
    }
    return uri;
  }

  AuthorizationResponse wait_for_response(std::optional<std::chrono::milliseconds> timeout,
                                          const CancellationToken& cancel) override {
    if (!accepting_) {
      accepting_ = true;
      do_accept();
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (timeout) {
      deadline = std::chrono::steady_clock::now() + *timeout;
    }

    while (!response_) {
      if (cancel.is_cancelled()) {
        throw AuthCancelledError("Sign-in was cancelled");
      }
      if (failure_) {
        throw AuthError("Sign-in redirect listener failed: " + *failure_);
      }
      auto slice = std::chrono::duration_cast<std::chrono::steady_clock::duration>(kPollInterval);
      if (deadline) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= *deadline) {
          throw AuthTimeoutError("Timed out waiting for sign-in to complete after " +
                                 std::to_string(std::chrono::duration_cast<std::chrono::seconds>(*timeout).count()) +
                                 " seconds");
        }
        slice = std::min(slice, *deadline - now);
      }
      io_.run_for(slice);
      if (io_.stopped()) {
        io_.restart();
      }
    }
    return *response_;
  }

private:
  void do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (ec) {
        if (ec != net::error::operation_aborted) {
          failure_ = ec.message();
        }
        return;
      }
      auto session = std::make_shared<Session>(std::move(socket));
      session->stream.expires_after(kRequestReadTimeout);
      http::async_read(session->stream, session->buffer, session->request,
                       [this, session](beast::error_code read_ec, std::size_t) { on_request(session, read_ec); });
      do_accept();
    });
  }

  void on_request(const std::shared_ptr<Session>& session, beast::error_code ec) {
    if (ec) {
      logger_.log(LogLevel::Debug, "dropped redirect connection", {{"error", ec.message()}});
      return;
    }

    const auto target = session->request.target();
    const std::string raw_target(target.data(), target.size());
    const auto query_pos = raw_target.find('?');
    const std::string path = raw_target.substr(0, query_pos);
    const std::string query = query_pos == std::string::npos ? std::string() : raw_target.substr(query_pos + 1);

    if (path != address_.path) {
      respond(session, http::status::not_found, html_page("Not found", "Nothing is served here."), std::nullopt);
      return;
    }

    const auto params = utils::qs::parse(query);
    AuthorizationResponse result;
    result.code = find_param(params, "code");
    result.state = find_param(params, "state");
    result.error = find_param(params, "error");
    result.error_description = find_param(params, "error_description");

    if (!result.code && !result.error) {
      respond(session, http::status::bad_request,
              html_page("Sign-in incomplete", "The redirect did not carry an authorization response."),
              std::nullopt);
      return;
    }

    logger_.log(LogLevel::Debug, "sign-in redirect received", {{"has_code", result.code.has_value()},
                                                               {"error", result.error.value_or("")}});
    if (result.error) {
      respond(session, http::status::ok,
              html_page("Sign-in failed", *result.error + ". You can close this window."), std::move(result));
    } else {
      respond(session, http::status::ok,
              html_page("Sign-in complete", "You can close this window and return to cost-tracker."),
              std::move(result));
    }
  }

  void respond(const std::shared_ptr<Session>& session,
               http::status status,
               std::string body,
               std::optional<AuthorizationResponse> result) {
    auto& response = session->response;
    response.version(session->request.version());
    response.result(status);
    response.set(http::field::content_type, "text/html; charset=utf-8");
    response.keep_alive(false);
    response.body() = std::move(body);
    response.prepare_payload();

    http::async_write(session->stream, response,
                      [this, session, result = std::move(result)](beast::error_code ec, std::size_t) mutable {
                        if (ec) {
                          logger_.log(LogLevel::Debug, "failed to answer redirect", {{"error", ec.message()}});
                        }
                        beast::error_code ignored;
                        session->stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
                        if (result && !response_) {
                          response_ = std::move(result);
                        }
                      });
  }

  LoopbackAddress address_;
  Logger logger_;
  net::io_context io_;
  tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  bool accepting_ = false;
  std::optional<AuthorizationResponse> response_;
  std::optional<std::string> failure_;
};

}  // namespace

LoopbackAddress parse_loopback_redirect(const std::string& redirect_uri) {
  constexpr std::string_view kScheme = "http://";
  if (redirect_uri.size() < kScheme.size() || lowercase(redirect_uri.substr(0, kScheme.size())) != kScheme) {
    throw AuthError("Redirect URI must use http:// on a loopback address: " + redirect_uri);
  }

  const std::string rest = redirect_uri.substr(kScheme.size());
  if (rest.find_first_of("?#") != std::string::npos) {
    throw AuthError("Redirect URI must not carry a query or fragment: " + redirect_uri);
  }
  const auto slash = rest.find('/');
  const std::string authority = rest.substr(0, slash);

  LoopbackAddress address;
  address.path = slash == std::string::npos ? "/" : rest.substr(slash);

  std::string port_text;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      throw AuthError("Malformed IPv6 host in redirect URI: " + redirect_uri);
    }
    address.host = authority.substr(1, close - 1);
    const std::string tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        throw AuthError("Malformed redirect URI: " + redirect_uri);
      }
      port_text = tail.substr(1);
    }
  } else {
    const auto colon = authority.find(':');
    address.host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_text = authority.substr(colon + 1);
    }
  }
  address.host = lowercase(address.host);

  if (!loopback_bind_address(address.host)) {
    throw AuthError("Redirect URI host must be a loopback address: " + redirect_uri);
  }

  if (!port_text.empty()) {
    if (port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
      throw AuthError("Invalid port in redirect URI: " + redirect_uri);
    }
    const long port = std::stol(port_text);
    if (port < 1 || port > 65535) {
      throw AuthError("Invalid port in redirect URI: " + redirect_uri);
    }
    address.port = static_cast<unsigned short>(port);
  }
  return address;
}

std::unique_ptr<AuthorizationCodeReceiver> make_loopback_receiver(const std::string& redirect_uri, Logger logger) {
  return std::make_unique<LoopbackReceiver>(parse_loopback_redirect(redirect_uri), std::move(logger));
}

}  // namespace costtracker

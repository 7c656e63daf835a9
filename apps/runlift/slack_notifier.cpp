// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "slack_notifier.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>

#include <chrono>
#include <regex>
#include <string>

#define RUNLIFT_LOG_COMPONENT "slack_notifier"
#include <runlift_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace runlift {
namespace app {

namespace {

std::string join_runs(const std::vector<std::string>& runs) {
  std::string joined;
  for (size_t i = 0; i < runs.size(); ++i) {
    if (i > 0) {
      joined += "\n\t\t• ";
    }
    joined += runs[i];
  }
  return joined;
}

std::string plural(size_t count) {
  return count == 1 ? "" : "s";
}

// Resolves host and connects the stream's socket, then calls on_connected.
// Any failure is stored in outcome and ends the chain.
template <typename Stream, typename OnConnected>
void async_connect_to(
  tcp::resolver& resolver, Stream& stream, const std::string& host, const std::string& port,
  beast::error_code& outcome, OnConnected on_connected
) {
  resolver.async_resolve(
    host, port,
    [&stream, &outcome, on_connected](beast::error_code ec, tcp::resolver::results_type results) {
      if (ec) {
        outcome = ec;
        return;
      }
      beast::get_lowest_layer(stream).async_connect(
        results,
        [&outcome, on_connected](beast::error_code ec, tcp::endpoint) {
          if (ec) {
            outcome = ec;
            return;
          }
          on_connected();
        }
      );
    }
  );
}

template <typename Stream>
void async_exchange(
  Stream& stream, http::request<http::string_body>& req, beast::flat_buffer& buffer,
  http::response<http::string_body>& res, beast::error_code& outcome
) {
  http::async_write(
    stream, req,
    [&stream, &buffer, &res, &outcome](beast::error_code ec, std::size_t) {
      if (ec) {
        outcome = ec;
        return;
      }
      http::async_read(
        stream, buffer, res, [&outcome](beast::error_code ec, std::size_t) { outcome = ec; }
      );
    }
  );
}

// Runs the queued operations until they finish or timeout passes. On expiry
// the socket is closed so pending operations complete with an error.
// Returns false if the deadline was hit.
bool run_with_deadline(
  net::io_context& ioc, tcp::resolver& resolver, beast::tcp_stream& socket,
  std::chrono::seconds timeout
) {
  ioc.run_for(timeout);
  if (ioc.stopped()) {
    return true;
  }
  resolver.cancel();
  socket.close();
  ioc.run();
  return false;
}

}  // namespace

std::string formatRunSummary(
  const std::vector<std::string>& completed, const std::vector<std::string>& failed
) {
  std::string message;

  if (!completed.empty()) {
    message += ":white_check_mark:  *S3 Upload*: Successfully uploaded ";
    message += std::to_string(completed.size()) + " run" + plural(completed.size());
    message += "\n\t\t• " + join_runs(completed);
  }

  if (!failed.empty()) {
    if (!message.empty()) {
      message += "\n\n";
    }
    message += ":x:  *S3 Upload*: Failed uploading ";
    message += std::to_string(failed.size()) + " run" + plural(failed.size());
    message += "\n\t\t• " + join_runs(failed);
  }

  return message;
}

bool parseWebhookUrl(
  const std::string& url, std::string& host, std::string& port, std::string& target, bool& use_ssl
) {
  static const std::regex url_regex(R"(^(https?)://([^/:]+)(?::(\d+))?(.*)$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return false;
  }

  std::string scheme = match[1].str();
  host = match[2].str();
  std::string port_str = match[3].str();
  target = match[4].str();

  if (target.empty()) {
    target = "/";
  }

  use_ssl = (scheme.size() == 5);  // "https", any case
  if (port_str.empty()) {
    port = use_ssl ? "443" : "80";
  } else {
    port = port_str;
  }

  return true;
}

// ============================================================================
// SlackNotifier Implementation
// ============================================================================

SlackNotifier::SlackNotifier(SlackConfig config, std::chrono::seconds timeout)
    : config_(std::move(config))
    , timeout_(timeout) {}

void SlackNotifier::notifyRunSummary(
  const std::vector<std::string>& completed, const std::vector<std::string>& failed
) {
  if (completed.empty() && failed.empty()) {
    return;
  }

  if (config_.alert_webhook.empty()) {
    postMessage(config_.log_webhook, formatRunSummary(completed, failed));
    return;
  }

  if (!completed.empty()) {
    postMessage(config_.log_webhook, formatRunSummary(completed, {}));
  }
  if (!failed.empty()) {
    postMessage(config_.alert_webhook, formatRunSummary({}, failed));
  }
}

void SlackNotifier::alert(const std::string& message) {
  const std::string& url =
    config_.alert_webhook.empty() ? config_.log_webhook : config_.alert_webhook;
  postMessage(url, message);
}

WebhookResult SlackNotifier::postMessage(const std::string& url, const std::string& message) {
  WebhookResult result;

  if (url.empty()) {
    result.error_message = "No webhook configured";
    RUNLIFT_LOG_DEBUG("Skipping Slack message, no webhook configured");
    return result;
  }

  std::string host, port, target;
  bool use_ssl = false;
  if (!parseWebhookUrl(url, host, port, target, use_ssl)) {
    result.error_message = "Invalid webhook URL";
    RUNLIFT_LOG_ERROR("Invalid Slack webhook URL");
    return result;
  }

  RUNLIFT_LOG_INFO("Posting message to Slack");

  nlohmann::json payload = {{"text", message}};

  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);

    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "runlift/1.0");
    req.set(http::field::content_type, "application/json");
    req.body() = payload.dump();
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    // Set by the last handler in the chain; would_block means it never ran
    beast::error_code outcome = net::error::would_block;
    bool finished = false;

    if (use_ssl) {
      ssl::context ctx(ssl::context::tlsv12_client);
      ctx.set_default_verify_paths();
      ctx.set_verify_mode(ssl::verify_peer);

      beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

      // Slack sits behind SNI
      if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        result.error_message = "SNI hostname failed: " + ec.message();
        RUNLIFT_LOG_ERROR(
          "Error in post request to Slack" << ::runlift::logging::kv("error", result.error_message)
        );
        return result;
      }

      async_connect_to(resolver, stream, host, port, outcome, [&]() {
        stream.async_handshake(ssl::stream_base::client, [&](beast::error_code ec) {
          if (ec) {
            outcome = ec;
            return;
          }
          async_exchange(stream, req, buffer, res, outcome);
        });
      });
      // The reply is complete once read; close_notify is not waited for
      finished = run_with_deadline(ioc, resolver, beast::get_lowest_layer(stream), timeout_);
    } else {
      beast::tcp_stream stream(ioc);

      async_connect_to(resolver, stream, host, port, outcome, [&]() {
        async_exchange(stream, req, buffer, res, outcome);
      });
      finished = run_with_deadline(ioc, resolver, stream, timeout_);

      if (finished && !outcome) {
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
          RUNLIFT_LOG_DEBUG("Socket shutdown" << ::runlift::logging::kv("error", ec.message()));
        }
      }
    }

    if (!finished) {
      result.error_message =
        "Timed out after " + std::to_string(timeout_.count()) + "s posting to Slack";
      RUNLIFT_LOG_ERROR(
        "Error in post request to Slack" << ::runlift::logging::kv("error", result.error_message)
      );
      return result;
    }
    if (outcome) {
      result.error_message = outcome.message();
      RUNLIFT_LOG_ERROR(
        "Error in post request to Slack" << ::runlift::logging::kv("error", result.error_message)
      );
      return result;
    }

    result.status_code = static_cast<int>(res.result_int());
    result.response_body = res.body();

    if (result.status_code >= 200 && result.status_code < 300) {
      result.success = true;
    } else {
      result.error_message = "Slack returned status " + std::to_string(result.status_code);
      RUNLIFT_LOG_ERROR(
        "Error in post request to Slack" << ::runlift::logging::kv("status", result.status_code)
                                          << ::runlift::logging::kv("body", result.response_body)
      );
    }
  } catch (const std::exception& e) {
    result.error_message = e.what();
    RUNLIFT_LOG_ERROR("Error in post request to Slack" << ::runlift::logging::kv("error", e.what()));
  }

  return result;
}

}  // namespace app
}  // namespace runlift

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_APP_SLACK_NOTIFIER_HPP
#define RUNLIFT_APP_SLACK_NOTIFIER_HPP

#include <chrono>
#include <string>
#include <vector>

#include "notifier.hpp"
#include "runlift_config.hpp"

namespace runlift {
namespace app {

/**
 * Result of a webhook POST.
 */
struct WebhookResult {
  bool success = false;
  int status_code = 0;
  std::string error_message;
  std::string response_body;
};

/**
 * Build the Slack text for a cycle summary:
 *
 *   :white_check_mark:  *S3 Upload*: Successfully uploaded 2 runs
 *   		• run_a
 *   		• run_b
 *
 * followed by a ":x:  *S3 Upload*: Failed uploading ..." block when any
 * run failed. Returns an empty string when both lists are empty.
 */
std::string formatRunSummary(
  const std::vector<std::string>& completed, const std::vector<std::string>& failed
);

/**
 * Split a webhook URL of the form http(s)://host(:port)/path.
 */
bool parseWebhookUrl(
  const std::string& url, std::string& host, std::string& port, std::string& target, bool& use_ssl
);

/**
 * Notifier posting {"text": ...} payloads to Slack incoming webhooks with
 * Boost.Beast. Completed runs go to the log webhook, failed runs and alerts
 * to the alert webhook, or to the log webhook when no alert webhook is set.
 */
class SlackNotifier : public INotifier {
public:
  explicit SlackNotifier(
    SlackConfig config, std::chrono::seconds timeout = std::chrono::seconds(30)
  );
  ~SlackNotifier() override = default;

  // Non-copyable
  SlackNotifier(const SlackNotifier&) = delete;
  SlackNotifier& operator=(const SlackNotifier&) = delete;

  void notifyRunSummary(
    const std::vector<std::string>& completed, const std::vector<std::string>& failed
  ) override;

  void alert(const std::string& message) override;

  /**
   * POST {"text": message} to url. Non-2xx responses and transport errors
   * are logged and returned, never thrown.
   */
  WebhookResult postMessage(const std::string& url, const std::string& message);

  const SlackConfig& config() const {
    return config_;
  }

private:
  SlackConfig config_;
  std::chrono::seconds timeout_;
};

}  // namespace app
}  // namespace runlift

#endif  // RUNLIFT_APP_SLACK_NOTIFIER_HPP

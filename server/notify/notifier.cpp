#include "server/notify/notifier.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace agentfw {

WebhookNotifier::WebhookNotifier(std::string url,
                                 std::shared_ptr<UpstreamTransport> transport)
    : url_(std::move(url)), transport_(std::move(transport)) {}

void WebhookNotifier::Send(const std::string& message) {
  if (url_.empty() || !transport_) {
    return;
  }
  auto payload = json({{"content", message}}).dump(-1, ' ', false,
                                                   json::error_handler_t::replace);
  try {
    auto response = transport_->Forward(
        "POST", url_, {{"content-type", "application/json"}}, payload);
    if (response.status < 200 || response.status >= 300) {
      log::Warn("notify", "alert webhook rejected message",
                "status=" + std::to_string(response.status));
    }
  } catch (const std::exception& ex) {
    log::Warn("notify", "alert webhook delivery failed", ex.what());
  }
}

}  // namespace agentfw

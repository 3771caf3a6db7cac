#pragma once

#include "net/upstream_transport.h"

#include <memory>
#include <string>

namespace agentfw {

// Outbound alert channel. Delivery is best-effort: Send never throws.
class Notifier {
 public:
  virtual ~Notifier() = default;
  virtual void Send(const std::string& message) = 0;
};

// Posts {"content": message} to a webhook (Discord-compatible payload).
class WebhookNotifier : public Notifier {
 public:
  WebhookNotifier(std::string url, std::shared_ptr<UpstreamTransport> transport);

  void Send(const std::string& message) override;
  const std::string& Url() const { return url_; }

 private:
  std::string url_;
  std::shared_ptr<UpstreamTransport> transport_;
};

}  // namespace agentfw

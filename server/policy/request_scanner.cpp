#include "server/policy/request_scanner.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>
#include <re2/re2.h>

using json = nlohmann::json;

namespace agentfw {

RequestScanner::RequestScanner(const std::string& patterns_json)
    : compiled_(Compile(patterns_json)) {}

RequestScanner::~RequestScanner() = default;

std::shared_ptr<const RequestScanner::PatternSet> RequestScanner::Compile(
    const std::string& patterns_json) {
  auto patterns = std::make_shared<PatternSet>();
  if (patterns_json.empty()) {
    return patterns;
  }
  json parsed;
  try {
    parsed = json::parse(patterns_json);
  } catch (const json::exception& ex) {
    log::Warn("scanner", "scan pattern list is not valid JSON; inbound scanning disabled",
              ex.what());
    return nullptr;
  }
  if (!parsed.is_array()) {
    log::Warn("scanner", "scan pattern list must be a JSON array; inbound scanning disabled");
    return nullptr;
  }

  re2::RE2::Options options;
  options.set_case_sensitive(false);
  options.set_log_errors(false);
  for (const auto& item : parsed) {
    if (!item.is_string()) {
      log::Warn("scanner", "skipping non-string scan pattern", item.dump());
      continue;
    }
    auto source = item.get<std::string>();
    auto re = std::make_unique<re2::RE2>(source, options);
    if (!re->ok()) {
      log::Warn("scanner", "skipping malformed scan pattern",
                "pattern=" + source + " error=" + re->error());
      continue;
    }
    patterns->push_back({source, std::move(re)});
  }
  return patterns;
}

bool RequestScanner::Enabled() const { return compiled_ && !compiled_->empty(); }

std::optional<std::string> RequestScanner::Scan(const std::string& body) const {
  if (!compiled_) {
    return std::nullopt;
  }
  for (const auto& pattern : *compiled_) {
    if (re2::RE2::PartialMatch(body, *pattern.re)) {
      return pattern.source;
    }
  }
  return std::nullopt;
}

}  // namespace agentfw

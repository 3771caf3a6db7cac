#include "server/policy/response_scanner.h"

#include <nlohmann/json.hpp>
#include <re2/re2.h>

#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace agentfw {

namespace {

void AddTag(std::vector<std::string>* matched, const std::string& tag) {
  if (std::find(matched->begin(), matched->end(), tag) == matched->end()) {
    matched->push_back(tag);
  }
}

// Replaces every occurrence of `needle`; returns the number replaced.
std::size_t ReplaceAll(std::string* haystack, const std::string& needle,
                       const std::string& replacement) {
  if (needle.empty()) {
    return 0;
  }
  std::size_t count = 0;
  std::string out;
  std::size_t pos = 0;
  while (true) {
    auto hit = haystack->find(needle, pos);
    if (hit == std::string::npos) {
      break;
    }
    out.append(*haystack, pos, hit - pos);
    out.append(replacement);
    pos = hit + needle.size();
    ++count;
  }
  if (count == 0) {
    return 0;
  }
  out.append(*haystack, pos, std::string::npos);
  *haystack = std::move(out);
  return count;
}

}  // namespace

const std::vector<std::string>& ResponseScanner::BuiltinPatternSources() {
  static const std::vector<std::string> kSources = {
      R"(sk-[a-zA-Z0-9_-]{20,})",          // OpenAI, DeepSeek, Anthropic sk-ant-*
      R"(ghp_[a-zA-Z0-9]{36})",            // GitHub personal access tokens
      R"(eyJ[a-zA-Z0-9_-]{20,})",          // JWT
      R"(AKIA[A-Z0-9]{16})",               // AWS access key IDs
      R"(rpa_[a-zA-Z0-9]{40,})",           // RunPod
      R"(xox[bpras]-[a-zA-Z0-9-]{10,})",   // Slack
      R"([0-9]+:AA[a-zA-Z0-9_-]{30,})",    // Telegram bot tokens
      R"([a-f0-9]{64})",                   // 64-char hex gateway tokens
      R"([a-f0-9]{8}-[a-f0-9]{4}-[a-f0-9]{4}-[a-f0-9]{4}-[a-f0-9]{12}:[a-f0-9]{32})",  // fal.ai
  };
  return kSources;
}

ResponseScanner::ResponseScanner() {
  re2::RE2::Options options;
  options.set_log_errors(false);
  for (const auto& source : BuiltinPatternSources()) {
    auto re = std::make_unique<re2::RE2>(source, options);
    if (!re->ok()) {
      throw std::logic_error("invalid built-in response pattern " + source +
                             ": " + re->error());
    }
    patterns_.push_back(
        {"pattern:" + source.substr(0, kTagExcerptLength), std::move(re)});
  }
}

ResponseScanner::~ResponseScanner() = default;

std::string ResponseScanner::RedactText(
    const std::string& text, const std::vector<SecretDescriptor>& known_secrets,
    std::vector<std::string>* matched) const {
  std::string scanned = text;

  for (const auto& secret : known_secrets) {
    if (ReplaceAll(&scanned, secret.value, kRedactionMarker) > 0) {
      AddTag(matched, "known:" + secret.name);
    }
  }

  for (const auto& pattern : patterns_) {
    if (re2::RE2::GlobalReplace(&scanned, *pattern.re, kRedactionMarker) > 0) {
      AddTag(matched, pattern.tag);
    }
  }
  return scanned;
}

ResponseScanResult ResponseScanner::Scan(
    const std::string& response_text,
    const std::vector<SecretDescriptor>& known_secrets) const {
  ResponseScanResult result;
  result.text = response_text;

  json parsed;
  try {
    parsed = json::parse(response_text);
  } catch (const json::exception&) {
    return result;
  }
  if (!parsed.is_object() || !parsed.contains("choices") ||
      !parsed["choices"].is_array()) {
    return result;
  }

  std::vector<std::string> matched;
  for (auto& choice : parsed["choices"]) {
    if (!choice.is_object() || !choice.contains("message") ||
        !choice["message"].is_object()) {
      continue;
    }
    auto& message = choice["message"];
    if (!message.contains("content") || !message["content"].is_string()) {
      continue;
    }
    const auto content = message["content"].get<std::string>();
    auto scanned = RedactText(content, known_secrets, &matched);
    if (scanned != content) {
      message["content"] = scanned;
    }
  }

  if (!matched.empty()) {
    result.text = parsed.dump(-1, ' ', false, json::error_handler_t::replace);
    result.matched = std::move(matched);
  }
  return result;
}

}  // namespace agentfw

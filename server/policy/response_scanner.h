#pragma once

#include "server/policy/credential_vault.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace agentfw {

struct ResponseScanResult {
  // Redacted body when anything matched, otherwise the input unchanged.
  std::string text;
  // Distinct "known:<name>" / "pattern:<excerpt>" tags in detection order.
  std::vector<std::string> matched;

  bool Redacted() const { return !matched.empty(); }
};

// Outbound content firewall for completion objects. Only `choices[*].message
// .content` strings are examined; any other body passes through untouched.
// Pattern matching is linear in the content length.
class ResponseScanner {
 public:
  static constexpr const char* kRedactionMarker = "[REDACTED-BY-AGENTFW]";
  static constexpr std::size_t kTagExcerptLength = 30;

  ResponseScanner();
  ~ResponseScanner();

  ResponseScanResult Scan(const std::string& response_text,
                          const std::vector<SecretDescriptor>& known_secrets) const;

  // Both layers over one string. Appends tags not already in `matched`.
  std::string RedactText(const std::string& text,
                         const std::vector<SecretDescriptor>& known_secrets,
                         std::vector<std::string>* matched) const;

  static const std::vector<std::string>& BuiltinPatternSources();

 private:
  struct CompiledPattern {
    std::string tag;
    std::unique_ptr<re2::RE2> re;
  };
  std::vector<CompiledPattern> patterns_;
};

}  // namespace agentfw

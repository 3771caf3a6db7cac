#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace agentfw {

// Inbound secret scanner. Patterns are operator data: a JSON array of regular
// expressions taken from config, compiled once at startup.
//
// Fails open on misconfiguration: an unparsable pattern list disables
// scanning, and a malformed individual pattern is skipped. Matching runs in
// time linear in the body, so arbitrarily long token runs are safe.
class RequestScanner {
 public:
  RequestScanner() = default;
  explicit RequestScanner(const std::string& patterns_json);
  ~RequestScanner();

  bool Enabled() const;

  // First configured pattern (in order) that matches anywhere in `body`,
  // case-insensitively.
  std::optional<std::string> Scan(const std::string& body) const;

 private:
  struct CompiledPattern {
    std::string source;
    std::unique_ptr<re2::RE2> re;
  };
  using PatternSet = std::vector<CompiledPattern>;

  // nullptr when the configuration itself is not a JSON array of strings.
  static std::shared_ptr<const PatternSet> Compile(
      const std::string& patterns_json);

  std::shared_ptr<const PatternSet> compiled_;
};

}  // namespace agentfw

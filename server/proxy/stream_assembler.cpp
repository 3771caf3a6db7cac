#include "server/proxy/stream_assembler.h"

#include <nlohmann/json.hpp>

#include <sstream>

using json = nlohmann::json;

namespace agentfw {

namespace {

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t\r\n");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

// Returns the string at `key` when present and non-empty.
bool NonEmptyString(const json& obj, const char* key, std::string* out) {
  if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) {
    return false;
  }
  auto value = obj[key].get<std::string>();
  if (value.empty()) {
    return false;
  }
  *out = std::move(value);
  return true;
}

}  // namespace

bool IsEventStream(const std::string& content_type) {
  return content_type.find("text/event-stream") != std::string::npos;
}

std::string AssembleEventStream(const std::string& raw_event_stream) {
  std::string id;
  std::string model = "unknown";
  std::string role = "assistant";
  std::string content;
  std::string finish_reason;
  json created;
  json usage;

  std::istringstream lines(raw_event_stream);
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.rfind("data:", 0) != 0) {
      continue;
    }
    auto data = Trim(line.substr(5));
    if (data.empty() || data == "[DONE]") {
      continue;
    }

    json chunk;
    try {
      chunk = json::parse(data);
    } catch (const json::exception&) {
      continue;
    }
    if (!chunk.is_object()) {
      continue;
    }

    NonEmptyString(chunk, "id", &id);
    NonEmptyString(chunk, "model", &model);
    if (chunk.contains("created") && chunk["created"].is_number()) {
      created = chunk["created"];
    }
    if (chunk.contains("usage") && chunk["usage"].is_object()) {
      usage = chunk["usage"];
    }
    if (!chunk.contains("choices") || !chunk["choices"].is_array() ||
        chunk["choices"].empty()) {
      continue;
    }
    const auto& choice = chunk["choices"][0];
    if (!choice.is_object()) {
      continue;
    }
    NonEmptyString(choice, "finish_reason", &finish_reason);
    if (choice.contains("delta") && choice["delta"].is_object()) {
      const auto& delta = choice["delta"];
      NonEmptyString(delta, "role", &role);
      if (delta.contains("content") && delta["content"].is_string()) {
        content += delta["content"].get<std::string>();
      }
    }
  }

  json assembled;
  assembled["id"] = id.empty() ? "chatcmpl-assembled" : id;
  assembled["object"] = "chat.completion";
  if (!created.is_null()) {
    assembled["created"] = created;
  }
  assembled["model"] = model;
  assembled["choices"] = json::array(
      {{{"index", 0},
        {"message", {{"role", role}, {"content", content}}},
        {"finish_reason", finish_reason.empty() ? "stop" : finish_reason}}});
  if (!usage.is_null()) {
    assembled["usage"] = usage;
  }
  return assembled.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace agentfw

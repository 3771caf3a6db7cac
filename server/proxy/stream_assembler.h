#pragma once

#include <string>

namespace agentfw {

// Rebuilds the single chat.completion object a non-streaming call would have
// returned from an event-stream body of chat.completion.chunk frames.
//
// Non-data lines and the [DONE] sentinel are ignored; an undecodable frame is
// skipped. id/model/role/finish_reason keep the last non-empty value seen and
// content deltas are concatenated in order.
std::string AssembleEventStream(const std::string& raw_event_stream);

// True for "text/event-stream" content types, parameters ignored.
bool IsEventStream(const std::string& content_type);

}  // namespace agentfw

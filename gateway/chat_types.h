#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vertexbridge {

enum class Role { kSystem, kUser, kAssistant };

const char *RoleName(Role role);
// Accepts "system", "user" and "assistant"; returns false for anything else.
bool ParseRole(const std::string &name, Role *role);

// A single conversation turn. Immutable once constructed.
class ChatMessage {
public:
  ChatMessage(Role role, std::string content)
      : role_(role), content_(std::move(content)) {}

  Role role() const { return role_; }
  const std::string &content() const { return content_; }

private:
  Role role_;
  std::string content_;
};

// Inbound chat-completion request after validation. Owned by the handling
// request scope; never mutated after parsing. messages is non-empty and in
// chronological order (last = most recent).
struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  std::optional<double> temperature; // [0, 2]
  std::optional<double> top_p;       // [0, 1]
  std::optional<int> max_output_tokens;
  std::vector<std::string> stop;
  bool stream{false};
};

// Soft target (preferred) and hard ceiling (maximum) for context size.
// Invariant: 0 < preferred <= maximum.
struct TokenBudget {
  int preferred{0};
  int maximum{0};

  bool Valid() const { return preferred > 0 && preferred <= maximum; }
};

// Result of context trimming; a copy, never an alias of the request history.
struct TrimmedContext {
  std::vector<ChatMessage> messages;
  int estimated_tokens{0};
  std::size_t dropped_messages{0};
  // Only the most recent turn was kept and it does not fit the preferred
  // budget (or, when degraded, the maximum). Callers still forward it.
  bool over_preferred{false};
  bool degraded{false};
};

enum class FinishReason { kStop, kLength, kContentFilter };

const char *FinishReasonName(FinishReason reason);

struct Usage {
  int prompt_tokens{0};
  int completion_tokens{0};
  int total_tokens{0};
};

struct CompletionChoice {
  int index{0};
  std::string role{"assistant"};
  std::string content;
  FinishReason finish_reason{FinishReason::kStop};
};

struct CompletionResponse {
  std::string id;
  std::string model;
  std::int64_t created{0};
  std::vector<CompletionChoice> choices;
  Usage usage;
};

// One unit of the caller-facing streaming protocol, already framed as SSE.
struct CallerStreamEvent {
  enum class Kind { kDelta, kTerminal, kError };
  Kind kind{Kind::kDelta};
  std::string frame;
};

} // namespace vertexbridge

#include "gateway/context_window.h"

#include <stdexcept>

namespace vertexbridge {

TrimmedContext
ContextWindowManager::Trim(const std::vector<ChatMessage> &messages,
                           const TokenBudget &budget) const {
  if (!budget.Valid()) {
    throw std::invalid_argument(
        "token budget requires 0 < preferred <= maximum");
  }

  TrimmedContext result;
  if (messages.empty()) {
    return result;
  }

  std::vector<int> cost;
  cost.reserve(messages.size());
  int total = 0;
  for (const auto &message : messages) {
    int tokens = estimator_.Estimate(message);
    cost.push_back(tokens);
    total += tokens;
  }

  if (total <= budget.preferred) {
    result.messages = messages;
    result.estimated_tokens = total;
    return result;
  }

  const bool has_system = messages.front().role() == Role::kSystem;
  const std::size_t first_turn = has_system ? 1 : 0;
  const std::size_t n = messages.size();
  const int system_tokens = has_system ? cost.front() : 0;

  // Only a system message: it is the most recent message, keep it.
  if (first_turn == n) {
    result.messages.push_back(messages.front());
    result.estimated_tokens = system_tokens;
    result.over_preferred = system_tokens > budget.preferred;
    result.degraded = system_tokens > budget.maximum;
    return result;
  }

  int running = system_tokens;
  std::size_t keep_from = n;
  for (std::size_t i = n; i-- > first_turn;) {
    if (running + cost[i] > budget.preferred) {
      break;
    }
    running += cost[i];
    keep_from = i;
  }

  if (keep_from == n) {
    keep_from = n - 1;
    running = system_tokens + cost.back();
    result.over_preferred = true;
    result.degraded = running > budget.maximum;
  }

  result.messages.reserve(n - keep_from + first_turn);
  if (has_system) {
    result.messages.push_back(messages.front());
  }
  for (std::size_t i = keep_from; i < n; ++i) {
    result.messages.push_back(messages[i]);
  }
  result.estimated_tokens = running;
  result.dropped_messages = keep_from - first_turn;
  return result;
}

} // namespace vertexbridge

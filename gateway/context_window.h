#pragma once

#include "backend/token_estimator.h"
#include "gateway/chat_types.h"

#include <vector>

namespace vertexbridge {

// Fits a conversation into a token budget by dropping the oldest turns.
//
// A leading system message is always retained. The remaining turns are kept
// most-recent-first while the running estimate stays within
// budget.preferred, so the output is the system message (if any) followed by
// a chronological suffix of the input. When not even the newest turn fits,
// that turn is kept anyway and the result is flagged over_preferred (and
// degraded when it also exceeds budget.maximum); the conversation is never
// emptied.
class ContextWindowManager {
public:
  explicit ContextWindowManager(const TokenEstimator &estimator)
      : estimator_(estimator) {}

  // Throws std::invalid_argument when the budget violates
  // 0 < preferred <= maximum.
  TrimmedContext Trim(const std::vector<ChatMessage> &messages,
                      const TokenBudget &budget) const;

private:
  const TokenEstimator &estimator_;
};

} // namespace vertexbridge

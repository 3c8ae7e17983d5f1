#pragma once

#include "gateway/chat_types.h"

#include <string>

namespace vertexbridge {

// Approximate token counter supplied by the backend collaborator.
class TokenEstimator {
public:
  virtual ~TokenEstimator() = default;
  virtual int Estimate(const ChatMessage &message) const = 0;
};

// 1.3 tokens per whitespace-separated word of content, truncated.
class WordTokenEstimator : public TokenEstimator {
public:
  static constexpr double kTokensPerWord = 1.3;

  int Estimate(const ChatMessage &message) const override;

  static int EstimateText(const std::string &text);
};

} // namespace vertexbridge

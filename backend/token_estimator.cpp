#include "backend/token_estimator.h"

#include <cctype>

namespace vertexbridge {

int WordTokenEstimator::Estimate(const ChatMessage &message) const {
  return EstimateText(message.content());
}

int WordTokenEstimator::EstimateText(const std::string &text) {
  std::size_t words = 0;
  bool in_word = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      in_word = false;
      continue;
    }
    if (!in_word) {
      ++words;
      in_word = true;
    }
  }
  return static_cast<int>(static_cast<double>(words) * kTokensPerWord);
}

} // namespace vertexbridge

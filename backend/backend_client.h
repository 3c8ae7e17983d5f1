#pragma once

#include "backend/token_estimator.h"
#include "gateway/errors.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vertexbridge {

// Backend-native request (Gemini generateContent shape). Built by
// RequestTranslator; serialized by the concrete client.
struct BackendContent {
  std::string role; // "user" | "model"
  std::string text;
};

struct BackendRequest {
  std::string model;
  std::optional<std::string> system_instruction;
  std::vector<BackendContent> contents;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<int> max_output_tokens;
  std::vector<std::string> stop_sequences;
};

// Backend finish vocabulary. kBlocked means the prompt itself was rejected
// (promptFeedback.blockReason) and no candidate was produced.
enum class BackendFinishReason {
  kUnspecified,
  kStop,
  kMaxTokens,
  kSafety,
  kRecitation,
  kBlocklist,
  kProhibitedContent,
  kSpii,
  kMalformedFunctionCall,
  kOther,
  kBlocked,
};

BackendFinishReason ParseBackendFinishReason(const std::string &name);

struct BackendUsage {
  int prompt_tokens{0};
  int candidates_tokens{0};
  int total_tokens{0};
};

struct BackendChunk {
  std::string delta_text;
  std::optional<BackendFinishReason> finish_reason;
  std::optional<BackendUsage> usage;
};

struct BackendCompletion {
  std::string text;
  BackendFinishReason finish_reason{BackendFinishReason::kStop};
  BackendUsage usage;
};

struct BackendBlocked {
  std::string reason;
  BackendUsage usage;
};

struct BackendFailure {
  ErrorKind kind{ErrorKind::kUpstreamError};
  std::string message;
  int upstream_status{0};
};

struct StreamEnd {};

using BackendResponse =
    std::variant<BackendCompletion, BackendBlocked, BackendFailure>;
using BackendStreamItem = std::variant<BackendChunk, BackendFailure, StreamEnd>;

// Pull-based, finite, non-restartable sequence of backend stream items.
class ChunkStream {
public:
  virtual ~ChunkStream() = default;

  // Blocks until the next item is available. After StreamEnd or a
  // BackendFailure every further call returns StreamEnd.
  virtual BackendStreamItem Next() = 0;

  // Abandons the stream and releases the transport. Idempotent.
  virtual void Cancel() = 0;
};

// Returns true when the caller has gone away and the call may be abandoned.
using CancelCheck = std::function<bool()>;

class BackendClient {
public:
  virtual ~BackendClient() = default;

  virtual BackendResponse Generate(const BackendRequest &request,
                                   const CancelCheck &cancelled) = 0;

  // Throws GatewayError when the stream cannot be opened.
  virtual std::unique_ptr<ChunkStream>
  GenerateStream(const BackendRequest &request) = 0;

  virtual const TokenEstimator &Estimator() const = 0;

  virtual std::string Name() const = 0;
};

} // namespace vertexbridge

#pragma once

#include "backend/backend_client.h"
#include "gateway/chat_types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace vertexbridge {

// Backend finish vocabulary -> caller vocabulary {stop, length,
// content_filter}. Safety, recitation, blocklist, prohibited-content, SPII
// and prompt blocks are content_filter; MAX_TOKENS is length; everything
// else is stop.
FinishReason MapFinishReason(BackendFinishReason reason);

// Converts backend results into OpenAI chat.completion / chat.completion.chunk
// payloads. One instance per request: it carries the completion id, model
// and creation time that every payload of that request repeats.
class ResponseTranslator {
public:
  ResponseTranslator(std::string id, std::string model, std::int64_t created);

  static std::string NewCompletionId();
  static std::int64_t NowSeconds();

  // Throws GatewayError for a BackendFailure. Usage numbers are the
  // backend's own counts.
  CompletionResponse Translate(const BackendResponse &response) const;

  static std::string Render(const CompletionResponse &response);

  // Delta event for one backend chunk. sequence_index 0 also announces the
  // assistant role.
  CallerStreamEvent TranslateChunk(const BackendChunk &chunk,
                                   std::size_t sequence_index) const;

  CallerStreamEvent TerminalEvent(FinishReason reason,
                                  const std::optional<Usage> &usage) const;

  static const char *DoneFrame() { return "data: [DONE]\n\n"; }

  static Usage ToUsage(const BackendUsage &usage);

  const std::string &id() const { return id_; }
  const std::string &model() const { return model_; }

private:
  std::string id_;
  std::string model_;
  std::int64_t created_;
};

} // namespace vertexbridge

#pragma once

#include "backend/backend_client.h"
#include "gateway/chat_types.h"
#include "gateway/context_window.h"
#include "gateway/model_catalog.h"
#include "gateway/request_translator.h"
#include "gateway/stream_relay.h"
#include "server/auth/rate_limiter.h"
#include "server/metrics/metrics.h"

#include <string>
#include <utility>
#include <vector>

namespace vertexbridge {

// What the transport should do with one chat-completion request.
struct ServiceReply {
  int status{200};
  std::string status_text{"OK"};
  std::string content_type{"application/json"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
  // The SSE response was written to the sink; nothing more to send.
  bool streamed{false};
  // The caller went away; the connection should be closed without a reply.
  bool client_gone{false};
};

// Runs admission, parsing, trimming, translation and the backend call for
// one request. Shared by all worker threads; per-request state lives on the
// stack of Handle().
class ChatService {
public:
  ChatService(BackendClient &backend, const ModelCatalog &catalog,
              RateLimiter &limiter, TokenBudget budget,
              MetricsRegistry *metrics = nullptr);

  // `path_model` is the {model_id} of /v1/models/{model_id}/chat, empty for
  // /v1/chat/completions. Streaming requests write to `sink`;
  // `disconnected` lets a non-streaming backend call be abandoned.
  ServiceReply Handle(const std::string &body, const std::string &path_model,
                      StreamSink &sink, const CancelCheck &disconnected);

  const TokenBudget &budget() const { return budget_; }
  const ModelCatalog &catalog() const { return catalog_; }

private:
  ServiceReply ErrorReply(const GatewayError &error);
  ServiceReply Complete(const ChatRequest &request,
                        const BackendRequest &backend_request,
                        const CancelCheck &disconnected);
  ServiceReply Stream(const ChatRequest &request,
                      const BackendRequest &backend_request, StreamSink &sink);

  BackendClient &backend_;
  const ModelCatalog &catalog_;
  RateLimiter &limiter_;
  TokenBudget budget_;
  MetricsRegistry *metrics_;
  ContextWindowManager trimmer_;
  RequestTranslator translator_;
};

} // namespace vertexbridge

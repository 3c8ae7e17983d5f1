#include "gateway/chat_service.h"

#include "gateway/chat_request.h"
#include "gateway/errors.h"
#include "gateway/response_translator.h"
#include "server/logging/logger.h"

#include <algorithm>
#include <stdexcept>

namespace vertexbridge {

ChatService::ChatService(BackendClient &backend, const ModelCatalog &catalog,
                         RateLimiter &limiter, TokenBudget budget,
                         MetricsRegistry *metrics)
    : backend_(backend), catalog_(catalog), limiter_(limiter),
      budget_(budget), metrics_(metrics), trimmer_(backend.Estimator()),
      translator_(catalog) {
  if (!budget_.Valid()) {
    throw std::invalid_argument(
        "context budget requires 0 < preferred <= maximum");
  }
}

ServiceReply ChatService::Handle(const std::string &body,
                                 const std::string &path_model,
                                 StreamSink &sink,
                                 const CancelCheck &disconnected) {
  if (metrics_) {
    metrics_->RecordRequest();
  }
  if (!limiter_.Admit()) {
    if (metrics_) {
      metrics_->RecordRateLimited();
    }
    log::Warn("ratelimit", "request rejected",
              "limit=" + std::to_string(limiter_.CurrentLimit()));
    auto reply = ErrorReply(GatewayError(
        ErrorKind::kRateLimited,
        "Rate limit exceeded. Please try again later."));
    reply.headers.emplace_back(
        "Retry-After", std::to_string(std::max(1, limiter_.SecondsUntilReset())));
    return reply;
  }

  try {
    ChatRequest request =
        ParseChatRequest(body, catalog_.DefaultModel(), path_model);
    if (!catalog_.Supports(request.model)) {
      throw GatewayError(ErrorKind::kInvalidModel,
                         "Model '" + request.model + "' not found", "model");
    }

    TrimmedContext context = trimmer_.Trim(request.messages, budget_);
    if (context.dropped_messages > 0) {
      log::Info("context", "trimmed conversation history",
                "dropped=" + std::to_string(context.dropped_messages) +
                    " tokens=" + std::to_string(context.estimated_tokens));
    }
    if (context.degraded) {
      log::Warn("context", "most recent message exceeds maximum context size",
                "tokens=" + std::to_string(context.estimated_tokens) +
                    " max=" + std::to_string(budget_.maximum));
    } else if (context.over_preferred) {
      log::Warn("context",
                "most recent message exceeds preferred context size",
                "tokens=" + std::to_string(context.estimated_tokens) +
                    " preferred=" + std::to_string(budget_.preferred));
    }
    if (metrics_) {
      metrics_->RecordContextTrim(context.dropped_messages, context.degraded);
    }

    BackendRequest backend_request = translator_.Translate(context, request);
    if (request.stream) {
      return Stream(request, backend_request, sink);
    }
    return Complete(request, backend_request, disconnected);
  } catch (const GatewayError &ex) {
    return ErrorReply(ex);
  } catch (const std::exception &ex) {
    log::Error("service", "unhandled failure", ex.what());
    return ErrorReply(GatewayError(ErrorKind::kInternal, ex.what()));
  }
}

ServiceReply ChatService::Complete(const ChatRequest &request,
                                   const BackendRequest &backend_request,
                                   const CancelCheck &disconnected) {
  ResponseTranslator translator(ResponseTranslator::NewCompletionId(),
                                request.model, ResponseTranslator::NowSeconds());
  BackendResponse response = backend_.Generate(backend_request, disconnected);
  CompletionResponse completion = translator.Translate(response);
  if (metrics_) {
    metrics_->RecordSuccess(request.model, completion.usage.prompt_tokens,
                            completion.usage.completion_tokens);
  }
  log::Debug("service", "completion",
             "id=" + completion.id + " model=" + completion.model);
  ServiceReply reply;
  reply.body = ResponseTranslator::Render(completion);
  return reply;
}

ServiceReply ChatService::Stream(const ChatRequest &request,
                                 const BackendRequest &backend_request,
                                 StreamSink &sink) {
  ResponseTranslator translator(ResponseTranslator::NewCompletionId(),
                                request.model, ResponseTranslator::NowSeconds());
  StreamRelay relay(backend_, sink, translator);
  RelayOutcome outcome = relay.Run(backend_request);

  ServiceReply reply;
  reply.streamed = outcome.opened;
  switch (outcome.state) {
  case RelayState::kCompleted:
    if (metrics_) {
      metrics_->RecordStreamCompleted(outcome.delta_events);
      Usage usage = outcome.usage.value_or(Usage{});
      metrics_->RecordSuccess(request.model, usage.prompt_tokens,
                              usage.completion_tokens);
    }
    return reply;
  case RelayState::kAborted:
    if (metrics_) {
      metrics_->RecordStreamAborted();
      metrics_->RecordError(ErrorKind::kClientDisconnected);
    }
    reply.client_gone = true;
    return reply;
  case RelayState::kFailed:
    break;
  case RelayState::kIdle:
  case RelayState::kConnecting:
  case RelayState::kStreaming:
    throw std::logic_error(std::string("relay finished in state ") +
                           RelayStateName(outcome.state));
  }

  ErrorKind kind = outcome.error.value_or(ErrorKind::kUpstreamError);
  if (metrics_) {
    metrics_->RecordStreamFailed();
  }
  if (!outcome.opened) {
    return ErrorReply(GatewayError(kind, outcome.error_message, {},
                                   outcome.upstream_status));
  }
  if (metrics_) {
    metrics_->RecordError(kind);
  }
  log::Error("relay", "stream failed after open",
             std::string("kind=") + ErrorKindName(kind) +
                 " message=" + outcome.error_message);
  return reply;
}

ServiceReply ChatService::ErrorReply(const GatewayError &error) {
  if (metrics_) {
    metrics_->RecordError(error.kind());
  }
  ServiceReply reply;
  if (error.kind() == ErrorKind::kClientDisconnected) {
    log::Debug("service", "client disconnected", error.what());
    reply.client_gone = true;
    reply.status = 499;
    return reply;
  }
  MappedError mapped = ErrorMapper::Map(error);
  if (mapped.status >= 500) {
    log::Error("service", error.what(),
               std::string("kind=") + ErrorKindName(error.kind()) +
                   (error.upstream_status()
                        ? " upstream_status=" +
                              std::to_string(error.upstream_status())
                        : std::string()));
  } else {
    log::Info("service", error.what(),
              std::string("kind=") + ErrorKindName(error.kind()));
  }
  reply.status = mapped.status;
  reply.status_text = mapped.status_text;
  reply.body = mapped.body;
  return reply;
}

} // namespace vertexbridge

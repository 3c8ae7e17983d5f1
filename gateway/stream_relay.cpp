#include "gateway/stream_relay.h"

#include "server/logging/logger.h"

#include <stdexcept>
#include <utility>

namespace vertexbridge {

const char *RelayStateName(RelayState state) {
  switch (state) {
  case RelayState::kIdle:
    return "idle";
  case RelayState::kConnecting:
    return "connecting";
  case RelayState::kStreaming:
    return "streaming";
  case RelayState::kCompleted:
    return "completed";
  case RelayState::kAborted:
    return "aborted";
  case RelayState::kFailed:
    return "failed";
  }
  return "idle";
}

RelayOutcome StreamRelay::Run(const BackendRequest &request) {
  if (state_ != RelayState::kIdle) {
    throw std::logic_error("StreamRelay::Run called twice");
  }
  state_ = RelayState::kConnecting;

  RelayOutcome outcome;
  StreamSession session;
  try {
    session.stream = backend_.GenerateStream(request);
  } catch (const GatewayError &ex) {
    state_ = RelayState::kFailed;
    outcome.state = state_;
    outcome.error = ex.kind();
    outcome.error_message = ex.what();
    outcome.upstream_status = ex.upstream_status();
    return outcome;
  }
  if (!session.stream) {
    state_ = RelayState::kFailed;
    outcome.state = state_;
    outcome.error = ErrorKind::kInternal;
    outcome.error_message = "backend returned no stream";
    return outcome;
  }

  if (sink_.Disconnected() || !sink_.Open()) {
    return Abort(session, std::move(outcome));
  }
  outcome.opened = true;

  while (true) {
    if (sink_.Disconnected()) {
      return Abort(session, std::move(outcome));
    }

    BackendStreamItem item;
    try {
      item = session.stream->Next();
    } catch (const GatewayError &ex) {
      return Fail(session, std::move(outcome), ex.kind(), ex.what(),
                  ex.upstream_status());
    } catch (const std::exception &ex) {
      return Fail(session, std::move(outcome), ErrorKind::kUpstreamError,
                  ex.what(), 0);
    }
    state_ = RelayState::kStreaming;

    if (std::holds_alternative<StreamEnd>(item)) {
      return Fail(session, std::move(outcome), ErrorKind::kUpstreamError,
                  "backend stream ended without a finish reason", 0);
    }
    if (const auto *failure = std::get_if<BackendFailure>(&item)) {
      return Fail(session, std::move(outcome), failure->kind,
                  failure->message, failure->upstream_status);
    }

    const auto &chunk = std::get<BackendChunk>(item);
    if (chunk.usage) {
      outcome.usage = ResponseTranslator::ToUsage(*chunk.usage);
    }
    if (!chunk.delta_text.empty()) {
      auto event = translator_.TranslateChunk(chunk, session.emitted);
      if (!sink_.Send(event.frame)) {
        return Abort(session, std::move(outcome));
      }
      session.accumulated += chunk.delta_text;
      ++session.emitted;
    }
    if (chunk.finish_reason) {
      FinishReason reason = MapFinishReason(*chunk.finish_reason);
      auto terminal = translator_.TerminalEvent(reason, outcome.usage);
      outcome.finish_reason = reason;
      outcome.text = session.accumulated;
      outcome.delta_events = session.emitted;
      if (!sink_.Send(terminal.frame) ||
          !sink_.Send(ResponseTranslator::DoneFrame())) {
        return Abort(session, std::move(outcome));
      }
      state_ = RelayState::kCompleted;
      outcome.state = state_;
      return outcome;
    }
  }
}

RelayOutcome StreamRelay::Abort(StreamSession &session, RelayOutcome outcome) {
  if (session.stream) {
    session.stream->Cancel();
  }
  state_ = RelayState::kAborted;
  outcome.state = state_;
  outcome.text = session.accumulated;
  outcome.delta_events = session.emitted;
  log::Debug("relay", "client disconnected; backend stream cancelled",
             "id=" + translator_.id() +
                 " events=" + std::to_string(session.emitted));
  return outcome;
}

RelayOutcome StreamRelay::Fail(StreamSession &session, RelayOutcome outcome,
                               ErrorKind kind, const std::string &message,
                               int upstream_status) {
  session.stream->Cancel();
  state_ = RelayState::kFailed;
  outcome.state = state_;
  outcome.error = kind;
  outcome.error_message = message;
  outcome.upstream_status = upstream_status;
  outcome.text = session.accumulated;
  outcome.delta_events = session.emitted;
  auto mapped = ErrorMapper::Map(kind, message);
  if (!sink_.Send(ErrorMapper::StreamErrorFrame(mapped))) {
    log::Debug("relay", "client gone before error event could be written",
               "id=" + translator_.id());
  }
  return outcome;
}

} // namespace vertexbridge

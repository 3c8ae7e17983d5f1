#pragma once

#include "backend/backend_client.h"
#include "gateway/chat_types.h"
#include "gateway/errors.h"
#include "gateway/response_translator.h"

#include <memory>
#include <optional>
#include <string>

namespace vertexbridge {

enum class RelayState {
  kIdle,
  kConnecting,
  kStreaming,
  kCompleted,
  kAborted,
  kFailed,
};

const char *RelayStateName(RelayState state);

// Caller-side transport of one streaming response.
class StreamSink {
public:
  virtual ~StreamSink() = default;

  // Sends the response head (status line and SSE headers). Called once,
  // after the backend stream is open and before the first event.
  virtual bool Open() = 0;

  // Writes one frame. Returns false when the client is gone.
  virtual bool Send(const std::string &frame) = 0;

  // Non-blocking probe: true once the client has closed its connection.
  virtual bool Disconnected() = 0;
};

struct RelayOutcome {
  RelayState state{RelayState::kIdle};
  // False when the backend stream could not be opened; nothing was written
  // to the sink and the caller still owes the client a complete response.
  bool opened{false};
  std::size_t delta_events{0};
  std::string text;
  std::optional<FinishReason> finish_reason;
  std::optional<Usage> usage;
  std::optional<ErrorKind> error;
  std::string error_message;
  int upstream_status{0};
};

// Drives one backend stream to the caller:
//
//   Idle -> Connecting -> Streaming -> {Completed, Aborted, Failed}
//
// Chunks are translated and written in arrival order, one at a time.
// Completed emits exactly one terminal event followed by [DONE]. Aborted
// (client gone) cancels the backend stream and emits nothing further.
// Failed emits a single error event built by ErrorMapper and closes.
class StreamRelay {
public:
  StreamRelay(BackendClient &backend, StreamSink &sink,
              const ResponseTranslator &translator)
      : backend_(backend), sink_(sink), translator_(translator) {}

  StreamRelay(const StreamRelay &) = delete;
  StreamRelay &operator=(const StreamRelay &) = delete;

  // One relay drives one stream; a second call throws std::logic_error.
  RelayOutcome Run(const BackendRequest &request);

  RelayState state() const { return state_; }

private:
  // Exclusively owned by Run(); released on every exit path.
  struct StreamSession {
    std::unique_ptr<ChunkStream> stream;
    std::string accumulated;
    std::size_t emitted{0};
  };

  RelayOutcome Abort(StreamSession &session, RelayOutcome outcome);
  RelayOutcome Fail(StreamSession &session, RelayOutcome outcome,
                    ErrorKind kind, const std::string &message,
                    int upstream_status);

  BackendClient &backend_;
  StreamSink &sink_;
  const ResponseTranslator &translator_;
  RelayState state_{RelayState::kIdle};
};

} // namespace vertexbridge

#pragma once

#include <stdexcept>
#include <string>

namespace vertexbridge {

// Every failure the gateway can surface to a caller. ErrorMapper::Map is a
// switch over this enum with no default, so adding a kind without a mapping
// fails to compile under -Werror=switch.
enum class ErrorKind {
  kRateLimited,
  kInvalidRequest,
  kInvalidModel,
  kUpstreamAuth,
  kUpstreamUnavailable,
  kUpstreamError,
  kClientDisconnected,
  kInternal,
};

const char *ErrorKindName(ErrorKind kind);

class GatewayError : public std::runtime_error {
public:
  GatewayError(ErrorKind kind, const std::string &message,
               std::string param = {}, int upstream_status = 0);

  ErrorKind kind() const { return kind_; }
  const std::string &param() const { return param_; }
  // HTTP status reported by the backend, 0 when the failure never reached it.
  int upstream_status() const { return upstream_status_; }

private:
  ErrorKind kind_;
  std::string param_;
  int upstream_status_;
};

struct MappedError {
  int status{500};
  std::string status_text;
  std::string body; // {"error":{"type","message","code","param"?}}
};

class ErrorMapper {
public:
  static MappedError Map(const GatewayError &error);
  static MappedError Map(ErrorKind kind, const std::string &message,
                         const std::string &param = {});

  // Anything that is not a GatewayError is an internal fault.
  static MappedError MapException(const std::exception &error);

  // SSE frame carrying the same error body a non-streaming caller would get.
  static std::string StreamErrorFrame(const MappedError &mapped);
};

} // namespace vertexbridge

#include "gateway/errors.h"

#include <nlohmann/json.hpp>

#include <utility>

using json = nlohmann::json;

namespace vertexbridge {

namespace {

struct ErrorEntry {
  int status;
  const char *status_text;
  const char *type;
  const char *code;
};

ErrorEntry Lookup(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kRateLimited:
    return {429, "Too Many Requests", "rate_limit_exceeded", "rate_limit"};
  case ErrorKind::kInvalidRequest:
    return {400, "Bad Request", "invalid_request", "invalid_request"};
  case ErrorKind::kInvalidModel:
    return {400, "Bad Request", "model_not_found", "model_not_found"};
  case ErrorKind::kUpstreamAuth:
    return {502, "Bad Gateway", "upstream_auth_error", "upstream_auth"};
  case ErrorKind::kUpstreamUnavailable:
    return {503, "Service Unavailable", "upstream_unavailable",
            "upstream_unavailable"};
  case ErrorKind::kUpstreamError:
    return {500, "Internal Server Error", "upstream_error", "upstream_error"};
  case ErrorKind::kClientDisconnected:
    // Never written to the wire; kept so the mapping stays total.
    return {499, "Client Closed Request", "client_disconnected",
            "client_disconnected"};
  case ErrorKind::kInternal:
    return {500, "Internal Server Error", "server_error", "server_error"};
  }
  return {500, "Internal Server Error", "server_error", "server_error"};
}

} // namespace

const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kRateLimited:
    return "rate_limited";
  case ErrorKind::kInvalidRequest:
    return "invalid_request";
  case ErrorKind::kInvalidModel:
    return "invalid_model";
  case ErrorKind::kUpstreamAuth:
    return "upstream_auth";
  case ErrorKind::kUpstreamUnavailable:
    return "upstream_unavailable";
  case ErrorKind::kUpstreamError:
    return "upstream_error";
  case ErrorKind::kClientDisconnected:
    return "client_disconnected";
  case ErrorKind::kInternal:
    return "internal";
  }
  return "internal";
}

GatewayError::GatewayError(ErrorKind kind, const std::string &message,
                           std::string param, int upstream_status)
    : std::runtime_error(message), kind_(kind), param_(std::move(param)),
      upstream_status_(upstream_status) {}

MappedError ErrorMapper::Map(const GatewayError &error) {
  return Map(error.kind(), error.what(), error.param());
}

MappedError ErrorMapper::Map(ErrorKind kind, const std::string &message,
                             const std::string &param) {
  auto entry = Lookup(kind);
  json err = {{"type", entry.type},
              {"message", message.empty() ? entry.type : message},
              {"code", entry.code}};
  if (!param.empty()) {
    err["param"] = param;
  }
  MappedError mapped;
  mapped.status = entry.status;
  mapped.status_text = entry.status_text;
  mapped.body = json({{"error", err}}).dump();
  return mapped;
}

MappedError ErrorMapper::MapException(const std::exception &error) {
  if (auto *gateway = dynamic_cast<const GatewayError *>(&error)) {
    return Map(*gateway);
  }
  return Map(ErrorKind::kInternal, error.what());
}

std::string ErrorMapper::StreamErrorFrame(const MappedError &mapped) {
  return "data: " + mapped.body + "\n\n";
}

} // namespace vertexbridge

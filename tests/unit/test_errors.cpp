#include <catch2/catch.hpp>

#include "gateway/errors.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>
#include <vector>

using json = nlohmann::json;
using vertexbridge::ErrorKind;
using vertexbridge::ErrorMapper;

TEST_CASE("ErrorMapper maps every kind to exactly one status", "[errors]") {
  const std::vector<std::pair<ErrorKind, int>> table{
      {ErrorKind::kRateLimited, 429},
      {ErrorKind::kInvalidRequest, 400},
      {ErrorKind::kInvalidModel, 400},
      {ErrorKind::kUpstreamAuth, 502},
      {ErrorKind::kUpstreamUnavailable, 503},
      {ErrorKind::kUpstreamError, 500},
      {ErrorKind::kClientDisconnected, 499},
      {ErrorKind::kInternal, 500},
  };
  for (const auto &[kind, status] : table) {
    auto mapped = ErrorMapper::Map(kind, "boom");
    INFO(vertexbridge::ErrorKindName(kind));
    REQUIRE(mapped.status == status);
    REQUIRE_FALSE(mapped.status_text.empty());
    auto body = json::parse(mapped.body);
    REQUIRE(body["error"]["message"] == "boom");
    REQUIRE(body["error"]["type"].is_string());
    REQUIRE(body["error"]["code"].is_string());
  }
}

TEST_CASE("ErrorMapper body carries param only when present", "[errors]") {
  auto with_param = json::parse(
      ErrorMapper::Map(vertexbridge::GatewayError(ErrorKind::kInvalidModel,
                                                  "Model 'x' not found",
                                                  "model"))
          .body);
  REQUIRE(with_param["error"]["type"] == "model_not_found");
  REQUIRE(with_param["error"]["code"] == "model_not_found");
  REQUIRE(with_param["error"]["param"] == "model");

  auto without = json::parse(
      ErrorMapper::Map(ErrorKind::kRateLimited, "slow down").body);
  REQUIRE(without["error"]["type"] == "rate_limit_exceeded");
  REQUIRE(without["error"]["code"] == "rate_limit");
  REQUIRE_FALSE(without["error"].contains("param"));
}

TEST_CASE("ErrorMapper treats foreign exceptions as internal", "[errors]") {
  auto mapped = ErrorMapper::MapException(std::out_of_range("index"));
  REQUIRE(mapped.status == 500);
  REQUIRE(json::parse(mapped.body)["error"]["type"] == "server_error");

  vertexbridge::GatewayError upstream(ErrorKind::kUpstreamAuth, "denied", {},
                                      403);
  const std::exception &as_base = upstream;
  auto gateway = ErrorMapper::MapException(as_base);
  REQUIRE(gateway.status == 502);
  REQUIRE(upstream.upstream_status() == 403);
}

TEST_CASE("ErrorMapper frames stream errors as one SSE event", "[errors]") {
  auto mapped = ErrorMapper::Map(ErrorKind::kUpstreamError, "cut off");
  auto frame = ErrorMapper::StreamErrorFrame(mapped);
  REQUIRE(frame == "data: " + mapped.body + "\n\n");
}

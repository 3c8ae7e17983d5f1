#include <catch2/catch.hpp>

#include "gateway/errors.h"
#include "gateway/response_translator.h"

#include <nlohmann/json.hpp>

#include <set>
#include <utility>
#include <vector>

using json = nlohmann::json;
using vertexbridge::BackendFinishReason;
using vertexbridge::FinishReason;

namespace {

json Payload(const std::string &frame) {
  REQUIRE(frame.rfind("data: ", 0) == 0);
  REQUIRE(frame.size() > 8);
  REQUIRE(frame.substr(frame.size() - 2) == "\n\n");
  return json::parse(frame.substr(6, frame.size() - 8));
}

} // namespace

TEST_CASE("MapFinishReason folds backend reasons into three values",
          "[response]") {
  const std::vector<std::pair<BackendFinishReason, FinishReason>> table{
      {BackendFinishReason::kStop, FinishReason::kStop},
      {BackendFinishReason::kUnspecified, FinishReason::kStop},
      {BackendFinishReason::kOther, FinishReason::kStop},
      {BackendFinishReason::kMalformedFunctionCall, FinishReason::kStop},
      {BackendFinishReason::kMaxTokens, FinishReason::kLength},
      {BackendFinishReason::kSafety, FinishReason::kContentFilter},
      {BackendFinishReason::kRecitation, FinishReason::kContentFilter},
      {BackendFinishReason::kBlocklist, FinishReason::kContentFilter},
      {BackendFinishReason::kProhibitedContent, FinishReason::kContentFilter},
      {BackendFinishReason::kSpii, FinishReason::kContentFilter},
      {BackendFinishReason::kBlocked, FinishReason::kContentFilter},
  };
  for (const auto &[backend, expected] : table) {
    REQUIRE(vertexbridge::MapFinishReason(backend) == expected);
  }
}

TEST_CASE("ResponseTranslator renders a completed response", "[response]") {
  vertexbridge::ResponseTranslator translator("chatcmpl-1", "gemini-test",
                                              1700000000);
  vertexbridge::BackendCompletion completion{
      "Hello!", BackendFinishReason::kMaxTokens, {4, 2, 6}};

  auto response = translator.Translate(completion);
  REQUIRE(response.choices.size() == 1);
  REQUIRE(response.choices[0].content == "Hello!");
  REQUIRE(response.choices[0].finish_reason == FinishReason::kLength);
  REQUIRE(response.usage.total_tokens == 6);

  auto body = json::parse(vertexbridge::ResponseTranslator::Render(response));
  REQUIRE(body["id"] == "chatcmpl-1");
  REQUIRE(body["object"] == "chat.completion");
  REQUIRE(body["created"] == 1700000000);
  REQUIRE(body["model"] == "gemini-test");
  REQUIRE(body["choices"][0]["index"] == 0);
  REQUIRE(body["choices"][0]["message"]["role"] == "assistant");
  REQUIRE(body["choices"][0]["message"]["content"] == "Hello!");
  REQUIRE(body["choices"][0]["finish_reason"] == "length");
  REQUIRE(body["usage"]["prompt_tokens"] == 4);
  REQUIRE(body["usage"]["completion_tokens"] == 2);
}

TEST_CASE("ResponseTranslator turns a blocked prompt into content_filter",
          "[response]") {
  vertexbridge::ResponseTranslator translator("id", "m", 1);
  auto response =
      translator.Translate(vertexbridge::BackendBlocked{"SAFETY", {3, 0, 3}});
  REQUIRE(response.choices[0].content.empty());
  REQUIRE(response.choices[0].finish_reason == FinishReason::kContentFilter);
  REQUIRE(response.usage.prompt_tokens == 3);
}

TEST_CASE("ResponseTranslator raises backend failures", "[response]") {
  vertexbridge::ResponseTranslator translator("id", "m", 1);
  vertexbridge::BackendFailure failure{
      vertexbridge::ErrorKind::kUpstreamAuth, "backend returned HTTP 403", 403};
  try {
    translator.Translate(failure);
    FAIL("expected GatewayError");
  } catch (const vertexbridge::GatewayError &ex) {
    REQUIRE(ex.kind() == vertexbridge::ErrorKind::kUpstreamAuth);
    REQUIRE(ex.upstream_status() == 403);
  }
}

TEST_CASE("TranslateChunk announces the role only on the first delta",
          "[response][stream]") {
  vertexbridge::ResponseTranslator translator("chatcmpl-2", "m", 5);
  vertexbridge::BackendChunk chunk{"Hel", std::nullopt, std::nullopt};

  auto first = translator.TranslateChunk(chunk, 0);
  REQUIRE(first.kind == vertexbridge::CallerStreamEvent::Kind::kDelta);
  auto first_json = Payload(first.frame);
  REQUIRE(first_json["object"] == "chat.completion.chunk");
  REQUIRE(first_json["choices"][0]["delta"]["role"] == "assistant");
  REQUIRE(first_json["choices"][0]["delta"]["content"] == "Hel");
  REQUIRE(first_json["choices"][0]["finish_reason"].is_null());

  auto second = Payload(translator.TranslateChunk(chunk, 1).frame);
  REQUIRE_FALSE(second["choices"][0]["delta"].contains("role"));
  REQUIRE(second["id"] == first_json["id"]);
}

TEST_CASE("TerminalEvent carries finish reason and optional usage",
          "[response][stream]") {
  vertexbridge::ResponseTranslator translator("chatcmpl-3", "m", 5);

  auto bare = translator.TerminalEvent(FinishReason::kStop, std::nullopt);
  REQUIRE(bare.kind == vertexbridge::CallerStreamEvent::Kind::kTerminal);
  auto bare_json = Payload(bare.frame);
  REQUIRE(bare_json["choices"][0]["finish_reason"] == "stop");
  REQUIRE(bare_json["choices"][0]["delta"].empty());
  REQUIRE_FALSE(bare_json.contains("usage"));

  vertexbridge::Usage usage{2, 3, 5};
  auto with_usage =
      Payload(translator.TerminalEvent(FinishReason::kContentFilter, usage)
                  .frame);
  REQUIRE(with_usage["choices"][0]["finish_reason"] == "content_filter");
  REQUIRE(with_usage["usage"]["total_tokens"] == 5);
  REQUIRE(std::string(vertexbridge::ResponseTranslator::DoneFrame()) ==
          "data: [DONE]\n\n");
}

TEST_CASE("ToUsage derives a missing total", "[response]") {
  auto usage = vertexbridge::ResponseTranslator::ToUsage({7, 5, 0});
  REQUIRE(usage.prompt_tokens == 7);
  REQUIRE(usage.completion_tokens == 5);
  REQUIRE(usage.total_tokens == 12);
  REQUIRE(vertexbridge::ResponseTranslator::ToUsage({7, 5, 20}).total_tokens ==
          20);
}

TEST_CASE("NewCompletionId is prefixed and unique", "[response]") {
  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) {
    auto id = vertexbridge::ResponseTranslator::NewCompletionId();
    REQUIRE(id.rfind("chatcmpl-", 0) == 0);
    ids.insert(id);
  }
  REQUIRE(ids.size() == 100);
}

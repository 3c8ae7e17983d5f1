#include <catch2/catch.hpp>

#include "fake_backend.h"
#include "gateway/response_translator.h"
#include "gateway/stream_relay.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;
using vertexbridge::BackendFinishReason;
using vertexbridge::fakes::Chunk;
using vertexbridge::fakes::FramePayload;

namespace {

vertexbridge::ResponseTranslator MakeTranslator() {
  return vertexbridge::ResponseTranslator("chatcmpl-test", "gemini-test",
                                          1700000000);
}

vertexbridge::BackendRequest MakeRequest() {
  vertexbridge::BackendRequest request;
  request.model = "gemini-test";
  request.contents.push_back({"user", "Say hello"});
  return request;
}

} // namespace

TEST_CASE("StreamRelay relays chunks in order then one terminal event",
          "[relay]") {
  vertexbridge::fakes::FakeBackend backend;
  backend.stream_items = {Chunk("Hel"), Chunk("lo, "), Chunk("world"),
                          Chunk("", BackendFinishReason::kStop)};
  vertexbridge::fakes::MemorySink sink;
  auto translator = MakeTranslator();
  vertexbridge::StreamRelay relay(backend, sink, translator);

  auto outcome = relay.Run(MakeRequest());

  REQUIRE(outcome.state == vertexbridge::RelayState::kCompleted);
  REQUIRE(relay.state() == vertexbridge::RelayState::kCompleted);
  REQUIRE(outcome.opened);
  REQUIRE(sink.open_calls == 1);
  REQUIRE(outcome.delta_events == 3);
  REQUIRE(outcome.text == "Hello, world");
  REQUIRE(outcome.finish_reason == vertexbridge::FinishReason::kStop);

  // Three deltas, terminal, [DONE].
  REQUIRE(sink.frames.size() == 5);
  std::string joined;
  for (int i = 0; i < 3; ++i) {
    auto event = json::parse(FramePayload(sink.frames[i]));
    REQUIRE(event["object"] == "chat.completion.chunk");
    REQUIRE(event["id"] == "chatcmpl-test");
    REQUIRE(event["choices"][0]["finish_reason"].is_null());
    joined += event["choices"][0]["delta"]["content"].get<std::string>();
  }
  REQUIRE(joined == "Hello, world");
  auto first = json::parse(FramePayload(sink.frames[0]));
  auto second = json::parse(FramePayload(sink.frames[1]));
  REQUIRE(first["choices"][0]["delta"]["role"] == "assistant");
  REQUIRE_FALSE(second["choices"][0]["delta"].contains("role"));

  auto terminal = json::parse(FramePayload(sink.frames[3]));
  REQUIRE(terminal["choices"][0]["finish_reason"] == "stop");
  REQUIRE(sink.frames[4] == "data: [DONE]\n\n");
}

TEST_CASE("StreamRelay output matches the non-streaming translation",
          "[relay]") {
  vertexbridge::fakes::FakeBackend backend;
  backend.stream_items = {Chunk("Hel"), Chunk("lo, "),
                          Chunk("world", BackendFinishReason::kStop)};
  vertexbridge::fakes::MemorySink sink;
  auto translator = MakeTranslator();
  vertexbridge::StreamRelay relay(backend, sink, translator);
  auto outcome = relay.Run(MakeRequest());

  vertexbridge::BackendCompletion completion;
  completion.text = "Hello, world";
  completion.finish_reason = BackendFinishReason::kStop;
  auto response = translator.Translate(completion);

  REQUIRE(outcome.state == vertexbridge::RelayState::kCompleted);
  REQUIRE(outcome.text == response.choices[0].content);
  REQUIRE(outcome.finish_reason == response.choices[0].finish_reason);
  REQUIRE(outcome.delta_events == 3);
}

TEST_CASE("StreamRelay aborts when the client leaves after the second chunk",
          "[relay]") {
  vertexbridge::fakes::FakeBackend backend;
  backend.stream_items = {Chunk("one "), Chunk("two "), Chunk("three "),
                          Chunk("four", BackendFinishReason::kStop)};
  auto probe = backend.probe;
  vertexbridge::fakes::MemorySink sink;
  sink.disconnect_after = 2;
  auto translator = MakeTranslator();

  {
    vertexbridge::StreamRelay relay(backend, sink, translator);
    auto outcome = relay.Run(MakeRequest());

    REQUIRE(outcome.state == vertexbridge::RelayState::kAborted);
    REQUIRE(relay.state() == vertexbridge::RelayState::kAborted);
    REQUIRE(outcome.delta_events == 2);
    REQUIRE(outcome.text == "one two ");
    REQUIRE_FALSE(outcome.finish_reason.has_value());
  }

  REQUIRE(sink.frames.size() == 2);
  REQUIRE(probe->cancels == 1);
  REQUIRE(probe->next_calls == 2);
  REQUIRE(probe->destroyed);
}

TEST_CASE("StreamRelay emits one error event on mid-stream failure",
          "[relay]") {
  vertexbridge::fakes::FakeBackend backend;
  backend.stream_items = {
      Chunk("partial"),
      vertexbridge::BackendFailure{
          vertexbridge::ErrorKind::kUpstreamUnavailable, "backend dropped",
          503}};
  vertexbridge::fakes::MemorySink sink;
  auto translator = MakeTranslator();
  vertexbridge::StreamRelay relay(backend, sink, translator);

  auto outcome = relay.Run(MakeRequest());

  REQUIRE(outcome.state == vertexbridge::RelayState::kFailed);
  REQUIRE(outcome.opened);
  REQUIRE(outcome.error == vertexbridge::ErrorKind::kUpstreamUnavailable);
  REQUIRE(outcome.upstream_status == 503);
  REQUIRE(sink.frames.size() == 2);
  auto error = json::parse(FramePayload(sink.frames[1]));
  REQUIRE(error["error"]["type"] == "upstream_unavailable");
  REQUIRE(error["error"]["message"] == "backend dropped");
  for (const auto &frame : sink.frames) {
    REQUIRE(frame != "data: [DONE]\n\n");
  }
  REQUIRE(backend.probe->cancels == 1);
}

TEST_CASE("StreamRelay writes nothing when the stream cannot be opened",
          "[relay]") {
  vertexbridge::fakes::FakeBackend backend;
  backend.open_error = vertexbridge::GatewayError(
      vertexbridge::ErrorKind::kUpstreamAuth, "token rejected", {}, 401);
  vertexbridge::fakes::MemorySink sink;
  auto translator = MakeTranslator();
  vertexbridge::StreamRelay relay(backend, sink, translator);

  auto outcome = relay.Run(MakeRequest());

  REQUIRE(outcome.state == vertexbridge::RelayState::kFailed);
  REQUIRE_FALSE(outcome.opened);
  REQUIRE(outcome.error == vertexbridge::ErrorKind::kUpstreamAuth);
  REQUIRE(outcome.upstream_status == 401);
  REQUIRE(sink.open_calls == 0);
  REQUIRE(sink.frames.empty());
}

TEST_CASE("StreamRelay fails a stream that ends without a finish reason",
          "[relay]") {
  vertexbridge::fakes::FakeBackend backend;
  backend.stream_items = {Chunk("cut "), vertexbridge::StreamEnd{}};
  vertexbridge::fakes::MemorySink sink;
  auto translator = MakeTranslator();
  vertexbridge::StreamRelay relay(backend, sink, translator);

  auto outcome = relay.Run(MakeRequest());

  REQUIRE(outcome.state == vertexbridge::RelayState::kFailed);
  REQUIRE(outcome.error == vertexbridge::ErrorKind::kUpstreamError);
  REQUIRE(sink.frames.size() == 2);
  auto error = json::parse(FramePayload(sink.frames.back()));
  REQUIRE(error["error"]["type"] == "upstream_error");
}

TEST_CASE("StreamRelay skips empty chunks and reports usage on the terminal",
          "[relay]") {
  vertexbridge::fakes::FakeBackend backend;
  backend.stream_items = {
      Chunk(""), Chunk("Hi"),
      Chunk("", BackendFinishReason::kMaxTokens,
            vertexbridge::BackendUsage{4, 1, 5})};
  vertexbridge::fakes::MemorySink sink;
  auto translator = MakeTranslator();
  vertexbridge::StreamRelay relay(backend, sink, translator);

  auto outcome = relay.Run(MakeRequest());

  REQUIRE(outcome.state == vertexbridge::RelayState::kCompleted);
  REQUIRE(outcome.delta_events == 1);
  REQUIRE(sink.frames.size() == 3);
  auto first = json::parse(FramePayload(sink.frames[0]));
  REQUIRE(first["choices"][0]["delta"]["role"] == "assistant");
  auto terminal = json::parse(FramePayload(sink.frames[1]));
  REQUIRE(terminal["choices"][0]["finish_reason"] == "length");
  REQUIRE(terminal["usage"]["total_tokens"] == 5);
  REQUIRE(outcome.usage.has_value());
  REQUIRE(outcome.usage->completion_tokens == 1);
}

TEST_CASE("StreamRelay maps a blocked prompt to content_filter", "[relay]") {
  vertexbridge::fakes::FakeBackend backend;
  backend.stream_items = {Chunk("", BackendFinishReason::kBlocked)};
  vertexbridge::fakes::MemorySink sink;
  auto translator = MakeTranslator();
  vertexbridge::StreamRelay relay(backend, sink, translator);

  auto outcome = relay.Run(MakeRequest());

  REQUIRE(outcome.state == vertexbridge::RelayState::kCompleted);
  REQUIRE(outcome.delta_events == 0);
  REQUIRE(outcome.finish_reason == vertexbridge::FinishReason::kContentFilter);
  REQUIRE(sink.frames.size() == 2);
}

TEST_CASE("StreamRelay drives a single stream only", "[relay]") {
  vertexbridge::fakes::FakeBackend backend;
  backend.stream_items = {Chunk("x", BackendFinishReason::kStop)};
  vertexbridge::fakes::MemorySink sink;
  auto translator = MakeTranslator();
  vertexbridge::StreamRelay relay(backend, sink, translator);

  REQUIRE(relay.state() == vertexbridge::RelayState::kIdle);
  relay.Run(MakeRequest());
  REQUIRE_THROWS_AS(relay.Run(MakeRequest()), std::logic_error);
  REQUIRE(backend.stream_calls == 1);
}

TEST_CASE("RelayStateName covers every state", "[relay]") {
  REQUIRE(std::string(vertexbridge::RelayStateName(
              vertexbridge::RelayState::kIdle)) == "idle");
  REQUIRE(std::string(vertexbridge::RelayStateName(
              vertexbridge::RelayState::kAborted)) == "aborted");
  REQUIRE(std::string(vertexbridge::RelayStateName(
              vertexbridge::RelayState::kFailed)) == "failed");
}

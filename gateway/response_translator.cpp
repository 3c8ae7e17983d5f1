#include "gateway/response_translator.h"

#include "gateway/errors.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace vertexbridge {

namespace {

json UsageJson(const Usage &usage) {
  return {{"prompt_tokens", usage.prompt_tokens},
          {"completion_tokens", usage.completion_tokens},
          {"total_tokens", usage.total_tokens}};
}

std::string Frame(const json &payload) {
  return "data: " + payload.dump() + "\n\n";
}

} // namespace

FinishReason MapFinishReason(BackendFinishReason reason) {
  switch (reason) {
  case BackendFinishReason::kMaxTokens:
    return FinishReason::kLength;
  case BackendFinishReason::kSafety:
  case BackendFinishReason::kRecitation:
  case BackendFinishReason::kBlocklist:
  case BackendFinishReason::kProhibitedContent:
  case BackendFinishReason::kSpii:
  case BackendFinishReason::kBlocked:
    return FinishReason::kContentFilter;
  case BackendFinishReason::kUnspecified:
  case BackendFinishReason::kStop:
  case BackendFinishReason::kMalformedFunctionCall:
  case BackendFinishReason::kOther:
    return FinishReason::kStop;
  }
  return FinishReason::kStop;
}

ResponseTranslator::ResponseTranslator(std::string id, std::string model,
                                       std::int64_t created)
    : id_(std::move(id)), model_(std::move(model)), created_(created) {}

std::string ResponseTranslator::NewCompletionId() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream out;
  out << "chatcmpl-" << std::hex << std::setfill('0') << std::setw(16)
      << rng() << std::setw(8) << (rng() & 0xffffffffULL);
  return out.str();
}

std::int64_t ResponseTranslator::NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Usage ResponseTranslator::ToUsage(const BackendUsage &usage) {
  Usage out;
  out.prompt_tokens = usage.prompt_tokens;
  out.completion_tokens = usage.candidates_tokens;
  out.total_tokens = usage.total_tokens > 0
                         ? usage.total_tokens
                         : usage.prompt_tokens + usage.candidates_tokens;
  return out;
}

CompletionResponse
ResponseTranslator::Translate(const BackendResponse &response) const {
  if (const auto *failure = std::get_if<BackendFailure>(&response)) {
    throw GatewayError(failure->kind, failure->message, "",
                       failure->upstream_status);
  }

  CompletionResponse out;
  out.id = id_;
  out.model = model_;
  out.created = created_;
  CompletionChoice choice;
  if (const auto *completion = std::get_if<BackendCompletion>(&response)) {
    choice.content = completion->text;
    choice.finish_reason = MapFinishReason(completion->finish_reason);
    out.usage = ToUsage(completion->usage);
  } else if (const auto *blocked = std::get_if<BackendBlocked>(&response)) {
    choice.finish_reason = FinishReason::kContentFilter;
    out.usage = ToUsage(blocked->usage);
  }
  out.choices.push_back(std::move(choice));
  return out;
}

std::string ResponseTranslator::Render(const CompletionResponse &response) {
  json choices = json::array();
  for (const auto &choice : response.choices) {
    choices.push_back(
        {{"index", choice.index},
         {"message", {{"role", choice.role}, {"content", choice.content}}},
         {"finish_reason", FinishReasonName(choice.finish_reason)}});
  }
  json j;
  j["id"] = response.id;
  j["object"] = "chat.completion";
  j["created"] = response.created;
  j["model"] = response.model;
  j["choices"] = choices;
  j["usage"] = UsageJson(response.usage);
  return j.dump();
}

CallerStreamEvent
ResponseTranslator::TranslateChunk(const BackendChunk &chunk,
                                   std::size_t sequence_index) const {
  json delta = {{"content", chunk.delta_text}};
  if (sequence_index == 0) {
    delta["role"] = "assistant";
  }
  json j;
  j["id"] = id_;
  j["object"] = "chat.completion.chunk";
  j["created"] = created_;
  j["model"] = model_;
  j["choices"] = json::array(
      {{{"index", 0}, {"delta", delta}, {"finish_reason", nullptr}}});
  return {CallerStreamEvent::Kind::kDelta, Frame(j)};
}

CallerStreamEvent
ResponseTranslator::TerminalEvent(FinishReason reason,
                                  const std::optional<Usage> &usage) const {
  json j;
  j["id"] = id_;
  j["object"] = "chat.completion.chunk";
  j["created"] = created_;
  j["model"] = model_;
  j["choices"] = json::array({{{"index", 0},
                               {"delta", json::object()},
                               {"finish_reason", FinishReasonName(reason)}}});
  if (usage) {
    j["usage"] = UsageJson(*usage);
  }
  return {CallerStreamEvent::Kind::kTerminal, Frame(j)};
}

} // namespace vertexbridge

#include "backend/vertex_client.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <utility>

using json = nlohmann::json;

namespace vertexbridge {
namespace {

// Upper bound on an error body drained from a failed stream request.
constexpr std::size_t kMaxErrorBody = 64 * 1024;

int IntField(const json &obj, const char *key) {
  auto it = obj.find(key);
  return it != obj.end() && it->is_number_integer() ? it->get<int>() : 0;
}

std::string StringField(const json &obj, const char *key,
                        const std::string &fallback = {}) {
  auto it = obj.find(key);
  return it != obj.end() && it->is_string() ? it->get<std::string>()
                                            : fallback;
}

BackendUsage ParseUsage(const json &j) {
  BackendUsage usage;
  auto it = j.find("usageMetadata");
  if (it == j.end() || !it->is_object()) {
    return usage;
  }
  usage.prompt_tokens = IntField(*it, "promptTokenCount");
  usage.candidates_tokens = IntField(*it, "candidatesTokenCount");
  usage.total_tokens = IntField(*it, "totalTokenCount");
  return usage;
}

std::string CandidateText(const json &candidate) {
  std::string text;
  auto content = candidate.find("content");
  if (content == candidate.end() || !content->is_object()) {
    return text;
  }
  auto parts = content->find("parts");
  if (parts == content->end() || !parts->is_array()) {
    return text;
  }
  for (const auto &part : *parts) {
    if (part.is_object() && part.contains("text") &&
        part["text"].is_string()) {
      text += part["text"].get<std::string>();
    }
  }
  return text;
}

std::string BlockReason(const json &j) {
  auto feedback = j.find("promptFeedback");
  if (feedback == j.end() || !feedback->is_object()) {
    return {};
  }
  auto reason = feedback->find("blockReason");
  if (reason == feedback->end() || !reason->is_string()) {
    return {};
  }
  return reason->get<std::string>();
}

const json *FirstCandidate(const json &j) {
  auto candidates = j.find("candidates");
  if (candidates == j.end() || !candidates->is_array() ||
      candidates->empty()) {
    return nullptr;
  }
  return &(*candidates)[0];
}

BackendFailure TransportFailure(const std::exception &ex) {
  BackendFailure failure;
  failure.kind = ErrorKind::kUpstreamUnavailable;
  failure.message = std::string("backend unreachable: ") + ex.what();
  return failure;
}

class VertexChunkStream : public ChunkStream {
public:
  VertexChunkStream(const HttpClient &http, HttpClient::RawConnection conn)
      : http_(http), conn_(conn) {}

  ~VertexChunkStream() override { Cancel(); }

  // Reads the response head. Throws GatewayError when the backend refused
  // the stream.
  void Open() {
    char buffer[4096];
    while (head_end_ == std::string::npos) {
      ssize_t n = http_.RecvRaw(conn_, buffer, sizeof(buffer));
      if (n <= 0) {
        bool timed_out = n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
        Cancel();
        throw GatewayError(ErrorKind::kUpstreamUnavailable,
                           timed_out ? "backend stream timed out"
                                     : "backend closed stream before headers");
      }
      raw_.append(buffer, buffer + n);
      head_end_ = raw_.find("\r\n\r\n");
    }

    HttpResponse head;
    if (!ParseResponseHead(raw_.substr(0, head_end_), &head)) {
      Cancel();
      throw GatewayError(ErrorKind::kUpstreamError,
                         "malformed backend response head");
    }
    auto te = head.headers.find("transfer-encoding");
    chunked_ = te != head.headers.end() &&
               te->second.find("chunked") != std::string::npos;
    std::string rest = raw_.substr(head_end_ + 4);
    raw_.clear();

    if (head.status < 200 || head.status >= 300) {
      std::string body = Decode(rest);
      while (body.size() < kMaxErrorBody) {
        ssize_t n = http_.RecvRaw(conn_, buffer, sizeof(buffer));
        if (n <= 0) {
          break;
        }
        body += Decode(std::string(buffer, buffer + n));
      }
      Cancel();
      throw GatewayError(VertexClient::ClassifyStatus(head.status),
                         VertexClient::ErrorMessage(head.status, body), {},
                         head.status);
    }
    parser_.Feed(Decode(rest), &pending_);
  }

  BackendStreamItem Next() override {
    char buffer[4096];
    while (!done_) {
      if (!pending_.empty()) {
        std::string payload = std::move(pending_.front());
        pending_.erase(pending_.begin());
        if (payload == "[DONE]") {
          continue;
        }
        try {
          return VertexClient::ParseStreamEvent(payload);
        } catch (const GatewayError &ex) {
          Cancel();
          return BackendFailure{ex.kind(), ex.what(), 0};
        }
      }
      if (eof_) {
        Cancel();
        break;
      }
      ssize_t n = http_.RecvRaw(conn_, buffer, sizeof(buffer));
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        Cancel();
        return BackendFailure{ErrorKind::kUpstreamUnavailable,
                              "backend stream timed out", 0};
      }
      if (n <= 0) {
        eof_ = true;
        parser_.Finish(&pending_);
        continue;
      }
      std::string decoded = Decode(std::string(buffer, buffer + n));
      if (malformed_) {
        Cancel();
        return BackendFailure{ErrorKind::kUpstreamError,
                              "malformed chunked backend stream", 0};
      }
      parser_.Feed(decoded, &pending_);
      if (chunked_ && decoder_.Done()) {
        eof_ = true;
        parser_.Finish(&pending_);
      }
    }
    return StreamEnd{};
  }

  void Cancel() override {
    done_ = true;
    if (conn_.sock >= 0 || conn_.ssl) {
      http_.CloseRaw(conn_);
    }
  }

private:
  std::string Decode(const std::string &bytes) {
    if (!chunked_) {
      return bytes;
    }
    std::string out;
    if (!decoder_.Feed(bytes.data(), bytes.size(), &out)) {
      malformed_ = true;
    }
    return out;
  }

  const HttpClient &http_;
  HttpClient::RawConnection conn_;
  std::string raw_;
  std::size_t head_end_{std::string::npos};
  bool chunked_{false};
  bool malformed_{false};
  bool eof_{false};
  bool done_{false};
  ChunkedDecoder decoder_;
  SseEventParser parser_;
  std::vector<std::string> pending_;
};

} // namespace

void SseEventParser::Feed(const std::string &data,
                          std::vector<std::string> *events) {
  buffer_ += data;
  std::size_t pos = 0;
  while (true) {
    auto nl = buffer_.find('\n', pos);
    if (nl == std::string::npos) {
      break;
    }
    std::string line = buffer_.substr(pos, nl - pos);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    ConsumeLine(std::move(line), events);
    pos = nl + 1;
  }
  buffer_.erase(0, pos);
}

void SseEventParser::Finish(std::vector<std::string> *events) {
  if (!buffer_.empty()) {
    std::string line = std::move(buffer_);
    buffer_.clear();
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    ConsumeLine(std::move(line), events);
  }
  ConsumeLine({}, events);
}

void SseEventParser::ConsumeLine(std::string line,
                                 std::vector<std::string> *events) {
  if (line.empty()) {
    if (has_data_) {
      events->push_back(std::move(data_));
      data_.clear();
      has_data_ = false;
    }
    return;
  }
  if (line.compare(0, 5, "data:") != 0) {
    return;
  }
  std::string value = line.substr(5);
  if (!value.empty() && value.front() == ' ') {
    value.erase(0, 1);
  }
  if (has_data_) {
    data_ += '\n';
  }
  data_ += value;
  has_data_ = true;
}

VertexClient::VertexClient(VertexClientConfig config)
    : config_(std::move(config)), http_(config_.timeout) {}

std::string VertexClient::BaseUrl() const {
  if (!config_.endpoint.empty()) {
    std::string base = config_.endpoint;
    while (!base.empty() && base.back() == '/') {
      base.pop_back();
    }
    return base;
  }
  return "https://" + config_.region + "-aiplatform.googleapis.com";
}

std::string VertexClient::ModelUrl(const std::string &model,
                                   bool stream) const {
  std::string url = BaseUrl() + "/v1/projects/" + config_.project_id +
                    "/locations/" + config_.region +
                    "/publishers/google/models/" + model;
  return url + (stream ? ":streamGenerateContent?alt=sse" : ":generateContent");
}

std::map<std::string, std::string> VertexClient::Headers() const {
  return {{"Authorization", "Bearer " + config_.access_token},
          {"Accept", "application/json, text/event-stream"}};
}

std::string VertexClient::SerializeRequest(const BackendRequest &request) {
  json payload;
  payload["contents"] = json::array();
  for (const auto &content : request.contents) {
    payload["contents"].push_back(
        {{"role", content.role}, {"parts", {{{"text", content.text}}}}});
  }
  if (request.system_instruction) {
    payload["systemInstruction"] = {
        {"parts", {{{"text", *request.system_instruction}}}}};
  }
  json generation = json::object();
  if (request.temperature) {
    generation["temperature"] = *request.temperature;
  }
  if (request.top_p) {
    generation["topP"] = *request.top_p;
  }
  if (request.max_output_tokens) {
    generation["maxOutputTokens"] = *request.max_output_tokens;
  }
  if (!request.stop_sequences.empty()) {
    generation["stopSequences"] = request.stop_sequences;
  }
  if (!generation.empty()) {
    payload["generationConfig"] = std::move(generation);
  }
  return payload.dump();
}

ErrorKind VertexClient::ClassifyStatus(int status) {
  switch (status) {
  case 401:
  case 403:
    return ErrorKind::kUpstreamAuth;
  case 408:
  case 429:
  case 500:
  case 502:
  case 503:
  case 504:
    return ErrorKind::kUpstreamUnavailable;
  default:
    return ErrorKind::kUpstreamError;
  }
}

std::string VertexClient::ErrorMessage(int status, const std::string &body) {
  std::string fallback = "backend returned HTTP " + std::to_string(status);
  try {
    auto j = json::parse(body);
    if (j.is_array() && !j.empty()) {
      j = j[0];
    }
    if (j.is_object() && j.contains("error") && j["error"].is_object() &&
        j["error"].contains("message") && j["error"]["message"].is_string()) {
      return fallback + ": " + j["error"]["message"].get<std::string>();
    }
  } catch (const json::exception &) {
    // Not a Google error document; keep the status-only message.
  }
  return fallback;
}

BackendResponse VertexClient::ParseResponse(int status,
                                            const std::string &body) {
  if (status < 200 || status >= 300) {
    return BackendFailure{ClassifyStatus(status), ErrorMessage(status, body),
                          status};
  }
  json j;
  try {
    j = json::parse(body);
  } catch (const json::exception &ex) {
    return BackendFailure{ErrorKind::kUpstreamError,
                          std::string("unparsable backend response: ") +
                              ex.what(),
                          status};
  }
  if (!j.is_object()) {
    return BackendFailure{ErrorKind::kUpstreamError,
                          "unexpected backend response shape", status};
  }
  BackendUsage usage = ParseUsage(j);
  const json *candidate = FirstCandidate(j);
  std::string block = BlockReason(j);
  if (!candidate) {
    if (!block.empty()) {
      return BackendBlocked{block, usage};
    }
    return BackendFailure{ErrorKind::kUpstreamError,
                          "backend response has no candidates", status};
  }
  BackendCompletion completion;
  completion.text = CandidateText(*candidate);
  completion.finish_reason =
      ParseBackendFinishReason(StringField(*candidate, "finishReason"));
  completion.usage = usage;
  return completion;
}

BackendChunk VertexClient::ParseStreamEvent(const std::string &payload) {
  json j;
  try {
    j = json::parse(payload);
  } catch (const json::exception &ex) {
    throw GatewayError(ErrorKind::kUpstreamError,
                       std::string("unparsable backend stream event: ") +
                           ex.what());
  }
  if (!j.is_object()) {
    throw GatewayError(ErrorKind::kUpstreamError,
                       "unexpected backend stream event shape");
  }
  if (j.contains("error") && j["error"].is_object()) {
    throw GatewayError(
        ErrorKind::kUpstreamError,
        StringField(j["error"], "message", "backend stream error"));
  }
  BackendChunk chunk;
  if (j.contains("usageMetadata")) {
    chunk.usage = ParseUsage(j);
  }
  const json *candidate = FirstCandidate(j);
  if (!candidate) {
    if (!BlockReason(j).empty()) {
      chunk.finish_reason = BackendFinishReason::kBlocked;
    }
    return chunk;
  }
  chunk.delta_text = CandidateText(*candidate);
  if (candidate->contains("finishReason") &&
      (*candidate)["finishReason"].is_string()) {
    chunk.finish_reason = ParseBackendFinishReason(
        (*candidate)["finishReason"].get<std::string>());
  }
  return chunk;
}

BackendResponse VertexClient::Generate(const BackendRequest &request,
                                       const CancelCheck &cancelled) {
  if (config_.access_token.empty()) {
    return BackendFailure{ErrorKind::kUpstreamAuth,
                          "no backend access token configured", 0};
  }
  std::string url = ModelUrl(request.model, false);
  log::Debug("backend", "generateContent", "model=" + request.model);
  try {
    auto response =
        http_.Post(url, SerializeRequest(request), Headers(), cancelled);
    return ParseResponse(response.status, response.body);
  } catch (const HttpCancelled &) {
    return BackendFailure{ErrorKind::kClientDisconnected,
                          "caller disconnected", 0};
  } catch (const HttpTimeout &ex) {
    return TransportFailure(ex);
  } catch (const std::runtime_error &ex) {
    return TransportFailure(ex);
  }
}

std::unique_ptr<ChunkStream>
VertexClient::GenerateStream(const BackendRequest &request) {
  if (config_.access_token.empty()) {
    throw GatewayError(ErrorKind::kUpstreamAuth,
                       "no backend access token configured");
  }
  std::string url = ModelUrl(request.model, true);
  log::Debug("backend", "streamGenerateContent", "model=" + request.model);
  HttpClient::RawConnection conn;
  try {
    conn = http_.SendRaw("POST", url, SerializeRequest(request), Headers());
  } catch (const std::runtime_error &ex) {
    auto failure = TransportFailure(ex);
    throw GatewayError(failure.kind, failure.message);
  }
  auto stream = std::make_unique<VertexChunkStream>(http_, conn);
  stream->Open();
  return stream;
}

} // namespace vertexbridge

#pragma once

#include "backend/backend_client.h"
#include "backend/token_estimator.h"
#include "net/http_client.h"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vertexbridge {

struct VertexClientConfig {
  std::string project_id;
  std::string region{"us-central1"};
  // Overrides https://{region}-aiplatform.googleapis.com (emulators, tests).
  std::string endpoint;
  std::string access_token;
  std::chrono::seconds timeout{120};
};

// Splits a text/event-stream body into the payloads of its "data:" lines.
// Multi-line data fields are joined with '\n'; comments and other fields are
// ignored.
class SseEventParser {
public:
  void Feed(const std::string &data, std::vector<std::string> *events);
  // Emits an event left unterminated at end of stream.
  void Finish(std::vector<std::string> *events);

private:
  void ConsumeLine(std::string line, std::vector<std::string> *events);

  std::string buffer_;
  std::string data_;
  bool has_data_{false};
};

// Gemini on Vertex AI REST (generateContent / streamGenerateContent).
class VertexClient : public BackendClient {
public:
  explicit VertexClient(VertexClientConfig config);

  BackendResponse Generate(const BackendRequest &request,
                           const CancelCheck &cancelled) override;
  std::unique_ptr<ChunkStream>
  GenerateStream(const BackendRequest &request) override;

  const TokenEstimator &Estimator() const override { return estimator_; }
  std::string Name() const override { return "vertex"; }

  std::string BaseUrl() const;
  std::string ModelUrl(const std::string &model, bool stream) const;

  static std::string SerializeRequest(const BackendRequest &request);

  // 401/403 -> kUpstreamAuth; 408/429/5xx gateway family ->
  // kUpstreamUnavailable; anything else -> kUpstreamError.
  static ErrorKind ClassifyStatus(int status);

  // Interprets a complete generateContent reply.
  static BackendResponse ParseResponse(int status, const std::string &body);

  // Interprets one streamed GenerateContentResponse object. A prompt block
  // is reported as a chunk finishing with kBlocked. Throws GatewayError
  // (kUpstreamError) when the payload is not valid JSON.
  static BackendChunk ParseStreamEvent(const std::string &payload);

  // Best-effort extraction of error.message from a Google error body.
  static std::string ErrorMessage(int status, const std::string &body);

private:
  std::map<std::string, std::string> Headers() const;

  VertexClientConfig config_;
  HttpClient http_;
  WordTokenEstimator estimator_;
};

} // namespace vertexbridge

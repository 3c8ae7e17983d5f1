#pragma once

#include "gateway/chat_service.h"
#include "gateway/stream_relay.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <openssl/ssl.h>

namespace vertexbridge {

// Parsed request line, headers and body of one HTTP/1.1 request.
struct HttpRequest {
  std::string method;
  std::string path;
  // Header names are lower-cased.
  std::map<std::string, std::string> headers;
  std::string body;

  std::string Header(const std::string &name) const;
};

struct HttpReply {
  int status{200};
  std::string status_text{"OK"};
  std::string content_type{"application/json"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
  // The response was already written through the stream sink.
  bool streamed{false};
  // Close the connection without writing anything.
  bool drop{false};
};

// Parses a request head (request line plus headers, without the blank
// line). Returns false when the request line is malformed.
bool ParseRequestHead(const std::string &head, HttpRequest *request);

// True once the connection on `fd` is reset or torn down in both directions.
// A client that only shut down its write side is still connected.
bool SocketPeerGone(int fd);

class HttpServer {
public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  // Static facts reported by /v1/health and /v1/info.
  struct ServerInfo {
    std::string name{"vertexbridge"};
    std::string version;
    std::string project_id;
    std::string region;
    int rate_limit{0};
    std::vector<std::string> cors_origins{"*"};
  };

  static constexpr std::size_t kMaxRequestBytes = 16 * 1024 * 1024;

  HttpServer(std::string host, int port, ChatService *service,
             MetricsRegistry *metrics, ServerInfo info, TlsConfig tls_config,
             int num_workers = 8);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  void Start();
  void Stop();
  bool Running() const { return running_.load(); }

  // Routes one request. Streaming chat requests write through `sink`.
  HttpReply Dispatch(const HttpRequest &request, StreamSink &sink,
                     const CancelCheck &disconnected);

  // Serializes a non-streamed reply, adding CORS headers.
  std::string Serialize(const HttpReply &reply) const;

private:
  struct ClientSession {
    int fd{-1};
    SSL *ssl{nullptr};
  };

  class SessionSink;

  void Run();
  void WorkerLoop();
  void HandleClient(ClientSession &session);

  HttpReply Health() const;
  HttpReply Models() const;
  HttpReply Info() const;
  HttpReply Preflight() const;
  HttpReply ErrorReply(ErrorKind kind, const std::string &message) const;
  std::string CorsOrigin() const;

  bool SendAll(ClientSession &session, const std::string &payload);
  ssize_t Receive(ClientSession &session, char *buffer, std::size_t length);
  bool PeerClosed(ClientSession &session) const;
  void CloseSession(ClientSession &session);

  std::string host_;
  int port_;
  ChatService *service_;
  MetricsRegistry *metrics_;
  ServerInfo info_;
  bool tls_enabled_{false};
  SSL_CTX *ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  int num_workers_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

} // namespace vertexbridge

#include "server/http/http_server.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/err.h>

using json = nlohmann::json;

namespace vertexbridge {

namespace {

constexpr char kChatCompletionsPath[] = "/v1/chat/completions";
constexpr char kModelsPrefix[] = "/v1/models/";
constexpr char kModelChatSuffix[] = "/chat";

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return value;
}

std::string TrimWs(const std::string &value) {
  auto s = value.find_first_not_of(" \t\r\n");
  auto e = value.find_last_not_of(" \t\r\n");
  return s == std::string::npos ? std::string() : value.substr(s, e - s + 1);
}

// Strips the query string; the gateway routes on the path alone.
std::string RoutePath(const std::string &target) {
  auto q = target.find('?');
  return q == std::string::npos ? target : target.substr(0, q);
}

// {id} of /v1/models/{id}/chat, or empty when `path` is not that route.
std::string ModelFromChatPath(const std::string &path) {
  const std::size_t prefix = std::strlen(kModelsPrefix);
  const std::size_t suffix = std::strlen(kModelChatSuffix);
  if (path.size() <= prefix + suffix ||
      path.compare(0, prefix, kModelsPrefix) != 0 ||
      path.compare(path.size() - suffix, suffix, kModelChatSuffix) != 0) {
    return {};
  }
  std::string id = path.substr(prefix, path.size() - prefix - suffix);
  if (id.find('/') != std::string::npos) {
    return {};
  }
  return id;
}

std::string JoinOrigins(const std::vector<std::string> &origins) {
  std::string joined;
  for (const auto &origin : origins) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += origin;
  }
  return joined.empty() ? "*" : joined;
}

std::string FormatSeconds(double seconds) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(6) << seconds;
  return out.str();
}

} // namespace

std::string HttpRequest::Header(const std::string &name) const {
  auto it = headers.find(ToLower(name));
  return it == headers.end() ? std::string() : it->second;
}

bool ParseRequestHead(const std::string &head, HttpRequest *request) {
  auto first_line_end = head.find("\r\n");
  std::string first_line = head.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos) {
    return false;
  }
  auto path_end = first_line.find(' ', method_end + 1);
  if (path_end == std::string::npos) {
    return false;
  }
  request->method = first_line.substr(0, method_end);
  request->path = first_line.substr(method_end + 1, path_end - method_end - 1);
  if (request->method.empty() || request->path.empty()) {
    return false;
  }
  std::size_t pos =
      first_line_end == std::string::npos ? head.size() : first_line_end + 2;
  while (pos < head.size()) {
    auto end = head.find("\r\n", pos);
    if (end == std::string::npos) {
      end = head.size();
    }
    std::string line = head.substr(pos, end - pos);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
      request->headers[ToLower(TrimWs(line.substr(0, colon)))] =
          TrimWs(line.substr(colon + 1));
    }
    pos = end + 2;
  }
  return true;
}

// Writes the SSE response of one streaming request to a client session.
class HttpServer::SessionSink : public StreamSink {
public:
  SessionSink(HttpServer &server, ClientSession &session)
      : server_(server), session_(session) {}

  bool Open() override {
    std::string head = "HTTP/1.1 200 OK\r\n"
                       "Content-Type: text/event-stream\r\n"
                       "Cache-Control: no-cache\r\n"
                       "Connection: close\r\n"
                       "Access-Control-Allow-Origin: " +
                       server_.CorsOrigin() + "\r\n\r\n";
    return Send(head);
  }

  bool Send(const std::string &frame) override {
    if (gone_) {
      return false;
    }
    if (!server_.SendAll(session_, frame)) {
      gone_ = true;
    }
    return !gone_;
  }

  bool Disconnected() override {
    if (!gone_ && server_.PeerClosed(session_)) {
      gone_ = true;
    }
    return gone_;
  }

private:
  HttpServer &server_;
  ClientSession &session_;
  bool gone_{false};
};

HttpServer::HttpServer(std::string host, int port, ChatService *service,
                       MetricsRegistry *metrics, ServerInfo info,
                       TlsConfig tls_config, int num_workers)
    : host_(std::move(host)), port_(port), service_(service),
      metrics_(metrics), info_(std::move(info)),
      num_workers_(num_workers > 0 ? num_workers : 8) {
  if (!service_) {
    throw std::invalid_argument("HttpServer requires a chat service");
  }
  if (tls_config.enabled) {
    SSL_load_error_strings();
    OpenSSL_add_ssl_algorithms();
    ssl_ctx_ = SSL_CTX_new(TLS_server_method());
    if (!ssl_ctx_) {
      throw std::runtime_error("failed to initialize TLS context");
    }
    SSL_CTX_set_ecdh_auto(ssl_ctx_, 1);
    if (SSL_CTX_use_certificate_file(ssl_ctx_, tls_config.cert_path.c_str(),
                                     SSL_FILETYPE_PEM) <= 0) {
      SSL_CTX_free(ssl_ctx_);
      ssl_ctx_ = nullptr;
      throw std::runtime_error("failed to load TLS certificate: " +
                               tls_config.cert_path);
    }
    if (SSL_CTX_use_PrivateKey_file(ssl_ctx_, tls_config.key_path.c_str(),
                                    SSL_FILETYPE_PEM) <= 0) {
      SSL_CTX_free(ssl_ctx_);
      ssl_ctx_ = nullptr;
      throw std::runtime_error("failed to load TLS key: " +
                               tls_config.key_path);
    }
    tls_enabled_ = true;
    log::Info("http", "TLS enabled", "cert=" + tls_config.cert_path);
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
}

void HttpServer::Stop() {
  // Run() clears running_ on listener failure; join whatever was started.
  running_ = false;
  if (!accept_thread_.joinable() && workers_.empty()) {
    return;
  }
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::strerror(errno));
    running_ = false;
    return;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    log::Error("http", "invalid listen address", "host=" + host_);
    ::close(fd);
    running_ = false;
    return;
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind() failed",
               std::string(std::strerror(errno)) +
                   " port=" + std::to_string(port_));
    ::close(fd);
    running_ = false;
    return;
  }

  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen() failed", std::strerror(errno));
    ::close(fd);
    running_ = false;
    return;
  }

  server_fd_.store(fd);

  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      break; // Socket closed by Stop() or error.
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    ClientSession session;
    session.fd = client_fd;
    if (tls_enabled_) {
      SSL *ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        log::Debug("http", "TLS handshake failed");
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

std::string HttpServer::CorsOrigin() const {
  return JoinOrigins(info_.cors_origins);
}

std::string HttpServer::Serialize(const HttpReply &reply) const {
  std::string out = "HTTP/1.1 " + std::to_string(reply.status) + " " +
                    reply.status_text + "\r\n";
  out += "Content-Type: " + reply.content_type + "\r\n";
  out += "Access-Control-Allow-Origin: " + CorsOrigin() + "\r\n";
  for (const auto &[name, value] : reply.headers) {
    out += name + ": " + value + "\r\n";
  }
  out += "Connection: close\r\n";
  out += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n\r\n";
  return out + reply.body;
}

HttpReply HttpServer::ErrorReply(ErrorKind kind,
                                 const std::string &message) const {
  auto mapped = ErrorMapper::Map(kind, message);
  HttpReply reply;
  reply.status = mapped.status;
  reply.status_text = mapped.status_text;
  reply.body = mapped.body;
  return reply;
}

HttpReply HttpServer::Health() const {
  const auto &budget = service_->budget();
  json j = {
      {"status", "ok"},
      {"version", info_.version},
      {"model", service_->catalog().DefaultModel()},
      {"project", info_.project_id},
      {"region", info_.region},
      {"rate_limit",
       info_.rate_limit > 0
           ? std::to_string(info_.rate_limit) + " requests per minute"
           : std::string("disabled")},
      {"preferred_context_size", std::to_string(budget.preferred) + " tokens"},
      {"max_context_size", std::to_string(budget.maximum) + " tokens"}};
  HttpReply reply;
  reply.body = j.dump();
  return reply;
}

HttpReply HttpServer::Models() const {
  auto created = static_cast<std::int64_t>(std::time(nullptr));
  json list = json::array();
  for (const auto &id : service_->catalog().Ids()) {
    list.push_back({{"id", id},
                    {"object", "model"},
                    {"created", created},
                    {"owned_by", "google"}});
  }
  HttpReply reply;
  reply.body = list.dump();
  return reply;
}

HttpReply HttpServer::Info() const {
  const auto &budget = service_->budget();
  json j = {{"server", info_.name},
            {"version", info_.version},
            {"vertex_ai",
             {{"project_id", info_.project_id},
              {"region", info_.region},
              {"model", service_->catalog().DefaultModel()}}},
            {"models", service_->catalog().Ids()},
            {"max_context_size", budget.maximum},
            {"preferred_context_size", budget.preferred},
            {"capabilities", {"text", "streaming"}},
            {"protocol_version", "openai-chat-v1"}};
  HttpReply reply;
  reply.body = j.dump();
  return reply;
}

HttpReply HttpServer::Preflight() const {
  HttpReply reply;
  reply.status = 204;
  reply.status_text = "No Content";
  reply.content_type = "text/plain";
  reply.headers.emplace_back("Access-Control-Allow-Methods",
                             "GET, POST, OPTIONS");
  reply.headers.emplace_back("Access-Control-Allow-Headers",
                             "Content-Type, Authorization");
  reply.headers.emplace_back("Access-Control-Max-Age", "600");
  return reply;
}

HttpReply HttpServer::Dispatch(const HttpRequest &request, StreamSink &sink,
                               const CancelCheck &disconnected) {
  const std::string path = RoutePath(request.path);

  if (request.method == "OPTIONS") {
    return Preflight();
  }
  if (request.method == "GET") {
    if (path == "/v1/health") {
      return Health();
    }
    if (path == "/v1/models") {
      return Models();
    }
    if (path == "/v1/info") {
      return Info();
    }
    if (path == "/metrics" && metrics_) {
      HttpReply reply;
      reply.content_type = "text/plain; version=0.0.4";
      reply.body = metrics_->RenderPrometheus();
      return reply;
    }
  }
  if (request.method == "POST") {
    std::string path_model;
    bool chat_route = path == kChatCompletionsPath;
    if (!chat_route) {
      path_model = ModelFromChatPath(path);
      chat_route = !path_model.empty();
    }
    if (chat_route) {
      ServiceReply served =
          service_->Handle(request.body, path_model, sink, disconnected);
      HttpReply reply;
      reply.status = served.status;
      reply.status_text = served.status_text;
      reply.content_type = served.content_type;
      reply.body = std::move(served.body);
      reply.headers = std::move(served.headers);
      reply.streamed = served.streamed;
      reply.drop = served.client_gone;
      return reply;
    }
  }
  HttpReply not_found = ErrorReply(ErrorKind::kInvalidRequest,
                                   "No route for " + request.method + " " +
                                       path);
  not_found.status = 404;
  not_found.status_text = "Not Found";
  return not_found;
}

void HttpServer::HandleClient(ClientSession &session) {
  // RAII guard: decrement connections and record latency on all exit paths.
  auto req_start = std::chrono::steady_clock::now();
  struct ConnectionGuard {
    MetricsRegistry *metrics;
    std::chrono::steady_clock::time_point start;
    ~ConnectionGuard() {
      if (metrics) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        double ms = std::chrono::duration<double, std::milli>(elapsed).count();
        metrics->RecordLatency(ms);
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_, req_start};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  auto too_large = [&]() {
    HttpReply reply = ErrorReply(ErrorKind::kInvalidRequest,
                                 "Request body exceeds 16 MiB");
    reply.status = 413;
    reply.status_text = "Payload Too Large";
    SendAll(session, Serialize(reply));
  };

  // Phase 1: read until the end-of-headers marker.
  std::string raw;
  char buffer[8192];
  std::size_t header_end = std::string::npos;
  while (header_end == std::string::npos) {
    if (raw.size() >= kMaxRequestBytes) {
      too_large();
      return;
    }
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      return;
    }
    raw.append(buffer, buffer + bytes);
    header_end = raw.find("\r\n\r\n");
  }

  HttpRequest request;
  if (!ParseRequestHead(raw.substr(0, header_end), &request)) {
    auto reply = ErrorReply(ErrorKind::kInvalidRequest, "Malformed request");
    SendAll(session, Serialize(reply));
    return;
  }

  // Phase 2: read the body announced by Content-Length.
  std::size_t content_length = 0;
  std::string length_header = request.Header("content-length");
  if (!length_header.empty()) {
    try {
      content_length = std::stoull(length_header);
    } catch (const std::exception &) {
      auto reply =
          ErrorReply(ErrorKind::kInvalidRequest, "Invalid Content-Length");
      SendAll(session, Serialize(reply));
      return;
    }
  }
  if (content_length > kMaxRequestBytes) {
    too_large();
    return;
  }
  request.body = raw.substr(header_end + 4);
  while (request.body.size() < content_length) {
    ssize_t bytes = Receive(session, buffer,
                            std::min(sizeof(buffer),
                                     content_length - request.body.size()));
    if (bytes <= 0) {
      return;
    }
    request.body.append(buffer, buffer + bytes);
  }
  request.body.resize(content_length);

  log::Debug("http", request.method + " " + request.path);

  SessionSink sink(*this, session);
  CancelCheck disconnected = [this, &session]() {
    return PeerClosed(session);
  };
  HttpReply reply;
  try {
    reply = Dispatch(request, sink, disconnected);
  } catch (const std::exception &ex) {
    log::Error("http", "request handling failed", ex.what());
    reply = ErrorReply(ErrorKind::kInternal, ex.what());
  }
  if (reply.drop || reply.streamed) {
    return;
  }
  auto elapsed = std::chrono::steady_clock::now() - req_start;
  reply.headers.emplace_back(
      "X-Process-Time",
      FormatSeconds(std::chrono::duration<double>(elapsed).count()));
  if (!SendAll(session, Serialize(reply))) {
    log::Debug("http", "client closed before response was written",
               request.method + " " + request.path);
  }
}

bool HttpServer::SendAll(ClientSession &session, const std::string &payload) {
  const char *data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

bool SocketPeerGone(int fd) {
  if (fd < 0) {
    return true;
  }
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLIN;
  if (::poll(&pfd, 1, 0) <= 0) {
    return false;
  }
  if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
    return true;
  }
  // Readable with EOF is a half-close: the client may still be reading.
  char next;
  ssize_t n = ::recv(fd, &next, 1, MSG_PEEK | MSG_DONTWAIT);
  if (n >= 0) {
    return false;
  }
  return errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
}

bool HttpServer::PeerClosed(ClientSession &session) const {
  return SocketPeerGone(session.fd);
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

} // namespace vertexbridge

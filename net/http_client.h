#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>

namespace vertexbridge {

struct HttpResponse {
  int status{0};
  // Header names are lower-cased.
  std::map<std::string, std::string> headers;
  std::string body;
};

// Thrown when a CancelCheck asks an in-flight request to stop.
class HttpCancelled : public std::runtime_error {
public:
  HttpCancelled() : std::runtime_error("request cancelled") {}
};

// Thrown when the peer does not answer within the client timeout.
class HttpTimeout : public std::runtime_error {
public:
  HttpTimeout() : std::runtime_error("request timed out") {}
};

// Parses a status line plus header block (no trailing blank line required).
// Returns false when the status line is malformed.
bool ParseResponseHead(const std::string &head, HttpResponse *response);

// Incremental decoder for Transfer-Encoding: chunked bodies.
class ChunkedDecoder {
public:
  // Appends decoded payload bytes to *out. Returns false on malformed input.
  bool Feed(const char *data, std::size_t length, std::string *out);
  bool Done() const { return state_ == State::kDone; }

private:
  enum class State { kSize, kData, kDataCrlf, kTrailer, kDone };
  State state_{State::kSize};
  std::string line_;
  std::size_t remaining_{0};
};

class HttpClient {
public:
  struct RawConnection {
    int sock{-1};
    SSL *ssl{nullptr};
  };

  using CancelCheck = std::function<bool()>;

  explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(120));
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  // `cancelled` is polled while waiting for the response; when it returns
  // true the connection is dropped and HttpCancelled is thrown.
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {},
       const CancelCheck &cancelled = nullptr) const;

  // Returns the raw socket for streaming reads. Caller owns the connection
  // and must release it with CloseRaw().
  RawConnection
  SendRaw(const std::string &method, const std::string &url,
          const std::string &body,
          const std::map<std::string, std::string> &headers) const;
  ssize_t RecvRaw(RawConnection &conn, char *buffer, std::size_t length) const;
  void CloseRaw(RawConnection &conn) const;

  std::chrono::seconds timeout() const { return timeout_; }

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers,
                    const CancelCheck &cancelled) const;

  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
  std::chrono::seconds timeout_;
};

} // namespace vertexbridge

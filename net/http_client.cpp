#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace vertexbridge {
namespace {

constexpr int kPollIntervalMs = 250;

struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = url.substr(0, scheme_pos);
    remainder = url.substr(scheme_pos + 3);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    parsed.port = std::stoi(host_port.substr(colon + 1));
  }
  if (parsed.host.empty()) {
    throw std::runtime_error("invalid URL host");
  }
  return parsed;
}

int CreateSocket(const ParsedUrl &parsed, std::chrono::seconds timeout) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                  &hints, &result) != 0) {
    throw std::runtime_error("failed to resolve host " + parsed.host);
  }
  int sock = -1;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1)
      continue;
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0)
      break;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1)
    throw std::runtime_error("failed to connect to " + parsed.host);
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count());
  tv.tv_usec = 0;
  setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  return sock;
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  request << "Content-Type: application/json\r\n";
  for (const auto &[key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

std::string Lower(std::string value) {
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

} // namespace

bool ParseResponseHead(const std::string &head, HttpResponse *response) {
  auto line_end = head.find("\r\n");
  std::string status_line = head.substr(0, line_end);
  if (status_line.compare(0, 5, "HTTP/") != 0) {
    return false;
  }
  auto status_pos = status_line.find(' ');
  if (status_pos == std::string::npos) {
    return false;
  }
  try {
    response->status = std::stoi(status_line.substr(status_pos + 1));
  } catch (const std::exception &) {
    return false;
  }
  std::size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
  while (pos < head.size()) {
    auto end = head.find("\r\n", pos);
    if (end == std::string::npos) {
      end = head.size();
    }
    std::string line = head.substr(pos, end - pos);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
      response->headers[Lower(TrimWs(line.substr(0, colon)))] =
          TrimWs(line.substr(colon + 1));
    }
    pos = end + 2;
  }
  return true;
}

bool ChunkedDecoder::Feed(const char *data, std::size_t length,
                          std::string *out) {
  std::size_t i = 0;
  while (i < length && state_ != State::kDone) {
    switch (state_) {
    case State::kSize: {
      char c = data[i++];
      if (c != '\n') {
        line_.push_back(c);
        break;
      }
      auto size_text = TrimWs(line_.substr(0, line_.find(';')));
      line_.clear();
      if (size_text.empty()) {
        return false;
      }
      try {
        remaining_ = std::stoul(size_text, nullptr, 16);
      } catch (const std::exception &) {
        return false;
      }
      state_ = remaining_ == 0 ? State::kTrailer : State::kData;
      break;
    }
    case State::kData: {
      std::size_t take = std::min(remaining_, length - i);
      out->append(data + i, take);
      i += take;
      remaining_ -= take;
      if (remaining_ == 0) {
        state_ = State::kDataCrlf;
      }
      break;
    }
    case State::kDataCrlf: {
      char c = data[i++];
      if (c == '\n') {
        state_ = State::kSize;
      } else if (c != '\r') {
        return false;
      }
      break;
    }
    case State::kTrailer: {
      char c = data[i++];
      if (c != '\n') {
        line_.push_back(c);
        break;
      }
      bool blank = TrimWs(line_).empty();
      line_.clear();
      if (blank) {
        state_ = State::kDone;
      }
      break;
    }
    case State::kDone:
      break;
    }
  }
  return true;
}

HttpClient::HttpClient(std::chrono::seconds timeout) : timeout_(timeout) {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse HttpClient::Post(const std::string &url, const std::string &body,
                              const std::map<std::string, std::string> &headers,
                              const CancelCheck &cancelled) const {
  return Send("POST", url, body, headers, cancelled);
}

HttpClient::RawConnection
HttpClient::SendRaw(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const {
  auto parsed = ParseUrl(url);
  RawConnection conn;
  conn.sock = CreateSocket(parsed, timeout_);
  auto payload = BuildRequest(parsed, method, body, headers);
  const char *send_ptr = payload.c_str();
  std::size_t send_remaining = payload.size();

  auto close_connection = [&](const char *message) {
    CloseRaw(conn);
    throw std::runtime_error(message);
  };

  if (parsed.use_tls) {
    if (!tls_ready_) {
      close_connection("TLS not available in HttpClient");
    }
    conn.ssl = SSL_new(ssl_ctx_);
    if (!conn.ssl) {
      close_connection("failed to allocate TLS context");
    }
    SSL_set_tlsext_host_name(conn.ssl, parsed.host.c_str());
#if defined(SSL_set1_host)
    SSL_set1_host(conn.ssl, parsed.host.c_str());
#endif
    SSL_set_fd(conn.ssl, conn.sock);
    if (SSL_connect(conn.ssl) != 1) {
      close_connection("TLS handshake failed");
    }
    if (SSL_get_verify_result(conn.ssl) != X509_V_OK) {
      close_connection("TLS certificate verification failed");
    }
    while (send_remaining > 0) {
      int sent =
          SSL_write(conn.ssl, send_ptr, static_cast<int>(send_remaining));
      if (sent <= 0) {
        close_connection("failed to send TLS request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
  } else {
    while (send_remaining > 0) {
      ssize_t sent = ::send(conn.sock, send_ptr, send_remaining, MSG_NOSIGNAL);
      if (sent <= 0) {
        close_connection("failed to send request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
    }
  }

  return conn;
}

ssize_t HttpClient::RecvRaw(RawConnection &conn, char *buffer,
                            std::size_t length) const {
  if (conn.ssl) {
    while (true) {
      int received = SSL_read(conn.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(conn.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      if (err == SSL_ERROR_ZERO_RETURN) {
        return 0;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(conn.sock, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpClient::CloseRaw(RawConnection &conn) const {
  if (conn.ssl) {
    SSL_shutdown(conn.ssl);
    SSL_free(conn.ssl);
    conn.ssl = nullptr;
  }
  if (conn.sock >= 0) {
    ::close(conn.sock);
    conn.sock = -1;
  }
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers,
                 const CancelCheck &cancelled) const {
  auto conn = SendRaw(method, url, body, headers);
  auto deadline = std::chrono::steady_clock::now() + timeout_;
  std::string raw;
  char buffer[4096];

  while (true) {
    if (cancelled && cancelled()) {
      CloseRaw(conn);
      throw HttpCancelled();
    }
    if (!(conn.ssl && SSL_pending(conn.ssl) > 0)) {
      pollfd pfd{};
      pfd.fd = conn.sock;
      pfd.events = POLLIN;
      int ready = ::poll(&pfd, 1, kPollIntervalMs);
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        CloseRaw(conn);
        throw std::runtime_error("poll failed while awaiting response");
      }
      if (ready == 0) {
        if (std::chrono::steady_clock::now() > deadline) {
          CloseRaw(conn);
          throw HttpTimeout();
        }
        continue;
      }
    }
    ssize_t read_bytes = RecvRaw(conn, buffer, sizeof(buffer));
    if (read_bytes < 0) {
      bool timed_out = errno == EAGAIN || errno == EWOULDBLOCK;
      CloseRaw(conn);
      if (timed_out) {
        throw HttpTimeout();
      }
      if (raw.find("\r\n\r\n") == std::string::npos) {
        throw std::runtime_error("connection failed while reading response");
      }
      break;
    }
    if (read_bytes == 0) {
      break;
    }
    raw.append(buffer, buffer + read_bytes);
  }
  CloseRaw(conn);

  HttpResponse http_response;
  auto header_end = raw.find("\r\n\r\n");
  std::string head =
      header_end == std::string::npos ? raw : raw.substr(0, header_end);
  if (!ParseResponseHead(head, &http_response)) {
    throw std::runtime_error("malformed HTTP response");
  }
  std::string body_str = header_end == std::string::npos
                             ? std::string()
                             : raw.substr(header_end + 4);
  auto te = http_response.headers.find("transfer-encoding");
  if (te != http_response.headers.end() &&
      Lower(te->second).find("chunked") != std::string::npos) {
    ChunkedDecoder decoder;
    std::string decoded;
    if (!decoder.Feed(body_str.data(), body_str.size(), &decoded)) {
      throw std::runtime_error("malformed chunked response body");
    }
    body_str = std::move(decoded);
  }
  http_response.body = std::move(body_str);
  return http_response;
}

} // namespace vertexbridge

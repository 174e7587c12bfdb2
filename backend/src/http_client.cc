// ─── Mirrorgate — Outbound HTTP/1.1 client implementation ───────────────

#include "http_client.h"
#include "url.h"
#include "utils.h"

#include "crow.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

using Millis = std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

// Time left before `deadline`, never below one millisecond so a socket
// timeout of zero (which means "block forever") is never installed.
Millis remaining_until(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<Millis>(deadline - Clock::now());
  return left.count() < 1 ? Millis(1) : left;
}

timeval to_timeval(Millis timeout) {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return tv;
}

bool set_nonblocking(int fd, bool enabled) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return fcntl(fd, F_SETFL, flags) == 0;
}

// getaddrinfo() has no timeout of its own, so it runs on a helper thread.
// When the deadline passes first the lookup is abandoned and the helper
// frees whatever it eventually gets.
struct PendingLookup {
  std::mutex mutex;
  std::condition_variable done_cv;
  bool done = false;
  bool abandoned = false;
  int rc = 0;
  addrinfo *results = nullptr;
};

addrinfo *resolve_host(const std::string &host, int port,
                       Clock::time_point deadline, std::string &error) {
  auto lookup = std::make_shared<PendingLookup>();
  std::string port_str = std::to_string(port);
  std::thread([lookup, host, port_str]() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *results = nullptr;
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    std::lock_guard<std::mutex> lock(lookup->mutex);
    if (lookup->abandoned) {
      if (rc == 0) freeaddrinfo(results);
      return;
    }
    lookup->rc = rc;
    lookup->results = results;
    lookup->done = true;
    lookup->done_cv.notify_one();
  }).detach();

  std::unique_lock<std::mutex> lock(lookup->mutex);
  if (!lookup->done_cv.wait_until(lock, deadline,
                                  [&lookup] { return lookup->done; })) {
    lookup->abandoned = true;
    error = "DNS resolution timed out for " + host;
    return nullptr;
  }
  if (lookup->rc != 0) {
    error = "DNS resolution failed for " + host + ": " + gai_strerror(lookup->rc);
    return nullptr;
  }
  return lookup->results;
}

// Tries every resolved address in turn; resolution and connect are bounded
// by `deadline` through a non-blocking connect + select.
int connect_tcp(const std::string &host, int port, Clock::time_point deadline,
                std::string &error) {
  addrinfo *results = resolve_host(host, port, deadline, error);
  if (!results) return -1;

  int connected_fd = -1;
  std::string last_error;
  for (addrinfo *addr = results; addr; addr = addr->ai_next) {
    int fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (fd < 0) {
      last_error = std::string("socket() failed: ") + std::strerror(errno);
      continue;
    }
    if (!set_nonblocking(fd, true)) {
      last_error = "fcntl() failed";
      close(fd);
      continue;
    }

    int rc = connect(fd, addr->ai_addr, addr->ai_addrlen);
    if (rc < 0 && errno != EINPROGRESS) {
      last_error = std::string("connect() failed: ") + std::strerror(errno);
      close(fd);
      continue;
    }
    if (rc < 0) {
      fd_set write_set;
      FD_ZERO(&write_set);
      FD_SET(fd, &write_set);
      timeval tv = to_timeval(remaining_until(deadline));
      rc = select(fd + 1, nullptr, &write_set, nullptr, &tv);
      if (rc <= 0) {
        last_error = rc == 0 ? "connect() timed out"
                             : std::string("select() failed: ") +
                                   std::strerror(errno);
        close(fd);
        continue;
      }
      int socket_error = 0;
      socklen_t len = sizeof(socket_error);
      if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &len) < 0 ||
          socket_error != 0) {
        last_error = std::string("connect() failed: ") +
                     std::strerror(socket_error ? socket_error : errno);
        close(fd);
        continue;
      }
    }

    timeval tv = to_timeval(remaining_until(deadline));
    if (!set_nonblocking(fd, false) ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
      last_error = "Failed to configure socket";
      close(fd);
      continue;
    }
    connected_fd = fd;
    break;
  }
  freeaddrinfo(results);

  if (connected_fd < 0) {
    error = last_error.empty() ? "Unable to connect to " + host : last_error;
  }
  return connected_fd;
}

SSL_CTX *client_tls_context(std::string &error) {
  static std::once_flag once;
  static SSL_CTX *ctx = nullptr;
  std::call_once(once, [] {
    SSL_CTX *candidate = SSL_CTX_new(TLS_client_method());
    if (!candidate) return;
    SSL_CTX_set_verify(candidate, SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(candidate) != 1) {
      SSL_CTX_free(candidate);
      return;
    }
    ctx = candidate;
  });
  if (!ctx) error = "TLS client context initialisation failed";
  return ctx;
}

std::string last_tls_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) return "unknown TLS error";
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}

// Plain or TLS byte stream over one connected socket.
class Connection {
public:
  Connection() = default;
  ~Connection() { close_now(); }

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  bool open(const std::string &host, int port, bool tls,
            Clock::time_point deadline, std::string &error) {
    fd_ = connect_tcp(host, port, deadline, error);
    if (fd_ < 0) return false;
    if (!tls) return true;

    SSL_CTX *ctx = client_tls_context(error);
    if (!ctx) return false;
    ssl_ = SSL_new(ctx);
    if (!ssl_) {
      error = "SSL_new() failed";
      return false;
    }
    SSL_set_tlsext_host_name(ssl_, host.c_str());
    SSL_set1_host(ssl_, host.c_str());
    SSL_set_fd(ssl_, fd_);
    if (SSL_connect(ssl_) != 1) {
      error = "TLS handshake with " + host + " failed: " + last_tls_error();
      return false;
    }
    return true;
  }

  bool write_all(const std::string &data, std::string &error) {
    size_t written = 0;
    while (written < data.size()) {
      size_t remaining = data.size() - written;
      if (ssl_) {
        int rc = SSL_write(ssl_, data.data() + written,
                           static_cast<int>(remaining));
        if (rc <= 0) {
          error = "TLS write failed: " + last_tls_error();
          return false;
        }
        written += static_cast<size_t>(rc);
      } else {
        ssize_t rc = send(fd_, data.data() + written, remaining, MSG_NOSIGNAL);
        if (rc < 0) {
          if (errno == EINTR) continue;
          error = (errno == EAGAIN || errno == EWOULDBLOCK)
                      ? "Timed out sending request"
                      : std::string("send() failed: ") + std::strerror(errno);
          return false;
        }
        written += static_cast<size_t>(rc);
      }
    }
    return true;
  }

  // Bounds the next read_some() call.
  bool set_read_timeout(Millis timeout) {
    timeval tv = to_timeval(timeout);
    return setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
  }

  // > 0 bytes read, 0 on orderly close, < 0 on error (error set).
  long read_some(char *buffer, size_t size, std::string &error) {
    if (ssl_) {
      int rc = SSL_read(ssl_, buffer, static_cast<int>(size));
      if (rc > 0) return rc;
      int ssl_error = SSL_get_error(ssl_, rc);
      if (ssl_error == SSL_ERROR_ZERO_RETURN) return 0;
      if (ssl_error == SSL_ERROR_WANT_READ ||
          (ssl_error == SSL_ERROR_SYSCALL &&
           (errno == EAGAIN || errno == EWOULDBLOCK))) {
        error = "Timed out waiting for upstream";
        return -1;
      }
      // Many servers drop the connection without close_notify.
      if (ssl_error == SSL_ERROR_SYSCALL && errno == 0) return 0;
      error = "TLS read failed: " + last_tls_error();
      return -1;
    }
    while (true) {
      ssize_t rc = recv(fd_, buffer, size, 0);
      if (rc >= 0) return static_cast<long>(rc);
      if (errno == EINTR) continue;
      error = (errno == EAGAIN || errno == EWOULDBLOCK)
                  ? "Timed out waiting for upstream"
                  : std::string("recv() failed: ") + std::strerror(errno);
      return -1;
    }
  }

private:
  void close_now() {
    if (ssl_) {
      SSL_shutdown(ssl_);
      SSL_free(ssl_);
      ssl_ = nullptr;
    }
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

  int fd_ = -1;
  SSL *ssl_ = nullptr;
};

// Walks the chunk framing of raw[start..]. `cursor` is the offset (from
// `start`) of the next unread chunk header; it only moves past complete
// chunks, so a caller can resume the scan after more bytes arrive.
// 1 = complete stream, 0 = needs more bytes, -1 = malformed framing.
int scan_chunked(const std::string &raw, size_t start, size_t &cursor,
                 std::string *out) {
  while (true) {
    size_t pos = start + cursor;
    size_t line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) {
      return raw.size() - pos > 1024 ? -1 : 0;
    }

    std::string size_text = raw.substr(pos, line_end - pos);
    size_t ext = size_text.find(';');
    if (ext != std::string::npos) size_text.resize(ext);
    size_text = trim_copy(size_text);
    if (size_text.empty() ||
        size_text.find_first_not_of("0123456789abcdefABCDEF") !=
            std::string::npos ||
        size_text.size() > 15)
      return -1;
    size_t chunk_len = std::stoul(size_text, nullptr, 16);

    size_t data_start = line_end + 2;
    if (chunk_len == 0) {
      // Optional trailers end with an empty line.
      if (raw.compare(data_start, 2, "\r\n") == 0) return 1;
      return raw.find("\r\n\r\n", data_start) != std::string::npos ? 1 : 0;
    }
    if (data_start + chunk_len + 2 > raw.size()) return 0;
    if (raw.compare(data_start + chunk_len, 2, "\r\n") != 0) return -1;
    if (out) out->append(raw, data_start, chunk_len);
    cursor = data_start + chunk_len + 2 - start;
  }
}

bool is_chunked(const HttpProxyResponse &response) {
  auto it = response.headers.find("transfer-encoding");
  return it != response.headers.end() &&
         to_lower(it->second).find("chunked") != std::string::npos;
}

long content_length_of(const HttpProxyResponse &response) {
  auto it = response.headers.find("content-length");
  if (it == response.headers.end()) return -1;
  auto parsed = parse_int_param(trim_copy(it->second).c_str());
  if (!parsed || *parsed < 0) return -1;
  return static_cast<long>(*parsed);
}

bool has_no_body(const std::string &method, int status) {
  return method == "HEAD" || (status >= 100 && status < 200) ||
         status == 204 || status == 304;
}

// Parses status line and headers. `body_start` receives the offset of the
// first body byte.
bool parse_head(const std::string &raw, HttpProxyResponse &out,
                size_t &body_start, std::string &error) {
  size_t header_end = raw.find("\r\n\r\n");
  size_t separator = 4;
  if (header_end == std::string::npos) {
    header_end = raw.find("\n\n");
    separator = 2;
  }
  if (header_end == std::string::npos) {
    error = "Incomplete HTTP response headers";
    return false;
  }
  body_start = header_end + separator;

  std::string head = raw.substr(0, header_end);
  std::vector<std::string> lines = split_copy(head, '\n');
  std::string status_line = trim_copy(lines.front());
  if (!starts_with_ci(status_line, "HTTP/")) {
    error = "Invalid HTTP status line";
    return false;
  }
  size_t code_start = status_line.find(' ');
  if (code_start == std::string::npos) {
    error = "Invalid HTTP status line";
    return false;
  }
  std::string code = status_line.substr(code_start + 1, 3);
  if (code.size() != 3 ||
      code.find_first_not_of("0123456789") != std::string::npos) {
    error = "Failed to parse status code";
    return false;
  }
  out.status_code = std::stoi(code);
  out.headers.clear();
  out.set_cookie_headers.clear();

  for (size_t i = 1; i < lines.size(); ++i) {
    std::string line = lines[i];
    if (!line.empty() && line.back() == '\r') line.pop_back();
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) continue;
    std::string name = to_lower(trim_copy(line.substr(0, colon)));
    std::string value = trim_copy(line.substr(colon + 1));
    if (name == "set-cookie") {
      out.set_cookie_headers.push_back(value);
      continue;
    }
    auto existing = out.headers.find(name);
    if (existing == out.headers.end()) {
      out.headers[name] = value;
    } else {
      existing->second += ", " + value;
    }
  }
  return true;
}

std::string build_request(const HttpRequestSpec &spec, const ParsedUrl &url) {
  std::ostringstream request;
  std::string target = url.path.empty() ? "/" : url.path;
  if (url.has_query) target += "?" + url.query;
  request << spec.method << " " << target << " HTTP/1.1\r\n";
  if (url.explicit_port && url.port != default_port_for_scheme(url.scheme)) {
    request << "Host: " << url.host << ":" << url.port << "\r\n";
  } else {
    request << "Host: " << url.host << "\r\n";
  }
  request << "Connection: close\r\n";

  for (const auto &kv : spec.headers) {
    std::string name = to_lower(kv.first);
    if (name == "host" || name == "connection" || name == "content-length" ||
        name == "transfer-encoding" || name == "keep-alive" ||
        name == "upgrade" || name == "proxy-connection")
      continue;
    request << kv.first << ": " << kv.second << "\r\n";
  }
  bool sends_body = !spec.body.empty() || spec.method == "POST" ||
                    spec.method == "PUT" || spec.method == "PATCH";
  if (sends_body) {
    request << "Content-Length: " << spec.body.size() << "\r\n";
  }
  request << "\r\n";
  if (!spec.body.empty()) request << spec.body;
  return request.str();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════
// Response parsing
// ═══════════════════════════════════════════════════════════════════════

bool dechunk_body(const std::string &body, std::string &out) {
  std::string decoded;
  size_t cursor = 0;
  if (scan_chunked(body, 0, cursor, &decoded) != 1) return false;
  out = std::move(decoded);
  return true;
}

bool parse_http_response(const std::string &raw, HttpProxyResponse &out,
                         std::string &error) {
  size_t body_start = 0;
  if (!parse_head(raw, out, body_start, error)) return false;
  out.body = raw.substr(body_start);

  if (is_chunked(out)) {
    std::string dechunked;
    if (!dechunk_body(out.body, dechunked)) {
      error = "Malformed chunked response body";
      return false;
    }
    out.body = std::move(dechunked);
    out.headers.erase("transfer-encoding");
    out.headers["content-length"] = std::to_string(out.body.size());
    return true;
  }

  long expected = content_length_of(out);
  if (expected >= 0 && out.body.size() > static_cast<size_t>(expected)) {
    out.body.resize(static_cast<size_t>(expected));
  }
  return true;
}

// ═══════════════════════════════════════════════════════════════════════
// Request execution
// ═══════════════════════════════════════════════════════════════════════

HttpProxyResponse send_http_request(const HttpRequestSpec &spec,
                                    ProxyError &error) {
  HttpProxyResponse response;

  ParsedUrl url;
  std::string url_error;
  if (!parse_url(spec.url, url, url_error) ||
      (url.scheme != "http" && url.scheme != "https")) {
    error = make_proxy_error(ProxyErrorKind::MalformedUpstreamResponse,
                             "Unsupported target URL: " + spec.url);
    return response;
  }

  std::string connect_host = url.host;
  if (connect_host.size() > 2 && connect_host.front() == '[') {
    connect_host = connect_host.substr(1, connect_host.size() - 2);
  }

  Millis timeout = spec.timeout.count() > 0 ? spec.timeout : Millis(30000);
  auto deadline = Clock::now() + timeout;

  Connection connection;
  std::string io_error;
  if (!connection.open(connect_host, url.port, url.scheme == "https", deadline,
                       io_error)) {
    error = make_proxy_error(ProxyErrorKind::UpstreamUnreachable, io_error);
    return response;
  }
  if (!connection.write_all(build_request(spec, url), io_error)) {
    error = make_proxy_error(ProxyErrorKind::UpstreamUnreachable, io_error);
    return response;
  }

  // ── Receive response ──
  std::string raw;
  char buffer[16384];
  bool head_parsed = false;
  size_t body_start = 0;
  long expected_length = -1;
  bool chunked = false;
  size_t chunk_cursor = 0;
  bool bodyless = false;

  while (true) {
    if (head_parsed) {
      if (bodyless) break;
      if (expected_length >= 0 &&
          raw.size() - body_start >= static_cast<size_t>(expected_length))
        break;
      if (chunked && scan_chunked(raw, body_start, chunk_cursor, nullptr) != 0)
        break;
    }
    if (Clock::now() >= deadline) {
      error = make_proxy_error(ProxyErrorKind::UpstreamUnreachable,
                               "Timed out reading from " + url.host);
      return response;
    }
    if (!connection.set_read_timeout(remaining_until(deadline))) {
      error = make_proxy_error(ProxyErrorKind::UpstreamUnreachable,
                               "Failed to configure socket");
      return response;
    }

    long received = connection.read_some(buffer, sizeof(buffer), io_error);
    if (received < 0) {
      error = make_proxy_error(ProxyErrorKind::UpstreamUnreachable, io_error);
      return response;
    }
    if (received == 0) break;
    raw.append(buffer, static_cast<size_t>(received));

    if (!head_parsed && (raw.find("\r\n\r\n") != std::string::npos ||
                         raw.find("\n\n") != std::string::npos)) {
      std::string head_error;
      if (!parse_head(raw, response, body_start, head_error)) {
        error = make_proxy_error(ProxyErrorKind::MalformedUpstreamResponse,
                                 head_error);
        return response;
      }
      head_parsed = true;
      bodyless = has_no_body(spec.method, response.status_code);
      chunked = is_chunked(response);
      if (!chunked) expected_length = content_length_of(response);
    }
  }

  if (raw.empty()) {
    error = make_proxy_error(ProxyErrorKind::UpstreamUnreachable,
                             "No response from " + url.host);
    return response;
  }

  std::string parse_error;
  if (!parse_http_response(raw, response, parse_error)) {
    error = make_proxy_error(ProxyErrorKind::MalformedUpstreamResponse,
                             parse_error);
    return response;
  }
  if (bodyless) response.body.clear();

  CROW_LOG_DEBUG << "HTTP " << spec.method << " " << spec.url << " -> "
                 << response.status_code << " (" << response.body.size()
                 << " bytes)";
  return response;
}

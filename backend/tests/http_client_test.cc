#include "http_client.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <functional>
#include <string>
#include <thread>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

// Accepts one connection on 127.0.0.1 and hands the socket to `script`,
// which writes whatever the test needs and returns.
class LoopbackServer {
public:
  explicit LoopbackServer(std::function<void(int)> script) {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    listen(listen_fd_, 1);
    socklen_t len = sizeof(addr);
    getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this, script]() {
      int client = accept(listen_fd_, nullptr, nullptr);
      if (client < 0) return;
      char buffer[4096];
      recv(client, buffer, sizeof(buffer), 0);  // request head
      script(client);
      close(client);
    });
  }

  ~LoopbackServer() {
    shutdown(listen_fd_, SHUT_RDWR);
    if (thread_.joinable()) thread_.join();
    close(listen_fd_);
  }

  std::string url(const std::string &path = "/") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

private:
  int listen_fd_ = -1;
  int port_ = 0;
  std::thread thread_;
};

void send_all(int fd, const std::string &data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t rc = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (rc <= 0) return;
    sent += static_cast<size_t>(rc);
  }
}

}  // namespace

TEST(HttpClientTest, ParsesStatusHeadersAndBody) {
  const std::string raw =
      "HTTP/1.1 200 OK\r\n"
      "Content-Type: text/html; charset=utf-8\r\n"
      "Content-Length: 5\r\n"
      "X-Custom:  spaced  \r\n"
      "\r\n"
      "hello";
  HttpProxyResponse response;
  std::string error;
  ASSERT_TRUE(parse_http_response(raw, response, error)) << error;
  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.body, "hello");
  EXPECT_EQ(response.headers["content-type"], "text/html; charset=utf-8");
  EXPECT_EQ(response.headers["x-custom"], "spaced");
}

TEST(HttpClientTest, CollectsSetCookieSeparatelyAndJoinsRepeats) {
  const std::string raw =
      "HTTP/1.1 302 Found\r\n"
      "Location: /next\r\n"
      "Set-Cookie: a=1; Path=/\r\n"
      "Set-Cookie: b=2\r\n"
      "Vary: Accept\r\n"
      "Vary: Cookie\r\n"
      "Content-Length: 0\r\n"
      "\r\n";
  HttpProxyResponse response;
  std::string error;
  ASSERT_TRUE(parse_http_response(raw, response, error)) << error;
  EXPECT_EQ(response.status_code, 302);
  EXPECT_EQ(response.headers["location"], "/next");
  ASSERT_EQ(response.set_cookie_headers.size(), 2u);
  EXPECT_EQ(response.set_cookie_headers[0], "a=1; Path=/");
  EXPECT_EQ(response.headers.count("set-cookie"), 0u);
  EXPECT_EQ(response.headers["vary"], "Accept, Cookie");
}

TEST(HttpClientTest, TruncatesBodyToContentLength) {
  const std::string raw =
      "HTTP/1.0 200 OK\r\nContent-Length: 3\r\n\r\nabcdef";
  HttpProxyResponse response;
  std::string error;
  ASSERT_TRUE(parse_http_response(raw, response, error));
  EXPECT_EQ(response.body, "abc");
}

TEST(HttpClientTest, DecodesChunkedBodies) {
  const std::string raw =
      "HTTP/1.1 200 OK\r\n"
      "Transfer-Encoding: chunked\r\n"
      "\r\n"
      "5\r\nhello\r\n"
      "7;ext=1\r\n, world\r\n"
      "0\r\n"
      "\r\n";
  HttpProxyResponse response;
  std::string error;
  ASSERT_TRUE(parse_http_response(raw, response, error)) << error;
  EXPECT_EQ(response.body, "hello, world");
  EXPECT_EQ(response.headers.count("transfer-encoding"), 0u);
  EXPECT_EQ(response.headers["content-length"], "12");
}

TEST(HttpClientTest, DechunkHandlesTrailers) {
  std::string out;
  ASSERT_TRUE(dechunk_body("3\r\nabc\r\n0\r\nX-Trailer: 1\r\n\r\n", out));
  EXPECT_EQ(out, "abc");
}

TEST(HttpClientTest, RejectsMalformedChunks) {
  std::string out;
  EXPECT_FALSE(dechunk_body("zz\r\nabc\r\n0\r\n\r\n", out));
  EXPECT_FALSE(dechunk_body("3\r\nabcXX0\r\n\r\n", out));
  EXPECT_FALSE(dechunk_body("5\r\nab", out));  // truncated
}

TEST(HttpClientTest, RejectsInvalidStatusLines) {
  HttpProxyResponse response;
  std::string error;
  EXPECT_FALSE(parse_http_response("garbage\r\n\r\n", response, error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(parse_http_response("HTTP/1.1 abc\r\n\r\n", response, error));
  EXPECT_FALSE(parse_http_response("HTTP/1.1 200 OK\r\nNo-End", response, error));
}

TEST(HttpClientTest, RefusedConnectionIsUpstreamUnreachable) {
  HttpRequestSpec spec;
  spec.url = "http://127.0.0.1:1/";
  spec.timeout = std::chrono::milliseconds(2000);
  ProxyError error;
  send_http_request(spec, error);
  EXPECT_EQ(error.kind, ProxyErrorKind::UpstreamUnreachable);
  EXPECT_TRUE(error.retryable());
}

TEST(HttpClientTest, InvalidUrlIsMalformed) {
  HttpRequestSpec spec;
  spec.url = "not a url";
  ProxyError error;
  send_http_request(spec, error);
  EXPECT_EQ(error.kind, ProxyErrorKind::MalformedUpstreamResponse);
  EXPECT_FALSE(error.retryable());
}

TEST(HttpClientTest, ReadsLargeChunkedBodyInLinearTime) {
  const size_t chunk_size = 64 * 1024;
  const size_t chunk_count = 384;  // 24 MiB
  LoopbackServer server([&](int fd) {
    send_all(fd, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n");
    std::string chunk(chunk_size, 'x');
    char size_line[32];
    snprintf(size_line, sizeof(size_line), "%zx\r\n", chunk_size);
    for (size_t i = 0; i < chunk_count; ++i) {
      send_all(fd, size_line + chunk + "\r\n");
    }
    send_all(fd, "0\r\n\r\n");
  });

  HttpRequestSpec spec;
  spec.url = server.url();
  spec.timeout = std::chrono::milliseconds(20000);
  ProxyError error;
  auto started = std::chrono::steady_clock::now();
  HttpProxyResponse response = send_http_request(spec, error);
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(error.kind, ProxyErrorKind::None) << error.message;
  EXPECT_EQ(response.body.size(), chunk_size * chunk_count);
  EXPECT_EQ(response.headers["content-length"],
            std::to_string(chunk_size * chunk_count));
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(HttpClientTest, StalledReadEndsAtTheAttemptDeadline) {
  LoopbackServer server([](int fd) {
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    send_all(fd, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nab");
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  });

  HttpRequestSpec spec;
  spec.url = server.url();
  spec.timeout = std::chrono::milliseconds(600);
  ProxyError error;
  auto started = std::chrono::steady_clock::now();
  send_http_request(spec, error);
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(error.kind, ProxyErrorKind::UpstreamUnreachable);
  EXPECT_LT(elapsed, std::chrono::milliseconds(900));
}

#pragma once
// ─── Mirrorgate — Outbound WebSocket client ─────────────────────────────
// The upstream leg of a tunnel: a ws:// or wss:// client on Boost.Beast.
// Each connection owns an io_context thread; every read and write runs on
// that thread, so send() and close() may be called from any thread.

#include <chrono>
#include <functional>
#include <memory>
#include <string>

class UpstreamWebSocket {
public:
  struct Options {
    std::chrono::milliseconds timeout{30000};  // connect and handshake
    std::string user_agent;
    std::string origin;        // sent as Origin; empty = omitted
    std::string subprotocols;  // Sec-WebSocket-Protocol; empty = omitted
    // An exception thrown on the io thread (typically by a handler) closes
    // this connection only, instead of terminating the process.
    bool keep_running_on_error = false;
  };

  struct Handlers {
    std::function<void(const std::string &data, bool binary)> on_message;
    // Called once, on the io thread, when the connection ends for any reason.
    std::function<void(const std::string &reason)> on_close;
  };

  UpstreamWebSocket();
  ~UpstreamWebSocket();

  UpstreamWebSocket(const UpstreamWebSocket &) = delete;
  UpstreamWebSocket &operator=(const UpstreamWebSocket &) = delete;

  // Resolves, connects, performs TLS (wss) and the WebSocket handshake.
  // Blocking; returns false with `error` set on failure.
  bool connect(const std::string &url, const Options &options,
               std::string &error);

  // Starts relaying incoming messages to `handlers`.
  void start(Handlers handlers);

  void send(std::string data, bool binary);

  // Graceful close; on_close fires once the close handshake ends.
  void close();

  bool is_open() const;

  class Impl;

private:
  std::unique_ptr<Impl> impl_;
};

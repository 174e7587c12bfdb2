// ─── Mirrorgate — Outbound WebSocket client implementation ──────────────

#include "upstream_websocket.h"
#include "background_error.h"
#include "url.h"

#include "crow.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <deque>
#include <thread>
#include <utility>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

class UpstreamWebSocket::Impl {
public:
  virtual ~Impl() = default;
  virtual bool connect(const ParsedUrl &url, const Options &options,
                       std::string &error) = 0;
  virtual void start(Handlers handlers) = 0;
  virtual void send(std::string data, bool binary) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

namespace {

using PlainWs = websocket::stream<beast::tcp_stream>;
using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

std::unique_ptr<PlainWs> make_ws(net::io_context &ioc, ssl::context &,
                                 PlainWs *) {
  return std::make_unique<PlainWs>(ioc);
}

std::unique_ptr<TlsWs> make_ws(net::io_context &ioc, ssl::context &ctx,
                               TlsWs *) {
  return std::make_unique<TlsWs>(ioc, ctx);
}

// ── TLS layer (no-op for ws://) ──

bool prepare_secure_layer(PlainWs &, ssl::context &, const std::string &,
                          std::string &) {
  return true;
}

bool prepare_secure_layer(TlsWs &ws, ssl::context &ctx, const std::string &host,
                          std::string &error) {
  beast::error_code ec;
  ctx.set_default_verify_paths(ec);
  if (ec) {
    error = "TLS trust store unavailable: " + ec.message();
    return false;
  }
  ctx.set_verify_mode(ssl::verify_peer);
  ws.next_layer().set_verify_callback(ssl::host_name_verification(host));
  if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host.c_str())) {
    error = "Failed to set TLS server name";
    return false;
  }
  return true;
}

template <class Handler>
void async_secure_handshake(PlainWs &ws, Handler &&handler) {
  net::post(ws.get_executor(),
            [handler]() mutable { handler(beast::error_code{}); });
}

template <class Handler>
void async_secure_handshake(TlsWs &ws, Handler &&handler) {
  ws.next_layer().async_handshake(ssl::stream_base::client,
                                  std::forward<Handler>(handler));
}

constexpr std::chrono::seconds kCloseWindow{1};

template <class WsStream>
class Channel : public UpstreamWebSocket::Impl {
public:
  Channel() : ssl_ctx_(ssl::context::tls_client), close_timer_(ioc_) {
    ws_ = make_ws(ioc_, ssl_ctx_, static_cast<WsStream *>(nullptr));
  }

  ~Channel() override {
    if (!io_thread_.joinable()) return;
    // No callbacks once the owner is gone. The close handshake gets a short
    // window before the socket is dropped.
    net::post(ioc_, [this]() {
      handlers_ = {};
      close_timer_.expires_after(kCloseWindow);
      close_timer_.async_wait([this](beast::error_code) { finish("released"); });
      if (!closing_) {
        closing_ = true;
        ws_->async_close(websocket::close_code::going_away,
                         [this](beast::error_code) { finish("released"); });
      }
    });
    io_thread_.join();
  }

  bool connect(const ParsedUrl &url, const UpstreamWebSocket::Options &options,
               std::string &error) override {
    std::string host = url.host;
    if (host.size() > 2 && host.front() == '[') host = host.substr(1, host.size() - 2);

    keep_running_on_error_ = options.keep_running_on_error;
    if (!prepare_secure_layer(*ws_, ssl_ctx_, host, error)) return false;

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(host, std::to_string(url.port), ec);
    if (ec) {
      error = "DNS resolution failed for " + host + ": " + ec.message();
      return false;
    }

    auto &lowest = beast::get_lowest_layer(*ws_);
    lowest.expires_after(options.timeout);
    ec = run_step([&](auto handler) { lowest.async_connect(results, handler); });
    if (ec) {
      error = "connect to " + host + " failed: " + ec.message();
      return false;
    }
    ec = run_step([&](auto handler) { async_secure_handshake(*ws_, handler); });
    if (ec) {
      error = "TLS handshake with " + host + " failed: " + ec.message();
      return false;
    }

    lowest.expires_never();
    websocket::stream_base::timeout timeouts =
        websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.handshake_timeout = options.timeout;
    ws_->set_option(timeouts);
    ws_->set_option(websocket::stream_base::decorator(
        [options](websocket::request_type &req) {
          if (!options.user_agent.empty())
            req.set(beast::http::field::user_agent, options.user_agent);
          if (!options.origin.empty())
            req.set(beast::http::field::origin, options.origin);
          if (!options.subprotocols.empty())
            req.set(beast::http::field::sec_websocket_protocol,
                    options.subprotocols);
        }));

    std::string host_header = url.host;
    if (url.explicit_port && url.port != default_port_for_scheme(url.scheme)) {
      host_header += ":" + std::to_string(url.port);
    }
    std::string target = url.path.empty() ? "/" : url.path;
    if (url.has_query) target += "?" + url.query;

    ec = run_step([&](auto handler) {
      ws_->async_handshake(host_header, target, handler);
    });
    if (ec) {
      error = "WebSocket handshake with " + host + " failed: " + ec.message();
      return false;
    }
    open_ = true;
    return true;
  }

  void start(UpstreamWebSocket::Handlers handlers) override {
    handlers_ = std::move(handlers);
    ioc_.restart();
    io_thread_ = std::thread([this]() {
      auto guard = net::make_work_guard(ioc_);
      net::post(ioc_, [this]() { do_read(); });
      while (true) {
        try {
          ioc_.run();
          return;
        } catch (const std::exception &ex) {
          report_background_exception("Upstream WebSocket", ex,
                                      keep_running_on_error_);
          finish(std::string("error: ") + ex.what());
        }
      }
    });
  }

  void send(std::string data, bool binary) override {
    net::post(ioc_, [this, data = std::move(data), binary]() mutable {
      if (closing_ || finished_) return;
      queue_.emplace_back(std::move(data), binary);
      if (queue_.size() == 1) do_write();
    });
  }

  void close() override {
    net::post(ioc_, [this]() {
      if (closing_ || finished_) return;
      closing_ = true;
      ws_->async_close(websocket::close_code::normal,
                       [this](beast::error_code) { finish("closed by proxy"); });
    });
  }

  bool is_open() const override { return open_ && !finished_flag_; }

private:
  // Runs one asynchronous operation to completion on the calling thread.
  template <class Start>
  beast::error_code run_step(Start start) {
    beast::error_code result = net::error::would_block;
    start([&result](beast::error_code ec, auto &&...) { result = ec; });
    ioc_.restart();
    ioc_.run();
    return result;
  }

  void do_read() {
    ws_->async_read(buffer_, [this](beast::error_code ec, std::size_t) {
      if (ec) {
        finish(ec == websocket::error::closed ? "closed by upstream"
                                              : ec.message());
        return;
      }
      std::string data = beast::buffers_to_string(buffer_.data());
      buffer_.consume(buffer_.size());
      if (handlers_.on_message) handlers_.on_message(data, ws_->got_binary());
      do_read();
    });
  }

  void do_write() {
    auto &front = queue_.front();
    ws_->binary(front.second);
    ws_->async_write(net::buffer(front.first),
                     [this](beast::error_code ec, std::size_t) {
                       if (ec) {
                         finish(ec.message());
                         return;
                       }
                       queue_.pop_front();
                       if (!queue_.empty() && !finished_) do_write();
                     });
  }

  void finish(const std::string &reason) {
    if (finished_) return;
    finished_ = true;
    finished_flag_ = true;
    queue_.clear();
    beast::error_code ec;
    beast::get_lowest_layer(*ws_).socket().close(ec);
    auto on_close = std::move(handlers_.on_close);
    handlers_ = {};
    ioc_.stop();
    if (on_close) on_close(reason);
  }

  net::io_context ioc_;
  ssl::context ssl_ctx_;
  std::unique_ptr<WsStream> ws_;
  net::steady_timer close_timer_;
  beast::flat_buffer buffer_;
  std::deque<std::pair<std::string, bool>> queue_;
  UpstreamWebSocket::Handlers handlers_;
  std::thread io_thread_;
  bool open_ = false;
  bool keep_running_on_error_ = false;
  bool closing_ = false;                    // io thread only
  bool finished_ = false;                   // io thread only
  std::atomic<bool> finished_flag_{false};  // readable from any thread
};

}  // namespace

UpstreamWebSocket::UpstreamWebSocket() = default;
UpstreamWebSocket::~UpstreamWebSocket() = default;

bool UpstreamWebSocket::connect(const std::string &url, const Options &options,
                                std::string &error) {
  ParsedUrl parsed;
  if (!parse_url(url, parsed, error)) return false;
  if (parsed.scheme == "wss") {
    impl_ = std::make_unique<Channel<TlsWs>>();
  } else if (parsed.scheme == "ws") {
    impl_ = std::make_unique<Channel<PlainWs>>();
  } else {
    error = "Unsupported WebSocket scheme: " + parsed.scheme;
    return false;
  }
  if (!impl_->connect(parsed, options, error)) {
    impl_.reset();
    return false;
  }
  CROW_LOG_DEBUG << "Upstream WebSocket connected: " << url;
  return true;
}

void UpstreamWebSocket::start(Handlers handlers) {
  if (impl_) impl_->start(std::move(handlers));
}

void UpstreamWebSocket::send(std::string data, bool binary) {
  if (impl_) impl_->send(std::move(data), binary);
}

void UpstreamWebSocket::close() {
  if (impl_) impl_->close();
}

bool UpstreamWebSocket::is_open() const { return impl_ && impl_->is_open(); }

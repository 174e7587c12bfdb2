#pragma once
// ─── Mirrorgate — Application context ───────────────────────────────────
// Holds all shared state (codec, cache, orchestrator, tunnels, sessions)
// and the two entry points the HTTP surface is built on:
// encode_for_proxy and resolve_via_proxy.

#include "crow.h"
#include "config.h"
#include "fetch_orchestrator.h"
#include "models.h"
#include "proxy_error.h"
#include "response_cache.h"
#include "session_hub.h"
#include "url_codec.h"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// ── Rate limiting state ──
struct RateLimitEntry {
  std::deque<SteadyTime> requests;
};

struct AppContext {
  // `sender` and `sleeper` replace the network and the backoff wait in tests.
  explicit AppContext(ProxyConfig cfg, HttpSender sender = nullptr,
                      FetchOrchestrator::Sleeper sleeper = nullptr);
  ~AppContext();

  AppContext(const AppContext &) = delete;
  AppContext &operator=(const AppContext &) = delete;

  ProxyConfig config;
  UrlCodec codec;
  ResponseCache cache;
  FetchOrchestrator orchestrator;
  SessionHub sessions;
  SteadyTime started_at;

  // ── Tunnel state ──
  std::mutex tunnel_mutex;
  std::unordered_map<crow::websocket::connection *, std::shared_ptr<TunnelState>>
      tunnel_connections;
  std::atomic<uint64_t> next_tunnel_id{1};
  std::atomic<uint64_t> tunnels_opened{0};

  // ── Session sockets ──
  std::mutex session_socket_mutex;
  std::unordered_map<crow::websocket::connection *, SessionHub::MemberId>
      session_connections;

  // ── Rate limiting ──
  std::mutex rate_limit_mutex;
  std::unordered_map<std::string, RateLimitEntry> rate_limit_map;

  // ── Counters ──
  std::atomic<uint64_t> requests_served{0};
  std::atomic<uint64_t> upstream_failures{0};
  std::atomic<uint64_t> requests_rate_limited{0};

  // Proxy path ("/watch?url=<token>") for an absolute http(s) URL.
  std::string encode_for_proxy(const std::string &url) const;

  // Decodes the proxy path, fetches the target (cache first) and rewrites
  // the body for the browser.
  std::optional<TransformedResponse> resolve_via_proxy(const std::string &path,
                                                       ProxyError &error);

  // Same pipeline for an already decoded target. Non-GET requests bypass
  // the cache.
  std::optional<TransformedResponse> resolve_target(const std::string &url,
                                                    const FetchRequest &request,
                                                    ProxyError &error);

  // "data" object of a session proxy_response: {status, headers, content}
  // for an absolute http(s) URL, content rewritten like a /watch body.
  std::optional<std::string> proxy_response_json(const std::string &url,
                                                 std::string &error);

  // Sliding-window limit per client key (the remote address). Records the
  // request and returns true when it is within the configured budget.
  bool check_rate_limit(const std::string &key);

  // Closes upstream tunnel legs, forgets session members and stops the
  // cache sweeper. Safe to call more than once.
  void shutdown();

private:
  std::atomic<bool> shut_down_{false};
};

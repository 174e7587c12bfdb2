#pragma once
// ─── Mirrorgate — Data models ───────────────────────────────────────────
// Pure data structures used across the application.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

using SteadyTime = std::chrono::steady_clock::time_point;

// One decoded upstream response, as produced by the HTTP client.
struct HttpProxyResponse {
  int status_code = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;  // lower-case names
  std::vector<std::string> set_cookie_headers;
};

// Outbound request description handed to the HTTP client.
struct HttpRequestSpec {
  std::string method = "GET";
  std::string url;  // absolute http(s) URL
  std::unordered_map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{30000};
};

// Value stored in the response cache.
struct CachedResponse {
  std::string payload;
  std::string content_type;
  std::string final_url;
};

struct CacheEntry {
  std::string key;
  CachedResponse value;
  SteadyTime created_at;
  SteadyTime expires_at;
  SteadyTime last_accessed_at;
  uint64_t access_count = 0;
  size_t size_bytes = 0;
  uint64_t touch_order = 0;  // breaks lastAccessedAt ties during eviction
};

struct CacheStats {
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t evictions = 0;
  uint64_t total_requests = 0;
  double hit_rate = 0.0;
  double eviction_rate = 0.0;
  size_t size = 0;
  size_t memory_bytes = 0;
  size_t max_size = 0;
  size_t max_memory = 0;
};

// Result of one orchestrated fetch (after redirects and decoding).
struct FetchResult {
  int status_code = 0;
  std::string body;
  std::string content_type;
  std::string final_url;
  std::unordered_map<std::string, std::string> headers;
  std::vector<std::string> redirect_chain;
  bool from_cache = false;
};

// Outcome of resolveViaProxy: the response the browser receives.
struct TransformedResponse {
  int status_code = 200;
  std::string body;
  std::string content_type;
  std::unordered_map<std::string, std::string> headers;
  bool cache_hit = false;
};

class UpstreamWebSocket;

// One browser WebSocket bridged to its upstream. The upstream leg owns
// its own io thread.
struct TunnelState {
  uint64_t id = 0;
  std::string target_url;  // ws:// or wss://
  std::unique_ptr<UpstreamWebSocket> upstream;
  std::atomic<bool> active{false};
  SteadyTime opened_at;
};

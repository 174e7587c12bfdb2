#pragma once
// ─── Mirrorgate — Fetch orchestrator ────────────────────────────────────
// Issues outbound requests on behalf of the proxy: cache lookup, redirect
// following with loop detection, retry with exponential backoff and
// transparent content decoding.

#include "http_client.h"
#include "models.h"
#include "proxy_error.h"
#include "response_cache.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

struct FetchRequest {
  std::string method = "GET";
  // Merged over the browser-like template; names compare case-insensitively.
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

class FetchOrchestrator {
public:
  struct Options {
    int max_redirects = 10;
    int retry_count = 3;  // total attempts per hop
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds timeout{30000};  // per attempt
  };

  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  // `cache` may be null (no caching). `sleeper` defaults to
  // std::this_thread::sleep_for.
  FetchOrchestrator(ResponseCache *cache, HttpSender sender, Options options,
                    Sleeper sleeper = nullptr);

  std::optional<FetchResult> fetch(const std::string &url,
                                   const FetchRequest &request,
                                   ProxyError &error);

  std::optional<FetchResult> fetch(const std::string &url, ProxyError &error) {
    return fetch(url, FetchRequest{}, error);
  }

  const Options &options() const { return options_; }

  static const std::unordered_map<std::string, std::string> &
  browser_headers();

private:
  HttpProxyResponse send_with_retry(const HttpRequestSpec &spec,
                                    ProxyError &error);

  ResponseCache *cache_;
  HttpSender sender_;
  Options options_;
  Sleeper sleeper_;
};

// ─── Mirrorgate — AppContext implementation ─────────────────────────────

#include "app_context.h"
#include "content_rewriter.h"
#include "upstream_websocket.h"
#include "utils.h"

#include "crow.h"

#include <vector>

namespace {

ResponseCache::Options cache_options(const ProxyConfig &config) {
  ResponseCache::Options options;
  options.max_size = config.cache_max_entries;
  options.max_memory = config.cache_max_memory;
  options.default_ttl = config.cache_ttl;
  options.sizing = config.cache_sizing;
  options.estimated_entry_size = config.cache_estimated_entry_size;
  options.keep_running_on_error = config.debug;
  return options;
}

FetchOrchestrator::Options fetch_options(const ProxyConfig &config) {
  FetchOrchestrator::Options options;
  options.max_redirects = config.max_redirects;
  options.retry_count = config.retry_count;
  options.retry_base_delay = config.retry_base_delay;
  options.timeout = config.request_timeout;
  return options;
}

// Upstream headers that survive into the proxied response. Everything else
// (framing, hop-by-hop, CSP and frame options, cookies) is dropped.
const char *const kForwardedHeaders[] = {
    "cache-control", "expires", "vary", "last-modified", "etag",
};

}  // namespace

AppContext::AppContext(ProxyConfig cfg, HttpSender sender,
                       FetchOrchestrator::Sleeper sleeper)
    : config(std::move(cfg)),
      codec(config.proxy_prefix),
      cache(cache_options(config)),
      orchestrator(&cache, std::move(sender), fetch_options(config),
                   std::move(sleeper)),
      started_at(std::chrono::steady_clock::now()) {
  sessions.set_proxy_handler([this](const std::string &url, std::string &error) {
    return proxy_response_json(url, error);
  });
}

AppContext::~AppContext() { shutdown(); }

std::string AppContext::encode_for_proxy(const std::string &url) const {
  return codec.proxy_path(url);
}

// ── Rate limiting ───────────────────────────────────────────────────────

bool AppContext::check_rate_limit(const std::string &key) {
  if (config.rate_limit_max_requests <= 0) return true;
  std::lock_guard<std::mutex> lock(rate_limit_mutex);
  auto now = std::chrono::steady_clock::now();
  auto window = config.rate_limit_window;

  // Forget idle clients so the map stays bounded by the active ones.
  if (rate_limit_map.size() > 4096) {
    for (auto it = rate_limit_map.begin(); it != rate_limit_map.end();) {
      if (it->second.requests.empty() ||
          now - it->second.requests.back() > window) {
        it = rate_limit_map.erase(it);
      } else {
        ++it;
      }
    }
  }

  auto &entry = rate_limit_map[key];
  while (!entry.requests.empty() && now - entry.requests.front() > window) {
    entry.requests.pop_front();
  }
  if (static_cast<int>(entry.requests.size()) >= config.rate_limit_max_requests) {
    requests_rate_limited.fetch_add(1);
    return false;
  }
  entry.requests.push_back(now);
  return true;
}

std::optional<TransformedResponse> AppContext::resolve_via_proxy(
    const std::string &path, ProxyError &error) {
  auto target = codec.decode_proxy_path(path, error);
  if (!target) return std::nullopt;
  return resolve_target(*target, FetchRequest{}, error);
}

std::optional<TransformedResponse> AppContext::resolve_target(
    const std::string &url, const FetchRequest &request, ProxyError &error) {
  auto fetched = orchestrator.fetch(url, request, error);
  if (!fetched) {
    upstream_failures.fetch_add(1);
    return std::nullopt;
  }

  TransformedResponse out;
  out.status_code = fetched->status_code;
  out.content_type = fetched->content_type;
  out.cache_hit = fetched->from_cache;

  auto still_encoded = fetched->headers.find("content-encoding");
  if (still_encoded != fetched->headers.end()) {
    // Unknown coding: the bytes cannot be rewritten, hand them over as is.
    out.body = std::move(fetched->body);
    out.headers["Content-Encoding"] = still_encoded->second;
  } else {
    RewriteContext rewrite_ctx(fetched->final_url, codec, config.tunnel_prefix);
    RewriteOptions options;
    options.script_strategy = config.script_strategy;
    out.body = transform_content(fetched->content_type, fetched->body,
                                 rewrite_ctx, options);
  }

  for (const char *name : kForwardedHeaders) {
    auto it = fetched->headers.find(name);
    if (it != fetched->headers.end()) out.headers[name] = it->second;
  }
  // A 3xx that was not followed still has to lead back through the proxy.
  auto location = fetched->headers.find("location");
  if (location != fetched->headers.end()) {
    RewriteContext rewrite_ctx(fetched->final_url, codec, config.tunnel_prefix);
    auto rewritten = rewrite_url(location->second, rewrite_ctx);
    out.headers["Location"] = rewritten ? *rewritten : location->second;
  }
  return out;
}

std::optional<std::string> AppContext::proxy_response_json(
    const std::string &url, std::string &error) {
  ProxyError proxy_error;
  auto result = resolve_target(url, FetchRequest{}, proxy_error);
  if (!result) {
    error = proxy_error.message;
    return std::nullopt;
  }
  crow::json::wvalue data;
  data["status"] = result->status_code;
  crow::json::wvalue headers(crow::json::load("{}"));
  if (!result->content_type.empty()) headers["content-type"] = result->content_type;
  for (const auto &header : result->headers) {
    headers[to_lower(header.first)] = header.second;
  }
  data["headers"] = std::move(headers);
  data["content"] = result->body;
  return data.dump();
}

void AppContext::shutdown() {
  if (shut_down_.exchange(true)) return;

  std::vector<std::shared_ptr<TunnelState>> tunnels;
  {
    std::lock_guard<std::mutex> lock(tunnel_mutex);
    for (auto &entry : tunnel_connections) tunnels.push_back(entry.second);
    tunnel_connections.clear();
  }
  for (auto &state : tunnels) {
    state->active = false;
    state->upstream.reset();
  }
  if (!tunnels.empty()) {
    CROW_LOG_INFO << "Shutdown: closed " << tunnels.size() << " tunnel(s)";
  }

  {
    std::lock_guard<std::mutex> lock(session_socket_mutex);
    session_connections.clear();
  }
  sessions.clear();
  cache.stop_sweeper();
}

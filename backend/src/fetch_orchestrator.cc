// ─── Mirrorgate — Fetch orchestrator implementation ─────────────────────

#include "fetch_orchestrator.h"
#include "decompress.h"
#include "url.h"
#include "utils.h"

#include "crow.h"

#include <thread>
#include <unordered_set>

namespace {

bool is_redirect_status(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 ||
         status == 308;
}

std::unordered_map<std::string, std::string> merge_headers(
    const std::unordered_map<std::string, std::string> &base,
    const std::unordered_map<std::string, std::string> &overrides) {
  std::unordered_map<std::string, std::string> merged = base;
  for (const auto &kv : overrides) {
    std::string lowered = to_lower(kv.first);
    for (auto it = merged.begin(); it != merged.end();) {
      if (to_lower(it->first) == lowered) it = merged.erase(it);
      else ++it;
    }
    merged[kv.first] = kv.second;
  }
  return merged;
}

void erase_header_ci(std::unordered_map<std::string, std::string> &headers,
                     const std::string &name) {
  for (auto it = headers.begin(); it != headers.end();) {
    if (to_lower(it->first) == name) it = headers.erase(it);
    else ++it;
  }
}

}  // namespace

FetchOrchestrator::FetchOrchestrator(ResponseCache *cache, HttpSender sender,
                                     Options options, Sleeper sleeper)
    : cache_(cache), sender_(std::move(sender)), options_(options),
      sleeper_(std::move(sleeper)) {
  if (!sender_) sender_ = send_http_request;
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
  if (options_.retry_count < 1) options_.retry_count = 1;
  if (options_.max_redirects < 0) options_.max_redirects = 0;
}

const std::unordered_map<std::string, std::string> &
FetchOrchestrator::browser_headers() {
  static const std::unordered_map<std::string, std::string> headers = {
      {"User-Agent",
       "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
       "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"},
      {"Accept",
       "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,"
       "image/webp,image/apng,*/*;q=0.8"},
      {"Accept-Language", "en-US,en;q=0.9"},
      {"Accept-Encoding", "gzip, deflate, br"},
      {"Sec-Fetch-Dest", "document"},
      {"Sec-Fetch-Mode", "navigate"},
      {"Sec-Fetch-Site", "none"},
      {"Sec-Fetch-User", "?1"},
      {"Upgrade-Insecure-Requests", "1"},
  };
  return headers;
}

HttpProxyResponse FetchOrchestrator::send_with_retry(const HttpRequestSpec &spec,
                                                     ProxyError &error) {
  HttpProxyResponse response;
  for (int attempt = 0; attempt < options_.retry_count; ++attempt) {
    error = ProxyError{};
    response = sender_(spec, error);
    if (!error) return response;
    if (!error.retryable()) return response;

    if (attempt + 1 < options_.retry_count) {
      auto delay = options_.retry_base_delay * (1LL << attempt);
      CROW_LOG_DEBUG << "Fetch: attempt " << (attempt + 1) << " for "
                     << spec.url << " failed (" << error.message
                     << "), retrying in " << delay.count() << "ms";
      sleeper_(delay);
    }
  }
  CROW_LOG_WARNING << "Fetch: giving up on " << spec.url << " after "
                   << options_.retry_count << " attempts: " << error.message;
  return response;
}

std::optional<FetchResult> FetchOrchestrator::fetch(const std::string &url,
                                                    const FetchRequest &request,
                                                    ProxyError &error) {
  error = ProxyError{};
  std::string method = request.method.empty() ? "GET" : request.method;
  bool cacheable = cache_ && method == "GET";

  if (cacheable) {
    if (auto cached = cache_->get(normalize_url(url))) {
      CROW_LOG_DEBUG << "Cache HIT " << url;
      FetchResult result;
      result.status_code = 200;
      result.body = std::move(cached->payload);
      result.content_type = std::move(cached->content_type);
      result.final_url = std::move(cached->final_url);
      result.headers["content-type"] = result.content_type;
      result.redirect_chain.push_back(url);
      result.from_cache = true;
      return result;
    }
    CROW_LOG_DEBUG << "Cache MISS " << url;
  }

  HttpRequestSpec spec;
  spec.method = method;
  spec.url = url;
  spec.headers = merge_headers(browser_headers(), request.headers);
  spec.body = request.body;
  spec.timeout = options_.timeout;

  std::unordered_set<std::string> visited;
  std::vector<std::string> chain;
  HttpProxyResponse response;

  while (true) {
    visited.insert(normalize_url(spec.url));
    chain.push_back(spec.url);

    response = send_with_retry(spec, error);
    if (error) return std::nullopt;

    auto location = response.headers.find("location");
    if (!is_redirect_status(response.status_code) ||
        location == response.headers.end() || location->second.empty()) {
      break;
    }

    std::string resolve_error;
    auto next = resolve_url(spec.url, location->second, resolve_error);
    if (!next || !is_http_url(*next)) {
      error = make_proxy_error(
          ProxyErrorKind::MalformedUpstreamResponse,
          "Unusable redirect target '" + location->second + "' from " +
              spec.url);
      return std::nullopt;
    }
    if (visited.count(normalize_url(*next))) {
      error = make_proxy_error(ProxyErrorKind::CircularRedirect,
                               "Redirect loop detected at " + *next);
      return std::nullopt;
    }
    if (static_cast<int>(chain.size()) > options_.max_redirects) {
      error = make_proxy_error(
          ProxyErrorKind::TooManyRedirects,
          "More than " + std::to_string(options_.max_redirects) +
              " redirects starting at " + url);
      return std::nullopt;
    }

    int status = response.status_code;
    if ((status == 301 || status == 302 || status == 303) &&
        spec.method != "GET" && spec.method != "HEAD") {
      spec.method = "GET";
      spec.body.clear();
      erase_header_ci(spec.headers, "content-type");
    }
    CROW_LOG_DEBUG << "Fetch: " << status << " " << spec.url << " -> " << *next;
    spec.url = *next;
  }

  // ── Decode body ──
  auto encoding = response.headers.find("content-encoding");
  if (encoding != response.headers.end()) {
    std::string decode_error;
    DecodeOutcome outcome =
        decode_content_encoding(encoding->second, response.body, decode_error);
    if (outcome == DecodeOutcome::Failed) {
      error = make_proxy_error(ProxyErrorKind::MalformedUpstreamResponse,
                               decode_error + " (" + spec.url + ")");
      return std::nullopt;
    }
    if (outcome == DecodeOutcome::Decoded) {
      response.headers.erase("content-encoding");
      response.headers["content-length"] = std::to_string(response.body.size());
    }
  }

  FetchResult result;
  result.status_code = response.status_code;
  result.body = std::move(response.body);
  result.final_url = spec.url;
  result.headers = std::move(response.headers);
  auto content_type = result.headers.find("content-type");
  if (content_type != result.headers.end()) {
    result.content_type = content_type->second;
  }
  result.redirect_chain = std::move(chain);

  // Bodies still carrying an unknown coding are not cached: the entry would
  // lose the header needed to read them.
  if (cacheable && spec.method == "GET" && result.status_code == 200 &&
      result.headers.count("content-encoding") == 0) {
    CachedResponse cached{result.body, result.content_type, result.final_url};
    std::string final_key = normalize_url(result.final_url);
    std::string request_key = normalize_url(url);
    if (request_key != final_key) cache_->set(request_key, cached);
    cache_->set(final_key, std::move(cached));
  }
  return result;
}

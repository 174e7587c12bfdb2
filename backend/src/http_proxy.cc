// ─── Mirrorgate — HTTP proxy surface implementation ─────────────────────

#include "http_proxy.h"
#include "app_context.h"
#include "url.h"
#include "utils.h"

#include <chrono>

namespace {

constexpr int kRetryAfterSeconds = 5;

bool is_forwarding_method(crow::HTTPMethod method) {
  return method == crow::HTTPMethod::Post || method == crow::HTTPMethod::Put ||
         method == crow::HTTPMethod::Patch ||
         method == crow::HTTPMethod::Delete;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════
//  Input helpers
// ═══════════════════════════════════════════════════════════════════════

std::optional<std::string> normalize_user_target(const std::string &input) {
  std::string value = trim_copy(input);
  if (value.empty()) return std::nullopt;

  std::string scheme = scheme_of(value);
  // "localhost:8080/x" reads as a scheme until the "//" is checked.
  if (!scheme.empty() && value.compare(scheme.size(), 3, "://") != 0) {
    scheme.clear();
  }
  if (scheme.empty()) {
    // "//host/path" and "host/path" both default to https.
    value = value.compare(0, 2, "//") == 0 ? "https:" + value
                                           : "https://" + value;
  } else if (scheme != "http" && scheme != "https") {
    return std::nullopt;
  }

  ParsedUrl parsed;
  std::string error;
  if (!parse_url(value, parsed, error) || parsed.host.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> read_target_from_body(const crow::request &request) {
  std::string content_type =
      media_type_of(request.get_header_value("Content-Type"));

  if (content_type == "application/x-www-form-urlencoded") {
    crow::query_string form("?" + request.body);
    const char *url = form.get("url");
    if (url) return std::string(url);
    return std::nullopt;
  }

  // JSON is the default for anything else.
  auto body = crow::json::load(request.body);
  if (!body || body.t() != crow::json::type::Object || !body.has("url") ||
      body["url"].t() != crow::json::type::String) {
    return std::nullopt;
  }
  return std::string(body["url"].s());
}

// ═══════════════════════════════════════════════════════════════════════
//  Responses
// ═══════════════════════════════════════════════════════════════════════

crow::response build_proxy_response(const TransformedResponse &transformed) {
  crow::response resp;
  resp.code = transformed.status_code;
  resp.body = transformed.body;
  if (!transformed.content_type.empty()) {
    resp.set_header("Content-Type", transformed.content_type);
  }
  for (const auto &header : transformed.headers) {
    resp.set_header(header.first, header.second);
  }
  resp.set_header("X-Cache", transformed.cache_hit ? "HIT" : "MISS");
  return resp;
}

crow::response build_error_page(const ProxyError &error,
                                const std::string &retry_path) {
  int status = proxy_error_status(error.kind);
  std::string title = status == 400 ? "Invalid address"
                      : status == 503 ? "Site unreachable"
                                      : "Upstream error";

  std::string html =
      "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">"
      "<title>" + title + " - Mirrorgate</title></head><body>"
      "<h1>" + title + "</h1>"
      "<p>" + html_escape(error.message) + "</p>"
      "<p><small>" + proxy_error_name(error.kind) + "</small></p>"
      "<p><a href=\"" + html_escape(retry_path) + "\">Try again</a></p>"
      "</body></html>\n";

  crow::response resp(status, html);
  resp.set_header("Content-Type", "text/html; charset=utf-8");
  resp.set_header("Cache-Control", "no-store");
  if (error.retryable()) {
    resp.set_header("Retry-After", std::to_string(kRetryAfterSeconds));
  }
  return resp;
}

// ═══════════════════════════════════════════════════════════════════════
//  /watch
// ═══════════════════════════════════════════════════════════════════════

std::optional<crow::response> rate_limit_rejection(AppContext &ctx,
                                                   const crow::request &request) {
  if (ctx.check_rate_limit(request.remote_ip_address)) return std::nullopt;
  CROW_LOG_WARNING << "Rate limit exceeded for " << request.remote_ip_address;
  crow::response resp(429, "Too many requests");
  resp.set_header("Content-Type", "text/plain; charset=utf-8");
  resp.set_header("Retry-After",
                  std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                                     ctx.config.rate_limit_window)
                                     .count()));
  return resp;
}

crow::response handle_watch_request(AppContext &ctx,
                                    const crow::request &request) {
  if (auto rejected = rate_limit_rejection(ctx, request))
    return std::move(*rejected);
  ctx.requests_served.fetch_add(1);
  const char *token = request.url_params.get("url");
  std::string retry_path = request.raw_url.empty() ? "/" : request.raw_url;

  ProxyError error;
  std::optional<TransformedResponse> result;

  try {
    if (token && *token) {
      if (is_forwarding_method(request.method)) {
        // Form submissions and scripted requests through a rewritten URL.
        auto target = ctx.codec.decode(token, error);
        if (target) {
          FetchRequest forward;
          forward.method = crow::method_name(request.method);
          forward.body = request.body;
          std::string content_type = request.get_header_value("Content-Type");
          if (!content_type.empty()) forward.headers["Content-Type"] = content_type;
          result = ctx.resolve_target(*target, forward, error);
        }
      } else {
        result = ctx.resolve_via_proxy(ctx.codec.proxy_prefix() + token, error);
      }
    } else if (request.method == crow::HTTPMethod::Post) {
      auto raw_target = read_target_from_body(request);
      auto target = raw_target ? normalize_user_target(*raw_target)
                               : std::nullopt;
      if (!target) {
        error = make_proxy_error(ProxyErrorKind::InvalidToken,
                                 "Expected a body with a valid url field");
        retry_path = "/";
      } else {
        retry_path = ctx.encode_for_proxy(*target);
        result = ctx.resolve_target(*target, FetchRequest{}, error);
      }
    } else {
      error = make_proxy_error(ProxyErrorKind::InvalidToken,
                               "Missing url parameter");
      retry_path = "/";
    }
  } catch (const std::exception &ex) {
    CROW_LOG_ERROR << "Proxy: unhandled exception for " << request.raw_url
                   << ": " << ex.what();
    error = make_proxy_error(ProxyErrorKind::MalformedUpstreamResponse,
                             ctx.config.debug ? ex.what()
                                              : "Internal proxy error");
  }

  if (!result) {
    if (!error) {
      error = make_proxy_error(ProxyErrorKind::MalformedUpstreamResponse,
                               "Empty upstream result");
    }
    if (error.kind == ProxyErrorKind::InvalidToken) {
      CROW_LOG_WARNING << "Proxy: " << error.message;
    } else {
      CROW_LOG_ERROR << "Proxy: " << proxy_error_name(error.kind) << " for "
                     << request.raw_url << ": " << error.message;
    }
    return build_error_page(error, retry_path);
  }
  return build_proxy_response(*result);
}

// ═══════════════════════════════════════════════════════════════════════
//  Route registration
// ═══════════════════════════════════════════════════════════════════════

void register_proxy_routes(CrowApp &app, AppContext &ctx) {
  CROW_ROUTE(app, "/watch")
      .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post,
               crow::HTTPMethod::Put, crow::HTTPMethod::Delete,
               crow::HTTPMethod::Patch)
      ([&ctx](const crow::request &request) {
        return handle_watch_request(ctx, request);
      });
}

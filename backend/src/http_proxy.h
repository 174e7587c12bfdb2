#pragma once
// ─── Mirrorgate — HTTP proxy surface ────────────────────────────────────
// The /watch handler: decodes the target, resolves it through the
// AppContext pipeline and turns the result (or the failure) into a Crow
// response.

#include "models.h"
#include "proxy_error.h"
#include "request_log_middleware.h"

#include <optional>
#include <string>

struct AppContext;

// User input to an absolute http(s) URL: surrounding blanks trimmed, a bare
// host ("example.com/x") defaulted to https://. std::nullopt when the result
// is still not a usable URL.
std::optional<std::string> normalize_user_target(const std::string &input);

// Reads "url" from a JSON ({"url": ...}) or form-encoded (url=...) body.
std::optional<std::string> read_target_from_body(const crow::request &request);

// Successful resolution: status, body, content type, forwarded headers and
// X-Cache.
crow::response build_proxy_response(const TransformedResponse &transformed);

// User-facing HTML error page with a retry link. 503 responses carry
// Retry-After.
crow::response build_error_page(const ProxyError &error,
                                 const std::string &retry_path);

// 429 response when the client behind `request` has used up its request
// budget; std::nullopt (and the request counted) otherwise.
std::optional<crow::response> rate_limit_rejection(AppContext &ctx,
                                                   const crow::request &request);

crow::response handle_watch_request(AppContext &ctx,
                                    const crow::request &request);

// Registers /watch (GET, POST, PUT, PATCH, DELETE).
void register_proxy_routes(CrowApp &app, AppContext &ctx);

#pragma once
// ─── Mirrorgate — Outbound HTTP/1.1 client ──────────────────────────────
// One request per connection over raw sockets, TLS through OpenSSL for
// https targets. Bodies come back de-chunked but still content-encoded.

#include "models.h"
#include "proxy_error.h"

#include <functional>
#include <string>

// Sends one request and reads the full response. Connect, TLS, send and
// timeout failures are reported as UpstreamUnreachable; responses that
// cannot be parsed as HTTP/1.x are reported as MalformedUpstreamResponse.
HttpProxyResponse send_http_request(const HttpRequestSpec &spec,
                                    ProxyError &error);

// Injection point used by the fetch orchestrator (and replaced in tests).
using HttpSender =
    std::function<HttpProxyResponse(const HttpRequestSpec &, ProxyError &)>;

// Parses a raw HTTP/1.x response (status line, headers, body). Exposed for
// testing; `error` is set when the status line or framing is invalid.
bool parse_http_response(const std::string &raw, HttpProxyResponse &out,
                         std::string &error);

// Removes chunked transfer framing. Returns false on a malformed stream.
bool dechunk_body(const std::string &body, std::string &out);

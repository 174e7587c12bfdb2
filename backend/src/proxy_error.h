#pragma once
// ─── Mirrorgate — Proxy error taxonomy ──────────────────────────────────
// Every failure of the proxy pipeline is carried as a ProxyError and mapped
// to an HTTP status at the handler boundary.

#include <string>
#include <utility>

enum class ProxyErrorKind {
  None,
  InvalidToken,
  UpstreamUnreachable,
  CircularRedirect,
  TooManyRedirects,
  MalformedUpstreamResponse,
};

struct ProxyError {
  ProxyErrorKind kind = ProxyErrorKind::None;
  std::string message;

  explicit operator bool() const { return kind != ProxyErrorKind::None; }

  // Connect/timeout failures are worth another attempt; everything else is
  // deterministic for a given upstream response.
  bool retryable() const { return kind == ProxyErrorKind::UpstreamUnreachable; }
};

inline ProxyError make_proxy_error(ProxyErrorKind kind, std::string message) {
  ProxyError error;
  error.kind = kind;
  error.message = std::move(message);
  return error;
}

inline const char *proxy_error_name(ProxyErrorKind kind) {
  switch (kind) {
    case ProxyErrorKind::None: return "None";
    case ProxyErrorKind::InvalidToken: return "InvalidToken";
    case ProxyErrorKind::UpstreamUnreachable: return "UpstreamUnreachable";
    case ProxyErrorKind::CircularRedirect: return "CircularRedirect";
    case ProxyErrorKind::TooManyRedirects: return "TooManyRedirects";
    case ProxyErrorKind::MalformedUpstreamResponse:
      return "MalformedUpstreamResponse";
  }
  return "Unknown";
}

// Redirect loops and undecodable bodies surface as upstream failures.
inline int proxy_error_status(ProxyErrorKind kind) {
  switch (kind) {
    case ProxyErrorKind::None: return 200;
    case ProxyErrorKind::InvalidToken: return 400;
    case ProxyErrorKind::UpstreamUnreachable: return 503;
    case ProxyErrorKind::CircularRedirect:
    case ProxyErrorKind::TooManyRedirects:
    case ProxyErrorKind::MalformedUpstreamResponse: return 502;
  }
  return 500;
}

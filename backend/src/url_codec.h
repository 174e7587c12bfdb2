#pragma once
// ─── Mirrorgate — URL codec ─────────────────────────────────────────────
// Reversible mapping between absolute http(s) URLs and path-safe tokens
// (unpadded base64url of the URL bytes), plus the proxy path built on it.

#include "proxy_error.h"

#include <optional>
#include <string>

class UrlCodec {
public:
  explicit UrlCodec(std::string proxy_prefix = "/watch?url=")
      : proxy_prefix_(std::move(proxy_prefix)) {}

  // Deterministic; the result only contains [A-Za-z0-9_-].
  std::string encode(const std::string &url) const;

  // Fails with InvalidToken when the token is not base64url or does not
  // decode to a well-formed absolute http(s) URL.
  std::optional<std::string> decode(const std::string &token,
                                    ProxyError &error) const;

  // encodeForProxy: prefix + token.
  std::string proxy_path(const std::string &url) const;

  // Extracts and decodes the token from a proxy path ("/watch?url=<token>").
  std::optional<std::string> decode_proxy_path(const std::string &path,
                                               ProxyError &error) const;

  bool is_proxy_path(const std::string &value) const;

  const std::string &proxy_prefix() const { return proxy_prefix_; }

private:
  std::string proxy_prefix_;
};

bool is_path_safe_token(const std::string &token);

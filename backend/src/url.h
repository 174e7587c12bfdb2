#pragma once
// ─── Mirrorgate — URL parsing and resolution ────────────────────────────
// Just enough of the URL standard for the proxy: absolute http(s)/ws(s)
// parsing, reference resolution against a base, and cache-key normalization.

#include <optional>
#include <string>

struct ParsedUrl {
  std::string scheme;    // lower-case, without ':'
  std::string userinfo;  // may be empty
  std::string host;      // lower-case; IPv6 literals keep their brackets
  int port = 0;          // effective port (default filled in)
  bool explicit_port = false;
  std::string path;      // always starts with '/'
  std::string query;     // without '?'
  bool has_query = false;
  std::string fragment;  // without '#'
  bool has_fragment = false;
};

int default_port_for_scheme(const std::string &scheme);

// Parses an absolute http/https/ws/wss URL. On failure `error` is set.
bool parse_url(const std::string &input, ParsedUrl &out, std::string &error);

// scheme://host[:port] with the port omitted when it is the default.
std::string url_origin(const ParsedUrl &url);

std::string url_to_string(const ParsedUrl &url, bool with_fragment = true);

// Resolves `ref` against the absolute `base`. Returns std::nullopt (and sets
// `error`) when the base is unusable or the reference cannot be resolved.
// References with a non-network scheme (mailto:, ftp:, ...) are returned
// unchanged; callers check the scheme of the result.
std::optional<std::string> resolve_url(const std::string &base,
                                       const std::string &ref,
                                       std::string &error);

// Lower-cased scheme and host, default port dropped, fragment dropped.
// Unparseable input is returned unchanged.
std::string normalize_url(const std::string &url);

bool is_http_url(const std::string &url);

// Reads the scheme of `value` ("https" for "HTTPS://x"); empty when absent.
std::string scheme_of(const std::string &value);

#pragma once
// ─── Mirrorgate — Client runtime shim ───────────────────────────────────
// The script injected into every proxied page (and prepended to proxied
// scripts). It patches navigation, fetch/XHR and WebSocket in the browser
// so runtime-built URLs are routed through the proxy as well.

#include <string>

struct ShimParams {
  std::string base_url;  // true URL of the page
  std::string origin;    // origin of the page
  std::string proxy_prefix = "/watch?url=";
  std::string tunnel_prefix = "/tunnel?url=";
};

// Renders the shim template with every parameter embedded as a JS string.
std::string render_client_shim(const ShimParams &params);

// JSON string literal safe to embed in an inline <script>: '<' is written
// as \u003c (so "</script" cannot appear) and U+2028/U+2029 are escaped.
std::string js_string_literal(const std::string &value);

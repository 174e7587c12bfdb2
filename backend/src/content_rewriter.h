#pragma once
// ─── Mirrorgate — Content rewriter ──────────────────────────────────────
// Rewrites embedded resource references in HTML, CSS and scripts so the
// browser routes every follow-up request back through the proxy.

#include "config.h"
#include "url_codec.h"

#include <optional>
#include <string>

// Immutable for one transformation pass.
struct RewriteContext {
  RewriteContext(std::string base, const UrlCodec &url_codec,
                 std::string tunnel = "/tunnel?url=");

  std::string base_url;  // absolute URL references resolve against
  std::string origin;    // origin of base_url
  const UrlCodec &codec;
  std::string tunnel_prefix;
};

struct RewriteOptions {
  ScriptStrategy script_strategy = ScriptStrategy::Shim;
};

enum class ContentKind { Html, Css, Script, Other };

ContentKind classify_content_type(const std::string &content_type);

// Resolves `value` against the context base and wraps it in a proxy path.
// std::nullopt means the value must be left as it is: empty, fragment-only,
// non-network scheme (data:, javascript:, mailto:, tel:, ...), already a
// proxy path, or unresolvable.
std::optional<std::string> rewrite_url(const std::string &value,
                                       const RewriteContext &ctx);

// Rewrites each candidate URL, keeping descriptors and separators.
std::string rewrite_srcset(const std::string &value, const RewriteContext &ctx);

// url(...) and @import targets. Comments and other strings are untouched.
std::string rewrite_css(const std::string &css, const RewriteContext &ctx);

// `standalone` scripts (served as their own resource) get the runtime shim
// prepended; inline scripts rely on the document's shim.
std::string rewrite_script(const std::string &script, const RewriteContext &ctx,
                           const RewriteOptions &options, bool standalone);

std::string rewrite_html(const std::string &html, const RewriteContext &ctx,
                         const RewriteOptions &options);

// Dispatch by declared content type; other types come back unchanged.
std::string transform_content(const std::string &content_type,
                              const std::string &body, const RewriteContext &ctx,
                              const RewriteOptions &options);

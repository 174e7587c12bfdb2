// ─── Mirrorgate — Content rewriter implementation ───────────────────────

#include "content_rewriter.h"
#include "client_shim.h"
#include "html_document.h"
#include "url.h"
#include "utils.h"

#include "crow.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace {

const char *const kUrlAttributes[] = {"src",    "href",   "action",
                                      "data",   "poster", "formaction"};

const std::unordered_set<std::string> kScriptMediaTypes = {
    "application/javascript",  "text/javascript",   "application/x-javascript",
    "application/ecmascript",  "text/ecmascript",   "text/x-javascript",
    "application/x-ecmascript", "text/jscript",     "module",
};

const std::unordered_set<std::string> kGlobalIdentifiers = {
    "window", "document", "location"};

const std::unordered_set<std::string> kDeclarationKeywords = {
    "var", "let", "const", "function", "class"};

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_css_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool matches_ci_at(const std::string &text, size_t pos, const char *word) {
  size_t len = std::char_traits<char>::length(word);
  if (pos + len > text.size()) return false;
  return starts_with_ci(text.substr(pos, len), word);
}

// Copies a quoted literal starting at `pos` (the opening quote) into `out`.
// Returns the position after the closing quote.
size_t copy_quoted(const std::string &text, size_t pos, std::string &out,
                   bool stop_at_newline) {
  char quote = text[pos];
  size_t i = pos + 1;
  while (i < text.size()) {
    char c = text[i];
    if (c == '\\' && i + 1 < text.size()) {
      i += 2;
      continue;
    }
    if (c == quote) {
      ++i;
      break;
    }
    if (stop_at_newline && c == '\n') break;
    ++i;
  }
  out.append(text, pos, i - pos);
  return i;
}

// ═══════════════════════════════════════════════════════════════════════
// CSS
// ═══════════════════════════════════════════════════════════════════════

// Handles "url(" at `pos`. Returns the position after the construct, or
// std::string::npos when the construct is unterminated.
size_t rewrite_css_url(const std::string &css, size_t pos,
                       const RewriteContext &ctx, std::string &out) {
  size_t i = pos + 4;
  while (i < css.size() && std::isspace(static_cast<unsigned char>(css[i]))) ++i;
  if (i >= css.size()) return std::string::npos;

  char quote = 0;
  std::string value;
  size_t close;
  if (css[i] == '"' || css[i] == '\'') {
    quote = css[i];
    size_t end = css.find(quote, i + 1);
    while (end != std::string::npos && css[end - 1] == '\\')
      end = css.find(quote, end + 1);
    if (end == std::string::npos) return std::string::npos;
    value = css.substr(i + 1, end - i - 1);
    close = css.find(')', end + 1);
  } else {
    close = css.find(')', i);
    if (close == std::string::npos) return std::string::npos;
    value = trim_copy(css.substr(i, close - i));
  }
  if (close == std::string::npos) return std::string::npos;

  auto rewritten = rewrite_url(value, ctx);
  if (!rewritten) {
    out.append(css, pos, close + 1 - pos);
  } else if (quote) {
    out += "url(";
    out += quote;
    out += *rewritten;
    out += quote;
    out += ')';
  } else {
    out += "url(" + *rewritten + ")";
  }
  return close + 1;
}

// ═══════════════════════════════════════════════════════════════════════
// Script identifiers
// ═══════════════════════════════════════════════════════════════════════

// A '/' after one of these (or at the start) begins a regex literal.
bool regex_may_follow(char last_significant) {
  return last_significant == 0 ||
         std::string("(,=:[!&|?{};+-*%<>~^").find(last_significant) !=
             std::string::npos;
}

size_t copy_regex(const std::string &js, size_t pos, std::string &out) {
  size_t i = pos + 1;
  bool in_class = false;
  while (i < js.size() && js[i] != '\n') {
    char c = js[i];
    if (c == '\\' && i + 1 < js.size()) {
      i += 2;
      continue;
    }
    if (c == '[') in_class = true;
    else if (c == ']') in_class = false;
    else if (c == '/' && !in_class) {
      ++i;
      while (i < js.size() && is_ident_char(js[i])) ++i;  // flags
      break;
    }
    ++i;
  }
  out.append(js, pos, i - pos);
  return i;
}

std::string substitute_globals(const std::string &js) {
  std::string out;
  out.reserve(js.size() + js.size() / 8);
  char last = 0;
  std::string last_word;
  size_t i = 0;
  while (i < js.size()) {
    char c = js[i];
    char next = i + 1 < js.size() ? js[i + 1] : '\0';

    if (c == '/' && next == '/') {
      size_t end = js.find('\n', i);
      if (end == std::string::npos) end = js.size();
      out.append(js, i, end - i);
      i = end;
      continue;
    }
    if (c == '/' && next == '*') {
      size_t end = js.find("*/", i + 2);
      end = end == std::string::npos ? js.size() : end + 2;
      out.append(js, i, end - i);
      i = end;
      continue;
    }
    if (c == '"' || c == '\'' || c == '`') {
      i = copy_quoted(js, i, out, c != '`');
      last = c;
      last_word.clear();
      continue;
    }
    if (c == '/' && (regex_may_follow(last) || last_word == "return" ||
                     last_word == "typeof")) {
      i = copy_regex(js, i, out);
      last = '/';
      last_word.clear();
      continue;
    }
    if (is_ident_start(c)) {
      size_t start = i;
      while (i < js.size() && is_ident_char(js[i])) ++i;
      std::string word = js.substr(start, i - start);
      if (kGlobalIdentifiers.count(word) && last != '.' &&
          !kDeclarationKeywords.count(last_word)) {
        out += "__mirrorgate." + word;
      } else {
        out += word;
      }
      last = word.back();
      last_word = word;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
      size_t start = i;
      while (i < js.size() && (is_ident_char(js[i]) || js[i] == '.')) ++i;
      out.append(js, start, i - start);
      last = '0';
      last_word.clear();
      continue;
    }

    out += c;
    if (!std::isspace(static_cast<unsigned char>(c))) {
      last = c;
      last_word.clear();
    }
    ++i;
  }
  return out;
}

// ═══════════════════════════════════════════════════════════════════════
// HTML helpers
// ═══════════════════════════════════════════════════════════════════════

bool is_javascript_block(const HtmlNode &script) {
  const HtmlAttribute *type = script.attribute("type");
  if (!type || trim_copy(type->value).empty()) return true;
  return kScriptMediaTypes.count(media_type_of(type->value)) != 0;
}

void remove_attribute(HtmlNode &node, const std::string &name) {
  auto &attrs = node.attributes;
  attrs.erase(std::remove_if(attrs.begin(), attrs.end(),
                             [&](const HtmlAttribute &attr) {
                               return attr.name.size() == name.size() &&
                                      starts_with_ci(attr.name, name);
                             }),
              attrs.end());
}

bool is_csp_meta(const HtmlNode &node) {
  if (node.tag_name != "meta") return false;
  const HtmlAttribute *equiv = node.attribute("http-equiv");
  if (!equiv) return false;
  std::string value = to_lower(trim_copy(equiv->value));
  return value == "content-security-policy" ||
         value == "content-security-policy-report-only";
}

// "5; url=/next" → "5; url=<proxy path>"
// content is "N[;,] [url=]target"; the target may be quoted.
void rewrite_meta_refresh(HtmlNode &node, const RewriteContext &ctx) {
  const HtmlAttribute *equiv = node.attribute("http-equiv");
  const HtmlAttribute *content = node.attribute("content");
  if (!equiv || !content || to_lower(trim_copy(equiv->value)) != "refresh")
    return;
  if (has_unknown_named_entity(content->raw_value)) return;
  const std::string &value = content->value;
  size_t pos = 0;
  while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])))
    ++pos;
  while (pos < value.size() &&
         (std::isdigit(static_cast<unsigned char>(value[pos])) || value[pos] == '.'))
    ++pos;
  while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])))
    ++pos;
  if (pos >= value.size() || (value[pos] != ';' && value[pos] != ',')) return;
  ++pos;
  while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos])))
    ++pos;
  if (to_lower(value.substr(pos, 3)) == "url") {
    size_t after = pos + 3;
    while (after < value.size() &&
           std::isspace(static_cast<unsigned char>(value[after])))
      ++after;
    if (after < value.size() && value[after] == '=') {
      pos = after + 1;
      while (pos < value.size() &&
             std::isspace(static_cast<unsigned char>(value[pos])))
        ++pos;
    }
  }
  std::string target = trim_copy(value.substr(pos));
  if (target.empty()) return;
  if (target.size() >= 2 && (target.front() == '\'' || target.front() == '"') &&
      target.back() == target.front()) {
    target = target.substr(1, target.size() - 2);
  }
  auto rewritten = rewrite_url(target, ctx);
  if (!rewritten) return;
  node.set_attribute("content", value.substr(0, pos) + *rewritten);
}

void remove_csp_metas(HtmlNode &node) {
  auto &children = node.children;
  children.erase(std::remove_if(children.begin(), children.end(),
                                [](const std::unique_ptr<HtmlNode> &child) {
                                  return is_csp_meta(*child);
                                }),
                 children.end());
  for (auto &child : children) remove_csp_metas(*child);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════

RewriteContext::RewriteContext(std::string base, const UrlCodec &url_codec,
                               std::string tunnel)
    : base_url(std::move(base)), codec(url_codec),
      tunnel_prefix(std::move(tunnel)) {
  ParsedUrl parsed;
  std::string error;
  if (parse_url(base_url, parsed, error)) origin = url_origin(parsed);
}

ContentKind classify_content_type(const std::string &content_type) {
  std::string media = media_type_of(content_type);
  if (media == "text/html" || media == "application/xhtml+xml")
    return ContentKind::Html;
  if (media == "text/css") return ContentKind::Css;
  if (media != "module" && kScriptMediaTypes.count(media))
    return ContentKind::Script;
  return ContentKind::Other;
}

std::optional<std::string> rewrite_url(const std::string &value,
                                       const RewriteContext &ctx) {
  std::string trimmed = trim_copy(value);
  if (trimmed.empty() || trimmed[0] == '#') return std::nullopt;

  std::string scheme = scheme_of(trimmed);
  if (!scheme.empty() && scheme != "http" && scheme != "https")
    return std::nullopt;
  if (ctx.codec.is_proxy_path(trimmed)) return std::nullopt;

  std::string error;
  auto resolved = resolve_url(ctx.base_url, trimmed, error);
  if (!resolved || !is_http_url(*resolved)) {
    CROW_LOG_DEBUG << "Rewrite: leaving '" << trimmed << "' unchanged: "
                   << (error.empty() ? "not an http(s) URL" : error);
    return std::nullopt;
  }

  // The fragment stays in the browser; only the document URL is encoded.
  std::string fragment;
  size_t hash = resolved->find('#');
  if (hash != std::string::npos) {
    fragment = resolved->substr(hash);
    resolved->erase(hash);
  }
  return ctx.codec.proxy_path(*resolved) + fragment;
}

std::string rewrite_srcset(const std::string &value, const RewriteContext &ctx) {
  std::string out;
  size_t pos = 0;
  const size_t n = value.size();
  while (pos < n) {
    size_t start = pos;
    while (pos < n && (std::isspace(static_cast<unsigned char>(value[pos])) ||
                       value[pos] == ','))
      ++pos;
    out.append(value, start, pos - start);
    if (pos >= n) break;

    size_t url_start = pos;
    while (pos < n && !std::isspace(static_cast<unsigned char>(value[pos])))
      ++pos;
    std::string url = value.substr(url_start, pos - url_start);
    std::string trailing;
    while (!url.empty() && url.back() == ',') {
      trailing += ',';
      url.pop_back();
    }
    out += rewrite_url(url, ctx).value_or(url);
    out += trailing;
    if (!trailing.empty()) continue;

    size_t descriptor_start = pos;
    int depth = 0;
    while (pos < n) {
      char c = value[pos];
      if (c == '(') ++depth;
      else if (c == ')') --depth;
      else if (c == ',' && depth <= 0) break;
      ++pos;
    }
    out.append(value, descriptor_start, pos - descriptor_start);
  }
  return out;
}

std::string rewrite_css(const std::string &css, const RewriteContext &ctx) {
  std::string out;
  out.reserve(css.size() + css.size() / 4);
  size_t i = 0;
  while (i < css.size()) {
    char c = css[i];
    if (c == '/' && i + 1 < css.size() && css[i + 1] == '*') {
      size_t end = css.find("*/", i + 2);
      end = end == std::string::npos ? css.size() : end + 2;
      out.append(css, i, end - i);
      i = end;
      continue;
    }
    if (c == '"' || c == '\'') {
      i = copy_quoted(css, i, out, true);
      continue;
    }
    if (matches_ci_at(css, i, "url(") && (i == 0 || !is_css_ident_char(css[i - 1]))) {
      size_t next = rewrite_css_url(css, i, ctx, out);
      if (next == std::string::npos) {
        out.append(css, i, std::string::npos);
        break;
      }
      i = next;
      continue;
    }
    if (c == '@' && matches_ci_at(css, i, "@import")) {
      size_t j = i + 7;
      while (j < css.size() && std::isspace(static_cast<unsigned char>(css[j]))) ++j;
      out.append(css, i, j - i);
      i = j;
      if (i < css.size() && (css[i] == '"' || css[i] == '\'')) {
        char quote = css[i];
        std::string literal;
        size_t end = copy_quoted(css, i, literal, true);
        bool closed = literal.size() >= 2 && literal.back() == quote;
        std::string target =
            closed ? literal.substr(1, literal.size() - 2) : std::string();
        auto rewritten = closed ? rewrite_url(target, ctx) : std::nullopt;
        if (rewritten) {
          out += quote;
          out += *rewritten;
          out += quote;
        } else {
          out += literal;
        }
        i = end;
      }
      continue;
    }
    out += c;
    ++i;
  }
  return out;
}

std::string rewrite_script(const std::string &script, const RewriteContext &ctx,
                           const RewriteOptions &options, bool standalone) {
  std::string body = options.script_strategy == ScriptStrategy::Identifiers
                         ? substitute_globals(script)
                         : script;
  if (!standalone) return body;

  ShimParams params;
  params.base_url = ctx.base_url;
  params.origin = ctx.origin;
  params.proxy_prefix = ctx.codec.proxy_prefix();
  params.tunnel_prefix = ctx.tunnel_prefix;
  return render_client_shim(params) + "\n" + body;
}

std::string rewrite_html(const std::string &html, const RewriteContext &ctx,
                         const RewriteOptions &options) {
  std::unique_ptr<HtmlNode> document = parse_html_document(html);

  // An existing <base href> decides how the rest of the document resolves.
  RewriteContext effective(ctx.base_url, ctx.codec, ctx.tunnel_prefix);
  effective.origin = ctx.origin;
  HtmlNode *base_element = nullptr;
  for (HtmlNode *base : find_elements(*document, "base")) {
    const HtmlAttribute *href = base->attribute("href");
    if (!href) continue;
    std::string error;
    auto resolved = resolve_url(ctx.base_url, trim_copy(href->value), error);
    if (resolved && is_http_url(*resolved)) {
      effective.base_url = *resolved;
      base->set_attribute("href", ctx.codec.proxy_path(*resolved));
      base_element = base;
    }
    break;
  }

  for (HtmlNode *element : find_elements(*document, "")) {
    bool rewrote = false;

    if (element != base_element) {
      for (const char *name : kUrlAttributes) {
        const HtmlAttribute *attr = element->attribute(name);
        if (!attr || !attr->has_value) continue;
        if (has_unknown_named_entity(attr->raw_value)) continue;
        if (auto rewritten = rewrite_url(attr->value, effective)) {
          element->set_attribute(attr->name, *rewritten);
          rewrote = true;
        }
      }
    }
    for (const char *name : {"srcset", "imagesrcset"}) {
      const HtmlAttribute *attr = element->attribute(name);
      if (!attr || !attr->has_value) continue;
      if (has_unknown_named_entity(attr->raw_value)) continue;
      std::string rewritten = rewrite_srcset(attr->value, effective);
      if (rewritten != attr->value) {
        element->set_attribute(attr->name, rewritten);
        rewrote = true;
      }
    }
    const HtmlAttribute *style = element->attribute("style");
    if (style && !has_unknown_named_entity(style->raw_value)) {
      std::string rewritten = rewrite_css(style->value, effective);
      if (rewritten != style->value) element->set_attribute(style->name, rewritten);
    }
    if (rewrote) remove_attribute(*element, "integrity");

    if (element->tag_name == "meta") {
      rewrite_meta_refresh(*element, effective);
    } else if (element->tag_name == "style") {
      std::string css = raw_text_content(*element);
      std::string rewritten = rewrite_css(css, effective);
      if (rewritten != css) set_raw_text_content(*element, rewritten);
    } else if (element->tag_name == "script" && is_javascript_block(*element) &&
               !element->has_attribute("src")) {
      std::string js = raw_text_content(*element);
      std::string rewritten = rewrite_script(js, effective, options, false);
      if (rewritten != js) set_raw_text_content(*element, rewritten);
    }
  }

  remove_csp_metas(*document);

  ShimParams params;
  params.base_url = effective.base_url;
  params.origin = ctx.origin;
  params.proxy_prefix = ctx.codec.proxy_prefix();
  params.tunnel_prefix = ctx.tunnel_prefix;
  auto shim = make_element("script");
  set_raw_text_content(*shim, render_client_shim(params));
  insert_child(*ensure_head(*document), 0, std::move(shim));

  return serialize_html(*document);
}

std::string transform_content(const std::string &content_type,
                              const std::string &body, const RewriteContext &ctx,
                              const RewriteOptions &options) {
  switch (classify_content_type(content_type)) {
    case ContentKind::Html: return rewrite_html(body, ctx, options);
    case ContentKind::Css: return rewrite_css(body, ctx);
    case ContentKind::Script: return rewrite_script(body, ctx, options, true);
    case ContentKind::Other: break;
  }
  return body;
}

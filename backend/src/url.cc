// ─── Mirrorgate — URL parsing and resolution ────────────────────────────

#include "url.h"
#include "utils.h"

#include <cctype>
#include <vector>

namespace {

bool is_network_scheme(const std::string &scheme) {
  return scheme == "http" || scheme == "https" || scheme == "ws" ||
         scheme == "wss";
}

bool parse_port(const std::string &raw, int &port) {
  if (raw.empty() || raw.size() > 5) return false;
  int value = 0;
  for (char ch : raw) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
    value = value * 10 + (ch - '0');
  }
  if (value <= 0 || value > 65535) return false;
  port = value;
  return true;
}

// Spaces, quotes, angle brackets and control bytes get percent-encoded the
// way a browser serializer would; everything else (including UTF-8) is kept.
std::string encode_unsafe(const std::string &value) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    unsigned char uch = static_cast<unsigned char>(ch);
    if (uch <= 0x20 || uch == 0x7F || ch == '"' || ch == '<' || ch == '>' ||
        ch == '`') {
      out += '%';
      out += hex[uch >> 4];
      out += hex[uch & 0x0F];
    } else {
      out += ch;
    }
  }
  return out;
}

// RFC 3986 §5.2.4 remove_dot_segments.
std::string remove_dot_segments(const std::string &path) {
  std::string input = path;
  std::string output;
  while (!input.empty()) {
    if (input.rfind("../", 0) == 0) {
      input.erase(0, 3);
    } else if (input.rfind("./", 0) == 0) {
      input.erase(0, 2);
    } else if (input.rfind("/./", 0) == 0) {
      input.erase(0, 2);
    } else if (input == "/.") {
      input = "/";
    } else if (input.rfind("/../", 0) == 0 || input == "/..") {
      input = input == "/.." ? "/" : input.substr(3);
      size_t last = output.rfind('/');
      output.erase(last == std::string::npos ? 0 : last);
    } else if (input == "." || input == "..") {
      input.clear();
    } else {
      size_t start = input[0] == '/' ? 1 : 0;
      size_t next = input.find('/', start);
      if (next == std::string::npos) next = input.size();
      output += input.substr(0, next);
      input.erase(0, next);
    }
  }
  return output;
}

std::string directory_of(const std::string &path) {
  size_t slash = path.rfind('/');
  if (slash == std::string::npos) return "/";
  return path.substr(0, slash + 1);
}

// Browsers strip tabs and newlines anywhere in a URL and treat '\' as '/'
// for special schemes.
std::string clean_reference(const std::string &ref) {
  std::string trimmed = trim_copy(ref);
  std::string out;
  out.reserve(trimmed.size());
  for (char ch : trimmed) {
    if (ch == '\t' || ch == '\n' || ch == '\r') continue;
    out += ch;
  }
  return out;
}

}  // namespace

int default_port_for_scheme(const std::string &scheme) {
  if (scheme == "http" || scheme == "ws") return 80;
  if (scheme == "https" || scheme == "wss") return 443;
  return 0;
}

std::string scheme_of(const std::string &value) {
  if (value.empty() || !std::isalpha(static_cast<unsigned char>(value[0])))
    return "";
  for (size_t i = 1; i < value.size(); ++i) {
    char ch = value[i];
    if (ch == ':') return to_lower(value.substr(0, i));
    if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '+' &&
        ch != '-' && ch != '.')
      return "";
  }
  return "";
}

bool parse_url(const std::string &input, ParsedUrl &out, std::string &error) {
  out = ParsedUrl{};
  error.clear();

  for (char ch : input) {
    unsigned char uch = static_cast<unsigned char>(ch);
    if (uch <= 0x20 || uch == 0x7F) {
      error = "URL contains whitespace or control characters";
      return false;
    }
  }

  size_t scheme_end = input.find("://");
  if (scheme_end == std::string::npos) {
    error = "URL must be absolute";
    return false;
  }
  out.scheme = scheme_of(input.substr(0, scheme_end + 1));
  if (out.scheme.empty() || !is_network_scheme(out.scheme)) {
    error = "Unsupported URL scheme";
    return false;
  }

  size_t authority_start = scheme_end + 3;
  size_t authority_end = input.find_first_of("/?#", authority_start);
  if (authority_end == std::string::npos) authority_end = input.size();
  std::string authority =
      input.substr(authority_start, authority_end - authority_start);

  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    out.userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
  }

  std::string host;
  std::string raw_port;
  if (!authority.empty() && authority.front() == '[') {
    size_t bracket_end = authority.find(']');
    if (bracket_end == std::string::npos || bracket_end == 1) {
      error = "Invalid IPv6 host";
      return false;
    }
    host = authority.substr(0, bracket_end + 1);
    if (bracket_end + 1 < authority.size()) {
      if (authority[bracket_end + 1] != ':') {
        error = "Invalid host/port separator";
        return false;
      }
      raw_port = authority.substr(bracket_end + 2);
      if (raw_port.empty()) {
        error = "Empty port";
        return false;
      }
    }
  } else {
    size_t colon = authority.find(':');
    host = authority.substr(0, colon);
    if (colon != std::string::npos) {
      raw_port = authority.substr(colon + 1);
      if (raw_port.empty()) {
        error = "Empty port";
        return false;
      }
    }
  }

  if (host.empty()) {
    error = "URL host is empty";
    return false;
  }
  for (char ch : host) {
    if (ch == '/' || ch == '\\' || ch == '<' || ch == '>' || ch == '^' ||
        ch == '|' || ch == '%' || ch == '"') {
      error = "URL host contains forbidden characters";
      return false;
    }
  }
  out.host = to_lower(host);

  out.port = default_port_for_scheme(out.scheme);
  if (!raw_port.empty()) {
    if (!parse_port(raw_port, out.port)) {
      error = "Invalid port";
      return false;
    }
    out.explicit_port = true;
  }

  std::string rest = input.substr(authority_end);
  size_t hash = rest.find('#');
  if (hash != std::string::npos) {
    out.fragment = rest.substr(hash + 1);
    out.has_fragment = true;
    rest.erase(hash);
  }
  size_t question = rest.find('?');
  if (question != std::string::npos) {
    out.query = rest.substr(question + 1);
    out.has_query = true;
    rest.erase(question);
  }
  out.path = rest.empty() ? "/" : rest;
  return true;
}

std::string url_origin(const ParsedUrl &url) {
  std::string origin = url.scheme + "://" + url.host;
  if (url.explicit_port && url.port != default_port_for_scheme(url.scheme)) {
    origin += ":" + std::to_string(url.port);
  }
  return origin;
}

std::string url_to_string(const ParsedUrl &url, bool with_fragment) {
  std::string result = url.scheme + "://";
  if (!url.userinfo.empty()) result += url.userinfo + "@";
  result += url.host;
  if (url.explicit_port && url.port != default_port_for_scheme(url.scheme)) {
    result += ":" + std::to_string(url.port);
  }
  result += url.path.empty() ? "/" : url.path;
  if (url.has_query) result += "?" + url.query;
  if (with_fragment && url.has_fragment) result += "#" + url.fragment;
  return result;
}

std::optional<std::string> resolve_url(const std::string &base,
                                       const std::string &ref,
                                       std::string &error) {
  ParsedUrl base_url;
  if (!parse_url(base, base_url, error)) return std::nullopt;

  std::string cleaned = clean_reference(ref);
  std::string ref_scheme = scheme_of(cleaned);

  if (!ref_scheme.empty()) {
    if (!is_network_scheme(ref_scheme)) return cleaned;
    std::string after = cleaned.substr(ref_scheme.size() + 1);
    for (char &ch : after) {
      if (ch == '\\') ch = '/';
    }
    if (after.rfind("//", 0) == 0) {
      ParsedUrl absolute;
      if (!parse_url(ref_scheme + ":" + encode_unsafe(after), absolute, error))
        return std::nullopt;
      return url_to_string(absolute);
    }
    if (ref_scheme != base_url.scheme) {
      error = "Scheme-relative reference without authority";
      return std::nullopt;
    }
    cleaned = after;  // "http:foo" is relative to a same-scheme base
  }

  for (char &ch : cleaned) {
    if (ch == '\\') ch = '/';
  }

  if (cleaned.rfind("//", 0) == 0) {
    ParsedUrl absolute;
    if (!parse_url(base_url.scheme + ":" + encode_unsafe(cleaned), absolute,
                   error))
      return std::nullopt;
    return url_to_string(absolute);
  }

  ParsedUrl result = base_url;
  result.has_fragment = false;
  result.fragment.clear();

  std::string remainder = encode_unsafe(cleaned);
  size_t hash = remainder.find('#');
  if (hash != std::string::npos) {
    result.fragment = remainder.substr(hash + 1);
    result.has_fragment = true;
    remainder.erase(hash);
  }

  if (remainder.empty()) return url_to_string(result);

  std::string path = remainder;
  std::string query;
  bool has_query = false;
  size_t question = remainder.find('?');
  if (question != std::string::npos) {
    path = remainder.substr(0, question);
    query = remainder.substr(question + 1);
    has_query = true;
  }

  if (path.empty()) {
    result.query = query;
    result.has_query = has_query;
    return url_to_string(result);
  }

  std::string merged =
      path.front() == '/' ? path : directory_of(base_url.path) + path;
  result.path = remove_dot_segments(merged);
  if (result.path.empty() || result.path.front() != '/') {
    result.path = "/" + result.path;
  }
  result.query = query;
  result.has_query = has_query;
  return url_to_string(result);
}

std::string normalize_url(const std::string &url) {
  ParsedUrl parsed;
  std::string error;
  if (!parse_url(url, parsed, error)) return url;
  parsed.explicit_port =
      parsed.explicit_port &&
      parsed.port != default_port_for_scheme(parsed.scheme);
  return url_to_string(parsed, false);
}

bool is_http_url(const std::string &url) {
  ParsedUrl parsed;
  std::string error;
  if (!parse_url(url, parsed, error)) return false;
  return parsed.scheme == "http" || parsed.scheme == "https";
}

// ─── Mirrorgate — URL codec implementation ──────────────────────────────

#include "url_codec.h"
#include "url.h"

#include <cstdint>

namespace {

const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

// Accepts both the url-safe and the standard alphabet so tokens minted by
// older clients (standard base64, possibly padded) still decode.
int decode_char(char ch) {
  if (ch >= 'A' && ch <= 'Z') return ch - 'A';
  if (ch >= 'a' && ch <= 'z') return ch - 'a' + 26;
  if (ch >= '0' && ch <= '9') return ch - '0' + 52;
  if (ch == '-' || ch == '+' || ch == ' ') return 62;
  if (ch == '_' || ch == '/') return 63;
  return -1;
}

bool base64url_decode(const std::string &input, std::string &output) {
  std::string token = input;
  while (!token.empty() && token.back() == '=') token.pop_back();
  if (token.size() % 4 == 1) return false;

  output.clear();
  output.reserve(token.size() * 3 / 4);
  uint32_t buffer = 0;
  int bits = 0;
  for (char ch : token) {
    int value = decode_char(ch);
    if (value < 0) return false;
    buffer = (buffer << 6) | static_cast<uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      output += static_cast<char>((buffer >> bits) & 0xFF);
    }
  }
  // Leftover bits must be zero padding, otherwise the token is not canonical.
  return (buffer & ((1u << bits) - 1)) == 0;
}

}  // namespace

bool is_path_safe_token(const std::string &token) {
  for (char ch : token) {
    bool ok = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
              (ch >= '0' && ch <= '9') || ch == '-' || ch == '_';
    if (!ok) return false;
  }
  return true;
}

std::string UrlCodec::encode(const std::string &url) const {
  std::string result;
  result.reserve((url.size() + 2) / 3 * 4);
  size_t i = 0;
  while (i + 2 < url.size()) {
    uint32_t chunk = (static_cast<unsigned char>(url[i]) << 16) |
                     (static_cast<unsigned char>(url[i + 1]) << 8) |
                     static_cast<unsigned char>(url[i + 2]);
    result += kAlphabet[(chunk >> 18) & 0x3F];
    result += kAlphabet[(chunk >> 12) & 0x3F];
    result += kAlphabet[(chunk >> 6) & 0x3F];
    result += kAlphabet[chunk & 0x3F];
    i += 3;
  }
  size_t remaining = url.size() - i;
  if (remaining == 1) {
    uint32_t chunk = static_cast<unsigned char>(url[i]) << 16;
    result += kAlphabet[(chunk >> 18) & 0x3F];
    result += kAlphabet[(chunk >> 12) & 0x3F];
  } else if (remaining == 2) {
    uint32_t chunk = (static_cast<unsigned char>(url[i]) << 16) |
                     (static_cast<unsigned char>(url[i + 1]) << 8);
    result += kAlphabet[(chunk >> 18) & 0x3F];
    result += kAlphabet[(chunk >> 12) & 0x3F];
    result += kAlphabet[(chunk >> 6) & 0x3F];
  }
  return result;
}

std::optional<std::string> UrlCodec::decode(const std::string &token,
                                            ProxyError &error) const {
  if (token.empty()) {
    error = make_proxy_error(ProxyErrorKind::InvalidToken, "Empty token");
    return std::nullopt;
  }
  std::string url;
  if (!base64url_decode(token, url)) {
    error = make_proxy_error(ProxyErrorKind::InvalidToken,
                             "Token is not valid base64url");
    return std::nullopt;
  }
  if (!is_http_url(url)) {
    error = make_proxy_error(ProxyErrorKind::InvalidToken,
                             "Token does not decode to an absolute http(s) URL");
    return std::nullopt;
  }
  return url;
}

std::string UrlCodec::proxy_path(const std::string &url) const {
  return proxy_prefix_ + encode(url);
}

bool UrlCodec::is_proxy_path(const std::string &value) const {
  return !proxy_prefix_.empty() && value.rfind(proxy_prefix_, 0) == 0;
}

std::optional<std::string> UrlCodec::decode_proxy_path(
    const std::string &path, ProxyError &error) const {
  std::string token;
  if (is_proxy_path(path)) {
    token = path.substr(proxy_prefix_.size());
  } else {
    size_t question = path.find('?');
    std::string query =
        question == std::string::npos ? std::string() : path.substr(question + 1);
    size_t pos = 0;
    bool found = false;
    while (pos <= query.size() && !found) {
      size_t amp = query.find('&', pos);
      if (amp == std::string::npos) amp = query.size();
      std::string part = query.substr(pos, amp - pos);
      if (part.rfind("url=", 0) == 0) {
        token = part.substr(4);
        found = true;
      }
      if (amp == query.size()) break;
      pos = amp + 1;
    }
    if (!found) {
      error = make_proxy_error(ProxyErrorKind::InvalidToken,
                               "URL parameter is required");
      return std::nullopt;
    }
  }
  size_t end = token.find_first_of("&#");
  if (end != std::string::npos) token.erase(end);
  return decode(token, error);
}

#pragma once
// ─── Mirrorgate — Utility functions ─────────────────────────────────────
// Small standalone helpers (header-only).

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

inline std::string now_utc() {
  auto now = std::chrono::system_clock::now();
  std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm utc_tm{};
#ifdef _WIN32
  gmtime_s(&utc_tm, &now_time);
#else
  gmtime_r(&now_time, &utc_tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

inline int64_t epoch_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline std::string json_escape(const std::string &value) {
  std::ostringstream oss;
  for (char ch : value) {
    switch (ch) {
      case '\\': oss << "\\\\"; break;
      case '"':  oss << "\\\""; break;
      case '\n': oss << "\\n";  break;
      case '\r': oss << "\\r";  break;
      case '\t': oss << "\\t";  break;
      default:   oss << ch;     break;
    }
  }
  return oss.str();
}

inline std::string html_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    switch (ch) {
      case '&': out += "&amp;";  break;
      case '<': out += "&lt;";   break;
      case '>': out += "&gt;";   break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default:  out += ch;       break;
    }
  }
  return out;
}

inline std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

inline bool starts_with_ci(const std::string &value, const std::string &prefix) {
  if (value.size() < prefix.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(value[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i])))
      return false;
  }
  return true;
}

inline std::string trim_copy(const std::string &value) {
  size_t start = 0;
  while (start < value.size() &&
         std::isspace(static_cast<unsigned char>(value[start]))) ++start;
  size_t e = value.size();
  while (e > start &&
         std::isspace(static_cast<unsigned char>(value[e - 1]))) --e;
  return value.substr(start, e - start);
}

inline std::vector<std::string> split_copy(const std::string &value, char sep) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= value.size()) {
    size_t next = value.find(sep, pos);
    if (next == std::string::npos) next = value.size();
    parts.push_back(value.substr(pos, next - pos));
    if (next == value.size()) break;
    pos = next + 1;
  }
  return parts;
}

// Media type without parameters, lower-cased ("text/html; charset=x" → "text/html").
inline std::string media_type_of(const std::string &content_type) {
  return to_lower(trim_copy(content_type.substr(0, content_type.find(';'))));
}

inline std::optional<long long> parse_int_param(const char *value) {
  if (!value) return std::nullopt;
  try {
    size_t used = 0;
    long long parsed = std::stoll(value, &used);
    if (used != std::string(value).size()) return std::nullopt;
    return parsed;
  }
  catch (const std::exception &) { return std::nullopt; }
}

inline std::optional<bool> parse_bool_param(const char *value) {
  if (!value) return std::nullopt;
  std::string lowered = to_lower(trim_copy(value));
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on")
    return true;
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off")
    return false;
  return std::nullopt;
}

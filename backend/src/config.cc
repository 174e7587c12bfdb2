// ─── Mirrorgate — Runtime configuration ─────────────────────────────────

#include "config.h"
#include "utils.h"

#include "crow.h"

#include <cstdlib>

namespace {

const char *env_value(const char *primary, const char *fallback = nullptr) {
  const char *value = std::getenv(primary);
  if (!value && fallback) value = std::getenv(fallback);
  return value;
}

template <typename T>
void read_number(const char *name, T &target, long long min_value,
                 const char *fallback = nullptr) {
  const char *raw = env_value(name, fallback);
  if (!raw) return;
  auto parsed = parse_int_param(raw);
  if (!parsed || *parsed < min_value) {
    CROW_LOG_WARNING << "Config: ignoring invalid " << name << "=" << raw;
    return;
  }
  target = static_cast<T>(*parsed);
}

void read_millis(const char *name, std::chrono::milliseconds &target,
                 long long min_value) {
  long long value = target.count();
  read_number(name, value, min_value);
  target = std::chrono::milliseconds(value);
}

void read_flag(const char *name, bool &target, const char *fallback = nullptr) {
  const char *raw = env_value(name, fallback);
  if (!raw) return;
  auto parsed = parse_bool_param(raw);
  if (!parsed) {
    CROW_LOG_WARNING << "Config: ignoring invalid " << name << "=" << raw;
    return;
  }
  target = *parsed;
}

}  // namespace

ProxyConfig load_config_from_env() {
  ProxyConfig config;

  read_number("MIRRORGATE_PORT", config.port, 1, "PORT");
  if (config.port > 65535) {
    CROW_LOG_WARNING << "Config: port out of range, using 10000";
    config.port = 10000;
  }
  read_flag("MIRRORGATE_DEBUG", config.debug, "DEBUG");
  read_number("MIRRORGATE_THREADS", config.threads, 0);

  read_number("MIRRORGATE_CACHE_MAX_ENTRIES", config.cache_max_entries, 1);
  read_number("MIRRORGATE_CACHE_MAX_MEMORY", config.cache_max_memory, 1);
  read_millis("MIRRORGATE_CACHE_TTL_MS", config.cache_ttl, 1);
  read_millis("MIRRORGATE_CACHE_SWEEP_MS", config.cache_sweep_interval, 1);
  if (const char *sizing = env_value("MIRRORGATE_CACHE_SIZING")) {
    std::string value = to_lower(sizing);
    if (value == "bytes") config.cache_sizing = CacheSizing::ByteAccurate;
    else if (value == "estimated") config.cache_sizing = CacheSizing::Estimated;
    else CROW_LOG_WARNING << "Config: unknown cache sizing " << sizing;
  }

  read_number("MIRRORGATE_MAX_REDIRECTS", config.max_redirects, 0);
  read_number("MIRRORGATE_RETRY_COUNT", config.retry_count, 1);
  read_millis("MIRRORGATE_RETRY_BASE_DELAY_MS", config.retry_base_delay, 0);
  read_millis("MIRRORGATE_REQUEST_TIMEOUT_MS", config.request_timeout, 1);

  if (const char *strategy = env_value("MIRRORGATE_SCRIPT_STRATEGY")) {
    std::string value = to_lower(strategy);
    if (value == "shim") config.script_strategy = ScriptStrategy::Shim;
    else if (value == "identifiers")
      config.script_strategy = ScriptStrategy::Identifiers;
    else CROW_LOG_WARNING << "Config: unknown script strategy " << strategy;
  }
  read_flag("MIRRORGATE_SESSIONS", config.enable_sessions);
  read_number("MIRRORGATE_RATE_LIMIT", config.rate_limit_max_requests, 0);
  read_millis("MIRRORGATE_RATE_LIMIT_WINDOW_MS", config.rate_limit_window, 1);
  read_millis("MIRRORGATE_SHUTDOWN_GRACE_MS", config.shutdown_grace, 0);

  return config;
}

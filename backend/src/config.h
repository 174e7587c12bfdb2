#pragma once
// ─── Mirrorgate — Runtime configuration ─────────────────────────────────
// Listening port, debug toggle and the numeric tunables of the engine.
// Loaded from the environment; every field has a working default.

#include <chrono>
#include <cstddef>
#include <string>

enum class CacheSizing { ByteAccurate, Estimated };
enum class ScriptStrategy { Shim, Identifiers };

struct ProxyConfig {
  int port = 10000;
  bool debug = false;
  int threads = 0;  // 0 = one per hardware thread

  // Response cache
  size_t cache_max_entries = 1000;
  size_t cache_max_memory = 100 * 1024 * 1024;
  std::chrono::milliseconds cache_ttl{600000};
  std::chrono::milliseconds cache_sweep_interval{300000};
  CacheSizing cache_sizing = CacheSizing::ByteAccurate;
  size_t cache_estimated_entry_size = 1024;

  // Fetch orchestrator
  int max_redirects = 10;
  int retry_count = 3;
  std::chrono::milliseconds retry_base_delay{1000};
  std::chrono::milliseconds request_timeout{30000};

  // Rewriting and tunnels
  std::string proxy_prefix = "/watch?url=";
  std::string tunnel_prefix = "/tunnel?url=";
  ScriptStrategy script_strategy = ScriptStrategy::Shim;
  bool enable_sessions = true;

  // Per-client request limit on /watch and /search; 0 disables it.
  int rate_limit_max_requests = 100;
  std::chrono::milliseconds rate_limit_window{15 * 60 * 1000};

  std::chrono::milliseconds shutdown_grace{10000};
};

// Reads PORT/DEBUG and the MIRRORGATE_* variables on top of the defaults.
// Invalid values are logged and ignored.
ProxyConfig load_config_from_env();

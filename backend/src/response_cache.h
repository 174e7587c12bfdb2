#pragma once
// ─── Mirrorgate — Bounded response cache ────────────────────────────────
// TTL-based store of fetched responses. Bounded by entry count and by
// accounted memory; overflow evicts ~10% of entries, least recently
// accessed first. A background sweeper drops expired and never-read
// entries on a fixed interval.

#include "config.h"
#include "models.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

class ResponseCache {
public:
  using Clock = std::function<SteadyTime()>;

  struct Options {
    size_t max_size = 1000;
    size_t max_memory = 100 * 1024 * 1024;
    std::chrono::milliseconds default_ttl{600000};
    CacheSizing sizing = CacheSizing::ByteAccurate;
    size_t estimated_entry_size = 1024;
    // A failing sweep is logged and the sweeper keeps going instead of
    // terminating the process (debug mode).
    bool keep_running_on_error = false;
  };

  explicit ResponseCache(Options options, Clock clock = nullptr);
  ~ResponseCache();

  ResponseCache(const ResponseCache &) = delete;
  ResponseCache &operator=(const ResponseCache &) = delete;

  // Returns false when the value alone is larger than max_memory.
  bool set(const std::string &key, CachedResponse value,
           std::optional<std::chrono::milliseconds> ttl = std::nullopt);

  std::optional<CachedResponse> get(const std::string &key);

  // Removes expired entries and entries never read since insertion.
  // Returns the number of entries removed.
  size_t sweep();

  CacheStats stats() const;
  void clear();

  void start_sweeper(std::chrono::milliseconds interval);
  void stop_sweeper();

private:
  size_t entry_size(const std::string &key, const CachedResponse &value) const;
  void evict_batch_locked();
  void erase_locked(std::unordered_map<std::string, CacheEntry>::iterator it);

  Options options_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, CacheEntry> entries_;
  size_t memory_bytes_ = 0;
  uint64_t next_touch_ = 0;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  uint64_t evictions_ = 0;
  uint64_t total_requests_ = 0;

  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  bool sweeper_stop_ = false;
  std::thread sweeper_;
};

// ─── Mirrorgate — Bounded response cache implementation ─────────────────

#include "response_cache.h"
#include "background_error.h"

#include "crow.h"

#include <algorithm>
#include <exception>
#include <vector>

ResponseCache::ResponseCache(Options options, Clock clock)
    : options_(options), clock_(std::move(clock)) {
  if (!clock_) clock_ = [] { return std::chrono::steady_clock::now(); };
  if (options_.max_size == 0) options_.max_size = 1;
}

ResponseCache::~ResponseCache() { stop_sweeper(); }

size_t ResponseCache::entry_size(const std::string &key,
                                 const CachedResponse &value) const {
  if (options_.sizing == CacheSizing::Estimated) {
    return options_.estimated_entry_size;
  }
  // Payloads are raw bytes; textual bodies are already UTF-8 encoded.
  return key.size() + value.payload.size() + value.content_type.size() +
         value.final_url.size();
}

void ResponseCache::erase_locked(
    std::unordered_map<std::string, CacheEntry>::iterator it) {
  memory_bytes_ -= std::min(memory_bytes_, it->second.size_bytes);
  entries_.erase(it);
}

void ResponseCache::evict_batch_locked() {
  if (entries_.empty()) return;
  size_t batch = std::max<size_t>(1, (entries_.size() + 9) / 10);

  std::vector<const CacheEntry *> order;
  order.reserve(entries_.size());
  for (const auto &item : entries_) order.push_back(&item.second);
  std::partial_sort(order.begin(), order.begin() + batch, order.end(),
                    [](const CacheEntry *a, const CacheEntry *b) {
                      if (a->last_accessed_at != b->last_accessed_at)
                        return a->last_accessed_at < b->last_accessed_at;
                      return a->touch_order < b->touch_order;
                    });

  std::vector<std::string> victims;
  victims.reserve(batch);
  for (size_t i = 0; i < batch; ++i) victims.push_back(order[i]->key);
  for (const auto &key : victims) {
    auto it = entries_.find(key);
    if (it == entries_.end()) continue;
    erase_locked(it);
    ++evictions_;
  }
  CROW_LOG_DEBUG << "Cache: evicted " << victims.size() << " entries";
}

bool ResponseCache::set(const std::string &key, CachedResponse value,
                        std::optional<std::chrono::milliseconds> ttl) {
  size_t size = entry_size(key, value);
  if (size > options_.max_memory) {
    CROW_LOG_DEBUG << "Cache: refusing " << key << " (" << size
                   << " bytes exceeds memory budget)";
    return false;
  }

  SteadyTime now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);

  auto existing = entries_.find(key);
  if (existing != entries_.end()) erase_locked(existing);

  while (!entries_.empty() &&
         (entries_.size() + 1 > options_.max_size ||
          memory_bytes_ + size > options_.max_memory)) {
    evict_batch_locked();
  }

  CacheEntry entry;
  entry.key = key;
  entry.value = std::move(value);
  entry.created_at = now;
  entry.expires_at = now + ttl.value_or(options_.default_ttl);
  entry.last_accessed_at = now;
  entry.access_count = 0;
  entry.size_bytes = size;
  entry.touch_order = next_touch_++;
  memory_bytes_ += size;
  entries_[key] = std::move(entry);
  return true;
}

std::optional<CachedResponse> ResponseCache::get(const std::string &key) {
  SteadyTime now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  ++total_requests_;

  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }
  if (now > it->second.expires_at) {
    erase_locked(it);
    ++evictions_;
    ++misses_;
    return std::nullopt;
  }

  it->second.last_accessed_at = now;
  it->second.touch_order = next_touch_++;
  ++it->second.access_count;
  ++hits_;
  return it->second.value;
}

size_t ResponseCache::sweep() {
  SteadyTime now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now > it->second.expires_at || it->second.access_count == 0) {
      memory_bytes_ -= std::min(memory_bytes_, it->second.size_bytes);
      it = entries_.erase(it);
      ++evictions_;
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

CacheStats ResponseCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats stats;
  stats.hits = hits_;
  stats.misses = misses_;
  stats.evictions = evictions_;
  stats.total_requests = total_requests_;
  if (total_requests_ > 0) {
    stats.hit_rate = static_cast<double>(hits_) / total_requests_;
    stats.eviction_rate = static_cast<double>(evictions_) / total_requests_;
  }
  stats.size = entries_.size();
  stats.memory_bytes = memory_bytes_;
  stats.max_size = options_.max_size;
  stats.max_memory = options_.max_memory;
  return stats;
}

void ResponseCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  memory_bytes_ = 0;
}

void ResponseCache::start_sweeper(std::chrono::milliseconds interval) {
  stop_sweeper();
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    sweeper_stop_ = false;
  }
  sweeper_ = std::thread([this, interval]() {
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!sweeper_cv_.wait_for(lock, interval,
                                 [this] { return sweeper_stop_; })) {
      lock.unlock();
      try {
        size_t removed = sweep();
        if (removed > 0) {
          CROW_LOG_DEBUG << "Cache: sweep removed " << removed << " entries";
        }
      } catch (const std::exception &ex) {
        report_background_exception("Cache sweeper", ex,
                                    options_.keep_running_on_error);
      }
      lock.lock();
    }
  });
}

void ResponseCache::stop_sweeper() {
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    sweeper_stop_ = true;
  }
  sweeper_cv_.notify_all();
  if (sweeper_.joinable()) sweeper_.join();
}

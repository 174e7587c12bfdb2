// ─── Mirrorgate — Routes implementation ─────────────────────────────────

#include "routes.h"
#include "app_context.h"
#include "http_proxy.h"
#include "utils.h"
#include "version.h"

namespace {

int64_t uptime_seconds(const AppContext &ctx) {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::steady_clock::now() - ctx.started_at)
      .count();
}

}  // namespace

crow::json::wvalue cache_stats_to_json(const CacheStats &stats) {
  crow::json::wvalue payload;
  payload["hits"] = stats.hits;
  payload["misses"] = stats.misses;
  payload["evictions"] = stats.evictions;
  payload["totalRequests"] = stats.total_requests;
  payload["hitRate"] = stats.hit_rate;
  payload["evictionRate"] = stats.eviction_rate;
  payload["size"] = static_cast<uint64_t>(stats.size);
  payload["memoryBytes"] = static_cast<uint64_t>(stats.memory_bytes);
  payload["maxSize"] = static_cast<uint64_t>(stats.max_size);
  payload["maxMemory"] = static_cast<uint64_t>(stats.max_memory);
  return payload;
}

// ══════════════════════════════════════════════════════════════════════
//  Health / metrics
// ══════════════════════════════════════════════════════════════════════

void register_health_routes(CrowApp &app, AppContext &ctx) {
  CROW_ROUTE(app, "/health")([&ctx] {
    crow::json::wvalue payload;
    payload["status"] = "ok";
    payload["message"] = "Mirrorgate online";
    payload["version"] = APP_VERSION;
    payload["uptimeSeconds"] = uptime_seconds(ctx);
    payload["time"] = now_utc();
    return payload;
  });
}

void register_metrics_routes(CrowApp &app, AppContext &ctx) {
  CROW_ROUTE(app, "/metrics")([&ctx] {
    size_t open_tunnels = 0;
    {
      std::lock_guard<std::mutex> lock(ctx.tunnel_mutex);
      open_tunnels = ctx.tunnel_connections.size();
    }

    crow::json::wvalue payload;
    payload["uptimeSeconds"] = uptime_seconds(ctx);
    payload["requests"] = ctx.requests_served.load();
    payload["upstreamFailures"] = ctx.upstream_failures.load();
    payload["rateLimited"] = ctx.requests_rate_limited.load();
    payload["cache"] = cache_stats_to_json(ctx.cache.stats());
    payload["tunnels"]["open"] = static_cast<uint64_t>(open_tunnels);
    payload["tunnels"]["total"] = ctx.tunnels_opened.load();
    payload["sessions"]["enabled"] = ctx.config.enable_sessions;
    payload["sessions"]["active"] =
        static_cast<uint64_t>(ctx.sessions.session_count());
    payload["sessions"]["members"] =
        static_cast<uint64_t>(ctx.sessions.member_count());
    return payload;
  });
}

// ══════════════════════════════════════════════════════════════════════
//  Search
// ══════════════════════════════════════════════════════════════════════

void register_search_routes(CrowApp &app, AppContext &ctx) {
  // POST /search: {url} -> {url: "/watch?url=<token>"}
  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        if (auto rejected = rate_limit_rejection(ctx, request))
          return std::move(*rejected);
        auto raw_target = read_target_from_body(request);
        auto target =
            raw_target ? normalize_user_target(*raw_target) : std::nullopt;
        if (!target) {
          crow::json::wvalue payload;
          payload["error"] = "A valid url is required";
          return crow::response(400, payload);
        }
        crow::json::wvalue payload;
        payload["url"] = ctx.encode_for_proxy(*target);
        return crow::response{payload};
      });
}

// ══════════════════════════════════════════════════════════════════════
//  Shared sessions
// ══════════════════════════════════════════════════════════════════════

void register_session_routes(CrowApp &app, AppContext &ctx) {
  CROW_WEBSOCKET_ROUTE(app, "/ws/session")
      .onopen([&ctx](crow::websocket::connection &conn) {
        auto member = ctx.sessions.add_member(
            [&conn](const std::string &text) { conn.send_text(text); });
        std::lock_guard<std::mutex> lock(ctx.session_socket_mutex);
        ctx.session_connections[&conn] = member;
      })
      .onmessage([&ctx](crow::websocket::connection &conn,
                         const std::string &data, bool is_binary) {
        SessionHub::MemberId member = 0;
        {
          std::lock_guard<std::mutex> lock(ctx.session_socket_mutex);
          auto it = ctx.session_connections.find(&conn);
          if (it == ctx.session_connections.end()) return;
          member = it->second;
        }
        if (is_binary) {
          conn.send_text(
              "{\"type\":\"error\",\"message\":\"Binary frames are not supported\"}");
          return;
        }
        ctx.sessions.handle_message(member, data);
      })
      .onclose([&ctx](crow::websocket::connection &conn,
                       const std::string & /*reason*/) {
        SessionHub::MemberId member = 0;
        {
          std::lock_guard<std::mutex> lock(ctx.session_socket_mutex);
          auto it = ctx.session_connections.find(&conn);
          if (it == ctx.session_connections.end()) return;
          member = it->second;
          ctx.session_connections.erase(it);
        }
        ctx.sessions.remove_member(member);
      });
}

// ─── Mirrorgate — WebSocket tunnel implementation ───────────────────────

#include "tunnel.h"
#include "app_context.h"
#include "upstream_websocket.h"
#include "url.h"
#include "utils.h"

#include <memory>

std::string websocket_target_for(const std::string &http_url) {
  std::string scheme = scheme_of(http_url);
  if (scheme == "http") return "ws" + http_url.substr(4);
  if (scheme == "https") return "wss" + http_url.substr(5);
  return std::string();
}

void register_tunnel_routes(CrowApp &app, AppContext &ctx) {
  CROW_WEBSOCKET_ROUTE(app, "/tunnel")
      .onaccept([&ctx](const crow::request &req, void **userdata) -> bool {
        try {
          const char *token_param = req.url_params.get("url");
          if (!token_param || !*token_param) {
            CROW_LOG_WARNING << "Tunnel: rejected - no target";
            return false;
          }

          ProxyError decode_error;
          auto target = ctx.codec.decode(token_param, decode_error);
          if (!target) {
            CROW_LOG_WARNING << "Tunnel: rejected - " << decode_error.message;
            return false;
          }
          std::string ws_url = websocket_target_for(*target);
          if (ws_url.empty()) {
            CROW_LOG_WARNING << "Tunnel: rejected - unsupported target "
                             << *target;
            return false;
          }

          UpstreamWebSocket::Options options;
          options.timeout = ctx.config.request_timeout;
          options.keep_running_on_error = ctx.config.debug;
          options.user_agent =
              FetchOrchestrator::browser_headers().at("User-Agent");
          ParsedUrl parsed;
          std::string parse_error;
          if (parse_url(*target, parsed, parse_error)) {
            options.origin = url_origin(parsed);
          }
          std::string protocols = req.get_header_value("Sec-WebSocket-Protocol");
          if (!protocols.empty()) options.subprotocols = protocols;

          auto state = std::make_shared<TunnelState>();
          state->id = ctx.next_tunnel_id.fetch_add(1);
          state->target_url = ws_url;
          state->upstream = std::make_unique<UpstreamWebSocket>();

          std::string error;
          if (!state->upstream->connect(ws_url, options, error)) {
            CROW_LOG_ERROR << "Tunnel: upstream connect failed for " << ws_url
                           << ": " << error;
            return false;
          }
          state->opened_at = std::chrono::steady_clock::now();
          state->active = true;

          *userdata = new std::shared_ptr<TunnelState>(state);
          CROW_LOG_INFO << "Tunnel " << state->id << ": accepted target="
                        << ws_url;
          return true;
        } catch (const std::exception &ex) {
          CROW_LOG_ERROR << "Tunnel: onaccept exception: " << ex.what();
          return false;
        }
      })
      .onopen([&ctx](crow::websocket::connection &conn) {
        auto *raw_state =
            static_cast<std::shared_ptr<TunnelState> *>(conn.userdata());
        if (!raw_state) {
          conn.close("Internal error");
          return;
        }
        auto state = *raw_state;
        delete raw_state;
        conn.userdata(nullptr);

        {
          std::lock_guard<std::mutex> lock(ctx.tunnel_mutex);
          ctx.tunnel_connections[&conn] = state;
        }
        ctx.tunnels_opened.fetch_add(1);

        // Upstream → browser, on the upstream io thread.
        std::weak_ptr<TunnelState> weak = state;
        UpstreamWebSocket::Handlers handlers;
        handlers.on_message = [weak, &conn](const std::string &data,
                                            bool binary) {
          auto alive = weak.lock();
          if (!alive || !alive->active) return;
          if (binary) conn.send_binary(data);
          else conn.send_text(data);
        };
        handlers.on_close = [weak, &conn](const std::string &reason) {
          auto alive = weak.lock();
          if (!alive || !alive->active.exchange(false)) return;
          CROW_LOG_DEBUG << "Tunnel " << alive->id << ": upstream ended ("
                         << reason << ")";
          conn.close("upstream closed");
        };
        state->upstream->start(std::move(handlers));
      })
      .onmessage([&ctx](crow::websocket::connection &conn,
                         const std::string &data, bool is_binary) {
        std::shared_ptr<TunnelState> state;
        {
          std::lock_guard<std::mutex> lock(ctx.tunnel_mutex);
          auto it = ctx.tunnel_connections.find(&conn);
          if (it == ctx.tunnel_connections.end()) return;
          state = it->second;
        }
        if (!state || !state->active || !state->upstream) return;
        state->upstream->send(data, is_binary);
      })
      .onclose([&ctx](crow::websocket::connection &conn,
                       const std::string &reason) {
        std::shared_ptr<TunnelState> state;
        {
          std::lock_guard<std::mutex> lock(ctx.tunnel_mutex);
          auto it = ctx.tunnel_connections.find(&conn);
          if (it != ctx.tunnel_connections.end()) {
            state = it->second;
            ctx.tunnel_connections.erase(it);
          }
        }
        if (!state) {
          // Closed between accept and open: the state is still parked in
          // userdata.
          auto *pending =
              static_cast<std::shared_ptr<TunnelState> *>(conn.userdata());
          if (!pending) return;
          state = *pending;
          delete pending;
          conn.userdata(nullptr);
        }
        state->active = false;
        // Joins the upstream io thread; no callback touches `conn` after this.
        state->upstream.reset();

        auto lifetime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - state->opened_at);
        CROW_LOG_INFO << "Tunnel " << state->id << ": closed after "
                      << lifetime.count() << "s reason=" << reason;
      });
}

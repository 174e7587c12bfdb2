#pragma once
// ─── Mirrorgate — WebSocket tunnel ──────────────────────────────────────
// Implements the /tunnel route: the browser connects with the encoded target
// (/tunnel?url=<token>), the backend opens a WebSocket to that target and
// relays messages in both directions until either leg closes.

#include "request_log_middleware.h"

#include <string>

struct AppContext;

// ws:// for http targets, wss:// for https; std::string() otherwise.
std::string websocket_target_for(const std::string &http_url);

void register_tunnel_routes(CrowApp &app, AppContext &ctx);

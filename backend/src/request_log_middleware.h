#pragma once
// ─── Mirrorgate — Request log middleware ────────────────────────────────
// Global Crow middleware: traces each request at debug level and marks
// every response as coming from the proxy.

#include "crow.h"

#include <chrono>

struct RequestLogMiddleware {
  struct context {
    std::chrono::steady_clock::time_point started;
  };

  void before_handle(crow::request & /*req*/, crow::response & /*res*/,
                     context &ctx) {
    ctx.started = std::chrono::steady_clock::now();
  }

  void after_handle(crow::request &req, crow::response &res, context &ctx) {
    res.add_header("X-Proxied-By", "Mirrorgate");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx.started);
    CROW_LOG_DEBUG << crow::method_name(req.method) << " " << req.raw_url
                   << " -> " << res.code << " (" << elapsed.count() << "ms)";
  }
};

// Every route file should use this alias instead of crow::SimpleApp.
using CrowApp = crow::App<RequestLogMiddleware>;

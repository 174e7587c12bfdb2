// ─── Mirrorgate — Entry point ───────────────────────────────────────────

#include "app_context.h"
#include "config.h"
#include "http_proxy.h"
#include "request_log_middleware.h"
#include "routes.h"
#include "tunnel.h"
#include "version.h"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <thread>
#include <unistd.h>

namespace {

// Last resort for anything the background loops do not catch themselves
// (see background_error.h): log what escaped and let the process die.
void log_and_abort() {
  try {
    std::exception_ptr current = std::current_exception();
    if (current) std::rethrow_exception(current);
    CROW_LOG_CRITICAL << "Terminating without an active exception";
  } catch (const std::exception &ex) {
    CROW_LOG_CRITICAL << "Uncaught exception: " << ex.what();
  } catch (...) {
    CROW_LOG_CRITICAL << "Uncaught non-standard exception";
  }
  std::abort();
}

}  // namespace

int main() {
  std::set_terminate(log_and_abort);

  ProxyConfig config = load_config_from_env();

  CrowApp app;
  app.loglevel(config.debug ? crow::LogLevel::Debug : crow::LogLevel::Info);

  AppContext ctx(config);

  register_health_routes(app, ctx);
  register_metrics_routes(app, ctx);
  register_search_routes(app, ctx);
  register_proxy_routes(app, ctx);
  register_tunnel_routes(app, ctx);
  if (config.enable_sessions) register_session_routes(app, ctx);

  ctx.cache.start_sweeper(config.cache_sweep_interval);

  CROW_LOG_INFO << "Mirrorgate " << APP_VERSION << " listening on port "
                << config.port << (config.debug ? " (debug)" : "");

  app.port(static_cast<uint16_t>(config.port));
  if (config.threads > 0) {
    app.concurrency(static_cast<uint16_t>(config.threads));
  } else {
    app.multithreaded();
  }
  // Crow stops accepting on SIGINT/SIGTERM and returns from run().
  app.run();

  CROW_LOG_INFO << "Shutting down";
  auto grace = config.shutdown_grace;
  std::thread([grace]() {
    std::this_thread::sleep_for(grace);
    CROW_LOG_ERROR << "Shutdown exceeded " << grace.count()
                   << "ms, forcing exit";
    _exit(1);
  }).detach();

  ctx.shutdown();
  CROW_LOG_INFO << "Shutdown complete";
  return 0;
}

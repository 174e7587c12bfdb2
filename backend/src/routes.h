#pragma once
// ─── Mirrorgate — Route registration ────────────────────────────────────
// Each function registers a group of CROW_ROUTE entries.

#include "models.h"
#include "request_log_middleware.h"

struct AppContext;

crow::json::wvalue cache_stats_to_json(const CacheStats &stats);

void register_health_routes(CrowApp &app, AppContext &ctx);
void register_metrics_routes(CrowApp &app, AppContext &ctx);
void register_search_routes(CrowApp &app, AppContext &ctx);
// /ws/session; registered only when sessions are enabled.
void register_session_routes(CrowApp &app, AppContext &ctx);

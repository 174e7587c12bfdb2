#pragma once
// ─── Mirrorgate — Background failures ───────────────────────────────────
// Exceptions that escape a background loop (cache sweeper, upstream
// WebSocket io threads) are logged at critical level. Outside debug mode
// the process then terminates; in debug mode the loop carries on.

#include <exception>

void report_background_exception(const char *where, const std::exception &ex,
                                 bool keep_running);

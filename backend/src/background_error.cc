// ─── Mirrorgate — Background failures ───────────────────────────────────

#include "background_error.h"

#include "crow.h"

#include <cstdlib>

void report_background_exception(const char *where, const std::exception &ex,
                                 bool keep_running) {
  CROW_LOG_CRITICAL << where << ": uncaught exception: " << ex.what();
  if (keep_running) {
    CROW_LOG_WARNING << where << ": debug mode, continuing";
    return;
  }
  std::abort();
}

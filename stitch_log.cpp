#include "stitch_log.h"
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <vector>

void stitch_logf(const stitch_events &ev, const char *fmt, ...) {
  if (!ev.on_log) return;

  char small[512];
  va_list ap;
  va_start(ap, fmt);
  va_list ap2;
  va_copy(ap2, ap);
  int n = vsnprintf(small, sizeof(small), fmt, ap);
  va_end(ap);
  if (n < 0) { va_end(ap2); return; }

  if ((size_t)n < sizeof(small)) {
    va_end(ap2);
    ev.on_log(std::string(small, (size_t)n));
    return;
  }

  // Long line (URLs with big identifiers); format again into a heap buffer.
  std::vector<char> big((size_t)n + 1);
  vsnprintf(big.data(), big.size(), fmt, ap2);
  va_end(ap2);
  ev.on_log(std::string(big.data(), (size_t)n));
}

void stitch_status(const stitch_events &ev, const std::string &text) {
  if (ev.on_status) ev.on_status(text);
}

void stitch_progress(const stitch_events &ev, double percent) {
  if (ev.on_progress) ev.on_progress(std::clamp(percent, 0.0, 100.0));
}

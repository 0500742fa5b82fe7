#pragma once
#include <functional>
#include <string>

// Notification channel from the core to whatever front-end drives it.
// All callbacks are optional and are invoked only from the thread that
// called run_stitch() / fetch_tiles(); marshaling to a UI thread is the
// receiver's business.
struct stitch_events {
  std::function<void(double /*percent 0..100*/)> on_progress;
  std::function<void(const std::string &)> on_status;
  // Log sink: one complete line per call, no trailing newline.
  std::function<void(const std::string &)> on_log;
};

void stitch_logf(const stitch_events &ev, const char *fmt, ...)
#if defined(__GNUC__)
  __attribute__((format(printf, 2, 3)))
#endif
  ;
void stitch_status(const stitch_events &ev, const std::string &text);
void stitch_progress(const stitch_events &ev, double percent);

#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "http_fetch.h"
#include "rgba_buf.h"
#include "stitch_log.h"
#include "tile_geometry.h"

static constexpr int kMinWorkers = 1;
static constexpr int kMaxWorkers = 16;

// Fetches and decodes one region into out (any extent; the caller fits it).
// worker is the index of the calling worker thread, 0..workers-1.
using tile_fetch_fn = std::function<bool(int worker, const tile_request &req, rgba_buf &out, std::string *err)>;

struct failed_region {
  region r;
  std::string url;
  std::string reason;
};

enum class fetch_status {
  completed,  // every region drained (some may have failed)
  cancelled,  // cancel flag observed
  aborted,    // first drained result was a failure
};

struct fetch_options {
  int workers = 4;
  const std::atomic<bool> *cancel = nullptr;
};

struct fetch_summary {
  fetch_status status = fetch_status::completed;
  size_t total = 0;
  size_t succeeded = 0;
  std::vector<failed_region> failed;
  std::string abort_reason;
};

// Runs `fetch` for every request on a pool of opts.workers threads and
// composites results into canvas from the calling thread, in completion
// order. canvas must already be sized to the full image.
fetch_summary fetch_tiles(const std::vector<tile_request> &requests, const tile_fetch_fn &fetch,
                          const fetch_options &opts, rgba_buf &canvas, const stitch_events &ev);

// HTTP + JPEG tile source with one keep-alive session per worker.
class http_tile_source {
public:
  http_tile_source(const std::string &origin, int workers, int timeout_sec = kTileTimeoutSec);

  bool fetch(int worker, const tile_request &req, rgba_buf &out, std::string *err);

  tile_fetch_fn as_fetch_fn();

private:
  std::vector<std::unique_ptr<http_session>> sessions;
};

#pragma once
#include <atomic>
#include <cstddef>
#include <string>
#include <vector>
#include "stitch_config.h"
#include "stitch_error.h"
#include "stitch_log.h"
#include "tile_fetcher.h"

enum class run_status {
  succeeded,  // output written; failed_regions may be non-empty
  cancelled,
  failed,
};

struct run_outcome {
  run_status status = run_status::failed;
  size_t total_regions = 0;
  size_t succeeded = 0;
  std::vector<failed_region> failed_regions;
  std::string output_path;   // set only when status == succeeded
  uint32_t width = 0, height = 0;
  tile_geometry geometry;
  output_kind kind = output_kind::lossless_uncompressed;
  stitch_error error;        // set only when status == failed
  std::string status_text;   // last status line emitted
};

// One complete run: descriptor -> geometry -> regions -> fetch/composite ->
// encode. Blocks until done. cancel may be null.
run_outcome run_stitch(const stitch_config &cfg, const stitch_events &ev, const std::atomic<bool> *cancel);

// Multi-line human summary of a finished run (path, size, tiles, format).
std::string describe_outcome(const run_outcome &o);

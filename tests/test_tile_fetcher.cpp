#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "test_util.h"
#include "tile_fetcher.h"

static const uint32_t kTile = 4;

// One row of n regions, each kTile x kTile; url is "tile/<index>".
static std::vector<tile_request> make_row(size_t n) {
  std::vector<tile_request> reqs;
  for (size_t i = 0; i < n; i++) {
    tile_request tr;
    tr.r.x = (uint32_t)i * kTile;
    tr.r.y = 0;
    tr.r.w = kTile;
    tr.r.h = kTile;
    tr.url = "tile/" + std::to_string(i);
    reqs.push_back(tr);
  }
  return reqs;
}

static size_t index_of(const tile_request &req) { return (size_t)(req.r.x / kTile); }

static bool region_painted(const rgba_buf &canvas, size_t i) {
  return canvas.at((uint32_t)i * kTile, 0)[3] != 0;
}

static bool solid_tile(const tile_request &req, rgba_buf &out) {
  out = make_solid(req.r.w, req.r.h, (uint8_t)(index_of(req) * 20), 100, 50, 255);
  return true;
}

struct log_capture {
  std::mutex mtx;
  std::vector<std::string> lines;
  bool contains(const std::string &needle) {
    std::lock_guard<std::mutex> lk(mtx);
    for (const auto &l : lines) if (l.find(needle) != std::string::npos) return true;
    return false;
  }
};

static stitch_events capture_events(log_capture &cap) {
  stitch_events ev;
  ev.on_log = [&cap](const std::string &l) {
    std::lock_guard<std::mutex> lk(cap.mtx);
    cap.lines.push_back(l);
  };
  return ev;
}

TEST(TileFetcher, AllTilesComposited) {
  const size_t n = 9;
  std::vector<tile_request> reqs = make_row(n);
  rgba_buf canvas;
  canvas.resize((uint32_t)n * kTile, kTile);

  std::vector<double> progress;
  stitch_events ev;
  ev.on_progress = [&progress](double p) { progress.push_back(p); };

  fetch_options opts;
  opts.workers = 4;
  fetch_summary s = fetch_tiles(reqs, [](int, const tile_request &req, rgba_buf &out, std::string *) {
    return solid_tile(req, out);
  }, opts, canvas, ev);

  EXPECT_EQ(s.status, fetch_status::completed);
  EXPECT_EQ(s.total, n);
  EXPECT_EQ(s.succeeded, n);
  EXPECT_TRUE(s.failed.empty());
  for (size_t i = 0; i < n; i++) {
    EXPECT_TRUE(region_painted(canvas, i)) << i;
    EXPECT_EQ(canvas.at((uint32_t)i * kTile + 1, 2)[0], (uint8_t)(i * 20));
  }
  ASSERT_EQ(progress.size(), n);
  for (size_t i = 1; i < progress.size(); i++) EXPECT_GT(progress[i], progress[i-1]);
  EXPECT_DOUBLE_EQ(progress.back(), 100.0);
}

TEST(TileFetcher, WorkerIndexWithinBudget) {
  std::vector<tile_request> reqs = make_row(20);
  rgba_buf canvas;
  canvas.resize(20 * kTile, kTile);
  std::atomic<int> bad{0};
  fetch_options opts;
  opts.workers = 64;  // clamped to 16
  fetch_summary s = fetch_tiles(reqs, [&bad](int worker, const tile_request &req, rgba_buf &out, std::string *) {
    if (worker < 0 || worker >= kMaxWorkers) bad++;
    return solid_tile(req, out);
  }, opts, canvas, stitch_events());
  EXPECT_EQ(s.status, fetch_status::completed);
  EXPECT_EQ(bad.load(), 0);
}

TEST(TileFetcher, LateFailureLeavesRegionTransparent) {
  const size_t n = 4;
  std::vector<tile_request> reqs = make_row(n);
  rgba_buf canvas;
  canvas.resize((uint32_t)n * kTile, kTile);

  // Region 0 fails only after some other tile has been composited.
  std::atomic<bool> one_drained{false};
  log_capture cap;
  stitch_events ev = capture_events(cap);
  ev.on_progress = [&one_drained](double) { one_drained.store(true); };

  fetch_options opts;
  opts.workers = 2;
  fetch_summary s = fetch_tiles(reqs, [&one_drained](int, const tile_request &req, rgba_buf &out, std::string *err) {
    if (index_of(req) == 0) {
      const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
      while (!one_drained.load() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      if (err) *err = "HTTP 500";
      return false;
    }
    return solid_tile(req, out);
  }, opts, canvas, ev);

  EXPECT_EQ(s.status, fetch_status::completed);
  EXPECT_EQ(s.succeeded, n - 1);
  ASSERT_EQ(s.failed.size(), 1u);
  EXPECT_EQ(s.failed[0].r.x, 0u);
  EXPECT_EQ(s.failed[0].url, "tile/0");
  EXPECT_EQ(s.failed[0].reason, "HTTP 500");
  EXPECT_FALSE(region_painted(canvas, 0));
  for (size_t i = 1; i < n; i++) EXPECT_TRUE(region_painted(canvas, i));
  EXPECT_TRUE(cap.contains("[fetch] Error downloading tile tile/0: HTTP 500"));
}

TEST(TileFetcher, FirstCompletedFailureAborts) {
  std::vector<tile_request> reqs = make_row(5);
  rgba_buf canvas;
  canvas.resize(5 * kTile, kTile);

  fetch_options opts;
  opts.workers = 1;
  fetch_summary s = fetch_tiles(reqs, [](int, const tile_request &req, rgba_buf &out, std::string *err) {
    if (index_of(req) == 0) { if (err) *err = "connection refused"; return false; }
    return solid_tile(req, out);
  }, opts, canvas, stitch_events());

  EXPECT_EQ(s.status, fetch_status::aborted);
  EXPECT_EQ(s.succeeded, 0u);
  EXPECT_EQ(s.abort_reason, "connection refused");
  for (size_t i = 0; i < 5; i++) EXPECT_FALSE(region_painted(canvas, i));
}

// The zero-successes rule looks at drain order, not request order: with
// enough workers a fast failure on any region can abort a run whose other
// regions would all have succeeded.
TEST(TileFetcher, ZeroSuccessRuleDependsOnCompletionOrder) {
  std::vector<tile_request> reqs = make_row(4);
  rgba_buf canvas;
  canvas.resize(4 * kTile, kTile);

  fetch_options opts;
  opts.workers = 4;
  fetch_summary s = fetch_tiles(reqs, [](int, const tile_request &req, rgba_buf &out, std::string *err) {
    if (index_of(req) == 3) { if (err) *err = "timeout"; return false; }
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return solid_tile(req, out);
  }, opts, canvas, stitch_events());

  EXPECT_EQ(s.status, fetch_status::aborted);
  EXPECT_EQ(s.succeeded, 0u);
}

TEST(TileFetcher, CancellationStopsCompositing) {
  const size_t n = 12;
  std::vector<tile_request> reqs = make_row(n);
  rgba_buf canvas;
  canvas.resize((uint32_t)n * kTile, kTile);

  std::atomic<bool> cancel{false};
  size_t composited = 0;
  log_capture cap;
  stitch_events ev = capture_events(cap);
  ev.on_progress = [&](double) {
    if (++composited == 2) cancel.store(true);
  };

  fetch_options opts;
  opts.workers = 2;
  opts.cancel = &cancel;
  fetch_summary s = fetch_tiles(reqs, [](int, const tile_request &req, rgba_buf &out, std::string *) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return solid_tile(req, out);
  }, opts, canvas, ev);

  EXPECT_EQ(s.status, fetch_status::cancelled);
  EXPECT_EQ(s.succeeded, 2u);
  EXPECT_EQ(composited, 2u);
  size_t painted = 0;
  for (size_t i = 0; i < n; i++) painted += region_painted(canvas, i) ? 1 : 0;
  EXPECT_EQ(painted, 2u);
  EXPECT_TRUE(cap.contains("[fetch] Download cancelled by user"));
}

TEST(TileFetcher, CancelledBeforeStart) {
  std::vector<tile_request> reqs = make_row(3);
  rgba_buf canvas;
  canvas.resize(3 * kTile, kTile);
  std::atomic<bool> cancel{true};
  std::atomic<int> calls{0};
  fetch_options opts;
  opts.cancel = &cancel;
  fetch_summary s = fetch_tiles(reqs, [&calls](int, const tile_request &req, rgba_buf &out, std::string *) {
    calls++;
    return solid_tile(req, out);
  }, opts, canvas, stitch_events());
  EXPECT_EQ(s.status, fetch_status::cancelled);
  EXPECT_EQ(s.succeeded, 0u);
  EXPECT_EQ(calls.load(), 0);
}

TEST(TileFetcher, ExceptionBecomesTileFailure) {
  std::vector<tile_request> reqs = make_row(2);
  rgba_buf canvas;
  canvas.resize(2 * kTile, kTile);
  fetch_options opts;
  opts.workers = 1;
  fetch_summary s = fetch_tiles(reqs, [](int, const tile_request &req, rgba_buf &out, std::string *) -> bool {
    if (index_of(req) == 1) throw std::runtime_error("decoder exploded");
    return solid_tile(req, out);
  }, opts, canvas, stitch_events());
  EXPECT_EQ(s.status, fetch_status::completed);
  ASSERT_EQ(s.failed.size(), 1u);
  EXPECT_EQ(s.failed[0].reason, "decoder exploded");
}

TEST(TileFetcher, ImpossibleRegionExtentFailsTile) {
  std::vector<tile_request> reqs = make_row(1);
  reqs[0].r.w = 2147483648u;
  reqs[0].r.h = 2147483648u;
  rgba_buf canvas;
  canvas.resize(kTile, kTile);
  fetch_options opts;
  opts.workers = 1;
  fetch_summary s = fetch_tiles(reqs, [](int, const tile_request &, rgba_buf &out, std::string *) {
    out = make_solid(2, 2, 1, 1, 1, 255);
    return true;
  }, opts, canvas, stitch_events());
  EXPECT_EQ(s.status, fetch_status::aborted);
  EXPECT_EQ(s.succeeded, 0u);
  EXPECT_NE(s.abort_reason.find("overflows"), std::string::npos) << s.abort_reason;
  EXPECT_EQ(canvas.at(0, 0)[3], 0);
}

TEST(TileFetcher, ShortTileIsPadded) {
  std::vector<tile_request> reqs = make_row(1);
  rgba_buf canvas;
  canvas.resize(kTile, kTile);
  log_capture cap;
  fetch_options opts;
  fetch_summary s = fetch_tiles(reqs, [](int, const tile_request &, rgba_buf &out, std::string *) {
    out = make_solid(2, 2, 1, 1, 1, 255);
    return true;
  }, opts, canvas, capture_events(cap));
  EXPECT_EQ(s.status, fetch_status::completed);
  EXPECT_EQ(canvas.at(1, 1)[3], 255);
  EXPECT_EQ(canvas.at(3, 3)[3], 0);
  EXPECT_TRUE(cap.contains("fitted to 4x4"));
}

TEST(TileFetcher, EmptyRequestList) {
  rgba_buf canvas;
  fetch_summary s = fetch_tiles({}, [](int, const tile_request &, rgba_buf &, std::string *) { return false; },
                                fetch_options(), canvas, stitch_events());
  EXPECT_EQ(s.status, fetch_status::completed);
  EXPECT_EQ(s.total, 0u);
}

#include "tile_fetcher.h"
#include "jpeg_codec.h"
#include "tile_compositor.h"
#include <string.h>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

namespace {

struct tile_fetch_result {
  size_t index = 0;
  bool ok = false;
  rgba_buf tile;
  uint32_t got_w = 0, got_h = 0;  // extent before fitting
  std::string error;
};

// Workers pull request indices from a shared counter and post finished
// results; only the draining thread touches the canvas.
struct fetch_pool {
  const std::vector<tile_request> &requests;
  const tile_fetch_fn &fetch;
  const std::atomic<bool> *cancel;

  std::atomic<size_t> next{0};
  std::atomic<bool> stop{false};

  std::mutex mtx;
  std::condition_variable cv;
  std::deque<tile_fetch_result> done;

  std::vector<std::thread> threads;
  int running = 0;  // guarded by mtx

  fetch_pool(const std::vector<tile_request> &reqs, const tile_fetch_fn &fn, const std::atomic<bool> *c)
    : requests(reqs), fetch(fn), cancel(c) {}

  ~fetch_pool() {
    stop.store(true);
    for (auto &t : threads) if (t.joinable()) t.join();
  }

  void start(int workers) {
    threads.reserve((size_t)workers);
    for (int i = 0; i < workers; i++) {
      {
        std::lock_guard<std::mutex> lk(mtx);
        running++;
      }
      threads.emplace_back([this, i]() { worker_main(i); });
    }
  }

  void worker_main(int worker) {
    for (;;) {
      if (stop.load()) break;
      if (cancel && cancel->load()) break;
      size_t idx = next.fetch_add(1);
      if (idx >= requests.size()) break;

      tile_fetch_result r;
      r.index = idx;
      const tile_request &req = requests[idx];
      try {
        r.ok = fetch(worker, req, r.tile, &r.error);
        if (r.ok) {
          r.got_w = r.tile.w;
          r.got_h = r.tile.h;
          fit_tile_to_extent(r.tile, req.r.w, req.r.h);
        }
      } catch (const std::exception &e) {
        r.ok = false;
        r.error = e.what();
      }
      if (!r.ok && r.error.empty()) r.error = "unknown error";

      {
        std::lock_guard<std::mutex> lk(mtx);
        done.push_back(std::move(r));
      }
      cv.notify_one();
    }

    {
      std::lock_guard<std::mutex> lk(mtx);
      running--;
    }
    cv.notify_one();
  }

  // Blocks for the next finished result. Returns false once every worker has
  // exited and nothing is left to drain (only happens after cancellation).
  bool take(tile_fetch_result &out) {
    std::unique_lock<std::mutex> lk(mtx);
    cv.wait(lk, [this]() { return !done.empty() || running == 0; });
    if (done.empty()) return false;
    out = std::move(done.front());
    done.pop_front();
    return true;
  }
};

} // namespace

static std::string region_str(const region &r) {
  return std::to_string(r.x) + "," + std::to_string(r.y) + "," + std::to_string(r.w) + "," + std::to_string(r.h);
}

fetch_summary fetch_tiles(const std::vector<tile_request> &requests, const tile_fetch_fn &fetch,
                          const fetch_options &opts, rgba_buf &canvas, const stitch_events &ev) {
  fetch_summary s;
  s.total = requests.size();
  if (requests.empty()) return s;

  const int workers = std::clamp(opts.workers, kMinWorkers, kMaxWorkers);
  fetch_pool pool(requests, fetch, opts.cancel);
  pool.start(workers);

  const size_t total = requests.size();
  for (size_t drained = 0; drained < total; drained++) {
    tile_fetch_result r;
    const bool got = pool.take(r);
    if (!got || (opts.cancel && opts.cancel->load())) {
      stitch_logf(ev, "[fetch] Download cancelled by user");
      s.status = fetch_status::cancelled;
      break;
    }

    const tile_request &req = requests[r.index];
    if (!r.ok) {
      stitch_logf(ev, "[fetch] Error downloading tile %s: %s", req.url.c_str(), r.error.c_str());
      if (s.succeeded == 0) {
        // Nothing has worked yet: wrong URL, auth, server down. Not worth
        // producing a blank image for.
        s.status = fetch_status::aborted;
        s.abort_reason = r.error;
        break;
      }
      s.failed.push_back(failed_region{req.r, req.url, r.error});
      continue;
    }

    if (r.got_w != req.r.w || r.got_h != req.r.h) {
      stitch_logf(ev, "[fetch] tile %s: server returned %ux%u, fitted to %ux%u",
                  region_str(req.r).c_str(), r.got_w, r.got_h, req.r.w, req.r.h);
    }
    composite_tile(canvas, r.tile, req.r);

    s.succeeded++;
    const double progress = (double)s.succeeded / (double)total * 100.0;
    stitch_progress(ev, progress);
    stitch_status(ev, "Downloaded " + std::to_string(s.succeeded) + "/" + std::to_string(total) + " tiles");
    if (s.succeeded % 25 == 0 || s.succeeded == total) {
      stitch_logf(ev, "[fetch] Progress: %zu/%zu tiles (%.1f%%)", s.succeeded, total, progress);
    }
  }

  // Leaving scope stops and joins the workers; anything still in flight
  // finishes and is dropped.
  return s;
}

http_tile_source::http_tile_source(const std::string &origin, int workers, int timeout_sec) {
  const int n = std::clamp(workers, kMinWorkers, kMaxWorkers);
  for (int i = 0; i < n; i++) sessions.emplace_back(new http_session(origin, timeout_sec));
}

bool http_tile_source::fetch(int worker, const tile_request &req, rgba_buf &out, std::string *err) {
  if (worker < 0 || (size_t)worker >= sessions.size()) {
    if (err) *err = "no HTTP session for worker " + std::to_string(worker);
    return false;
  }
  std::string body, content_type;
  if (!sessions[(size_t)worker]->get(req.url, body, err, &content_type)) return false;

  // Region URLs ask for default.jpg; anything else (an HTML error page, a
  // PNG from a misconfigured server) gets named instead of a libjpeg message.
  const uint8_t *data = reinterpret_cast<const uint8_t*>(body.data());
  const char *fmt = sniff_image_format(data, body.size());
  if (!fmt || strcmp(fmt, "JPEG") != 0) {
    if (err) {
      *err = "tile " + req.url + " is not a JPEG (Content-Type: " +
             (content_type.empty() ? std::string("none") : content_type) + ", " +
             std::to_string(body.size()) + " bytes" + (fmt ? std::string(", looks like ") + fmt : std::string()) + ")";
    }
    return false;
  }
  std::string why;
  if (!decode_jpeg_to_rgba(data, body.size(), out, &why)) {
    if (err) *err = "decode " + req.url + ": " + why;
    return false;
  }
  return true;
}

tile_fetch_fn http_tile_source::as_fetch_fn() {
  return [this](int worker, const tile_request &req, rgba_buf &out, std::string *err) {
    return fetch(worker, req, out, err);
  };
}

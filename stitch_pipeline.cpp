#include "stitch_pipeline.h"
#include "http_fetch.h"
#include "iiif_descriptor.h"
#include "tile_geometry.h"
#include <chrono>
#include <new>
#include <sstream>
#include <stdexcept>
#include <system_error>

static run_outcome &fail_run(run_outcome &o, const stitch_events &ev, const stitch_error &e) {
  o.status = run_status::failed;
  o.error = e;
  stitch_logf(ev, "[stitch] ERROR (%s): %s", error_kind_name(e.kind), e.message.c_str());
  stitch_status(ev, "Download failed");
  stitch_progress(ev, 0.0);
  return o;
}

run_outcome run_stitch(const stitch_config &cfg_in, const stitch_events &ev_in, const std::atomic<bool> *cancel) {
  run_outcome o;

  // Track the last status line for the outcome, then forward.
  stitch_events ev = ev_in;
  ev.on_status = [&o, &ev_in](const std::string &s) {
    o.status_text = s;
    if (ev_in.on_status) ev_in.on_status(s);
  };

  const auto t0 = std::chrono::steady_clock::now();

  stitch_config cfg = cfg_in;
  cfg_normalize(cfg);
  o.kind = cfg.kind;

  std::string why;
  if (!cfg_validate(cfg, &why)) return fail_run(o, ev, stitch_error{error_kind::config, why});
  if (!cfg_prepare_output_dir(cfg, &why)) return fail_run(o, ev, stitch_error{error_kind::config, why});

  const std::string service_url = normalize_service_url(cfg.service_url);
  stitch_status(ev, "Getting image information...");
  stitch_logf(ev, "[stitch] Service URL: %s", service_url.c_str());

  url_parts parts;
  if (!split_url(service_url, parts))
    return fail_run(o, ev, stitch_error{error_kind::descriptor_fetch, "not an http(s) URL: " + service_url});

  service_descriptor desc;
  stitch_error err;
  if (!fetch_descriptor(service_url, desc, &err)) return fail_run(o, ev, err);

  o.width = desc.width;
  o.height = desc.height;
  stitch_status(ev, "Image size: " + std::to_string(desc.width) + " x " + std::to_string(desc.height) + " pixels");
  stitch_logf(ev, "[descriptor] Image dimensions: %u x %u", desc.width, desc.height);
  if (!desc.id.empty() && normalize_service_url(desc.id) != service_url) {
    stitch_logf(ev, "[descriptor] note: descriptor id is %s", desc.id.c_str());
  }

  tile_geometry g = resolve_tile_geometry(desc, cfg.tile_size);
  o.geometry = g;
  stitch_logf(ev, "[geometry] Using tile size: %u x %u (overlap: %upx)", g.tile_w, g.tile_h, g.overlap);
  if (desc.max_area) {
    stitch_logf(ev, "[geometry] Respecting server maxArea: %llu", (unsigned long long)desc.max_area);
  }

  const std::string dims = std::to_string(desc.width) + " x " + std::to_string(desc.height);
  fetch_summary fs;
  {
    // The canvas goes first: an image too large to hold fails here, before
    // a grid of matching size is planned.
    rgba_buf canvas;
    std::vector<tile_request> requests;
    try {
      canvas.resize(desc.width, desc.height);
      stitch_status(ev, "Preparing download URLs...");
      requests = plan_tile_requests(service_url, desc.width, desc.height, g);
    } catch (const std::bad_alloc &) {
      return fail_run(o, ev, stitch_error{error_kind::allocation, "cannot allocate a " + dims + " image"});
    } catch (const std::length_error &e) {
      return fail_run(o, ev, stitch_error{error_kind::allocation, "image too large: " + dims + " (" + e.what() + ")"});
    }
    o.total_regions = requests.size();
    stitch_logf(ev, "[stitch] Total tiles to download: %zu", requests.size());
    stitch_status(ev, "Downloading " + std::to_string(requests.size()) + " tiles...");

    fetch_options opts;
    opts.workers = cfg.workers;
    opts.cancel = cancel;

    http_tile_source source(parts.origin, cfg.workers);
    try {
      fs = fetch_tiles(requests, source.as_fetch_fn(), opts, canvas, ev);
    } catch (const std::system_error &e) {
      return fail_run(o, ev, stitch_error{error_kind::tile_fetch, std::string("cannot start workers: ") + e.what()});
    }
    o.succeeded = fs.succeeded;
    o.failed_regions = fs.failed;

    if (fs.status == fetch_status::cancelled) {
      o.status = run_status::cancelled;
      stitch_status(ev, "Download cancelled");
      stitch_logf(ev, "[stitch] Download was cancelled");
      return o;
    }
    if (fs.status == fetch_status::aborted) {
      return fail_run(o, ev, stitch_error{error_kind::tile_fetch, fs.abort_reason});
    }

    const std::string output_path = cfg_output_path(cfg);
    stitch_status(ev, "Saving image...");
    stitch_logf(ev, "[encode] Saving to: %s", output_path.c_str());
    bool encoded = false;
    try {
      encoded = encode_canvas_to_file(canvas, cfg.kind, output_path, &err);
    } catch (const std::bad_alloc &) {
      return fail_run(o, ev, stitch_error{error_kind::allocation, "not enough memory to encode a " + dims + " image"});
    }
    if (!encoded) return fail_run(o, ev, err);
    o.output_path = output_path;
  }

  const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  o.status = run_status::succeeded;
  if (!o.failed_regions.empty()) {
    stitch_logf(ev, "[stitch] %zu of %zu tiles failed; their areas are transparent",
                o.failed_regions.size(), o.total_regions);
  }
  stitch_logf(ev, "[stitch] Successfully saved to: %s (%.1fs)", o.output_path.c_str(), secs);
  stitch_status(ev, "Download complete!");
  stitch_progress(ev, 100.0);
  return o;
}

std::string describe_outcome(const run_outcome &o) {
  std::ostringstream ss;
  switch (o.status) {
    case run_status::succeeded:
      ss << "Image saved to:\n" << o.output_path << "\n\n"
         << "Size: " << o.width << " x " << o.height << " pixels\n"
         << "Tiles: " << o.total_regions << "\n";
      if (!o.failed_regions.empty()) {
        ss << "Failed tiles: " << o.failed_regions.size() << "\n";
        for (const auto &f : o.failed_regions) {
          ss << "  " << f.r.x << "," << f.r.y << "," << f.r.w << "," << f.r.h << ": " << f.reason << "\n";
        }
      }
      ss << "Format: " << output_kind_label(o.kind);
      break;
    case run_status::cancelled:
      ss << "Download cancelled (" << o.succeeded << "/" << o.total_regions << " tiles fetched)";
      break;
    case run_status::failed:
      ss << "Error: " << o.error.message;
      break;
  }
  return ss.str();
}

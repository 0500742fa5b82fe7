#include "tile_geometry.h"
#include <algorithm>
#include <cmath>

static const tile_spec &choose_tile_spec(const std::vector<tile_spec> &tiles) {
  for (const auto &t : tiles) {
    if (std::find(t.scale_factors.begin(), t.scale_factors.end(), 1u) != t.scale_factors.end()) return t;
  }
  return tiles.front();
}

void clamp_to_max_area(uint64_t max_area, uint32_t &w, uint32_t &h) {
  if (!max_area) return;
  uint64_t area = (uint64_t)w * (uint64_t)h;
  if (area <= max_area) return;

  double scale = std::sqrt((double)max_area / (double)area);
  w = std::max<uint32_t>(1, (uint32_t)std::floor((double)w * scale));
  h = std::max<uint32_t>(1, (uint32_t)std::floor((double)h * scale));

  // Floating point may land one pixel high; shave the larger side.
  while ((uint64_t)w * (uint64_t)h > max_area && (w > 1 || h > 1)) {
    if (w >= h) w--; else h--;
  }
}

tile_geometry resolve_tile_geometry(const service_descriptor &d, uint32_t tile_pref) {
  tile_geometry g;
  if (!d.tiles.empty()) {
    const tile_spec &t = choose_tile_spec(d.tiles);
    g.tile_w = t.width ? t.width : kFallbackTileWidth;
    g.tile_h = t.height ? t.height : g.tile_w;
    g.overlap = t.overlap;
  } else {
    uint32_t s = tile_pref ? tile_pref : kDefaultTileSize;
    g.tile_w = s;
    g.tile_h = s;
    g.overlap = 0;
  }

  clamp_to_max_area(d.max_area, g.tile_w, g.tile_h);

  if (d.max_width) {
    uint32_t mh = d.max_height ? d.max_height : d.max_width;
    g.tile_w = std::min(g.tile_w, d.max_width);
    g.tile_h = std::min(g.tile_h, mh);
  }
  return g;
}

std::vector<region> plan_regions(uint32_t width, uint32_t height, const tile_geometry &g) {
  std::vector<region> out;
  if (!width || !height || !g.tile_w || !g.tile_h) return out;

  uint64_t cols = ((uint64_t)width + g.tile_w - 1) / g.tile_w;
  uint64_t rows = ((uint64_t)height + g.tile_h - 1) / g.tile_h;
  out.reserve((size_t)(cols * rows));

  for (uint64_t y = 0; y < height; y += g.tile_h) {
    uint32_t h = (uint32_t)std::min<uint64_t>(g.tile_h, height - y);
    for (uint64_t x = 0; x < width; x += g.tile_w) {
      region r;
      r.x = (uint32_t)x;
      r.y = (uint32_t)y;
      r.w = (uint32_t)std::min<uint64_t>(g.tile_w, width - x);
      r.h = h;
      out.push_back(r);
    }
  }
  return out;
}

std::string region_url(const std::string &base, const region &r) {
  return base + "/" + std::to_string(r.x) + "," + std::to_string(r.y) + "," +
         std::to_string(r.w) + "," + std::to_string(r.h) + "/full/0/default.jpg";
}

std::vector<tile_request> plan_tile_requests(const std::string &base, uint32_t width, uint32_t height,
                                             const tile_geometry &g) {
  std::vector<tile_request> out;
  for (const region &r : plan_regions(width, height, g)) {
    tile_request tr;
    tr.r = r;
    tr.url = region_url(base, r);
    out.push_back(std::move(tr));
  }
  return out;
}

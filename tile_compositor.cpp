#include "tile_compositor.h"
#include <algorithm>
#include <cassert>
#include <cstring>

bool fit_tile_to_extent(rgba_buf &tile, uint32_t w, uint32_t h) {
  if (tile.w == w && tile.h == h) return false;

  rgba_buf fitted;
  fitted.resize(w, h);
  const uint32_t cw = std::min(w, tile.w);
  const uint32_t ch = std::min(h, tile.h);
  for (uint32_t y = 0; y < ch; y++) {
    memcpy(fitted.row(y), tile.row(y), (size_t)cw * 4);
  }
  tile = std::move(fitted);
  return true;
}

void composite_tile(rgba_buf &canvas, const rgba_buf &tile, const region &r) {
  assert(tile.w == r.w && tile.h == r.h);
  assert((uint64_t)r.x + r.w <= canvas.w && (uint64_t)r.y + r.h <= canvas.h);

  if (!canvas.storage_matches() || !tile.storage_matches()) return;
  if (r.x >= canvas.w || r.y >= canvas.h) return;
  const uint32_t cw = std::min({tile.w, r.w, canvas.w - r.x});
  const uint32_t ch = std::min({tile.h, r.h, canvas.h - r.y});
  for (uint32_t y = 0; y < ch; y++) {
    memcpy(canvas.at(r.x, r.y + y), tile.row(y), (size_t)cw * 4);
  }
}

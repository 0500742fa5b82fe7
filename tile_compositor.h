#pragma once
#include <cstdint>
#include "rgba_buf.h"
#include "tile_geometry.h"

// Crops a decoded tile to its top-left w x h, or pads it with transparent
// pixels when the server returned less than asked for. Returns true if the
// extent had to change. Throws like rgba_buf::resize for impossible extents.
bool fit_tile_to_extent(rgba_buf &tile, uint32_t w, uint32_t h);

// Copies tile pixels into canvas at (r.x, r.y). tile must be r.w x r.h.
// Writes are clipped to the canvas; buffers whose pixel storage does not
// match their dimensions are left untouched.
void composite_tile(rgba_buf &canvas, const rgba_buf &tile, const region &r);

#ifndef RGBA_BUF_H
#define RGBA_BUF_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// Tightly packed RGBA8 pixels, row-major, stride = w*4.
// A freshly resized buffer is fully transparent (all bytes zero).
struct rgba_buf {
  uint32_t w = 0, h = 0;
  std::vector<uint8_t> px;

  // Throws std::length_error when W*H*4 does not fit in std::size_t, std::bad_alloc
  // when it cannot be allocated. w/h are only updated on success.
  void resize(uint32_t W, uint32_t H) {
    const std::size_t max_px = std::numeric_limits<std::size_t>::max() / 4;
    if (W && (std::size_t)H > max_px / W)
      throw std::length_error("rgba_buf: " + std::to_string(W) + " x " + std::to_string(H) + " overflows");
    px.assign((std::size_t)W * (std::size_t)H * 4, 0);
    w = W; h = H;
  }

  std::size_t stride() const { return (std::size_t)w * 4; }
  // True when px holds exactly w*h pixels. Checked by division so dimensions
  // set without storage cannot wrap into a match.
  bool storage_matches() const {
    if (!w || !h) return px.empty();
    return px.size() % stride() == 0 && px.size() / stride() == h;
  }
  uint8_t *row(uint32_t y) { return px.data() + (std::size_t)y * stride(); }
  const uint8_t *row(uint32_t y) const { return px.data() + (std::size_t)y * stride(); }
  uint8_t *at(uint32_t x, uint32_t y) { return row(y) + (std::size_t)x * 4; }
  const uint8_t *at(uint32_t x, uint32_t y) const { return row(y) + (std::size_t)x * 4; }
};

#endif

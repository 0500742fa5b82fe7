#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>
#include "rgba_buf.h"

// Unique directory under the system temp dir, removed on destruction.
struct scoped_temp_dir {
  std::filesystem::path path;

  scoped_temp_dir() {
    static std::atomic<int> seq{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = std::filesystem::temp_directory_path() /
           ("iiif_stitch_test_" + std::to_string(getpid()) + "_" + std::to_string(stamp) + "_" +
            std::to_string(seq.fetch_add(1)));
    std::filesystem::create_directories(path);
  }
  ~scoped_temp_dir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }

  std::string file(const std::string &name) const { return (path / name).string(); }
};

// Deterministic opaque-ish gradient with a few translucent pixels.
static inline rgba_buf make_test_image(uint32_t w, uint32_t h) {
  rgba_buf img;
  img.resize(w, h);
  for (uint32_t y = 0; y < h; y++) {
    for (uint32_t x = 0; x < w; x++) {
      uint8_t *p = img.at(x, y);
      p[0] = (uint8_t)(x * 7 + y);
      p[1] = (uint8_t)(y * 5 + 3);
      p[2] = (uint8_t)(x ^ y);
      p[3] = (uint8_t)(((x + y) % 5 == 0) ? 128 : 255);
    }
  }
  return img;
}

static inline rgba_buf make_solid(uint32_t w, uint32_t h, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
  rgba_buf img;
  img.resize(w, h);
  for (size_t i = 0; i < img.px.size(); i += 4) {
    img.px[i] = r; img.px[i+1] = g; img.px[i+2] = b; img.px[i+3] = a;
  }
  return img;
}

#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "iiif_descriptor.h"

static constexpr uint32_t kDefaultTileSize = 1024;   // no tiles advertised, "auto"
static constexpr uint32_t kFallbackTileWidth = 512;  // tile spec without a width
static constexpr uint32_t kMinTilePref = 64;
static constexpr uint32_t kMaxTilePref = 4096;

struct tile_geometry {
  uint32_t tile_w = 0;
  uint32_t tile_h = 0;
  uint32_t overlap = 0;  // advertised only; requested regions never overlap
};

struct region {
  uint32_t x = 0, y = 0, w = 0, h = 0;
};

struct tile_request {
  region r;
  std::string url;
};

// tile_pref: 0 = let the server decide, otherwise an explicit size in
// [kMinTilePref, kMaxTilePref] used when the server advertises no tiles.
tile_geometry resolve_tile_geometry(const service_descriptor &d, uint32_t tile_pref);

// Scales w/h down by sqrt(max_area / (w*h)) when the area exceeds max_area.
// max_area == 0 means no limit.
void clamp_to_max_area(uint64_t max_area, uint32_t &w, uint32_t &h);

// Row-major grid of non-overlapping regions covering [0,width)x[0,height).
std::vector<region> plan_regions(uint32_t width, uint32_t height, const tile_geometry &g);

// {base}/{x},{y},{w},{h}/full/0/default.jpg
std::string region_url(const std::string &base, const region &r);

std::vector<tile_request> plan_tile_requests(const std::string &base, uint32_t width, uint32_t height,
                                             const tile_geometry &g);

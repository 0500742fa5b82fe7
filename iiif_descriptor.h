#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "stitch_error.h"

// One entry of the descriptor's "tiles" array. Zero means "not advertised"
// (or not a usable positive integer); the geometry resolver applies defaults.
struct tile_spec {
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t overlap = 0;
  std::vector<uint32_t> scale_factors;
};

struct service_descriptor {
  std::string id;            // "@id" (v2) or "id" (v3), informational
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<tile_spec> tiles;
  uint64_t max_area = 0;     // 0 => no limit
  uint32_t max_width = 0;    // 0 => no limit
  uint32_t max_height = 0;   // 0 => same as max_width
};

// Canonical service base: no query/fragment, no "/info.json", no trailing '/'.
std::string normalize_service_url(const std::string &url);

// Parses an info.json body. Fails with descriptor_fetch on malformed JSON and
// descriptor_format when width/height are missing or not positive integers.
bool parse_descriptor_json(const std::string &text, service_descriptor &out, stitch_error *err);

// GET {base}/info.json (30s timeout) and parse it.
bool fetch_descriptor(const std::string &base, service_descriptor &out, stitch_error *err);

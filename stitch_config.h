#pragma once
#include <stdint.h>
#include <string>
#include "canvas_encoder.h"

struct stitch_config {
  std::string service_url;
  std::string output_dir;                 // created if absent
  std::string file_name = "downloaded_image";
  output_kind kind = output_kind::lossless_uncompressed;
  uint32_t tile_size = 0;                 // 0 = auto (server decides)
  int workers = 4;                        // 1..16
};

// Parses "auto" or a decimal pixel size. "auto" and "0" yield 0.
bool tile_size_from_string(const std::string &s, uint32_t &out);
std::string tile_size_to_string(uint32_t tile_size);

// Normalizes config in-place:
// - trims url/dir/name
// - clamps workers to 1..16
// - fills output_dir with ~/Downloads (if it exists) or "." when empty
void cfg_normalize(stitch_config &c);

// Rejects what the core cannot run with: empty url/name/dir, a tile size
// outside [64,4096], a file name containing a path separator.
bool cfg_validate(const stitch_config &c, std::string *err);

// {output_dir}/{file_name}.{ext}
std::string cfg_output_path(const stitch_config &c);

// create_directories(output_dir); fails if it exists and is not a directory.
bool cfg_prepare_output_dir(const stitch_config &c, std::string *err);

// JSON serialization / parsing
std::string config_to_json(const stitch_config &c);
bool config_from_json_text(const std::string &text, stitch_config &c);

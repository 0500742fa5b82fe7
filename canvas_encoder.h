#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "rgba_buf.h"
#include "stitch_error.h"

enum class output_kind {
  lossless_uncompressed = 0,  // TIFF
  lossless_compressed = 1,    // PNG
  lossy = 2,                  // JPEG, flattened on white
};

static constexpr int kJpegOutputQuality = 95;
static constexpr int kPngLevel = 9;

// "tiff" | "png" | "jpg" (also "tif", "jpeg" and the long kind names)
bool output_kind_from_string(const std::string &s, output_kind &out);
const char *output_kind_to_string(output_kind k);  // tiff, png, jpg
const char *output_kind_ext(output_kind k);        // tif, png, jpg
const char *output_kind_label(output_kind k);      // TIFF, PNG, JPEG

// Blends RGBA over opaque white using alpha as the mask; writes packed RGB.
void flatten_on_white(const rgba_buf &src, std::vector<uint8_t> &rgb);

bool encode_png(const rgba_buf &canvas, std::vector<uint8_t> &out, stitch_error *err);
bool encode_jpeg_flattened(const rgba_buf &canvas, std::vector<uint8_t> &out, stitch_error *err);

// Encodes to "<path>.tmp" and renames over path; nothing is left behind on failure.
bool encode_canvas_to_file(const rgba_buf &canvas, output_kind kind, const std::string &path, stitch_error *err);

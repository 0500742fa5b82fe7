#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "rgba_buf.h"

enum jpeg_src_format { JPEG_SRC_RGB = 0, JPEG_SRC_RGBA = 1 };

// Names the image container by its magic bytes: "JPEG", "PNG", "GIF",
// "WebP", "TIFF", "JPEG 2000", "HTML", or nullptr when unrecognised.
const char *sniff_image_format(const uint8_t *data, size_t size);

// Decodes a JPEG into 4-channel RGBA (alpha = 255).
bool decode_jpeg_to_rgba(const uint8_t *data, size_t size, rgba_buf &out, std::string *err);

// Encodes packed RGB or RGBA pixels. pitch is bytes per row.
bool encode_pixels_to_jpeg(const uint8_t *src, int w, int h, int pitch, jpeg_src_format fmt,
                           int quality, bool optimize, std::vector<uint8_t> &out_jpeg, std::string *err);

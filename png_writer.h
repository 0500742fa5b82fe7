#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "rgba_buf.h"

// RGBA8 PNG (colour type 6). level is the zlib level 0..9; 0 emits stored
// deflate blocks.
bool encode_png_rgba(const rgba_buf &img, int level, std::vector<uint8_t> &out, std::string *err);

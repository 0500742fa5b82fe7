#pragma once
#include <string>
#include "rgba_buf.h"

// Baseline uncompressed RGBA8 TIFF with an unassociated alpha sample.
// Switches to BigTIFF when the pixel data would not fit classic offsets.
bool write_tiff_rgba(const rgba_buf &img, const std::string &path, std::string *err);

#include "tiff_writer.h"
#include <tiffio.h>
#include <cstring>
#include <vector>

bool write_tiff_rgba(const rgba_buf &img, const std::string &path, std::string *err) {
  if (!img.w || !img.h || img.px.size() != (size_t)img.w * img.h * 4) {
    if (err) *err = "TIFF: empty or inconsistent image";
    return false;
  }

  const uint64_t bytes = (uint64_t)img.w * img.h * 4;
  const char *mode = (bytes > 0xF0000000ull) ? "w8" : "w";
  TIFF *tf = TIFFOpen(path.c_str(), mode);
  if (!tf) {
    if (err) *err = "TIFF: cannot open for writing: " + path;
    return false;
  }

  const uint16_t extra[1] = { EXTRASAMPLE_UNASSALPHA };
  TIFFSetField(tf, TIFFTAG_IMAGEWIDTH, img.w);
  TIFFSetField(tf, TIFFTAG_IMAGELENGTH, img.h);
  TIFFSetField(tf, TIFFTAG_SAMPLESPERPIXEL, 4);
  TIFFSetField(tf, TIFFTAG_BITSPERSAMPLE, 8);
  TIFFSetField(tf, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
  TIFFSetField(tf, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
  TIFFSetField(tf, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
  TIFFSetField(tf, TIFFTAG_EXTRASAMPLES, 1, extra);
  TIFFSetField(tf, TIFFTAG_ORIENTATION, ORIENTATION_TOPLEFT);
  TIFFSetField(tf, TIFFTAG_ROWSPERSTRIP, TIFFDefaultStripSize(tf, 0));

  // TIFFWriteScanline takes a mutable buffer.
  std::vector<uint8_t> line(img.stride());
  bool ok = true;
  for (uint32_t y = 0; y < img.h; y++) {
    memcpy(line.data(), img.row(y), line.size());
    if (TIFFWriteScanline(tf, line.data(), y, 0) < 0) {
      if (err) *err = "TIFF: write failed at row " + std::to_string(y) + ": " + path;
      ok = false;
      break;
    }
  }

  if (ok && !TIFFFlush(tf)) {
    if (err) *err = "TIFF: flush failed: " + path;
    ok = false;
  }
  TIFFClose(tf);
  return ok;
}

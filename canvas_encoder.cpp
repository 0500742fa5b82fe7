#include "canvas_encoder.h"
#include "jpeg_codec.h"
#include "png_writer.h"
#include "tiff_writer.h"
#include <fstream>
#include <system_error>
#include <filesystem>

bool output_kind_from_string(const std::string &s, output_kind &out) {
  if (s == "tiff" || s == "tif" || s == "lossless-uncompressed") { out = output_kind::lossless_uncompressed; return true; }
  if (s == "png" || s == "lossless-compressed") { out = output_kind::lossless_compressed; return true; }
  if (s == "jpg" || s == "jpeg" || s == "lossy") { out = output_kind::lossy; return true; }
  return false;
}

const char *output_kind_to_string(output_kind k) {
  switch (k) {
    case output_kind::lossless_uncompressed: return "tiff";
    case output_kind::lossless_compressed: return "png";
    case output_kind::lossy: return "jpg";
  }
  return "?";
}

const char *output_kind_ext(output_kind k) {
  switch (k) {
    case output_kind::lossless_uncompressed: return "tif";
    case output_kind::lossless_compressed: return "png";
    case output_kind::lossy: return "jpg";
  }
  return "bin";
}

const char *output_kind_label(output_kind k) {
  switch (k) {
    case output_kind::lossless_uncompressed: return "TIFF";
    case output_kind::lossless_compressed: return "PNG";
    case output_kind::lossy: return "JPEG";
  }
  return "?";
}

void flatten_on_white(const rgba_buf &src, std::vector<uint8_t> &rgb) {
  const size_t n = (size_t)src.w * src.h;
  rgb.resize(n * 3);
  const uint8_t *s = src.px.data();
  uint8_t *d = rgb.data();
  for (size_t i = 0; i < n; i++, s += 4, d += 3) {
    const uint32_t a = s[3];
    const uint32_t inv = 255u - a;
    d[0] = (uint8_t)((s[0] * a + 255u * inv + 127u) / 255u);
    d[1] = (uint8_t)((s[1] * a + 255u * inv + 127u) / 255u);
    d[2] = (uint8_t)((s[2] * a + 255u * inv + 127u) / 255u);
  }
}

bool encode_png(const rgba_buf &canvas, std::vector<uint8_t> &out, stitch_error *err) {
  std::string why;
  if (!encode_png_rgba(canvas, kPngLevel, out, &why)) return fail(err, error_kind::encode, why);
  return true;
}

bool encode_jpeg_flattened(const rgba_buf &canvas, std::vector<uint8_t> &out, stitch_error *err) {
  if (!canvas.w || !canvas.h) return fail(err, error_kind::encode, "JPEG: empty canvas");
  std::vector<uint8_t> rgb;
  flatten_on_white(canvas, rgb);
  std::string why;
  if (!encode_pixels_to_jpeg(rgb.data(), (int)canvas.w, (int)canvas.h, (int)canvas.w * 3, JPEG_SRC_RGB,
                             kJpegOutputQuality, true, out, &why))
    return fail(err, error_kind::encode, why);
  return true;
}

static bool write_bytes(const std::string &path, const std::vector<uint8_t> &data, std::string *err) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.is_open()) {
    if (err) *err = "cannot open for writing: " + path;
    return false;
  }
  f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
  f.close();
  if (f.fail()) {
    if (err) *err = "write failed: " + path;
    return false;
  }
  return true;
}

bool encode_canvas_to_file(const rgba_buf &canvas, output_kind kind, const std::string &path, stitch_error *err) {
  const std::string tmp = path + ".tmp";
  std::string why;
  bool ok = false;

  switch (kind) {
    case output_kind::lossless_uncompressed:
      ok = write_tiff_rgba(canvas, tmp, &why);
      break;
    case output_kind::lossless_compressed: {
      std::vector<uint8_t> bytes;
      stitch_error e;
      if (!encode_png(canvas, bytes, &e)) { why = e.message; break; }
      ok = write_bytes(tmp, bytes, &why);
      break;
    }
    case output_kind::lossy: {
      std::vector<uint8_t> bytes;
      stitch_error e;
      if (!encode_jpeg_flattened(canvas, bytes, &e)) { why = e.message; break; }
      ok = write_bytes(tmp, bytes, &why);
      break;
    }
    default:
      return fail(err, error_kind::encode, "unsupported output kind " + std::to_string((int)kind));
  }

  std::error_code ec;
  if (ok) {
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
      why = "rename " + tmp + " -> " + path + ": " + ec.message();
      ok = false;
    }
  }
  if (!ok) {
    std::filesystem::remove(tmp, ec);
    return fail(err, error_kind::encode, why);
  }
  return true;
}

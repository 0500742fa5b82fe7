#include "jpeg_codec.h"
#include <turbojpeg.h>
#include <cctype>
#include <cstring>

const char *sniff_image_format(const uint8_t *d, size_t n) {
  if (!d) return nullptr;
  if (n >= 3 && d[0] == 0xFF && d[1] == 0xD8 && d[2] == 0xFF) return "JPEG";
  if (n >= 8 && memcmp(d, "\x89PNG\r\n\x1a\n", 8) == 0) return "PNG";
  if (n >= 6 && (memcmp(d, "GIF87a", 6) == 0 || memcmp(d, "GIF89a", 6) == 0)) return "GIF";
  if (n >= 12 && memcmp(d, "RIFF", 4) == 0 && memcmp(d + 8, "WEBP", 4) == 0) return "WebP";
  if (n >= 4 && (memcmp(d, "II*\0", 4) == 0 || memcmp(d, "MM\0*", 4) == 0)) return "TIFF";
  if (n >= 12 && memcmp(d, "\0\0\0\x0CjP  \r\n\x87\n", 12) == 0) return "JPEG 2000";
  if (n >= 4 && memcmp(d, "\xFF\x4F\xFF\x51", 4) == 0) return "JPEG 2000";

  size_t i = 0;
  while (i < n && std::isspace(d[i])) i++;
  if (i < n && d[i] == '<') return "HTML";
  return nullptr;
}

bool decode_jpeg_to_rgba(const uint8_t *data, size_t size, rgba_buf &out, std::string *err) {
  if (!data || !size) {
    if (err) *err = "empty JPEG buffer";
    return false;
  }

  tjhandle decompressor = tj3Init(TJINIT_DECOMPRESS);
  if (!decompressor) {
    if (err) *err = "tj3Init(TJINIT_DECOMPRESS) failed";
    return false;
  }

  bool ok = false;
  if (tj3DecompressHeader(decompressor, data, size) != 0) {
    if (err) *err = std::string("JPEG header: ") + tj3GetErrorStr(decompressor);
  } else {
    int w = tj3Get(decompressor, TJPARAM_JPEGWIDTH);
    int h = tj3Get(decompressor, TJPARAM_JPEGHEIGHT);
    if (w <= 0 || h <= 0) {
      if (err) *err = "JPEG has no dimensions";
    } else {
      out.resize((uint32_t)w, (uint32_t)h);
      // TJPF_RGBA fills the alpha byte with 0xFF.
      if (tj3Decompress8(decompressor, data, size, out.px.data(), (int)out.stride(), TJPF_RGBA) != 0) {
        if (err) *err = std::string("JPEG decode: ") + tj3GetErrorStr(decompressor);
      } else {
        ok = true;
      }
    }
  }

  tj3Destroy(decompressor);
  return ok;
}

bool encode_pixels_to_jpeg(const uint8_t *src, int w, int h, int pitch, jpeg_src_format fmt,
                           int quality, bool optimize, std::vector<uint8_t> &out_jpeg, std::string *err) {
  if (!src || w <= 0 || h <= 0) {
    if (err) *err = "nothing to encode";
    return false;
  }

  tjhandle compressor = tj3Init(TJINIT_COMPRESS);
  if (!compressor) {
    if (err) *err = "tj3Init(TJINIT_COMPRESS) failed";
    return false;
  }

  tj3Set(compressor, TJPARAM_QUALITY, quality);
  tj3Set(compressor, TJPARAM_SUBSAMP, TJSAMP_420);
  tj3Set(compressor, TJPARAM_OPTIMIZE, optimize ? 1 : 0);

  unsigned char *dest_buf = nullptr;
  size_t dest_size = 0;

  int status = tj3Compress8(
    compressor,
    src,
    w, pitch, h,
    fmt == JPEG_SRC_RGBA ? TJPF_RGBA : TJPF_RGB,
    &dest_buf, &dest_size
  );

  if (status == 0) {
    out_jpeg.assign(dest_buf, dest_buf + dest_size);
  } else if (err) {
    *err = std::string("JPEG encode: ") + tj3GetErrorStr(compressor);
  }

  tj3Free(dest_buf);
  tj3Destroy(compressor);
  return (status == 0);
}

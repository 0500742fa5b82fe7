#include "png_writer.h"
#include <zlib.h>
#include <algorithm>
#include <cstring>

static void png_write_u32(std::vector<uint8_t> &o, uint32_t v) {
  o.push_back((v>>24)&0xFF); o.push_back((v>>16)&0xFF); o.push_back((v>>8)&0xFF); o.push_back(v&0xFF);
}

static void png_write_chunk(std::vector<uint8_t> &o, const char type[4], const uint8_t *data, size_t len) {
  png_write_u32(o, (uint32_t)len);
  size_t start=o.size();
  o.insert(o.end(), type, type+4);
  if (len) o.insert(o.end(), data, data+len);
  uLong c = crc32(0L, Z_NULL, 0);
  c = crc32(c, o.data()+start, (uInt)(4 + len));
  png_write_u32(o, (uint32_t)c);
}

bool encode_png_rgba(const rgba_buf &img, int level, std::vector<uint8_t> &out, std::string *err) {
  if (!img.w || !img.h || img.px.size() != (size_t)img.w * img.h * 4) {
    if (err) *err = "PNG: empty or inconsistent image";
    return false;
  }

  // Raw scanlines: filter byte + RGBA quads
  const size_t row_bytes = img.stride();
  std::vector<uint8_t> raw;
  raw.resize((size_t)img.h * (1 + row_bytes));
  for (uint32_t y=0;y<img.h;y++) {
    uint8_t *dst = raw.data() + (size_t)y * (1 + row_bytes);
    dst[0] = 0; // filter type 0
    memcpy(dst + 1, img.row(y), row_bytes);
  }

  // Feed deflate in bounded chunks; uInt counters cap a single call at 4 GiB.
  std::vector<uint8_t> z;
  z_stream zs;
  memset(&zs, 0, sizeof(zs));
  if (deflateInit(&zs, level) != Z_OK) {
    if (err) *err = "PNG: deflateInit failed";
    return false;
  }
  z.resize(raw.size() / 4 + (1u << 16));

  const size_t kChunk = (size_t)1 << 30;
  size_t in_pos = 0;
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    if (zs.avail_in == 0 && in_pos < raw.size()) {
      size_t n = std::min(kChunk, raw.size() - in_pos);
      zs.next_in = raw.data() + in_pos;
      zs.avail_in = (uInt)n;
      in_pos += n;
    }
    const int flush = (in_pos == raw.size()) ? Z_FINISH : Z_NO_FLUSH;
    if (z.size() - (size_t)zs.total_out < ((size_t)1 << 16)) z.resize(z.size() + z.size() / 2);
    zs.next_out = z.data() + zs.total_out;
    zs.avail_out = (uInt)std::min(kChunk, z.size() - (size_t)zs.total_out);
    rc = deflate(&zs, flush);
    if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) break;
  }

  const size_t z_len = (size_t)zs.total_out;
  deflateEnd(&zs);
  if (rc != Z_STREAM_END) {
    if (err) *err = "PNG: deflate failed";
    return false;
  }
  z.resize(z_len);

  out.clear();
  out.reserve(z.size() + 64);
  const uint8_t sig[8]={137,80,78,71,13,10,26,10};
  out.insert(out.end(), sig, sig+8);

  // IHDR
  std::vector<uint8_t> ihdr;
  png_write_u32(ihdr, img.w); png_write_u32(ihdr, img.h);
  ihdr.push_back(8);  // bit depth
  ihdr.push_back(6);  // color type RGBA
  ihdr.push_back(0);  // compression
  ihdr.push_back(0);  // filter
  ihdr.push_back(0);  // interlace
  png_write_chunk(out, "IHDR", ihdr.data(), ihdr.size());

  // IDAT chunk length is a u32; split large streams.
  const size_t kMaxIdat = 0x7FFFFFFF;
  for (size_t pos = 0; pos < z.size(); pos += kMaxIdat) {
    size_t len = std::min(kMaxIdat, z.size() - pos);
    png_write_chunk(out, "IDAT", z.data() + pos, len);
  }
  png_write_chunk(out, "IEND", nullptr, 0);
  return true;
}

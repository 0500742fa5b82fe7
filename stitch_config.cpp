#include "stitch_config.h"
#include "tile_fetcher.h"
#include "tile_geometry.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <system_error>

using nlohmann::json;

static bool parse_u32(const char *s, uint32_t *out) {
  if (!s || !*s) return false;
  char *end = NULL;
  errno = 0;
  unsigned long v = strtoul(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0') return false;
  if (v > 0xFFFFFFFFul) return false;
  *out = (uint32_t)v;
  return true;
}

static std::string trim(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace((unsigned char)s[b])) b++;
  while (e > b && std::isspace((unsigned char)s[e-1])) e--;
  return s.substr(b, e - b);
}

bool tile_size_from_string(const std::string &s_in, uint32_t &out) {
  std::string s = trim(s_in);
  if (s == "auto") { out = 0; return true; }
  uint32_t v = 0;
  if (!parse_u32(s.c_str(), &v)) return false;
  out = v;
  return true;
}

std::string tile_size_to_string(uint32_t tile_size) {
  return tile_size ? std::to_string(tile_size) : std::string("auto");
}

static std::string default_output_dir() {
  const char *home = getenv("HOME");
  if (home && *home) {
    std::filesystem::path downloads = std::filesystem::path(home) / "Downloads";
    std::error_code ec;
    if (std::filesystem::is_directory(downloads, ec)) return downloads.string();
  }
  return ".";
}

void cfg_normalize(stitch_config &c) {
  c.service_url = trim(c.service_url);
  c.output_dir = trim(c.output_dir);
  c.file_name = trim(c.file_name);
  c.workers = std::clamp(c.workers, kMinWorkers, kMaxWorkers);
  if (c.output_dir.empty()) c.output_dir = default_output_dir();
}

bool cfg_validate(const stitch_config &c, std::string *err) {
  auto bad = [&](const std::string &m) { if (err) *err = m; return false; };
  if (c.service_url.empty()) return bad("Please enter a IIIF URL");
  if (c.output_dir.empty()) return bad("Please select a destination directory");
  if (c.file_name.empty()) return bad("Please enter a file name");
  if (c.file_name.find('/') != std::string::npos) return bad("File name must not contain '/'");
  if (c.tile_size != 0 && (c.tile_size < kMinTilePref || c.tile_size > kMaxTilePref))
    return bad("Tile size must be between " + std::to_string(kMinTilePref) + " and " +
               std::to_string(kMaxTilePref) + " pixels");
  if (c.workers < kMinWorkers || c.workers > kMaxWorkers)
    return bad("Concurrent downloads must be between " + std::to_string(kMinWorkers) + " and " +
               std::to_string(kMaxWorkers));
  return true;
}

std::string cfg_output_path(const stitch_config &c) {
  std::filesystem::path p = std::filesystem::path(c.output_dir) / (c.file_name + "." + output_kind_ext(c.kind));
  return p.string();
}

bool cfg_prepare_output_dir(const stitch_config &c, std::string *err) {
  std::error_code ec;
  std::filesystem::path dir(c.output_dir);
  if (std::filesystem::is_directory(dir, ec)) return true;
  if (std::filesystem::exists(dir, ec)) {
    if (err) *err = "Destination is not a directory: " + c.output_dir;
    return false;
  }
  if (!std::filesystem::create_directories(dir, ec) && ec) {
    if (err) *err = "Cannot create destination directory " + c.output_dir + ": " + ec.message();
    return false;
  }
  return true;
}

std::string config_to_json(const stitch_config &c) {
  json j;
  j["serviceUrl"] = c.service_url;
  j["outputDir"] = c.output_dir;
  j["fileName"] = c.file_name;
  j["format"] = output_kind_to_string(c.kind);
  if (c.tile_size) j["tileSize"] = c.tile_size;
  else j["tileSize"] = "auto";
  j["workers"] = c.workers;
  return j.dump(2);
}

bool config_from_json_text(const std::string &text, stitch_config &c) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return false;

  auto get_str = [&](const char *k, std::string &out) {
    if (j.contains(k) && j[k].is_string()) out = j[k].get<std::string>();
  };
  auto get_int = [&](const char *k, int &out) {
    if (j.contains(k) && j[k].is_number_integer()) out = j[k].get<int>();
  };

  get_str("serviceUrl", c.service_url);
  get_str("outputDir", c.output_dir);
  get_str("fileName", c.file_name);
  get_int("workers", c.workers);

  std::string format;
  get_str("format", format);
  if (!format.empty()) {
    output_kind k;
    if (!output_kind_from_string(format, k)) return false;
    c.kind = k;
  }

  if (j.contains("tileSize")) {
    const json &t = j["tileSize"];
    if (t.is_string()) {
      uint32_t v = 0;
      if (!tile_size_from_string(t.get<std::string>(), v)) return false;
      c.tile_size = v;
    } else if (t.is_number_unsigned()) {
      c.tile_size = (uint32_t)std::min<uint64_t>(t.get<uint64_t>(), 0xFFFFFFFFull);
    } else if (t.is_number_integer()) {
      return false;  // negative
    }
  }
  return true;
}

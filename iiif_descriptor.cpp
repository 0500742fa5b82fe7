#include "iiif_descriptor.h"
#include "http_fetch.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

using nlohmann::json;

static const char kInfoSuffix[] = "/info.json";

static bool ends_with(const std::string &s, const char *suffix, size_t n) {
  return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

std::string normalize_service_url(const std::string &url) {
  size_t b = 0, e = url.size();
  while (b < e && std::isspace((unsigned char)url[b])) b++;
  while (e > b && std::isspace((unsigned char)url[e-1])) e--;
  std::string u = url.substr(b, e - b);

  size_t q = u.find_first_of("?#");
  if (q != std::string::npos) u.erase(q);

  // Repeat until stable so that normalize(normalize(u)) == normalize(u)
  // also for inputs like ".../info.json/".
  const size_t n = sizeof(kInfoSuffix) - 1;
  for (;;) {
    size_t before = u.size();
    while (!u.empty() && u.back() == '/') u.pop_back();
    if (ends_with(u, kInfoSuffix, n)) u.erase(u.size() - n);
    if (u.size() == before) break;
  }
  return u;
}

// Accepts JSON integers, floats >= 1 (truncated) and decimal strings.
static bool json_positive(const json &v, uint64_t limit, uint64_t &out) {
  uint64_t x = 0;
  if (v.is_number_unsigned()) {
    x = v.get<uint64_t>();
  } else if (v.is_number_integer()) {
    int64_t s = v.get<int64_t>();
    if (s <= 0) return false;
    x = (uint64_t)s;
  } else if (v.is_number_float()) {
    double d = v.get<double>();
    if (!std::isfinite(d) || d < 1.0 || d > (double)limit) return false;
    x = (uint64_t)std::floor(d);
  } else if (v.is_string()) {
    const std::string s = v.get<std::string>();
    size_t i = 0;
    while (i < s.size() && std::isspace((unsigned char)s[i])) i++;
    size_t digits_begin = i;
    while (i < s.size() && std::isdigit((unsigned char)s[i])) i++;
    size_t digits_end = i;
    while (i < s.size() && std::isspace((unsigned char)s[i])) i++;
    if (digits_end == digits_begin || i != s.size() || digits_end - digits_begin > 19) return false;
    x = std::strtoull(s.c_str() + digits_begin, nullptr, 10);
  } else {
    return false;
  }
  if (x == 0 || x > limit) return false;
  out = x;
  return true;
}

static uint32_t json_u32_or_zero(const json &obj, const char *key) {
  if (!obj.is_object() || !obj.contains(key)) return 0;
  uint64_t v = 0;
  if (!json_positive(obj[key], std::numeric_limits<uint32_t>::max(), v)) return 0;
  return (uint32_t)v;
}

static tile_spec parse_tile_spec(const json &t) {
  tile_spec ts;
  if (!t.is_object()) return ts;
  ts.width = json_u32_or_zero(t, "width");
  if (!ts.width) ts.width = json_u32_or_zero(t, "tileWidth");
  ts.height = json_u32_or_zero(t, "height");
  if (!ts.height) ts.height = json_u32_or_zero(t, "tileHeight");
  ts.overlap = json_u32_or_zero(t, "overlap");
  if (t.contains("scaleFactors") && t["scaleFactors"].is_array()) {
    for (const auto &sf : t["scaleFactors"]) {
      uint64_t v = 0;
      if (json_positive(sf, std::numeric_limits<uint32_t>::max(), v)) ts.scale_factors.push_back((uint32_t)v);
    }
  }
  return ts;
}

// Size limits live at the top level in v3 and inside the "profile" array
// objects in v2. The top level wins when both are present.
static void parse_limits(const json &j, service_descriptor &d) {
  auto take = [&](const json &obj) {
    if (!obj.is_object()) return;
    if (!d.max_area && obj.contains("maxArea")) {
      uint64_t v = 0;
      if (json_positive(obj["maxArea"], std::numeric_limits<uint64_t>::max(), v)) d.max_area = v;
    }
    if (!d.max_width) d.max_width = json_u32_or_zero(obj, "maxWidth");
    if (!d.max_height) d.max_height = json_u32_or_zero(obj, "maxHeight");
  };
  take(j);
  if (j.contains("profile") && j["profile"].is_array()) {
    for (const auto &p : j["profile"]) take(p);
  }
}

bool parse_descriptor_json(const std::string &text, service_descriptor &out, stitch_error *err) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) return fail(err, error_kind::descriptor_fetch, "info.json is not valid JSON");
  if (!j.is_object()) return fail(err, error_kind::descriptor_format, "info.json is not a JSON object");

  service_descriptor d;
  if (j.contains("@id") && j["@id"].is_string()) d.id = j["@id"].get<std::string>();
  else if (j.contains("id") && j["id"].is_string()) d.id = j["id"].get<std::string>();

  for (const char *key : {"width", "height"}) {
    if (!j.contains(key)) return fail(err, error_kind::descriptor_format, std::string("info.json has no '") + key + "'");
    uint64_t v = 0;
    if (!json_positive(j[key], std::numeric_limits<uint32_t>::max(), v))
      return fail(err, error_kind::descriptor_format, std::string("info.json '") + key + "' is not a positive integer: " + j[key].dump());
    (key[0] == 'w' ? d.width : d.height) = (uint32_t)v;
  }

  if (j.contains("tiles") && j["tiles"].is_array()) {
    for (const auto &t : j["tiles"]) d.tiles.push_back(parse_tile_spec(t));
  }
  parse_limits(j, d);

  out = std::move(d);
  return true;
}

bool fetch_descriptor(const std::string &base, service_descriptor &out, stitch_error *err) {
  url_parts parts;
  if (!split_url(base, parts)) return fail(err, error_kind::descriptor_fetch, "not an http(s) URL: " + base);

  http_session session(parts.origin, kDescriptorTimeoutSec);
  std::string body, why;
  if (!session.get(base + kInfoSuffix, body, &why)) return fail(err, error_kind::descriptor_fetch, why);
  return parse_descriptor_json(body, out, err);
}

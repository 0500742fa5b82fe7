#include "http_fetch.h"
#include <httplib.h>
#include <algorithm>
#include <cctype>

bool split_url(const std::string &url, url_parts &out) {
  size_t sep = url.find("://");
  if (sep == std::string::npos || sep == 0) return false;

  std::string scheme = url.substr(0, sep);
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (scheme != "http" && scheme != "https") return false;

  size_t host_begin = sep + 3;
  size_t host_end = url.find('/', host_begin);
  if (host_end == std::string::npos) host_end = url.size();
  if (host_end == host_begin) return false;

  out.origin = scheme + url.substr(sep, host_end - sep);
  out.path = url.substr(host_end);
  return true;
}

std::vector<std::pair<std::string, std::string>> browser_headers() {
  return {
    {"User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36"},
    {"Accept", "image/*,*/*;q=0.8"},
    {"Accept-Language", "en-US,en;q=0.9"},
  };
}

struct http_session::Impl {
  explicit Impl(const std::string &origin) : cli(origin) {}
  httplib::Client cli;
};

http_session::http_session(const std::string &origin, int timeout_sec)
  : p(new Impl(origin)), origin_(origin) {
  httplib::Headers hdrs;
  for (const auto &h : browser_headers()) hdrs.emplace(h.first, h.second);
  p->cli.set_default_headers(hdrs);
  p->cli.set_connection_timeout(timeout_sec, 0);
  p->cli.set_read_timeout(timeout_sec, 0);
  p->cli.set_write_timeout(timeout_sec, 0);
  p->cli.set_keep_alive(true);
  p->cli.set_follow_location(true);
  // Region paths ("x,y,w,h") and identifiers ("a%2Fb") are already in URL form.
  p->cli.set_url_encode(false);
}

http_session::~http_session() = default;

bool http_session::get(const std::string &url, std::string &body, std::string *err, std::string *content_type) {
  if (!p->cli.is_valid()) {
    if (err) *err = "cannot create HTTP client for " + origin_ + " (unsupported scheme or built without TLS)";
    return false;
  }

  url_parts parts;
  if (!split_url(url, parts) || parts.origin != origin_) {
    if (err) *err = "URL not on session origin " + origin_ + ": " + url;
    return false;
  }
  if (parts.path.empty()) parts.path = "/";

  auto res = p->cli.Get(parts.path);
  if (!res) {
    if (err) *err = "GET " + url + " failed: " + httplib::to_string(res.error());
    return false;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "GET " + url + " returned HTTP " + std::to_string(res->status);
    return false;
  }
  if (content_type) *content_type = res->get_header_value("Content-Type");
  body = std::move(res->body);
  return true;
}

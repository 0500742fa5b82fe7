#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Timeouts in seconds.
static constexpr int kDescriptorTimeoutSec = 30;
static constexpr int kTileTimeoutSec = 60;

struct url_parts {
  std::string origin;  // "https://host[:port]"
  std::string path;    // "/iiif/2/abc" (may be empty)
};

// Splits an absolute http(s) URL into origin and path. Returns false for
// anything without a "scheme://host" prefix.
bool split_url(const std::string &url, url_parts &out);

// Browser-like request headers sent with every request.
std::vector<std::pair<std::string, std::string>> browser_headers();

// One keep-alive HTTP client bound to a single origin. Not safe for
// concurrent use; the tile fetcher gives each worker its own session.
class http_session {
public:
  http_session(const std::string &origin, int timeout_sec);
  ~http_session();

  http_session(const http_session&) = delete;
  http_session& operator=(const http_session&) = delete;

  const std::string &origin() const { return origin_; }

  // GET an absolute URL on this session's origin. Fails on network error,
  // timeout, non-2xx status or a URL on a different origin. content_type,
  // when given, receives the response Content-Type (empty if absent).
  bool get(const std::string &url, std::string &body, std::string *err, std::string *content_type = nullptr);

private:
  struct Impl;
  std::unique_ptr<Impl> p;
  std::string origin_;
};

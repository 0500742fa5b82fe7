#pragma once
#include <string>

// Error categories of a stitch run. Everything except tile_fetch is fatal
// where it occurs; tile_fetch is fatal only before the first tile succeeded.
enum class error_kind {
  none = 0,
  config,
  descriptor_fetch,
  descriptor_format,
  tile_fetch,
  allocation,
  encode,
};

struct stitch_error {
  error_kind kind = error_kind::none;
  std::string message;
};

static inline const char *error_kind_name(error_kind k) {
  switch (k) {
    case error_kind::none: return "none";
    case error_kind::config: return "config";
    case error_kind::descriptor_fetch: return "descriptor fetch";
    case error_kind::descriptor_format: return "descriptor format";
    case error_kind::tile_fetch: return "tile fetch";
    case error_kind::allocation: return "allocation";
    case error_kind::encode: return "encode";
  }
  return "unknown";
}

static inline bool fail(stitch_error *err, error_kind k, const std::string &msg) {
  if (err) { err->kind = k; err->message = msg; }
  return false;
}

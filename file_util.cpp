#include "file_util.h"
#include <errno.h>
#include <stdio.h>
#include <string.h>

static std::string os_reason(const char *what, const std::string &path, int e) {
  return std::string(what) + " " + path + ": " + strerror(e);
}

bool read_text_file(const std::string &path, std::string &out, bool *missing, std::string *err) {
  if (missing) *missing = false;
  FILE *f = fopen(path.c_str(), "rb");
  if (!f) {
    const int e = errno;
    if (e == ENOENT && missing) { *missing = true; return false; }
    if (err) *err = os_reason("open", path, e);
    return false;
  }

  std::string data;
  char buf[16384];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), f)) > 0) data.append(buf, n);
  const bool bad = ferror(f) != 0;
  const int e = errno;
  fclose(f);
  if (bad) {
    if (err) *err = os_reason("read", path, e);
    return false;
  }
  out.swap(data);
  return true;
}

bool write_file_atomic(const std::string &path, const std::string &data, std::string *err) {
  const std::string tmp = path + ".tmp";
  FILE *f = fopen(tmp.c_str(), "wb");
  if (!f) {
    if (err) *err = os_reason("create", tmp, errno);
    return false;
  }

  bool ok = fwrite(data.data(), 1, data.size(), f) == data.size();
  int e = ok ? 0 : errno;
  if (ok && fflush(f) != 0) { ok = false; e = errno; }
  if (fclose(f) != 0 && ok) { ok = false; e = errno; }
  if (!ok) {
    if (err) *err = os_reason("write", tmp, e ? e : EIO);
    remove(tmp.c_str());
    return false;
  }

  if (rename(tmp.c_str(), path.c_str()) != 0) {
    if (err) *err = os_reason("rename to", path, errno);
    remove(tmp.c_str());
    return false;
  }
  return true;
}

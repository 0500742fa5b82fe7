#pragma once
#include <string>

// Reads a whole file. A missing file is reported separately via *missing so
// callers can fall back to defaults; every other failure fills *err.
bool read_text_file(const std::string &path, std::string &out, bool *missing, std::string *err);

// Writes data to path.tmp, then renames it over path. On failure the tmp file
// is removed and *err names the step and the OS reason.
bool write_file_atomic(const std::string &path, const std::string &data, std::string *err);

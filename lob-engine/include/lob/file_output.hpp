#pragma once
#include <string>

namespace lob {

// Write to "<path>.tmp" then rename over path (best-effort; falls back to a
// direct write when rename fails, e.g. across filesystems).
// Creates missing parent directories. Returns false if nothing was written.
bool write_file_atomic_like(const std::string& path, const std::string& data);

} // namespace lob

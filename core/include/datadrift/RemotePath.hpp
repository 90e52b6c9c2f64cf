// Helpers for '/'-separated remote paths.
#pragma once
#include <string>

namespace datadrift {
namespace remotepath {

// Collapse duplicate separators and resolve "." / ".." segments.
// Absolute input stays absolute; ".." never climbs above "/".
std::string normalize(const std::string& path);

// Resolve `path` against `base` (absolute `path` ignores `base`), then normalize.
std::string resolve(const std::string& base, const std::string& path);

// Append one name to a directory path.
std::string join(const std::string& dir, const std::string& name);

// Parent directory ("/" for "/" and for top-level entries).
std::string parent(const std::string& path);

// Last segment ("" for "/").
std::string baseName(const std::string& path);

inline bool isAbsolute(const std::string& path) { return !path.empty() && path[0] == '/'; }

} // namespace remotepath
} // namespace datadrift

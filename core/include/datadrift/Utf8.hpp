#pragma once
#include <cstddef>
#include <string>

namespace datadrift {

// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF.
bool isValidUtf8(const char* data, std::size_t len);

inline bool isValidUtf8(const std::string& s) { return isValidUtf8(s.data(), s.size()); }

} // namespace datadrift

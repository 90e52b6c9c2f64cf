#include "datadrift/Utf8.hpp"

namespace datadrift {

bool isValidUtf8(const char* data, std::size_t len) {
    const unsigned char* p = reinterpret_cast<const unsigned char*>(data);
    std::size_t i = 0;
    while (i < len) {
        const unsigned char c = p[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t need = 0;
        unsigned char lo = 0x80, hi = 0xBF; // allowed range of the first continuation byte
        if (c >= 0xC2 && c <= 0xDF) {
            need = 1;
        } else if (c == 0xE0) {
            need = 2; lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            need = 2;
        } else if (c == 0xED) {
            need = 2; hi = 0x9F; // no UTF-16 surrogates
        } else if (c == 0xF0) {
            need = 3; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            need = 3;
        } else if (c == 0xF4) {
            need = 3; hi = 0x8F;
        } else {
            return false;
        }
        if (i + need >= len) return false; // truncated sequence
        if (p[i + 1] < lo || p[i + 1] > hi) return false;
        for (std::size_t k = 2; k <= need; ++k) {
            if (p[i + k] < 0x80 || p[i + k] > 0xBF) return false;
        }
        i += need + 1;
    }
    return true;
}

} // namespace datadrift

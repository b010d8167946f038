#include "util/Utf8.hpp"

namespace sift::util {

int decode_utf8(const char* s, size_t len, uint32_t* cp) {
    if (len == 0) return 0;
    auto c = (uint8_t)s[0];
    if (c < 0x80)        { *cp = c; return 1; }
    auto cont = [&](size_t i) { return ((uint8_t)s[i] & 0xC0) == 0x80; };
    if ((c & 0xE0) == 0xC0 && len >= 2 && cont(1)) {
        *cp = ((uint32_t)(c & 0x1F) << 6) | (s[1] & 0x3F);
        return (*cp >= 0x80) ? 2 : 0;
    }
    if ((c & 0xF0) == 0xE0 && len >= 3 && cont(1) && cont(2)) {
        *cp = ((uint32_t)(c & 0x0F) << 12) | ((uint32_t)(s[1] & 0x3F) << 6) | (s[2] & 0x3F);
        // Overlong forms and UTF-16 surrogates are rejected
        return (*cp >= 0x800 && (*cp < 0xD800 || *cp > 0xDFFF)) ? 3 : 0;
    }
    if ((c & 0xF8) == 0xF0 && len >= 4 && cont(1) && cont(2) && cont(3)) {
        *cp = ((uint32_t)(c & 0x07) << 18) | ((uint32_t)(s[1] & 0x3F) << 12)
            | ((uint32_t)(s[2] & 0x3F) << 6) | (s[3] & 0x3F);
        return (*cp >= 0x10000 && *cp <= 0x10FFFF) ? 4 : 0;
    }
    return 0;
}

int encode_utf8(uint32_t cp, uint8_t out[4]) {
    if (cp < 0x80)    { out[0] = (uint8_t)cp; return 1; }
    if (cp < 0x800)   { out[0] = 0xC0 | (cp >> 6); out[1] = 0x80 | (cp & 0x3F); return 2; }
    if (cp < 0x10000) { out[0] = 0xE0 | (cp >> 12); out[1] = 0x80 | ((cp >> 6) & 0x3F);
                        out[2] = 0x80 | (cp & 0x3F); return 3; }
    out[0] = 0xF0 | (cp >> 18); out[1] = 0x80 | ((cp >> 12) & 0x3F);
    out[2] = 0x80 | ((cp >> 6) & 0x3F); out[3] = 0x80 | (cp & 0x3F);
    return 4;
}

std::u32string to_u32(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        uint32_t cp;
        int n = decode_utf8(s.data() + i, s.size() - i, &cp);
        if (n == 0) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
        } else {
            out.push_back(static_cast<char32_t>(cp));
            i += static_cast<size_t>(n);
        }
    }
    return out;
}

std::string to_utf8(std::u32string_view s) {
    std::string out;
    out.reserve(s.size());
    uint8_t buf[4];
    for (char32_t c : s) {
        int n = encode_utf8(static_cast<uint32_t>(c), buf);
        out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
    }
    return out;
}

} // namespace sift::util

#include "utf8.h"

#include <cstdint>

namespace forge {
namespace utf8 {

std::u32string decode(const std::string& bytes, std::vector<std::size_t>* invalid) {
    std::u32string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    const std::size_t n = bytes.size();
    auto reject = [&]() {
        if (invalid) invalid->push_back(out.size());
        out.push_back(kReplacement);
        ++i;
    };
    while (i < n) {
        auto b0 = static_cast<std::uint8_t>(bytes[i]);
        if (b0 < 0x80) { out.push_back(b0); ++i; continue; }
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if ((b0 & 0xE0) == 0xC0) { extra = 1; cp = b0 & 0x1F; }
        else if ((b0 & 0xF0) == 0xE0) { extra = 2; cp = b0 & 0x0F; }
        else if ((b0 & 0xF8) == 0xF0) { extra = 3; cp = b0 & 0x07; }
        else { reject(); continue; }
        if (i + extra >= n) { reject(); continue; }
        bool ok = true;
        for (std::size_t k = 1; k <= extra; ++k) {
            auto b = static_cast<std::uint8_t>(bytes[i + k]);
            if ((b & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (b & 0x3F);
        }
        // Overlong encodings are rejected along with surrogates
        static const std::uint32_t minimum[4] = { 0, 0x80, 0x800, 0x10000 };
        if (!ok || cp < minimum[extra] || !isScalar(cp)) { reject(); continue; }
        out.push_back(static_cast<char32_t>(cp));
        i += extra + 1;
    }
    return out;
}

std::string encode(char32_t c) {
    std::string out;
    auto cp = static_cast<std::uint32_t>(c);
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

std::string encode(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t c : text) out += encode(c);
    return out;
}

} // namespace utf8
} // namespace forge

#ifndef FORGE_UTF8_H
#define FORGE_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace forge {
namespace utf8 {

constexpr char32_t kReplacement = 0xFFFD;

// Decode UTF-8 bytes into unicode scalars. Malformed sequences decode to
// U+FFFD; the scalar index of each one is appended to `invalid`.
std::u32string decode(const std::string& bytes, std::vector<std::size_t>* invalid = nullptr);

std::string encode(const std::u32string& text);
std::string encode(char32_t c);

inline bool isScalar(std::uint32_t cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

} // namespace utf8
} // namespace forge

#endif // FORGE_UTF8_H

#ifndef TOOLGATE_UTF8_SANITIZE_HPP
#define TOOLGATE_UTF8_SANITIZE_HPP

#include <cstddef>
#include <string>

namespace utf8_sanitize {

// Decodes raw bytes as UTF-8, replacing every ill-formed sequence with U+FFFD.
// Each maximal ill-formed subpart becomes exactly one replacement character
// (overlong forms, surrogates and code points above U+10FFFF are ill-formed),
// so command output with stray binary bytes still yields a valid JSON string.
std::string decode_lossy(const char *bytes, size_t length);

// Captured child output arrives as a byte buffer in a std::string.
std::string decode_lossy(const std::string &bytes);

} // namespace utf8_sanitize

#endif // TOOLGATE_UTF8_SANITIZE_HPP

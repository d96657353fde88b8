#include "utils/utf8_sanitize.hpp"

namespace utf8_sanitize {

namespace {

const char kReplacementUtf8[] = "\xEF\xBF\xBD"; // U+FFFD in UTF-8
constexpr size_t kReplacementLength = sizeof(kReplacementUtf8) - 1;

// Total sequence length announced by a lead byte (1-4), or 0 if the byte can never start a sequence.
size_t sequence_length(unsigned char lead) {
    if (lead < 0x80u) {
        return 1;
    }
    if (lead >= 0xC2u && lead <= 0xDFu) {
        return 2;
    }
    if (lead >= 0xE0u && lead <= 0xEFu) {
        return 3;
    }
    if (lead >= 0xF0u && lead <= 0xF4u) {
        return 4;
    }
    return 0;
}

// The second byte range depends on the lead byte; this is what rules out
// overlong encodings, UTF-16 surrogates and values past U+10FFFF.
bool second_byte_valid(unsigned char lead, unsigned char byte) {
    switch (lead) {
    case 0xE0u:
        return byte >= 0xA0u && byte <= 0xBFu;
    case 0xEDu:
        return byte >= 0x80u && byte <= 0x9Fu;
    case 0xF0u:
        return byte >= 0x90u && byte <= 0xBFu;
    case 0xF4u:
        return byte >= 0x80u && byte <= 0x8Fu;
    default:
        return byte >= 0x80u && byte <= 0xBFu;
    }
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

} // namespace

std::string decode_lossy(const char *bytes, size_t length) {
    std::string result;
    result.reserve(length);

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(bytes);
    const unsigned char *end = pointer + length;

    while (pointer < end) {
        unsigned char lead = *pointer;
        size_t expected = sequence_length(lead);

        if (expected == 1) {
            result.push_back(static_cast<char>(lead));
            ++pointer;
            continue;
        }
        if (expected == 0) {
            result.append(kReplacementUtf8, kReplacementLength);
            ++pointer;
            continue;
        }

        // Count how many bytes of the announced sequence are well formed.
        // A truncated or broken sequence is replaced as one unit up to the
        // first offending byte, which is then examined again on its own.
        size_t accepted = 1;
        if (pointer + 1 < end && second_byte_valid(lead, pointer[1])) {
            accepted = 2;
            while (accepted < expected && pointer + accepted < end && is_continuation(pointer[accepted])) {
                ++accepted;
            }
        }

        if (accepted == expected) {
            result.append(reinterpret_cast<const char *>(pointer), expected);
        } else {
            result.append(kReplacementUtf8, kReplacementLength);
        }
        pointer += accepted;
    }

    return result;
}

std::string decode_lossy(const std::string &bytes) {
    return decode_lossy(bytes.data(), bytes.size());
}

} // namespace utf8_sanitize

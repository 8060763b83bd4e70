#include "utils/utf8_sanitize.hpp"

#include <cstddef>

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at bytes[offset], or 0.
// Second-byte ranges follow the Unicode table of well-formed byte sequences.
std::size_t sequence_length(const unsigned char *bytes, std::size_t offset, std::size_t size) {
    unsigned char lead = bytes[offset];
    if (lead < 0x80u) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead == 0xE0u) {
        length = 3;
        second_low = 0xA0u;
    } else if (lead == 0xEDu) {
        length = 3;
        second_high = 0x9Fu;
    } else if (lead >= 0xE1u && lead <= 0xEFu) {
        length = 3;
    } else if (lead == 0xF0u) {
        length = 4;
        second_low = 0x90u;
    } else if (lead == 0xF4u) {
        length = 4;
        second_high = 0x8Fu;
    } else if (lead >= 0xF1u && lead <= 0xF3u) {
        length = 4;
    } else {
        return 0;
    }

    if (offset + length > size) {
        return 0;
    }

    unsigned char second = bytes[offset + 1];
    if (second < second_low || second > second_high) {
        return 0;
    }
    for (std::size_t index = 2; index < length; ++index) {
        if ((bytes[offset + index] & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

std::string decode_lossy(const std::string &bytes) {
    std::string text;
    text.reserve(bytes.size());

    const unsigned char *data = reinterpret_cast<const unsigned char *>(bytes.data());
    std::size_t offset = 0;
    while (offset < bytes.size()) {
        std::size_t length = sequence_length(data, offset, bytes.size());
        if (length == 0) {
            text += kReplacement;
            ++offset;
            continue;
        }
        text.append(bytes, offset, length);
        offset += length;
    }
    return text;
}

bool is_valid(const std::string &text) {
    const unsigned char *data = reinterpret_cast<const unsigned char *>(text.data());
    std::size_t offset = 0;
    while (offset < text.size()) {
        std::size_t length = sequence_length(data, offset, text.size());
        if (length == 0) {
            return false;
        }
        offset += length;
    }
    return true;
}

} // namespace utf8_sanitize

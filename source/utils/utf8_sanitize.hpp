#ifndef CMCPS_UTF8_SANITIZE_HPP
#define CMCPS_UTF8_SANITIZE_HPP

#include <string>

namespace utf8_sanitize {

// Decodes raw subprocess bytes permissively: every byte that does not start a
// well-formed UTF-8 sequence (including overlong forms, surrogates and code
// points above U+10FFFF) is replaced with U+FFFD. Never fails.
std::string decode_lossy(const std::string &bytes);

// True if the text is already well-formed UTF-8.
bool is_valid(const std::string &text);

} // namespace utf8_sanitize

#endif // CMCPS_UTF8_SANITIZE_HPP

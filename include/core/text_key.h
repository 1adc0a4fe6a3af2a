#ifndef SUBDUB_TEXT_KEY_H
#define SUBDUB_TEXT_KEY_H

#include <cstdint>
#include <string>
#include <string_view>

namespace subdub {

// Line breaks become spaces, then leading/trailing whitespace is trimmed.
std::string normalizeCueText(std::string_view text);

// True when the text has nothing but whitespace.
bool isBlankText(std::string_view text);

// FNV-1a 64-bit hash; stable across runs so it can address files on disk.
std::uint64_t fnv1a64(std::string_view data);

// 16-digit lowercase hex of fnv1a64(normalizeCueText(text)).
std::string textHash(std::string_view text);

}  // namespace subdub

#endif  // SUBDUB_TEXT_KEY_H

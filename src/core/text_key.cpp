#include "core/text_key.h"

#include <cctype>
#include <cstdio>

namespace subdub {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string normalizeCueText(std::string_view text) {
    std::string flat;
    flat.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            // CRLF collapses into the space emitted for '\n'.
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                continue;
            }
            c = ' ';
        } else if (c == '\n') {
            c = ' ';
        }
        flat.push_back(c);
    }

    std::size_t begin = 0;
    while (begin < flat.size() && isSpace(flat[begin])) {
        ++begin;
    }
    std::size_t end = flat.size();
    while (end > begin && isSpace(flat[end - 1])) {
        --end;
    }
    return flat.substr(begin, end - begin);
}

bool isBlankText(std::string_view text) {
    for (char c : text) {
        if (!isSpace(c)) {
            return false;
        }
    }
    return true;
}

std::uint64_t fnv1a64(std::string_view data) {
    std::uint64_t hash = 14695981039346656037ull;
    for (char c : data) {
        hash ^= static_cast<std::uint8_t>(c);
        hash *= 1099511628211ull;
    }
    return hash;
}

std::string textHash(std::string_view text) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(fnv1a64(normalizeCueText(text))));
    return std::string(buf);
}

}  // namespace subdub

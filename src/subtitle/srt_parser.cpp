#include "subtitle/srt_parser.h"

#include "logging/logger.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace subdub {
namespace subtitle {

namespace {

std::string trimRight(const std::string& s) {
    std::size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(0, end);
}

std::string trim(const std::string& s) {
    std::string right = trimRight(s);
    std::size_t begin = 0;
    while (begin < right.size() && std::isspace(static_cast<unsigned char>(right[begin]))) {
        ++begin;
    }
    return right.substr(begin);
}

bool isIndexLine(const std::string& line) {
    if (line.empty()) {
        return false;
    }
    for (char c : line) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

const std::regex& timingRegex() {
    static const std::regex kTiming(
        R"(^\s*(\d{1,2}:\d{2}:\d{2}[,.]\d{1,3})\s*-->\s*(\d{1,2}:\d{2}:\d{2}[,.]\d{1,3}).*$)");
    return kTiming;
}

}  // namespace

bool parseSrtTimestamp(const std::string& text, std::chrono::milliseconds& out) {
    static const std::regex kStamp(R"(^\s*(\d{1,2}):(\d{2}):(\d{2})[,.](\d{1,3})\s*$)");
    std::smatch m;
    if (!std::regex_match(text, m, kStamp)) {
        return false;
    }
    long long hours = std::stoll(m[1].str());
    long long minutes = std::stoll(m[2].str());
    long long seconds = std::stoll(m[3].str());
    std::string fraction = m[4].str();
    // "5" and "50" after the separator mean 500 ms.
    while (fraction.size() < 3) {
        fraction.push_back('0');
    }
    long long millis = std::stoll(fraction);
    if (minutes >= 60 || seconds >= 60) {
        return false;
    }
    out = std::chrono::milliseconds(((hours * 60 + minutes) * 60 + seconds) * 1000 + millis);
    return true;
}

bool isValidUtf8(const std::string& data) {
    std::size_t i = 0;
    while (i < data.size()) {
        auto c = static_cast<unsigned char>(data[i]);
        std::size_t extra = 0;
        if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= data.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(data[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

std::string latin1ToUtf8(const std::string& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (char ch : data) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

bool parseSrtString(const std::string& rawContent, std::vector<Cue>& cues) {
    cues.clear();

    std::string content = rawContent;
    if (content.size() >= 3 && static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        content.erase(0, 3);
    }
    if (!isValidUtf8(content)) {
        LOG_WARN("Subtitle text is not valid UTF-8, decoding as Latin-1");
        content = latin1ToUtf8(content);
    }

    std::vector<std::string> lines;
    {
        std::istringstream stream(content);
        std::string line;
        while (std::getline(stream, line)) {
            lines.push_back(trimRight(line));
        }
    }

    std::size_t i = 0;
    int skipped = 0;
    while (i < lines.size()) {
        while (i < lines.size() && lines[i].empty()) {
            ++i;
        }
        if (i >= lines.size()) {
            break;
        }

        Cue cue;
        cue.index = static_cast<int>(cues.size()) + 1;
        std::string header = trim(lines[i]);
        if (isIndexLine(header)) {
            errno = 0;
            char* end = nullptr;
            long index = std::strtol(header.c_str(), &end, 10);
            if (errno == ERANGE || index > std::numeric_limits<int>::max()) {
                LOG_WARN("Subtitle index '{}' out of range near line {}, numbering by position",
                         header, i + 1);
            } else {
                cue.index = static_cast<int>(index);
            }
            ++i;
        }

        std::smatch m;
        if (i >= lines.size() || !std::regex_match(lines[i], m, timingRegex()) ||
            !parseSrtTimestamp(m[1].str(), cue.start) || !parseSrtTimestamp(m[2].str(), cue.end)) {
            LOG_WARN("Skipping malformed subtitle block near line {}", i + 1);
            ++skipped;
            while (i < lines.size() && !lines[i].empty()) {
                ++i;
            }
            continue;
        }
        ++i;

        if (cue.end <= cue.start) {
            LOG_WARN("Skipping zero-length subtitle block {} near line {}", cue.index, i);
            ++skipped;
            while (i < lines.size() && !lines[i].empty()) {
                ++i;
            }
            continue;
        }

        std::string text;
        while (i < lines.size() && !lines[i].empty()) {
            if (!text.empty()) {
                text.push_back('\n');
            }
            text += lines[i];
            ++i;
        }
        cue.text = std::move(text);
        cues.push_back(std::move(cue));
    }

    if (skipped > 0) {
        LOG_WARN("Skipped {} malformed subtitle block(s)", skipped);
    }
    return !cues.empty();
}

bool parseSrtFile(const std::string& filePath, std::vector<Cue>& cues) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open subtitle file: {}", filePath);
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    if (!parseSrtString(buffer.str(), cues)) {
        LOG_ERROR("Subtitle file is empty or contains no valid cue: {}", filePath);
        return false;
    }
    LOG_INFO("Loaded {} subtitle entries from {}", cues.size(), filePath);
    return true;
}

}  // namespace subtitle
}  // namespace subdub

#ifndef SUBDUB_SRT_PARSER_H
#define SUBDUB_SRT_PARSER_H

#include "subtitle/cue_timeline.h"

#include <chrono>
#include <string>
#include <vector>

namespace subdub {
namespace subtitle {

// Parse a SubRip file. Malformed blocks are skipped with a warning.
// Returns false if the file cannot be read or yields no cue.
bool parseSrtFile(const std::string& filePath, std::vector<Cue>& cues);

// Parse SubRip content from memory.
bool parseSrtString(const std::string& content, std::vector<Cue>& cues);

// Parse "HH:MM:SS,mmm" (',' or '.' before the milliseconds).
bool parseSrtTimestamp(const std::string& text, std::chrono::milliseconds& out);

// True if `data` is well-formed UTF-8.
bool isValidUtf8(const std::string& data);

// Reinterpret Latin-1 bytes as UTF-8.
std::string latin1ToUtf8(const std::string& data);

}  // namespace subtitle
}  // namespace subdub

#endif  // SUBDUB_SRT_PARSER_H

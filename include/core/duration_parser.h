#ifndef SUBDUB_DURATION_PARSER_H
#define SUBDUB_DURATION_PARSER_H

#include <optional>
#include <string>

namespace subdub {

// Parse "HH:MM:SS[.fff]", "MM:SS[.fff]" or plain seconds ("93.5").
// Returns std::nullopt for malformed or negative values.
std::optional<double> parseDurationString(const std::string& text);

// "HH:MM:SS.mmm" for log output.
std::string formatDuration(double seconds);

}  // namespace subdub

#endif  // SUBDUB_DURATION_PARSER_H

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace issueflow::util {

std::string Trim(std::string_view value);

std::string Join(const std::vector<std::string>& parts, std::string_view separator);

// Appends line to a notes blob, one entry per line.
std::string AppendNotesLine(std::string_view notes, std::string_view line);

// Whole-string decimal parse of a command-line value. Throws
// util::ValidationError naming the flag on anything else.
int ParseInt(std::string_view value, std::string_view name);

// As ParseInt, but a count or bound: negative values and values above max
// are rejected instead of wrapping.
std::uint64_t ParseUnsigned(std::string_view value, std::string_view name, std::uint64_t max = std::numeric_limits<std::uint64_t>::max());

// Credential prefixes (API keys, tokens, PEM blocks) found anywhere in text,
// matched case-insensitively, in a fixed order.
std::vector<std::string> FindSecretMarkers(std::string_view text);

} // namespace issueflow::util

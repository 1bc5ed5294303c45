#include "internal/util/strings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <system_error>

#include "internal/util/errors.hpp"

namespace issueflow::util {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

constexpr std::array<std::string_view, 6> kSecretMarkers = {"sk-", "ghp_", "gho_", "AKIA", "eyJ", "-----BEGIN"};

ValidationError InvalidFlag(std::string_view name, std::string_view value, std::string_view why) {
  std::string msg = "invalid ";
  msg.append(name).append(" '").append(value).append("'");
  if (!why.empty()) msg.append(": ").append(why);
  return ValidationError(msg);
}

template <typename T>
T ParseWhole(std::string_view value, std::string_view name) {
  T          parsed{};
  const auto end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
  if (ec == std::errc::result_out_of_range) throw InvalidFlag(name, value, "out of range");
  if (value.empty() || ec != std::errc() || ptr != end) throw InvalidFlag(name, value, "not a number");
  return parsed;
}

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::string Trim(std::string_view value) {
  const auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(kWhitespace);
  return std::string(value.substr(first, last - first + 1));
}

std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += separator;
    out += parts[i];
  }
  return out;
}

std::string AppendNotesLine(std::string_view notes, std::string_view line) {
  std::string out(notes);
  while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) {
    out.pop_back();
  }
  if (!out.empty()) {
    out += '\n';
  }
  out += line;
  return out;
}

std::vector<std::string> FindSecretMarkers(std::string_view text) {
  const auto               haystack = Lower(text);
  std::vector<std::string> found;
  for (const auto marker : kSecretMarkers) {
    if (haystack.find(Lower(marker)) != std::string::npos) {
      found.emplace_back(marker);
    }
  }
  return found;
}

int ParseInt(std::string_view value, std::string_view name) {
  return ParseWhole<int>(value, name);
}

std::uint64_t ParseUnsigned(std::string_view value, std::string_view name, std::uint64_t max) {
  if (!value.empty() && value.front() == '-') throw InvalidFlag(name, value, "must not be negative");
  const auto parsed = ParseWhole<std::uint64_t>(value, name);
  if (parsed > max) throw InvalidFlag(name, value, "at most " + std::to_string(max));
  return parsed;
}

} // namespace issueflow::util

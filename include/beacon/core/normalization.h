#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <string_view>

namespace beacon::core {

// Locale-independent ASCII helpers. Output is byte-stable across platforms.

// normalize_ascii_lower converts A-Z to a-z. Non-ASCII bytes are preserved.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim removes leading and trailing ASCII whitespace (space/tab/newline).
inline std::string trim(const std::string_view input) {
  const auto is_space = [](char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
  };

  std::size_t start = 0;
  while (start < input.size() && is_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// first_integer returns the first run of ASCII digits in input, if any.
// "3 years" -> 3, "about 18 months" -> 18, "n/a" -> nullopt.
inline std::optional<int> first_integer(const std::string_view input) {
  std::size_t i = 0;
  while (i < input.size() && (input[i] < '0' || input[i] > '9')) {
    ++i;
  }
  if (i == input.size()) {
    return std::nullopt;
  }

  long long value = 0;
  while (i < input.size() && input[i] >= '0' && input[i] <= '9') {
    value = value * 10 + (input[i] - '0');
    if (value > 1000000) {
      // Saturate; durations this long are data errors, not experience.
      return 1000000;
    }
    ++i;
  }
  return static_cast<int>(value);
}

// round_to rounds half away from zero to the given number of decimal places.
inline double round_to(const double value, const int places) {
  const double scale = std::pow(10.0, places);
  return std::round(value * scale) / scale;
}

}  // namespace beacon::core

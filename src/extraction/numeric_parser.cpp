#include <epsbar/extraction/numeric_parser.hpp>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace epsbar::extraction {

namespace {

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

}  // namespace

std::optional<double> parse_numeric(std::string_view text) {
  std::string_view s = trim(text);
  if (s.empty()) return std::nullopt;

  std::string digits;
  digits.reserve(s.size());
  bool seen_digit = false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '$' && digits.empty()) continue;
    if (c == '-' && digits.empty()) {
      digits.push_back(c);
      continue;
    }
    if (c == ',') {
      // Thousands separator only between digits.
      if (!seen_digit || i + 1 >= s.size() ||
          !std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
        return std::nullopt;
      }
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c))) seen_digit = true;
    digits.push_back(c);
  }
  if (!seen_digit) return std::nullopt;

  double value = 0.0;
  const char* first = digits.data();
  const char* last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::fixed);
  if (ec != std::errc{} || ptr != last || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace epsbar::extraction

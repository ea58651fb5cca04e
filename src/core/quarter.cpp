#include <epsbar/core/quarter.hpp>
#include <cctype>
#include <cstddef>

namespace epsbar::core {

std::string QuarterId::to_key() const {
  const int yy = ((year % 100) + 100) % 100;
  std::string key = "Q";
  key += static_cast<char>('0' + quarter);
  key += '\'';
  key += static_cast<char>('0' + yy / 10);
  key += static_cast<char>('0' + yy % 10);
  return key;
}

std::optional<QuarterId> parse_quarter_key(std::string_view key) {
  if (key.size() < 4 || key[0] != 'Q') return std::nullopt;
  const char q = key[1];
  if (q < '1' || q > '4') return std::nullopt;

  std::size_t pos = 2;
  if (key[pos] == '\'') ++pos;
  if (key.size() - pos != 2) return std::nullopt;
  const auto d0 = static_cast<unsigned char>(key[pos]);
  const auto d1 = static_cast<unsigned char>(key[pos + 1]);
  if (!std::isdigit(d0) || !std::isdigit(d1)) return std::nullopt;

  return QuarterId{q - '0', 2000 + (d0 - '0') * 10 + (d1 - '0')};
}

}  // namespace epsbar::core

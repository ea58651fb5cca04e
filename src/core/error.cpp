#include <epsbar/core/error.hpp>

namespace epsbar::core {

std::string_view to_string(ExtractError e) noexcept {
  switch (e) {
    case ExtractError::None:
      return "none";
    case ExtractError::InvalidImage:
      return "invalid image";
    case ExtractError::LoadFailed:
      return "load failed";
    case ExtractError::InvalidConfig:
      return "invalid config";
    case ExtractError::ParseError:
      return "parse error";
  }
  return "unknown";
}

}  // namespace epsbar::core

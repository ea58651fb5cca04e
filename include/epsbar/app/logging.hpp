#pragma once

#include <string_view>

namespace epsbar::app {

/// Configure the default spdlog logger: timestamped "time - name - level - message"
/// lines on stderr at \p level ("trace", "debug", "info", "warn", "error", "off").
/// Unknown level names fall back to info.
void setup_logging(std::string_view level);

}  // namespace epsbar::app

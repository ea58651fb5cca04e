#include <epsbar/app/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace epsbar::app {

void setup_logging(std::string_view level) {
  auto logger = spdlog::get("epsbar");
  if (!logger) {
    logger = spdlog::stderr_color_mt("epsbar");
  }
  logger->set_pattern("%Y-%m-%d %H:%M:%S - %n - %l - %v");

  auto parsed = spdlog::level::from_str(std::string(level));
  if (parsed == spdlog::level::off && level != "off") {
    parsed = spdlog::level::info;
  }
  logger->set_level(parsed);
  spdlog::set_default_logger(logger);
}

}  // namespace epsbar::app

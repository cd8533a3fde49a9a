#include <pricematch/app/logging.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace pricematch::app {

void init_logging(std::string_view level) {
  const std::string name(level);
  spdlog::level::level_enum parsed = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  const bool unknown = parsed == spdlog::level::off && name != "off";
  if (unknown) parsed = spdlog::level::info;

  spdlog::set_level(parsed);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (unknown) {
    spdlog::warn("Unknown log level '{}'; using info", name);
  }
}

}  // namespace pricematch::app

#pragma once

#include <string_view>

namespace pricematch::app {

/// Configure the default spdlog logger: level by name (trace, debug, info,
/// warn, error, critical, off) and a timestamped pattern. Unknown names
/// fall back to info.
void init_logging(std::string_view level);

}  // namespace pricematch::app

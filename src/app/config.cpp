#include <pricematch/app/config.hpp>
#include "core/text_utils.hpp"
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <string_view>
#include <system_error>

namespace pricematch::app {

namespace {

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key = core::detail::trim(line.substr(0, pos));
  value = core::detail::trim(line.substr(pos + 1));
  return !key.empty();
}

/// Parse the whole of \p value into \p out; on failure warn and leave \p out as is.
template <typename T>
void parse_number(const std::string& key, const std::string& value, T& out) {
  T parsed{};
  const char* end = value.data() + value.size();
  const auto result = std::from_chars(value.data(), end, parsed);
  if (result.ec != std::errc{} || result.ptr != end) {
    spdlog::warn("Config: ignoring invalid {} '{}'", key, value);
    return;
  }
  out = parsed;
}

}  // namespace

MatcherConfig default_config() {
  MatcherConfig c;
  c.rules_dir = "config/rules";
  c.backend_type = EmbeddingBackendType::Mock;
  c.min_confidence = 0.65;
  c.max_matches = 3;
  c.num_workers = 0;
  c.log_level = "info";
  return c;
}

MatcherConfig load_config(const std::string& path) {
  MatcherConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("Config file {} not readable; using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    const std::string stripped = core::detail::trim(line);
    if (stripped.empty() || stripped[0] == '#') continue;
    if (!parse_line(stripped, key, value)) continue;

    if (key == "rules_dir") c.rules_dir = value;
    else if (key == "embedding_backend") {
      if (value == "onnx") c.backend_type = EmbeddingBackendType::Onnx;
      else if (value == "mock") c.backend_type = EmbeddingBackendType::Mock;
      else spdlog::warn("Config: unknown embedding_backend '{}'", value);
    }
    else if (key == "model_path") c.model_path = value;
    else if (key == "vocab_path") c.vocab_path = value;
    else if (key == "min_confidence") parse_number(key, value, c.min_confidence);
    else if (key == "max_matches") parse_number(key, value, c.max_matches);
    else if (key == "num_workers") parse_number(key, value, c.num_workers);
    else if (key == "log_level") c.log_level = value;
  }
  return c;
}

}  // namespace pricematch::app

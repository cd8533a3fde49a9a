#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pricematch::core::detail {

/// ASCII lowercase copy.
std::string to_lower(std::string_view s);

/// Strip leading/trailing whitespace.
std::string trim(std::string_view s);

[[nodiscard]] inline bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

/// Replace every non-overlapping occurrence of from (non-empty) with to.
void replace_all(std::string& s, std::string_view from, std::string_view to);

/// Whitespace-separated words, in order, duplicates kept.
std::vector<std::string> split_words(std::string_view s);

}  // namespace pricematch::core::detail

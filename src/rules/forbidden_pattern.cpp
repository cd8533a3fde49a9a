#include <pricematch/rules/forbidden_pattern.hpp>
#include "core/text_utils.hpp"
#include <string>

namespace pricematch::rules {

namespace detail = pricematch::core::detail;

std::optional<PatternTerm> parse_pattern_term(std::string_view text) {
  const std::string token = detail::trim(text);
  if (token.empty()) return std::nullopt;

  const auto colon = token.find(':');
  if (colon != std::string::npos) {
    if (token.find(':', colon + 1) != std::string::npos) return std::nullopt;
    if (token.find('|') != std::string::npos) return std::nullopt;
    CategoryTerm term{detail::trim(token.substr(0, colon)),
                      detail::trim(token.substr(colon + 1))};
    if (term.type.empty() || term.subtype.empty()) return std::nullopt;
    return term;
  }

  if (token.find('|') != std::string::npos) {
    AlternationTerm term;
    std::size_t start = 0;
    while (start <= token.size()) {
      const auto bar = token.find('|', start);
      const auto end = bar == std::string::npos ? token.size() : bar;
      std::string option = detail::to_lower(detail::trim(token.substr(start, end - start)));
      if (!option.empty()) term.options.push_back(std::move(option));
      if (bar == std::string::npos) break;
      start = bar + 1;
    }
    if (term.options.empty()) return std::nullopt;
    return term;
  }

  return KeywordTerm{detail::to_lower(token)};
}

std::optional<PatternRule> parse_pattern_rule(std::string_view left, std::string_view right) {
  auto l = parse_pattern_term(left);
  auto r = parse_pattern_term(right);
  if (!l || !r) return std::nullopt;
  std::string source(left);
  source += " vs ";
  source += right;
  return PatternRule{std::move(*l), std::move(*r), std::move(source)};
}

}  // namespace pricematch::rules

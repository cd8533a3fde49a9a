#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pricematch::rules {

/// "type:subtype" side of a pattern rule; matches on classification.
struct CategoryTerm {
  std::string type;
  std::string subtype;
};

/// "opt1|opt2|..." side; matches when any option occurs in the name.
struct AlternationTerm {
  std::vector<std::string> options;  // lowercase, non-empty
};

/// Plain keyword side; matches when it occurs in the name.
struct KeywordTerm {
  std::string keyword;  // lowercase, non-empty
};

using PatternTerm = std::variant<CategoryTerm, AlternationTerm, KeywordTerm>;

/// Forbidden pattern pair, parsed once at load time.
struct PatternRule {
  PatternTerm left;
  PatternTerm right;
  std::string source;  // "left vs right" as written in the rule file
};

/// Parse one side of a forbidden pair. Returns nullopt for malformed input
/// ("a:b:c", ":x", "|", empty string).
[[nodiscard]] std::optional<PatternTerm> parse_pattern_term(std::string_view text);

/// Parse both sides; nullopt if either side is malformed.
[[nodiscard]] std::optional<PatternRule> parse_pattern_rule(std::string_view left,
                                                            std::string_view right);

/// True if the token is written in the pattern mini-language (contains ':' or '|').
[[nodiscard]] inline bool is_pattern_token(std::string_view token) noexcept {
  return token.find_first_of(":|") != std::string_view::npos;
}

}  // namespace pricematch::rules

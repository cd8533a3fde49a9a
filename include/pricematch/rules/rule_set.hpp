#pragma once

#include <pricematch/rules/forbidden_pattern.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pricematch::rules {

/// Taxonomy entry; more keywords means a more specific category.
struct TaxonomyCategory {
  std::string type;
  std::string subtype{"generic"};
  std::vector<std::string> keywords;  // lowercase
};

/// Regional spellings rewritten to one canonical term before classification.
struct SynonymGroup {
  std::string canonical;            // lowercase
  std::vector<std::string> terms;   // lowercase, non-empty
};

using TokenPair = std::pair<std::string, std::string>;

struct TokenPairHash {
  std::size_t operator()(const TokenPair& p) const noexcept {
    const std::size_t h1 = std::hash<std::string>{}(p.first);
    const std::size_t h2 = std::hash<std::string>{}(p.second);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

/// Immutable rule tables shared read-only by every component of a matching run.
/// Build through the loader (rule_loader.hpp); hold as std::shared_ptr<const RuleSet>.
/// Every table may be empty; an empty RuleSet classifies everything as
/// ("other", "generic") and forbids nothing.
struct RuleSet {
  std::vector<TaxonomyCategory> categories;
  std::unordered_set<std::string> strict_categories;   // "type:subtype"
  std::vector<TokenPair> incompatible_categories;      // "type:subtype" or "type"

  /// Bare-type and exact "type:subtype" pairs, both orders stored.
  std::unordered_set<TokenPair, TokenPairHash> forbidden_pairs;
  std::vector<PatternRule> forbidden_patterns;
  std::unordered_map<std::string, double> penalty_multipliers;

  std::vector<SynonymGroup> synonyms;
  std::vector<std::string> brands;  // lowercase, declaration order

  [[nodiscard]] bool is_forbidden_pair(std::string_view a, std::string_view b) const {
    return forbidden_pairs.contains(TokenPair{std::string(a), std::string(b)});
  }

  [[nodiscard]] bool is_strict(const std::string& qualified) const {
    return strict_categories.contains(qualified);
  }

  /// Configured multiplier for "different_{type_a}_vs_{type_b}", if any.
  [[nodiscard]] std::optional<double> penalty_for(std::string_view type_a,
                                                  std::string_view type_b) const;
};

}  // namespace pricematch::rules

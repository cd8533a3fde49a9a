#include <pricematch/matching/forbidden_rules.hpp>
#include "core/text_utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <variant>

namespace pricematch::matching {

namespace detail = pricematch::core::detail;

namespace {

constexpr std::array<std::string_view, 2> kBakingAgents{"baking powder", "baking soda"};
constexpr std::array<std::string_view, 5> kBakingClashSpices{"cumin", "coriander", "turmeric",
                                                             "chili", "masala"};
// Order matters: the first listed spice found in a name names that product.
constexpr std::array<std::string_view, 6> kNamedSpices{"amchur", "anardana", "cumin",
                                                       "coriander", "turmeric", "chili"};

template <std::size_t N>
bool contains_any(std::string_view name, const std::array<std::string_view, N>& words) {
  return std::any_of(words.begin(), words.end(),
                     [name](std::string_view w) { return detail::contains(name, w); });
}

std::string_view first_spice(std::string_view name) {
  for (const auto spice : kNamedSpices) {
    if (detail::contains(name, spice)) return spice;
  }
  return {};
}

struct TermMatcher {
  const std::string& name;
  const core::Classification& cls;

  bool operator()(const rules::CategoryTerm& t) const {
    return t.type == cls.type && t.subtype == cls.subtype;
  }
  bool operator()(const rules::AlternationTerm& t) const {
    return std::any_of(t.options.begin(), t.options.end(),
                       [this](const std::string& opt) { return detail::contains(name, opt); });
  }
  bool operator()(const rules::KeywordTerm& t) const {
    return detail::contains(name, t.keyword);
  }
};

bool term_matches(const rules::PatternTerm& term, const std::string& name,
                  const core::Classification& cls) {
  return std::visit(TermMatcher{name, cls}, term);
}

}  // namespace

ForbiddenRuleEngine::ForbiddenRuleEngine(std::shared_ptr<const rules::RuleSet> rules)
    : rules_(std::move(rules)) {}

ForbiddenVerdict ForbiddenRuleEngine::check(std::string_view name_a,
                                            std::string_view name_b,
                                            const core::Classification& class_a,
                                            const core::Classification& class_b) const {
  const std::string qa = class_a.qualified();
  const std::string qb = class_b.qualified();
  if (rules_->is_forbidden_pair(qa, qb)) {
    return {true, fmt::format("Forbidden type combination: {} vs {}", qa, qb)};
  }
  if (rules_->is_forbidden_pair(class_a.type, class_b.type)) {
    return {true, fmt::format("Forbidden type combination: {} vs {}", class_a.type, class_b.type)};
  }

  const std::string lower_a = detail::to_lower(name_a);
  const std::string lower_b = detail::to_lower(name_b);

  if (auto reason = check_patterns(lower_a, lower_b, class_a, class_b)) {
    return {true, std::move(*reason)};
  }
  if (auto reason = check_incompatible(class_a, class_b)) {
    return {true, std::move(*reason)};
  }
  if (auto reason = check_critical_exclusions(lower_a, lower_b)) {
    return {true, std::move(*reason)};
  }
  return {};
}

std::optional<std::string> ForbiddenRuleEngine::check_patterns(
    const std::string& lower_a, const std::string& lower_b,
    const core::Classification& class_a, const core::Classification& class_b) const {
  for (const auto& rule : rules_->forbidden_patterns) {
    const bool forward = term_matches(rule.left, lower_a, class_a) &&
                         term_matches(rule.right, lower_b, class_b);
    const bool reverse = !forward && term_matches(rule.left, lower_b, class_b) &&
                         term_matches(rule.right, lower_a, class_a);
    if (forward || reverse) {
      return fmt::format("Matches forbidden pattern: {}", rule.source);
    }
  }
  return std::nullopt;
}

std::optional<std::string> ForbiddenRuleEngine::check_incompatible(
    const core::Classification& class_a, const core::Classification& class_b) const {
  const std::string qa = class_a.qualified();
  const std::string qb = class_b.qualified();
  for (const auto& [c1, c2] : rules_->incompatible_categories) {
    if ((qa == c1 && qb == c2) || (qa == c2 && qb == c1) ||
        (class_a.type == c1 && class_b.type == c2) ||
        (class_a.type == c2 && class_b.type == c1)) {
      return fmt::format("Incompatible categories: {} vs {}", c1, c2);
    }
  }
  return std::nullopt;
}

std::optional<std::string> check_critical_exclusions(std::string_view lower_a,
                                                     std::string_view lower_b) {
  if ((contains_any(lower_a, kBakingAgents) && contains_any(lower_b, kBakingClashSpices)) ||
      (contains_any(lower_b, kBakingAgents) && contains_any(lower_a, kBakingClashSpices))) {
    return std::string("Baking agents cannot match with spices");
  }

  const auto spice_a = first_spice(lower_a);
  const auto spice_b = first_spice(lower_b);
  if (!spice_a.empty() && !spice_b.empty() && spice_a != spice_b) {
    return fmt::format("Different spices: {} vs {}", spice_a, spice_b);
  }

  if ((detail::contains(lower_a, "coconut") && detail::contains(lower_b, "curry")) ||
      (detail::contains(lower_a, "curry") && detail::contains(lower_b, "coconut"))) {
    return std::string("Coconut products cannot match with curry products");
  }
  return std::nullopt;
}

}  // namespace pricematch::matching

#pragma once

#include <pricematch/core/classification.hpp>
#include <pricematch/rules/rule_set.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pricematch::matching {

/// Outcome of a forbidden-match check; reason is empty when allowed.
struct ForbiddenVerdict {
  bool forbidden{false};
  std::string reason;
};

/// Decides whether two products may never be matched, whatever their similarity.
///
/// Checks, first hit wins:
/// 1. exact "type:subtype" pair, 2. bare type pair, 3. pattern rules (either
/// orientation), 4. incompatible categories, 5. built-in exclusions on the raw
/// names (baking agents vs spices, two different named spices, coconut vs curry).
/// Never throws; malformed patterns were already dropped at load time.
class ForbiddenRuleEngine {
 public:
  explicit ForbiddenRuleEngine(std::shared_ptr<const rules::RuleSet> rules);

  [[nodiscard]] ForbiddenVerdict check(std::string_view name_a,
                                       std::string_view name_b,
                                       const core::Classification& class_a,
                                       const core::Classification& class_b) const;

 private:
  [[nodiscard]] std::optional<std::string> check_patterns(
      const std::string& lower_a, const std::string& lower_b,
      const core::Classification& class_a, const core::Classification& class_b) const;

  [[nodiscard]] std::optional<std::string> check_incompatible(
      const core::Classification& class_a, const core::Classification& class_b) const;

  std::shared_ptr<const rules::RuleSet> rules_;
};

/// Built-in cross-domain exclusions on lowercased names.
[[nodiscard]] std::optional<std::string> check_critical_exclusions(std::string_view lower_a,
                                                                   std::string_view lower_b);

}  // namespace pricematch::matching

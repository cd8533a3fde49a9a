#include <pricematch/rules/rule_set.hpp>
#include <string>

namespace pricematch::rules {

std::optional<double> RuleSet::penalty_for(std::string_view type_a,
                                           std::string_view type_b) const {
  std::string key = "different_";
  key += type_a;
  key += "_vs_";
  key += type_b;
  const auto it = penalty_multipliers.find(key);
  if (it == penalty_multipliers.end()) return std::nullopt;
  return it->second;
}

}  // namespace pricematch::rules

#include <pricematch/matching/category_classifier.hpp>
#include "core/text_utils.hpp"
#include <cstddef>

namespace pricematch::matching {

namespace detail = pricematch::core::detail;

CategoryClassifier::CategoryClassifier(std::shared_ptr<const rules::RuleSet> rules)
    : rules_(std::move(rules)) {}

std::string CategoryClassifier::canonicalize(std::string_view name) const {
  std::string working = detail::to_lower(name);
  for (const auto& group : rules_->synonyms) {
    for (const auto& term : group.terms) {
      if (detail::contains(working, term)) {
        detail::replace_all(working, term, group.canonical);
      }
    }
  }
  return working;
}

core::Classification CategoryClassifier::classify(std::string_view name) const {
  const std::string working = canonicalize(name);

  const rules::TaxonomyCategory* best = nullptr;
  std::size_t best_priority = 0;
  for (const auto& category : rules_->categories) {
    const std::size_t priority = category.keywords.size();
    if (best && priority <= best_priority) continue;
    for (const auto& keyword : category.keywords) {
      if (detail::contains(working, keyword)) {
        best = &category;
        best_priority = priority;
        break;
      }
    }
  }

  if (!best) return core::Classification{};
  return core::Classification{best->type, best->subtype};
}

}  // namespace pricematch::matching

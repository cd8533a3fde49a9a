#pragma once

#include <pricematch/core/classification.hpp>
#include <pricematch/rules/rule_set.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace pricematch::matching {

/// Maps a free-text product name to (type, subtype) by keyword matching
/// against the taxonomy, after synonym rewriting.
///
/// A category whose keyword occurs in the name is a candidate; the candidate
/// with the most configured keywords wins, declaration order breaks ties.
/// Pure and thread-safe; rules are shared read-only.
class CategoryClassifier {
 public:
  explicit CategoryClassifier(std::shared_ptr<const rules::RuleSet> rules);

  [[nodiscard]] core::Classification classify(std::string_view name) const;

  /// Lowercased name with every synonym term replaced by its canonical term.
  [[nodiscard]] std::string canonicalize(std::string_view name) const;

 private:
  std::shared_ptr<const rules::RuleSet> rules_;
};

}  // namespace pricematch::matching

#pragma once

#include <pricematch/core/error.hpp>
#include <pricematch/core/product.hpp>
#include <pricematch/core/product_match.hpp>
#include <pricematch/matching/category_classifier.hpp>
#include <pricematch/matching/embedding_backend.hpp>
#include <pricematch/matching/forbidden_rules.hpp>
#include <pricematch/matching/similarity_scorer.hpp>
#include <pricematch/rules/rule_set.hpp>
#include <expected>
#include <memory>

namespace pricematch::matching {

/// Scoring thresholds and factors of the confidence pipeline.
struct ConfidenceTuning {
  double min_name_similarity{0.3};
  double same_category_bonus{0.15};
  double default_type_penalty{0.5};
  double strict_subtype_penalty{0.3};
  double subtype_penalty{0.7};
  double borderline_low{0.6};
  double borderline_high{0.75};
};

/// Turns a (primary, candidate) pair into a [0, 1] confidence plus the ordered
/// reasons that shaped it. Order: classify, forbidden check (terminal), name
/// similarity with early rejection below 0.3 (terminal), category penalty,
/// size penalty, price-ratio penalty, borderline scrutiny, clamp.
///
/// Forbidden and dissimilar pairs are results with score 0, not errors; errors
/// are reserved for invalid records and embedding failures.
/// Thread-safe: rules are read-only and the embedding cache is synchronized.
class ConfidenceCalculator {
 public:
  ConfidenceCalculator(std::shared_ptr<const rules::RuleSet> rules,
                       std::unique_ptr<IEmbeddingBackend> backend,
                       ConfidenceTuning tuning = {});

  [[nodiscard]] std::expected<core::ConfidenceResult, core::MatchError> confidence(
      const core::ProductRecord& primary, const core::ProductRecord& candidate);

  [[nodiscard]] const CategoryClassifier& classifier() const noexcept { return classifier_; }
  [[nodiscard]] const ForbiddenRuleEngine& forbidden_rules() const noexcept { return forbidden_; }
  [[nodiscard]] SimilarityScorer& scorer() noexcept { return scorer_; }

 private:
  std::shared_ptr<const rules::RuleSet> rules_;
  CategoryClassifier classifier_;
  ForbiddenRuleEngine forbidden_;
  SimilarityScorer scorer_;
  ConfidenceTuning tuning_;
};

}  // namespace pricematch::matching

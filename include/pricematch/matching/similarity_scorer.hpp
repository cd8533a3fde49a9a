#pragma once

#include <pricematch/core/error.hpp>
#include <pricematch/matching/embedding_backend.hpp>
#include <pricematch/matching/embedding_cache.hpp>
#include <pricematch/rules/rule_set.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace pricematch::matching {

/// Weights of the hybrid score.
inline constexpr double kSemanticWeight = 0.4;
inline constexpr double kLexicalWeight = 0.6;

/// Hybrid name similarity: 0.4 * embedding cosine + 0.6 * token-sort ratio on
/// normalized names, then a brand adjustment (+0.1 capped at 1.0 for the same
/// brand, x0.85 for two different known brands). Names sharing no word score 0.1
/// without touching the embedding model. Symmetric in its arguments.
///
/// Thread-safe: the embedding cache is internally synchronized.
class SimilarityScorer {
 public:
  SimilarityScorer(std::shared_ptr<const rules::RuleSet> rules,
                   std::unique_ptr<IEmbeddingBackend> backend);

  [[nodiscard]] std::expected<double, core::MatchError> similarity(std::string_view name_a,
                                                                   std::string_view name_b);

  /// Name with the size token removed, lowercased, punctuation turned into
  /// spaces and stop words dropped.
  [[nodiscard]] std::string normalize_name(std::string_view name) const;

  /// First known brand (declaration order) contained in the name, lowercase.
  [[nodiscard]] std::optional<std::string> extract_brand(std::string_view name) const;

  /// rapidfuzz token_sort_ratio scaled to [0, 1].
  [[nodiscard]] static double lexical_similarity(const std::string& norm_a,
                                                 const std::string& norm_b);

  /// Warm the embedding cache with the normalized form of every name.
  [[nodiscard]] std::expected<void, core::MatchError> prefetch(std::span<const std::string> names);

  [[nodiscard]] EmbeddingCache& cache() noexcept { return cache_; }

 private:
  std::shared_ptr<const rules::RuleSet> rules_;
  EmbeddingCache cache_;
};

}  // namespace pricematch::matching

#pragma once

#include <pricematch/core/error.hpp>
#include <pricematch/core/product.hpp>
#include <pricematch/core/product_match.hpp>
#include <pricematch/matching/confidence_calculator.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pricematch::matching {

inline constexpr double kDefaultMinConfidence = 0.65;
inline constexpr std::size_t kDefaultMaxMatches = 3;

/// A pair (or whole primary, when candidate_id is empty) that could not be scored.
struct PairFailure {
  std::int64_t primary_id{0};
  std::optional<std::int64_t> candidate_id;
  core::MatchError error{core::MatchError::None};
  std::string detail;
};

/// Matches of a batch run, concatenated in primary order, plus what was skipped.
struct BatchResult {
  std::vector<core::ProductMatch> matches;
  std::vector<PairFailure> failures;
};

/// Applies the confidence calculator to one-to-many and many-to-many product sets.
/// Owns the whole engine for a run: rules, classifier, forbidden rules, scorer
/// and embedding cache. Safe to call from several threads at once.
class MatchFinder {
 public:
  MatchFinder(std::shared_ptr<const rules::RuleSet> rules,
              std::unique_ptr<IEmbeddingBackend> backend,
              ConfidenceTuning tuning = {});

  /// Best matches of \p primary among \p candidates: skips the candidate with the
  /// primary's id, keeps confidence >= min_confidence, sorts by descending
  /// confidence (stable) and keeps at most max_matches.
  /// A candidate that fails to score is skipped and, if \p failures is given,
  /// recorded there. Only an invalid primary fails the call.
  [[nodiscard]] std::expected<std::vector<core::ProductMatch>, core::MatchError> find_matches(
      const core::ProductRecord& primary,
      std::span<const core::ProductRecord> candidates,
      double min_confidence = kDefaultMinConfidence,
      std::size_t max_matches = kDefaultMaxMatches,
      std::vector<PairFailure>* failures = nullptr);

  /// find_matches for every primary against all candidates. No cross-primary
  /// constraint: one candidate may be the best match of several primaries.
  [[nodiscard]] BatchResult batch_match(std::span<const core::ProductRecord> primaries,
                                        std::span<const core::ProductRecord> candidates,
                                        double min_confidence = kDefaultMinConfidence,
                                        std::size_t max_matches = kDefaultMaxMatches);

  /// Encode every distinct normalized name of both sets in one backend call.
  /// Failure is logged; pairs then encode on demand.
  void prefetch(std::span<const core::ProductRecord> primaries,
                std::span<const core::ProductRecord> candidates);

  [[nodiscard]] ConfidenceCalculator& calculator() noexcept { return calculator_; }

 private:
  [[nodiscard]] std::expected<core::ConfidenceResult, core::MatchError> score_pair(
      const core::ProductRecord& primary, const core::ProductRecord& candidate,
      std::string& detail);

  ConfidenceCalculator calculator_;
};

/// Append one primary's outcome to \p out (matches, or a primary-level failure),
/// followed by its per-candidate failures.
void append_primary_result(
    BatchResult& out, const core::ProductRecord& primary,
    std::expected<std::vector<core::ProductMatch>, core::MatchError> result,
    std::vector<PairFailure> pair_failures);

}  // namespace pricematch::matching

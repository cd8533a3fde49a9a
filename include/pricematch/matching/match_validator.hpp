#pragma once

#include <pricematch/core/product.hpp>
#include <pricematch/core/product_match.hpp>
#include <pricematch/matching/unit_price.hpp>
#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pricematch::matching {

struct RejectedMatch {
  std::string reason;
  core::ProductMatch match;
};

/// Outcome of post-match validation.
struct ValidationReport {
  std::vector<core::ProductMatch> validated;
  std::vector<RejectedMatch> rejected;
  std::vector<PriceComparison> size_analysis;     // one per match with both products known
  double normalization_success_rate{0.0};        // share of size_analysis compared per unit
  std::map<std::string, std::size_t> rejection_reasons;

  [[nodiscard]] std::size_t total() const noexcept { return validated.size() + rejected.size(); }
};

/// Second-pass sanity checks on accepted matches before prices are compared:
/// per-unit price plausibility, size extraction confidence, name overlap of
/// low-confidence matches and size mismatches.
class MatchValidator {
 public:
  /// \param use_normalization false runs only the basic word-overlap check.
  [[nodiscard]] ValidationReport validate(std::span<const core::ProductMatch> matches,
                                          std::span<const core::ProductRecord> primaries,
                                          std::span<const core::ProductRecord> competitors,
                                          bool use_normalization = true) const;

  /// Issues found for one match; empty means valid.
  [[nodiscard]] std::vector<std::string> check(const core::ProductRecord& primary,
                                               const core::ProductRecord& competitor,
                                               const core::ProductMatch& match,
                                               const PriceComparison& comparison) const;
};

/// |words(a) & words(b)| / |words(a) | words(b)| on lowercased whitespace words.
[[nodiscard]] double word_jaccard(std::string_view a, std::string_view b);

}  // namespace pricematch::matching

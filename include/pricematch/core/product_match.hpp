#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pricematch::core {

/// Confidence tier of an accepted match.
enum class MatchType : std::uint8_t {
  Exact,       // confidence >= 0.9
  Similar,     // confidence >= 0.75
  Substitute,  // anything else above the caller's threshold
};

/// Accepted pairing of a primary product with a competitor product.
/// Built once by the match finder and handed to the caller by value.
struct ProductMatch {
  std::int64_t primary_id{0};
  std::int64_t matched_id{0};
  double confidence{0.0};
  MatchType match_type{MatchType::Substitute};
  double size_similarity{0.0};
  std::vector<std::string> warnings;
};

/// Score plus the ordered penalty / rejection reasons that produced it.
struct ConfidenceResult {
  double score{0.0};
  std::vector<std::string> warnings;
};

[[nodiscard]] MatchType match_type_for(double confidence) noexcept;

[[nodiscard]] std::string_view to_string(MatchType type) noexcept;

}  // namespace pricematch::core

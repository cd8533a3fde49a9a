#include <pricematch/core/product_match.hpp>

namespace pricematch::core {

MatchType match_type_for(double confidence) noexcept {
  if (confidence >= 0.9) return MatchType::Exact;
  if (confidence >= 0.75) return MatchType::Similar;
  return MatchType::Substitute;
}

std::string_view to_string(MatchType type) noexcept {
  switch (type) {
    case MatchType::Exact:
      return "exact";
    case MatchType::Similar:
      return "similar";
    case MatchType::Substitute:
    default:
      return "substitute";
  }
}

}  // namespace pricematch::core

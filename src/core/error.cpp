#include <pricematch/core/error.hpp>

namespace pricematch::core {

std::string_view to_string(MatchError error) noexcept {
  switch (error) {
    case MatchError::None:
      return "none";
    case MatchError::InvalidProduct:
      return "invalid_product";
    case MatchError::InvalidConfig:
      return "invalid_config";
    case MatchError::RuleLoadFailed:
      return "rule_load_failed";
    case MatchError::EmbeddingFailed:
      return "embedding_failed";
    case MatchError::ScoringFailed:
      return "scoring_failed";
    default:
      return "unknown";
  }
}

}  // namespace pricematch::core

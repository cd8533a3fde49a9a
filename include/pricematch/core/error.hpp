#pragma once

#include <string_view>

namespace pricematch::core {

/// Matching error codes; used with std::expected for recoverable failures.
/// Business outcomes (forbidden pair, low similarity) are not errors.
enum class MatchError {
  None = 0,
  InvalidProduct,
  InvalidConfig,
  RuleLoadFailed,
  EmbeddingFailed,
  ScoringFailed,
};

/// Short stable name for logs and CLI output.
[[nodiscard]] std::string_view to_string(MatchError error) noexcept;

}  // namespace pricematch::core

#pragma once

#include <pricematch/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace pricematch::core {

/// One retailer product as supplied by the ingestion side.
/// Owned by the caller; the matching engine only reads it.
struct ProductRecord {
  std::int64_t id{0};
  std::string name;
  std::optional<double> price;
  std::optional<std::string> brand;
  std::optional<std::string> category;

  /// True when a strictly positive price is known.
  [[nodiscard]] bool has_price() const noexcept {
    return price.has_value() && *price > 0.0;
  }
};

/// Rejects records that cannot be scored (empty or whitespace-only name).
[[nodiscard]] std::expected<void, MatchError> validate_product(
    const ProductRecord& product);

}  // namespace pricematch::core

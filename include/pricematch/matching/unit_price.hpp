#pragma once

#include <pricematch/core/product.hpp>
#include <pricematch/core/size_info.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pricematch::matching {

/// How much the extracted pack size can be trusted.
enum class SizeConfidence : std::uint8_t {
  High,
  Medium,
  Low,
  Unknown,
};

/// Pack size for price normalization. Unlike extract_size() this understands
/// multi-packs ("12 x 200g"), fluid ounces and spelled-out units, and falls
/// back to a bare number with Low confidence.
struct PackSize {
  double value{0.0};
  std::string base_unit{"unknown"};  // g, ml, pcs or unknown
  core::UnitType unit_type{core::UnitType::Unknown};
  SizeConfidence confidence{SizeConfidence::Unknown};
};

/// Price per standard quantity; only the field matching the unit type is set.
struct NormalizedPrice {
  std::optional<double> per_100g;
  std::optional<double> per_lb;
  std::optional<double> per_liter;
  std::optional<double> per_unit;
  double original_price{0.0};
  SizeConfidence confidence{SizeConfidence::Unknown};
};

enum class PriceBasis : std::uint8_t {
  Absolute,
  Per100g,
  PerLiter,
  PerUnit,
};

/// Primary vs competitor price, per unit when both sizes allow it.
/// savings > 0 means the primary store is cheaper.
struct PriceComparison {
  std::int64_t primary_id{0};
  std::int64_t competitor_id{0};
  double primary_price{0.0};
  double competitor_price{0.0};
  PriceBasis basis{PriceBasis::Absolute};
  double primary_per_unit{0.0};
  double competitor_per_unit{0.0};
  double savings{0.0};
  double savings_pct{0.0};
  SizeConfidence size_confidence{SizeConfidence::Unknown};
  bool can_compare_normalized{false};
};

[[nodiscard]] PackSize extract_pack_size(std::string_view name);

[[nodiscard]] NormalizedPrice normalize_price(double price, std::string_view name);

[[nodiscard]] PriceComparison compare_prices(const core::ProductRecord& primary,
                                             const core::ProductRecord& competitor);

/// "$/100g", "$/L", "$/unit" or "$".
[[nodiscard]] std::string_view unit_label(PriceBasis basis) noexcept;

[[nodiscard]] std::string_view to_string(SizeConfidence confidence) noexcept;

}  // namespace pricematch::matching

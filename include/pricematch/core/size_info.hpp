#pragma once

#include <cstdint>
#include <string>

namespace pricematch::core {

/// Magnitude class of a pack size.
enum class UnitType : std::uint8_t {
  Weight,
  Volume,
  Count,
  Unknown,
};

/// Pack size parsed from a product name.
/// value is in the base unit of its class: grams, millilitres or pieces.
/// The "nothing found" sentinel is {0, "", Unknown, ""}.
struct SizeInfo {
  double value{0.0};
  std::string unit;
  UnitType unit_type{UnitType::Unknown};
  std::string original;  // matched text, e.g. "1kg"

  /// True when a size token was found in the name (distinct from value == 0).
  [[nodiscard]] bool detected() const noexcept { return !original.empty(); }
};

}  // namespace pricematch::core

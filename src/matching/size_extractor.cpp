#include <pricematch/matching/size_extractor.hpp>
#include "core/text_utils.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <regex>
#include <string>
#include <system_error>

namespace pricematch::matching {

namespace {

struct UnitConversion {
  std::string_view unit;
  double factor;
  std::string_view base_unit;
  core::UnitType unit_type;
};

constexpr std::array<UnitConversion, 21> kConversions{{
    {"kg", 1000.0, "g", core::UnitType::Weight},
    {"kgs", 1000.0, "g", core::UnitType::Weight},
    {"g", 1.0, "g", core::UnitType::Weight},
    {"gm", 1.0, "g", core::UnitType::Weight},
    {"gms", 1.0, "g", core::UnitType::Weight},
    {"gram", 1.0, "g", core::UnitType::Weight},
    {"grams", 1.0, "g", core::UnitType::Weight},
    {"lb", 453.6, "g", core::UnitType::Weight},
    {"lbs", 453.6, "g", core::UnitType::Weight},
    {"oz", 28.35, "g", core::UnitType::Weight},
    {"l", 1000.0, "ml", core::UnitType::Volume},
    {"ltr", 1000.0, "ml", core::UnitType::Volume},
    {"ltrs", 1000.0, "ml", core::UnitType::Volume},
    {"litre", 1000.0, "ml", core::UnitType::Volume},
    {"litres", 1000.0, "ml", core::UnitType::Volume},
    {"liter", 1000.0, "ml", core::UnitType::Volume},
    {"liters", 1000.0, "ml", core::UnitType::Volume},
    {"ml", 1.0, "ml", core::UnitType::Volume},
    {"pc", 1.0, "pcs", core::UnitType::Count},
    {"pcs", 1.0, "pcs", core::UnitType::Count},
    {"each", 1.0, "each", core::UnitType::Count},
}};

/// Unit must not run into a following letter ("5 lemons" is not 5 litres).
const std::regex& size_pattern() {
  static const std::regex pattern(
      R"((\d+(?:\.\d+)?)\s*(kgs|kg|grams|gram|gms|gm|g|lbs|lb|oz|ml|ltrs|ltr|litres|litre|liters|liter|l|pcs|pc|each)(?![a-z]))",
      std::regex::ECMAScript | std::regex::icase);
  return pattern;
}

constexpr double kExactBand = 0.02;

}  // namespace

core::SizeInfo extract_size(std::string_view name) {
  const std::string text(name);
  std::smatch match;
  if (!std::regex_search(text, match, size_pattern())) {
    return core::SizeInfo{};
  }

  const std::string digits = match[1].str();
  double value = 0.0;
  const auto parsed = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (parsed.ec != std::errc{}) {
    return core::SizeInfo{};
  }
  const std::string unit = core::detail::to_lower(match[2].str());
  const auto it = std::find_if(kConversions.begin(), kConversions.end(),
                               [&unit](const UnitConversion& c) { return c.unit == unit; });
  if (it == kConversions.end()) {
    return core::SizeInfo{value, unit, core::UnitType::Unknown, match[0].str()};
  }
  return core::SizeInfo{value * it->factor, std::string(it->base_unit), it->unit_type,
                        match[0].str()};
}

double size_similarity(const core::SizeInfo& a, const core::SizeInfo& b) noexcept {
  if (a.unit_type != b.unit_type) {
    if (a.unit_type == core::UnitType::Unknown || b.unit_type == core::UnitType::Unknown) {
      return 0.3;
    }
    return 0.1;
  }
  if (a.value == 0.0 || b.value == 0.0) {
    return 0.5;
  }

  const double ratio = std::min(a.value, b.value) / std::max(a.value, b.value);
  if (std::abs(ratio - 1.0) < kExactBand) return 1.0;
  if (ratio < 0.5) return ratio * 0.3;
  if (ratio < 0.75) return ratio * 0.6;
  return ratio;
}

}  // namespace pricematch::matching

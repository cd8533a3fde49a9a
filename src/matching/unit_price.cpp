#include <pricematch/matching/unit_price.hpp>
#include "core/text_utils.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <regex>
#include <string>
#include <system_error>

namespace pricematch::matching {

namespace {

struct SizePattern {
  std::regex pattern;
  core::UnitType unit_type;
  double multiplier;
  const char* base_unit;
};

constexpr double kGramsPerPound = 453.592;
constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

/// Tried in order; fluid ounces before ounces so "12 fl oz" is a volume.
const std::array<SizePattern, 8>& size_patterns() {
  static const std::array<SizePattern, 8> patterns{{
      {std::regex(R"((\d+(?:\.\d+)?)\s*kg\b)", kFlags), core::UnitType::Weight, 1000.0, "g"},
      {std::regex(R"((\d+(?:\.\d+)?)\s*(?:g|gm|gms|gram|grams)\b)", kFlags),
       core::UnitType::Weight, 1.0, "g"},
      {std::regex(R"((\d+(?:\.\d+)?)\s*(?:lb|lbs|pound|pounds)\b)", kFlags),
       core::UnitType::Weight, kGramsPerPound, "g"},
      {std::regex(R"((\d+(?:\.\d+)?)\s*(?:fl\s*oz|fluid\s*ounce)\b)", kFlags),
       core::UnitType::Volume, 29.5735, "ml"},
      {std::regex(R"((\d+(?:\.\d+)?)\s*(?:oz|ounce|ounces)\b)", kFlags), core::UnitType::Weight,
       28.3495, "g"},
      {std::regex(R"((\d+(?:\.\d+)?)\s*(?:l|liter|liters|litre|litres)\b)", kFlags),
       core::UnitType::Volume, 1000.0, "ml"},
      {std::regex(R"((\d+(?:\.\d+)?)\s*(?:ml|milliliter|milliliters)\b)", kFlags),
       core::UnitType::Volume, 1.0, "ml"},
      {std::regex(R"((\d+)\s*(?:pcs?|pieces?|each|count)\b)", kFlags), core::UnitType::Count, 1.0,
       "pcs"},
  }};
  return patterns;
}

const std::regex& multipack_pattern() {
  static const std::regex pattern(R"((\d+)\s*x\s*(\d+(?:\.\d+)?)\s*(g|gm|ml)\b)", kFlags);
  return pattern;
}

const std::regex& bare_number_pattern() {
  static const std::regex pattern(R"((\d+(?:\.\d+)?))");
  return pattern;
}

double parse_number(const std::string& digits) {
  double value = 0.0;
  const auto parsed = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  return parsed.ec == std::errc{} ? value : 0.0;
}

/// The weaker of two confidences (Unknown is weakest).
SizeConfidence weaker(SizeConfidence a, SizeConfidence b) {
  return static_cast<std::uint8_t>(a) > static_cast<std::uint8_t>(b) ? a : b;
}

}  // namespace

PackSize extract_pack_size(std::string_view name) {
  const std::string text(name);
  std::smatch match;

  if (std::regex_search(text, match, multipack_pattern())) {
    const double total = parse_number(match[1].str()) * parse_number(match[2].str());
    const bool volume = core::detail::to_lower(match[3].str()) == "ml";
    return PackSize{total, volume ? "ml" : "g",
                    volume ? core::UnitType::Volume : core::UnitType::Weight,
                    SizeConfidence::High};
  }

  for (const auto& p : size_patterns()) {
    if (!std::regex_search(text, match, p.pattern)) continue;
    const double value = parse_number(match[1].str()) * p.multiplier;
    const SizeConfidence confidence =
        match[0].length() > 3 ? SizeConfidence::High : SizeConfidence::Medium;
    return PackSize{value, p.base_unit, p.unit_type, confidence};
  }

  if (std::regex_search(text, match, bare_number_pattern())) {
    return PackSize{parse_number(match[1].str()), "unknown", core::UnitType::Unknown,
                    SizeConfidence::Low};
  }
  return PackSize{};
}

NormalizedPrice normalize_price(double price, std::string_view name) {
  const PackSize size = extract_pack_size(name);
  NormalizedPrice normalized;
  normalized.original_price = price;
  normalized.confidence = size.confidence;

  if (size.value <= 0.0 || size.confidence == SizeConfidence::Unknown) {
    return normalized;
  }
  switch (size.unit_type) {
    case core::UnitType::Weight:
      normalized.per_100g = price / size.value * 100.0;
      normalized.per_lb = price / size.value * kGramsPerPound;
      break;
    case core::UnitType::Volume:
      normalized.per_liter = price / size.value * 1000.0;
      break;
    case core::UnitType::Count:
      normalized.per_unit = price / size.value;
      break;
    case core::UnitType::Unknown:
    default:
      break;
  }
  return normalized;
}

PriceComparison compare_prices(const core::ProductRecord& primary,
                               const core::ProductRecord& competitor) {
  PriceComparison cmp;
  cmp.primary_id = primary.id;
  cmp.competitor_id = competitor.id;
  cmp.primary_price = primary.price.value_or(0.0);
  cmp.competitor_price = competitor.price.value_or(0.0);

  const NormalizedPrice p = normalize_price(cmp.primary_price, primary.name);
  const NormalizedPrice c = normalize_price(cmp.competitor_price, competitor.name);
  cmp.size_confidence = weaker(p.confidence, c.confidence);

  const auto usable = [](const std::optional<double>& v) { return v.has_value() && *v > 0.0; };
  if (usable(p.per_100g) && usable(c.per_100g)) {
    cmp.basis = PriceBasis::Per100g;
    cmp.primary_per_unit = *p.per_100g;
    cmp.competitor_per_unit = *c.per_100g;
  } else if (usable(p.per_liter) && usable(c.per_liter)) {
    cmp.basis = PriceBasis::PerLiter;
    cmp.primary_per_unit = *p.per_liter;
    cmp.competitor_per_unit = *c.per_liter;
  } else if (usable(p.per_unit) && usable(c.per_unit)) {
    cmp.basis = PriceBasis::PerUnit;
    cmp.primary_per_unit = *p.per_unit;
    cmp.competitor_per_unit = *c.per_unit;
  } else {
    return cmp;
  }

  cmp.can_compare_normalized = true;
  cmp.savings = cmp.competitor_per_unit - cmp.primary_per_unit;
  cmp.savings_pct = cmp.savings / cmp.primary_per_unit * 100.0;
  return cmp;
}

std::string_view unit_label(PriceBasis basis) noexcept {
  switch (basis) {
    case PriceBasis::Per100g:
      return "$/100g";
    case PriceBasis::PerLiter:
      return "$/L";
    case PriceBasis::PerUnit:
      return "$/unit";
    case PriceBasis::Absolute:
    default:
      return "$";
  }
}

std::string_view to_string(SizeConfidence confidence) noexcept {
  switch (confidence) {
    case SizeConfidence::High:
      return "high";
    case SizeConfidence::Medium:
      return "medium";
    case SizeConfidence::Low:
      return "low";
    case SizeConfidence::Unknown:
    default:
      return "unknown";
  }
}

}  // namespace pricematch::matching

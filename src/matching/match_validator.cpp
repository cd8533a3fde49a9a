#include <pricematch/matching/match_validator.hpp>
#include "core/text_utils.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <set>
#include <unordered_map>

namespace pricematch::matching {

namespace {

constexpr double kLowConfidence = 0.7;
constexpr double kMinNameOverlap = 0.3;
constexpr double kMaxPerUnitDiffPct = 500.0;
constexpr double kMaxAbsolutePriceRatio = 10.0;
constexpr double kSizeMismatch = 0.5;
constexpr double kSizeMismatchConfidence = 0.75;
constexpr double kNoCommonWordsConfidence = 0.8;

std::set<std::string> word_set(std::string_view s) {
  const auto words = core::detail::split_words(core::detail::to_lower(s));
  return {words.begin(), words.end()};
}

using ProductIndex = std::unordered_map<std::int64_t, const core::ProductRecord*>;

ProductIndex index_by_id(std::span<const core::ProductRecord> products) {
  ProductIndex index;
  index.reserve(products.size());
  for (const auto& p : products) index.emplace(p.id, &p);
  return index;
}

const core::ProductRecord* find(const ProductIndex& index, std::int64_t id) {
  const auto it = index.find(id);
  return it == index.end() ? nullptr : it->second;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

}  // namespace

double word_jaccard(std::string_view a, std::string_view b) {
  const auto wa = word_set(a);
  const auto wb = word_set(b);
  if (wa.empty() && wb.empty()) return 0.0;
  std::size_t common = 0;
  for (const auto& w : wa) {
    if (wb.contains(w)) ++common;
  }
  const std::size_t all = wa.size() + wb.size() - common;
  return static_cast<double>(common) / static_cast<double>(all);
}

std::vector<std::string> MatchValidator::check(const core::ProductRecord& primary,
                                               const core::ProductRecord& competitor,
                                               const core::ProductMatch& match,
                                               const PriceComparison& comparison) const {
  std::vector<std::string> issues;

  if (match.confidence < kLowConfidence) {
    const double overlap = word_jaccard(primary.name, competitor.name);
    if (overlap < kMinNameOverlap) {
      issues.push_back(
          fmt::format("Low name similarity ({:.2f}) for low confidence match", overlap));
    }
  }

  if (comparison.can_compare_normalized) {
    if (std::abs(comparison.savings_pct) > kMaxPerUnitDiffPct) {
      issues.push_back(
          fmt::format("Extreme per-unit price difference: {:.1f}%", comparison.savings_pct));
    }
    if (comparison.size_confidence == SizeConfidence::Low) {
      issues.emplace_back("Low confidence in size extraction");
    }
  } else if (comparison.primary_price > 0.0 && comparison.competitor_price > 0.0) {
    const double ratio = std::max(comparison.primary_price, comparison.competitor_price) /
                         std::min(comparison.primary_price, comparison.competitor_price);
    if (ratio > kMaxAbsolutePriceRatio) {
      issues.push_back(fmt::format(
          "Cannot normalize sizes and absolute price difference too large: {:.1f}x", ratio));
    }
  }

  if (match.size_similarity < kSizeMismatch && match.confidence < kSizeMismatchConfidence) {
    issues.emplace_back("Size/quantity mismatch detected");
  }
  return issues;
}

ValidationReport MatchValidator::validate(std::span<const core::ProductMatch> matches,
                                          std::span<const core::ProductRecord> primaries,
                                          std::span<const core::ProductRecord> competitors,
                                          bool use_normalization) const {
  const ProductIndex primary_index = index_by_id(primaries);
  const ProductIndex competitor_index = index_by_id(competitors);

  ValidationReport report;
  const auto reject = [&report](std::string reason, const core::ProductMatch& match) {
    ++report.rejection_reasons[reason];
    report.rejected.push_back({std::move(reason), match});
  };

  for (const auto& match : matches) {
    const core::ProductRecord* primary = find(primary_index, match.primary_id);
    const core::ProductRecord* competitor = find(competitor_index, match.matched_id);
    if (primary == nullptr || competitor == nullptr) {
      reject("Missing product data", match);
      continue;
    }

    if (!use_normalization) {
      if (word_jaccard(primary->name, competitor->name) == 0.0 &&
          match.confidence < kNoCommonWordsConfidence) {
        spdlog::debug("Rejecting match with no common words: {} vs {}", primary->name,
                      competitor->name);
        reject("No common words", match);
      } else {
        report.validated.push_back(match);
      }
      continue;
    }

    PriceComparison comparison = compare_prices(*primary, *competitor);
    auto issues = check(*primary, *competitor, match, comparison);
    report.size_analysis.push_back(comparison);
    if (issues.empty()) {
      report.validated.push_back(match);
    } else {
      reject(join(issues, "; "), match);
    }
  }

  if (!report.size_analysis.empty()) {
    const auto normalized =
        std::count_if(report.size_analysis.begin(), report.size_analysis.end(),
                      [](const PriceComparison& c) { return c.can_compare_normalized; });
    report.normalization_success_rate =
        static_cast<double>(normalized) / static_cast<double>(report.size_analysis.size());
  }

  spdlog::info("Validated {} of {} matches ({} rejected)", report.validated.size(), matches.size(),
               report.rejected.size());
  return report;
}

}  // namespace pricematch::matching

#include <pricematch/matching/confidence_calculator.hpp>
#include <pricematch/matching/size_extractor.hpp>
#include "core/text_utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <set>
#include <string>
#include <vector>

namespace pricematch::matching {

namespace detail = pricematch::core::detail;

namespace {

constexpr std::array<std::string_view, 6> kUnitWords{"g", "kg", "ml", "l", "oz", "lb"};

/// Words shared by both raw names, ignoring bare unit words.
std::size_t common_meaningful_words(std::string_view a, std::string_view b) {
  const auto words_a = detail::split_words(detail::to_lower(a));
  const auto words_b = detail::split_words(detail::to_lower(b));
  const std::set<std::string> set_a(words_a.begin(), words_a.end());
  std::set<std::string> common;
  for (const auto& w : words_b) {
    if (!set_a.contains(w)) continue;
    if (std::find(kUnitWords.begin(), kUnitWords.end(), w) != kUnitWords.end()) continue;
    common.insert(w);
  }
  return common.size();
}

std::string describe(const core::SizeInfo& size) {
  return fmt::format("{}{}", size.value, size.unit);
}

}  // namespace

ConfidenceCalculator::ConfidenceCalculator(std::shared_ptr<const rules::RuleSet> rules,
                                           std::unique_ptr<IEmbeddingBackend> backend,
                                           ConfidenceTuning tuning)
    : rules_(rules),
      classifier_(rules),
      forbidden_(rules),
      scorer_(rules, std::move(backend)),
      tuning_(tuning) {}

std::expected<core::ConfidenceResult, core::MatchError> ConfidenceCalculator::confidence(
    const core::ProductRecord& primary, const core::ProductRecord& candidate) {
  if (auto valid = core::validate_product(primary); !valid) {
    return std::unexpected(valid.error());
  }
  if (auto valid = core::validate_product(candidate); !valid) {
    return std::unexpected(valid.error());
  }

  core::ConfidenceResult result;
  auto& warnings = result.warnings;

  const core::Classification p_class = classifier_.classify(primary.name);
  const core::Classification c_class = classifier_.classify(candidate.name);

  ForbiddenVerdict verdict = forbidden_.check(primary.name, candidate.name, p_class, c_class);
  if (verdict.forbidden) {
    warnings.push_back(std::move(verdict.reason));
    return result;
  }

  auto similarity = scorer_.similarity(primary.name, candidate.name);
  if (!similarity) {
    return std::unexpected(similarity.error());
  }
  double score = *similarity;
  if (score < tuning_.min_name_similarity) {
    warnings.push_back(fmt::format("Very low name similarity: {:.2f}", score));
    return result;
  }

  // Category penalty or bonus.
  if (p_class.type != c_class.type) {
    score *= rules_->penalty_for(p_class.type, c_class.type).value_or(tuning_.default_type_penalty);
    warnings.push_back(fmt::format("Type mismatch: {} vs {}", p_class.type, c_class.type));
  } else if (p_class.subtype != c_class.subtype) {
    if (rules_->is_strict(p_class.qualified()) || rules_->is_strict(c_class.qualified())) {
      score *= tuning_.strict_subtype_penalty;
      warnings.push_back(
          fmt::format("Strict subtype mismatch: {} vs {}", p_class.subtype, c_class.subtype));
    } else {
      score *= tuning_.subtype_penalty;
      warnings.push_back(
          fmt::format("Subtype mismatch: {} vs {}", p_class.subtype, c_class.subtype));
    }
  } else {
    score = std::min(score + tuning_.same_category_bonus, 1.0);
  }

  // Size.
  const core::SizeInfo p_size = extract_size(primary.name);
  const core::SizeInfo c_size = extract_size(candidate.name);
  const double size_sim = size_similarity(p_size, c_size);
  if (size_sim < 0.5) {
    score *= 0.5;
    warnings.push_back(fmt::format("Significant size mismatch: {} vs {}", describe(p_size),
                                   describe(c_size)));
  } else if (size_sim < 0.75) {
    score *= 0.8;
    warnings.push_back(
        fmt::format("Size difference: {} vs {}", describe(p_size), describe(c_size)));
  } else if (size_sim > 0.95) {
    score = std::min(score + 0.05, 1.0);
  }

  // Price sanity.
  if (primary.has_price() && candidate.has_price()) {
    const double hi = std::max(*primary.price, *candidate.price);
    const double lo = std::min(*primary.price, *candidate.price);
    const double ratio = hi / lo;
    if (ratio > 10.0) {
      score *= 0.6;
      warnings.push_back(fmt::format("Large price difference: {:.1f}x", ratio));
    } else if (ratio > 5.0) {
      score *= 0.8;
      warnings.push_back(fmt::format("Price difference: {:.1f}x", ratio));
    }
  }

  // Borderline scrutiny.
  if (score > tuning_.borderline_low && score < tuning_.borderline_high) {
    if (warnings.size() > 2u) {
      score *= 0.8;
    }
    if (common_meaningful_words(primary.name, candidate.name) < 2u) {
      score *= 0.7;
      warnings.emplace_back("Insufficient common meaningful words");
    }
  }

  result.score = std::clamp(score, 0.0, 1.0);
  return result;
}

}  // namespace pricematch::matching

#include <pricematch/matching/similarity_scorer.hpp>
#include <pricematch/matching/size_extractor.hpp>
#include "core/text_utils.hpp"
#include <rapidfuzz/fuzz.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <vector>

namespace pricematch::matching {

namespace detail = pricematch::core::detail;

namespace {

constexpr std::array<std::string_view, 11> kStopWords{
    "the", "and", "or", "of", "in", "with", "for", "pure", "organic", "fresh", "premium"};

constexpr double kNoCommonWordsScore = 0.1;
constexpr double kSameBrandBonus = 0.1;
constexpr double kDifferentBrandFactor = 0.85;

bool is_word_char(char ch) {
  const auto c = static_cast<unsigned char>(ch);
  return std::isalnum(c) != 0 || c == '_' || c >= 0x80;
}

bool is_stop_word(std::string_view w) {
  return std::find(kStopWords.begin(), kStopWords.end(), w) != kStopWords.end();
}

}  // namespace

SimilarityScorer::SimilarityScorer(std::shared_ptr<const rules::RuleSet> rules,
                                   std::unique_ptr<IEmbeddingBackend> backend)
    : rules_(std::move(rules)), cache_(std::move(backend)) {}

std::string SimilarityScorer::normalize_name(std::string_view name) const {
  std::string working(name);
  const core::SizeInfo size = extract_size(name);
  if (size.detected()) {
    detail::replace_all(working, size.original, "");
  }

  working = detail::to_lower(working);
  for (char& c : working) {
    if (!is_word_char(c)) c = ' ';
  }

  std::string out;
  for (const auto& word : detail::split_words(working)) {
    if (is_stop_word(word)) continue;
    if (!out.empty()) out.push_back(' ');
    out += word;
  }
  return out;
}

std::optional<std::string> SimilarityScorer::extract_brand(std::string_view name) const {
  const std::string lower = detail::to_lower(name);
  for (const auto& brand : rules_->brands) {
    if (detail::contains(lower, brand)) return brand;
  }
  return std::nullopt;
}

double SimilarityScorer::lexical_similarity(const std::string& norm_a, const std::string& norm_b) {
  return rapidfuzz::fuzz::token_sort_ratio(norm_a, norm_b) / 100.0;
}

std::expected<void, core::MatchError> SimilarityScorer::prefetch(
    std::span<const std::string> names) {
  std::vector<std::string> normalized;
  normalized.reserve(names.size());
  for (const auto& name : names) {
    std::string norm = normalize_name(name);
    if (!norm.empty()) normalized.push_back(std::move(norm));
  }
  return cache_.prefetch(normalized);
}

std::expected<double, core::MatchError> SimilarityScorer::similarity(std::string_view name_a,
                                                                     std::string_view name_b) {
  const std::string norm_a = normalize_name(name_a);
  const std::string norm_b = normalize_name(name_b);
  if (norm_a.empty() || norm_b.empty()) {
    return 0.0;
  }

  const auto words_a = detail::split_words(norm_a);
  const auto words_b = detail::split_words(norm_b);
  const std::set<std::string> set_a(words_a.begin(), words_a.end());
  const bool any_common = std::any_of(words_b.begin(), words_b.end(),
                                      [&set_a](const std::string& w) { return set_a.contains(w); });
  if (!any_common) {
    return kNoCommonWordsScore;
  }

  auto emb_a = cache_.get(norm_a);
  if (!emb_a) return std::unexpected(emb_a.error());
  auto emb_b = cache_.get(norm_b);
  if (!emb_b) return std::unexpected(emb_b.error());

  const double semantic = cosine_similarity(*emb_a, *emb_b);
  const double lexical = lexical_similarity(norm_a, norm_b);
  double score = kSemanticWeight * semantic + kLexicalWeight * lexical;

  const auto brand_a = extract_brand(name_a);
  const auto brand_b = extract_brand(name_b);
  if (brand_a && brand_b) {
    if (*brand_a == *brand_b) {
      score = std::min(score + kSameBrandBonus, 1.0);
    } else {
      score *= kDifferentBrandFactor;
    }
  }
  return score;
}

}  // namespace pricematch::matching

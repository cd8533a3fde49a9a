#include <pricematch/matching/match_finder.hpp>
#include <pricematch/matching/size_extractor.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <string>

namespace pricematch::matching {

namespace {

constexpr std::size_t kProgressInterval = 50;

}  // namespace

MatchFinder::MatchFinder(std::shared_ptr<const rules::RuleSet> rules,
                         std::unique_ptr<IEmbeddingBackend> backend,
                         ConfidenceTuning tuning)
    : calculator_(std::move(rules), std::move(backend), tuning) {}

std::expected<core::ConfidenceResult, core::MatchError> MatchFinder::score_pair(
    const core::ProductRecord& primary, const core::ProductRecord& candidate,
    std::string& detail) {
  try {
    auto scored = calculator_.confidence(primary, candidate);
    if (!scored) detail = std::string(core::to_string(scored.error()));
    return scored;
  } catch (const std::exception& e) {
    detail = e.what();
    return std::unexpected(core::MatchError::ScoringFailed);
  }
}

std::expected<std::vector<core::ProductMatch>, core::MatchError> MatchFinder::find_matches(
    const core::ProductRecord& primary,
    std::span<const core::ProductRecord> candidates,
    double min_confidence,
    std::size_t max_matches,
    std::vector<PairFailure>* failures) {
  if (auto valid = core::validate_product(primary); !valid) {
    return std::unexpected(valid.error());
  }

  const core::SizeInfo p_size = extract_size(primary.name);
  std::vector<core::ProductMatch> matches;

  for (const auto& candidate : candidates) {
    if (candidate.id == primary.id) continue;

    std::string detail;
    auto scored = score_pair(primary, candidate, detail);
    if (!scored) {
      spdlog::warn("Skipping pair {} / {}: {}", primary.id, candidate.id, detail);
      if (failures) {
        failures->push_back({primary.id, candidate.id, scored.error(), std::move(detail)});
      }
      continue;
    }
    if (scored->score < min_confidence) continue;

    core::ProductMatch match;
    match.primary_id = primary.id;
    match.matched_id = candidate.id;
    match.confidence = scored->score;
    match.match_type = core::match_type_for(scored->score);
    match.size_similarity = size_similarity(p_size, extract_size(candidate.name));
    match.warnings = std::move(scored->warnings);
    matches.push_back(std::move(match));
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const core::ProductMatch& a, const core::ProductMatch& b) {
                     return a.confidence > b.confidence;
                   });
  if (matches.size() > max_matches) {
    matches.resize(max_matches);
  }
  return matches;
}

void MatchFinder::prefetch(std::span<const core::ProductRecord> primaries,
                           std::span<const core::ProductRecord> candidates) {
  std::vector<std::string> names;
  names.reserve(primaries.size() + candidates.size());
  for (const auto& p : primaries) names.push_back(p.name);
  for (const auto& c : candidates) names.push_back(c.name);
  if (auto warmed = calculator_.scorer().prefetch(names); !warmed) {
    spdlog::warn("Embedding prefetch failed ({}); encoding per pair",
                 core::to_string(warmed.error()));
  }
}

BatchResult MatchFinder::batch_match(std::span<const core::ProductRecord> primaries,
                                     std::span<const core::ProductRecord> candidates,
                                     double min_confidence,
                                     std::size_t max_matches) {
  prefetch(primaries, candidates);

  BatchResult out;
  for (std::size_t i = 0; i < primaries.size(); ++i) {
    if (i % kProgressInterval == 0) {
      spdlog::info("Processing {}/{} products", i + 1, primaries.size());
    }
    std::vector<PairFailure> pair_failures;
    auto result = find_matches(primaries[i], candidates, min_confidence, max_matches,
                               &pair_failures);
    append_primary_result(out, primaries[i], std::move(result), std::move(pair_failures));
  }
  spdlog::info("Found {} total matches", out.matches.size());
  return out;
}

void append_primary_result(
    BatchResult& out, const core::ProductRecord& primary,
    std::expected<std::vector<core::ProductMatch>, core::MatchError> result,
    std::vector<PairFailure> pair_failures) {
  if (result) {
    out.matches.insert(out.matches.end(), std::make_move_iterator(result->begin()),
                       std::make_move_iterator(result->end()));
  } else {
    spdlog::warn("Skipping primary product {}: {}", primary.id, core::to_string(result.error()));
    out.failures.push_back(
        {primary.id, std::nullopt, result.error(), std::string(core::to_string(result.error()))});
  }
  out.failures.insert(out.failures.end(), std::make_move_iterator(pair_failures.begin()),
                      std::make_move_iterator(pair_failures.end()));
}

}  // namespace pricematch::matching

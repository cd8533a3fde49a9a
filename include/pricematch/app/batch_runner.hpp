#pragma once

#include <pricematch/core/product.hpp>
#include <pricematch/matching/match_finder.hpp>
#include <cstddef>
#include <span>

namespace pricematch::app {

/// MatchFinder::batch_match spread over a thread pool, one primary per task.
/// Output (matches and failures) is in primary order, identical to the
/// sequential run. num_workers 0 = use hardware concurrency; 1 runs inline.
[[nodiscard]] matching::BatchResult batch_match_parallel(
    matching::MatchFinder& finder,
    std::span<const core::ProductRecord> primaries,
    std::span<const core::ProductRecord> candidates,
    double min_confidence = matching::kDefaultMinConfidence,
    std::size_t max_matches = matching::kDefaultMaxMatches,
    std::size_t num_workers = 0);

}  // namespace pricematch::app

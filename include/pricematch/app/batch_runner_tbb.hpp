#pragma once

#include <pricematch/core/product.hpp>
#include <pricematch/matching/match_finder.hpp>
#include <cstddef>
#include <span>

#ifdef PRICEMATCH_HAS_TBB

namespace pricematch::app {

/// MatchFinder::batch_match with primaries scored in parallel by TBB.
///
/// Each primary is scored by find_matches() from a TBB task; the finder is
/// shared, so its embedding backend must be thread-safe for encode() (the
/// mock and ONNX backends are). Names of both sets are prefetched into the
/// embedding cache first.
///
/// Results are collected per primary and concatenated in primary order, so
/// the output equals the sequential batch_match() output.
[[nodiscard]] matching::BatchResult batch_match_tbb(
    matching::MatchFinder& finder,
    std::span<const core::ProductRecord> primaries,
    std::span<const core::ProductRecord> candidates,
    double min_confidence = matching::kDefaultMinConfidence,
    std::size_t max_matches = matching::kDefaultMaxMatches);

}  // namespace pricematch::app

#endif  // PRICEMATCH_HAS_TBB

#include <pricematch/app/batch_runner_tbb.hpp>

#ifdef PRICEMATCH_HAS_TBB

#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <expected>
#include <vector>

namespace pricematch::app {

matching::BatchResult batch_match_tbb(matching::MatchFinder& finder,
                                      std::span<const core::ProductRecord> primaries,
                                      std::span<const core::ProductRecord> candidates,
                                      double min_confidence,
                                      std::size_t max_matches) {
  const std::size_t n = primaries.size();
  if (n == 0) return {};

  finder.prefetch(primaries, candidates);

  using PrimaryResult = std::expected<std::vector<core::ProductMatch>, core::MatchError>;
  std::vector<PrimaryResult> results(n);
  std::vector<std::vector<matching::PairFailure>> failures(n);

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          results[i] = finder.find_matches(primaries[i], candidates, min_confidence,
                                           max_matches, &failures[i]);
        }
      });

  matching::BatchResult out;
  for (std::size_t i = 0; i < n; ++i) {
    matching::append_primary_result(out, primaries[i], std::move(results[i]),
                                    std::move(failures[i]));
  }
  spdlog::info("Found {} total matches (TBB)", out.matches.size());
  return out;
}

}  // namespace pricematch::app

#endif  // PRICEMATCH_HAS_TBB

#include <pricematch/app/batch_runner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <expected>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pricematch::app {

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

/// Result slot of one primary, filled by whichever worker takes it.
struct PrimarySlot {
  std::expected<std::vector<core::ProductMatch>, core::MatchError> result;
  std::vector<matching::PairFailure> failures;
};

}  // namespace

matching::BatchResult batch_match_parallel(matching::MatchFinder& finder,
                                           std::span<const core::ProductRecord> primaries,
                                           std::span<const core::ProductRecord> candidates,
                                           double min_confidence,
                                           std::size_t max_matches,
                                           std::size_t num_workers) {
  const std::size_t n = primaries.size();
  if (n == 0) return {};

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return finder.batch_match(primaries, candidates, min_confidence, max_matches);
  }

  finder.prefetch(primaries, candidates);

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;
  std::vector<PrimarySlot> slots(n);
  std::atomic<std::size_t> done{0};

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      PrimarySlot& slot = slots[idx];
      slot.result = finder.find_matches(primaries[idx], candidates, min_confidence, max_matches,
                                        &slot.failures);
      const std::size_t finished = ++done;
      if (finished % 50 == 0) {
        spdlog::info("Processed {}/{} products", finished, n);
      }
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  matching::BatchResult out;
  for (std::size_t i = 0; i < n; ++i) {
    matching::append_primary_result(out, primaries[i], std::move(slots[i].result),
                                    std::move(slots[i].failures));
  }
  spdlog::info("Found {} total matches using {} workers", out.matches.size(), workers);
  return out;
}

}  // namespace pricematch::app

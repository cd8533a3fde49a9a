#pragma once

#include <pricematch/matching/embedding_backend.hpp>
#include <atomic>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pricematch::matching {

/// Deterministic backend for tests and demos: hashed bag-of-words vectors,
/// so texts with the same words embed identically and disjoint texts are
/// near-orthogonal. Per-text vectors and failures can be configured.
/// Configure before sharing across threads; encode() only reads.
class MockEmbeddingBackend : public IEmbeddingBackend {
 public:
  explicit MockEmbeddingBackend(int dimension = 64);

  /// Return \p values (normalized) for \p text instead of the hashed vector.
  void set_embedding(std::string text, std::vector<float> values);

  /// Make encode(\p text) fail with EmbeddingFailed.
  void fail_on(std::string text);

  [[nodiscard]] std::expected<Embedding, core::MatchError> encode(std::string_view text) override;

  [[nodiscard]] std::expected<std::vector<Embedding>, core::MatchError> encode_batch(
      std::span<const std::string> texts) override;

  [[nodiscard]] int dimension() const noexcept override { return dimension_; }

  /// Texts encoded so far (single and batch calls).
  [[nodiscard]] std::size_t encode_calls() const noexcept { return encode_calls_.load(); }
  [[nodiscard]] std::size_t batch_calls() const noexcept { return batch_calls_.load(); }

 private:
  [[nodiscard]] std::expected<Embedding, core::MatchError> embed(std::string_view text) const;

  int dimension_;
  std::unordered_map<std::string, std::vector<float>> overrides_;
  std::unordered_set<std::string> failing_;
  std::atomic<std::size_t> encode_calls_{0};
  std::atomic<std::size_t> batch_calls_{0};
};

}  // namespace pricematch::matching

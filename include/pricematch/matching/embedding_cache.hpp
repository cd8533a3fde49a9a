#pragma once

#include <pricematch/core/error.hpp>
#include <pricematch/matching/embedding_backend.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>

namespace pricematch::matching {

/// Text -> embedding memo in front of a backend, so every distinct
/// normalized name is encoded once per run. Thread-safe.
class EmbeddingCache {
 public:
  explicit EmbeddingCache(std::unique_ptr<IEmbeddingBackend> backend);

  /// Encode all texts not yet cached in a single encode_batch() call.
  [[nodiscard]] std::expected<void, core::MatchError> prefetch(std::span<const std::string> texts);

  /// Cached embedding, encoding on a miss.
  [[nodiscard]] std::expected<Embedding, core::MatchError> get(const std::string& text);

  [[nodiscard]] std::size_t size() const;
  void clear();

  [[nodiscard]] IEmbeddingBackend& backend() noexcept { return *backend_; }

 private:
  std::unique_ptr<IEmbeddingBackend> backend_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Embedding> entries_;
};

}  // namespace pricematch::matching

#include <pricematch/matching/embedding_cache.hpp>
#include <mutex>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace pricematch::matching {

EmbeddingCache::EmbeddingCache(std::unique_ptr<IEmbeddingBackend> backend)
    : backend_(std::move(backend)) {
  if (!backend_) {
    throw std::invalid_argument("EmbeddingCache: backend must not be null");
  }
}

std::expected<void, core::MatchError> EmbeddingCache::prefetch(
    std::span<const std::string> texts) {
  std::vector<std::string> missing;
  {
    std::shared_lock lock(mutex_);
    std::unordered_set<std::string> seen;
    for (const auto& text : texts) {
      if (entries_.contains(text) || !seen.insert(text).second) continue;
      missing.push_back(text);
    }
  }
  if (missing.empty()) return {};

  auto encoded = backend_->encode_batch(missing);
  if (!encoded) {
    return std::unexpected(encoded.error());
  }
  if (encoded->size() != missing.size()) {
    return std::unexpected(core::MatchError::EmbeddingFailed);
  }

  std::unique_lock lock(mutex_);
  for (std::size_t i = 0; i < missing.size(); ++i) {
    entries_.try_emplace(std::move(missing[i]), std::move((*encoded)[i]));
  }
  return {};
}

std::expected<Embedding, core::MatchError> EmbeddingCache::get(const std::string& text) {
  {
    std::shared_lock lock(mutex_);
    if (const auto it = entries_.find(text); it != entries_.end()) {
      return it->second;
    }
  }

  auto encoded = backend_->encode(text);
  if (!encoded) {
    return std::unexpected(encoded.error());
  }

  std::unique_lock lock(mutex_);
  return entries_.try_emplace(text, std::move(*encoded)).first->second;
}

std::size_t EmbeddingCache::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void EmbeddingCache::clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
}

}  // namespace pricematch::matching

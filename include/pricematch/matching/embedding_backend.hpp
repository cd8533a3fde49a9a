#pragma once

#include <pricematch/core/error.hpp>
#include <opencv2/core/mat.hpp>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pricematch::matching {

/// Sentence embedding: one row, CV_32F, L2-normalized (empty Mat = no vector).
using Embedding = cv::Mat;

/// Abstract sentence-embedding backend: text -> Embedding.
/// Implement encode() and dimension(); optionally override encode_batch and warmup.
/// encode() may be called from several threads at once.
class IEmbeddingBackend {
 public:
  virtual ~IEmbeddingBackend() = default;

  /// Single text. Must be implemented.
  [[nodiscard]] virtual std::expected<Embedding, core::MatchError> encode(
      std::string_view text) = 0;

  /// Optional: batch encode. Default: loop over encode(). Override to run one model call.
  [[nodiscard]] virtual std::expected<std::vector<Embedding>, core::MatchError> encode_batch(
      std::span<const std::string> texts);

  /// Embedding width; 0 if not known until the first encode.
  [[nodiscard]] virtual int dimension() const noexcept = 0;

  /// Optional: warmup run. Call once after construction. Default: no-op.
  virtual void warmup() {}
};

/// Cosine similarity of two row vectors; 0 when either is empty, zero or the
/// widths differ. Symmetric.
[[nodiscard]] double cosine_similarity(const Embedding& a, const Embedding& b);

}  // namespace pricematch::matching

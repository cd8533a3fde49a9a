#pragma once

#include <pricematch/core/error.hpp>
#include <pricematch/matching/embedding_backend.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace pricematch::matching {

/// ONNX Runtime sentence-embedding backend (MiniLM / BERT style export).
///
/// Expected model inputs, matched by name: input_ids and attention_mask
/// (int64 [batch, seq]) and optionally token_type_ids. Output 0 is either the
/// token states [batch, seq, dim], mean-pooled over the attention mask, or a
/// pooled [batch, dim] sentence embedding. Results are L2-normalized.
///
/// Session::Run is thread-safe, so encode()/encode_batch() may be called
/// concurrently.
class OnnxEmbeddingBackend : public IEmbeddingBackend {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param vocab_path Path to the WordPiece vocab.txt shipped with the model.
  /// \param max_length Token limit per text, including [CLS] and [SEP].
  /// Throws std::runtime_error if the model or vocabulary cannot be loaded.
  OnnxEmbeddingBackend(std::string model_path,
                       std::string vocab_path,
                       std::size_t max_length = 128);

  ~OnnxEmbeddingBackend() override;

  OnnxEmbeddingBackend(const OnnxEmbeddingBackend&) = delete;
  OnnxEmbeddingBackend& operator=(const OnnxEmbeddingBackend&) = delete;

  [[nodiscard]] std::expected<Embedding, core::MatchError> encode(std::string_view text) override;

  [[nodiscard]] std::expected<std::vector<Embedding>, core::MatchError> encode_batch(
      std::span<const std::string> texts) override;

  [[nodiscard]] int dimension() const noexcept override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace pricematch::matching

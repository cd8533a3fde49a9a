#pragma once

#include <pricematch/app/config.hpp>
#include <pricematch/matching/embedding_backend.hpp>
#include <memory>

namespace pricematch::app {

/// Embedding backend selected by \p config. The ONNX backend is warmed up
/// before it is returned. Throws std::runtime_error if the model or vocabulary
/// is missing or cannot be loaded.
[[nodiscard]] std::unique_ptr<matching::IEmbeddingBackend> make_embedding_backend(
    const MatcherConfig& config);

}  // namespace pricematch::app

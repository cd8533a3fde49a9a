#include <pricematch/app/backend_factory.hpp>
#include <pricematch/matching/mock_embedding_backend.hpp>
#include <pricematch/matching/onnx_embedding_backend.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pricematch::app {

std::unique_ptr<matching::IEmbeddingBackend> make_embedding_backend(const MatcherConfig& config) {
  switch (config.backend_type) {
    case EmbeddingBackendType::Onnx: {
      if (config.model_path.empty() || config.vocab_path.empty()) {
        throw std::runtime_error("onnx embedding backend needs model_path and vocab_path");
      }
      auto backend =
          std::make_unique<matching::OnnxEmbeddingBackend>(config.model_path, config.vocab_path);
      backend->warmup();
      return backend;
    }
    case EmbeddingBackendType::Mock:
    default:
      spdlog::info("Using mock embedding backend");
      return std::make_unique<matching::MockEmbeddingBackend>();
  }
}

}  // namespace pricematch::app

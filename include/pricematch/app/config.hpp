#pragma once

#include <cstddef>
#include <string>

namespace pricematch::app {

/// Embedding backend type: mock (hashed bag-of-words) or onnx (real model).
enum class EmbeddingBackendType {
  Mock,
  Onnx,
};

/// Matcher configuration: rule tables, embedding model, thresholds, workers.
struct MatcherConfig {
  std::string rules_dir{"config/rules"};
  EmbeddingBackendType backend_type{EmbeddingBackendType::Mock};
  std::string model_path;
  std::string vocab_path;
  double min_confidence{0.65};
  std::size_t max_matches{3};
  std::size_t num_workers{0};  // 0 = hardware concurrency
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Unknown keys are ignored; values that do not parse keep the default.
MatcherConfig load_config(const std::string& path);

/// Default config when no file is provided.
MatcherConfig default_config();

}  // namespace pricematch::app

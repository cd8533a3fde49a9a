#include <pricematch/matching/onnx_embedding_backend.hpp>
#include <pricematch/matching/wordpiece_tokenizer.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace pricematch::matching {

namespace {

enum class InputRole { InputIds, AttentionMask, TokenTypeIds };

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

InputRole role_for(const std::string& name) {
  if (name.find("input_ids") != std::string::npos) return InputRole::InputIds;
  if (name.find("attention_mask") != std::string::npos) return InputRole::AttentionMask;
  if (name.find("token_type_ids") != std::string::npos) return InputRole::TokenTypeIds;
  throw std::runtime_error("OnnxEmbeddingBackend: unsupported model input '" + name + "'");
}

/// Mean of the token rows of \p hidden (seq x dim) weighted by \p mask (1 x seq).
cv::Mat mean_pool(const cv::Mat& hidden, const cv::Mat& mask) {
  cv::Mat pooled = mask * hidden;
  const double count = cv::sum(mask)[0];
  if (count > 0.0) pooled /= count;
  return pooled;
}

}  // namespace

struct OnnxEmbeddingBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "pricematch"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};
  WordPieceTokenizer tokenizer;

  std::vector<std::string> input_names;
  std::vector<InputRole> input_roles;
  std::vector<const char*> input_name_ptrs;
  std::string output_name;

  std::atomic<int> dimension{0};

  Impl(const std::string& vocab_path, std::size_t max_length)
      : tokenizer(vocab_path, max_length) {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxEmbeddingBackend::OnnxEmbeddingBackend(std::string model_path,
                                           std::string vocab_path,
                                           std::size_t max_length)
    : impl_(std::make_unique<Impl>(vocab_path, max_length)) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  const size_t num_inputs = impl_->session.GetInputCount();
  if (num_inputs == 0) {
    throw std::runtime_error("OnnxEmbeddingBackend: model has no inputs");
  }
  bool has_ids = false;
  for (size_t i = 0; i < num_inputs; ++i) {
    std::string name = impl_->session.GetInputNameAllocated(i, allocator).get();
    const InputRole role = role_for(name);
    has_ids = has_ids || role == InputRole::InputIds;
    impl_->input_roles.push_back(role);
    impl_->input_names.push_back(std::move(name));
  }
  if (!has_ids) {
    throw std::runtime_error("OnnxEmbeddingBackend: model has no input_ids input");
  }
  for (const auto& name : impl_->input_names) {
    impl_->input_name_ptrs.push_back(name.c_str());
  }

  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxEmbeddingBackend: model has no outputs");
  }
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  const auto out_shape =
      impl_->session.GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (!out_shape.empty() && out_shape.back() > 0) {
    impl_->dimension = static_cast<int>(out_shape.back());
  }
  spdlog::info("Loaded embedding model {} ({} inputs, dimension {})", model_path, num_inputs,
               impl_->dimension.load());
}

OnnxEmbeddingBackend::~OnnxEmbeddingBackend() = default;

int OnnxEmbeddingBackend::dimension() const noexcept {
  return impl_->dimension.load();
}

std::expected<Embedding, core::MatchError> OnnxEmbeddingBackend::encode(std::string_view text) {
  const std::array<std::string, 1> one{std::string(text)};
  auto batch = encode_batch(one);
  if (!batch) {
    return std::unexpected(batch.error());
  }
  return std::move(batch->front());
}

std::expected<std::vector<Embedding>, core::MatchError> OnnxEmbeddingBackend::encode_batch(
    std::span<const std::string> texts) {
  if (texts.empty()) return std::vector<Embedding>{};

  std::vector<std::vector<std::int64_t>> token_ids;
  token_ids.reserve(texts.size());
  std::size_t seq_len = 0;
  for (const auto& text : texts) {
    token_ids.push_back(impl_->tokenizer.encode(text));
    seq_len = std::max(seq_len, token_ids.back().size());
  }

  const std::size_t batch = texts.size();
  const std::size_t count = batch * seq_len;
  std::vector<std::int64_t> ids(count, impl_->tokenizer.pad_id());
  std::vector<std::int64_t> mask(count, 0);
  std::vector<std::int64_t> type_ids(count, 0);
  for (std::size_t b = 0; b < batch; ++b) {
    const auto& row = token_ids[b];
    std::copy(row.begin(), row.end(), ids.begin() + static_cast<std::ptrdiff_t>(b * seq_len));
    std::fill_n(mask.begin() + static_cast<std::ptrdiff_t>(b * seq_len), row.size(), 1);
  }

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  const std::array<int64_t, 2> shape{static_cast<int64_t>(batch), static_cast<int64_t>(seq_len)};
  std::vector<Ort::Value> inputs;
  inputs.reserve(impl_->input_roles.size());
  for (const InputRole role : impl_->input_roles) {
    std::vector<std::int64_t>& source = role == InputRole::InputIds        ? ids
                                        : role == InputRole::AttentionMask ? mask
                                                                           : type_ids;
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem_info, source.data(), source.size(),
                                                       shape.data(), shape.size()));
  }

  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;
  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, impl_->input_name_ptrs.data(), inputs.data(),
                                 inputs.size(), output_names_c, 1);
  } catch (const Ort::Exception& e) {
    spdlog::warn("Embedding model run failed: {}", e.what());
    return std::unexpected(core::MatchError::EmbeddingFailed);
  }
  if (outputs.size() != 1u) {
    return std::unexpected(core::MatchError::EmbeddingFailed);
  }

  const auto info = outputs[0].GetTensorTypeAndShapeInfo();
  if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
    return std::unexpected(core::MatchError::EmbeddingFailed);
  }
  const std::vector<int64_t> out_shape = info.GetShape();
  const float* data = outputs[0].GetTensorData<float>();

  std::vector<Embedding> results;
  results.reserve(batch);
  if (out_shape.size() == 3u && out_shape[0] == static_cast<int64_t>(batch)) {
    // Token states [batch, seq, dim]: mean-pool over real tokens.
    const int tokens = static_cast<int>(out_shape[1]);
    const int dim = static_cast<int>(out_shape[2]);
    if (tokens != static_cast<int>(seq_len) || dim <= 0) {
      return std::unexpected(core::MatchError::EmbeddingFailed);
    }
    for (std::size_t b = 0; b < batch; ++b) {
      const cv::Mat hidden(tokens, dim, CV_32F,
                           const_cast<float*>(data + b * static_cast<std::size_t>(tokens) * dim));
      cv::Mat weights(1, tokens, CV_32F);
      for (int t = 0; t < tokens; ++t) {
        weights.at<float>(0, t) = static_cast<float>(mask[b * seq_len + static_cast<std::size_t>(t)]);
      }
      cv::Mat pooled = mean_pool(hidden, weights);
      cv::normalize(pooled, pooled);
      results.push_back(std::move(pooled));
    }
    impl_->dimension = dim;
  } else if (out_shape.size() == 2u && out_shape[0] == static_cast<int64_t>(batch)) {
    // Already pooled [batch, dim].
    const int dim = static_cast<int>(out_shape[1]);
    if (dim <= 0) {
      return std::unexpected(core::MatchError::EmbeddingFailed);
    }
    for (std::size_t b = 0; b < batch; ++b) {
      cv::Mat row = cv::Mat(1, dim, CV_32F, const_cast<float*>(data + b * dim)).clone();
      cv::normalize(row, row);
      results.push_back(std::move(row));
    }
    impl_->dimension = dim;
  } else {
    return std::unexpected(core::MatchError::EmbeddingFailed);
  }
  return results;
}

void OnnxEmbeddingBackend::warmup() {
  if (auto warm = encode("warmup"); !warm) {
    spdlog::warn("Embedding model warmup failed");
  }
}

}  // namespace pricematch::matching

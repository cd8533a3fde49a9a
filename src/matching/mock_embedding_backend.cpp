#include <pricematch/matching/mock_embedding_backend.hpp>
#include "core/text_utils.hpp"
#include <opencv2/core.hpp>
#include <cstdint>

namespace pricematch::matching {

namespace {

std::uint64_t fnv1a(std::string_view s) {
  std::uint64_t h = 1469598103934665603ULL;
  for (const char c : s) {
    h ^= static_cast<unsigned char>(c);
    h *= 1099511628211ULL;
  }
  return h;
}

}  // namespace

MockEmbeddingBackend::MockEmbeddingBackend(int dimension)
    : dimension_(dimension > 0 ? dimension : 64) {}

void MockEmbeddingBackend::set_embedding(std::string text, std::vector<float> values) {
  overrides_[std::move(text)] = std::move(values);
}

void MockEmbeddingBackend::fail_on(std::string text) {
  failing_.insert(std::move(text));
}

std::expected<Embedding, core::MatchError> MockEmbeddingBackend::embed(
    std::string_view text) const {
  const std::string key(text);
  if (failing_.contains(key)) {
    return std::unexpected(core::MatchError::EmbeddingFailed);
  }

  cv::Mat row;
  if (const auto it = overrides_.find(key); it != overrides_.end()) {
    row = cv::Mat(it->second, /*copyData=*/true).reshape(1, 1);
  } else {
    row = cv::Mat::zeros(1, dimension_, CV_32F);
    for (const auto& word : core::detail::split_words(text)) {
      const std::uint64_t h = fnv1a(word);
      const int bucket = static_cast<int>(h % static_cast<std::uint64_t>(dimension_));
      row.at<float>(0, bucket) += (h >> 63) != 0u ? -1.f : 1.f;
    }
  }
  if (cv::norm(row, cv::NORM_L2) > 0.0) {
    cv::normalize(row, row);
  }
  return row;
}

std::expected<Embedding, core::MatchError> MockEmbeddingBackend::encode(std::string_view text) {
  ++encode_calls_;
  return embed(text);
}

std::expected<std::vector<Embedding>, core::MatchError> MockEmbeddingBackend::encode_batch(
    std::span<const std::string> texts) {
  ++batch_calls_;
  std::vector<Embedding> results;
  results.reserve(texts.size());
  for (const auto& text : texts) {
    ++encode_calls_;
    auto one = embed(text);
    if (!one) {
      return std::unexpected(one.error());
    }
    results.push_back(std::move(*one));
  }
  return results;
}

}  // namespace pricematch::matching

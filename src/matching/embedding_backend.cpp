#include <pricematch/matching/embedding_backend.hpp>
#include <opencv2/core.hpp>

namespace pricematch::matching {

std::expected<std::vector<Embedding>, core::MatchError>
IEmbeddingBackend::encode_batch(std::span<const std::string> texts) {
  std::vector<Embedding> results;
  results.reserve(texts.size());
  for (const auto& text : texts) {
    auto single = encode(text);
    if (!single) {
      return std::unexpected(single.error());
    }
    results.push_back(std::move(*single));
  }
  return results;
}

double cosine_similarity(const Embedding& a, const Embedding& b) {
  if (a.empty() || b.empty() || a.total() != b.total() || a.type() != b.type()) {
    return 0.0;
  }
  const double na = cv::norm(a, cv::NORM_L2);
  const double nb = cv::norm(b, cv::NORM_L2);
  if (na == 0.0 || nb == 0.0) return 0.0;
  return a.reshape(1, 1).dot(b.reshape(1, 1)) / (na * nb);
}

}  // namespace pricematch::matching

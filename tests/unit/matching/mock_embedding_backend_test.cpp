#include <pricematch/core/error.hpp>
#include <pricematch/matching/embedding_backend.hpp>
#include <pricematch/matching/mock_embedding_backend.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace nm = pricematch::matching;
namespace nc = pricematch::core;

TEST(MockEmbeddingBackend, SameTextSameVector) {
  nm::MockEmbeddingBackend mock(32);
  EXPECT_EQ(mock.dimension(), 32);
  auto a = mock.encode("basmati rice");
  auto b = mock.encode("basmati rice");
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->cols, 32);
  EXPECT_NEAR(nm::cosine_similarity(*a, *b), 1.0, 1e-6);
  EXPECT_NEAR(cv::norm(*a), 1.0, 1e-6);
}

TEST(MockEmbeddingBackend, OverridesAreNormalized) {
  nm::MockEmbeddingBackend mock;
  mock.set_embedding("tata salt", {3.f, 4.f});
  auto e = mock.encode("tata salt");
  ASSERT_TRUE(e.has_value());
  ASSERT_EQ(e->cols, 2);
  EXPECT_NEAR(e->at<float>(0, 0), 0.6f, 1e-6);
  EXPECT_NEAR(e->at<float>(0, 1), 0.8f, 1e-6);
}

TEST(MockEmbeddingBackend, FailOnReturnsEmbeddingFailed) {
  nm::MockEmbeddingBackend mock;
  mock.fail_on("broken");
  auto e = mock.encode("broken");
  ASSERT_FALSE(e.has_value());
  EXPECT_EQ(e.error(), nc::MatchError::EmbeddingFailed);

  const std::vector<std::string> texts{"fine", "broken"};
  auto batch = mock.encode_batch(texts);
  ASSERT_FALSE(batch.has_value());
  EXPECT_EQ(batch.error(), nc::MatchError::EmbeddingFailed);
}

TEST(MockEmbeddingBackend, BatchCountsCalls) {
  nm::MockEmbeddingBackend mock;
  const std::vector<std::string> texts{"a", "b", "c"};
  auto batch = mock.encode_batch(texts);
  ASSERT_TRUE(batch.has_value());
  EXPECT_EQ(batch->size(), 3u);
  EXPECT_EQ(mock.batch_calls(), 1u);
  EXPECT_EQ(mock.encode_calls(), 3u);
}

TEST(CosineSimilarity, DegenerateInputsScoreZero) {
  const cv::Mat empty;
  const cv::Mat zero = cv::Mat::zeros(1, 4, CV_32F);
  const cv::Mat unit = (cv::Mat_<float>(1, 4) << 1.f, 0.f, 0.f, 0.f);
  const cv::Mat wide = cv::Mat::ones(1, 8, CV_32F);
  EXPECT_DOUBLE_EQ(nm::cosine_similarity(empty, unit), 0.0);
  EXPECT_DOUBLE_EQ(nm::cosine_similarity(zero, unit), 0.0);
  EXPECT_DOUBLE_EQ(nm::cosine_similarity(unit, wide), 0.0);

  const cv::Mat other = (cv::Mat_<float>(1, 4) << 0.f, 1.f, 0.f, 0.f);
  EXPECT_NEAR(nm::cosine_similarity(unit, other), 0.0, 1e-12);
  EXPECT_NEAR(nm::cosine_similarity(unit, unit), 1.0, 1e-12);
}

#include <pricematch/core/error.hpp>
#include <pricematch/matching/embedding_cache.hpp>
#include <pricematch/matching/mock_embedding_backend.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace nm = pricematch::matching;
namespace nc = pricematch::core;

TEST(EmbeddingCache, RejectsNullBackend) {
  EXPECT_THROW(nm::EmbeddingCache(nullptr), std::invalid_argument);
}

TEST(EmbeddingCache, PrefetchEncodesDistinctMissingTextsInOneBatch) {
  auto mock = std::make_unique<nm::MockEmbeddingBackend>();
  nm::MockEmbeddingBackend* raw = mock.get();
  nm::EmbeddingCache cache(std::move(mock));

  const std::vector<std::string> texts{"tata salt", "amul butter", "tata salt", "basmati rice"};
  ASSERT_TRUE(cache.prefetch(texts).has_value());
  EXPECT_EQ(raw->batch_calls(), 1u);
  EXPECT_EQ(raw->encode_calls(), 3u);
  EXPECT_EQ(cache.size(), 3u);

  // Already cached: no further backend work.
  ASSERT_TRUE(cache.prefetch(texts).has_value());
  auto hit = cache.get("amul butter");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(raw->batch_calls(), 1u);
  EXPECT_EQ(raw->encode_calls(), 3u);
}

TEST(EmbeddingCache, GetEncodesOnMissOnce) {
  auto mock = std::make_unique<nm::MockEmbeddingBackend>();
  nm::MockEmbeddingBackend* raw = mock.get();
  nm::EmbeddingCache cache(std::move(mock));

  ASSERT_TRUE(cache.get("moong dal").has_value());
  ASSERT_TRUE(cache.get("moong dal").has_value());
  EXPECT_EQ(raw->encode_calls(), 1u);
  EXPECT_EQ(cache.size(), 1u);

  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
}

TEST(EmbeddingCache, FailuresAreNotCached) {
  auto mock = std::make_unique<nm::MockEmbeddingBackend>();
  mock->fail_on("bad");
  nm::EmbeddingCache cache(std::move(mock));

  const std::vector<std::string> texts{"good", "bad"};
  auto prefetched = cache.prefetch(texts);
  ASSERT_FALSE(prefetched.has_value());
  EXPECT_EQ(prefetched.error(), nc::MatchError::EmbeddingFailed);
  EXPECT_EQ(cache.size(), 0u);

  auto got = cache.get("bad");
  ASSERT_FALSE(got.has_value());
  EXPECT_EQ(got.error(), nc::MatchError::EmbeddingFailed);
  EXPECT_TRUE(cache.get("good").has_value());
  EXPECT_EQ(cache.size(), 1u);
}

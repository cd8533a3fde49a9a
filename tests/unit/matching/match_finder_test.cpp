#include <pricematch/core/error.hpp>
#include <pricematch/core/product.hpp>
#include <pricematch/matching/match_finder.hpp>
#include <pricematch/matching/mock_embedding_backend.hpp>
#include "test_rules.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace nm = pricematch::matching;
namespace nc = pricematch::core;

namespace {

nc::ProductRecord product(std::int64_t id, std::string name) {
  nc::ProductRecord p;
  p.id = id;
  p.name = std::move(name);
  return p;
}

std::vector<nc::ProductRecord> competitor_catalogue() {
  return {
      product(1, "Tata Salt 1kg"),          // same id as the primary below
      product(2, "Tata Salt 1kg"),
      product(3, "Tata Rock Salt 1kg"),
      product(4, "Amul Butter 500g"),
      product(5, "Tata Salt 1kg"),
      product(6, "Everest Turmeric Powder 200g"),
  };
}

/// "tata salt" and "tata rock salt" embed orthogonally, so the rock salt
/// candidate scores clearly below the exact duplicates.
std::unique_ptr<nm::MockEmbeddingBackend> make_backend() {
  auto mock = std::make_unique<nm::MockEmbeddingBackend>();
  mock->set_embedding("tata salt", {1.f, 0.f});
  mock->set_embedding("tata rock salt", {0.f, 1.f});
  return mock;
}

}  // namespace

TEST(MatchFinder, RespectsLimitSelfExclusionAndOrdering) {
  nm::MatchFinder finder(pricematch::test::grocery_rules(), make_backend());
  const auto candidates = competitor_catalogue();
  const auto primary = product(1, "Tata Salt 1kg");

  for (std::size_t max_matches : {1u, 2u, 3u, 10u}) {
    auto matches = finder.find_matches(primary, candidates, 0.0, max_matches);
    ASSERT_TRUE(matches.has_value());
    EXPECT_LE(matches->size(), max_matches);
    for (std::size_t i = 0; i < matches->size(); ++i) {
      EXPECT_NE((*matches)[i].matched_id, primary.id);
      EXPECT_EQ((*matches)[i].primary_id, primary.id);
      if (i > 0) EXPECT_GE((*matches)[i - 1].confidence, (*matches)[i].confidence);
    }
  }
}

TEST(MatchFinder, ExactDuplicatesComeFirstInCandidateOrder) {
  nm::MatchFinder finder(pricematch::test::grocery_rules(), make_backend());
  const auto candidates = competitor_catalogue();
  auto matches = finder.find_matches(product(1, "Tata Salt 1kg"), candidates, 0.65, 2);
  ASSERT_TRUE(matches.has_value());
  ASSERT_EQ(matches->size(), 2u);
  EXPECT_EQ((*matches)[0].matched_id, 2);
  EXPECT_EQ((*matches)[1].matched_id, 5);
  EXPECT_EQ((*matches)[0].match_type, nc::MatchType::Exact);
  EXPECT_DOUBLE_EQ((*matches)[0].size_similarity, 1.0);

  auto all = finder.find_matches(product(1, "Tata Salt 1kg"), candidates, 0.65, 10);
  ASSERT_TRUE(all.has_value());
  ASSERT_EQ(all->size(), 3u);
  EXPECT_EQ((*all)[2].matched_id, 3);
  EXPECT_LT((*all)[2].confidence, 0.9);
  EXPECT_EQ((*all)[2].match_type, nc::MatchType::Similar);
}

TEST(MatchFinder, MinConfidenceFilters) {
  nm::MatchFinder finder(pricematch::test::grocery_rules(), make_backend());
  const auto candidates = competitor_catalogue();
  auto matches = finder.find_matches(product(1, "Tata Salt 1kg"), candidates, 0.65, 10);
  ASSERT_TRUE(matches.has_value());
  for (const auto& m : *matches) {
    EXPECT_GE(m.confidence, 0.65);
    EXPECT_NE(m.matched_id, 4);  // no common words
    EXPECT_NE(m.matched_id, 6);
  }
}

TEST(MatchFinder, InvalidPrimaryFails) {
  nm::MatchFinder finder(pricematch::test::grocery_rules(), make_backend());
  const auto candidates = competitor_catalogue();
  auto matches = finder.find_matches(product(9, ""), candidates);
  ASSERT_FALSE(matches.has_value());
  EXPECT_EQ(matches.error(), nc::MatchError::InvalidProduct);
}

TEST(MatchFinder, EmbeddingFailureSkipsOnlyThatPair) {
  auto mock = make_backend();
  mock->fail_on("tata rock salt");
  nm::MatchFinder finder(pricematch::test::grocery_rules(), std::move(mock));
  auto candidates = competitor_catalogue();
  candidates.push_back(product(7, ""));

  std::vector<nm::PairFailure> failures;
  auto matches = finder.find_matches(product(1, "Tata Salt 1kg"), candidates, 0.65, 10, &failures);
  ASSERT_TRUE(matches.has_value());
  EXPECT_EQ(matches->size(), 2u);

  ASSERT_EQ(failures.size(), 2u);
  EXPECT_EQ(failures[0].candidate_id, std::optional<std::int64_t>(3));
  EXPECT_EQ(failures[0].error, nc::MatchError::EmbeddingFailed);
  EXPECT_EQ(failures[1].candidate_id, std::optional<std::int64_t>(7));
  EXPECT_EQ(failures[1].error, nc::MatchError::InvalidProduct);
}

TEST(MatchFinder, BatchMatchConcatenatesInPrimaryOrderAndRecordsFailures) {
  auto mock = make_backend();
  nm::MockEmbeddingBackend* raw = mock.get();
  nm::MatchFinder finder(pricematch::test::grocery_rules(), std::move(mock));

  const std::vector<nc::ProductRecord> primaries{
      product(100, "Tata Salt 1kg"), product(101, " "), product(102, "Amul Butter 500g")};
  const auto candidates = competitor_catalogue();
  const auto result = finder.batch_match(primaries, candidates, 0.65, 3);

  ASSERT_FALSE(result.matches.empty());
  EXPECT_EQ(result.matches.front().primary_id, 100);
  EXPECT_EQ(result.matches.back().primary_id, 102);
  EXPECT_EQ(result.matches.back().matched_id, 4);

  ASSERT_EQ(result.failures.size(), 1u);
  EXPECT_EQ(result.failures[0].primary_id, 101);
  EXPECT_FALSE(result.failures[0].candidate_id.has_value());
  EXPECT_EQ(result.failures[0].error, nc::MatchError::InvalidProduct);

  // Prefetch encoded every name in one batch.
  EXPECT_EQ(raw->batch_calls(), 1u);
}

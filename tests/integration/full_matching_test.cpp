#include <pricematch/app/batch_runner.hpp>
#include <pricematch/app/product_loader.hpp>
#include <pricematch/core/product_match.hpp>
#include <pricematch/matching/match_finder.hpp>
#include <pricematch/matching/match_validator.hpp>
#include <pricematch/matching/mock_embedding_backend.hpp>
#include <pricematch/rules/rule_loader.hpp>
#include "temp_dir.hpp"
#include "test_rules.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>

namespace na = pricematch::app;
namespace nm = pricematch::matching;
namespace nc = pricematch::core;
namespace nr = pricematch::rules;

namespace {

const nc::ProductMatch* find_match(const nm::BatchResult& batch, std::int64_t primary,
                                   std::int64_t competitor) {
  const auto it = std::find_if(batch.matches.begin(), batch.matches.end(),
                               [&](const nc::ProductMatch& m) {
                                 return m.primary_id == primary && m.matched_id == competitor;
                               });
  return it == batch.matches.end() ? nullptr : &*it;
}

}  // namespace

TEST(FullMatching, FilesToValidatedMatches) {
  pricematch::test::TempDir dir("full_matching_test");
  dir.write(nr::kClassificationsFile, pricematch::test::classifications_doc().dump());
  dir.write(nr::kForbiddenFile, pricematch::test::forbidden_doc().dump());
  dir.write(nr::kSynonymsFile, pricematch::test::synonyms_doc().dump());
  dir.write(nr::kBrandsFile, pricematch::test::brands_doc().dump());

  const auto primary_path = dir.write("ours.json", R"([
    {"id": 1, "name": "Tata Salt 1kg", "price": 1.2},
    {"id": 2, "name": "Basmati Rice 1 kg", "price": 10.0},
    {"id": 3, "name": "Aashirvaad Atta 5kg", "price": 6.5},
    {"name": "missing id"}
  ])");
  const auto competitor_path = dir.write("theirs.json", R"([
    {"id": 101, "name": "Tata Salt 1 kg", "price": 1.1},
    {"id": 103, "name": "Basmati Rice 1kg", "price": 100.0},
    {"id": 104, "name": "Basmati Rice Flour 1kg", "price": 2.0}
  ])");

  const auto primaries = na::load_products(primary_path);
  const auto competitors = na::load_products(competitor_path);
  ASSERT_TRUE(primaries.has_value());
  ASSERT_TRUE(competitors.has_value());
  ASSERT_EQ(primaries->size(), 3u);

  nm::MatchFinder finder(nr::load_rule_set(dir.path()),
                         std::make_unique<nm::MockEmbeddingBackend>());
  const auto batch = na::batch_match_parallel(finder, *primaries, *competitors, 0.3, 3, 2);
  EXPECT_TRUE(batch.failures.empty());

  const auto* salt = find_match(batch, 1, 101);
  ASSERT_NE(salt, nullptr);
  EXPECT_EQ(salt->match_type, nc::MatchType::Exact);
  EXPECT_DOUBLE_EQ(salt->size_similarity, 1.0);

  const auto* rice = find_match(batch, 2, 103);
  ASSERT_NE(rice, nullptr);
  EXPECT_NEAR(rice->confidence, 0.8, 1e-9);

  for (const auto& m : batch.matches) {
    EXPECT_GE(m.confidence, 0.3);
    EXPECT_NE(m.primary_id, 3);  // no competitor shares a word with the atta
  }

  const auto report = nm::MatchValidator{}.validate(batch.matches, *primaries, *competitors);
  EXPECT_EQ(report.total(), batch.matches.size());
  EXPECT_TRUE(std::any_of(report.validated.begin(), report.validated.end(),
                          [](const nc::ProductMatch& m) { return m.matched_id == 101; }));
  const auto rejected = std::find_if(report.rejected.begin(), report.rejected.end(),
                                     [](const nm::RejectedMatch& r) {
                                       return r.match.primary_id == 2 && r.match.matched_id == 103;
                                     });
  ASSERT_NE(rejected, report.rejected.end());
  EXPECT_EQ(rejected->reason, "Extreme per-unit price difference: 900.0%");
}

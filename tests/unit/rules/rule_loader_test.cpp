#include <pricematch/rules/rule_loader.hpp>
#include <pricematch/rules/rule_set.hpp>
#include "temp_dir.hpp"
#include "test_rules.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace nr = pricematch::rules;

using pricematch::test::TempDir;

TEST(RuleLoader, BuildsTaxonomyInDeclarationOrder) {
  auto rules = pricematch::test::grocery_rules();
  ASSERT_GE(rules->categories.size(), 3u);
  EXPECT_EQ(rules->categories[0].type, "salt");
  EXPECT_EQ(rules->categories[1].subtype, "basmati");
  EXPECT_EQ(rules->categories[1].keywords.size(), 2u);
  EXPECT_TRUE(rules->is_strict("lentils:toor"));
  EXPECT_FALSE(rules->is_strict("lentils"));
  ASSERT_EQ(rules->incompatible_categories.size(), 1u);
  EXPECT_EQ(rules->incompatible_categories[0].first, "snacks");
}

TEST(RuleLoader, ForbiddenPairsAreSymmetric) {
  auto rules = pricematch::test::grocery_rules();
  EXPECT_TRUE(rules->is_forbidden_pair("rice", "flour"));
  EXPECT_TRUE(rules->is_forbidden_pair("flour", "rice"));
  EXPECT_TRUE(rules->is_forbidden_pair("flour:besan", "flour:atta"));
  EXPECT_FALSE(rules->is_forbidden_pair("rice", "salt"));
  EXPECT_EQ(rules->forbidden_pairs.size(), 4u);
}

TEST(RuleLoader, MalformedPatternsAreDropped) {
  auto rules = pricematch::test::grocery_rules();
  ASSERT_EQ(rules->forbidden_patterns.size(), 3u);
  EXPECT_EQ(rules->forbidden_patterns[0].source, "whole|seeds vs powder|ground");

  const auto& sweets = rules->forbidden_patterns[1];
  EXPECT_EQ(sweets.source, "sweets:generic vs snacks");
  ASSERT_TRUE(std::holds_alternative<nr::CategoryTerm>(sweets.left));
  EXPECT_EQ(std::get<nr::CategoryTerm>(sweets.left).subtype, "generic");
  ASSERT_TRUE(std::holds_alternative<nr::KeywordTerm>(sweets.right));
  EXPECT_EQ(std::get<nr::KeywordTerm>(sweets.right).keyword, "snacks");

  const auto& ghee = rules->forbidden_patterns[2];
  EXPECT_TRUE(std::holds_alternative<nr::KeywordTerm>(ghee.left));
  ASSERT_TRUE(std::holds_alternative<nr::AlternationTerm>(ghee.right));
  EXPECT_EQ(std::get<nr::AlternationTerm>(ghee.right).options.size(), 2u);
}

TEST(RuleLoader, PenaltyMultipliersByTypePair) {
  auto rules = pricematch::test::grocery_rules();
  auto penalty = rules->penalty_for("rice", "lentils");
  ASSERT_TRUE(penalty.has_value());
  EXPECT_DOUBLE_EQ(*penalty, 0.2);
  EXPECT_FALSE(rules->penalty_for("rice", "salt").has_value());
}

TEST(RuleLoader, SynonymGroupsWithoutTermsAreSkippedAndBrandsLowercased) {
  auto rules = pricematch::test::grocery_rules();
  ASSERT_EQ(rules->synonyms.size(), 1u);
  EXPECT_EQ(rules->synonyms[0].canonical, "toor");
  ASSERT_EQ(rules->brands.size(), 4u);
  EXPECT_EQ(rules->brands[0], "tata");
}

TEST(RuleLoader, WrongShapedDocumentsDegradeToEmpty) {
  const nlohmann::json not_object = nlohmann::json::array();
  auto rules = nr::make_rule_set(not_object, nlohmann::json(), not_object, nlohmann::json());
  EXPECT_TRUE(rules->categories.empty());
  EXPECT_TRUE(rules->forbidden_pairs.empty());
  EXPECT_TRUE(rules->synonyms.empty());
  EXPECT_TRUE(rules->brands.empty());
}

TEST(RuleLoader, MissingDirectoryYieldsEmptyRuleSet) {
  auto rules = nr::load_rule_set("/nonexistent/pricematch/rules");
  ASSERT_NE(rules, nullptr);
  EXPECT_TRUE(rules->categories.empty());
  EXPECT_TRUE(rules->forbidden_patterns.empty());
  EXPECT_TRUE(rules->penalty_multipliers.empty());
}

TEST(RuleLoader, LoadsFilesAndToleratesInvalidJson) {
  TempDir dir("rule_loader_test");
  dir.write(nr::kClassificationsFile, pricematch::test::classifications_doc().dump());
  dir.write(nr::kForbiddenFile, "{ this is not json");
  dir.write(nr::kBrandsFile, R"({"known_brands": ["MDH"]})");

  auto rules = nr::load_rule_set(dir.path());
  EXPECT_EQ(rules->categories.size(), pricematch::test::classifications_doc()["categories"].size());
  EXPECT_TRUE(rules->forbidden_pairs.empty());
  EXPECT_TRUE(rules->synonyms.empty());
  ASSERT_EQ(rules->brands.size(), 1u);
  EXPECT_EQ(rules->brands[0], "mdh");
}

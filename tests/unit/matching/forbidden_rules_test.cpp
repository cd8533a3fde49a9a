#include <pricematch/matching/category_classifier.hpp>
#include <pricematch/matching/forbidden_rules.hpp>
#include "test_rules.hpp"
#include <gtest/gtest.h>
#include <string>

namespace nm = pricematch::matching;

namespace {

class ForbiddenRulesTest : public ::testing::Test {
 protected:
  nm::ForbiddenVerdict check(const std::string& a, const std::string& b) const {
    return engine_.check(a, b, classifier_.classify(a), classifier_.classify(b));
  }

  std::shared_ptr<const pricematch::rules::RuleSet> rules_ = pricematch::test::grocery_rules();
  nm::CategoryClassifier classifier_{rules_};
  nm::ForbiddenRuleEngine engine_{rules_};
};

}  // namespace

TEST_F(ForbiddenRulesTest, AllowsUnrelatedRules) {
  const auto verdict = check("Tata Salt 1kg", "Tata Salt 1kg");
  EXPECT_FALSE(verdict.forbidden);
  EXPECT_TRUE(verdict.reason.empty());
}

TEST_F(ForbiddenRulesTest, BareTypePair) {
  const auto verdict = check("Basmati Rice 5kg", "Aashirvaad Atta 5kg");
  EXPECT_TRUE(verdict.forbidden);
  EXPECT_EQ(verdict.reason, "Forbidden type combination: rice vs flour");
}

TEST_F(ForbiddenRulesTest, QualifiedCategoryPair) {
  const auto verdict = check("Aashirvaad Atta 5kg", "Besan Flour 1kg");
  EXPECT_TRUE(verdict.forbidden);
  EXPECT_EQ(verdict.reason, "Forbidden type combination: flour:atta vs flour:besan");
}

TEST_F(ForbiddenRulesTest, AlternationPatternInBothOrientations) {
  const auto forward = check("Jeera Seeds 100g", "Jeera Ground 100g");
  EXPECT_TRUE(forward.forbidden);
  EXPECT_EQ(forward.reason, "Matches forbidden pattern: whole|seeds vs powder|ground");

  const auto reverse = check("Jeera Ground 100g", "Jeera Seeds 100g");
  EXPECT_TRUE(reverse.forbidden);
  EXPECT_EQ(reverse.reason, forward.reason);
}

TEST_F(ForbiddenRulesTest, CategoryTermAgainstKeywordInBothOrientations) {
  const std::string expected = "Matches forbidden pattern: sweets:generic vs snacks";

  const auto category_primary = check("Kaju Barfi 250g", "Haldiram Snacks Mix 200g");
  EXPECT_TRUE(category_primary.forbidden);
  EXPECT_EQ(category_primary.reason, expected);

  const auto category_candidate = check("Haldiram Snacks Mix 200g", "Kaju Barfi 250g");
  EXPECT_TRUE(category_candidate.forbidden);
  EXPECT_EQ(category_candidate.reason, expected);
}

TEST_F(ForbiddenRulesTest, CategoryTermNeedsTheClassification) {
  // "snacks" appears in both names but neither is classified as sweets.
  const auto verdict = check("Haldiram Snacks Mix 200g", "Bikano Party Snacks 200g");
  EXPECT_FALSE(verdict.forbidden);
}

TEST_F(ForbiddenRulesTest, KeywordAgainstAlternationInBothOrientations) {
  const std::string expected = "Matches forbidden pattern: ghee vs oil|vanaspati";

  const auto forward = check("Amul Ghee 1l", "Fortune Sunflower Oil 1l");
  EXPECT_TRUE(forward.forbidden);
  EXPECT_EQ(forward.reason, expected);

  const auto reverse = check("Dalda Vanaspati 1l", "Amul Ghee 1l");
  EXPECT_TRUE(reverse.forbidden);
  EXPECT_EQ(reverse.reason, expected);

  EXPECT_FALSE(check("Amul Ghee 1l", "Gowardhan Ghee 1l").forbidden);
}

TEST_F(ForbiddenRulesTest, IncompatibleCategories) {
  const auto verdict = check("Bikaji Bhujia 400g", "Everest Garam Masala 100g");
  EXPECT_TRUE(verdict.forbidden);
  EXPECT_EQ(verdict.reason, "Incompatible categories: snacks vs spice");
}

TEST_F(ForbiddenRulesTest, DifferentNamedSpices) {
  const auto verdict = check("Everest Turmeric Powder 200g", "Badshah Coriander Powder 200g");
  EXPECT_TRUE(verdict.forbidden);
  EXPECT_EQ(verdict.reason, "Different spices: turmeric vs coriander");
}

TEST_F(ForbiddenRulesTest, BakingAgentsAgainstSpices) {
  const auto verdict = check("Baking Soda 200g", "Chili Flakes 200g");
  EXPECT_TRUE(verdict.forbidden);
  EXPECT_EQ(verdict.reason, "Baking agents cannot match with spices");
}

TEST_F(ForbiddenRulesTest, CoconutAgainstCurry) {
  const auto verdict = check("Coconut Milk 400ml", "Thai Curry Paste 400g");
  EXPECT_TRUE(verdict.forbidden);
  EXPECT_EQ(verdict.reason, "Coconut products cannot match with curry products");
}

TEST(CriticalExclusions, SameSpiceIsAllowed) {
  EXPECT_FALSE(nm::check_critical_exclusions("mdh cumin 100g", "everest cumin 200g").has_value());
  EXPECT_FALSE(nm::check_critical_exclusions("tata salt", "amul butter").has_value());
}

#include <pricematch/matching/category_classifier.hpp>
#include "test_rules.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace nm = pricematch::matching;
namespace nc = pricematch::core;

TEST(CategoryClassifier, FallsBackToOtherGeneric) {
  nm::CategoryClassifier classifier(pricematch::test::grocery_rules());
  EXPECT_EQ(classifier.classify("Paper Towels 6 pack"), (nc::Classification{"other", "generic"}));
}

TEST(CategoryClassifier, MoreKeywordsOutrankBroaderCategory) {
  nm::CategoryClassifier classifier(pricematch::test::grocery_rules());
  // Both rice:basmati (2 keywords) and rice:generic (1 keyword) match.
  EXPECT_EQ(classifier.classify("India Gate Basmati Rice 5kg"),
            (nc::Classification{"rice", "basmati"}));
  EXPECT_EQ(classifier.classify("Sona Rice 5kg"), (nc::Classification{"rice", "generic"}));
}

TEST(CategoryClassifier, TieGoesToFirstDeclaredCategory) {
  nm::CategoryClassifier classifier(pricematch::test::grocery_rules());
  // lentils:toor and lentils:moong both have two keywords.
  EXPECT_EQ(classifier.classify("Moong Toor Mix"), (nc::Classification{"lentils", "toor"}));
}

TEST(CategoryClassifier, SynonymsRewriteBeforeMatching) {
  nm::CategoryClassifier classifier(pricematch::test::grocery_rules());
  EXPECT_EQ(classifier.canonicalize("Tuvar Dal 2LB"), "toor dal 2lb");
  EXPECT_EQ(classifier.classify("Tuvar Dal 2lb"), (nc::Classification{"lentils", "toor"}));
  EXPECT_EQ(classifier.classify("ARHAR dal"), (nc::Classification{"lentils", "toor"}));
}

TEST(CategoryClassifier, IsDeterministic) {
  nm::CategoryClassifier classifier(pricematch::test::grocery_rules());
  const std::vector<std::string> names{"Everest Turmeric Powder 200g", "Bikaji Bhujia",
                                       "Aashirvaad Whole Wheat Atta 10lb", "Amul Butter"};
  for (const auto& name : names) {
    const auto first = classifier.classify(name);
    for (int i = 0; i < 5; ++i) {
      EXPECT_EQ(classifier.classify(name), first) << name;
    }
  }
}

TEST(CategoryClassifier, EmptyRulesClassifyEverythingAsOther) {
  nm::CategoryClassifier classifier(std::make_shared<const pricematch::rules::RuleSet>());
  EXPECT_EQ(classifier.classify("Basmati Rice"), (nc::Classification{"other", "generic"}));
}

#pragma once

#include <pricematch/rules/rule_set.hpp>
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <memory>

namespace pricematch::rules {

/// File names looked up inside a rules directory.
inline constexpr const char* kClassificationsFile = "classifications.json";
inline constexpr const char* kForbiddenFile = "forbidden.json";
inline constexpr const char* kSynonymsFile = "synonyms.json";
inline constexpr const char* kBrandsFile = "brands.json";

/// Table parsers. Each fills its part of \p rules from one document and never
/// throws: wrong-typed entries are skipped (debug log), a non-object document
/// leaves the tables untouched.
void apply_classifications(const nlohmann::json& doc, RuleSet& rules);
void apply_forbidden(const nlohmann::json& doc, RuleSet& rules);
void apply_synonyms(const nlohmann::json& doc, RuleSet& rules);
void apply_brands(const nlohmann::json& doc, RuleSet& rules);

/// Build a RuleSet from four in-memory documents (null documents are allowed).
[[nodiscard]] std::shared_ptr<const RuleSet> make_rule_set(const nlohmann::json& classifications,
                                                           const nlohmann::json& forbidden,
                                                           const nlohmann::json& synonyms,
                                                           const nlohmann::json& brands);

/// Load the four rule documents from \p dir. Missing or unparsable files
/// degrade to empty tables with a warning; this never fails.
[[nodiscard]] std::shared_ptr<const RuleSet> load_rule_set(const std::filesystem::path& dir);

}  // namespace pricematch::rules

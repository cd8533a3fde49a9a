#include <pricematch/rules/rule_loader.hpp>
#include "core/text_utils.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <string>
#include <variant>

namespace pricematch::rules {

namespace detail = pricematch::core::detail;
using nlohmann::json;

namespace {

/// Two-element array of strings, or nullopt.
std::optional<TokenPair> as_token_pair(const json& entry) {
  if (!entry.is_array() || entry.size() != 2u) return std::nullopt;
  if (!entry[0].is_string() || !entry[1].is_string()) return std::nullopt;
  return TokenPair{entry[0].get<std::string>(), entry[1].get<std::string>()};
}

std::vector<std::string> lowercase_strings(const json& arr) {
  std::vector<std::string> out;
  if (!arr.is_array()) return out;
  for (const auto& v : arr) {
    if (!v.is_string()) continue;
    std::string s = detail::to_lower(detail::trim(v.get<std::string>()));
    if (!s.empty()) out.push_back(std::move(s));
  }
  return out;
}

bool is_category_token(const std::string& token) {
  const auto term = parse_pattern_term(token);
  return term && std::holds_alternative<CategoryTerm>(*term);
}

json read_document(const std::filesystem::path& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("Rule file {} not found, using empty table", path.string());
    return json();
  }
  json doc = json::parse(f, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    spdlog::warn("Rule file {} is not valid JSON, using empty table", path.string());
    return json();
  }
  return doc;
}

}  // namespace

void apply_classifications(const json& doc, RuleSet& rules) {
  if (!doc.is_object()) return;

  if (const auto it = doc.find("categories"); it != doc.end() && it->is_array()) {
    for (const auto& entry : *it) {
      if (!entry.is_object() || !entry.contains("type") || !entry["type"].is_string()) {
        spdlog::debug("Skipping taxonomy entry without a type: {}", entry.dump());
        continue;
      }
      TaxonomyCategory category;
      category.type = entry["type"].get<std::string>();
      if (entry.contains("subtype") && entry["subtype"].is_string()) {
        category.subtype = entry["subtype"].get<std::string>();
      }
      if (entry.contains("keywords")) {
        category.keywords = lowercase_strings(entry["keywords"]);
      }
      rules.categories.push_back(std::move(category));
    }
  }

  const auto mr = doc.find("matching_rules");
  if (mr == doc.end() || !mr->is_object()) return;

  if (const auto strict = mr->find("strict_category_matching");
      strict != mr->end() && strict->is_array()) {
    for (const auto& v : *strict) {
      if (v.is_string()) rules.strict_categories.insert(v.get<std::string>());
    }
  }
  if (const auto incompat = mr->find("incompatible_categories");
      incompat != mr->end() && incompat->is_array()) {
    for (const auto& entry : *incompat) {
      if (auto pair = as_token_pair(entry)) {
        rules.incompatible_categories.push_back(std::move(*pair));
      } else {
        spdlog::debug("Skipping malformed incompatible pair: {}", entry.dump());
      }
    }
  }
}

void apply_forbidden(const json& doc, RuleSet& rules) {
  if (!doc.is_object()) return;

  if (const auto it = doc.find("pairs"); it != doc.end() && it->is_array()) {
    for (const auto& entry : *it) {
      auto pair = as_token_pair(entry);
      if (!pair) {
        spdlog::debug("Skipping malformed forbidden pair: {}", entry.dump());
        continue;
      }
      auto& [a, b] = *pair;
      const bool plain = !is_pattern_token(a) && !is_pattern_token(b);
      if (plain || (is_category_token(a) && is_category_token(b))) {
        rules.forbidden_pairs.insert({a, b});
        rules.forbidden_pairs.insert({b, a});
        continue;
      }
      if (auto rule = parse_pattern_rule(a, b)) {
        rules.forbidden_patterns.push_back(std::move(*rule));
      } else {
        spdlog::debug("Dropping unparsable forbidden pattern: {} vs {}", a, b);
      }
    }
  }

  const auto r = doc.find("rules");
  if (r == doc.end() || !r->is_object()) return;
  const auto pm = r->find("penalty_multipliers");
  if (pm == r->end() || !pm->is_object()) return;
  for (const auto& [key, value] : pm->items()) {
    if (value.is_number()) {
      rules.penalty_multipliers[key] = value.get<double>();
    }
  }
}

void apply_synonyms(const json& doc, RuleSet& rules) {
  if (!doc.is_object()) return;
  const auto it = doc.find("groups");
  if (it == doc.end() || !it->is_array()) return;
  for (const auto& entry : *it) {
    if (!entry.is_object() || !entry.contains("canonical") || !entry["canonical"].is_string()) {
      continue;
    }
    SynonymGroup group;
    group.canonical = detail::to_lower(entry["canonical"].get<std::string>());
    if (entry.contains("terms")) group.terms = lowercase_strings(entry["terms"]);
    if (!group.terms.empty()) rules.synonyms.push_back(std::move(group));
  }
}

void apply_brands(const json& doc, RuleSet& rules) {
  if (!doc.is_object()) return;
  if (const auto it = doc.find("known_brands"); it != doc.end()) {
    rules.brands = lowercase_strings(*it);
  }
}

std::shared_ptr<const RuleSet> make_rule_set(const json& classifications,
                                             const json& forbidden,
                                             const json& synonyms,
                                             const json& brands) {
  auto rules = std::make_shared<RuleSet>();
  apply_classifications(classifications, *rules);
  apply_forbidden(forbidden, *rules);
  apply_synonyms(synonyms, *rules);
  apply_brands(brands, *rules);
  spdlog::info("Loaded {} classifications, {} forbidden pairs, {} forbidden patterns",
               rules->categories.size(), rules->forbidden_pairs.size(),
               rules->forbidden_patterns.size());
  return rules;
}

std::shared_ptr<const RuleSet> load_rule_set(const std::filesystem::path& dir) {
  return make_rule_set(read_document(dir / kClassificationsFile),
                       read_document(dir / kForbiddenFile),
                       read_document(dir / kSynonymsFile),
                       read_document(dir / kBrandsFile));
}

}  // namespace pricematch::rules

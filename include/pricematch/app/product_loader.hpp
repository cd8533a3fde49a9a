#pragma once

#include <pricematch/core/error.hpp>
#include <pricematch/core/product.hpp>
#include <nlohmann/json_fwd.hpp>
#include <expected>
#include <string>
#include <vector>

namespace pricematch::app {

/// Products from a JSON array of {id, name, price?, brand?, category?}.
/// Entries without an integer id or a string name are skipped with a warning;
/// a document that is not an array is InvalidProduct.
[[nodiscard]] std::expected<std::vector<core::ProductRecord>, core::MatchError> parse_products(
    const nlohmann::json& doc);

/// Read and parse a product file. Unreadable or malformed JSON is InvalidProduct.
[[nodiscard]] std::expected<std::vector<core::ProductRecord>, core::MatchError> load_products(
    const std::string& path);

}  // namespace pricematch::app

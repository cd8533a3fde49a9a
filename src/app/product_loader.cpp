#include <pricematch/app/product_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace pricematch::app {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& entry, const char* key) {
  const auto it = entry.find(key);
  if (it == entry.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

}  // namespace

std::expected<std::vector<core::ProductRecord>, core::MatchError> parse_products(
    const nlohmann::json& doc) {
  if (!doc.is_array()) {
    return std::unexpected(core::MatchError::InvalidProduct);
  }

  std::vector<core::ProductRecord> products;
  products.reserve(doc.size());
  for (std::size_t i = 0; i < doc.size(); ++i) {
    const auto& entry = doc[i];
    if (!entry.is_object()) {
      spdlog::warn("Product entry {} is not an object; skipped", i);
      continue;
    }
    const auto id = entry.find("id");
    const auto name = entry.find("name");
    if (id == entry.end() || !id->is_number_integer() || name == entry.end() ||
        !name->is_string()) {
      spdlog::warn("Product entry {} lacks an integer id or a name; skipped", i);
      continue;
    }

    core::ProductRecord p;
    p.id = id->get<std::int64_t>();
    p.name = name->get<std::string>();
    if (const auto price = entry.find("price"); price != entry.end() && price->is_number()) {
      p.price = price->get<double>();
    }
    p.brand = optional_string(entry, "brand");
    p.category = optional_string(entry, "category");
    products.push_back(std::move(p));
  }
  return products;
}

std::expected<std::vector<core::ProductRecord>, core::MatchError> load_products(
    const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::error("Cannot open product file {}", path);
    return std::unexpected(core::MatchError::InvalidProduct);
  }
  const nlohmann::json doc = nlohmann::json::parse(f, nullptr, false);
  if (doc.is_discarded()) {
    spdlog::error("Product file {} is not valid JSON", path);
    return std::unexpected(core::MatchError::InvalidProduct);
  }
  auto products = parse_products(doc);
  if (products) {
    spdlog::info("Loaded {} products from {}", products->size(), path);
  } else {
    spdlog::error("Product file {} is not a JSON array", path);
  }
  return products;
}

}  // namespace pricematch::app

#include <pricematch/core/product.hpp>

namespace pricematch::core {

std::expected<void, MatchError> validate_product(const ProductRecord& product) {
  if (product.name.find_first_not_of(" \t\r\n") == std::string::npos) {
    return std::unexpected(MatchError::InvalidProduct);
  }
  return {};
}

}  // namespace pricematch::core

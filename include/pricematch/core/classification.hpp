#pragma once

#include <string>

namespace pricematch::core {

/// Category pair assigned to a product name, e.g. ("spice", "turmeric").
struct Classification {
  std::string type{"other"};
  std::string subtype{"generic"};

  /// "type:subtype" token as used by the rule tables.
  [[nodiscard]] std::string qualified() const { return type + ":" + subtype; }

  friend bool operator==(const Classification&, const Classification&) = default;
};

}  // namespace pricematch::core

#pragma once

#include <pricematch/core/size_info.hpp>
#include <string_view>

namespace pricematch::matching {

/// Parse the first number+unit token of a product name and convert it to the
/// base unit of its class (g, ml, pieces). Recognised units: g, gm, kg, lb(s),
/// oz, ml, l, pc(s), each; case-insensitive, optional space before the unit.
/// Returns the {0, "", Unknown, ""} sentinel when no token is present.
[[nodiscard]] core::SizeInfo extract_size(std::string_view name);

/// Similarity of two pack sizes in [0, 1]. Symmetric; for one unit type it is
/// non-increasing as the magnitude ratio falls, and 1.0 for equal sizes.
[[nodiscard]] double size_similarity(const core::SizeInfo& a, const core::SizeInfo& b) noexcept;

}  // namespace pricematch::matching

// syx/basic/edit_distance.hpp - Levenshtein distance and suggestion ranking
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace syx
{

/// Classic Levenshtein distance (insert/delete/substitute, each cost 1).
[[nodiscard]] size_t edit_distance(std::string_view a, std::string_view b);

/**
 * Order `candidates` by edit distance to `target`, closest first.
 *
 * The sort is stable, so candidates at equal distance keep their input order.
 * Duplicate candidates are kept once (first occurrence).
 */
[[nodiscard]] std::vector<std::string> rank_by_edit_distance(
  std::string_view target, const std::vector<std::string> & candidates);

}  // namespace syx

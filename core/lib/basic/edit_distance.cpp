// syx/basic/edit_distance.cpp
#include "syx/basic/edit_distance.hpp"

#include <algorithm>
#include <utility>

namespace syx
{

size_t edit_distance(std::string_view a, std::string_view b)
{
  // Two-row dynamic programming table.
  std::vector<size_t> prev(b.size() + 1);
  std::vector<size_t> cur(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) {
    prev[j] = j;
  }

  for (size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

std::vector<std::string> rank_by_edit_distance(
  std::string_view target, const std::vector<std::string> & candidates)
{
  std::vector<std::pair<size_t, std::string>> scored;
  scored.reserve(candidates.size());
  for (const auto & c : candidates) {
    const bool seen = std::any_of(
      scored.begin(), scored.end(), [&](const auto & s) { return s.second == c; });
    if (!seen) {
      scored.emplace_back(edit_distance(target, c), c);
    }
  }

  std::stable_sort(scored.begin(), scored.end(), [](const auto & x, const auto & y) {
    return x.first < y.first;
  });

  std::vector<std::string> out;
  out.reserve(scored.size());
  for (auto & s : scored) {
    out.push_back(std::move(s.second));
  }
  return out;
}

}  // namespace syx

#include "layoutprep/fuzzy_match.hpp"

#include <vector>

namespace layoutprep {

std::optional<ApproximateMatch> FindApproximateMatch(std::u32string_view query, std::u32string_view text) {
  const std::size_t m = query.size();
  const std::size_t n = text.size();
  if (n == 0) {
    return std::nullopt;
  }

  // Column-wise DP over the text. cost[i] is the distance of query[0, i) to the
  // best substring ending at the current text position, start[i] where that
  // substring begins.
  std::vector<std::size_t> cost(m + 1);
  std::vector<std::size_t> start(m + 1);
  std::vector<std::size_t> prev_cost(m + 1);
  std::vector<std::size_t> prev_start(m + 1);
  for (std::size_t i = 0; i <= m; ++i) {
    prev_cost[i] = i;
    prev_start[i] = 0;
  }

  ApproximateMatch best;
  bool have_best = false;
  for (std::size_t j = 1; j <= n; ++j) {
    cost[0] = 0;
    start[0] = j;
    const char32_t t = text[j - 1];
    for (std::size_t i = 1; i <= m; ++i) {
      std::size_t diag = prev_cost[i - 1] + (query[i - 1] == t ? 0 : 1);
      std::size_t up = cost[i - 1] + 1;
      std::size_t left = prev_cost[i] + 1;
      if (diag <= up && diag <= left) {
        cost[i] = diag;
        start[i] = prev_start[i - 1];
      } else if (up <= left) {
        cost[i] = up;
        start[i] = start[i - 1];
      } else {
        cost[i] = left;
        start[i] = prev_start[i];
      }
    }

    if (!have_best || cost[m] < best.cost) {
      best.start_pos = start[m];
      best.end_pos = j;
      best.cost = cost[m];
      have_best = true;
      if (best.cost == 0) {
        break;
      }
    }
    cost.swap(prev_cost);
    start.swap(prev_start);
  }
  return best;
}

}  // namespace layoutprep

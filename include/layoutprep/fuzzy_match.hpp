#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace layoutprep {

struct ApproximateMatch {
  std::size_t start_pos = 0;  // first matched position in the text
  std::size_t end_pos = 0;    // one past the last matched position
  std::size_t cost = 0;       // edit distance between query and text[start_pos, end_pos)
};

// Cheapest approximate occurrence of `query` anywhere in `text` (semi-global
// edit distance with unit costs). Among equally cheap occurrences the one that
// ends first wins. std::nullopt when text is empty.
[[nodiscard]] std::optional<ApproximateMatch> FindApproximateMatch(std::u32string_view query,
                                                                   std::u32string_view text);

}  // namespace layoutprep

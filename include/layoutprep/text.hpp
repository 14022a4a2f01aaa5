#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace layoutprep {

// Canonical form used for every text comparison in the pipeline: full Unicode
// lowercasing followed by NFKC.
[[nodiscard]] std::string Normalize(std::string_view text);

bool NextCodepoint(std::string_view s, std::size_t& i, std::uint32_t& cp);
void AppendUtf8(std::uint32_t cp, std::string& out);
[[nodiscard]] std::u32string ToCodepoints(std::string_view utf8);
[[nodiscard]] std::string ToUtf8(std::u32string_view codepoints);

[[nodiscard]] bool IsSpace(std::uint32_t cp);
[[nodiscard]] bool IsWordChar(std::uint32_t cp);
[[nodiscard]] bool IsDecimalDigit(std::uint32_t cp);

// Splits into runs of word characters, runs of digits and single non-word
// characters. Whitespace separates pieces and is dropped.
[[nodiscard]] std::vector<std::string> SplitWords(std::string_view text);

// SplitWords() joined back together with single spaces.
[[nodiscard]] std::string RetokenizeText(std::string_view text);

// Strips leading and trailing periods, then surrounding whitespace.
[[nodiscard]] std::string TrimPunctuation(std::string_view text);

[[nodiscard]] std::string TrimWhitespace(std::string_view text);

// Replaces embedded NUL characters with U+FFFD.
[[nodiscard]] std::string SanitizeNul(std::string_view text);

constexpr std::size_t kCapitalizationFeatureCount = 7;

// first upper, second upper, fraction upper, first lower, second lower,
// fraction lower, fraction digits. Booleans are 0 or 1, fractions in [0, 1].
[[nodiscard]] std::array<float, kCapitalizationFeatureCount> CapitalizationFeatures(std::string_view token);

}  // namespace layoutprep

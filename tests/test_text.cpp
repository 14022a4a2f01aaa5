#include <cassert>
#include <string>
#include <vector>

#include "layoutprep/hash.hpp"
#include "layoutprep/text.hpp"
#include "test_support.hpp"

int main() {
  using namespace layoutprep;
  using layoutprep::testing::Near;

  // lowercase + NFKC
  assert(Normalize("Deep LEARNING") == "deep learning");
  assert(Normalize("\xC3\x84" "BC") == "\xC3\xA4" "bc");  // ÄBC
  assert(Normalize("\xEF\xAC\x81") == "fi");             // ﬁ ligature
  assert(Normalize("") == "");

  auto words = SplitWords("Hello, world42x  (a_b)");
  std::vector<std::string> expected = {"Hello", ",", "world", "42", "x", "(", "a_b", ")"};
  assert(words == expected);
  assert(RetokenizeText("  Deep   Learning. ") == "Deep Learning .");
  assert(RetokenizeText("") == "");

  assert(TrimPunctuation("... A title .") == "A title");
  assert(TrimPunctuation("Title") == "Title");
  assert(TrimWhitespace("\t x \n") == "x");

  std::string with_nul("a\0b", 3);
  assert(SanitizeNul(with_nul) == "a\xEF\xBF\xBD" "b");

  assert(ToUtf8(ToCodepoints("gr\xC3\xBC\xC3\x9F")) == "gr\xC3\xBC\xC3\x9F");
  assert(ToCodepoints("gr\xC3\xBC\xC3\x9F").size() == 4);

  // Malformed UTF-8 yields U+FFFD per bad byte and keeps the following text.
  assert(ToCodepoints("\xC3" "A") == std::u32string(U"\uFFFDA"));
  assert(ToCodepoints("ab\xE2\x82") == std::u32string(U"ab\uFFFD\uFFFD"));
  assert(ToCodepoints("\xC0\xAF") == std::u32string(U"\uFFFD\uFFFD"));
  assert(ToCodepoints("\xED\xA0\x80") == std::u32string(U"\uFFFD\uFFFD\uFFFD"));
  assert(ToCodepoints("\xF4\x90\x80\x80").size() == 4);
  assert(ToCodepoints("\xF0\x9F\x98\x80") == std::u32string(U"\U0001F600"));
  auto truncated = SplitWords("\xC3" "Abc");
  assert((truncated == std::vector<std::string>{"\xEF\xBF\xBD", "Abc"}));

  auto caps = CapitalizationFeatures("Hello");
  assert(caps[0] == 1.0f && caps[1] == 0.0f);
  assert(Near(caps[2], 0.2));
  assert(caps[3] == 0.0f && caps[4] == 1.0f);
  assert(Near(caps[5], 0.8));
  assert(caps[6] == 0.0f);
  auto digits = CapitalizationFeatures("A1");
  assert(digits[1] == 0.0f && Near(digits[6], 0.5));
  auto empty = CapitalizationFeatures("");
  for (float v : empty) {
    assert(v == 0.0f);
  }

  // Reference values of MurmurHash3 x86_32, seed 0.
  assert(Murmur3Hash32("") == 0u);
  assert(Murmur3Hash32Signed("foo") == -156908512);
  assert(Murmur3Hash32Signed("hello") == 613153351);

  return 0;
}

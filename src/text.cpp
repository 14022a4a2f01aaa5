#include "layoutprep/text.hpp"

#include <stdexcept>

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace layoutprep {

namespace {

const icu::Normalizer2& NfkcInstance() {
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* norm = icu::Normalizer2::getNFKCInstance(status);
  if (U_FAILURE(status) || norm == nullptr) {
    throw std::runtime_error("ICU: failed to get NFKC normalizer");
  }
  return *norm;
}

}  // namespace

std::string Normalize(std::string_view text) {
  static const icu::Normalizer2& norm = NfkcInstance();

  icu::UnicodeString u = icu::UnicodeString::fromUTF8(
      icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
  u.toLower(icu::Locale::getRoot());
  icu::UnicodeString out;
  UErrorCode status = U_ZERO_ERROR;
  norm.normalize(u, out, status);
  if (U_FAILURE(status)) {
    throw std::runtime_error("ICU: NFKC normalize failed");
  }
  std::string utf8_out;
  out.toUTF8String(utf8_out);
  return utf8_out;
}

bool NextCodepoint(std::string_view s, std::size_t& i, std::uint32_t& cp) {
  if (i >= s.size()) {
    return false;
  }
  auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
  const unsigned char c = byte(i);
  if (c < 0x80) {
    cp = c;
    i += 1;
    return true;
  }

  std::size_t len = 0;
  std::uint32_t value = 0;
  std::uint32_t min_value = 0;
  if ((c & 0xE0) == 0xC0) {
    len = 2;
    value = c & 0x1Fu;
    min_value = 0x80;
  } else if ((c & 0xF0) == 0xE0) {
    len = 3;
    value = c & 0x0Fu;
    min_value = 0x800;
  } else if ((c & 0xF8) == 0xF0) {
    len = 4;
    value = c & 0x07u;
    min_value = 0x10000;
  }

  // Malformed input decodes to U+FFFD and consumes a single byte.
  cp = 0xFFFD;
  if (len == 0 || i + len > s.size()) {
    i += 1;
    return true;
  }
  for (std::size_t k = 1; k < len; ++k) {
    const unsigned char next = byte(i + k);
    if ((next & 0xC0) != 0x80) {
      i += 1;
      return true;
    }
    value = (value << 6) | (next & 0x3Fu);
  }
  if (value < min_value || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
    i += 1;
    return true;
  }
  cp = value;
  i += len;
  return true;
}

void AppendUtf8(std::uint32_t cp, std::string& out) {
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::u32string ToCodepoints(std::string_view utf8) {
  std::u32string out;
  out.reserve(utf8.size());
  std::size_t i = 0;
  std::uint32_t cp = 0;
  while (NextCodepoint(utf8, i, cp)) {
    out.push_back(static_cast<char32_t>(cp));
  }
  return out;
}

std::string ToUtf8(std::u32string_view codepoints) {
  std::string out;
  out.reserve(codepoints.size());
  for (char32_t cp : codepoints) {
    AppendUtf8(static_cast<std::uint32_t>(cp), out);
  }
  return out;
}

bool IsSpace(std::uint32_t cp) {
  if (cp <= 0x20) {
    return cp == 0x09 || cp == 0x0A || cp == 0x0B || cp == 0x0C || cp == 0x0D || cp == 0x1C ||
           cp == 0x1D || cp == 0x1E || cp == 0x1F || cp == 0x20;
  }
  return cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
         cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

bool IsWordChar(std::uint32_t cp) {
  if (cp == '_') {
    return true;
  }
  auto c = static_cast<UChar32>(cp);
  if (u_isalnum(c)) {
    return true;
  }
  int8_t type = u_charType(c);
  return type == U_LETTER_NUMBER || type == U_OTHER_NUMBER;
}

bool IsDecimalDigit(std::uint32_t cp) { return u_isdigit(static_cast<UChar32>(cp)) != 0; }

std::vector<std::string> SplitWords(std::string_view text) {
  std::vector<std::string> out;
  std::string word;
  std::string digits;
  auto flush = [&](std::string& piece) {
    if (!piece.empty()) {
      out.push_back(std::move(piece));
      piece.clear();
    }
  };

  std::size_t i = 0;
  std::uint32_t cp = 0;
  while (NextCodepoint(text, i, cp)) {
    if (IsDecimalDigit(cp)) {
      flush(word);
      AppendUtf8(cp, digits);
    } else if (IsWordChar(cp)) {
      flush(digits);
      AppendUtf8(cp, word);
    } else {
      flush(word);
      flush(digits);
      if (!IsSpace(cp)) {
        std::string single;
        AppendUtf8(cp, single);
        out.push_back(std::move(single));
      }
    }
  }
  flush(word);
  flush(digits);
  return out;
}

std::string RetokenizeText(std::string_view text) {
  std::string out;
  for (const auto& piece : SplitWords(text)) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += piece;
  }
  return out;
}

std::string TrimWhitespace(std::string_view text) {
  std::u32string cps = ToCodepoints(text);
  std::size_t start = 0;
  while (start < cps.size() && IsSpace(cps[start])) {
    ++start;
  }
  std::size_t end = cps.size();
  while (end > start && IsSpace(cps[end - 1])) {
    --end;
  }
  return ToUtf8(std::u32string_view(cps).substr(start, end - start));
}

std::string TrimPunctuation(std::string_view text) {
  std::size_t start = 0;
  while (start < text.size() && text[start] == '.') {
    ++start;
  }
  std::size_t end = text.size();
  while (end > start && text[end - 1] == '.') {
    --end;
  }
  return TrimWhitespace(text.substr(start, end - start));
}

std::string SanitizeNul(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '\0') {
      out += "\xEF\xBF\xBD";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::array<float, kCapitalizationFeatureCount> CapitalizationFeatures(std::string_view token) {
  std::array<float, kCapitalizationFeatureCount> features{};
  std::u32string cps = ToCodepoints(token);
  if (cps.empty()) {
    return features;
  }

  auto is_upper = [](char32_t c) { return u_isupper(static_cast<UChar32>(c)) != 0; };
  auto is_lower = [](char32_t c) { return u_islower(static_cast<UChar32>(c)) != 0; };

  std::size_t uppers = 0;
  std::size_t lowers = 0;
  std::size_t digits = 0;
  for (char32_t c : cps) {
    if (is_upper(c)) ++uppers;
    if (is_lower(c)) ++lowers;
    if (IsDecimalDigit(c)) ++digits;
  }
  const auto n = static_cast<float>(cps.size());

  features[0] = is_upper(cps[0]) ? 1.0f : 0.0f;
  features[1] = cps.size() > 1 && is_upper(cps[1]) ? 1.0f : 0.0f;
  features[2] = static_cast<float>(uppers) / n;
  features[3] = is_lower(cps[0]) ? 1.0f : 0.0f;
  features[4] = cps.size() > 1 && is_lower(cps[1]) ? 1.0f : 0.0f;
  features[5] = static_cast<float>(lowers) / n;
  features[6] = static_cast<float>(digits) / n;
  return features;
}

}  // namespace layoutprep

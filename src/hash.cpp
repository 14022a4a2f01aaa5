#include "layoutprep/hash.hpp"

#include <cstring>

namespace layoutprep {

namespace {

inline std::uint32_t Rotl32(std::uint32_t x, int r) { return (x << r) | (x >> (32 - r)); }

inline std::uint32_t FinalMix(std::uint32_t h) {
  h ^= h >> 16;
  h *= 0x85ebca6bu;
  h ^= h >> 13;
  h *= 0xc2b2ae35u;
  h ^= h >> 16;
  return h;
}

}  // namespace

std::uint32_t Murmur3Hash32(std::string_view data, std::uint32_t seed) {
  const auto* bytes = reinterpret_cast<const std::uint8_t*>(data.data());
  const std::size_t len = data.size();
  const std::size_t nblocks = len / 4;

  constexpr std::uint32_t c1 = 0xcc9e2d51u;
  constexpr std::uint32_t c2 = 0x1b873593u;

  std::uint32_t h1 = seed;
  for (std::size_t i = 0; i < nblocks; ++i) {
    std::uint32_t k1 = static_cast<std::uint32_t>(bytes[i * 4]) |
                       (static_cast<std::uint32_t>(bytes[i * 4 + 1]) << 8) |
                       (static_cast<std::uint32_t>(bytes[i * 4 + 2]) << 16) |
                       (static_cast<std::uint32_t>(bytes[i * 4 + 3]) << 24);
    k1 *= c1;
    k1 = Rotl32(k1, 15);
    k1 *= c2;

    h1 ^= k1;
    h1 = Rotl32(h1, 13);
    h1 = h1 * 5 + 0xe6546b64u;
  }

  const std::uint8_t* tail = bytes + nblocks * 4;
  std::uint32_t k1 = 0;
  switch (len & 3u) {
    case 3:
      k1 ^= static_cast<std::uint32_t>(tail[2]) << 16;
      [[fallthrough]];
    case 2:
      k1 ^= static_cast<std::uint32_t>(tail[1]) << 8;
      [[fallthrough]];
    case 1:
      k1 ^= tail[0];
      k1 *= c1;
      k1 = Rotl32(k1, 15);
      k1 *= c2;
      h1 ^= k1;
  }

  h1 ^= static_cast<std::uint32_t>(len);
  return FinalMix(h1);
}

std::int32_t Murmur3Hash32Signed(std::string_view data, std::uint32_t seed) {
  std::uint32_t h = Murmur3Hash32(data, seed);
  std::int32_t out = 0;
  std::memcpy(&out, &h, sizeof(out));
  return out;
}

}  // namespace layoutprep

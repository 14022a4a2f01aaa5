#pragma once

#include <cstdint>
#include <string_view>

namespace layoutprep {

// MurmurHash3, x86 32-bit variant. Stable across processes and platforms; used
// for font hashing, synthetic embedding seeds and cache keys.
[[nodiscard]] std::uint32_t Murmur3Hash32(std::string_view data, std::uint32_t seed = 0);

// The same hash reinterpreted as a signed 32-bit value.
[[nodiscard]] std::int32_t Murmur3Hash32Signed(std::string_view data, std::uint32_t seed = 0);

}  // namespace layoutprep

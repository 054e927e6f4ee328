#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace matrixforge::util {

// MurmurHash3 64-bit finalizer
[[nodiscard]] inline constexpr auto murmur3_mix64(std::uint64_t h) noexcept
    -> std::uint64_t {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

template <typename T>
inline auto mix_into(std::size_t &seed, const T &value) noexcept -> void {
  constexpr std::size_t kMagic = 0x9e3779b97f4a7c15ULL;
  seed ^= std::hash<T>{}(value) + kMagic + (seed << 6) + (seed >> 2);
}

/// Shard owning `key`, mixed so that similar keys spread across shards.
template <typename T>
[[nodiscard]] inline auto shard_of(const T &key, unsigned shard_count) noexcept
    -> unsigned {
  const auto h = murmur3_mix64(static_cast<std::uint64_t>(std::hash<T>{}(key)));
  return static_cast<unsigned>(h % (shard_count == 0 ? 1 : shard_count));
}

} // namespace matrixforge::util

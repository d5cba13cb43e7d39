#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace pakx {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint16_t byteswap(uint16_t value) noexcept {
  return static_cast<uint16_t>((value << 8) | (value >> 8));
}

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return ((value & 0x00000000000000FFull) << 56) | ((value & 0x000000000000FF00ull) << 40) |
         ((value & 0x0000000000FF0000ull) << 24) | ((value & 0x00000000FF000000ull) << 8) |
         ((value & 0x000000FF00000000ull) >> 8) | ((value & 0x0000FF0000000000ull) >> 24) |
         ((value & 0x00FF000000000000ull) >> 40) | ((value & 0xFF00000000000000ull) >> 56);
}

// Big-endian <-> host for any unsigned width
template <typename T> inline constexpr T fromBigEndian(T value) noexcept {
  if constexpr (std::endian::native == std::endian::little) {
    return byteswap(value);
  }
  return value;
}

} // namespace detail

// All archive integers are stored big-endian. These read/write unaligned fields in place.

inline uint16_t loadBE16(const uint8_t *src) noexcept {
  uint16_t value;
  std::memcpy(&value, src, sizeof(value));
  return detail::fromBigEndian(value);
}

inline uint32_t loadBE32(const uint8_t *src) noexcept {
  uint32_t value;
  std::memcpy(&value, src, sizeof(value));
  return detail::fromBigEndian(value);
}

inline uint64_t loadBE64(const uint8_t *src) noexcept {
  uint64_t value;
  std::memcpy(&value, src, sizeof(value));
  return detail::fromBigEndian(value);
}

inline void storeBE16(uint8_t *dst, uint16_t value) noexcept {
  value = detail::fromBigEndian(value);
  std::memcpy(dst, &value, sizeof(value));
}

inline void storeBE32(uint8_t *dst, uint32_t value) noexcept {
  value = detail::fromBigEndian(value);
  std::memcpy(dst, &value, sizeof(value));
}

inline void storeBE64(uint8_t *dst, uint64_t value) noexcept {
  value = detail::fromBigEndian(value);
  std::memcpy(dst, &value, sizeof(value));
}

} // namespace pakx

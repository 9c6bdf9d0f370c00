#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace mpqx {

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

} // namespace detail

// Check if the system is little-endian at compile time
inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// Convert little-endian to host byte order (MPQ stores everything little-endian)
inline constexpr uint16_t letoh16(uint16_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint32_t letoh32(uint32_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint64_t letoh64(uint64_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Convert host byte order to little-endian
inline constexpr uint16_t htole16(uint16_t value) noexcept { return letoh16(value); }
inline constexpr uint32_t htole32(uint32_t value) noexcept { return letoh32(value); }
inline constexpr uint64_t htole64(uint64_t value) noexcept { return letoh64(value); }

// Unaligned little-endian loads and stores
inline uint16_t readLE16(const uint8_t *src) noexcept {
  uint16_t value;
  std::memcpy(&value, src, sizeof(value));
  return letoh16(value);
}

inline uint32_t readLE32(const uint8_t *src) noexcept {
  uint32_t value;
  std::memcpy(&value, src, sizeof(value));
  return letoh32(value);
}

inline uint64_t readLE64(const uint8_t *src) noexcept {
  uint64_t value;
  std::memcpy(&value, src, sizeof(value));
  return letoh64(value);
}

inline void writeLE16(uint8_t *dst, uint16_t value) noexcept {
  value = htole16(value);
  std::memcpy(dst, &value, sizeof(value));
}

inline void writeLE32(uint8_t *dst, uint32_t value) noexcept {
  value = htole32(value);
  std::memcpy(dst, &value, sizeof(value));
}

inline void writeLE64(uint8_t *dst, uint64_t value) noexcept {
  value = htole64(value);
  std::memcpy(dst, &value, sizeof(value));
}

} // namespace mpqx

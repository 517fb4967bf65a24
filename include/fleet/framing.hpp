/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace tfleet {

enum Endianness : uint8_t { LITTLE = 0, BIG = 1 };

constexpr Endianness get_system_endianness() {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
  return Endianness::BIG;
#else
  return Endianness::LITTLE;
#endif
}

template <typename T> void bswap(T &value) {
  if constexpr (sizeof(T) == 2) {
    value = __builtin_bswap16(value);
  } else if constexpr (sizeof(T) == 4) {
    value = __builtin_bswap32(value);
  } else if constexpr (sizeof(T) == 8) {
    value = __builtin_bswap64(value);
  }
}

template <typename T> T to_big_endian(T value) {
  if constexpr (get_system_endianness() == Endianness::LITTLE) {
    bswap(value);
  }
  return value;
}

template <typename T> T from_big_endian(T value) { return to_big_endian(value); }

/**
 * @brief Fixed 8-byte frame header: 4-byte magic followed by the body length, both big-endian.
 */
struct FrameHeader {
  static constexpr uint32_t MAGIC = 0x54464C54; // "TFLT"
  static constexpr size_t SIZE = 8;

  uint32_t length = 0;

  std::array<uint8_t, SIZE> encode() const {
    std::array<uint8_t, SIZE> bytes{};
    const uint32_t magic = to_big_endian(MAGIC);
    const uint32_t len = to_big_endian(length);
    std::memcpy(bytes.data(), &magic, sizeof(magic));
    std::memcpy(bytes.data() + sizeof(magic), &len, sizeof(len));
    return bytes;
  }

  static FrameHeader decode(const uint8_t *bytes) {
    uint32_t magic = 0;
    uint32_t len = 0;
    std::memcpy(&magic, bytes, sizeof(magic));
    std::memcpy(&len, bytes + sizeof(magic), sizeof(len));
    if (from_big_endian(magic) != MAGIC) {
      throw std::runtime_error("Bad frame magic");
    }
    FrameHeader header;
    header.length = from_big_endian(len);
    return header;
  }
};

} // namespace tfleet

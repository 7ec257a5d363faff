// -*- mode: c++; c-basic-offset: 2; -*-

#pragma once

/**
 * @file   constants.hh
 * @date   octobre  6, 2026
 * @brief  Page geometry and format constants shared by every component
 */

#include <cstddef>
#include <cstdint>

namespace bigcache {
  /** @brief Enum to help with size of things */
  enum SZ : size_t
  {
    B = 1,
    KiB = 1024 * B,
    MiB = 1024 * KiB,
    GiB = 1024 * MiB,
  };

  static constexpr size_t PAGE_SIZE = 4 * SZ::KiB; // Bytes
  static constexpr size_t PAGE_SHIFT = 12;

  static constexpr uint32_t BIGCACHE_MAGIC = 0x42494743; // "BIGC"
  static constexpr uint32_t BIGCACHE_VERSION = 1;

  /** @brief Longest source path a file table entry can hold (incl. NUL) */
  static constexpr size_t MAX_PATH_LEN = 512;

  inline constexpr uint64_t page_align_down(uint64_t val) {
    return val & ~(uint64_t)(PAGE_SIZE - 1);
  }

  inline constexpr uint64_t page_align_up(uint64_t val) {
    return (val + PAGE_SIZE - 1) & ~(uint64_t)(PAGE_SIZE - 1);
  }

  inline constexpr bool is_page_aligned(uint64_t val) {
    return (val & (PAGE_SIZE - 1)) == 0;
  }
} // namespace bigcache

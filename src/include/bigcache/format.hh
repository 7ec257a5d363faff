// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   format.hh
 * @date   octobre  6, 2026
 * @brief  On-disk layout of a BigCache file
 *
 * @details
 * +----------------------------------+ 0
 * | header_t                         |
 * +----------------------------------+ index_offset
 * | page_index_t[page_count]         |
 * +----------------------------------+ file_table_offset
 * | file_entry_t[file_count]         |
 * +----------------------------------+ data_offset (page aligned)
 * | page 0 | page 1 | ... | page N-1 |
 * +----------------------------------+ total_size
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "bigcache/constants.hh"

namespace bigcache {
  struct __attribute__((packed)) header_t {
    uint32_t magic;
    uint32_t version;
    uint32_t page_count;
    uint32_t file_count;
    uint64_t data_offset;
    uint64_t index_offset;
    uint64_t file_table_offset;
    uint64_t total_size;
    uint32_t checksum; //< CRC-32 of the whole file, this field read as zero
    uint32_t flags;
    uint8_t reserved[32];
  };

  /** @brief Where a cached page came from, one per page of the data region */
  struct __attribute__((packed)) page_index_t {
    uint32_t file_id;
    uint64_t source_offset; //< Page aligned offset in the source file
    uint32_t access_order;  //< First access position in the observed trace
    uint16_t flags;
    uint16_t reserved;
  };

  struct __attribute__((packed)) file_entry_t {
    uint32_t file_id;
    uint32_t path_len;
    uint32_t page_count;
    uint64_t original_size;
    char path[MAX_PATH_LEN];
  };

  enum page_flags_t : uint16_t
  {
    PAGE_FLAG_EXECUTABLE = 1 << 0,
    PAGE_FLAG_READONLY = 1 << 1,
    PAGE_FLAG_CRITICAL = 1 << 2,
    PAGE_FLAG_COMPRESSED = 1 << 3,
  };

  static_assert(sizeof(header_t) == 88);
  static_assert(sizeof(page_index_t) == 20);
  static_assert(sizeof(file_entry_t) == 532);

  /** @brief Byte offset of header_t::checksum, skipped when checksumming */
  static constexpr size_t CHECKSUM_FIELD_OFF = offsetof(header_t, checksum);

  /**
   * @brief CRC-32 of a complete cache image with the checksum field zeroed
   * @param[in] img Start of the image (header first)
   * @param[in] len Length of the image in bytes
   */
  uint32_t image_checksum(const void *img, size_t len);
} // namespace bigcache

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   layout.hh
 * @date   octobre  7, 2026
 * @brief  Cache layout table produced by the trace analysis
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace bigcache {
  /** @brief One row of the layout table */
  struct layout_entry_t {
    std::string source_file;
    uint64_t source_offset;
    uint64_t size; //< 0 if the column was empty
    uint32_t access_order;
  };

  /**
   * @brief Parse a layout CSV
   *
   * @details Columns are cache_offset, source_file, source_offset, size,
   * first_access_order. The first line is a header and is always skipped.
   * cache_offset is ignored. Malformed rows are skipped with a warning.
   *
   * @param[in] path Path to the layout file
   * @param[out] entries Parsed rows are appended here
   * @return Number of rows parsed, -errno if the file could not be read
   */
  int parse_layout(const std::string &path,
                   std::vector<layout_entry_t> &entries);
} // namespace bigcache

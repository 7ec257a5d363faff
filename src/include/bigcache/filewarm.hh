// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   filewarm.hh
 * @date   octobre  8, 2026
 * @brief  Pull layout pages of the original files into the page cache
 */

#pragma once

#include <cstdint>
#include <vector>

#include "bigcache/layout.hh"

namespace bigcache {
  struct warm_report_t {
    uint64_t pages_ok;
    uint64_t pages_failed;
    uint64_t files_opened;
    uint64_t files_failed;
    uint64_t elapsed_ns;
  };

  /**
   * @brief Read the pages named by @p entries in their order
   * @details Each page gets a POSIX_FADV_WILLNEED hint and a one byte read,
   * which is enough for the kernel to bring the page in. Works without the
   * cache file or any interception.
   */
  warm_report_t warm_files(const std::vector<layout_entry_t> &entries);
} // namespace bigcache

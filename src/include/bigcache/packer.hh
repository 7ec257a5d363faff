// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   packer.hh
 * @date   octobre  7, 2026
 * @brief  Builds a BigCache file from a list of (file, offset) pages
 */

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/container_hash/hash.hpp>

#include "bigcache/format.hh"
#include "bigcache/layout.hh"
#include "nvsl/stats.hh"

namespace bigcache {
  struct pack_report_t {
    uint32_t pages;
    uint32_t files;
    uint64_t read_ok;
    uint64_t read_failed; //< Pages zero-filled because the source was unreadable
    uint64_t total_size;
  };

  class Packer {
  private:
    struct pending_page_t {
      uint32_t file_id;
      uint64_t offset;
      uint32_t access_order;
    };

    std::vector<std::string> files;
    std::unordered_map<std::string, uint32_t> file_ids;
    std::vector<pending_page_t> pages;

    using page_key_t = std::pair<uint32_t, uint64_t>;

    /** @brief (file_id, aligned offset) of every page added so far */
    std::unordered_set<page_key_t, boost::hash<page_key_t>> seen;

    pack_report_t last_report = {};
    nvsl::Counter read_ok, read_failed;

    uint32_t get_file_id(const std::string &path);
    int fill_page(int src_fd, const pending_page_t &pg, uint8_t *dst);

  public:
    Packer();

    /**
     * @brief Queue the page holding @p offset of @p path
     * @return true if the page was new, false for a duplicate
     */
    bool add_page(const std::string &path, uint64_t offset,
                  uint32_t access_order);

    /**
     * @brief Queue every page covered by a layout row
     * @details A row without a size covers a single page.
     * @return Number of new pages
     */
    size_t add_entry(const layout_entry_t &entry);

    /** @brief Parse a layout file and queue all its rows */
    int load_layout(const std::string &path);

    /**
     * @brief Write the cache file
     * @details Unreadable source pages are zero-filled and counted in the
     * report, they do not fail the build.
     * @return 0 on success, -errno on failure
     */
    int build(const std::string &output);

    uint32_t page_count() const { return pages.size(); }
    uint32_t file_count() const { return files.size(); }
    const pack_report_t &report() const { return last_report; }
  };
} // namespace bigcache

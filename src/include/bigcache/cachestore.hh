// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   cachestore.hh
 * @date   octobre  6, 2026
 * @brief  Read-only view of a BigCache file and its page lookup index
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

#include "bigcache/format.hh"

namespace bigcache {
  /** @brief Reasons CacheStore::load() refuses a file */
  enum class format_error_t
  {
    NONE = 0,
    IO,            //< Unable to open or map the file
    TRUNCATED,     //< Smaller than its header
    BAD_MAGIC,
    BAD_VERSION,
    SIZE_MISMATCH, //< header.total_size differs from the file size
    BAD_LAYOUT,    //< Sections overlap, misaligned or ids out of range
  };

  const char *format_error_str(format_error_t err);

  /**
   * @brief Loaded cache container
   *
   * @details The mapping and the index are immutable between load() and
   * unload(), lookups need no locking. Only the hit/miss counters change.
   */
  class CacheStore {
  private:
    struct page_key_t {
      uint32_t file_id;
      uint64_t offset;

      bool operator==(const page_key_t &) const = default;
    };

    /** @brief FNV-1a over (file_id, offset) */
    struct page_key_hash_t {
      size_t operator()(const page_key_t &key) const;
    };

    std::string cache_path;
    std::unique_ptr<boost::interprocess::file_mapping> fmap;
    std::unique_ptr<boost::interprocess::mapped_region> region;

    const uint8_t *base = nullptr;
    size_t mapped_size = 0;
    header_t hdr = {};
    const page_index_t *page_index = nullptr;
    const file_entry_t *file_table = nullptr;

    std::unordered_map<std::string, uint32_t> file_ids;

    /** @brief (file, page aligned offset) -> byte offset in the cache file */
    std::unordered_map<page_key_t, uint64_t, page_key_hash_t> page_map;

    std::atomic<uint64_t> hits = 0;
    std::atomic<uint64_t> misses = 0;
    std::atomic<uint64_t> bytes_served = 0;
    bool preheated = false;

    format_error_t check_header(size_t file_sz) const;
    format_error_t build_index();
    std::optional<uint64_t> find(uint32_t file_id, uint64_t offset);

  public:
    CacheStore() {}
    ~CacheStore();

    CacheStore(const CacheStore &) = delete;
    CacheStore &operator=(const CacheStore &) = delete;

    /**
     * @brief Map a cache file read-only and build the lookup index
     * @param[in] path Path of the cache file
     * @return format_error_t::NONE on success. On failure the store stays
     * unloaded.
     */
    format_error_t load(const std::string &path);

    /** @brief Release the mapping and the index, safe to call repeatedly */
    void unload();

    bool is_loaded() const { return base != nullptr; }
    bool is_preheated() const { return preheated; }

    /**
     * @brief Find the cached copy of the page holding @p offset
     * @return Pointer to PAGE_SIZE bytes inside the mapping, nullptr on miss
     */
    const void *lookup(const std::string &path, uint64_t offset);

    /** @brief Same as lookup() for callers that already have a file id */
    const void *lookup(uint32_t file_id, uint64_t offset);

    /** @brief Absolute byte offset of the cached page inside the cache file */
    std::optional<uint64_t> lookup_offset(const std::string &path,
                                          uint64_t offset);

    /** @brief File id of @p path if the cache holds any page of it */
    std::optional<uint32_t> file_id(const std::string &path) const;

    /**
     * @brief Pull the whole container into the page cache
     * @details Touches every page with sequential read-ahead advice, then
     * switches the mapping to random access advice and tries to mlock it.
     */
    int preheat();

    /** @brief Touch the data pages with index in [start_idx, end_idx) */
    int preheat_range(uint32_t start_idx, uint32_t end_idx);

    /** @brief Check magic, size and checksum of the loaded file */
    int verify() const;

    const std::string &path() const { return cache_path; }
    const header_t &header() const { return hdr; }
    const page_index_t &page(uint32_t idx) const { return page_index[idx]; }
    const file_entry_t &file(uint32_t id) const { return file_table[id]; }
    std::string file_path(uint32_t id) const;
    const uint8_t *data() const { return base; }
    size_t size() const { return mapped_size; }

    /** @brief Pointer to the idx-th page of the data region */
    const uint8_t *page_data(uint32_t idx) const {
      return base + hdr.data_offset + (uint64_t)idx * PAGE_SIZE;
    }

    uint64_t hit_count() const { return hits.load(); }
    uint64_t miss_count() const { return misses.load(); }
    uint64_t bytes_count() const { return bytes_served.load(); }

    void reset_stats();
    void print_stats(std::ostream &os) const;
  };
} // namespace bigcache

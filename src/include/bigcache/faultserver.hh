// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   faultserver.hh
 * @date   octobre  9, 2026
 * @brief  userfaultfd server that resolves missing pages from a CacheStore
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <linux/userfaultfd.h>
#include <pthread.h>
#include <sys/mman.h>

#include "bigcache/cachestore.hh"

namespace bigcache {
  typedef void *(*mmap_sign)(void *, size_t, int, int, int, off_t);
  typedef int (*munmap_sign)(void *, size_t);

  struct fault_config_t {
    bool zero_fill_on_miss = true;
    bool collect_stats = true;
    int log_level = 0;

    /** @brief Cached pages installed after each hit */
    uint32_t prefetch_ahead = 0;

    /** @brief Attempts for an UFFDIO_COPY that keeps failing with EAGAIN */
    uint32_t copy_retries = 3;
  };

  struct fault_stats_t {
    uint64_t total_faults;
    uint64_t cache_hits;
    uint64_t cache_misses;
    uint64_t zero_fills;
    uint64_t copy_errors;
    uint64_t prefetched;
    uint64_t total_ns;
    uint64_t max_ns;
  };

  /** @brief Address range served by the fault server */
  struct memory_region_t {
    void *base;
    size_t size;
    std::string source_path;
    uint64_t file_offset;
    int prot;

    /** @brief Id of source_path in the store, empty if the file is absent */
    std::optional<uint32_t> file_id;

    bool contains(uint64_t addr) const {
      const auto start = (uint64_t)base;
      return addr >= start and addr < start + size;
    }
  };

  /**
   * @brief Demand pager backed by a CacheStore
   *
   * @details One worker thread waits on the userfaultfd and a wake pipe. The
   * region registry and the statistics are protected by two different
   * mutexes so that registering a region never waits on stats updates.
   */
  class FaultServer {
  public:
    enum class state_t { CREATED, CONFIGURED, RUNNING, STOPPED };

    static constexpr int POLL_TIMEOUT_MS = 1000;

  private:
    CacheStore *store;
    mmap_sign map_fn;
    munmap_sign unmap_fn;
    std::atomic<state_t> state = state_t::CREATED;
    fault_config_t cfg;

    int uffd = -1;
    int wake_fds[2] = {-1, -1};
    void *zero_page = nullptr;

    pthread_t worker;
    std::mutex state_mtx;

    std::vector<memory_region_t> regions;
    mutable std::mutex regions_mtx;

    fault_stats_t stats = {};
    mutable std::mutex stats_mtx;

    static void *worker_entry(void *arg);
    void event_loop();
    void handle_event(const uffd_msg &msg);

    int copy_page(uint64_t dst, const void *src);
    int zero_fill_page(uint64_t dst);
    void prefetch(const memory_region_t &region, uint64_t fault_page);
    void record_fault(bool hit, bool zero_fill, bool copy_error,
                      uint64_t ns);

  public:
    /**
     * @param[in] store Cache the pages are served from
     * @param[in] map_fn,unmap_fn Used for the server's own mappings, an
     * mmap() interposer passes the libc functions here
     */
    explicit FaultServer(CacheStore *store, mmap_sign map_fn = ::mmap,
                         munmap_sign unmap_fn = ::munmap)
        : store(store), map_fn(map_fn), unmap_fn(unmap_fn) {}
    ~FaultServer();

    FaultServer(const FaultServer &) = delete;
    FaultServer &operator=(const FaultServer &) = delete;

    /**
     * @brief Open the userfaultfd and allocate the wake pipe and zero page
     * @return 0 on success, -errno otherwise. Fails when the process is not
     * allowed to use userfaultfd.
     */
    int init();

    /** @return 0, or -EBUSY while the worker is running */
    int set_config(const fault_config_t &config);
    fault_config_t get_config() const { return cfg; }

    /** @brief Spawn the worker thread, no-op if already running */
    int start();

    /** @brief Wake the worker and join it, no-op if not running */
    int stop();

    state_t get_state() const { return state.load(); }
    bool is_running() const { return state.load() == state_t::RUNNING; }

    /**
     * @brief Serve missing pages of [addr, addr + size) from @p path
     * @param[in] addr Page aligned start address
     * @param[in] size Length, rounded up to a page multiple
     * @param[in] path Source file the range mirrors
     * @param[in] file_off Offset in @p path that maps to @p addr
     * @return 0 on success, -errno otherwise. Nothing is recorded on failure.
     */
    int register_region(void *addr, size_t size, const std::string &path,
                        uint64_t file_off);

    /** @return 0, or -ENOENT if no region starts at @p addr */
    int unregister_region(void *addr);

    /**
     * @brief Anonymous mapping whose pages are faulted in from the cache
     * @return Start of the mapping, nullptr on failure with nothing left
     * mapped or registered
     */
    void *create_mapping(size_t size, const std::string &path,
                         uint64_t file_off, int prot);

    /**
     * @brief Unmap (a prefix of) a mapping returned by create_mapping()
     * @return 0, -ENOENT if no region starts at @p addr, or -errno from
     * munmap
     */
    int destroy_mapping(void *addr, size_t size);

    /**
     * @brief Resolve a fault at @p addr
     * @return 0 if the page was installed, -ENODATA on a miss with zero fill
     * disabled, -ENOENT if no region covers @p addr, -errno if the kernel
     * refused the page
     */
    int handle_fault(uint64_t addr);

    fault_stats_t get_stats() const;
    void reset_stats();
    void print_stats(std::ostream &os) const;
    void dump_regions(std::ostream &os) const;
    size_t region_count() const;
  };
} // namespace bigcache

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   interceptor.hh
 * @date   octobre 10, 2026
 * @brief  Redirects private file mappings to fault server regions
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>

#include <sys/types.h>

#include "bigcache/cachestore.hh"
#include "bigcache/faultserver.hh"

namespace bigcache {
  /**
   * @brief mmap()/munmap() front end
   *
   * @details Every call that is not redirected goes to the real functions
   * unchanged, with the same arguments, return value and errno.
   */
  class MmapInterceptor {
  private:
    CacheStore *store;
    FaultServer *server;
    mmap_sign real_mmap;
    munmap_sign real_munmap;
    int verbose;

    std::atomic<uint64_t> intercepted = 0;
    std::atomic<uint64_t> bypassed = 0;
    std::atomic<uint64_t> bytes_redirected = 0;

    void *bypass(void *addr, size_t len, int prot, int flags, int fd,
                 off_t off);

  public:
    /**
     * @param[in] store Loaded cache, may be nullptr to bypass everything
     * @param[in] server Fault server, mappings are only redirected while it
     * runs
     */
    MmapInterceptor(CacheStore *store, FaultServer *server,
                    mmap_sign real_mmap, munmap_sign real_munmap,
                    int verbose = 0)
        : store(store), server(server), real_mmap(real_mmap),
          real_munmap(real_munmap), verbose(verbose) {}

    /** @brief Whether mappings of @p path may be served from the cache */
    static bool is_cacheable_path(const std::string &path);

    void *mmap(void *addr, size_t len, int prot, int flags, int fd,
               off_t off);
    int munmap(void *addr, size_t len);

    uint64_t intercepted_count() const { return intercepted.load(); }
    uint64_t bypassed_count() const { return bypassed.load(); }
    uint64_t redirected_bytes() const { return bytes_redirected.load(); }

    void print_stats(std::ostream &os) const;
  };
} // namespace bigcache

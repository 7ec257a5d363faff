// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   test_faultserver.cc
 * @date   octobre 16, 2026
 * @brief  userfaultfd page resolution from a cache file
 */

#include "gtest/gtest.h"
#include <cstring>
#include <sys/mman.h>

#include "bigcache/faultserver.hh"
#include "bigcache/packer.hh"
#include "test_util.hh"

using namespace bigcache;
using namespace bigcache::test;

/* lib.so has 4 pages on disk, only the first 3 are packed */
class FaultServerTest : public ::testing::Test {
protected:
  TempDir dir;
  std::string lib, cache;
  CacheStore store;

  void SetUp() override {
    ASSERT_TRUE(dir.ok());

    lib = write_pattern_file(dir / "lib.so", 4 * PAGE_SIZE, 5);
    cache = dir / "cache.bin";

    Packer packer;
    packer.add_entry({lib, 0, 3 * PAGE_SIZE, 0});
    ASSERT_EQ(packer.build(cache), 0);
    ASSERT_EQ(store.load(cache), format_error_t::NONE);
  }

  /* Anonymous range the tests register by hand */
  uint8_t *map_pages(size_t count) {
    void *addr = mmap(nullptr, count * PAGE_SIZE, PROT_READ | PROT_WRITE,
                      MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    return addr == MAP_FAILED ? nullptr : (uint8_t *)addr;
  }

  static bool page_matches(const uint8_t *page, uint8_t seed,
                           uint64_t file_off) {
    const auto expected = pattern(seed, file_off + PAGE_SIZE);
    return memcmp(page, expected.data() + file_off, PAGE_SIZE) == 0;
  }
};

#define INIT_OR_SKIP(server)                                                  \
  do {                                                                        \
    const int rc_ = (server).init();                                          \
    if (rc_ != 0) {                                                           \
      GTEST_SKIP() << "userfaultfd unavailable: " << strerror(-rc_);          \
    }                                                                         \
  } while (0)

TEST_F(FaultServerTest, hit_installs_cached_page) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);

  uint8_t *base = map_pages(3);
  ASSERT_NE(base, nullptr);
  ASSERT_EQ(server.register_region(base, 3 * PAGE_SIZE, lib, 0), 0);

  EXPECT_EQ(server.handle_fault((uint64_t)base + PAGE_SIZE + 17), 0);
  EXPECT_TRUE(page_matches(base + PAGE_SIZE, 5, PAGE_SIZE));

  const auto stats = server.get_stats();
  EXPECT_EQ(stats.total_faults, 1u);
  EXPECT_EQ(stats.cache_hits, 1u);
  EXPECT_EQ(stats.cache_misses, 0u);
  EXPECT_EQ(stats.copy_errors, 0u);

  EXPECT_EQ(server.unregister_region(base), 0);
  munmap(base, 3 * PAGE_SIZE);
}

TEST_F(FaultServerTest, miss_without_zero_fill) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);

  fault_config_t cfg;
  cfg.zero_fill_on_miss = false;
  ASSERT_EQ(server.set_config(cfg), 0);

  uint8_t *base = map_pages(1);
  ASSERT_NE(base, nullptr);
  ASSERT_EQ(server.register_region(base, PAGE_SIZE, lib, 3 * PAGE_SIZE), 0);

  EXPECT_EQ(server.handle_fault((uint64_t)base), -ENODATA);

  const auto stats = server.get_stats();
  EXPECT_EQ(stats.total_faults, 1u);
  EXPECT_EQ(stats.cache_misses, 1u);
  EXPECT_EQ(stats.zero_fills, 0u);

  /* The page was never installed, drop the registration before unmapping */
  EXPECT_EQ(server.unregister_region(base), 0);
  munmap(base, PAGE_SIZE);
}

TEST_F(FaultServerTest, miss_zero_fills) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);

  uint8_t *base = map_pages(1);
  ASSERT_NE(base, nullptr);
  ASSERT_EQ(server.register_region(base, PAGE_SIZE, lib, 3 * PAGE_SIZE), 0);

  EXPECT_EQ(server.handle_fault((uint64_t)base), 0);

  const std::vector<uint8_t> zeros(PAGE_SIZE, 0);
  EXPECT_EQ(memcmp(base, zeros.data(), PAGE_SIZE), 0);

  const auto stats = server.get_stats();
  EXPECT_EQ(stats.zero_fills, 1u);
  EXPECT_EQ(stats.cache_hits, 0u);

  EXPECT_EQ(server.unregister_region(base), 0);
  munmap(base, PAGE_SIZE);
}

TEST_F(FaultServerTest, uncached_file_zero_fills) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);

  uint8_t *base = map_pages(1);
  ASSERT_NE(base, nullptr);
  ASSERT_EQ(server.register_region(base, PAGE_SIZE, dir / "other.so", 0), 0);

  EXPECT_EQ(server.handle_fault((uint64_t)base), 0);
  EXPECT_EQ(base[0], 0);
  EXPECT_EQ(server.get_stats().zero_fills, 1u);

  EXPECT_EQ(server.unregister_region(base), 0);
  munmap(base, PAGE_SIZE);
}

TEST_F(FaultServerTest, fault_outside_regions) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);

  EXPECT_EQ(server.handle_fault(0x1000), -ENOENT);

  const auto stats = server.get_stats();
  EXPECT_EQ(stats.total_faults, 1u);
  EXPECT_EQ(stats.cache_misses, 1u);
}

TEST_F(FaultServerTest, register_errors) {
  FaultServer server(&store);

  uint8_t *base = map_pages(2);
  ASSERT_NE(base, nullptr);

  /* No userfaultfd yet */
  EXPECT_EQ(server.register_region(base, PAGE_SIZE, lib, 0), -EBADF);

  const int rc = server.init();
  if (rc != 0) {
    munmap(base, 2 * PAGE_SIZE);
    GTEST_SKIP() << "userfaultfd unavailable: " << strerror(-rc);
  }

  EXPECT_EQ(server.register_region(base + 1, PAGE_SIZE, lib, 0), -EINVAL);
  EXPECT_EQ(server.register_region(base, 0, lib, 0), -EINVAL);
  EXPECT_EQ(server.unregister_region(base), -ENOENT);
  EXPECT_EQ(server.region_count(), 0u);

  /* Sizes are rounded up to whole pages */
  ASSERT_EQ(server.register_region(base, 100, lib, 0), 0);
  EXPECT_EQ(server.region_count(), 1u);
  EXPECT_EQ(server.unregister_region(base), 0);
  EXPECT_EQ(server.region_count(), 0u);

  munmap(base, 2 * PAGE_SIZE);
}

TEST_F(FaultServerTest, lifecycle) {
  FaultServer server(&store);
  EXPECT_EQ(server.get_state(), FaultServer::state_t::CREATED);

  /* Nothing to run without a userfaultfd */
  EXPECT_EQ(server.start(), -EBADF);
  EXPECT_FALSE(server.is_running());

  INIT_OR_SKIP(server);

  fault_config_t cfg;
  cfg.copy_retries = 0;
  ASSERT_EQ(server.set_config(cfg), 0);
  EXPECT_EQ(server.get_state(), FaultServer::state_t::CONFIGURED);
  EXPECT_EQ(server.get_config().copy_retries, 1u);

  ASSERT_EQ(server.start(), 0);
  EXPECT_TRUE(server.is_running());
  EXPECT_EQ(server.start(), 0);
  EXPECT_EQ(server.set_config(cfg), -EBUSY);

  EXPECT_EQ(server.stop(), 0);
  EXPECT_EQ(server.get_state(), FaultServer::state_t::STOPPED);
  EXPECT_EQ(server.stop(), 0);

  /* Restart after a stop */
  ASSERT_EQ(server.start(), 0);
  EXPECT_TRUE(server.is_running());
  EXPECT_EQ(server.stop(), 0);
}

TEST_F(FaultServerTest, worker_serves_real_faults) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);
  ASSERT_EQ(server.start(), 0);

  auto *base = (uint8_t *)server.create_mapping(3 * PAGE_SIZE, lib, 0,
                                                PROT_READ);
  ASSERT_NE(base, nullptr);
  EXPECT_EQ(server.region_count(), 1u);

  for (uint64_t off = 0; off < 3 * PAGE_SIZE; off += PAGE_SIZE) {
    EXPECT_TRUE(page_matches(base + off, 5, off)) << "page at " << off;
  }

  EXPECT_EQ(server.destroy_mapping(base, 3 * PAGE_SIZE), 0);
  EXPECT_EQ(server.region_count(), 0u);
  EXPECT_EQ(server.destroy_mapping(base, 3 * PAGE_SIZE), -ENOENT);

  /* The faulting thread is woken before the worker records the fault */
  EXPECT_EQ(server.stop(), 0);

  const auto stats = server.get_stats();
  EXPECT_EQ(stats.total_faults, 3u);
  EXPECT_EQ(stats.cache_hits, 3u);
}

TEST_F(FaultServerTest, partial_destroy_keeps_tail) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);
  ASSERT_EQ(server.start(), 0);

  auto *base = (uint8_t *)server.create_mapping(3 * PAGE_SIZE, lib, 0,
                                                PROT_READ);
  ASSERT_NE(base, nullptr);

  /* Drop the first page, the rest still mirrors lib.so from page 1 */
  ASSERT_EQ(server.destroy_mapping(base, PAGE_SIZE), 0);
  EXPECT_EQ(server.region_count(), 1u);
  EXPECT_TRUE(page_matches(base + 2 * PAGE_SIZE, 5, 2 * PAGE_SIZE));

  EXPECT_EQ(server.destroy_mapping(base + PAGE_SIZE, 2 * PAGE_SIZE), 0);
  EXPECT_EQ(server.region_count(), 0u);

  EXPECT_EQ(server.stop(), 0);
}

TEST_F(FaultServerTest, prefetch_after_hit) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);

  fault_config_t cfg;
  cfg.prefetch_ahead = 4;
  ASSERT_EQ(server.set_config(cfg), 0);

  uint8_t *base = map_pages(3);
  ASSERT_NE(base, nullptr);
  ASSERT_EQ(server.register_region(base, 3 * PAGE_SIZE, lib, 0), 0);

  ASSERT_EQ(server.handle_fault((uint64_t)base), 0);

  /* Prefetch stops at the end of the region */
  const auto stats = server.get_stats();
  ASSERT_EQ(stats.prefetched, 2u);
  EXPECT_EQ(stats.total_faults, 1u);

  /* No worker runs, these pages are only readable because they are present */
  for (uint64_t off = 0; off < 3 * PAGE_SIZE; off += PAGE_SIZE) {
    EXPECT_TRUE(page_matches(base + off, 5, off)) << "page at " << off;
  }

  EXPECT_EQ(server.unregister_region(base), 0);
  munmap(base, 3 * PAGE_SIZE);
}

TEST_F(FaultServerTest, double_resolve_is_harmless) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);

  uint8_t *base = map_pages(1);
  ASSERT_NE(base, nullptr);
  ASSERT_EQ(server.register_region(base, PAGE_SIZE, lib, 0), 0);

  EXPECT_EQ(server.handle_fault((uint64_t)base), 0);
  EXPECT_EQ(server.handle_fault((uint64_t)base), 0);
  EXPECT_TRUE(page_matches(base, 5, 0));
  EXPECT_EQ(server.get_stats().copy_errors, 0u);

  EXPECT_EQ(server.unregister_region(base), 0);
  munmap(base, PAGE_SIZE);
}

TEST_F(FaultServerTest, reset_stats) {
  FaultServer server(&store);
  INIT_OR_SKIP(server);

  EXPECT_EQ(server.handle_fault(0x1000), -ENOENT);
  ASSERT_EQ(server.get_stats().total_faults, 1u);

  server.reset_stats();
  EXPECT_EQ(server.get_stats().total_faults, 0u);
}

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   test_interceptor.cc
 * @date   octobre 17, 2026
 * @brief  mmap() redirection and bypass rules
 */

#include "gtest/gtest.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include "bigcache/interceptor.hh"
#include "bigcache/packer.hh"
#include "test_util.hh"

using namespace bigcache;
using namespace bigcache::test;

TEST(interceptor, cacheable_paths) {
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("/system/lib64/libc.so"));
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("/data/app/base.apk"));
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("/data/app/oat/base.odex"));
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("/data/app/oat/base.vdex"));
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("boot.art"));
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("boot.oat"));
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("classes.dex"));
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("core.jar"));
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("/usr/lib/libz.so.1"));
  EXPECT_TRUE(MmapInterceptor::is_cacheable_path("/usr/lib/libz.so.1.2.13"));

  EXPECT_FALSE(MmapInterceptor::is_cacheable_path(""));
  EXPECT_FALSE(MmapInterceptor::is_cacheable_path("/data/db.sqlite"));
  EXPECT_FALSE(MmapInterceptor::is_cacheable_path("/tmp/notes.txt"));
  EXPECT_FALSE(MmapInterceptor::is_cacheable_path("/tmp/lib.so.bak"));
  EXPECT_FALSE(MmapInterceptor::is_cacheable_path("/tmp/lib.so."));
  EXPECT_FALSE(MmapInterceptor::is_cacheable_path("/tmp/sofile"));
}

/* lib.so has 4 pages on disk, only the first 3 are packed */
class InterceptorTest : public ::testing::Test {
protected:
  TempDir dir;
  std::string lib, data, cache;
  CacheStore store;
  int lib_fd = -1, data_fd = -1;

  void SetUp() override {
    ASSERT_TRUE(dir.ok());

    lib = write_pattern_file(dir / "lib.so", 4 * PAGE_SIZE, 9);
    data = write_pattern_file(dir / "data.bin", 2 * PAGE_SIZE, 4);
    cache = dir / "cache.bin";

    Packer packer;
    packer.add_entry({lib, 0, 3 * PAGE_SIZE, 0});
    packer.add_entry({data, 0, 2 * PAGE_SIZE, 1});
    ASSERT_EQ(packer.build(cache), 0);
    ASSERT_EQ(store.load(cache), format_error_t::NONE);

    lib_fd = open(lib.c_str(), O_RDONLY);
    data_fd = open(data.c_str(), O_RDONLY);
    ASSERT_NE(lib_fd, -1);
    ASSERT_NE(data_fd, -1);
  }

  void TearDown() override {
    if (lib_fd != -1) close(lib_fd);
    if (data_fd != -1) close(data_fd);
  }

  static bool bytes_match(const void *addr, uint8_t seed, uint64_t file_off,
                          size_t len) {
    const auto expected = pattern(seed, file_off + len);
    return memcmp(addr, expected.data() + file_off, len) == 0;
  }
};

TEST_F(InterceptorTest, redirects_cached_library) {
  FaultServer server(&store);
  const int rc = server.init();
  if (rc != 0) {
    GTEST_SKIP() << "userfaultfd unavailable: " << strerror(-rc);
  }
  ASSERT_EQ(server.start(), 0);

  MmapInterceptor icpt(&store, &server, ::mmap, ::munmap);

  void *addr = icpt.mmap(nullptr, 2 * PAGE_SIZE, PROT_READ, MAP_PRIVATE,
                         lib_fd, PAGE_SIZE);
  ASSERT_NE(addr, MAP_FAILED);
  EXPECT_EQ(icpt.intercepted_count(), 1u);
  EXPECT_EQ(icpt.bypassed_count(), 0u);
  EXPECT_EQ(icpt.redirected_bytes(), 2 * PAGE_SIZE);
  EXPECT_EQ(server.region_count(), 1u);

  EXPECT_TRUE(bytes_match(addr, 9, PAGE_SIZE, 2 * PAGE_SIZE));

  EXPECT_EQ(icpt.munmap(addr, 2 * PAGE_SIZE), 0);
  EXPECT_EQ(server.region_count(), 0u);

  EXPECT_EQ(server.stop(), 0);
  EXPECT_EQ(server.get_stats().cache_hits, 2u);
}

TEST_F(InterceptorTest, bypasses_uncached_offset) {
  FaultServer server(&store);
  const int rc = server.init();
  if (rc != 0) {
    GTEST_SKIP() << "userfaultfd unavailable: " << strerror(-rc);
  }
  ASSERT_EQ(server.start(), 0);

  MmapInterceptor icpt(&store, &server, ::mmap, ::munmap);

  void *addr = icpt.mmap(nullptr, PAGE_SIZE, PROT_READ, MAP_PRIVATE, lib_fd,
                         3 * PAGE_SIZE);
  ASSERT_NE(addr, MAP_FAILED);
  EXPECT_EQ(icpt.intercepted_count(), 0u);
  EXPECT_EQ(icpt.bypassed_count(), 1u);
  EXPECT_EQ(server.region_count(), 0u);
  EXPECT_TRUE(bytes_match(addr, 9, 3 * PAGE_SIZE, PAGE_SIZE));

  EXPECT_EQ(icpt.munmap(addr, PAGE_SIZE), 0);
  EXPECT_EQ(server.stop(), 0);
}

TEST_F(InterceptorTest, bypasses_ineligible_calls) {
  FaultServer server(&store);
  const int rc = server.init();
  if (rc != 0) {
    GTEST_SKIP() << "userfaultfd unavailable: " << strerror(-rc);
  }
  ASSERT_EQ(server.start(), 0);

  MmapInterceptor icpt(&store, &server, ::mmap, ::munmap);

  /* Extension is not on the list even though the file is cached */
  void *addr = icpt.mmap(nullptr, PAGE_SIZE, PROT_READ, MAP_PRIVATE, data_fd,
                         0);
  ASSERT_NE(addr, MAP_FAILED);
  EXPECT_TRUE(bytes_match(addr, 4, 0, PAGE_SIZE));
  EXPECT_EQ(icpt.munmap(addr, PAGE_SIZE), 0);

  /* Shared mappings must see the file */
  addr = icpt.mmap(nullptr, PAGE_SIZE, PROT_READ, MAP_SHARED, lib_fd, 0);
  ASSERT_NE(addr, MAP_FAILED);
  EXPECT_TRUE(bytes_match(addr, 9, 0, PAGE_SIZE));
  EXPECT_EQ(icpt.munmap(addr, PAGE_SIZE), 0);

  /* Anonymous memory */
  addr = icpt.mmap(nullptr, PAGE_SIZE, PROT_READ | PROT_WRITE,
                   MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
  ASSERT_NE(addr, MAP_FAILED);
  ((volatile uint8_t *)addr)[0] = 1;
  EXPECT_EQ(icpt.munmap(addr, PAGE_SIZE), 0);

  /* Unaligned offset fails the same way the kernel does */
  errno = 0;
  addr = icpt.mmap(nullptr, PAGE_SIZE, PROT_READ, MAP_PRIVATE, lib_fd, 100);
  EXPECT_EQ(addr, MAP_FAILED);
  EXPECT_EQ(errno, EINVAL);

  EXPECT_EQ(icpt.intercepted_count(), 0u);
  EXPECT_EQ(icpt.bypassed_count(), 4u);
  EXPECT_EQ(server.region_count(), 0u);

  EXPECT_EQ(server.stop(), 0);
}

TEST_F(InterceptorTest, bad_fd_matches_libc) {
  MmapInterceptor icpt(&store, nullptr, ::mmap, ::munmap);

  errno = 0;
  void *expected = ::mmap(nullptr, PAGE_SIZE, PROT_READ, MAP_PRIVATE, -1, 0);
  const int expected_errno = errno;

  errno = 0;
  void *actual = icpt.mmap(nullptr, PAGE_SIZE, PROT_READ, MAP_PRIVATE, -1, 0);

  EXPECT_EQ(expected, MAP_FAILED);
  EXPECT_EQ(actual, MAP_FAILED);
  EXPECT_EQ(errno, expected_errno);
  EXPECT_EQ(errno, EBADF);
}

TEST_F(InterceptorTest, bypasses_without_running_server) {
  FaultServer server(&store);

  /* Never started */
  MmapInterceptor stopped(&store, &server, ::mmap, ::munmap);
  void *addr = stopped.mmap(nullptr, PAGE_SIZE, PROT_READ, MAP_PRIVATE,
                            lib_fd, 0);
  ASSERT_NE(addr, MAP_FAILED);
  EXPECT_TRUE(bytes_match(addr, 9, 0, PAGE_SIZE));
  EXPECT_EQ(stopped.bypassed_count(), 1u);
  EXPECT_EQ(stopped.munmap(addr, PAGE_SIZE), 0);

  /* No server at all */
  MmapInterceptor none(&store, nullptr, ::mmap, ::munmap);
  addr = none.mmap(nullptr, PAGE_SIZE, PROT_READ, MAP_PRIVATE, lib_fd, 0);
  ASSERT_NE(addr, MAP_FAILED);
  EXPECT_TRUE(bytes_match(addr, 9, 0, PAGE_SIZE));
  EXPECT_EQ(none.bypassed_count(), 1u);
  EXPECT_EQ(none.munmap(addr, PAGE_SIZE), 0);

  /* No cache */
  MmapInterceptor no_store(nullptr, nullptr, ::mmap, ::munmap);
  addr = no_store.mmap(nullptr, PAGE_SIZE, PROT_READ, MAP_PRIVATE, lib_fd, 0);
  ASSERT_NE(addr, MAP_FAILED);
  EXPECT_EQ(no_store.intercepted_count(), 0u);
  EXPECT_EQ(no_store.munmap(addr, PAGE_SIZE), 0);
}

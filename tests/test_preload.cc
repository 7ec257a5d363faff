// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   test_preload.cc
 * @date   octobre 19, 2026
 * @brief  bcpreload loaded into a real process with LD_PRELOAD
 */

#include "gtest/gtest.h"
#include <cstdlib>
#include <cstring>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

#include "bigcache/faultserver.hh"
#include "bigcache/packer.hh"
#include "test_util.hh"

using namespace bigcache;
using namespace bigcache::test;

constexpr size_t FILE_PAGES = 4;
constexpr uint8_t PACKED_SEED = 21;
constexpr uint8_t REWRITTEN_SEED = 22;

/* lib.so is packed with one pattern and rewritten with another, only a
   redirected mapping shows the packed bytes */
class PreloadTest : public ::testing::Test {
protected:
  TempDir dir;
  std::string lib, cache;
  CacheStore store;

  struct helper_result_t {
    int exit_code;
    std::string err;
  };

  void SetUp() override {
    ASSERT_TRUE(dir.ok());

    lib = write_pattern_file(dir / "lib.so", FILE_PAGES * PAGE_SIZE,
                             PACKED_SEED);
    cache = dir / "cache.bin";

    Packer packer;
    packer.add_entry({lib, 0, FILE_PAGES * PAGE_SIZE, 0});
    ASSERT_EQ(packer.build(cache), 0);
    ASSERT_EQ(store.load(cache), format_error_t::NONE);

    write_pattern_file(lib, FILE_PAGES * PAGE_SIZE, REWRITTEN_SEED);
  }

  /** @brief Run the helper under the shim, exit_code is -1 if it crashed */
  helper_result_t run_helper(const std::string &cache_path,
                             const std::string &enabled, uint8_t seed) {
    helper_result_t result = {-1, ""};

    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
      return result;
    }

    const pid_t pid = fork();
    if (pid == -1) {
      close(err_pipe[0]);
      close(err_pipe[1]);
      return result;
    }

    if (pid == 0) {
      close(err_pipe[0]);
      dup2(err_pipe[1], STDERR_FILENO);

      setenv("LD_PRELOAD", BCPRELOAD_PATH, 1);
      setenv("BIGCACHE_PATH", cache_path.c_str(), 1);
      setenv("BIGCACHE_ENABLED", enabled.c_str(), 1);

      const auto seed_str = std::to_string((int)seed);
      execl(PRELOAD_HELPER_PATH, PRELOAD_HELPER_PATH, lib.c_str(),
            seed_str.c_str(), (char *)nullptr);
      _exit(127);
    }

    close(err_pipe[1]);
    char buf[512];
    ssize_t rc;
    while ((rc = read(err_pipe[0], buf, sizeof(buf))) > 0) {
      result.err.append(buf, rc);
    }
    close(err_pipe[0]);

    int status;
    if (waitpid(pid, &status, 0) == pid and WIFEXITED(status)) {
      result.exit_code = WEXITSTATUS(status);
    }

    return result;
  }

  bool userfaultfd_available() {
    FaultServer server(&store);
    return server.init() == 0;
  }
};

TEST_F(PreloadTest, cached_library_served_from_cache) {
  if (not userfaultfd_available()) {
    GTEST_SKIP() << "userfaultfd unavailable";
  }

  const auto result = run_helper(cache, "1", PACKED_SEED);
  EXPECT_EQ(result.exit_code, 0) << result.err;

  /* Printed by the destructor with the fault server still running */
  EXPECT_NE(result.err.find("Summary:"), std::string::npos) << result.err;
}

TEST_F(PreloadTest, disabled_shim_passes_through) {
  const auto result = run_helper(cache, "0", REWRITTEN_SEED);
  EXPECT_EQ(result.exit_code, 0) << result.err;
  EXPECT_EQ(result.err.find("Summary:"), std::string::npos) << result.err;
}

TEST_F(PreloadTest, missing_cache_passes_through) {
  const auto result =
      run_helper(dir / "missing.bin", "1", REWRITTEN_SEED);
  EXPECT_EQ(result.exit_code, 0) << result.err;
  EXPECT_EQ(result.err.find("Summary:"), std::string::npos) << result.err;
}

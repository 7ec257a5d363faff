// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   test_config.cc
 * @date   octobre 16, 2026
 * @brief  BIGCACHE_* environment parsing
 */

#include "gtest/gtest.h"
#include <cstdlib>

#include "bigcache/config.hh"

using namespace bigcache;

static void clear_env() {
  for (const char *var : {"BIGCACHE_PATH", "BIGCACHE_ENABLED",
                          "BIGCACHE_VERBOSE", "BIGCACHE_ZERO_FILL",
                          "BIGCACHE_PREFETCH"}) {
    unsetenv(var);
  }
}

TEST(config, defaults) {
  clear_env();

  const auto cfg = read_preload_config();
  EXPECT_EQ(cfg.cache_path, DEFAULT_CACHE_PATH);
  EXPECT_TRUE(cfg.enabled);
  EXPECT_EQ(cfg.verbose, 0);
  EXPECT_TRUE(cfg.zero_fill);
  EXPECT_EQ(cfg.prefetch_ahead, 0u);
}

TEST(config, from_environment) {
  clear_env();
  setenv("BIGCACHE_PATH", "/tmp/app.bigcache", 1);
  setenv("BIGCACHE_ENABLED", "0", 1);
  setenv("BIGCACHE_VERBOSE", "3", 1);
  setenv("BIGCACHE_ZERO_FILL", "0", 1);
  setenv("BIGCACHE_PREFETCH", "8", 1);

  const auto cfg = read_preload_config();
  EXPECT_EQ(cfg.cache_path, "/tmp/app.bigcache");
  EXPECT_FALSE(cfg.enabled);
  EXPECT_EQ(cfg.verbose, 3);
  EXPECT_FALSE(cfg.zero_fill);
  EXPECT_EQ(cfg.prefetch_ahead, 8u);

  clear_env();
}

TEST(config, malformed_values_use_defaults) {
  clear_env();
  setenv("BIGCACHE_ENABLED", "yes", 1);
  setenv("BIGCACHE_VERBOSE", "12abc", 1);
  setenv("BIGCACHE_PREFETCH", "-4", 1);

  const auto cfg = read_preload_config();
  EXPECT_TRUE(cfg.enabled);
  EXPECT_EQ(cfg.verbose, 0);
  EXPECT_EQ(cfg.prefetch_ahead, 0u);

  clear_env();
}

TEST(config, verbose_is_clamped) {
  clear_env();
  setenv("BIGCACHE_VERBOSE", "42", 1);

  EXPECT_EQ(read_preload_config().verbose, MAX_VERBOSE);

  clear_env();
}

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   config.hh
 * @date   octobre  8, 2026
 * @brief  Runtime configuration of the preload shim
 */

#pragma once

#include <cstdint>
#include <string>

namespace bigcache {
  constexpr const char *DEFAULT_CACHE_PATH = "/data/local/tmp/bigcache.bin";
  constexpr int MAX_VERBOSE = 5;

  struct preload_config_t {
    std::string cache_path = DEFAULT_CACHE_PATH;
    bool enabled = true;
    int verbose = 0;
    bool zero_fill = true;
    uint32_t prefetch_ahead = 0;
  };

  /**
   * @brief Read BIGCACHE_* from the environment
   * @details Unset variables keep their default, malformed numbers fall back
   * to the default with a warning.
   */
  preload_config_t read_preload_config();
} // namespace bigcache

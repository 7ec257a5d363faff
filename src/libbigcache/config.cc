// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   config.cc
 * @date   octobre  8, 2026
 * @brief  Environment parsing for the preload shim
 */

#include <algorithm>

#include "bigcache/config.hh"
#include "bigcache/envvars.hh"
#include "nvsl/trace.hh"

using namespace bigcache;

static long env_to_long(const std::string &name, const std::string &val,
                        long def) {
  if (val == "") {
    return def;
  }

  size_t idx = 0;
  long result = def;
  try {
    result = std::stol(val, &idx, 10);
  } catch (const std::exception &e) {
    idx = 0;
  }

  if (idx != val.size()) {
    DBGW << "Ignoring malformed " << name << "=" << val << ", using " << def
         << "\n";
    return def;
  }

  return result;
}

preload_config_t bigcache::read_preload_config() {
  preload_config_t cfg;

  cfg.cache_path = get_env_str(BIGCACHE_PATH_ENV, DEFAULT_CACHE_PATH);
  if (cfg.cache_path == "") {
    cfg.cache_path = DEFAULT_CACHE_PATH;
  }

  cfg.enabled = env_to_long("BIGCACHE_ENABLED",
                            get_env_str(BIGCACHE_ENABLED_ENV), 1) != 0;

  const long verbose = env_to_long("BIGCACHE_VERBOSE",
                                   get_env_str(BIGCACHE_VERBOSE_ENV), 0);
  cfg.verbose = (int)std::clamp<long>(verbose, 0, MAX_VERBOSE);

  cfg.zero_fill = env_to_long("BIGCACHE_ZERO_FILL",
                              get_env_str(BIGCACHE_ZERO_FILL_ENV), 1) != 0;

  const long prefetch = env_to_long("BIGCACHE_PREFETCH",
                                    get_env_str(BIGCACHE_PREFETCH_ENV), 0);
  cfg.prefetch_ahead = (uint32_t)std::max<long>(prefetch, 0);

  return cfg;
}

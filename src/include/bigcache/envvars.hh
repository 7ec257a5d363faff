// -*- mode: c++; c-basic-offset: 2; -*-

#pragma once

/**
 * @file   envvars.hh
 * @date   octobre  8, 2026
 * @brief  Environment variables read by the interception components
 */

#include <string>
#include "nvsl/envvars.hh"

NVSL_DECL_ENV(BIGCACHE_PATH);
NVSL_DECL_ENV(BIGCACHE_ENABLED);
NVSL_DECL_ENV(BIGCACHE_VERBOSE);
NVSL_DECL_ENV(BIGCACHE_ZERO_FILL);
NVSL_DECL_ENV(BIGCACHE_PREFETCH);

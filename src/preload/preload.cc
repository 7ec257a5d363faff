// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   preload.cc
 * @date   octobre 10, 2026
 * @brief  LD_PRELOAD shim serving library and dex mappings from a BigCache
 */

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>

#include <dlfcn.h>
#include <sys/mman.h>

#include "bigcache/cachestore.hh"
#include "bigcache/config.hh"
#include "bigcache/faultserver.hh"
#include "bigcache/interceptor.hh"
#include "nvsl/error.hh"
#include "nvsl/trace.hh"

using namespace bigcache;

static mmap_sign real_mmap = nullptr;
static munmap_sign real_munmap = nullptr;

struct preload_state_t {
  preload_config_t cfg;
  std::unique_ptr<CacheStore> store;
  std::unique_ptr<FaultServer> server;
  std::unique_ptr<MmapInterceptor> interceptor;
  uint64_t load_ns = 0;
  uint64_t preheat_ns = 0;
};

/**
 * @brief Set once the shim is fully initialized, nullptr means pass-through
 * @details Never freed, threads may still be inside an interposed call while
 * the destructors run.
 */
static std::atomic<preload_state_t *> preload_state = nullptr;

/** @brief Initialize all the dlsyms (mmap and munmap) */
static void init_dlsyms() {
  real_mmap = (mmap_sign)dlsym(RTLD_NEXT, "mmap");
  if (real_mmap == nullptr) {
    DBGE << "dlsym failed for mmap: " << std::string(dlerror()) << "\n";
    exit(1);
  }

  real_munmap = (munmap_sign)dlsym(RTLD_NEXT, "munmap");
  if (real_munmap == nullptr) {
    DBGE << "dlsym failed for munmap: " << std::string(dlerror()) << "\n";
    exit(1);
  }
}

static uint64_t elapsed_ns(std::chrono::steady_clock::time_point start) {
  using namespace std::chrono;
  return duration_cast<nanoseconds>(steady_clock::now() - start).count();
}

/** @brief Bring up the cache and the fault server, nullptr on any failure */
static preload_state_t *init_preload_state(const preload_config_t &cfg) {
  auto state = std::make_unique<preload_state_t>();
  state->cfg = cfg;
  state->store = std::make_unique<CacheStore>();

  auto start = std::chrono::steady_clock::now();
  const auto err = state->store->load(cfg.cache_path);
  if (err != format_error_t::NONE) {
    DBGW << "BigCache disabled, unable to load " << cfg.cache_path << ": "
         << format_error_str(err) << "\n";
    return nullptr;
  }
  state->load_ns = elapsed_ns(start);

  start = std::chrono::steady_clock::now();
  if (state->store->preheat() != 0) {
    DBGW << "Preheating " << cfg.cache_path << " failed\n";
  }
  state->preheat_ns = elapsed_ns(start);

  state->server = std::make_unique<FaultServer>(state->store.get(),
                                                real_mmap, real_munmap);
  if (state->server->init() != 0) {
    DBGW << "BigCache disabled, userfaultfd is not available\n";
    return nullptr;
  }

  fault_config_t fcfg;
  fcfg.zero_fill_on_miss = cfg.zero_fill;
  fcfg.collect_stats = true;
  fcfg.log_level = cfg.verbose;
  fcfg.prefetch_ahead = cfg.prefetch_ahead;

  if (state->server->set_config(fcfg) != 0 or state->server->start() != 0) {
    DBGW << "BigCache disabled, unable to start the fault server\n";
    return nullptr;
  }

  state->interceptor = std::make_unique<MmapInterceptor>(
      state->store.get(), state->server.get(), real_mmap, real_munmap,
      cfg.verbose);

  return state.release();
}

extern "C" {
void *mmap(void *__addr, size_t __len, int __prot, int __flags, int __fd,
           __off_t __offset) __THROW {
  if (real_mmap == nullptr) {
    init_dlsyms();
  }

  preload_state_t *state = preload_state.load(std::memory_order_acquire);
  if (state == nullptr) {
    return real_mmap(__addr, __len, __prot, __flags, __fd, __offset);
  }

  return state->interceptor->mmap(__addr, __len, __prot, __flags, __fd,
                                  __offset);
}

void *mmap64(void *__addr, size_t __len, int __prot, int __flags, int __fd,
             __off64_t __offset) __THROW {
  return mmap(__addr, __len, __prot, __flags, __fd, __offset);
}

int munmap(void *__addr, size_t __len) __THROW {
  if (real_munmap == nullptr) {
    init_dlsyms();
  }

  preload_state_t *state = preload_state.load(std::memory_order_acquire);
  if (state == nullptr) {
    return real_munmap(__addr, __len);
  }

  return state->interceptor->munmap(__addr, __len);
}
}

/**
 * @brief Constructor for the preload shared object
 */
__attribute__((__constructor__(101))) void bcpreload_ctor() {
  init_dlsyms();

  const auto cfg = read_preload_config();
  if (not cfg.enabled) {
    DBGH(1) << "BigCache is disabled by environment\n";
    return;
  }

  preload_state_t *state = init_preload_state(cfg);
  preload_state.store(state, std::memory_order_release);

  if (state != nullptr and cfg.verbose >= 1) {
    std::cerr << "BigCache: " << cfg.cache_path << " loaded in "
              << state->load_ns / 1000 << " us, preheated in "
              << state->preheat_ns / 1000 << " us\n";
  }
}

/**
 * @brief Destructor for the preload shared object
 */
__attribute__((__destructor__(101))) void bcpreload_dtor() {
  /* Later calls go straight to libc, the state itself stays allocated */
  preload_state_t *state =
      preload_state.exchange(nullptr, std::memory_order_acq_rel);
  if (state == nullptr) {
    return;
  }

  std::cerr << "Summary:\n";
  state->interceptor->print_stats(std::cerr);
  state->server->print_stats(std::cerr);
  state->store->print_stats(std::cerr);

  if (state->server->stop() != 0) {
    DBGW << "Unable to stop the fault server\n";
  }
}

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   bctracer.cc
 * @date   octobre 14, 2026
 * @brief  Runs or attaches to a process and serves its file reads from a
 * BigCache
 */

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "bigcache/cachestore.hh"
#include "bigcache/ptrace_backend.hh"
#include "bigcache/tracer.hh"
#include "nvsl/string.hh"
#include "nvsl/trace.hh"

using namespace bigcache;

static void usage(const char *prog) {
  std::cerr << "Usage:\n";
  std::cerr << "\t" << prog << " <cache.bin> -- <command> [args...]\n";
  std::cerr << "\t" << prog << " <cache.bin> -p <pid>\n";
}

int main(int argc, char *argv[]) {
  if (argc < 4) {
    usage(argv[0]);
    return EXIT_FAILURE;
  }

  const auto cache_path = nvsl::S(argv[1]);
  const auto mode = nvsl::S(argv[2]);

  if (mode != "--" and mode != "-p") {
    usage(argv[0]);
    return EXIT_FAILURE;
  }

  CacheStore store;
  const auto err = store.load(cache_path);
  if (err != format_error_t::NONE) {
    DBGE << "Failed to load " << cache_path << ": " << format_error_str(err)
         << "\n";
    return EXIT_FAILURE;
  }

  if (store.preheat() != 0) {
    DBGW << "Preheating " << cache_path << " failed\n";
  }

  const auto backend = make_native_backend();
  if (backend == nullptr) {
    DBGE << "No ptrace backend for this architecture\n";
    return EXIT_FAILURE;
  }

  SyscallTracer tracer(&store, backend.get());
  int rc;

  if (mode == "-p") {
    pid_t pid;
    try {
      pid = std::stoi(argv[3]);
    } catch (const std::exception &e) {
      DBGE << "Invalid pid `" << argv[3] << "'\n";
      return EXIT_FAILURE;
    }
    rc = tracer.attach(pid);
  } else {
    rc = tracer.spawn(std::vector<std::string>(argv + 3, argv + argc));
  }

  if (rc != 0) {
    DBGE << "Unable to start tracing: " << strerror(-rc) << "\n";
    return EXIT_FAILURE;
  }

  const int status = tracer.run();

  std::cerr << "Summary:\n";
  tracer.print_stats(std::cerr);
  store.print_stats(std::cerr);

  if (status < 0) {
    DBGE << "Tracing failed: " << strerror(-status) << "\n";
    return EXIT_FAILURE;
  }

  return status;
}

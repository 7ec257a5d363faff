// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   bigcache.cc
 * @date   octobre 14, 2026
 * @brief  Command line entry point: pack, verify, info, benchmark, simulate
 */

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iomanip>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <sys/mman.h>

#include "bigcache/cachestore.hh"
#include "bigcache/faultserver.hh"
#include "bigcache/filewarm.hh"
#include "bigcache/layout.hh"
#include "bigcache/packer.hh"
#include "nvsl/clock.hh"
#include "nvsl/common.hh"
#include "nvsl/string.hh"
#include "nvsl/trace.hh"

using namespace bigcache;

using args_t = std::vector<std::string>;

struct command_t {
  std::function<int(const args_t &)> fn;
  size_t min_args;
  std::string usage;
  std::string help;
};

static constexpr size_t DEFAULT_ITERATIONS = 1000;

static double ns_to_ms(size_t ns) {
  return (double)ns / 1000000.0;
}

static bool load_store(CacheStore &store, const std::string &path) {
  const auto err = store.load(path);
  if (err != format_error_t::NONE) {
    DBGE << "Failed to load " << path << ": " << format_error_str(err)
         << "\n";
    return false;
  }

  return true;
}

/** @brief Mapping of the first cached file served by @p server */
static void *map_first_file(const CacheStore &store, FaultServer &server,
                            size_t &len) {
  const file_entry_t &fe = store.file(0);
  len = page_align_up(std::max<uint64_t>((uint64_t)fe.original_size,
                                         (uint64_t)fe.page_count * PAGE_SIZE));

  return server.create_mapping(len, store.file_path(0), 0, PROT_READ);
}

static int cmd_pack(const args_t &args) {
  Packer packer;

  const int rows = packer.load_layout(args[0]);
  if (rows < 0) {
    return EXIT_FAILURE;
  }

  if (packer.page_count() == 0) {
    DBGE << "Layout " << args[0] << " names no pages\n";
    return EXIT_FAILURE;
  }

  const int rc = packer.build(args[1]);
  if (rc != 0) {
    DBGE << "Failed to build " << args[1] << ": " << strerror(-rc) << "\n";
    return EXIT_FAILURE;
  }

  const auto &report = packer.report();
  std::cout << "BigCache written to " << args[1] << "\n";
  std::cout << "  Rows: " << rows << "\n";
  std::cout << "  Pages: " << report.pages << "\n";
  std::cout << "  Files: " << report.files << "\n";
  std::cout << "  Pages read: " << report.read_ok << "\n";
  std::cout << "  Pages zero-filled: " << report.read_failed << "\n";
  std::cout << "  Size: " << report.total_size << " bytes\n";

  return EXIT_SUCCESS;
}

static int cmd_verify(const args_t &args) {
  CacheStore store;
  if (not load_store(store, args[0])) {
    return EXIT_FAILURE;
  }

  const int rc = store.verify();
  if (rc != 0) {
    DBGE << args[0] << " failed verification\n";
    return EXIT_FAILURE;
  }

  std::cout << args[0] << ": OK (" << store.header().page_count
            << " pages, " << store.header().file_count << " files)\n";
  return EXIT_SUCCESS;
}

static int cmd_info(const args_t &args) {
  CacheStore store;
  if (not load_store(store, args[0])) {
    return EXIT_FAILURE;
  }

  const header_t &hdr = store.header();

  std::cout << "=== BigCache Information ===\n";
  std::cout << "File: " << args[0] << "\n";
  std::cout << "Magic: 0x" << std::hex << hdr.magic << std::dec << "\n";
  std::cout << "Version: " << hdr.version << "\n";
  std::cout << "Pages: " << hdr.page_count << "\n";
  std::cout << "Files: " << hdr.file_count << "\n";
  std::cout << "Total size: " << hdr.total_size << " bytes\n";
  std::cout << "Data offset: 0x" << std::hex << hdr.data_offset << "\n";
  std::cout << "Index offset: 0x" << hdr.index_offset << "\n";
  std::cout << "File table offset: 0x" << hdr.file_table_offset << std::dec
            << "\n";
  std::cout << "Checksum: 0x" << std::hex << hdr.checksum << std::dec
            << "\n";

  std::cout << "\nFiles:\n";
  for (uint32_t id = 0; id < hdr.file_count; id++) {
    const file_entry_t &fe = store.file(id);
    std::cout << "  [" << id << "] " << store.file_path(id) << " ("
              << fe.page_count << " pages, " << fe.original_size
              << " bytes)\n";
  }

  return EXIT_SUCCESS;
}

static int cmd_benchmark(const args_t &args) {
  size_t iterations = DEFAULT_ITERATIONS;
  if (args.size() > 1) {
    try {
      iterations = std::stoul(args[1]);
    } catch (const std::exception &e) {
      DBGE << "Invalid iteration count `" << args[1] << "'\n";
      return EXIT_FAILURE;
    }
  }

  if (iterations == 0) {
    DBGE << "Iteration count must be positive\n";
    return EXIT_FAILURE;
  }

  nvsl::Clock clk;
  CacheStore store;

  clk.tick();
  if (not load_store(store, args[0])) {
    return EXIT_FAILURE;
  }
  clk.tock();
  const auto load_ns = clk.ns();

  clk.reset();
  clk.tick();
  const int rc = store.preheat();
  clk.tock();
  const auto preheat_ns = clk.ns();

  if (rc != 0) {
    DBGW << "Preheat failed: " << strerror(-rc) << "\n";
  }

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "=== BigCache Benchmark ===\n";
  std::cout << "File: " << args[0] << "\n";
  std::cout << "Iterations: " << iterations << "\n";
  std::cout << "Load time: " << ns_to_ms(load_ns) << " ms\n";
  std::cout << "Preheat time: " << ns_to_ms(preheat_ns) << " ms\n";

  const header_t &hdr = store.header();
  if (hdr.page_count == 0 or hdr.file_count == 0) {
    std::cout << "Cache is empty, nothing to benchmark\n";
    return EXIT_SUCCESS;
  }

  /* Lookup cost over the index */
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<uint32_t> pick(0, hdr.page_count - 1);
  volatile uint8_t sum = 0;

  clk.reset();
  clk.tick();
  for (size_t i = 0; i < iterations; i++) {
    const page_index_t &pi = store.page(pick(rng));
    const auto *page =
        static_cast<const uint8_t *>(store.lookup(pi.file_id, pi.source_offset));
    if (page != nullptr) {
      sum = sum + page[0];
    }
  }
  clk.tock();

  std::cout << "Random lookups: " << ns_to_ms(clk.ns()) << " ms ("
            << clk.ns() / iterations << " ns/lookup)\n";

  FaultServer server(&store);
  if (server.init() != 0 or server.start() != 0) {
    DBGW << "userfaultfd unavailable, skipping the fault benchmark\n";
    store.print_stats(std::cout);
    return EXIT_SUCCESS;
  }

  size_t len = 0;
  auto *region = static_cast<uint8_t *>(map_first_file(store, server, len));
  if (region == nullptr) {
    DBGW << "Unable to create a fault server mapping\n";
    store.print_stats(std::cout);
    return EXIT_SUCCESS;
  }

  const size_t pages = len / PAGE_SIZE;
  std::uniform_int_distribution<size_t> pick_page(0, pages - 1);

  clk.reset();
  clk.tick();
  for (size_t i = 0; i < iterations; i++) {
    sum = sum + region[pick_page(rng) * PAGE_SIZE];
  }
  clk.tock();

  std::cout << "Random access (" << store.file_path(0) << ", " << pages
            << " pages): " << ns_to_ms(clk.ns()) << " ms, "
            << (double)clk.ns() / 1000.0 / iterations << " us/access\n";

  clk.reset();
  clk.tick();
  for (size_t off = 0; off < len; off += PAGE_SIZE) {
    sum = sum + region[off];
  }
  clk.tock();

  std::cout << "Sequential access: " << ns_to_ms(clk.ns()) << " ms, "
            << (double)clk.ns() / 1000.0 / pages << " us/page\n";

  if (server.destroy_mapping(region, len) != 0) {
    DBGW << "Unable to unmap the benchmark region\n";
  }
  server.stop();

  server.print_stats(std::cout);
  store.print_stats(std::cout);

  return EXIT_SUCCESS;
}

static int cmd_simulate(const args_t &args) {
  nvsl::Clock clk;
  CacheStore store;

  std::vector<layout_entry_t> entries;
  if (parse_layout(args[1], entries) < 0) {
    return EXIT_FAILURE;
  }

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "=== Cold Start Simulation ===\n";
  std::cout << "BigCache: " << args[0] << "\n";
  std::cout << "Layout: " << args[1] << " (" << entries.size()
            << " rows)\n\n";

  /* Sequential read of the whole container */
  clk.tick();
  if (not load_store(store, args[0])) {
    return EXIT_FAILURE;
  }
  const int rc = store.preheat();
  clk.tock();
  const auto seq_ns = clk.ns();

  if (rc != 0) {
    DBGW << "Preheat failed: " << strerror(-rc) << "\n";
  }

  std::cout << "--- Sequential load ---\n";
  std::cout << "Load + preheat: " << ns_to_ms(seq_ns) << " ms\n\n";

  /* Replay of the traced accesses against the index */
  uint64_t hits = 0, misses = 0;
  volatile uint8_t sum = 0;

  clk.reset();
  clk.tick();
  for (const auto &entry : entries) {
    const auto *page = static_cast<const uint8_t *>(
        store.lookup(entry.source_file, entry.source_offset));
    if (page != nullptr) {
      sum = sum + page[0];
      hits++;
    } else {
      misses++;
    }
  }
  clk.tock();
  const auto replay_ns = clk.ns();

  std::cout << "--- Replayed lookups ---\n";
  std::cout << "Lookup time: " << ns_to_ms(replay_ns) << " ms\n";
  std::cout << "Hits: " << hits << ", Misses: " << misses << "\n";
  if (hits + misses != 0) {
    std::cout << "Hit rate: " << (double)hits * 100 / (double)(hits + misses)
              << "%\n";
  }
  std::cout << "\n";

  /* Fault driven access to the first file in layout order */
  std::cout << "--- Fault driven access ---\n";

  FaultServer server(&store);
  if (store.header().file_count == 0) {
    std::cout << "Cache is empty, skipped\n\n";
  } else if (server.init() != 0 or server.start() != 0) {
    std::cout << "userfaultfd unavailable, skipped\n\n";
  } else {
    size_t len = 0;
    auto *region = static_cast<uint8_t *>(map_first_file(store, server, len));

    if (region == nullptr) {
      std::cout << "Unable to create a fault server mapping, skipped\n\n";
    } else {
      const std::string first = store.file_path(0);
      uint64_t touched = 0;

      clk.reset();
      clk.tick();
      for (const auto &entry : entries) {
        if (entry.source_file == first and entry.source_offset < len) {
          sum = sum + region[page_align_down(entry.source_offset)];
          touched++;
        }
      }
      clk.tock();

      std::cout << "Pages touched in " << first << ": " << touched << "\n";
      std::cout << "Demand paging time: " << ns_to_ms(clk.ns()) << " ms\n";

      if (server.destroy_mapping(region, len) != 0) {
        DBGW << "Unable to unmap the simulation region\n";
      }
      server.stop();
      server.print_stats(std::cout);
      std::cout << "\n";
    }
  }

  std::cout << "=== Summary ===\n";
  std::cout << "Sequential container read: " << ns_to_ms(seq_ns) << " ms\n";
  std::cout << "Replayed lookups: " << ns_to_ms(replay_ns) << " ms\n";

  return EXIT_SUCCESS;
}

static int cmd_warm(const args_t &args) {
  std::vector<layout_entry_t> entries;
  if (parse_layout(args[0], entries) < 0) {
    return EXIT_FAILURE;
  }

  const auto report = warm_files(entries);

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "=== File Warm ===\n";
  std::cout << "Files opened: " << report.files_opened << " ("
            << report.files_failed << " failed)\n";
  std::cout << "Pages warmed: " << report.pages_ok << " ("
            << report.pages_failed << " failed)\n";
  std::cout << "Time: " << ns_to_ms(report.elapsed_ns) << " ms\n";

  return report.files_opened == 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}

static void usage(const char *prog,
                  const std::map<std::string, command_t> &cmds) {
  std::cerr << "BigCache - userspace demand paging for cold start\n\n";
  std::cerr << "Usage: " << prog << " <command> [args]\n\n";
  std::cerr << "Commands:\n";
  for (const auto &[name, cmd] : cmds) {
    std::cerr << "  " << std::left << std::setw(40) << (name + " " + cmd.usage)
              << cmd.help << "\n";
  }
  std::cerr << "  " << std::left << std::setw(40) << "help"
            << "Show this help\n";
  std::cerr << "\nEnvironment (bcpreload.so):\n";
  std::cerr << "  BIGCACHE_PATH      Cache file\n";
  std::cerr << "  BIGCACHE_ENABLED   0 to disable interception\n";
  std::cerr << "  BIGCACHE_VERBOSE   Log level 0-5\n";
  std::cerr << "  BIGCACHE_ZERO_FILL 0 to leave missing pages unresolved\n";
  std::cerr << "  BIGCACHE_PREFETCH  Pages installed after each hit\n";
}

int main(int argc, char *argv[]) {
  const std::map<std::string, command_t> cmds = {
      {"pack",
       {cmd_pack, 2, "<layout.csv> <output.bin>", "Pack pages into a cache"}},
      {"verify", {cmd_verify, 1, "<cache.bin>", "Check cache integrity"}},
      {"info", {cmd_info, 1, "<cache.bin>", "Print header and file table"}},
      {"benchmark",
       {cmd_benchmark, 1, "<cache.bin> [iterations]", "Time cache accesses"}},
      {"simulate",
       {cmd_simulate, 2, "<cache.bin> <layout.csv>", "Simulate a cold start"}},
      {"warm",
       {cmd_warm, 1, "<layout.csv>", "Warm the page cache from the layout"}},
  };

  if (argc < 2) {
    usage(argv[0], cmds);
    return EXIT_FAILURE;
  }

  const auto name = nvsl::S(argv[1]);
  if (name == "help" or name == "--help" or name == "-h") {
    usage(argv[0], cmds);
    return EXIT_SUCCESS;
  }

  const auto it = cmds.find(name);
  if (it == cmds.end()) {
    DBGE << "Unknown command `" << name << "'\n";
    usage(argv[0], cmds);
    return EXIT_FAILURE;
  }

  const args_t args(argv + 2, argv + argc);
  if (args.size() < it->second.min_args) {
    DBGE << "Usage: " << argv[0] << " " << name << " " << it->second.usage
         << "\n";
    return EXIT_FAILURE;
  }

  return it->second.fn(args);
}

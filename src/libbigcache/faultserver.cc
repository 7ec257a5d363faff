// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   faultserver.cc
 * @date   octobre  9, 2026
 * @brief  userfaultfd demand pager
 */

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <sys/syscall.h>
#include <unistd.h>

#include "bigcache/faultserver.hh"
#include "nvsl/common.hh"
#include "nvsl/error.hh"
#include "nvsl/trace.hh"

using namespace bigcache;

/** @brief Messages drained per read() of the userfaultfd */
static constexpr size_t UFFD_MSG_BATCH = 16;

static int userfaultfd(int flags) {
  return syscall(SYS_userfaultfd, flags);
}

FaultServer::~FaultServer() {
  stop();

  {
    std::lock_guard<std::mutex> guard(regions_mtx);
    regions.clear();
  }

  /* Closing the userfaultfd drops every remaining registration */
  if (uffd != -1) {
    close(uffd);
  }

  for (const int fd : wake_fds) {
    if (fd != -1) {
      close(fd);
    }
  }

  if (zero_page != nullptr) {
    unmap_fn(zero_page, PAGE_SIZE);
  }
}

int FaultServer::init() {
  if (uffd != -1) {
    return 0;
  }

  /* Only user mode faults are needed, which unprivileged processes may ask
     for on kernels that restrict userfaultfd */
  uffd = userfaultfd(O_CLOEXEC | O_NONBLOCK | UFFD_USER_MODE_ONLY);
  if (uffd == -1 and errno == EINVAL) {
    uffd = userfaultfd(O_CLOEXEC | O_NONBLOCK);
  }

  if (uffd == -1) {
    const int err = errno;
    DBGE << "userfaultfd failed: " << PSTR() << "\n";
    return -err;
  }

  struct uffdio_api uapi = {};
  uapi.api = UFFD_API;
  if (ioctl(uffd, UFFDIO_API, &uapi) == -1) {
    const int err = errno;
    DBGE << "ioctl(UFFDIO_API) failed: " << PSTR() << "\n";
    close(uffd);
    uffd = -1;
    return -err;
  }

  if (uapi.api != UFFD_API) {
    DBGE << "Unexpected userfaultfd API version " << uapi.api << "\n";
    close(uffd);
    uffd = -1;
    return -EPROTO;
  }

  if (pipe2(wake_fds, O_CLOEXEC | O_NONBLOCK) == -1) {
    const int err = errno;
    DBGE << "pipe2 failed: " << PSTR() << "\n";
    close(uffd);
    uffd = -1;
    return -err;
  }

  zero_page = map_fn(nullptr, PAGE_SIZE, PROT_READ,
                   MAP_PRIVATE | MAP_ANONYMOUS | MAP_POPULATE, -1, 0);
  if (zero_page == MAP_FAILED) {
    const int err = errno;
    DBGE << "Unable to allocate the zero page: " << PSTR() << "\n";
    zero_page = nullptr;
    close(uffd);
    close(wake_fds[0]);
    close(wake_fds[1]);
    uffd = wake_fds[0] = wake_fds[1] = -1;
    return -err;
  }

  state = state_t::CREATED;
  DBGH(1) << "Fault server created, uffd = " << uffd << "\n";

  return 0;
}

int FaultServer::set_config(const fault_config_t &config) {
  std::lock_guard<std::mutex> guard(state_mtx);

  if (state == state_t::RUNNING) {
    return -EBUSY;
  }

  cfg = config;
  if (cfg.copy_retries == 0) {
    cfg.copy_retries = 1;
  }

  state = state_t::CONFIGURED;
  return 0;
}

void *FaultServer::worker_entry(void *arg) {
  auto *self = static_cast<FaultServer *>(arg);
  self->event_loop();
  return nullptr;
}

int FaultServer::start() {
  std::lock_guard<std::mutex> guard(state_mtx);

  if (state == state_t::RUNNING) {
    return 0;
  }

  if (uffd == -1) {
    return -EBADF;
  }

  /* Leftover wake bytes would stop the new worker right away */
  char buf[64];
  while (read(wake_fds[0], buf, sizeof(buf)) > 0) {
  }

  const int rc = pthread_create(&worker, nullptr, &worker_entry, this);
  if (rc != 0) {
    DBGE << "Unable to start the fault worker: " << strerror(rc) << "\n";
    return -rc;
  }

  state = state_t::RUNNING;
  DBGH(1) << "Fault server started\n";

  return 0;
}

int FaultServer::stop() {
  std::lock_guard<std::mutex> guard(state_mtx);

  if (state != state_t::RUNNING) {
    return 0;
  }

  const char byte = 1;
  ssize_t rc;
  do {
    rc = write(wake_fds[1], &byte, 1);
  } while (rc == -1 and errno == EINTR);

  if (rc != 1) {
    DBGE << "Unable to wake the fault worker: " << PSTR() << "\n";
    return -EIO;
  }

  pthread_join(worker, nullptr);
  state = state_t::STOPPED;

  DBGH(1) << "Fault server stopped\n";
  return 0;
}

void FaultServer::event_loop() {
  uffd_msg msgs[UFFD_MSG_BATCH];

  while (true) {
    struct pollfd pfds[2] = {
        {.fd = uffd, .events = POLLIN, .revents = 0},
        {.fd = wake_fds[0], .events = POLLIN, .revents = 0},
    };

    const int rc = poll(pfds, 2, POLL_TIMEOUT_MS);
    if (rc == -1) {
      if (errno == EINTR) {
        continue;
      }

      DBGE << "poll on the userfaultfd failed: " << PSTR() << "\n";
      break;
    }

    if (rc == 0) {
      continue;
    }

    if (pfds[1].revents & POLLIN) {
      char byte;
      while (read(wake_fds[0], &byte, 1) > 0) {
      }
      break;
    }

    if (pfds[0].revents & (POLLERR | POLLHUP)) {
      DBGE << "userfaultfd reported an error, worker exiting\n";
      break;
    }

    if (not(pfds[0].revents & POLLIN)) {
      continue;
    }

    const ssize_t bytes = read(uffd, msgs, sizeof(msgs));
    if (bytes == -1) {
      if (errno != EAGAIN and errno != EINTR) {
        DBGE << "read from userfaultfd failed: " << PSTR() << "\n";
      }
      continue;
    }

    const size_t count = bytes / sizeof(uffd_msg);
    for (size_t i = 0; i < count; i++) {
      handle_event(msgs[i]);
    }
  }
}

void FaultServer::handle_event(const uffd_msg &msg) {
  switch (msg.event) {
  case UFFD_EVENT_PAGEFAULT: {
    const uint64_t addr = msg.arg.pagefault.address;
    const int rc = handle_fault(addr);
    if (rc == -ENODATA) {
      DBGW << "Fault at 0x" << std::hex << addr << std::dec
           << " missed the cache and zero fill is off, leaving it blocked\n";
    } else if (rc != 0) {
      DBGE << "Unable to resolve fault at 0x" << std::hex << addr
           << std::dec << ": " << strerror(-rc) << "\n";
    }
    break;
  }
  case UFFD_EVENT_FORK:
    DBGH(1) << "uffd event: fork, child uffd " << msg.arg.fork.ufd << "\n";
    break;
  case UFFD_EVENT_REMAP:
    DBGH(1) << "uffd event: remap 0x" << std::hex << msg.arg.remap.from
            << " -> 0x" << msg.arg.remap.to << std::dec << "\n";
    break;
  case UFFD_EVENT_REMOVE:
    DBGH(1) << "uffd event: remove 0x" << std::hex << msg.arg.remove.start
            << "-0x" << msg.arg.remove.end << std::dec << "\n";
    break;
  case UFFD_EVENT_UNMAP:
    DBGH(1) << "uffd event: unmap 0x" << std::hex << msg.arg.remove.start
            << "-0x" << msg.arg.remove.end << std::dec << "\n";
    break;
  default:
    DBGW << "Unknown uffd event " << (int)msg.event << "\n";
    break;
  }
}

int FaultServer::copy_page(uint64_t dst, const void *src) {
  int err = EAGAIN;

  for (uint32_t attempt = 0; attempt < cfg.copy_retries; attempt++) {
    struct uffdio_copy copy = {};
    copy.dst = dst;
    copy.src = (uint64_t)src;
    copy.len = PAGE_SIZE;
    copy.mode = 0;

    if (ioctl(uffd, UFFDIO_COPY, &copy) == 0) {
      return 0;
    }

    err = errno;
    if (err == EEXIST) {
      /* Raced with another resolve of the same page, waiters still need a
         wake up */
      struct uffdio_range range = {.start = dst, .len = PAGE_SIZE};
      if (ioctl(uffd, UFFDIO_WAKE, &range) == -1) {
        DBGW << "UFFDIO_WAKE at 0x" << std::hex << dst << std::dec
             << " failed: " << PSTR() << "\n";
      }
      return 0;
    }

    if (err != EAGAIN) {
      break;
    }
  }

  return -err;
}

int FaultServer::zero_fill_page(uint64_t dst) {
  struct uffdio_zeropage zp = {};
  zp.range.start = dst;
  zp.range.len = PAGE_SIZE;
  zp.mode = 0;

  if (ioctl(uffd, UFFDIO_ZEROPAGE, &zp) == -1 and errno != EEXIST) {
    return -errno;
  }

  return 0;
}

void FaultServer::prefetch(const memory_region_t &region,
                           uint64_t fault_page) {
  const uint64_t region_start = (uint64_t)region.base;
  uint64_t installed = 0;

  for (uint32_t i = 1; i <= cfg.prefetch_ahead; i++) {
    const uint64_t page = fault_page + (uint64_t)i * PAGE_SIZE;
    if (not region.contains(page)) {
      break;
    }

    const uint64_t src_off = region.file_offset + (page - region_start);
    const void *src = store->lookup(*region.file_id, src_off);
    if (src == nullptr) {
      continue;
    }

    if (copy_page(page, src) == 0) {
      installed++;
    }
  }

  if (installed != 0 and cfg.collect_stats) {
    std::lock_guard<std::mutex> guard(stats_mtx);
    stats.prefetched += installed;
  }
}

void FaultServer::record_fault(bool hit, bool zero_fill, bool copy_error,
                               uint64_t ns) {
  if (not cfg.collect_stats) {
    return;
  }

  std::lock_guard<std::mutex> guard(stats_mtx);

  stats.total_faults++;
  if (hit) {
    stats.cache_hits++;
  } else if (zero_fill) {
    stats.zero_fills++;
  } else {
    stats.cache_misses++;
  }

  if (copy_error) {
    stats.copy_errors++;
  }

  stats.total_ns += ns;
  stats.max_ns = std::max(stats.max_ns, ns);
}

int FaultServer::handle_fault(uint64_t addr) {
  using namespace std::chrono;

  const auto start_clk = steady_clock::now();
  const uint64_t page = page_align_down(addr);
  const auto elapsed_ns = [&start_clk]() {
    return (uint64_t)duration_cast<nanoseconds>(steady_clock::now() -
                                                 start_clk)
        .count();
  };

  std::optional<memory_region_t> region;
  {
    std::lock_guard<std::mutex> guard(regions_mtx);
    for (const auto &reg : regions) {
      if (reg.contains(page)) {
        region = reg;
        break;
      }
    }
  }

  if (not region) {
    DBGW << "Fault at 0x" << std::hex << addr << std::dec
         << " outside every registered region\n";
    record_fault(false, false, false, elapsed_ns());
    return -ENOENT;
  }

  const uint64_t src_off =
      region->file_offset + (page - (uint64_t)region->base);
  const void *src = nullptr;
  if (region->file_id) {
    src = store->lookup(*region->file_id, src_off);
  }

  if (src != nullptr) {
    int rc = copy_page(page, src);

    if (rc != 0) {
      /* Never leave the faulting thread suspended */
      DBGE << "UFFDIO_COPY at 0x" << std::hex << page << std::dec
           << " failed: " << strerror(-rc) << ", zero filling\n";
      const int zrc = zero_fill_page(page);
      if (zrc != 0) {
        DBGE << "UFFDIO_ZEROPAGE at 0x" << std::hex << page << std::dec
             << " failed: " << strerror(-zrc) << "\n";
      }
      record_fault(true, false, true, elapsed_ns());
      return rc;
    }

    if (cfg.log_level >= 3) {
      DBGH(3) << "hit " << region->source_path << "@" << src_off << " -> 0x"
              << std::hex << page << std::dec << "\n";
    }

    if (cfg.prefetch_ahead != 0) {
      prefetch(*region, page);
    }

    record_fault(true, false, false, elapsed_ns());
    return 0;
  }

  if (not cfg.zero_fill_on_miss) {
    if (cfg.log_level >= 2) {
      DBGH(2) << "miss " << region->source_path << "@" << src_off << "\n";
    }
    record_fault(false, false, false, elapsed_ns());
    return -ENODATA;
  }

  int rc = copy_page(page, zero_page);
  if (rc != 0) {
    DBGE << "Zero fill at 0x" << std::hex << page << std::dec
         << " failed: " << strerror(-rc) << "\n";
    record_fault(false, true, true, elapsed_ns());
    return rc;
  }

  if (cfg.log_level >= 2) {
    DBGH(2) << "zero fill " << region->source_path << "@" << src_off << "\n";
  }

  record_fault(false, true, false, elapsed_ns());
  return 0;
}

int FaultServer::register_region(void *addr, size_t size,
                                 const std::string &path, uint64_t file_off) {
  if (uffd == -1) {
    return -EBADF;
  }

  if (not is_page_aligned((uint64_t)addr) or size == 0) {
    return -EINVAL;
  }

  size = page_align_up(size);

  struct uffdio_register reg = {};
  reg.range.start = (uint64_t)addr;
  reg.range.len = size;
  reg.mode = UFFDIO_REGISTER_MODE_MISSING;

  if (ioctl(uffd, UFFDIO_REGISTER, &reg) == -1) {
    const int err = errno;
    DBGW << "UFFDIO_REGISTER " << addr << "+" << size
         << " failed: " << PSTR() << "\n";
    return -err;
  }

  memory_region_t region = {
      .base = addr,
      .size = size,
      .source_path = path,
      .file_offset = file_off,
      .prot = PROT_READ,
      .file_id = store->file_id(path),
  };

  std::lock_guard<std::mutex> guard(regions_mtx);
  regions.push_back(std::move(region));

  DBGH(2) << "Registered " << addr << "+" << size << " for " << path << "@"
          << file_off << "\n";

  return 0;
}

int FaultServer::unregister_region(void *addr) {
  std::lock_guard<std::mutex> guard(regions_mtx);

  const auto it =
      std::find_if(regions.begin(), regions.end(),
                   [addr](const memory_region_t &r) { return r.base == addr; });
  if (it == regions.end()) {
    return -ENOENT;
  }

  struct uffdio_range range = {.start = (uint64_t)it->base, .len = it->size};
  if (ioctl(uffd, UFFDIO_UNREGISTER, &range) == -1) {
    DBGW << "UFFDIO_UNREGISTER " << it->base << " failed: " << PSTR()
         << "\n";
  }

  regions.erase(it);
  return 0;
}

void *FaultServer::create_mapping(size_t size, const std::string &path,
                                  uint64_t file_off, int prot) {
  if (size == 0) {
    return nullptr;
  }

  size = page_align_up(size);

  void *addr = map_fn(nullptr, size, PROT_READ | PROT_WRITE,
                    MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
  if (addr == MAP_FAILED) {
    DBGW << "Anonymous mapping of " << size << " bytes failed: " << PSTR()
         << "\n";
    return nullptr;
  }

  if (register_region(addr, size, path, file_off) != 0) {
    unmap_fn(addr, size);
    return nullptr;
  }

  if (prot != (PROT_READ | PROT_WRITE) and mprotect(addr, size, prot) == -1) {
    DBGW << "mprotect(" << addr << ", " << prot << ") failed: " << PSTR()
         << "\n";
    unregister_region(addr);
    unmap_fn(addr, size);
    return nullptr;
  }

  std::lock_guard<std::mutex> guard(regions_mtx);
  for (auto &reg : regions) {
    if (reg.base == addr) {
      reg.prot = prot;
    }
  }

  return addr;
}

int FaultServer::destroy_mapping(void *addr, size_t size) {
  std::unique_lock<std::mutex> guard(regions_mtx);

  const auto it =
      std::find_if(regions.begin(), regions.end(),
                   [addr](const memory_region_t &r) { return r.base == addr; });
  if (it == regions.end()) {
    return -ENOENT;
  }

  const size_t len = page_align_up(size);
  if (len < it->size) {
    /* The kernel keeps the registration on the remaining tail */
    if (unmap_fn(addr, len) == -1) {
      return -errno;
    }

    it->base = nvsl::RCast<uint8_t *>(addr) + len;
    it->size -= len;
    it->file_offset += len;
    return 0;
  }

  const size_t region_sz = it->size;
  guard.unlock();

  unregister_region(addr);
  if (unmap_fn(addr, std::max(len, region_sz)) == -1) {
    return -errno;
  }

  return 0;
}

fault_stats_t FaultServer::get_stats() const {
  std::lock_guard<std::mutex> guard(stats_mtx);
  return stats;
}

void FaultServer::reset_stats() {
  std::lock_guard<std::mutex> guard(stats_mtx);
  stats = {};
}

size_t FaultServer::region_count() const {
  std::lock_guard<std::mutex> guard(regions_mtx);
  return regions.size();
}

void FaultServer::print_stats(std::ostream &os) const {
  const auto s = get_stats();

  os << "=== Fault Server Statistics ===\n";
  os << "Total faults: " << s.total_faults << "\n";
  os << "Cache hits: " << s.cache_hits << "\n";
  os << "Cache misses: " << s.cache_misses << "\n";
  os << "Zero fills: " << s.zero_fills << "\n";
  os << "Copy errors: " << s.copy_errors << "\n";
  os << "Prefetched: " << s.prefetched << "\n";

  if (s.total_faults != 0) {
    os << "Hit rate: " << std::fixed << std::setprecision(2)
       << (double)s.cache_hits * 100 / (double)s.total_faults << "%\n";
    os << "Avg fault time: " << s.total_ns / s.total_faults << " ns\n";
    os << "Max fault time: " << s.max_ns << " ns\n";
  }
}

void FaultServer::dump_regions(std::ostream &os) const {
  std::lock_guard<std::mutex> guard(regions_mtx);

  os << "=== Registered regions (" << regions.size() << ") ===\n";
  for (const auto &reg : regions) {
    os << reg.base << "+" << reg.size << " prot=" << reg.prot << " "
       << reg.source_path << "@" << reg.file_offset
       << (reg.file_id ? "" : " (not cached)") << "\n";
  }
}

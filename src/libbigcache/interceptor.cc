// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   interceptor.cc
 * @date   octobre 10, 2026
 * @brief  Eligibility filter and redirection of file mappings
 */

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>

#include <sys/mman.h>

#include "bigcache/interceptor.hh"
#include "nvsl/error.hh"
#include "nvsl/trace.hh"
#include "nvsl/utils.hh"

using namespace bigcache;

static constexpr std::array<const char *, 8> CACHEABLE_SUFFIXES = {
    ".so", ".dex", ".odex", ".oat", ".vdex", ".art", ".apk", ".jar",
};

bool MmapInterceptor::is_cacheable_path(const std::string &path) {
  for (const char *suffix : CACHEABLE_SUFFIXES) {
    if (path.ends_with(suffix)) {
      return true;
    }
  }

  /* Versioned shared objects, libfoo.so.1.2 */
  const auto pos = path.rfind(".so.");
  if (pos == std::string::npos) {
    return false;
  }

  const auto version = path.substr(pos + 4);
  return not version.empty() and
         std::all_of(version.begin(), version.end(),
                     [](char c) { return std::isdigit(c) or c == '.'; });
}

void *MmapInterceptor::bypass(void *addr, size_t len, int prot, int flags,
                              int fd, off_t off) {
  bypassed.fetch_add(1, std::memory_order_relaxed);
  return real_mmap(addr, len, prot, flags, fd, off);
}

void *MmapInterceptor::mmap(void *addr, size_t len, int prot, int flags,
                            int fd, off_t off) {
  /* Cheap checks first, these also keep allocator mmaps away from anything
     that allocates */
  if (store == nullptr or server == nullptr or not server->is_running() or
      not store->is_loaded()) {
    return bypass(addr, len, prot, flags, fd, off);
  }

  if (fd < 0 or (flags & MAP_ANONYMOUS) or not(flags & MAP_PRIVATE) or
      (flags & (MAP_FIXED | MAP_FIXED_NOREPLACE)) or len == 0 or off < 0 or
      not is_page_aligned((uint64_t)off)) {
    return bypass(addr, len, prot, flags, fd, off);
  }

  const std::string path = nvsl::fd_to_fname(fd);
  if (path.empty() or not is_cacheable_path(path)) {
    if (verbose >= 2) {
      DBGH(2) << "bypass " << (path.empty() ? "(unknown)" : path) << "\n";
    }
    return bypass(addr, len, prot, flags, fd, off);
  }

  if (not store->lookup_offset(path, off)) {
    if (verbose >= 2) {
      DBGH(2) << "miss " << path << "@" << off << "\n";
    }
    return bypass(addr, len, prot, flags, fd, off);
  }

  void *result = server->create_mapping(len, path, off, prot);
  if (result == nullptr) {
    if (verbose >= 1) {
      DBGW << "Redirect failed for " << path << ", using the file mapping\n";
    }
    return bypass(addr, len, prot, flags, fd, off);
  }

  if (verbose >= 1) {
    DBGH(1) << "redirect "
            << nvsl::mmap_to_str(addr, len, prot, flags, fd, off) << " ("
            << path << ") -> " << result << "\n";
  }

  intercepted.fetch_add(1, std::memory_order_relaxed);
  bytes_redirected.fetch_add(len, std::memory_order_relaxed);

  return result;
}

int MmapInterceptor::munmap(void *addr, size_t len) {
  if (server != nullptr) {
    const int rc = server->destroy_mapping(addr, len);
    if (rc == 0) {
      return 0;
    }

    if (rc != -ENOENT) {
      errno = -rc;
      return -1;
    }
  }

  return real_munmap(addr, len);
}

void MmapInterceptor::print_stats(std::ostream &os) const {
  os << "Intercepted: " << intercepted_count() << " mappings, "
     << redirected_bytes() << " bytes\n";
  os << "Bypassed: " << bypassed_count() << " mappings\n";
}

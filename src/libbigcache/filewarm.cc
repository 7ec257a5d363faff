// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   filewarm.cc
 * @date   octobre  8, 2026
 * @brief  Page cache warmer for the original files
 */

#include <chrono>
#include <string>
#include <unordered_map>

#include <fcntl.h>
#include <unistd.h>

#include "bigcache/constants.hh"
#include "bigcache/filewarm.hh"
#include "nvsl/error.hh"
#include "nvsl/stats.hh"
#include "nvsl/trace.hh"

using namespace bigcache;

warm_report_t bigcache::warm_files(const std::vector<layout_entry_t> &entries) {
  std::unordered_map<std::string, int> fds;
  nvsl::Counter pages_ok, pages_failed, files_opened, files_failed;

  pages_ok.init("warm_pages_ok", "Pages brought into the page cache");
  pages_failed.init("warm_pages_failed", "Pages that could not be read");
  files_opened.init("warm_files_opened", "Files opened for warming");
  files_failed.init("warm_files_failed", "Files that could not be opened");

  const auto start = std::chrono::steady_clock::now();

  for (const auto &entry : entries) {
    auto it = fds.find(entry.source_file);
    if (it == fds.end()) {
      const int fd = open(entry.source_file.c_str(), O_RDONLY | O_CLOEXEC);
      if (fd == -1) {
        DBGH(1) << "Unable to open " << entry.source_file << ": " << PSTR()
                << "\n";
        ++files_failed;
      } else {
        ++files_opened;
      }
      it = fds.emplace(entry.source_file, fd).first;
    }

    const int fd = it->second;
    const uint64_t first = page_align_down(entry.source_offset);
    const uint64_t len = entry.size == 0 ? PAGE_SIZE
                                         : page_align_up(entry.source_offset +
                                                         entry.size) -
                                               first;

    if (fd == -1) {
      for (uint64_t off = 0; off < len; off += PAGE_SIZE) {
        ++pages_failed;
      }
      continue;
    }

    const int rc = posix_fadvise(fd, first, len, POSIX_FADV_WILLNEED);
    if (rc != 0) {
      DBGH(2) << "posix_fadvise(" << entry.source_file << ") failed: " << rc
              << "\n";
    }

    for (uint64_t off = first; off < first + len; off += PAGE_SIZE) {
      char byte;
      if (pread(fd, &byte, 1, off) == 1) {
        ++pages_ok;
      } else {
        ++pages_failed;
      }
    }
  }

  for (const auto &[path, fd] : fds) {
    if (fd != -1) {
      close(fd);
    }
  }

  const auto end = std::chrono::steady_clock::now();

  return {
      .pages_ok = pages_ok.value(),
      .pages_failed = pages_failed.value(),
      .files_opened = files_opened.value(),
      .files_failed = files_failed.value(),
      .elapsed_ns = (uint64_t)std::chrono::duration_cast<
                        std::chrono::nanoseconds>(end - start)
                        .count(),
  };
}

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   packer.cc
 * @date   octobre  7, 2026
 * @brief  BigCache file builder
 */

#include <cstdint>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

#include "bigcache/packer.hh"
#include "nvsl/common.hh"
#include "nvsl/error.hh"
#include "nvsl/trace.hh"

namespace bip = boost::interprocess;

using namespace bigcache;

/** @brief Files whose pages hold code */
static bool is_code_file(const std::string &path) {
  return path.find(".so") != std::string::npos or path.ends_with(".odex") or
         path.ends_with(".oat");
}

Packer::Packer() {
  read_ok.init("pack_read_ok", "Source pages copied into the cache");
  read_failed.init("pack_read_failed",
                   "Source pages zero-filled after a failed read");
}

uint32_t Packer::get_file_id(const std::string &path) {
  const auto it = file_ids.find(path);
  if (it != file_ids.end()) {
    return it->second;
  }

  const uint32_t id = files.size();
  files.push_back(path);
  file_ids.emplace(path, id);

  return id;
}

bool Packer::add_page(const std::string &path, uint64_t offset,
                      uint32_t access_order) {
  if (path.size() >= MAX_PATH_LEN) {
    DBGW << "Path too long, skipping " << path << "\n";
    return false;
  }

  const uint64_t aligned = page_align_down(offset);
  const uint32_t id = get_file_id(path);

  if (not seen.emplace(id, aligned).second) {
    return false;
  }

  pages.push_back({id, aligned, access_order});
  return true;
}

size_t Packer::add_entry(const layout_entry_t &entry) {
  const uint64_t first = page_align_down(entry.source_offset);
  uint64_t last = first;

  if (entry.size != 0) {
    if (entry.size - 1 > UINT64_MAX - entry.source_offset) {
      DBGW << "Entry " << entry.source_file << "@" << entry.source_offset
           << "+" << entry.size << " overflows, skipping\n";
      return 0;
    }
    last = page_align_down(entry.source_offset + entry.size - 1);
  }

  size_t added = 0;
  for (uint64_t off = first;; off += PAGE_SIZE) {
    if (add_page(entry.source_file, off, entry.access_order)) {
      added++;
    }

    /* Stop before off + PAGE_SIZE can wrap */
    if (off == last) {
      break;
    }
  }

  return added;
}

int Packer::load_layout(const std::string &path) {
  std::vector<layout_entry_t> entries;

  const int rc = parse_layout(path, entries);
  if (rc < 0) {
    return rc;
  }

  size_t added = 0;
  for (const auto &entry : entries) {
    added += add_entry(entry);
  }

  DBGH(1) << "Layout " << path << ": " << entries.size() << " rows, "
          << added << " unique pages\n";

  return rc;
}

int Packer::fill_page(int src_fd, const pending_page_t &pg, uint8_t *dst) {
  if (src_fd < 0) {
    return -1;
  }

  size_t done = 0;
  while (done < PAGE_SIZE) {
    const ssize_t rc =
        pread(src_fd, dst + done, PAGE_SIZE - done, pg.offset + done);
    if (rc == -1 and errno == EINTR) {
      continue;
    }

    if (rc == -1) {
      DBGW << "pread " << files[pg.file_id] << "@" << pg.offset
           << " failed: " << PSTR() << "\n";
      break;
    }

    if (rc == 0) {
      DBGH(2) << "Short read " << files[pg.file_id] << "@" << pg.offset
              << ": " << done << " bytes\n";
      break;
    }

    done += rc;
  }

  /* Only whole pages are cached */
  if (done != PAGE_SIZE) {
    std::memset(dst, 0, PAGE_SIZE);
    return -1;
  }

  return 0;
}

int Packer::build(const std::string &output) {
  if (pages.empty()) {
    DBGE << "Nothing to pack\n";
    return -EINVAL;
  }

  const uint64_t index_off = sizeof(header_t);
  const uint64_t ftable_off = index_off + pages.size() * sizeof(page_index_t);
  const uint64_t data_off =
      page_align_up(ftable_off + files.size() * sizeof(file_entry_t));
  const uint64_t total_size = data_off + pages.size() * PAGE_SIZE;

  DBGH(1) << "Building " << output << ": " << pages.size() << " pages from "
          << files.size() << " files, " << total_size << " bytes\n";

  const int out_fd = open(output.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (out_fd == -1) {
    const int err = errno;
    DBGE << "Unable to create " << output << ": " << PSTR() << "\n";
    return -err;
  }

  if (ftruncate(out_fd, total_size) == -1) {
    const int err = errno;
    DBGE << "ftruncate(" << output << ", " << total_size
         << ") failed: " << PSTR() << "\n";
    close(out_fd);
    return -err;
  }
  close(out_fd);

  std::unique_ptr<bip::mapped_region> region;
  try {
    bip::file_mapping fmap(output.c_str(), bip::read_write);
    region = std::make_unique<bip::mapped_region>(fmap, bip::read_write);
  } catch (const bip::interprocess_exception &e) {
    DBGE << "Unable to map " << output << ": " << e.what() << "\n";
    return -EIO;
  }

  auto *img = static_cast<uint8_t *>(region->get_address());
  auto *hdr = nvsl::RCast<header_t *>(img);
  auto *index = nvsl::RCast<page_index_t *>(img + index_off);
  auto *ftable = nvsl::RCast<file_entry_t *>(img + ftable_off);
  uint8_t *data = img + data_off;

  hdr->magic = BIGCACHE_MAGIC;
  hdr->version = BIGCACHE_VERSION;
  hdr->page_count = pages.size();
  hdr->file_count = files.size();
  hdr->data_offset = data_off;
  hdr->index_offset = index_off;
  hdr->file_table_offset = ftable_off;
  hdr->total_size = total_size;
  hdr->checksum = 0;
  hdr->flags = 0;

  std::vector<uint32_t> pages_per_file(files.size(), 0);
  for (const auto &pg : pages) {
    pages_per_file[pg.file_id]++;
  }

  for (uint32_t id = 0; id < files.size(); id++) {
    file_entry_t &fe = ftable[id];
    struct stat st;

    fe.file_id = id;
    fe.path_len = files[id].size();
    fe.page_count = pages_per_file[id];
    fe.original_size = 0;
    std::memcpy(fe.path, files[id].c_str(), files[id].size());

    if (stat(files[id].c_str(), &st) == 0) {
      fe.original_size = st.st_size;
    }
  }

  const uint64_t ok_before = read_ok.value();
  const uint64_t failed_before = read_failed.value();

  /* One descriptor per source file, opened lazily */
  std::vector<int> src_fds(files.size(), -2);

  for (size_t i = 0; i < pages.size(); i++) {
    const pending_page_t &pg = pages[i];
    page_index_t &pi = index[i];

    pi.file_id = pg.file_id;
    pi.source_offset = pg.offset;
    pi.access_order = pg.access_order;
    pi.flags = is_code_file(files[pg.file_id]) ? PAGE_FLAG_EXECUTABLE : 0;
    pi.reserved = 0;

    int &src_fd = src_fds[pg.file_id];
    if (src_fd == -2) {
      src_fd = open(files[pg.file_id].c_str(), O_RDONLY | O_CLOEXEC);
      if (src_fd == -1) {
        DBGW << "Unable to open " << files[pg.file_id] << ": " << PSTR()
             << ", its pages are zero-filled\n";
      }
    }

    if (fill_page(src_fd, pg, data + i * PAGE_SIZE) == 0) {
      ++read_ok;
    } else {
      ++read_failed;
    }
  }

  for (const int fd : src_fds) {
    if (fd >= 0) {
      close(fd);
    }
  }

  hdr->checksum = image_checksum(img, total_size);

  if (not region->flush()) {
    DBGW << "Flushing " << output << " failed: " << PSTR() << "\n";
  }

  last_report = {
      .pages = (uint32_t)pages.size(),
      .files = (uint32_t)files.size(),
      .read_ok = read_ok.value() - ok_before,
      .read_failed = read_failed.value() - failed_before,
      .total_size = total_size,
  };

  if (last_report.read_failed != 0) {
    DBGW << last_report.read_failed << " of " << pages.size()
         << " pages could not be read and were zero-filled\n";
  }

  return 0;
}

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   cachestore.cc
 * @date   octobre  6, 2026
 * @brief  Loader and page index for BigCache files
 */

#include <cstring>
#include <filesystem>
#include <iomanip>

#include <sys/mman.h>

#include "bigcache/cachestore.hh"
#include "nvsl/common.hh"
#include "nvsl/error.hh"
#include "nvsl/trace.hh"

namespace bip = boost::interprocess;
namespace fs = std::filesystem;

using namespace bigcache;

static constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
static constexpr uint64_t FNV_PRIME = 1099511628211ULL;

const char *bigcache::format_error_str(format_error_t err) {
  switch (err) {
  case format_error_t::NONE:
    return "ok";
  case format_error_t::IO:
    return "unable to open or map the file";
  case format_error_t::TRUNCATED:
    return "file is truncated";
  case format_error_t::BAD_MAGIC:
    return "bad magic";
  case format_error_t::BAD_VERSION:
    return "unsupported version";
  case format_error_t::SIZE_MISMATCH:
    return "header size does not match file size";
  case format_error_t::BAD_LAYOUT:
    return "corrupt section layout";
  }

  return "unknown error";
}

size_t CacheStore::page_key_hash_t::operator()(const page_key_t &key) const {
  uint64_t hash = FNV_OFFSET_BASIS;

  for (size_t i = 0; i < sizeof(key.file_id); i++) {
    hash ^= (key.file_id >> (i * 8)) & 0xFF;
    hash *= FNV_PRIME;
  }

  for (size_t i = 0; i < sizeof(key.offset); i++) {
    hash ^= (key.offset >> (i * 8)) & 0xFF;
    hash *= FNV_PRIME;
  }

  return hash;
}

CacheStore::~CacheStore() {
  unload();
}

format_error_t CacheStore::check_header(size_t file_sz) const {
  if (hdr.magic != BIGCACHE_MAGIC) {
    DBGE << "Invalid magic 0x" << std::hex << hdr.magic << std::dec << "\n";
    return format_error_t::BAD_MAGIC;
  }

  if (hdr.version != BIGCACHE_VERSION) {
    DBGE << "Unsupported version " << hdr.version << "\n";
    return format_error_t::BAD_VERSION;
  }

  if (hdr.total_size != file_sz) {
    DBGE << "Size mismatch (header: " << hdr.total_size
         << ", actual: " << file_sz << ")\n";
    return format_error_t::SIZE_MISMATCH;
  }

  if (not is_page_aligned(hdr.data_offset)) {
    DBGE << "Data offset " << hdr.data_offset << " is not page aligned\n";
    return format_error_t::BAD_LAYOUT;
  }

  if (hdr.data_offset > hdr.total_size) {
    DBGE << "Data offset " << hdr.data_offset << " is past the end of the "
         << hdr.total_size << " bytes file\n";
    return format_error_t::TRUNCATED;
  }

  /* Sizes are bounded by the file size, the subtractions cannot wrap */
  const uint64_t index_sz = (uint64_t)hdr.page_count * sizeof(page_index_t);
  const uint64_t ftable_sz = (uint64_t)hdr.file_count * sizeof(file_entry_t);

  if (hdr.index_offset < sizeof(header_t) or
      hdr.index_offset > hdr.data_offset or
      index_sz > hdr.data_offset - hdr.index_offset) {
    DBGE << "Page index at " << hdr.index_offset << " (" << index_sz
         << " bytes) does not fit before the data region\n";
    return format_error_t::BAD_LAYOUT;
  }

  if (hdr.file_table_offset < sizeof(header_t) or
      hdr.file_table_offset > hdr.data_offset or
      ftable_sz > hdr.data_offset - hdr.file_table_offset) {
    DBGE << "File table at " << hdr.file_table_offset << " (" << ftable_sz
         << " bytes) does not fit before the data region\n";
    return format_error_t::BAD_LAYOUT;
  }

  if ((uint64_t)hdr.page_count * PAGE_SIZE !=
      hdr.total_size - hdr.data_offset) {
    DBGE << "Data region does not hold exactly " << hdr.page_count
         << " pages\n";
    return format_error_t::BAD_LAYOUT;
  }

  return format_error_t::NONE;
}

format_error_t CacheStore::build_index() {
  file_ids.reserve(hdr.file_count);
  page_map.reserve(hdr.page_count);

  for (uint32_t id = 0; id < hdr.file_count; id++) {
    file_ids.emplace(file_path(id), id);
  }

  for (uint32_t i = 0; i < hdr.page_count; i++) {
    const page_index_t &pi = page_index[i];

    if (pi.file_id >= hdr.file_count) {
      DBGE << "Page " << i << " references file " << pi.file_id
           << " out of " << hdr.file_count << "\n";
      return format_error_t::BAD_LAYOUT;
    }

    if (not is_page_aligned(pi.source_offset)) {
      DBGE << "Page " << i << " has unaligned source offset "
           << pi.source_offset << "\n";
      return format_error_t::BAD_LAYOUT;
    }

    const uint64_t cache_off = hdr.data_offset + (uint64_t)i * PAGE_SIZE;
    const auto [_, inserted] =
        page_map.emplace(page_key_t{pi.file_id, pi.source_offset}, cache_off);

    if (not inserted) {
      DBGW << "Duplicate page " << file_path(pi.file_id) << "@"
           << pi.source_offset << ", keeping the first copy\n";
    }
  }

  return format_error_t::NONE;
}

format_error_t CacheStore::load(const std::string &path) {
  unload();

  std::error_code ec;
  const auto file_sz = fs::file_size(path, ec);
  if (ec) {
    DBGE << "Unable to stat " << path << ": " << ec.message() << "\n";
    return format_error_t::IO;
  }

  if (file_sz < sizeof(header_t)) {
    DBGE << path << " is too small to be a cache file (" << file_sz
         << " bytes)\n";
    return format_error_t::TRUNCATED;
  }

  try {
    fmap = std::make_unique<bip::file_mapping>(path.c_str(), bip::read_only);
    region = std::make_unique<bip::mapped_region>(*fmap, bip::read_only);
  } catch (const bip::interprocess_exception &e) {
    DBGE << "Unable to map " << path << ": " << e.what() << "\n";
    unload();
    return format_error_t::IO;
  }

  base = nvsl::RCast<const uint8_t *>(region->get_address());
  mapped_size = region->get_size();
  std::memcpy(&hdr, base, sizeof(hdr));

  auto err = check_header(mapped_size);
  if (err != format_error_t::NONE) {
    unload();
    return err;
  }

  page_index = nvsl::RCast<const page_index_t *>(base + hdr.index_offset);
  file_table = nvsl::RCast<const file_entry_t *>(base + hdr.file_table_offset);

  err = build_index();
  if (err != format_error_t::NONE) {
    unload();
    return err;
  }

  cache_path = path;

  DBGH(1) << "BigCache loaded: " << hdr.page_count << " pages, "
          << hdr.file_count << " files, " << hdr.total_size << " bytes\n";

  return format_error_t::NONE;
}

void CacheStore::unload() {
  page_map.clear();
  file_ids.clear();

  region.reset();
  fmap.reset();

  base = nullptr;
  mapped_size = 0;
  page_index = nullptr;
  file_table = nullptr;
  hdr = {};
  preheated = false;
  cache_path.clear();
}

std::string CacheStore::file_path(uint32_t id) const {
  const file_entry_t &fe = file_table[id];
  const size_t max_len = std::min<size_t>(fe.path_len, MAX_PATH_LEN);

  return std::string(fe.path, strnlen(fe.path, max_len));
}

std::optional<uint32_t> CacheStore::file_id(const std::string &path) const {
  const auto it = file_ids.find(path);
  if (it == file_ids.end()) {
    return std::nullopt;
  }

  return it->second;
}

std::optional<uint64_t> CacheStore::find(uint32_t file_id, uint64_t offset) {
  const auto it = page_map.find({file_id, page_align_down(offset)});

  if (it == page_map.end()) {
    misses.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  hits.fetch_add(1, std::memory_order_relaxed);
  return it->second;
}

const void *CacheStore::lookup(uint32_t file_id, uint64_t offset) {
  if (not is_loaded()) {
    return nullptr;
  }

  const auto cache_off = find(file_id, offset);
  if (not cache_off) {
    return nullptr;
  }

  bytes_served.fetch_add(PAGE_SIZE, std::memory_order_relaxed);
  return base + *cache_off;
}

const void *CacheStore::lookup(const std::string &path, uint64_t offset) {
  if (not is_loaded()) {
    return nullptr;
  }

  const auto id = file_id(path);
  if (not id) {
    misses.fetch_add(1, std::memory_order_relaxed);
    return nullptr;
  }

  return lookup(*id, offset);
}

std::optional<uint64_t> CacheStore::lookup_offset(const std::string &path,
                                                  uint64_t offset) {
  if (not is_loaded()) {
    return std::nullopt;
  }

  const auto id = file_id(path);
  if (not id) {
    misses.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  return find(*id, offset);
}

int CacheStore::preheat() {
  if (not is_loaded()) {
    return -EINVAL;
  }

  DBGH(1) << "Preheating " << cache_path << " (" << mapped_size
          << " bytes)\n";

  if (not region->advise(bip::mapped_region::advice_sequential)) {
    DBGW << "madvise(SEQUENTIAL) failed: " << PSTR() << "\n";
  }

  volatile uint8_t sum = 0;
  for (size_t off = 0; off < mapped_size; off += PAGE_SIZE) {
    sum = sum + base[off];
  }
  (void)sum;

  /* Faults drive the access order from here on, not the file order */
  if (not region->advise(bip::mapped_region::advice_random)) {
    DBGW << "madvise(RANDOM) failed: " << PSTR() << "\n";
  }

  if (mlock(base, mapped_size) == -1) {
    DBGH(1) << "mlock (optional) failed: " << PSTR() << "\n";
  }

  preheated = true;
  return 0;
}

int CacheStore::preheat_range(uint32_t start_idx, uint32_t end_idx) {
  if (not is_loaded()) {
    return -EINVAL;
  }

  if (start_idx >= hdr.page_count or end_idx > hdr.page_count or
      start_idx >= end_idx) {
    return -EINVAL;
  }

  volatile uint8_t sum = 0;
  for (uint32_t idx = start_idx; idx < end_idx; idx++) {
    sum = sum + *page_data(idx);
  }
  (void)sum;

  return 0;
}

int CacheStore::verify() const {
  if (not is_loaded()) {
    return -EINVAL;
  }

  if (hdr.magic != BIGCACHE_MAGIC) {
    DBGE << "Verification failed: invalid magic\n";
    return -EINVAL;
  }

  if (hdr.total_size != mapped_size) {
    DBGE << "Verification failed: size mismatch (header: " << hdr.total_size
         << ", actual: " << mapped_size << ")\n";
    return -EINVAL;
  }

  const uint32_t csum = image_checksum(base, mapped_size);
  if (csum != hdr.checksum) {
    DBGE << "Verification failed: checksum 0x" << std::hex << csum
         << " != 0x" << hdr.checksum << std::dec << "\n";
    return -EIO;
  }

  return 0;
}

void CacheStore::reset_stats() {
  hits = 0;
  misses = 0;
  bytes_served = 0;
}

void CacheStore::print_stats(std::ostream &os) const {
  const uint64_t h = hit_count(), m = miss_count();

  os << "=== BigCache Statistics ===\n";
  os << "Loaded: " << (is_loaded() ? "yes" : "no") << "\n";
  os << "Preheated: " << (preheated ? "yes" : "no") << "\n";

  if (is_loaded()) {
    os << "Pages: " << hdr.page_count << "\n";
    os << "Files: " << hdr.file_count << "\n";
    os << "Size: " << hdr.total_size << " bytes\n";
  }

  os << "Cache hits: " << h << "\n";
  os << "Cache misses: " << m << "\n";
  if (h + m > 0) {
    os << "Hit rate: " << std::fixed << std::setprecision(2)
       << (double)h * 100 / (double)(h + m) << "%\n";
  }
  os << "Bytes served: " << bytes_count() << "\n";
}

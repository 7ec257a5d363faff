// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   layout.cc
 * @date   octobre  7, 2026
 * @brief  Layout table parser
 */

#include <cctype>
#include <cerrno>
#include <fstream>

#include <boost/algorithm/string.hpp>

#include "bigcache/layout.hh"
#include "nvsl/error.hh"
#include "nvsl/trace.hh"

using namespace bigcache;

enum layout_col_t {
  COL_CACHE_OFFSET = 0,
  COL_SOURCE_FILE,
  COL_SOURCE_OFFSET,
  COL_SIZE,
  COL_ACCESS_ORDER,
  COL_COUNT,
};

static bool parse_u64(const std::string &str, uint64_t &val) {
  /* std::stoull() takes "-5" and wraps it */
  if (str.empty() or not std::isdigit((unsigned char)str[0])) {
    return false;
  }

  try {
    size_t idx = 0;
    val = std::stoull(str, &idx, 10);
    return idx == str.size();
  } catch (const std::exception &e) {
    return false;
  }
}

int bigcache::parse_layout(const std::string &path,
                           std::vector<layout_entry_t> &entries) {
  std::ifstream ifs(path);
  if (not ifs.is_open()) {
    const int err = errno ? errno : ENOENT;
    DBGE << "Unable to open layout " << path << ": " << PSTR() << "\n";
    return -err;
  }

  std::string line;
  size_t lineno = 0;
  int parsed = 0;

  /* Header row */
  std::getline(ifs, line);
  lineno++;

  while (std::getline(ifs, line)) {
    lineno++;

    boost::algorithm::trim(line);
    if (line.empty()) {
      continue;
    }

    std::vector<std::string> cols;
    boost::algorithm::split(cols, line, boost::is_any_of(","));
    for (auto &col : cols) {
      boost::algorithm::trim(col);
    }

    if (cols.size() < COL_COUNT) {
      DBGW << path << ":" << lineno << ": expected " << COL_COUNT
           << " columns, got " << cols.size() << ", skipping\n";
      continue;
    }

    layout_entry_t entry = {};
    uint64_t order = 0;

    entry.source_file = cols[COL_SOURCE_FILE];
    if (entry.source_file.empty() or
        not parse_u64(cols[COL_SOURCE_OFFSET], entry.source_offset) or
        not parse_u64(cols[COL_ACCESS_ORDER], order)) {
      DBGW << path << ":" << lineno << ": malformed row, skipping\n";
      continue;
    }

    if (not cols[COL_SIZE].empty() and
        not parse_u64(cols[COL_SIZE], entry.size)) {
      DBGW << path << ":" << lineno << ": bad size column, skipping\n";
      continue;
    }

    entry.access_order = (uint32_t)order;
    entries.push_back(std::move(entry));
    parsed++;
  }

  DBGH(1) << "Parsed " << parsed << " layout rows from " << path << "\n";

  return parsed;
}

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   format.cc
 * @date   octobre  6, 2026
 * @brief  Checksum over a cache image
 */

#include <boost/crc.hpp>

#include "bigcache/format.hh"

uint32_t bigcache::image_checksum(const void *img, size_t len) {
  const auto *bytes = static_cast<const uint8_t *>(img);
  const uint8_t zeros[sizeof(header_t::checksum)] = {};
  constexpr size_t after_csum = CHECKSUM_FIELD_OFF + sizeof(zeros);

  boost::crc_32_type crc;

  if (len < after_csum) {
    crc.process_bytes(bytes, len);
    return crc.checksum();
  }

  crc.process_bytes(bytes, CHECKSUM_FIELD_OFF);
  crc.process_bytes(zeros, sizeof(zeros));
  crc.process_bytes(bytes + after_csum, len - after_csum);

  return crc.checksum();
}

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   ptrace_backend.cc
 * @date   octobre 12, 2026
 * @brief  Architecture independent part of the ptrace backends
 */

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <elf.h>
#include <sys/ptrace.h>
#include <sys/uio.h>

#include "bigcache/ptrace_backend.hh"
#include "nvsl/error.hh"
#include "nvsl/trace.hh"

using namespace bigcache;

const char *bigcache::syscall_kind_str(syscall_kind_t kind) {
  switch (kind) {
  case syscall_kind_t::OPEN:
    return "open";
  case syscall_kind_t::OPENAT:
    return "openat";
  case syscall_kind_t::CLOSE:
    return "close";
  case syscall_kind_t::READ:
    return "read";
  case syscall_kind_t::PREAD64:
    return "pread64";
  case syscall_kind_t::DUP:
    return "dup";
  case syscall_kind_t::DUP2:
    return "dup2";
  case syscall_kind_t::DUP3:
    return "dup3";
  case syscall_kind_t::FCNTL:
    return "fcntl";
  case syscall_kind_t::EXECVE:
    return "execve";
  case syscall_kind_t::OTHER:
    break;
  }

  return "other";
}

int PtraceBackend::read_regs(pid_t tid, regs_t &regs) const {
  struct iovec iov = {
      .iov_base = regs.words.data(),
      .iov_len = sizeof(regs.words),
  };

  if (ptrace(PTRACE_GETREGSET, tid, (void *)NT_PRSTATUS, &iov) == -1) {
    return -errno;
  }

  regs.len = iov.iov_len;
  return 0;
}

int PtraceBackend::write_regs(pid_t tid, const regs_t &regs) const {
  struct iovec iov = {
      .iov_base = const_cast<uint64_t *>(regs.words.data()),
      .iov_len = regs.len,
  };

  if (ptrace(PTRACE_SETREGSET, tid, (void *)NT_PRSTATUS, &iov) == -1) {
    return -errno;
  }

  return 0;
}

ssize_t PtraceBackend::read_mem(pid_t tid, uint64_t addr, void *buf,
                                size_t len) const {
  struct iovec local = {.iov_base = buf, .iov_len = len};
  struct iovec remote = {.iov_base = (void *)addr, .iov_len = len};

  const ssize_t rc = process_vm_readv(tid, &local, 1, &remote, 1, 0);
  if (rc >= 0) {
    return rc;
  }

  /* Word at a time through ptrace */
  auto *dst = static_cast<uint8_t *>(buf);
  size_t done = 0;
  while (done < len) {
    const uint64_t word_addr = (addr + done) & ~(sizeof(long) - 1);
    const size_t skip = (addr + done) - word_addr;
    const size_t chunk = std::min(sizeof(long) - skip, len - done);

    errno = 0;
    const long word = ptrace(PTRACE_PEEKDATA, tid, (void *)word_addr, nullptr);
    if (errno != 0) {
      return done == 0 ? -errno : (ssize_t)done;
    }

    std::memcpy(dst + done, (const uint8_t *)&word + skip, chunk);
    done += chunk;
  }

  return done;
}

ssize_t PtraceBackend::write_mem(pid_t tid, uint64_t addr, const void *buf,
                                 size_t len) const {
  struct iovec local = {.iov_base = const_cast<void *>(buf), .iov_len = len};
  struct iovec remote = {.iov_base = (void *)addr, .iov_len = len};

  const ssize_t rc = process_vm_writev(tid, &local, 1, &remote, 1, 0);
  if (rc == (ssize_t)len) {
    return rc;
  }

  DBGH(3) << "process_vm_writev(" << tid << ") failed: " << PSTR()
          << ", using PTRACE_POKEDATA\n";

  /* Partial words keep the tracee's bytes around the written range */
  const auto *src = static_cast<const uint8_t *>(buf);
  size_t done = 0;
  while (done < len) {
    const uint64_t word_addr = (addr + done) & ~(sizeof(long) - 1);
    const size_t skip = (addr + done) - word_addr;
    const size_t chunk = std::min(sizeof(long) - skip, len - done);
    long word = 0;

    if (skip != 0 or chunk != sizeof(long)) {
      errno = 0;
      word = ptrace(PTRACE_PEEKDATA, tid, (void *)word_addr, nullptr);
      if (errno != 0) {
        return done == 0 ? -errno : (ssize_t)done;
      }
    }

    std::memcpy((uint8_t *)&word + skip, src + done, chunk);

    if (ptrace(PTRACE_POKEDATA, tid, (void *)word_addr, (void *)word) == -1) {
      return done == 0 ? -errno : (ssize_t)done;
    }

    done += chunk;
  }

  return done;
}

std::unique_ptr<PtraceBackend> bigcache::make_native_backend() {
#if defined(__x86_64__)
  return make_x86_64_backend();
#elif defined(__aarch64__)
  return make_aarch64_backend();
#else
  return nullptr;
#endif
}

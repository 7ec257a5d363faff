// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   ptrace_backend.hh
 * @date   octobre 12, 2026
 * @brief  Architecture specific register access for the syscall tracer
 */

#pragma once

#include <array>
#include <cstdint>
#include <memory>

#include <sys/types.h>

namespace bigcache {
  /** @brief Syscalls the tracer cares about, everything else is OTHER */
  enum class syscall_kind_t {
    OTHER,
    OPEN,
    OPENAT,
    CLOSE,
    READ,
    PREAD64,
    DUP,
    DUP2,
    DUP3,
    FCNTL,
    EXECVE,
  };

  const char *syscall_kind_str(syscall_kind_t kind);

  struct syscall_t {
    syscall_kind_t kind;
    long nr;
    uint64_t args[6];

    /** @brief Only meaningful at syscall exit */
    int64_t ret;
  };

  /** @brief Raw NT_PRSTATUS register set of a stopped task */
  struct regs_t {
    static constexpr size_t MAX_WORDS = 64;

    std::array<uint64_t, MAX_WORDS> words;
    size_t len; //< Bytes filled by the kernel
  };

  /**
   * @brief Register and memory access to a ptrace-stopped task
   *
   * @details Register and memory access are generic, only the register
   * layout and the syscall numbers differ between architectures.
   */
  class PtraceBackend {
  public:
    virtual ~PtraceBackend() = default;

    virtual const char *name() const = 0;

    /** @return 0 or -errno */
    virtual int read_regs(pid_t tid, regs_t &regs) const;

    /** @return 0 or -errno */
    virtual int write_regs(pid_t tid, const regs_t &regs) const;

    /**
     * @brief Copy @p len bytes at @p addr in the tracee into @p buf
     * @return Bytes copied or -errno
     */
    virtual ssize_t read_mem(pid_t tid, uint64_t addr, void *buf,
                             size_t len) const;

    /**
     * @brief Copy @p len bytes from @p buf to @p addr in the tracee
     * @details Uses process_vm_writev() and falls back to PTRACE_POKEDATA
     * when the kernel refuses it.
     * @return Bytes copied or -errno
     */
    virtual ssize_t write_mem(pid_t tid, uint64_t addr, const void *buf,
                              size_t len) const;

    /** @brief Syscall number, arguments and return value in @p regs */
    virtual syscall_t decode(const regs_t &regs) const = 0;
  };

  std::unique_ptr<PtraceBackend> make_x86_64_backend();
  std::unique_ptr<PtraceBackend> make_aarch64_backend();

  /** @brief Backend of the architecture this binary was built for */
  std::unique_ptr<PtraceBackend> make_native_backend();
} // namespace bigcache

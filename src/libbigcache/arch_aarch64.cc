// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   arch_aarch64.cc
 * @date   octobre 12, 2026
 * @brief  aarch64 register layout and syscall numbers
 */

#include <cstddef>

#include "bigcache/ptrace_backend.hh"

using namespace bigcache;

namespace {
  /** @brief NT_PRSTATUS layout, struct user_pt_regs */
  struct aarch64_regs_t {
    uint64_t regs[31];
    uint64_t sp;
    uint64_t pc;
    uint64_t pstate;
  };

  static_assert(sizeof(aarch64_regs_t) == 272);
  static_assert(sizeof(aarch64_regs_t) <= sizeof(regs_t::words));

  /* Generic syscall table, there is no plain open() or dup2() */
  enum aarch64_nr_t : long {
    NR_DUP = 23,
    NR_DUP3 = 24,
    NR_FCNTL = 25,
    NR_OPENAT = 56,
    NR_CLOSE = 57,
    NR_READ = 63,
    NR_PREAD64 = 67,
    NR_EXECVE = 221,
  };

  /** @brief x8 holds the syscall number, x0 the first argument and the
      return value */
  class Aarch64Backend : public PtraceBackend {
  public:
    const char *name() const override { return "aarch64"; }

    syscall_t decode(const regs_t &regs) const override {
      const auto *r =
          reinterpret_cast<const aarch64_regs_t *>(regs.words.data());
      syscall_t sc = {};

      sc.nr = (long)r->regs[8];
      for (size_t i = 0; i < 6; i++) {
        sc.args[i] = r->regs[i];
      }
      sc.ret = (int64_t)r->regs[0];

      switch (sc.nr) {
      case NR_DUP:
        sc.kind = syscall_kind_t::DUP;
        break;
      case NR_DUP3:
        sc.kind = syscall_kind_t::DUP3;
        break;
      case NR_FCNTL:
        sc.kind = syscall_kind_t::FCNTL;
        break;
      case NR_OPENAT:
        sc.kind = syscall_kind_t::OPENAT;
        break;
      case NR_CLOSE:
        sc.kind = syscall_kind_t::CLOSE;
        break;
      case NR_READ:
        sc.kind = syscall_kind_t::READ;
        break;
      case NR_PREAD64:
        sc.kind = syscall_kind_t::PREAD64;
        break;
      case NR_EXECVE:
        sc.kind = syscall_kind_t::EXECVE;
        break;
      default:
        sc.kind = syscall_kind_t::OTHER;
        break;
      }

      return sc;
    }
  };
} // namespace

std::unique_ptr<PtraceBackend> bigcache::make_aarch64_backend() {
  return std::make_unique<Aarch64Backend>();
}

// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   arch_x86_64.cc
 * @date   octobre 12, 2026
 * @brief  x86_64 register layout and syscall numbers
 */

#include <cstddef>

#include "bigcache/ptrace_backend.hh"

using namespace bigcache;

namespace {
  /** @brief NT_PRSTATUS layout, struct user_regs_struct */
  struct x86_64_regs_t {
    uint64_t r15, r14, r13, r12, rbp, rbx, r11, r10, r9, r8;
    uint64_t rax, rcx, rdx, rsi, rdi, orig_rax;
    uint64_t rip, cs, eflags, rsp, ss;
    uint64_t fs_base, gs_base, ds, es, fs, gs;
  };

  static_assert(sizeof(x86_64_regs_t) == 216);
  static_assert(sizeof(x86_64_regs_t) <= sizeof(regs_t::words));

  enum x86_64_nr_t : long {
    NR_READ = 0,
    NR_OPEN = 2,
    NR_CLOSE = 3,
    NR_PREAD64 = 17,
    NR_DUP = 32,
    NR_DUP2 = 33,
    NR_EXECVE = 59,
    NR_FCNTL = 72,
    NR_OPENAT = 257,
    NR_DUP3 = 292,
  };

  class X86_64Backend : public PtraceBackend {
  public:
    const char *name() const override { return "x86_64"; }

    syscall_t decode(const regs_t &regs) const override {
      const auto *r = reinterpret_cast<const x86_64_regs_t *>(regs.words.data());
      syscall_t sc = {};

      sc.nr = (long)r->orig_rax;
      sc.args[0] = r->rdi;
      sc.args[1] = r->rsi;
      sc.args[2] = r->rdx;
      sc.args[3] = r->r10;
      sc.args[4] = r->r8;
      sc.args[5] = r->r9;
      sc.ret = (int64_t)r->rax;

      switch (sc.nr) {
      case NR_READ:
        sc.kind = syscall_kind_t::READ;
        break;
      case NR_OPEN:
        sc.kind = syscall_kind_t::OPEN;
        break;
      case NR_CLOSE:
        sc.kind = syscall_kind_t::CLOSE;
        break;
      case NR_PREAD64:
        sc.kind = syscall_kind_t::PREAD64;
        break;
      case NR_DUP:
        sc.kind = syscall_kind_t::DUP;
        break;
      case NR_DUP2:
        sc.kind = syscall_kind_t::DUP2;
        break;
      case NR_EXECVE:
        sc.kind = syscall_kind_t::EXECVE;
        break;
      case NR_FCNTL:
        sc.kind = syscall_kind_t::FCNTL;
        break;
      case NR_OPENAT:
        sc.kind = syscall_kind_t::OPENAT;
        break;
      case NR_DUP3:
        sc.kind = syscall_kind_t::DUP3;
        break;
      default:
        sc.kind = syscall_kind_t::OTHER;
        break;
      }

      return sc;
    }
  };
} // namespace

std::unique_ptr<PtraceBackend> bigcache::make_x86_64_backend() {
  return std::make_unique<X86_64Backend>();
}

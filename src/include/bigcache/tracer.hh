// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   tracer.hh
 * @date   octobre 13, 2026
 * @brief  ptrace based tracer substituting read data with cached pages
 */

#pragma once

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/types.h>

#include "bigcache/cachestore.hh"
#include "bigcache/ptrace_backend.hh"
#include "nvsl/stats.hh"

namespace bigcache {
  /**
   * @brief Serves pread64()/read() data of tracked files from a CacheStore
   *
   * @details Only the bytes a call already returned are replaced. Return
   * values, errno and control flow of the tracee are never changed.
   */
  class SyscallTracer {
  private:
    struct task_t {
      pid_t tgid;
      bool started;    //< Initial SIGSTOP of a new task consumed
      bool in_syscall; //< Between syscall entry and exit stops
      syscall_t entry; //< Arguments captured at entry
    };

    CacheStore *store;
    const PtraceBackend *backend;

    pid_t main_pid = -1;
    int main_status = 0;
    std::unordered_map<pid_t, task_t> tasks;

    /** @brief (tgid, fd) -> file id in the store */
    std::map<std::pair<pid_t, int>, uint32_t> tracked_fds;

    nvsl::Counter intercepted, bypassed, pages_missed;
    uint64_t bytes_served = 0;
    uint64_t substitute_ns = 0;

    static pid_t read_tgid(pid_t tid);
    static int64_t read_fd_pos(pid_t tid, int fd);

    /** @brief Store id of the file @p fd of @p tid currently refers to */
    std::optional<uint32_t> cached_file_of(pid_t tid, int fd) const;

    /** @brief Track @p fd if it refers to a cached file, untrack it otherwise */
    void track_fd(pid_t tid, pid_t tgid, int fd);

    /** @brief Rebuild the tracked fds of @p tgid from /proc/<tid>/fd */
    void scan_fds(pid_t tid, pid_t tgid);

    int attach_task(pid_t tid);

    int setup_task(pid_t tid);
    void add_task(pid_t tid, bool started);
    void inherit_fds(pid_t parent_tgid, pid_t child_tgid);
    void drop_process(pid_t tgid);

    void handle_syscall_stop(pid_t tid);
    void handle_event(pid_t tid, int event);
    void on_fd_exit(pid_t tid, const task_t &task, int64_t fd);
    void on_read_exit(pid_t tid, const task_t &task, uint64_t offset,
                      int64_t ret);

    /** @return Bytes written into the tracee */
    uint64_t substitute(pid_t tid, uint32_t file_id, uint64_t buf,
                        uint64_t offset, uint64_t len);

  public:
    SyscallTracer(CacheStore *store, const PtraceBackend *backend);

    /**
     * @brief Fork and exec @p argv under trace
     * @return 0 on success, -errno otherwise
     */
    int spawn(const std::vector<std::string> &argv);

    /**
     * @brief Trace an already running process, all of its threads and the
     * tasks they create afterwards
     *
     * @details Cached files the process already has open are tracked from
     * /proc/<pid>/fd.
     * @return 0 on success, -errno otherwise
     */
    int attach(pid_t pid);

    /**
     * @brief Trace until every traced task has exited
     * @return Exit code of the spawned or attached process (128 + signal if
     * it was killed), -errno on failure
     */
    int run();

    bool is_tracked(pid_t tgid, int fd) const {
      return tracked_fds.contains({tgid, fd});
    }

    uint64_t intercepted_count() const { return intercepted.value(); }
    uint64_t bypassed_count() const { return bypassed.value(); }
    uint64_t bytes_count() const { return bytes_served; }

    void print_stats(std::ostream &os) const;
  };
} // namespace bigcache

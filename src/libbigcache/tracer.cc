// -*- mode: c++; c-basic-offset: 2; -*-

/**
 * @file   tracer.cc
 * @date   octobre 13, 2026
 * @brief  Syscall tracer main loop and read substitution
 */

#include <algorithm>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>

#include <fcntl.h>
#include <sys/ptrace.h>
#include <sys/wait.h>
#include <unistd.h>

#include "bigcache/tracer.hh"
#include "nvsl/error.hh"
#include "nvsl/trace.hh"

namespace fs = std::filesystem;

using namespace bigcache;

static constexpr long TRACE_OPTIONS =
    PTRACE_O_TRACESYSGOOD | PTRACE_O_TRACEFORK | PTRACE_O_TRACEVFORK |
    PTRACE_O_TRACECLONE;

SyscallTracer::SyscallTracer(CacheStore *store, const PtraceBackend *backend)
    : store(store), backend(backend) {
  NVSL_ASSERT(store != nullptr and backend != nullptr,
              "Tracer needs a cache and a ptrace backend");

  intercepted.init("tracer_intercepted",
                   "Reads whose data was served from the cache");
  bypassed.init("tracer_bypassed", "Reads left untouched");
  pages_missed.init("tracer_pages_missed",
                    "Pages of tracked reads absent from the cache");
}

pid_t SyscallTracer::read_tgid(pid_t tid) {
  std::ifstream status("/proc/" + std::to_string(tid) + "/status");
  std::string line;

  while (std::getline(status, line)) {
    if (line.starts_with("Tgid:")) {
      try {
        return std::stoi(line.substr(5));
      } catch (const std::exception &e) {
        break;
      }
    }
  }

  return tid;
}

int64_t SyscallTracer::read_fd_pos(pid_t tid, int fd) {
  std::ifstream fdinfo("/proc/" + std::to_string(tid) + "/fdinfo/" +
                       std::to_string(fd));
  std::string line;

  while (std::getline(fdinfo, line)) {
    if (line.starts_with("pos:")) {
      try {
        return std::stoll(line.substr(4));
      } catch (const std::exception &e) {
        return -EINVAL;
      }
    }
  }

  return -ENOENT;
}

void SyscallTracer::add_task(pid_t tid, bool started) {
  task_t task = {};
  task.tgid = read_tgid(tid);
  task.started = started;
  task.in_syscall = false;

  tasks[tid] = task;
}

int SyscallTracer::setup_task(pid_t tid) {
  if (ptrace(PTRACE_SETOPTIONS, tid, nullptr, (void *)TRACE_OPTIONS) == -1) {
    const int err = errno;
    DBGE << "PTRACE_SETOPTIONS(" << tid << ") failed: " << PSTR() << "\n";
    return -err;
  }

  add_task(tid, true);

  if (ptrace(PTRACE_SYSCALL, tid, nullptr, nullptr) == -1) {
    const int err = errno;
    DBGE << "PTRACE_SYSCALL(" << tid << ") failed: " << PSTR() << "\n";
    tasks.erase(tid);
    return -err;
  }

  return 0;
}

int SyscallTracer::spawn(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    return -EINVAL;
  }

  std::vector<char *> cargv;
  for (const auto &arg : argv) {
    cargv.push_back(const_cast<char *>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid == -1) {
    const int err = errno;
    DBGE << "fork failed: " << PSTR() << "\n";
    return -err;
  }

  if (pid == 0) {
    if (ptrace(PTRACE_TRACEME, 0, nullptr, nullptr) == -1) {
      _exit(127);
    }
    raise(SIGSTOP);
    execvp(cargv[0], cargv.data());
    _exit(127);
  }

  int status;
  if (waitpid(pid, &status, 0) == -1) {
    const int err = errno;
    DBGE << "waitpid(" << pid << ") failed: " << PSTR() << "\n";
    return -err;
  }

  if (not WIFSTOPPED(status)) {
    DBGE << "Child " << pid << " exited before tracing started\n";
    return -ECHILD;
  }

  main_pid = pid;
  DBGH(1) << "Tracing " << argv[0] << " (pid " << pid << ")\n";

  return setup_task(pid);
}

int SyscallTracer::attach_task(pid_t tid) {
  if (ptrace(PTRACE_ATTACH, tid, nullptr, nullptr) == -1) {
    const int err = errno;
    DBGE << "PTRACE_ATTACH(" << tid << ") failed: " << PSTR() << "\n";
    return -err;
  }

  int status;
  if (waitpid(tid, &status, __WALL) == -1) {
    const int err = errno;
    DBGE << "waitpid(" << tid << ") failed: " << PSTR() << "\n";
    return -err;
  }

  return 0;
}

int SyscallTracer::attach(pid_t pid) {
  int rc = attach_task(pid);
  if (rc != 0) {
    return rc;
  }

  main_pid = pid;
  std::set<pid_t> stopped = {pid};

  /* Threads may be created while attaching, rescan until nothing is new */
  const auto task_dir = "/proc/" + std::to_string(pid) + "/task";
  for (bool found = true; found;) {
    found = false;

    std::error_code ec;
    fs::directory_iterator it(task_dir, ec);
    for (; not ec and it != fs::directory_iterator(); it.increment(ec)) {
      pid_t tid;
      try {
        tid = std::stoi(it->path().filename().string());
      } catch (const std::exception &e) {
        continue;
      }

      if (stopped.contains(tid)) {
        continue;
      }

      /* The thread may exit before it is attached */
      if (attach_task(tid) == 0) {
        stopped.insert(tid);
        found = true;
      }
    }

    if (ec) {
      DBGW << "Unable to list " << task_dir << ": " << ec.message() << "\n";
    }
  }

  scan_fds(pid, read_tgid(pid));

  DBGH(1) << "Attached to pid " << pid << " (" << stopped.size()
          << " threads)\n";

  for (const pid_t tid : stopped) {
    const int task_rc = setup_task(tid);
    if (task_rc != 0 and tid == pid) {
      rc = task_rc;
    }
  }

  return rc;
}

void SyscallTracer::inherit_fds(pid_t parent_tgid, pid_t child_tgid) {
  const auto begin = tracked_fds.lower_bound({parent_tgid, INT_MIN});
  const auto end = tracked_fds.upper_bound({parent_tgid, INT_MAX});
  std::vector<std::pair<int, uint32_t>> inherited;

  for (auto it = begin; it != end; ++it) {
    inherited.emplace_back(it->first.second, it->second);
  }

  for (const auto &[fd, id] : inherited) {
    tracked_fds[{child_tgid, fd}] = id;
  }
}

void SyscallTracer::drop_process(pid_t tgid) {
  const auto begin = tracked_fds.lower_bound({tgid, INT_MIN});
  const auto end = tracked_fds.upper_bound({tgid, INT_MAX});
  tracked_fds.erase(begin, end);
}

void SyscallTracer::handle_event(pid_t tid, int event) {
  if (event != PTRACE_EVENT_FORK and event != PTRACE_EVENT_VFORK and
      event != PTRACE_EVENT_CLONE) {
    return;
  }

  unsigned long msg = 0;
  if (ptrace(PTRACE_GETEVENTMSG, tid, nullptr, &msg) == -1) {
    DBGW << "PTRACE_GETEVENTMSG(" << tid << ") failed: " << PSTR() << "\n";
    return;
  }

  const auto child = (pid_t)msg;
  if (not tasks.contains(child)) {
    add_task(child, false);
  }

  const pid_t parent_tgid = tasks[tid].tgid;
  const pid_t child_tgid = tasks[child].tgid;
  if (child_tgid != parent_tgid) {
    inherit_fds(parent_tgid, child_tgid);
  }

  DBGH(2) << "Task " << tid << " created " << child << "\n";
}

std::optional<uint32_t> SyscallTracer::cached_file_of(pid_t tid,
                                                      int fd) const {
  const auto link = "/proc/" + std::to_string(tid) + "/fd/" +
                    std::to_string(fd);
  std::error_code ec;
  const auto path = fs::read_symlink(link, ec);
  if (ec) {
    DBGH(2) << "Unable to resolve " << link << ": " << ec.message() << "\n";
    return std::nullopt;
  }

  return store->file_id(path.string());
}

void SyscallTracer::track_fd(pid_t tid, pid_t tgid, int fd) {
  const auto id = cached_file_of(tid, fd);
  if (id) {
    tracked_fds[{tgid, fd}] = *id;
    DBGH(2) << "[" << tid << "] tracking fd " << fd << "\n";
  } else {
    /* The fd number may be reused from a tracked file */
    tracked_fds.erase({tgid, fd});
  }
}

void SyscallTracer::scan_fds(pid_t tid, pid_t tgid) {
  drop_process(tgid);

  const auto fd_dir = "/proc/" + std::to_string(tid) + "/fd";
  std::error_code ec;
  fs::directory_iterator it(fd_dir, ec);
  for (; not ec and it != fs::directory_iterator(); it.increment(ec)) {
    try {
      track_fd(tid, tgid, std::stoi(it->path().filename().string()));
    } catch (const std::exception &e) {
      continue;
    }
  }

  if (ec) {
    DBGW << "Unable to list " << fd_dir << ": " << ec.message() << "\n";
  }
}

void SyscallTracer::on_fd_exit(pid_t tid, const task_t &task, int64_t fd) {
  if (fd < 0) {
    return;
  }

  track_fd(tid, task.tgid, (int)fd);
}

uint64_t SyscallTracer::substitute(pid_t tid, uint32_t file_id, uint64_t buf,
                                   uint64_t offset, uint64_t len) {
  const uint64_t end = offset + len;
  uint64_t written = 0;

  for (uint64_t cur = offset; cur < end;) {
    const uint64_t page = page_align_down(cur);
    const uint64_t in_page = cur - page;
    const uint64_t chunk = std::min<uint64_t>(PAGE_SIZE - in_page, end - cur);

    const auto *src = static_cast<const uint8_t *>(store->lookup(file_id, page));
    if (src == nullptr) {
      ++pages_missed;
    } else {
      const ssize_t rc =
          backend->write_mem(tid, buf + (cur - offset), src + in_page, chunk);
      if (rc < 0) {
        DBGW << "Writing " << chunk << " bytes into " << tid << " failed: "
             << strerror((int)-rc) << "\n";
      } else {
        written += rc;
      }
    }

    cur += chunk;
  }

  return written;
}

void SyscallTracer::on_read_exit(pid_t tid, const task_t &task,
                                 uint64_t offset, int64_t ret) {
  const int fd = (int)task.entry.args[0];
  const uint64_t buf = task.entry.args[1];

  const auto it = tracked_fds.find({task.tgid, fd});
  if (ret <= 0 or it == tracked_fds.end()) {
    ++bypassed;
    return;
  }

  /* The fd may have been closed or replaced by a call that is not decoded,
     e.g. close_range() */
  if (cached_file_of(tid, fd) != it->second) {
    DBGH(2) << "[" << tid << "] fd " << fd << " no longer refers to file "
            << it->second << "\n";
    tracked_fds.erase(it);
    ++bypassed;
    return;
  }

  const auto start = std::chrono::steady_clock::now();
  const uint64_t written = substitute(tid, it->second, buf, offset, ret);
  substitute_ns += std::chrono::duration_cast<std::chrono::nanoseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  if (written == 0) {
    ++bypassed;
    return;
  }

  ++intercepted;
  bytes_served += written;

  DBGH(3) << "[" << tid << "] " << syscall_kind_str(task.entry.kind) << " fd "
          << fd << " @" << offset << ": " << written << " of " << ret
          << " bytes from the cache\n";
}

void SyscallTracer::handle_syscall_stop(pid_t tid) {
  task_t &task = tasks[tid];

  regs_t regs = {};
  const int rc = backend->read_regs(tid, regs);
  if (rc != 0) {
    DBGW << "Unable to read registers of " << tid << ": " << strerror(-rc)
         << "\n";
    task.in_syscall = not task.in_syscall;
    return;
  }

  const syscall_t sc = backend->decode(regs);

  if (not task.in_syscall) {
    task.in_syscall = true;
    task.entry = sc;
    return;
  }

  task.in_syscall = false;

  switch (task.entry.kind) {
  case syscall_kind_t::OPEN:
  case syscall_kind_t::OPENAT:
  case syscall_kind_t::DUP:
  case syscall_kind_t::DUP2:
  case syscall_kind_t::DUP3:
    on_fd_exit(tid, task, sc.ret);
    break;
  case syscall_kind_t::FCNTL: {
    const auto cmd = (int)task.entry.args[1];
    if (cmd == F_DUPFD or cmd == F_DUPFD_CLOEXEC) {
      on_fd_exit(tid, task, sc.ret);
    }
    break;
  }
  case syscall_kind_t::EXECVE:
    /* O_CLOEXEC fds are gone, their numbers may already be reused */
    if (sc.ret == 0) {
      scan_fds(tid, task.tgid);
    }
    break;
  case syscall_kind_t::CLOSE:
    if (sc.ret == 0) {
      tracked_fds.erase({task.tgid, (int)task.entry.args[0]});
    }
    break;
  case syscall_kind_t::PREAD64:
    on_read_exit(tid, task, task.entry.args[3], sc.ret);
    break;
  case syscall_kind_t::READ: {
    const int fd = (int)task.entry.args[0];
    if (sc.ret <= 0 or not is_tracked(task.tgid, fd)) {
      ++bypassed;
      break;
    }

    /* The position has already moved past the data that was read */
    const int64_t pos = read_fd_pos(tid, fd);
    if (pos < sc.ret) {
      ++bypassed;
      break;
    }

    on_read_exit(tid, task, pos - sc.ret, sc.ret);
    break;
  }
  case syscall_kind_t::OTHER:
    break;
  }
}

int SyscallTracer::run() {
  if (tasks.empty()) {
    return -ECHILD;
  }

  while (not tasks.empty()) {
    int status;
    const pid_t tid = waitpid(-1, &status, __WALL);
    if (tid == -1) {
      if (errno == EINTR) {
        continue;
      }

      if (errno == ECHILD) {
        break;
      }

      const int err = errno;
      DBGE << "waitpid failed: " << PSTR() << "\n";
      return -err;
    }

    if (WIFEXITED(status) or WIFSIGNALED(status)) {
      const auto it = tasks.find(tid);
      if (it != tasks.end()) {
        const pid_t tgid = it->second.tgid;
        tasks.erase(it);

        if (tid == tgid) {
          drop_process(tgid);
        }
      }

      if (tid == main_pid) {
        main_status = WIFEXITED(status) ? WEXITSTATUS(status)
                                        : 128 + WTERMSIG(status);
      }
      continue;
    }

    if (not WIFSTOPPED(status)) {
      continue;
    }

    const int sig = WSTOPSIG(status);
    const int event = status >> 16;
    int inject = 0;

    auto it = tasks.find(tid);
    if (it == tasks.end()) {
      /* New task reported before its parent's fork event */
      add_task(tid, true);
    } else if (not it->second.started and sig == SIGSTOP) {
      it->second.started = true;
    } else if (sig == (SIGTRAP | 0x80)) {
      handle_syscall_stop(tid);
    } else if (sig == SIGTRAP and event != 0) {
      handle_event(tid, event);
    } else if (sig != SIGTRAP) {
      inject = sig;
    }

    if (ptrace(PTRACE_SYSCALL, tid, nullptr, (void *)(long)inject) == -1) {
      if (errno != ESRCH) {
        DBGW << "PTRACE_SYSCALL(" << tid << ") failed: " << PSTR() << "\n";
      }
    }
  }

  return main_status;
}

void SyscallTracer::print_stats(std::ostream &os) const {
  os << "=== BigCache Tracer Statistics ===\n";
  os << "Backend: " << backend->name() << "\n";
  os << "Intercepted reads: " << intercepted.value() << "\n";
  os << "Bypassed reads: " << bypassed.value() << "\n";
  os << "Pages missed: " << pages_missed.value() << "\n";
  os << "Bytes served: " << bytes_served << "\n";
  os << "Substitution time: " << substitute_ns / 1000 << " us\n";
}

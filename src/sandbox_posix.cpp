#include "codelab/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <mutex>
#include <set>

namespace codelab {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr auto kFinalDrain = std::chrono::milliseconds(50);
constexpr std::size_t kReadChunk = 64 * 1024;
// Reads per stream per poll round, so a fast writer on one pipe cannot starve
// the watchdog.
constexpr int kMaxReadsPerRound = 16;

struct ChildStatus {
  int stage;
  int err;
};

class Fd {
 public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { reset(); }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }

 private:
  int fd_{-1};
};

bool make_pipe(Fd& read_end, Fd& write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) return false;
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

void append_limited(std::string& dst, const char* src, std::size_t n, std::size_t limit,
                    bool& truncated) {
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min(n, avail);
  dst.append(src, take);
  if (take < n) truncated = true;
}

struct Stream {
  Fd* fd;
  std::string* text;
  bool* truncated;
};

// One step of building the child's root filesystem. Paths are absolute and
// already prefixed with fs_root where they name something inside it.
struct MountStep {
  enum class Kind { make_dir, make_file, bind_ro, bind_rw, tmpfs, symlink };
  Kind kind;
  std::string src;
  std::string dst;
};

// Host-side preparation of the mount steps for spec.fs_root. Runs in the
// parent, so it may allocate and stat freely.
class RootPlanner {
 public:
  explicit RootPlanner(const std::string& root) : root_(root) {}

  void readonly(const std::string& path) {
    struct stat st;
    if (path.empty() || path[0] != '/' || ::lstat(path.c_str(), &st) != 0) return;
    const std::string dst = root_ + path;
    if (S_ISLNK(st.st_mode)) {
      std::string target(PATH_MAX, '\0');
      const ssize_t n = ::readlink(path.c_str(), target.data(), target.size());
      if (n <= 0) return;
      target.resize(static_cast<std::size_t>(n));
      parents(path);
      steps_.push_back({MountStep::Kind::symlink, target, dst});
    } else if (S_ISDIR(st.st_mode)) {
      dirs(path);
      steps_.push_back({MountStep::Kind::bind_ro, path, dst});
    } else {
      parents(path);
      steps_.push_back({MountStep::Kind::make_file, {}, dst});
      steps_.push_back({MountStep::Kind::bind_ro, path, dst});
    }
  }

  void device(const std::string& path) {
    parents(path);
    steps_.push_back({MountStep::Kind::make_file, {}, root_ + path});
    steps_.push_back({MountStep::Kind::bind_rw, path, root_ + path});
  }

  void tmpfs(const std::string& path) {
    dirs(path);
    steps_.push_back({MountStep::Kind::tmpfs, {}, root_ + path});
  }

  void writable(const std::string& path) {
    dirs(path);
    steps_.push_back({MountStep::Kind::bind_rw, path, root_ + path});
  }

  void dirs(const std::string& path) {
    parents(path);
    if (made_.insert(path).second) {
      steps_.push_back({MountStep::Kind::make_dir, {}, root_ + path});
    }
  }

  std::vector<MountStep>& steps() { return steps_; }

 private:
  void parents(const std::string& path) {
    for (std::size_t pos = path.find('/', 1); pos != std::string::npos;
         pos = path.find('/', pos + 1)) {
      const std::string dir = path.substr(0, pos);
      if (made_.insert(dir).second) {
        steps_.push_back({MountStep::Kind::make_dir, {}, root_ + dir});
      }
    }
  }

  std::string root_;
  std::set<std::string> made_;
  std::vector<MountStep> steps_;
};

// Everything the child touches is prepared before fork(): between fork and
// exec only async-signal-safe calls are made.
struct ChildPlan {
  const char* command;
  char* const* argv;
  char* const* envp;
  const char* cwd;
  const char* stdin_path;
  const ProcessSpec* spec;
  const char* fs_root;  // nullptr: no filesystem isolation
  const char* old_root;
  const MountStep* steps;
  std::size_t step_count;
  const char* uid_map;
  const char* gid_map;
};

[[noreturn]] void child_fail(int status_fd, SetupStage stage) {
  const ChildStatus st{static_cast<int>(stage), errno};
  if (::write(status_fd, &st, sizeof(st)) != static_cast<ssize_t>(sizeof(st))) _exit(126);
  _exit(127);
}

bool set_limit(int resource, rlim_t soft, rlim_t hard) {
  struct rlimit rl;
  rl.rlim_cur = soft;
  rl.rlim_max = hard;
  return ::setrlimit(resource, &rl) == 0;
}

enum class Namespaces { failed, plain, with_user };

Namespaces enter_namespaces(int flags) {
  // A user namespace lets an unprivileged caller own the new namespaces.
  // The plain form covers callers that hold CAP_SYS_ADMIN but run where user
  // namespaces are disabled.
  if (::unshare(CLONE_NEWUSER | flags) == 0) return Namespaces::with_user;
  if (::unshare(flags) == 0) return Namespaces::plain;
  return Namespaces::failed;
}

bool write_file(const char* path, const char* text) {
  const int fd = ::open(path, O_WRONLY | O_CLOEXEC);
  if (fd < 0) return false;
  const std::size_t len = std::strlen(text);
  const bool ok = ::write(fd, text, len) == static_cast<ssize_t>(len);
  ::close(fd);
  return ok;
}

// Maps the caller's uid/gid onto themselves so files created in the tmpfs
// root and the workspace keep their owner.
bool write_id_maps(const ChildPlan& plan) {
  // Missing on kernels older than 3.19, where gid_map needs no deny first.
  if (!write_file("/proc/self/setgroups", "deny") && errno != ENOENT) return false;
  return write_file("/proc/self/uid_map", plan.uid_map) &&
         write_file("/proc/self/gid_map", plan.gid_map);
}

// A read-only remount inside a user namespace must keep the flags that are
// locked on the source mount, or the kernel refuses it.
bool remount_readonly(const char* dst) {
  struct statvfs sv;
  if (::statvfs(dst, &sv) != 0) return false;
  unsigned long flags = MS_BIND | MS_REMOUNT | MS_RDONLY;
  if (sv.f_flag & ST_NOSUID) flags |= MS_NOSUID;
  if (sv.f_flag & ST_NODEV) flags |= MS_NODEV;
  if (sv.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
  if (sv.f_flag & ST_NOATIME) flags |= MS_NOATIME;
  if (sv.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
  if (sv.f_flag & ST_RELATIME) flags |= MS_RELATIME;
  return ::mount(nullptr, dst, nullptr, flags, nullptr) == 0;
}

bool run_step(const MountStep& step) {
  const char* dst = step.dst.c_str();
  switch (step.kind) {
    case MountStep::Kind::make_dir:
      return ::mkdir(dst, 0755) == 0 || errno == EEXIST;
    case MountStep::Kind::make_file: {
      const int fd = ::open(dst, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
      if (fd < 0) return false;
      ::close(fd);
      return true;
    }
    case MountStep::Kind::bind_ro:
      return ::mount(step.src.c_str(), dst, nullptr, MS_BIND | MS_REC, nullptr) == 0 &&
             remount_readonly(dst);
    case MountStep::Kind::bind_rw:
      return ::mount(step.src.c_str(), dst, nullptr, MS_BIND | MS_REC, nullptr) == 0;
    case MountStep::Kind::tmpfs:
      return ::mount("tmpfs", dst, "tmpfs", MS_NOSUID | MS_NODEV, "size=64m,mode=1777") == 0;
    case MountStep::Kind::symlink:
      return ::symlink(step.src.c_str(), dst) == 0 || errno == EEXIST;
  }
  return false;
}

bool enter_root(const ChildPlan& plan) {
  // Keep our mounts from propagating back into the host namespace.
  if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) return false;
  if (::mount("tmpfs", plan.fs_root, "tmpfs", MS_NOSUID | MS_NODEV, "size=16m,mode=0755") != 0) {
    return false;
  }
  for (std::size_t i = 0; i < plan.step_count; ++i) {
    if (!run_step(plan.steps[i])) return false;
  }
  if (::mkdir(plan.old_root, 0700) != 0 && errno != EEXIST) return false;
  if (::syscall(SYS_pivot_root, plan.fs_root, plan.old_root) == 0) {
    if (::chdir("/") != 0) return false;
    if (::umount2("/.old_root", MNT_DETACH) != 0) return false;
    ::rmdir("/.old_root");
    return true;
  }
  // pivot_root refuses some roots (e.g. an initramfs); chroot still hides the
  // host tree once the process cannot escape it.
  return ::chroot(plan.fs_root) == 0 && ::chdir("/") == 0;
}

[[noreturn]] void child_main(const ChildPlan& plan, int out_w, int err_w, int status_w) {
  const ProcessSpec& spec = *plan.spec;

  if (::setsid() < 0) child_fail(status_w, SetupStage::session);

  const bool isolate_fs = plan.fs_root != nullptr;
  const int ns_flags = (spec.isolate_network ? CLONE_NEWNET : 0) | (isolate_fs ? CLONE_NEWNS : 0);
  if (ns_flags != 0) {
    const Namespaces ns = enter_namespaces(ns_flags);
    if (ns == Namespaces::failed) {
      child_fail(status_w, spec.isolate_network ? SetupStage::network_isolation
                                                : SetupStage::filesystem_isolation);
    }
    if (isolate_fs) {
      if (ns == Namespaces::with_user && !write_id_maps(plan)) {
        child_fail(status_w, SetupStage::filesystem_isolation);
      }
      if (!enter_root(plan)) child_fail(status_w, SetupStage::filesystem_isolation);
    }
  }

  const int in_fd = ::open(plan.stdin_path, O_RDONLY | O_CLOEXEC);
  if (in_fd < 0 || ::dup2(in_fd, STDIN_FILENO) < 0) child_fail(status_w, SetupStage::stdin_redirect);
  if (::dup2(out_w, STDOUT_FILENO) < 0 || ::dup2(err_w, STDERR_FILENO) < 0) {
    child_fail(status_w, SetupStage::stdin_redirect);
  }

  if (plan.cwd[0] != '\0' && ::chdir(plan.cwd) != 0) {
    child_fail(status_w, SetupStage::working_directory);
  }

  bool limits_ok = set_limit(RLIMIT_CORE, 0, 0);
  if (spec.max_memory_bytes > 0) {
    limits_ok = limits_ok && set_limit(RLIMIT_AS, spec.max_memory_bytes, spec.max_memory_bytes);
  }
  if (spec.max_file_descriptors > 0) {
    limits_ok = limits_ok &&
                set_limit(RLIMIT_NOFILE, spec.max_file_descriptors, spec.max_file_descriptors);
  }
  if (spec.max_file_size_bytes > 0) {
    limits_ok = limits_ok &&
                set_limit(RLIMIT_FSIZE, spec.max_file_size_bytes, spec.max_file_size_bytes);
  }
  if (spec.timeout_ms > 0) {
    // CPU backstop in whole seconds; the wall-clock watchdog normally fires first.
    const rlim_t cpu = (spec.timeout_ms + 999) / 1000;
    limits_ok = limits_ok && set_limit(RLIMIT_CPU, cpu, cpu + 1);
  }
  if (!limits_ok) child_fail(status_w, SetupStage::resource_limits);

  ::signal(SIGPIPE, SIG_DFL);

  ::execve(plan.command, plan.argv, plan.envp);
  child_fail(status_w, SetupStage::exec);
}

void read_available(Stream& s, char* buf, std::size_t limit) {
  for (int round = 0; round < kMaxReadsPerRound && s.fd->valid(); ++round) {
    const ssize_t n = ::read(s.fd->get(), buf, kReadChunk);
    if (n > 0) {
      append_limited(*s.text, buf, static_cast<std::size_t>(n), limit, *s.truncated);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    s.fd->reset();  // EOF or hard error
  }
}

void poll_streams(Stream* streams, std::size_t count, std::chrono::milliseconds wait,
                  char* buf, std::size_t limit) {
  struct pollfd pfds[2];
  std::size_t idx[2];
  nfds_t n = 0;
  for (std::size_t k = 0; k < count; ++k) {
    if (!streams[k].fd->valid()) continue;
    pfds[n].fd = streams[k].fd->get();
    pfds[n].events = POLLIN;
    pfds[n].revents = 0;
    idx[n] = k;
    ++n;
  }
  if (n == 0) {
    // Nothing left to read; still honour the wait so the loop does not spin.
    struct timespec ts;
    ts.tv_sec = 0;
    ts.tv_nsec = static_cast<long>(wait.count()) * 1000000L;
    ::nanosleep(&ts, nullptr);
    return;
  }
  const int ready = ::poll(pfds, n, static_cast<int>(wait.count()));
  if (ready <= 0) return;
  for (nfds_t k = 0; k < n; ++k) {
    if (pfds[k].revents & (POLLIN | POLLHUP | POLLERR)) {
      read_available(streams[idx[k]], buf, limit);
    }
  }
}

std::chrono::milliseconds clamp_wait(Clock::time_point now, Clock::time_point until) {
  if (until <= now) return std::chrono::milliseconds(0);
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now) +
                    std::chrono::milliseconds(1);
  return std::min<std::chrono::milliseconds>(left, kPollInterval);
}

pid_t wait_child(pid_t pid, int* status, int flags, struct rusage* ru) {
  pid_t w;
  do {
    w = ::wait4(pid, status, flags, ru);
  } while (w < 0 && errno == EINTR);
  return w;
}

}  // namespace

std::string to_string(SetupStage stage) {
  switch (stage) {
    case SetupStage::none: return "none";
    case SetupStage::session: return "session";
    case SetupStage::network_isolation: return "network_isolation";
    case SetupStage::filesystem_isolation: return "filesystem_isolation";
    case SetupStage::stdin_redirect: return "stdin_redirect";
    case SetupStage::working_directory: return "working_directory";
    case SetupStage::resource_limits: return "resource_limits";
    case SetupStage::exec: return "exec";
  }
  return "unknown";
}

ProcessResult run_process(const ProcessSpec& spec, const CancellationToken* cancel) {
  std::vector<std::string> args = spec.argv;
  if (args.empty()) args.push_back(spec.command);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& a : args) argv.push_back(a.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  envs.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env) envs.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  const std::string stdin_path = spec.stdin_path.empty() ? "/dev/null" : spec.stdin_path;

  RootPlanner root(spec.fs_root);
  if (!spec.fs_root.empty()) {
    for (const auto& p : spec.readonly_paths) root.readonly(p);
    root.dirs("/dev");
    for (const char* dev : {"/dev/null", "/dev/zero", "/dev/urandom"}) root.device(dev);
    root.tmpfs("/tmp");
    if (!spec.cwd.empty()) root.writable(spec.cwd);
  }
  const std::string old_root = spec.fs_root + "/.old_root";
  const std::string uid_map = std::to_string(::getuid()) + " " + std::to_string(::getuid()) + " 1\n";
  const std::string gid_map = std::to_string(::getgid()) + " " + std::to_string(::getgid()) + " 1\n";

  const ChildPlan plan{spec.command.c_str(),
                       argv.data(),
                       envp.data(),
                       spec.cwd.c_str(),
                       stdin_path.c_str(),
                       &spec,
                       spec.fs_root.empty() ? nullptr : spec.fs_root.c_str(),
                       old_root.c_str(),
                       root.steps().data(),
                       root.steps().size(),
                       uid_map.c_str(),
                       gid_map.c_str()};

  Fd out_r, out_w, err_r, err_w, status_r, status_w;
  if (!make_pipe(out_r, out_w) || !make_pipe(err_r, err_w) || !make_pipe(status_r, status_w)) {
    throw EngineError(ErrorCode::spawn_failed, std::string("pipe: ") + std::strerror(errno));
  }

  const auto start = Clock::now();
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw EngineError(ErrorCode::spawn_failed, std::string("fork: ") + std::strerror(errno));
  }
  if (pid == 0) {
    child_main(plan, out_w.get(), err_w.get(), status_w.get());
  }

  out_w.reset();
  err_w.reset();
  status_w.reset();

  ProcessResult result;

  // Blocks until exec succeeds (close-on-exec gives EOF) or setup fails.
  ChildStatus st{};
  ssize_t got;
  do {
    got = ::read(status_r.get(), &st, sizeof(st));
  } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(st))) {
    int status = 0;
    struct rusage ru {};
    wait_child(pid, &status, 0, &ru);
    result.outcome = ProcessOutcome::setup_failed;
    result.failed_stage = static_cast<SetupStage>(st.stage);
    result.setup_errno = st.err;
    result.exit_code = 127;
    result.elapsed_us = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count());
    return result;
  }

  if (::fcntl(out_r.get(), F_SETFL, O_NONBLOCK) != 0 ||
      ::fcntl(err_r.get(), F_SETFL, O_NONBLOCK) != 0) {
    ::kill(-pid, SIGKILL);
    int status = 0;
    wait_child(pid, &status, 0, nullptr);
    throw EngineError(ErrorCode::spawn_failed, std::string("fcntl: ") + std::strerror(errno));
  }

  Stream streams[2] = {{&out_r, &result.stdout_text, &result.stdout_truncated},
                       {&err_r, &result.stderr_text, &result.stderr_truncated}};
  std::vector<char> buf(kReadChunk);
  const std::size_t limit = spec.max_output_bytes;

  enum class Stop { none, timeout, cancel };
  Stop stop = Stop::none;
  const auto deadline = start + std::chrono::milliseconds(spec.timeout_ms);
  Clock::time_point kill_at{};
  bool kill_sent = false;
  int status = 0;
  struct rusage ru {};
  Clock::time_point end{};

  while (true) {
    const auto now = Clock::now();
    if (stop == Stop::none) {
      if (cancel && cancel->cancelled()) {
        stop = Stop::cancel;
      } else if (now >= deadline) {
        stop = Stop::timeout;
      }
      if (stop != Stop::none) {
        ::kill(-pid, SIGTERM);
        kill_at = now + spec.kill_grace;
      }
    } else if (!kill_sent && now >= kill_at) {
      ::kill(-pid, SIGKILL);
      kill_sent = true;
    }

    const auto wait = stop == Stop::none ? clamp_wait(now, deadline)
                      : kill_sent        ? kPollInterval
                                         : clamp_wait(now, kill_at);
    poll_streams(streams, 2, wait, buf.data(), limit);

    const pid_t w = wait_child(pid, &status, WNOHANG, &ru);
    if (w == pid) {
      end = Clock::now();
      break;
    }
    if (w < 0) {
      ::kill(-pid, SIGKILL);
      throw EngineError(ErrorCode::spawn_failed, std::string("wait4: ") + std::strerror(errno));
    }
  }

  // Descendants that outlived the leader are part of the same run.
  ::kill(-pid, SIGKILL);

  const auto drain_until = Clock::now() + kFinalDrain;
  while ((out_r.valid() || err_r.valid()) && Clock::now() < drain_until) {
    poll_streams(streams, 2, std::chrono::milliseconds(5), buf.data(), limit);
  }

  result.elapsed_us = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
  if (ru.ru_maxrss > 0) {
    result.peak_rss_bytes = static_cast<std::uint64_t>(ru.ru_maxrss) * 1024u;  // KiB on Linux
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + result.term_signal;
  }

  if (stop == Stop::timeout) {
    result.outcome = ProcessOutcome::timed_out;
    result.exit_code = 124;
  } else if (stop == Stop::cancel) {
    result.outcome = ProcessOutcome::cancelled;
  } else if (WIFSIGNALED(status)) {
    result.outcome = ProcessOutcome::signaled;
  } else {
    result.outcome = ProcessOutcome::exited;
  }
  return result;
}

SandboxCapabilities detect_sandbox_capabilities() {
  static std::once_flag once;
  static SandboxCapabilities caps;
  std::call_once(once, [] {
    const auto probe = [](int flags) {
      const pid_t pid = ::fork();
      if (pid < 0) return false;
      if (pid == 0) _exit(enter_namespaces(flags) != Namespaces::failed ? 0 : 1);
      int status = 0;
      return wait_child(pid, &status, 0, nullptr) == pid && WIFEXITED(status) &&
             WEXITSTATUS(status) == 0;
    };
    caps.network_namespace = probe(CLONE_NEWNET);
    caps.mount_namespace = probe(CLONE_NEWNS);
  });
  return caps;
}

}  // namespace codelab

#pragma once

// codelab/sandbox.hpp — Isolated subprocess runner.
//
// run_process() forks a child that, before exec:
//   - becomes leader of its own session and process group (setsid), so the
//     watchdog can signal every descendant with kill(-pgid, ...);
//   - optionally enters fresh user+network namespaces (no interfaces but lo);
//   - optionally enters a mount namespace and pivot_roots into a tmpfs that
//     holds only read-only system binds, a few /dev nodes, a private /tmp and
//     the workspace bound read-write at its own path;
//   - chdirs into the per-run workspace and reads stdin from a file;
//   - applies RLIMIT_AS, RLIMIT_CPU, RLIMIT_NOFILE, RLIMIT_FSIZE, RLIMIT_CORE.
// A close-on-exec status pipe tells the parent which setup step failed, if any.
//
// The parent multiplexes stdout/stderr with poll() into buffers bounded at
// max_output_bytes. Output past the bound is read and discarded; the child is
// never killed for volume. On deadline or cancellation the whole group gets
// SIGTERM, then SIGKILL after kill_grace.
//
// Environment failures (pipe/fork) throw EngineError(spawn_failed). Everything
// the child does is reported in ProcessResult.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "codelab/types.hpp"

namespace codelab {

// Shared between a caller and a running execution. cancel() may be called from
// any thread; the watchdog notices within one poll interval.
class CancellationToken {
 public:
  void cancel() { flag_.store(true, std::memory_order_release); }
  bool cancelled() const { return flag_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> flag_{false};
};

struct ProcessSpec {
  std::string command;            // absolute path handed to execve
  std::vector<std::string> argv;  // including argv[0]; empty: {command}
  std::map<std::string, std::string> env;
  std::string cwd;
  std::string stdin_path;  // empty: /dev/null
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{4096};
  std::uint64_t max_memory_bytes{0};       // 0 = unlimited
  std::uint64_t max_file_descriptors{64};  // 0 = unlimited
  std::uint64_t max_file_size_bytes{16 * 1024 * 1024};
  bool isolate_network{false};
  // Filesystem view. Empty fs_root: the host filesystem. Otherwise fs_root
  // (an existing empty directory) becomes / for the child. readonly_paths that
  // do not exist are skipped; symlinks among them are recreated as symlinks.
  std::string fs_root;
  std::vector<std::string> readonly_paths;
  std::chrono::milliseconds kill_grace{50};
};

enum class ProcessOutcome {
  exited,
  signaled,
  timed_out,
  cancelled,
  setup_failed,
};

// Child-side step that failed before exec.
enum class SetupStage {
  none,
  session,
  network_isolation,
  filesystem_isolation,
  stdin_redirect,
  working_directory,
  resource_limits,
  exec,
};

std::string to_string(SetupStage stage);

struct ProcessResult {
  ProcessOutcome outcome{ProcessOutcome::exited};
  int exit_code{0};    // WEXITSTATUS, or 128+signal when signaled/killed
  int term_signal{0};
  std::string stdout_text;
  std::string stderr_text;
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::uint64_t elapsed_us{0};
  std::optional<std::uint64_t> peak_rss_bytes;
  SetupStage failed_stage{SetupStage::none};
  int setup_errno{0};
};

ProcessResult run_process(const ProcessSpec& spec, const CancellationToken* cancel = nullptr);

struct SandboxCapabilities {
  bool process_groups{true};
  bool rlimits{true};
  bool network_namespace{false};
  bool mount_namespace{false};
};

// Probes once whether this process can create network and mount namespaces
// here (forks a throwaway child per probe). Cached after the first call.
SandboxCapabilities detect_sandbox_capabilities();

}  // namespace codelab

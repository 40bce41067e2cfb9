#include "codelab/executor.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

#include "codelab/hash.hpp"
#include "codelab/observability.hpp"
#include "codelab/translator.hpp"

extern char** environ;

namespace fs = std::filesystem;

namespace codelab {

namespace {

// Removed from the child even when sandboxing is off: values that differ
// between otherwise identical runs.
const std::vector<std::string> kEnvDenylist = {"RANDOM", "TZ", "HOSTNAME", "PWD", "OLDPWD", "SHLVL"};

inline bool starts_with(const std::string& v, const std::string& prefix) {
  return v.size() >= prefix.size() && v.compare(0, prefix.size(), prefix) == 0;
}

bool key_in(const std::string& key, const std::vector<std::string>& list) {
  return std::find(list.begin(), list.end(), key) != list.end();
}

// Visible read-only inside an isolated run, together with the interpreter's
// install prefix. Missing entries are skipped.
const std::vector<std::string> kSystemPaths = {"/usr",  "/bin",   "/sbin",    "/lib",
                                               "/lib32", "/lib64", "/libx32", "/etc/ld.so.cache"};

bool allowed_in_sandbox(const std::string& key) {
  return key == "PATH" || key == "LANG" || key == "TERM" || starts_with(key, "LC_");
}

// Path normalization with symlink resolution and confinement check.
std::string normalize_under(const std::string& base_dir, const std::string& p) {
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(fs::path(base_dir), ec);
  if (ec) return "";
  const fs::path in = p.empty() ? base : fs::weakly_canonical(base / p, ec);
  if (ec) return "";
  const std::string base_str = base.string();
  const std::string in_str = in.string();
  if (in_str != base_str && !starts_with(in_str, base_str + "/")) return "";
  return in_str;
}

bool is_executable(const std::string& path) {
  return !path.empty() && ::access(path.c_str(), X_OK) == 0;
}

// Private directory for one run. Removed on destruction.
class RunWorkspace {
 public:
  RunWorkspace(const std::string& root_dir, const std::string& request_id) {
    std::error_code ec;
    const fs::path root = root_dir.empty() ? fs::temp_directory_path(ec) / "codelab" : fs::path(root_dir);
    if (ec) throw EngineError(ErrorCode::workspace_unavailable, "no temporary directory: " + ec.message());
    fs::create_directories(root, ec);
    if (ec) {
      throw EngineError(ErrorCode::workspace_unavailable,
                        "cannot create workspace root " + root.string() + ": " + ec.message());
    }

    std::string stem = sanitize_request_id(request_id);
    if (stem.empty()) stem = sanitize_request_id(generate_uuid());
    for (int attempt = 0; attempt < 16; ++attempt) {
      const std::string name = "run-" + stem + (attempt ? "-" + std::to_string(attempt) : "");
      const std::string confined = normalize_under(root.string(), name);
      if (confined.empty()) break;
      if (fs::create_directory(confined, ec)) {
        fs::permissions(confined, fs::perms::owner_all, fs::perm_options::replace, ec);
        path_ = confined;
        return;
      }
      if (ec) break;
    }
    throw EngineError(ErrorCode::workspace_unavailable,
                      "cannot create run directory under " + root.string() +
                          (ec ? ": " + ec.message() : std::string()));
  }

  ~RunWorkspace() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (!root_.empty()) fs::remove_all(root_, ec);
  }

  RunWorkspace(const RunWorkspace&) = delete;
  RunWorkspace& operator=(const RunWorkspace&) = delete;

  const std::string& path() const { return path_; }

  // Empty sibling directory the child mounts its private root on.
  const std::string& make_root() {
    std::error_code ec;
    const std::string dir = path_ + ".root";
    if (!fs::create_directory(dir, ec)) {
      throw EngineError(ErrorCode::workspace_unavailable,
                        "cannot create " + dir + (ec ? ": " + ec.message() : std::string()));
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    root_ = dir;
    return root_;
  }

  std::string write(const std::string& name, const std::string& content) const {
    const std::string file = path_ + "/" + name;
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) throw EngineError(ErrorCode::workspace_unavailable, "cannot write " + file);
    return file;
  }

 private:
  std::string path_;
  std::string root_;
};

// System paths plus the install prefix of the interpreter (both as named and
// with symlinks resolved) when it lives outside them.
std::vector<std::string> readonly_paths_for(const std::string& interpreter) {
  std::vector<std::string> out = kSystemPaths;
  const auto covered = [&](const std::string& p) {
    for (const auto& sys : out) {
      if (p == sys || starts_with(p, sys + "/")) return true;
    }
    return false;
  };
  std::error_code ec;
  const fs::path canonical = fs::canonical(interpreter, ec);
  for (const fs::path& exe : {fs::path(interpreter), ec ? fs::path() : canonical}) {
    if (exe.empty()) continue;
    const std::string prefix = exe.parent_path().parent_path().string();
    if (prefix.empty() || prefix == "/" || covered(prefix)) continue;
    out.push_back(prefix);
  }
  return out;
}

// What to run for a request once the language has been resolved.
struct Program {
  std::string interpreter;
  std::vector<std::string> args;  // after argv[0]
  std::string script_name;
  std::string script;
  bool translated{false};
  std::vector<std::string> translation_errors;
};

std::string join_lines(const std::vector<std::string>& v) {
  std::string out;
  for (const auto& s : v) {
    out += s;
    out += '\n';
  }
  return out;
}

ExecutionResult result_from_process(const ProcessResult& p, const ResourceLimits& limits) {
  ExecutionResult r;
  r.stdout_text = p.stdout_text;
  r.stderr_text = p.stderr_text;
  r.truncated_output = p.stdout_truncated || p.stderr_truncated;
  r.wall_time_us = p.elapsed_us;
  r.memory_used_bytes = p.peak_rss_bytes;

  switch (p.outcome) {
    case ProcessOutcome::exited:
      r.return_code = p.exit_code;
      r.status = p.exit_code == 0 ? ExecutionStatus::completed : ExecutionStatus::failed;
      break;
    case ProcessOutcome::signaled:
      r.return_code = p.exit_code;
      r.status = ExecutionStatus::failed;
      break;
    case ProcessOutcome::timed_out:
      r.status = ExecutionStatus::timed_out;
      r.wall_time_us = std::min<std::uint64_t>(p.elapsed_us, limits.max_execution_time_ms() * 1000);
      break;
    case ProcessOutcome::cancelled:
      r.status = ExecutionStatus::cancelled;
      break;
    case ProcessOutcome::setup_failed: {
      const std::string what = "sandbox setup failed at " + to_string(p.failed_stage) + " (errno " +
                               std::to_string(p.setup_errno) + ")";
      switch (p.failed_stage) {
        case SetupStage::network_isolation:
        case SetupStage::filesystem_isolation:
          r.status = ExecutionStatus::rejected_by_policy;
          r.stderr_text = what + "\n";
          r.memory_used_bytes.reset();
          break;
        case SetupStage::exec:
          throw EngineError(ErrorCode::interpreter_unavailable, what);
        case SetupStage::stdin_redirect:
        case SetupStage::working_directory:
          throw EngineError(ErrorCode::workspace_unavailable, what);
        default:
          throw EngineError(ErrorCode::sandbox_unavailable, what);
      }
      break;
    }
  }
  return r;
}

}  // namespace

std::string sanitize_request_id(const std::string& id) {
  std::string out;
  out.reserve(id.size());
  for (char c : id) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
        c == '_') {
      out.push_back(c);
    }
  }
  return out;
}

bool is_secret_key(const std::string& key) {
  auto ends_with = [&](const std::string& suffix) {
    return key.size() >= suffix.size() &&
           key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if (ends_with("_TOKEN") || ends_with("_SECRET") || ends_with("_KEY") || ends_with("_PASSWORD") ||
      ends_with("_CREDENTIAL")) {
    return true;
  }
  return starts_with(key, "AUTH") || starts_with(key, "COOKIE") || starts_with(key, "AWS_SECRET") ||
         starts_with(key, "GH_TOKEN") || starts_with(key, "GITHUB_TOKEN") ||
         starts_with(key, "NPM_TOKEN");
}

std::map<std::string, std::string> child_environment(bool sandboxed, const std::string& workspace) {
  std::map<std::string, std::string> env;
  for (char** e = environ; e && *e; ++e) {
    const std::string entry(*e);
    const auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    std::string key = entry.substr(0, eq);
    if (key_in(key, kEnvDenylist) || is_secret_key(key)) continue;
    if (sandboxed && !allowed_in_sandbox(key)) continue;
    env[std::move(key)] = entry.substr(eq + 1);
  }
  if (!env.contains("PATH")) env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
  env["HOME"] = workspace;
  env["TMPDIR"] = workspace;
  env["PYTHONHASHSEED"] = "0";
  env["PYTHONDONTWRITEBYTECODE"] = "1";
  env["PYTHONIOENCODING"] = "utf-8";
  return env;
}

std::string find_in_path(const std::string& name) {
  const char* path = std::getenv("PATH");
  const std::string dirs = (path && path[0]) ? path : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= dirs.size()) {
    std::size_t end = dirs.find(':', start);
    if (end == std::string::npos) end = dirs.size();
    const std::string dir = dirs.substr(start, end - start);
    if (!dir.empty()) {
      const std::string candidate = dir + "/" + name;
      if (is_executable(candidate)) return candidate;
    }
    start = end + 1;
  }
  return "";
}

SandboxExecutor::SandboxExecutor(ExecutorConfig config) : config_(std::move(config)) {
  if (!config_.policy) config_.policy = std::make_shared<const SecurityPolicy>();
}

ExecutionResult SandboxExecutor::execute(const ExecutionRequest& request,
                                         const CancellationToken* cancel) {
  ExecutionEvent ev;
  ev.request_id = request.id;
  ev.language = to_string(request.language);
  ev.code_digest = code_digest(request.language, request.code);
  ev.bytes_code = request.code.size();

  ExecutionResult result;
  try {
    ScopeTimer total(ev.duration_ns);
    const ResourceLimits limits = request.limits.clamped_to(config_.default_limits);
    const SecurityPolicy& policy = *config_.policy;

    Program program;
    const std::string python =
        config_.python_path.empty() ? find_in_path("python3") : config_.python_path;
    if (request.language == LanguageId::jac && !config_.jac_path.empty()) {
      if (!is_executable(config_.jac_path)) {
        throw EngineError(ErrorCode::interpreter_unavailable,
                          "JAC interpreter not executable: " + config_.jac_path);
      }
      program.interpreter = config_.jac_path;
      program.args = {"run", "script.jac"};
      program.script_name = "script.jac";
      program.script = request.code;
    } else {
      if (request.language == LanguageId::jac && !config_.jac_translate_fallback) {
        throw EngineError(ErrorCode::interpreter_unavailable,
                          "no JAC interpreter configured and translation fallback is off");
      }
      if (!is_executable(python)) {
        throw EngineError(ErrorCode::interpreter_unavailable,
                          python.empty() ? "python3 not found on PATH"
                                         : "Python interpreter not executable: " + python);
      }
      program.interpreter = python;
      // Not -I: it implies -E, which would drop PYTHONHASHSEED.
      program.args = {"-s", "-u", "script.py"};
      program.script_name = "script.py";
      if (request.language == LanguageId::jac) {
        TranslationResult t = translate(request.code, LanguageId::jac, LanguageId::py);
        program.translated = true;
        program.translation_errors = std::move(t.errors);
        program.script = std::move(t.translated_code);
      } else {
        program.script = request.code;
      }
    }
    ev.translated = program.translated;

    if (cancel && cancel->cancelled()) {
      result.status = ExecutionStatus::cancelled;
    } else if (!program.translation_errors.empty()) {
      result.status = ExecutionStatus::failed;
      result.stderr_text = "translation failed:\n" + join_lines(program.translation_errors);
    } else if (policy.sandboxing_enabled && !policy.network_access_enabled &&
               !detect_sandbox_capabilities().network_namespace) {
      result.status = ExecutionStatus::rejected_by_policy;
      result.stderr_text = "network isolation is required by policy but unavailable on this host\n";
    } else if (policy.sandboxing_enabled && !detect_sandbox_capabilities().mount_namespace) {
      result.status = ExecutionStatus::rejected_by_policy;
      result.stderr_text = "filesystem isolation is required by policy but unavailable on this host\n";
    } else {
      RunWorkspace ws(config_.workspace_root, request.id);
      ws.write(program.script_name, program.script);

      ProcessSpec spec;
      spec.command = program.interpreter;
      spec.argv.push_back(program.interpreter);
      spec.argv.insert(spec.argv.end(), program.args.begin(), program.args.end());
      spec.env = child_environment(policy.sandboxing_enabled, ws.path());
      spec.cwd = ws.path();
      if (request.stdin_text) spec.stdin_path = ws.write("stdin.txt", *request.stdin_text);
      spec.timeout_ms = limits.max_execution_time_ms();
      spec.max_output_bytes = static_cast<std::size_t>(limits.max_output_bytes());
      spec.max_memory_bytes = limits.max_memory_bytes();
      spec.isolate_network = policy.sandboxing_enabled && !policy.network_access_enabled;
      if (policy.sandboxing_enabled) {
        spec.fs_root = ws.make_root();
        spec.readonly_paths = readonly_paths_for(program.interpreter);
      }

      ProcessResult p;
      {
        ScopeTimer sandbox(ev.sandbox_ns);
        p = run_process(spec, cancel);
      }
      result = result_from_process(p, limits);
    }
  } catch (const EngineError& e) {
    global_engine_stats().record_environment_failure(e.code());
    throw;
  }

  ev.status = result.status;
  ev.result_digest = result_digest(result);
  ev.bytes_stdout = result.stdout_text.size();
  ev.bytes_stderr = result.stderr_text.size();
  ev.truncated_output = result.truncated_output;
  ev.memory_used_bytes = result.memory_used_bytes.value_or(0);
  emit_execution_event(ev);
  return result;
}

}  // namespace codelab

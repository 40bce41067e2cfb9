#pragma once

// codelab/executor.hpp — Runs one request in an isolated subprocess.
//
// Order of operations in SandboxExecutor::execute():
//   1. clamp the request limits to the configured defaults
//   2. pick the interpreter (JAC may fall back to translate-then-PY)
//   3. create a private workspace under workspace_root, write script + stdin
//   4. build the scrubbed child environment
//   5. run_process() under the limits, network namespace unless allowed
//   6. map the process outcome onto ExecutionStatus
//   7. emit one ExecutionEvent
//
// The executor never throws for anything the submitted program does. It throws
// EngineError when the host cannot run programs at all: no interpreter
// (interpreter_unavailable), no workspace (workspace_unavailable), pipe/fork
// failure (spawn_failed), or a child setup step other than network isolation
// failing (sandbox_unavailable). Missing network isolation is reported as
// RejectedByPolicy instead of running unsandboxed.

#include <map>
#include <memory>
#include <string>

#include "codelab/policy.hpp"
#include "codelab/sandbox.hpp"
#include "codelab/types.hpp"

namespace codelab {

struct ExecutorConfig {
  std::shared_ptr<const SecurityPolicy> policy{std::make_shared<const SecurityPolicy>()};
  ResourceLimits default_limits{ResourceLimits::defaults()};
  std::string python_path;  // empty: first python3 on PATH
  std::string jac_path;     // empty: no native JAC interpreter
  bool jac_translate_fallback{true};
  std::string workspace_root;  // empty: <temp>/codelab
};

class Executor {
 public:
  virtual ~Executor() = default;
  virtual ExecutionResult execute(const ExecutionRequest& request,
                                  const CancellationToken* cancel = nullptr) = 0;
};

class SandboxExecutor final : public Executor {
 public:
  explicit SandboxExecutor(ExecutorConfig config);

  ExecutionResult execute(const ExecutionRequest& request,
                          const CancellationToken* cancel = nullptr) override;

  const ExecutorConfig& config() const { return config_; }

 private:
  ExecutorConfig config_;
};

// First executable `name` on $PATH, or empty.
std::string find_in_path(const std::string& name);

// Keeps alphanumerics, '-' and '_'.
std::string sanitize_request_id(const std::string& id);

// Environment variable names that look like credentials.
bool is_secret_key(const std::string& key);

// Environment handed to the interpreter. Built from the current process
// environment minus credentials and nondeterministic variables; with
// sandboxing only locale, terminal and PATH survive.
std::map<std::string, std::string> child_environment(bool sandboxed,
                                                     const std::string& workspace);

}  // namespace codelab

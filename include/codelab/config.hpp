#pragma once

// codelab/config.hpp — Engine configuration and request/result documents.
//
// Precedence, lowest first:
//   1. built-in defaults (SecurityPolicy{}, ResourceLimits::defaults())
//   2. JSON config file (config_from_json / load_config_file)
//   3. environment (apply_env_overrides):
//        CODELAB_PYTHON            python interpreter path
//        CODELAB_JAC               JAC interpreter path
//        CODELAB_WORKSPACE         root for per-run directories
//        CODELAB_SANDBOX_DISABLED  "1" turns sandboxing off
//        CODELAB_EVENT_LOG         JSONL event sink
//
// Config document:
//   {
//     "config_version": "1",
//     "policy": { blocked_imports, blocked_functions, allowed_languages,
//                 sandboxing_enabled, network_access_enabled,
//                 max_executions_per_minute, max_executions_per_hour },
//     "limits": { max_execution_time_ms, max_memory_bytes,
//                 max_output_bytes, max_code_bytes },
//     "interpreters": { python, jac, jac_translate_fallback },
//     "workspace_root": "...",
//     "event_log_path": "..."
//   }

#include <optional>
#include <string>
#include <vector>

#include "codelab/executor.hpp"
#include "codelab/policy.hpp"
#include "codelab/types.hpp"

namespace codelab {

constexpr const char* kConfigVersion = "1";

struct EngineConfig {
  SecurityPolicy policy;
  ResourceLimits default_limits{ResourceLimits::defaults()};
  std::string python_path;
  std::string jac_path;
  bool jac_translate_fallback{true};
  std::string workspace_root;
  std::string event_log_path;
};

// Fields absent from the document keep their defaults. Problems are appended
// to *errors; the returned config holds whatever could be read.
EngineConfig config_from_json(const std::string& json, std::vector<std::string>* errors);

// Throws EngineError(invalid_request) when the file is unreadable or invalid.
EngineConfig load_config_file(const std::string& path);

void apply_env_overrides(EngineConfig& config);

ExecutorConfig to_executor_config(const EngineConfig& config);

std::string config_to_json(const EngineConfig& config);

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const std::string& config_json);

// Request document: {id?, language, code, stdin?, limits?}. Limits in the
// document tighten `defaults` and are clamped to them. Returns nullopt and
// fills *error on malformed input.
std::optional<ExecutionRequest> parse_request_json(const std::string& json,
                                                   const ResourceLimits& defaults,
                                                   std::string* error);

std::string request_to_json(const ExecutionRequest& request);

// {id, status, stdout, stderr, return_code|null, wall_time_us,
//  memory_used|null, truncated_output, code_digest[, violation]}
std::string result_to_json(const ExecutionRequest& request, const ExecutionResult& result,
                           const std::optional<PolicyViolation>& violation = std::nullopt);

}  // namespace codelab

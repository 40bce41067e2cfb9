#pragma once

// codelab/types.hpp — Core value types shared by the policy gate, the sandbox
// executor, the translator and session accounting.
//
// OWNERSHIP:
//   - ExecutionRequest/ExecutionResult are value types. The executor copies what
//     it needs out of a request and keeps no reference after execute() returns.
//   - ResourceLimits is immutable after construction; a per-request override can
//     only tighten it (see ResourceLimits::tightened_by).
//
// ERRORS:
//   - Code misbehaviour never throws. It is reported as an ExecutionStatus.
//   - Environment failures (cannot spawn, no interpreter, no workspace) throw
//     EngineError carrying an ErrorCode.
//   - Misuse of the session API throws PreconditionViolation.

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace codelab {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  invalid_request,
  invalid_limits,
  spawn_failed,
  interpreter_unavailable,
  workspace_unavailable,
  sandbox_unavailable,
  session_closed,
  session_unknown,
};

std::string to_string(ErrorCode code);

// Environment failure: the engine could not even begin running the code.
class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

// Programming error on the caller side (recording into a closed session, ...).
class PreconditionViolation : public std::logic_error {
 public:
  PreconditionViolation(ErrorCode code, const std::string& message)
      : std::logic_error(message), code_(code) {}
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

enum class LanguageId { jac, py };

std::string to_string(LanguageId lang);
// Accepts "jac"/"JAC" and "py"/"PY"/"python".
std::optional<LanguageId> parse_language(const std::string& s);

enum class ExecutionStatus {
  pending,
  running,
  completed,
  failed,
  timed_out,
  rejected_by_policy,
  cancelled,
};

std::string to_string(ExecutionStatus status);
std::optional<ExecutionStatus> parse_status(const std::string& s);
bool is_terminal(ExecutionStatus status);

// Optional per-request override. Absent fields inherit the default.
struct LimitOverride {
  std::optional<std::uint64_t> max_execution_time_ms;
  std::optional<std::uint64_t> max_memory_bytes;
  std::optional<std::uint64_t> max_output_bytes;
  std::optional<std::uint64_t> max_code_bytes;
};

class ResourceLimits {
 public:
  // Throws EngineError(invalid_limits) if any ceiling is zero.
  ResourceLimits(std::uint64_t max_execution_time_ms, std::uint64_t max_memory_bytes,
                 std::uint64_t max_output_bytes, std::uint64_t max_code_bytes);

  static ResourceLimits defaults();

  std::uint64_t max_execution_time_ms() const { return max_execution_time_ms_; }
  std::chrono::milliseconds max_execution_time() const {
    return std::chrono::milliseconds(max_execution_time_ms_);
  }
  std::uint64_t max_memory_bytes() const { return max_memory_bytes_; }
  std::uint64_t max_output_bytes() const { return max_output_bytes_; }
  std::uint64_t max_code_bytes() const { return max_code_bytes_; }

  // Merge with a per-request override. Each field becomes min(default, override):
  // an override can lower a ceiling but never raise it.
  ResourceLimits tightened_by(const LimitOverride& o) const;

  // Field-wise minimum of two profiles.
  ResourceLimits clamped_to(const ResourceLimits& ceiling) const;

  bool operator==(const ResourceLimits& other) const = default;

 private:
  std::uint64_t max_execution_time_ms_;
  std::uint64_t max_memory_bytes_;
  std::uint64_t max_output_bytes_;
  std::uint64_t max_code_bytes_;
};

// Who is asking. Rate limiting is keyed on id.
struct CallerIdentity {
  std::string id;
};

using SystemTime = std::chrono::system_clock::time_point;

struct ExecutionRequest {
  std::string id;  // UUID v4
  LanguageId language{LanguageId::py};
  std::string code;
  std::optional<std::string> stdin_text;
  ResourceLimits limits{ResourceLimits::defaults()};
  SystemTime submitted_at{std::chrono::system_clock::now()};
};

// Fills in a fresh id and submitted_at.
ExecutionRequest make_request(LanguageId language, std::string code,
                              const ResourceLimits& limits = ResourceLimits::defaults());

struct ExecutionResult {
  ExecutionStatus status{ExecutionStatus::pending};
  std::string stdout_text;
  std::string stderr_text;
  std::optional<int> return_code;
  std::uint64_t wall_time_us{0};
  std::optional<std::uint64_t> memory_used_bytes;
  bool truncated_output{false};
};

// Random RFC 4122 version 4 identifier, lower-case hex with dashes.
std::string generate_uuid();

// Milliseconds since the Unix epoch, for JSON output.
std::uint64_t to_unix_ms(SystemTime t);

}  // namespace codelab

#include "codelab/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <random>

namespace codelab {

namespace {

// Defaults follow the platform's shipped security settings: 5 s wall clock,
// 10 KiB of captured output, 100 KiB of source. The memory ceiling is applied
// as RLIMIT_AS (virtual address space), so it sits above what a CPython
// interpreter maps at startup.
constexpr std::uint64_t kDefaultTimeMs = 5000;
constexpr std::uint64_t kDefaultMemoryBytes = 256ull * 1024 * 1024;
constexpr std::uint64_t kDefaultOutputBytes = 10240;
constexpr std::uint64_t kDefaultCodeBytes = 102400;

std::uint64_t pick_min(std::uint64_t base, const std::optional<std::uint64_t>& o) {
  return o ? std::min(base, *o) : base;
}

}  // namespace

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::invalid_request: return "invalid_request";
    case ErrorCode::invalid_limits: return "invalid_limits";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::interpreter_unavailable: return "interpreter_unavailable";
    case ErrorCode::workspace_unavailable: return "workspace_unavailable";
    case ErrorCode::sandbox_unavailable: return "sandbox_unavailable";
    case ErrorCode::session_closed: return "session_closed";
    case ErrorCode::session_unknown: return "session_unknown";
  }
  return "unknown";
}

std::string to_string(LanguageId lang) {
  switch (lang) {
    case LanguageId::jac: return "jac";
    case LanguageId::py: return "py";
  }
  return "unknown";
}

std::optional<LanguageId> parse_language(const std::string& s) {
  std::string lower;
  lower.reserve(s.size());
  for (char c : s) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (lower == "jac") return LanguageId::jac;
  if (lower == "py" || lower == "python") return LanguageId::py;
  return std::nullopt;
}

std::string to_string(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::pending: return "pending";
    case ExecutionStatus::running: return "running";
    case ExecutionStatus::completed: return "completed";
    case ExecutionStatus::failed: return "failed";
    case ExecutionStatus::timed_out: return "timed_out";
    case ExecutionStatus::rejected_by_policy: return "rejected_by_policy";
    case ExecutionStatus::cancelled: return "cancelled";
  }
  return "unknown";
}

std::optional<ExecutionStatus> parse_status(const std::string& s) {
  static constexpr std::array<ExecutionStatus, 7> kAll = {
      ExecutionStatus::pending,   ExecutionStatus::running,
      ExecutionStatus::completed, ExecutionStatus::failed,
      ExecutionStatus::timed_out, ExecutionStatus::rejected_by_policy,
      ExecutionStatus::cancelled};
  for (auto st : kAll) {
    if (to_string(st) == s) return st;
  }
  return std::nullopt;
}

bool is_terminal(ExecutionStatus status) {
  return status != ExecutionStatus::pending && status != ExecutionStatus::running;
}

ResourceLimits::ResourceLimits(std::uint64_t max_execution_time_ms,
                               std::uint64_t max_memory_bytes,
                               std::uint64_t max_output_bytes,
                               std::uint64_t max_code_bytes)
    : max_execution_time_ms_(max_execution_time_ms),
      max_memory_bytes_(max_memory_bytes),
      max_output_bytes_(max_output_bytes),
      max_code_bytes_(max_code_bytes) {
  if (max_execution_time_ms_ == 0 || max_memory_bytes_ == 0 ||
      max_output_bytes_ == 0 || max_code_bytes_ == 0) {
    throw EngineError(ErrorCode::invalid_limits,
                      "resource limits must be strictly positive");
  }
}

ResourceLimits ResourceLimits::defaults() {
  return ResourceLimits(kDefaultTimeMs, kDefaultMemoryBytes, kDefaultOutputBytes,
                        kDefaultCodeBytes);
}

ResourceLimits ResourceLimits::tightened_by(const LimitOverride& o) const {
  return ResourceLimits(pick_min(max_execution_time_ms_, o.max_execution_time_ms),
                        pick_min(max_memory_bytes_, o.max_memory_bytes),
                        pick_min(max_output_bytes_, o.max_output_bytes),
                        pick_min(max_code_bytes_, o.max_code_bytes));
}

ResourceLimits ResourceLimits::clamped_to(const ResourceLimits& ceiling) const {
  return ResourceLimits(std::min(max_execution_time_ms_, ceiling.max_execution_time_ms_),
                        std::min(max_memory_bytes_, ceiling.max_memory_bytes_),
                        std::min(max_output_bytes_, ceiling.max_output_bytes_),
                        std::min(max_code_bytes_, ceiling.max_code_bytes_));
}

ExecutionRequest make_request(LanguageId language, std::string code,
                              const ResourceLimits& limits) {
  ExecutionRequest req;
  req.id = generate_uuid();
  req.language = language;
  req.code = std::move(code);
  req.limits = limits;
  req.submitted_at = std::chrono::system_clock::now();
  return req;
}

std::string generate_uuid() {
  static std::mutex mu;
  static std::mt19937_64 rng{std::random_device{}()};
  std::array<unsigned char, 16> b{};
  {
    std::lock_guard<std::mutex> lk(mu);
    const std::uint64_t hi = rng();
    const std::uint64_t lo = rng();
    for (int i = 0; i < 8; ++i) {
      b[i] = static_cast<unsigned char>(hi >> (i * 8));
      b[8 + i] = static_cast<unsigned char>(lo >> (i * 8));
    }
  }
  b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);  // version 4
  b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);  // RFC 4122 variant
  char buf[37];
  std::snprintf(buf, sizeof(buf),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10],
                b[11], b[12], b[13], b[14], b[15]);
  return std::string(buf, 36);
}

std::uint64_t to_unix_ms(SystemTime t) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
}

}  // namespace codelab

#pragma once

// codelab/observability.hpp — Execution events and engine statistics.
//
// ExecutionEvent is the observable unit. Every execute() and every policy
// rejection emits exactly one, which is:
//   - counted in the process-wide EngineStats;
//   - handed to the registered hook, if any;
//   - otherwise appended as one JSON line to the file named by
//     CODELAB_EVENT_LOG (or the configured event_log_path).
//
// Events carry digests and metadata only. Program text and captured output
// never leave the engine through this layer.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "codelab/policy.hpp"
#include "codelab/types.hpp"

namespace codelab {

struct ExecutionEvent {
  std::string request_id;
  std::string caller_id;
  std::string language;
  std::string code_digest;
  std::string result_digest;  // empty for rejections
  ExecutionStatus status{ExecutionStatus::pending};
  std::string violation;      // PolicyViolationKind for rejections, else empty
  std::string error_code;     // ErrorCode when the environment failed

  // Duration breakdown (nanoseconds)
  std::uint64_t duration_ns{0};  // whole execute() call
  std::uint64_t sandbox_ns{0};   // spawn to reap

  std::size_t bytes_code{0};
  std::size_t bytes_stdout{0};
  std::size_t bytes_stderr{0};
  bool truncated_output{false};
  std::uint64_t memory_used_bytes{0};
  bool translated{false};  // JAC ran through the PY fallback
};

std::string event_to_json(const ExecutionEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // p in [0.0, 1.0]. Microseconds; 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  std::uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats — aggregated counters
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the recent-event ring uses a mutex.
class EngineStats {
 public:
  void record_execution(const ExecutionEvent& ev);
  void record_environment_failure(ErrorCode code);
  std::string to_json() const;

  // Reset everything. Tests only.
  void reset();

  alignas(64) std::atomic<std::uint64_t> total_executions{0};
  alignas(64) std::atomic<std::uint64_t> completed{0};
  alignas(64) std::atomic<std::uint64_t> failed{0};
  alignas(64) std::atomic<std::uint64_t> timed_out{0};
  alignas(64) std::atomic<std::uint64_t> cancelled{0};
  alignas(64) std::atomic<std::uint64_t> sandbox_rejections{0};

  // Requests stopped by validate_request, by kind.
  alignas(64) std::atomic<std::uint64_t> rejected_unsupported_language{0};
  alignas(64) std::atomic<std::uint64_t> rejected_code_too_large{0};
  alignas(64) std::atomic<std::uint64_t> rejected_forbidden_construct{0};
  alignas(64) std::atomic<std::uint64_t> rejected_rate_limited{0};

  alignas(64) std::atomic<std::uint64_t> environment_failures{0};
  alignas(64) std::atomic<std::uint64_t> truncated_outputs{0};
  alignas(64) std::atomic<std::uint64_t> translated_runs{0};
  alignas(64) std::atomic<std::uint64_t> peak_memory_bytes_max{0};

  LatencyHistogram latency_histogram;

  static constexpr std::size_t kMaxRecentEvents = 1000;
  // Oldest first.
  std::vector<ExecutionEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<ExecutionEvent> ring_buffer_;
  std::size_t ring_head_{0};  // next slot to overwrite once full
};

EngineStats& global_engine_stats();

// Non-blocking, fire-and-forget.
void emit_execution_event(const ExecutionEvent& ev);

// Builds and emits the event for a request stopped by the policy gate.
void emit_rejection_event(const ExecutionRequest& request, const CallerIdentity& caller,
                          const PolicyViolation& violation);

using ExecutionEventHook = void (*)(const ExecutionEvent&);
void set_execution_event_hook(ExecutionEventHook hook);

// Fallback sink when CODELAB_EVENT_LOG is unset. Empty disables it.
void set_event_log_path(const std::string& path);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace codelab

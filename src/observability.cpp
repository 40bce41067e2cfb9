#include "codelab/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "codelab/hash.hpp"
#include "codelab/jsonlite.hpp"

namespace codelab {

namespace {

// Bucket index = bit_width(us): floor(log2(us)) + 1 for us > 0.
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* key, double v, const char* fmt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += ",\"";
  out += key;
  out += "\":";
  out += buf;
}

void atomic_max(std::atomic<std::uint64_t>& target, std::uint64_t v) {
  std::uint64_t cur = target.load(std::memory_order_relaxed);
  while (v > cur && !target.compare_exchange_weak(cur, v, std::memory_order_relaxed)) {
  }
}

std::atomic<ExecutionEventHook> g_event_hook{nullptr};

std::mutex g_log_path_mu;
std::string g_log_path;

std::string configured_log_path() {
  const char* env = std::getenv("CODELAB_EVENT_LOG");
  if (env && env[0]) return env;
  std::lock_guard<std::mutex> lk(g_log_path_mu);
  return g_log_path;
}

}  // namespace

std::string event_to_json(const ExecutionEvent& ev) {
  jsonlite::Object o;
  o["request_id"] = ev.request_id;
  o["caller_id"] = ev.caller_id;
  o["language"] = ev.language;
  o["code_digest"] = ev.code_digest;
  o["result_digest"] = ev.result_digest;
  o["status"] = to_string(ev.status);
  o["violation"] = ev.violation;
  o["error_code"] = ev.error_code;
  o["duration_ns"] = ev.duration_ns;
  o["sandbox_ns"] = ev.sandbox_ns;
  o["bytes_code"] = static_cast<std::uint64_t>(ev.bytes_code);
  o["bytes_stdout"] = static_cast<std::uint64_t>(ev.bytes_stdout);
  o["bytes_stderr"] = static_cast<std::uint64_t>(ev.bytes_stderr);
  o["truncated_output"] = ev.truncated_output;
  o["memory_used_bytes"] = ev.memory_used_bytes;
  o["translated"] = ev.translated;
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  std::uint64_t counts[kBuckets];
  for (std::size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target && cumulative > 0) {
      // Midpoint of [2^(i-1), 2^i) us; bucket 0 is [0, 1us).
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(256);
  out += "{\"count\":";
  out += std::to_string(count());
  append_fixed(out, "mean_us", mean_us(), "%.2f");
  const double p50 = percentile(0.50);
  const double p95 = percentile(0.95);
  const double p99 = percentile(0.99);
  append_fixed(out, "p50_ms", p50 / 1000.0, "%.3f");
  append_fixed(out, "p95_ms", p95 / 1000.0, "%.3f");
  append_fixed(out, "p99_ms", p99 / 1000.0, "%.3f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_execution(const ExecutionEvent& ev) {
  if (!ev.violation.empty()) {
    if (ev.violation == to_string(PolicyViolationKind::unsupported_language)) {
      rejected_unsupported_language.fetch_add(1, std::memory_order_relaxed);
    } else if (ev.violation == to_string(PolicyViolationKind::code_too_large)) {
      rejected_code_too_large.fetch_add(1, std::memory_order_relaxed);
    } else if (ev.violation == to_string(PolicyViolationKind::forbidden_construct)) {
      rejected_forbidden_construct.fetch_add(1, std::memory_order_relaxed);
    } else {
      rejected_rate_limited.fetch_add(1, std::memory_order_relaxed);
    }
  } else {
    total_executions.fetch_add(1, std::memory_order_relaxed);
    switch (ev.status) {
      case ExecutionStatus::completed:
        completed.fetch_add(1, std::memory_order_relaxed);
        break;
      case ExecutionStatus::timed_out:
        timed_out.fetch_add(1, std::memory_order_relaxed);
        break;
      case ExecutionStatus::cancelled:
        cancelled.fetch_add(1, std::memory_order_relaxed);
        break;
      case ExecutionStatus::rejected_by_policy:
        sandbox_rejections.fetch_add(1, std::memory_order_relaxed);
        break;
      default:
        failed.fetch_add(1, std::memory_order_relaxed);
        break;
    }
    if (ev.truncated_output) truncated_outputs.fetch_add(1, std::memory_order_relaxed);
    if (ev.translated) translated_runs.fetch_add(1, std::memory_order_relaxed);
    atomic_max(peak_memory_bytes_max, ev.memory_used_bytes);
    latency_histogram.record(ev.duration_ns);
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

void EngineStats::record_environment_failure(ErrorCode) {
  environment_failures.fetch_add(1, std::memory_order_relaxed);
}

std::vector<ExecutionEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  std::vector<ExecutionEvent> out;
  out.reserve(ring_buffer_.size());
  for (std::size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

void EngineStats::reset() {
  for (auto* c : {&total_executions, &completed, &failed, &timed_out, &cancelled,
                  &sandbox_rejections, &rejected_unsupported_language, &rejected_code_too_large,
                  &rejected_forbidden_construct, &rejected_rate_limited, &environment_failures,
                  &truncated_outputs, &translated_runs, &peak_memory_bytes_max}) {
    c->store(0, std::memory_order_relaxed);
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string EngineStats::to_json() const {
  auto n = [](const std::atomic<std::uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  const std::uint64_t total = total_executions.load(std::memory_order_relaxed);
  const double success_rate =
      total > 0 ? static_cast<double>(completed.load(std::memory_order_relaxed)) /
                      static_cast<double>(total)
                : 0.0;

  std::string out;
  out.reserve(768);
  out += "{\"total_executions\":" + n(total_executions);
  out += ",\"by_status\":{\"completed\":" + n(completed);
  out += ",\"failed\":" + n(failed);
  out += ",\"timed_out\":" + n(timed_out);
  out += ",\"cancelled\":" + n(cancelled);
  out += ",\"rejected_by_policy\":" + n(sandbox_rejections);
  out += "}";
  append_fixed(out, "success_rate", success_rate, "%.6f");
  out += ",\"rejections\":{\"unsupported_language\":" + n(rejected_unsupported_language);
  out += ",\"code_too_large\":" + n(rejected_code_too_large);
  out += ",\"forbidden_construct\":" + n(rejected_forbidden_construct);
  out += ",\"rate_limited\":" + n(rejected_rate_limited);
  out += "}";
  out += ",\"environment_failures\":" + n(environment_failures);
  out += ",\"truncated_outputs\":" + n(truncated_outputs);
  out += ",\"translated_runs\":" + n(translated_runs);
  out += ",\"peak_memory_bytes_max\":" + n(peak_memory_bytes_max);
  out += ",\"latency\":";
  out += latency_histogram.to_json();
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

void set_execution_event_hook(ExecutionEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_path_mu);
  g_log_path = path;
}

void emit_execution_event(const ExecutionEvent& ev) {
  global_engine_stats().record_execution(ev);

  if (ExecutionEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  const std::string log_path = configured_log_path();
  if (log_path.empty()) return;

  const std::string line = event_to_json(ev) + "\n";
  // O_APPEND keeps concurrent short lines whole.
  if (FILE* f = std::fopen(log_path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

void emit_rejection_event(const ExecutionRequest& request, const CallerIdentity& caller,
                          const PolicyViolation& violation) {
  ExecutionEvent ev;
  ev.request_id = request.id;
  ev.caller_id = caller.id;
  ev.language = to_string(request.language);
  ev.code_digest = code_digest(request.language, request.code);
  ev.status = ExecutionStatus::rejected_by_policy;
  ev.violation = to_string(violation.kind);
  ev.bytes_code = request.code.size();
  emit_execution_event(ev);
}

}  // namespace codelab

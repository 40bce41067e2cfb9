#pragma once

// codelab/session.hpp — Aggregate accounting over a sequence of executions.
//
// A session is append-only while active and frozen once closed. record() calls
// are serialized by a per-session mutex and applied in completion order, so
// several executions belonging to one session may be in flight at once.
//
// Misuse (recording into a closed or unknown session, recording a result that
// has not reached a terminal status, closing twice) throws
// PreconditionViolation. There is no legitimate path that does any of these.

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "codelab/types.hpp"

namespace codelab {

struct SessionHandle {
  std::uint64_t value{0};
  bool operator==(const SessionHandle&) const = default;
};

struct SessionSummary {
  std::string id;
  SystemTime started_at{};
  std::optional<SystemTime> ended_at;
  std::uint64_t total_executions{0};
  std::uint64_t successful_executions{0};
  std::uint64_t failed_executions{0};
  std::chrono::microseconds total_execution_time{0};
  bool is_active{true};

  // successful / total, 0.0 for an empty session.
  double success_rate() const;
};

std::string summary_to_json(const SessionSummary& s);

class ExecutionSession {
 public:
  ExecutionSession();

  // Completed counts as a success, every other terminal status as a failure.
  void record(const ExecutionResult& result);
  SessionSummary close();
  SessionSummary snapshot() const;

  bool is_active() const;
  std::string id() const;

 private:
  mutable std::mutex mu_;
  SessionSummary state_;
};

class SessionRegistry {
 public:
  SessionHandle open();
  void record(SessionHandle handle, const ExecutionResult& result);
  SessionSummary close(SessionHandle handle);
  SessionSummary summary(SessionHandle handle) const;

  // Active sessions, in the order they were opened.
  std::vector<SessionSummary> open_sessions() const;
  // Open sessions held by the registry.
  std::size_t size() const;
  std::size_t closed_size() const;

  // Closing a session releases it; its frozen summary stays answerable (and
  // a second close still reports session_closed) for the most recent
  // kMaxClosedSummaries closes. Older handles become unknown.
  static constexpr std::size_t kMaxClosedSummaries = 1024;

 private:
  std::shared_ptr<ExecutionSession> find(SessionHandle handle) const;
  void check_not_closed_locked(SessionHandle handle) const;

  mutable std::mutex mu_;
  std::uint64_t next_handle_{1};
  std::map<std::uint64_t, std::shared_ptr<ExecutionSession>> sessions_;
  std::map<std::uint64_t, SessionSummary> closed_;
  std::deque<std::uint64_t> closed_order_;  // oldest first
};

}  // namespace codelab

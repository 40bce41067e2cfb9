#include "codelab/session.hpp"

#include "codelab/jsonlite.hpp"

namespace codelab {

double SessionSummary::success_rate() const {
  if (total_executions == 0) return 0.0;
  return static_cast<double>(successful_executions) / static_cast<double>(total_executions);
}

std::string summary_to_json(const SessionSummary& s) {
  jsonlite::Object o;
  o["id"] = s.id;
  o["started_at_ms"] = to_unix_ms(s.started_at);
  o["ended_at_ms"] = s.ended_at ? jsonlite::Value(to_unix_ms(*s.ended_at)) : jsonlite::Value();
  o["total_executions"] = s.total_executions;
  o["successful_executions"] = s.successful_executions;
  o["failed_executions"] = s.failed_executions;
  o["total_execution_time_us"] = static_cast<std::uint64_t>(s.total_execution_time.count());
  o["is_active"] = s.is_active;
  o["success_rate"] = s.success_rate();
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// ExecutionSession
// ---------------------------------------------------------------------------

ExecutionSession::ExecutionSession() {
  state_.id = generate_uuid();
  state_.started_at = std::chrono::system_clock::now();
}

void ExecutionSession::record(const ExecutionResult& result) {
  if (!is_terminal(result.status)) {
    throw PreconditionViolation(ErrorCode::invalid_request,
                                "cannot record a result in status " + to_string(result.status));
  }
  std::lock_guard<std::mutex> lk(mu_);
  if (!state_.is_active) {
    throw PreconditionViolation(ErrorCode::session_closed,
                                "session " + state_.id + " is closed");
  }
  ++state_.total_executions;
  if (result.status == ExecutionStatus::completed) {
    ++state_.successful_executions;
  } else {
    ++state_.failed_executions;
  }
  state_.total_execution_time += std::chrono::microseconds(result.wall_time_us);
}

SessionSummary ExecutionSession::close() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!state_.is_active) {
    throw PreconditionViolation(ErrorCode::session_closed,
                                "session " + state_.id + " is already closed");
  }
  state_.is_active = false;
  state_.ended_at = std::chrono::system_clock::now();
  return state_;
}

SessionSummary ExecutionSession::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

bool ExecutionSession::is_active() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_.is_active;
}

std::string ExecutionSession::id() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_.id;
}

// ---------------------------------------------------------------------------
// SessionRegistry
// ---------------------------------------------------------------------------

SessionHandle SessionRegistry::open() {
  std::lock_guard<std::mutex> lk(mu_);
  const SessionHandle h{next_handle_++};
  sessions_.emplace(h.value, std::make_shared<ExecutionSession>());
  return h;
}

void SessionRegistry::check_not_closed_locked(SessionHandle handle) const {
  if (closed_.contains(handle.value)) {
    throw PreconditionViolation(ErrorCode::session_closed,
                                "session " + std::to_string(handle.value) + " is closed");
  }
}

std::shared_ptr<ExecutionSession> SessionRegistry::find(SessionHandle handle) const {
  std::lock_guard<std::mutex> lk(mu_);
  check_not_closed_locked(handle);
  auto it = sessions_.find(handle.value);
  if (it == sessions_.end()) {
    throw PreconditionViolation(ErrorCode::session_unknown,
                                "unknown session handle " + std::to_string(handle.value));
  }
  return it->second;
}

// The registry lock is released before the session lock is taken, so a slow
// record() on one session never blocks others.
void SessionRegistry::record(SessionHandle handle, const ExecutionResult& result) {
  find(handle)->record(result);
}

SessionSummary SessionRegistry::close(SessionHandle handle) {
  // Throws session_closed if another thread closed it first.
  SessionSummary summary = find(handle)->close();
  std::lock_guard<std::mutex> lk(mu_);
  sessions_.erase(handle.value);
  closed_.emplace(handle.value, summary);
  closed_order_.push_back(handle.value);
  while (closed_order_.size() > kMaxClosedSummaries) {
    closed_.erase(closed_order_.front());
    closed_order_.pop_front();
  }
  return summary;
}

SessionSummary SessionRegistry::summary(SessionHandle handle) const {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = closed_.find(handle.value);
    if (it != closed_.end()) return it->second;
  }
  return find(handle)->snapshot();
}

std::vector<SessionSummary> SessionRegistry::open_sessions() const {
  std::vector<std::shared_ptr<ExecutionSession>> all;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [h, s] : sessions_) all.push_back(s);
  }
  std::vector<SessionSummary> out;
  for (const auto& s : all) {
    SessionSummary snap = s->snapshot();
    if (snap.is_active) out.push_back(std::move(snap));
  }
  return out;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.size();
}

std::size_t SessionRegistry::closed_size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_.size();
}

}  // namespace codelab

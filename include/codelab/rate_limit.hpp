#pragma once

// codelab/rate_limit.hpp — Sliding-window attempt counter per caller.
//
// Only attempted runs are recorded: the pipeline calls try_record_attempt()
// after a request has passed validate_request(), never for a rejected one.
// try_record_attempt() re-checks both caps and records under the same lock, so
// concurrent submissions from one caller cannot overshoot a cap.
// Thread-safe; one mutex guards all callers. Callers whose attempts have all
// aged out are forgotten.

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "codelab/policy.hpp"

namespace codelab {

class RateCounter final : public RateCounterView {
 public:
  using Clock = std::chrono::steady_clock;

  void record_attempt(const CallerIdentity& caller, Clock::time_point at = Clock::now());

  // Records only when the caller is below both caps; otherwise returns the
  // rate_limited violation and records nothing.
  std::optional<PolicyViolation> try_record_attempt(const CallerIdentity& caller,
                                                    std::uint64_t per_minute_cap,
                                                    std::uint64_t per_hour_cap,
                                                    Clock::time_point at = Clock::now());

  std::uint64_t executions_in_last_minute(const CallerIdentity& caller) const override;
  std::uint64_t executions_in_last_hour(const CallerIdentity& caller) const override;

  std::uint64_t count_within(const CallerIdentity& caller, Clock::duration window,
                             Clock::time_point now) const;

  std::size_t tracked_callers() const;
  // Drops attempts older than an hour and callers left with none. Returns the
  // number of callers still tracked. Also runs every kSweepInterval records.
  std::size_t prune(Clock::time_point now = Clock::now());
  void clear();

  static constexpr std::uint64_t kSweepInterval = 256;

 private:
  void insert_locked(const std::string& id, Clock::time_point at);
  void prune_locked(Clock::time_point now);

  mutable std::mutex mu_;
  // Oldest first. Entries older than an hour are dropped on the next record.
  std::map<std::string, std::deque<Clock::time_point>> attempts_;
  std::uint64_t records_since_sweep_{0};
};

}  // namespace codelab

#include "codelab/rate_limit.hpp"

#include <algorithm>
#include <iterator>

namespace codelab {

namespace {
constexpr auto kMinute = std::chrono::minutes(1);
constexpr auto kHour = std::chrono::hours(1);
}  // namespace

void RateCounter::insert_locked(const std::string& id, Clock::time_point at) {
  auto& q = attempts_[id];
  while (!q.empty() && at - q.front() >= kHour) q.pop_front();
  // Keep the deque sorted even when callers pass explicit timestamps.
  q.insert(std::upper_bound(q.begin(), q.end(), at), at);
  if (++records_since_sweep_ >= kSweepInterval) prune_locked(at);
}

void RateCounter::prune_locked(Clock::time_point now) {
  records_since_sweep_ = 0;
  for (auto it = attempts_.begin(); it != attempts_.end();) {
    auto& q = it->second;
    while (!q.empty() && now - q.front() >= kHour) q.pop_front();
    it = q.empty() ? attempts_.erase(it) : std::next(it);
  }
}

void RateCounter::record_attempt(const CallerIdentity& caller, Clock::time_point at) {
  std::lock_guard<std::mutex> lk(mu_);
  insert_locked(caller.id, at);
}

std::optional<PolicyViolation> RateCounter::try_record_attempt(const CallerIdentity& caller,
                                                               std::uint64_t per_minute_cap,
                                                               std::uint64_t per_hour_cap,
                                                               Clock::time_point at) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = attempts_.find(caller.id);
  if (it != attempts_.end()) {
    const auto& q = it->second;
    const auto in_window = [&](Clock::duration window) {
      const auto first = std::upper_bound(q.begin(), q.end(), at - window);
      return static_cast<std::uint64_t>(std::distance(first, q.end()));
    };
    const std::uint64_t per_minute = in_window(kMinute);
    if (per_minute >= per_minute_cap) return rate_limit_violation("minute", per_minute, per_minute_cap);
    const std::uint64_t per_hour = in_window(kHour);
    if (per_hour >= per_hour_cap) return rate_limit_violation("hour", per_hour, per_hour_cap);
  }
  insert_locked(caller.id, at);
  return std::nullopt;
}

std::uint64_t RateCounter::count_within(const CallerIdentity& caller, Clock::duration window,
                                        Clock::time_point now) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = attempts_.find(caller.id);
  if (it == attempts_.end()) return 0;
  const auto& q = it->second;
  const auto first = std::upper_bound(q.begin(), q.end(), now - window);
  return static_cast<std::uint64_t>(std::distance(first, q.end()));
}

std::uint64_t RateCounter::executions_in_last_minute(const CallerIdentity& caller) const {
  return count_within(caller, kMinute, Clock::now());
}

std::uint64_t RateCounter::executions_in_last_hour(const CallerIdentity& caller) const {
  return count_within(caller, kHour, Clock::now());
}

std::size_t RateCounter::tracked_callers() const {
  std::lock_guard<std::mutex> lk(mu_);
  return attempts_.size();
}

std::size_t RateCounter::prune(Clock::time_point now) {
  std::lock_guard<std::mutex> lk(mu_);
  prune_locked(now);
  return attempts_.size();
}

void RateCounter::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  attempts_.clear();
  records_since_sweep_ = 0;
}

}  // namespace codelab

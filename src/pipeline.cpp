#include "codelab/pipeline.hpp"

#include "codelab/observability.hpp"

namespace codelab {

ExecutionPipeline::ExecutionPipeline(std::shared_ptr<const SecurityPolicy> policy,
                                     Executor& executor, RateCounter& rate_counter,
                                     SessionRegistry* sessions)
    : policy_(policy ? std::move(policy) : std::make_shared<const SecurityPolicy>()),
      executor_(executor),
      rate_counter_(rate_counter),
      sessions_(sessions) {}

Submission ExecutionPipeline::submit(const ExecutionRequest& request, const CallerIdentity& caller,
                                     std::optional<SessionHandle> session,
                                     const CancellationToken* cancel) {
  Submission out;
  if (session && !sessions_) {
    throw PreconditionViolation(ErrorCode::session_unknown,
                                "pipeline has no session registry");
  }
  // Reject misuse before anything runs.
  if (session && !sessions_->summary(*session).is_active) {
    throw PreconditionViolation(ErrorCode::session_closed, "session is closed");
  }

  out.violation = validate_request(request, *policy_, rate_counter_, caller);
  if (out.violation) {
    out.result.status = ExecutionStatus::rejected_by_policy;
    out.result.stderr_text = out.violation->detail;
    emit_rejection_event(request, caller, *out.violation);
    return out;
  }

  // A concurrent submission may have taken the last slot since validation.
  out.violation = rate_counter_.try_record_attempt(caller, policy_->max_executions_per_minute,
                                                   policy_->max_executions_per_hour);
  if (out.violation) {
    out.result.status = ExecutionStatus::rejected_by_policy;
    out.result.stderr_text = out.violation->detail;
    emit_rejection_event(request, caller, *out.violation);
    return out;
  }

  out.result = executor_.execute(request, cancel);
  if (session) sessions_->record(*session, out.result);
  return out;
}

}  // namespace codelab

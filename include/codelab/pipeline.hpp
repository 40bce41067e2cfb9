#pragma once

// codelab/pipeline.hpp — validate, count, execute, record.
//
// submit():
//   1. validate_request() against the policy snapshot and the rate counter;
//      a violation produces a RejectedByPolicy result, emits a rejection
//      event and returns without touching the executor or the counter;
//   2. record the attempt for the caller;
//   3. Executor::execute();
//   4. record the result into the session, when one is given.
//
// EngineError from the executor propagates unchanged; the attempt stays
// counted and nothing is recorded into the session.

#include <memory>
#include <optional>

#include "codelab/executor.hpp"
#include "codelab/policy.hpp"
#include "codelab/rate_limit.hpp"
#include "codelab/session.hpp"

namespace codelab {

struct Submission {
  ExecutionResult result;
  std::optional<PolicyViolation> violation;
};

class ExecutionPipeline {
 public:
  ExecutionPipeline(std::shared_ptr<const SecurityPolicy> policy, Executor& executor,
                    RateCounter& rate_counter, SessionRegistry* sessions = nullptr);

  Submission submit(const ExecutionRequest& request, const CallerIdentity& caller,
                    std::optional<SessionHandle> session = std::nullopt,
                    const CancellationToken* cancel = nullptr);

  const SecurityPolicy& policy() const { return *policy_; }

 private:
  std::shared_ptr<const SecurityPolicy> policy_;
  Executor& executor_;
  RateCounter& rate_counter_;
  SessionRegistry* sessions_;
};

}  // namespace codelab

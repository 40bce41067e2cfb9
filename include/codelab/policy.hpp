#pragma once

// codelab/policy.hpp — Pre-execution policy gate.
//
// validate_request() is a pure function of its inputs: it never records a rate
// attempt and never touches the executor. Checks run in a fixed order and stop
// at the first violation:
//   1. language allowed
//   2. code size within limits.max_code_bytes
//   3. lexical scan for blocked imports and blocked call-style tokens
//   4. per-caller minute and hour rate caps
//
// The scan in step 3 is lexical only. Comments and string literals are skipped,
// but names are not resolved: `import os as o` is caught, while
// `m = __builtins__; getattr(m, "ev" + "al")` is not. Aliasing through
// assignment is a known false negative.

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "codelab/jsonlite.hpp"
#include "codelab/types.hpp"

namespace codelab {

struct SecurityPolicy {
  std::set<std::string> blocked_imports{"os", "sys", "subprocess", "importlib"};
  std::set<std::string> blocked_functions{"eval", "exec", "open", "__import__"};
  std::set<LanguageId> allowed_languages{LanguageId::jac, LanguageId::py};
  bool sandboxing_enabled{true};
  bool network_access_enabled{false};
  std::uint64_t max_executions_per_minute{60};
  std::uint64_t max_executions_per_hour{1000};
};

enum class PolicyViolationKind {
  unsupported_language,
  code_too_large,
  forbidden_construct,
  rate_limited,
};

std::string to_string(PolicyViolationKind kind);

struct PolicyViolation {
  PolicyViolationKind kind;
  std::string name;    // offending import/function for forbidden_construct
  std::string detail;  // human-readable
};

// Read side of the rate counter, as seen by the validator.
class RateCounterView {
 public:
  virtual ~RateCounterView() = default;
  virtual std::uint64_t executions_in_last_minute(const CallerIdentity& caller) const = 0;
  virtual std::uint64_t executions_in_last_hour(const CallerIdentity& caller) const = 0;
};

// Violation for a caller already at `cap` runs inside `window` ("minute" or "hour").
PolicyViolation rate_limit_violation(const std::string& window, std::uint64_t count,
                                     std::uint64_t cap);

std::optional<PolicyViolation> validate_request(const ExecutionRequest& request,
                                                const SecurityPolicy& policy,
                                                const RateCounterView& rate_state,
                                                const CallerIdentity& caller);

// Step 3 on its own. Returns the first forbidden construct in source order.
std::optional<PolicyViolation> scan_forbidden_constructs(const std::string& code,
                                                         LanguageId language,
                                                         const SecurityPolicy& policy);

std::string violation_to_json(const PolicyViolation& v);

jsonlite::Object policy_to_object(const SecurityPolicy& policy);

// Reads the fields present in obj over a default policy. Unknown languages and
// wrongly typed fields are reported through *errors (when non-null).
SecurityPolicy policy_from_object(const jsonlite::Object& obj, std::vector<std::string>* errors);

}  // namespace codelab

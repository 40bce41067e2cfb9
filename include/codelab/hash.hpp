#pragma once

#include <string>
#include <string_view>

#include "codelab/types.hpp"

namespace codelab {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// BLAKE3-256, lower-case hex (64 chars).
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated digest: BLAKE3(domain || payload).
std::string hash_domain(std::string_view domain, std::string_view payload);

// Fingerprint of a submitted program. Execution events carry this instead of
// the program text. Language is part of the domain so identical text submitted
// as JAC and as PY yields different digests.
std::string code_digest(LanguageId language, std::string_view code);

// Fingerprint of what a run produced (status, return code, both streams).
// Timing fields are excluded, so two runs of a deterministic program match.
std::string result_digest(const ExecutionResult& result);

}  // namespace codelab

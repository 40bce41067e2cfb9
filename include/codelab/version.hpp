#pragma once

// codelab/version.hpp — Version manifest for every surface an embedder sees.
//
// All constants are compile-time. codelab_init() calls check_compatibility()
// and refuses to start on an ABI mismatch. Any change to a JSON document
// shape listed here requires bumping its constant.

#include <cstdint>
#include <string>

namespace codelab {
namespace version {

// Bump when c_api.h changes binary shape or semantics.
constexpr std::uint32_t ENGINE_ABI_VERSION = 1;

// 1 = BLAKE3-256, lower-case hex.
constexpr std::uint32_t HASH_ALGORITHM_VERSION = 1;

// Request/result JSON accepted and produced by the CLI and the C ABI.
constexpr std::uint32_t REQUEST_FORMAT_VERSION = 1;

// One JSON object per line, see event_to_json().
constexpr std::uint32_t EVENT_LOG_VERSION = 1;

// Rows of translator grammar_table(). Bump when a row is added or changed.
constexpr std::uint32_t GRAMMAR_VERSION = 1;

struct VersionManifest {
  std::uint32_t engine_abi{ENGINE_ABI_VERSION};
  std::uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::uint32_t request_format{REQUEST_FORMAT_VERSION};
  std::uint32_t event_log{EVENT_LOG_VERSION};
  std::uint32_t grammar{GRAMMAR_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");

std::string manifest_to_json(const VersionManifest& m);

// Never throws. On mismatch ok is false and description says what to rebuild.
struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
  std::uint32_t required_abi{ENGINE_ABI_VERSION};
  std::uint32_t actual_abi{ENGINE_ABI_VERSION};
};

CompatibilityResult check_compatibility(std::uint32_t caller_abi_version = ENGINE_ABI_VERSION);

}  // namespace version
}  // namespace codelab

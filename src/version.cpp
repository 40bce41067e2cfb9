#include "codelab/version.hpp"

#include <sstream>

#include "codelab/hash.hpp"

#ifndef CODELAB_VERSION
#define CODELAB_VERSION "0.1.0"
#endif

namespace codelab {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver = engine_semver.empty() ? CODELAB_VERSION : engine_semver;
  m.hash_primitive = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_abi\":" << m.engine_abi
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"request_format\":" << m.request_format
    << ",\"event_log\":" << m.event_log
    << ",\"grammar\":" << m.grammar
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(std::uint32_t caller_abi_version) {
  CompatibilityResult r;
  if (caller_abi_version != ENGINE_ABI_VERSION) {
    r.ok = false;
    r.error_code = "abi_version_mismatch";
    r.description = "Caller ABI version " + std::to_string(caller_abi_version) +
                    " != engine ABI version " + std::to_string(ENGINE_ABI_VERSION) +
                    ". Rebuild the caller against the current codelab headers.";
    r.actual_abi = caller_abi_version;
  }
  return r;
}

}  // namespace version
}  // namespace codelab

#include "codelab/hash.hpp"

// BLAKE3 is the only hash primitive. Domain prefixes:
//   "code:jac:" / "code:py:"  submitted program text
//   "res:"                     run outcome (no timing)

#include <array>

extern "C" {
#include <blake3.h>
}

namespace codelab {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

// Length-prefix a field so "ab"+"c" and "a"+"bc" hash differently.
void update_field(blake3_hasher& h, std::string_view field) {
  const std::string len = std::to_string(field.size()) + ":";
  blake3_hasher_update(&h, len.data(), len.size());
  blake3_hasher_update(&h, field.data(), field.size());
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string code_digest(LanguageId language, std::string_view code) {
  const std::string domain = "code:" + to_string(language) + ":";
  return hash_domain(domain, code);
}

std::string result_digest(const ExecutionResult& result) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  const std::string_view domain = "res:";
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  update_field(hasher, to_string(result.status));
  update_field(hasher, result.return_code ? std::to_string(*result.return_code) : "null");
  update_field(hasher, result.truncated_output ? "1" : "0");
  update_field(hasher, result.stdout_text);
  update_field(hasher, result.stderr_text);
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace codelab

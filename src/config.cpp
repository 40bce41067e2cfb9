#include "codelab/config.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

#include "codelab/hash.hpp"
#include "codelab/jsonlite.hpp"

namespace codelab {

namespace {

// Below this the interpreter itself may fail to start under RLIMIT_AS.
constexpr std::uint64_t kMinSensibleMemoryBytes = 32ull * 1024 * 1024;

const std::set<std::string> kTopLevelKeys = {"config_version", "policy",         "limits",
                                             "interpreters",   "workspace_root", "event_log_path"};

const char* env_or_null(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

// Reads an optional positive integer field. Absent: nullopt. Present but
// wrong: reported, nullopt.
std::optional<std::uint64_t> read_positive(const jsonlite::Object& obj, const std::string& key,
                                           const std::string& where,
                                           std::vector<std::string>* errors) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  const auto* n = std::get_if<std::uint64_t>(&it->second.v);
  if (!n || *n == 0) {
    if (errors) errors->push_back(where + key + " must be a positive integer");
    return std::nullopt;
  }
  return *n;
}

LimitOverride read_limit_override(const jsonlite::Object& obj, const std::string& where,
                                  std::vector<std::string>* errors) {
  LimitOverride o;
  o.max_execution_time_ms = read_positive(obj, "max_execution_time_ms", where, errors);
  o.max_memory_bytes = read_positive(obj, "max_memory_bytes", where, errors);
  o.max_output_bytes = read_positive(obj, "max_output_bytes", where, errors);
  o.max_code_bytes = read_positive(obj, "max_code_bytes", where, errors);
  return o;
}

jsonlite::Object limits_to_object(const ResourceLimits& l) {
  jsonlite::Object o;
  o["max_execution_time_ms"] = l.max_execution_time_ms();
  o["max_memory_bytes"] = l.max_memory_bytes();
  o["max_output_bytes"] = l.max_output_bytes();
  o["max_code_bytes"] = l.max_code_bytes();
  return o;
}

bool wrong_type_string(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && !std::holds_alternative<std::string>(it->second.v);
}

bool wrong_type_object(const jsonlite::Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && !std::holds_alternative<jsonlite::Object>(it->second.v);
}

}  // namespace

EngineConfig config_from_json(const std::string& json, std::vector<std::string>* errors) {
  EngineConfig cfg;
  auto report = [&](const std::string& msg) {
    if (errors) errors->push_back(msg);
  };

  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(json, &err);
  if (err) {
    report(err->code + ": " + err->message);
    return cfg;
  }

  for (const char* key : {"policy", "limits", "interpreters"}) {
    if (wrong_type_object(doc, key)) report(std::string(key) + " must be an object");
  }
  for (const char* key : {"config_version", "workspace_root", "event_log_path"}) {
    if (wrong_type_string(doc, key)) report(std::string(key) + " must be a string");
  }

  cfg.policy = policy_from_object(jsonlite::get_object(doc, "policy"), errors);

  const jsonlite::Object limits = jsonlite::get_object(doc, "limits");
  const LimitOverride o = read_limit_override(limits, "limits.", errors);
  const ResourceLimits d = ResourceLimits::defaults();
  // Config limits replace the defaults outright; only requests are clamped.
  cfg.default_limits = ResourceLimits(o.max_execution_time_ms.value_or(d.max_execution_time_ms()),
                                      o.max_memory_bytes.value_or(d.max_memory_bytes()),
                                      o.max_output_bytes.value_or(d.max_output_bytes()),
                                      o.max_code_bytes.value_or(d.max_code_bytes()));

  const jsonlite::Object interp = jsonlite::get_object(doc, "interpreters");
  if (wrong_type_string(interp, "python")) report("interpreters.python must be a string");
  if (wrong_type_string(interp, "jac")) report("interpreters.jac must be a string");
  cfg.python_path = jsonlite::get_string(interp, "python");
  cfg.jac_path = jsonlite::get_string(interp, "jac");
  cfg.jac_translate_fallback = jsonlite::get_bool(interp, "jac_translate_fallback", true);

  cfg.workspace_root = jsonlite::get_string(doc, "workspace_root");
  cfg.event_log_path = jsonlite::get_string(doc, "event_log_path");
  return cfg;
}

EngineConfig load_config_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw EngineError(ErrorCode::invalid_request, "cannot read config file: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  std::vector<std::string> errors;
  EngineConfig cfg = config_from_json(ss.str(), &errors);
  if (!errors.empty()) {
    throw EngineError(ErrorCode::invalid_request, "invalid config " + path + ": " + errors.front());
  }
  return cfg;
}

void apply_env_overrides(EngineConfig& config) {
  if (const char* v = env_or_null("CODELAB_PYTHON")) config.python_path = v;
  if (const char* v = env_or_null("CODELAB_JAC")) config.jac_path = v;
  if (const char* v = env_or_null("CODELAB_WORKSPACE")) config.workspace_root = v;
  if (const char* v = env_or_null("CODELAB_EVENT_LOG")) config.event_log_path = v;
  if (const char* v = env_or_null("CODELAB_SANDBOX_DISABLED")) {
    if (std::string(v) == "1") config.policy.sandboxing_enabled = false;
  }
}

ExecutorConfig to_executor_config(const EngineConfig& config) {
  ExecutorConfig e;
  e.policy = std::make_shared<const SecurityPolicy>(config.policy);
  e.default_limits = config.default_limits;
  e.python_path = config.python_path;
  e.jac_path = config.jac_path;
  e.jac_translate_fallback = config.jac_translate_fallback;
  e.workspace_root = config.workspace_root;
  return e;
}

std::string config_to_json(const EngineConfig& config) {
  jsonlite::Object interp;
  interp["python"] = config.python_path;
  interp["jac"] = config.jac_path;
  interp["jac_translate_fallback"] = config.jac_translate_fallback;

  jsonlite::Object o;
  o["config_version"] = kConfigVersion;
  o["policy"] = policy_to_object(config.policy);
  o["limits"] = limits_to_object(config.default_limits);
  o["interpreters"] = std::move(interp);
  o["workspace_root"] = config.workspace_root;
  o["event_log_path"] = config.event_log_path;
  return jsonlite::to_json(o);
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  r.config_version = jsonlite::get_string(doc, "config_version");
  if (r.config_version.empty()) {
    r.warnings.push_back("config_version missing, assuming " + std::string(kConfigVersion));
    r.config_version = kConfigVersion;
  } else if (r.config_version != kConfigVersion) {
    r.errors.push_back("unsupported config_version: " + r.config_version);
  }
  for (const auto& [key, value] : doc) {
    if (!kTopLevelKeys.contains(key)) r.warnings.push_back("unknown key ignored: " + key);
  }

  const EngineConfig cfg = config_from_json(config_json, &r.errors);

  if (cfg.policy.allowed_languages.empty()) {
    r.warnings.push_back("policy.allowed_languages is empty: every request will be rejected");
  }
  if (cfg.policy.max_executions_per_hour < cfg.policy.max_executions_per_minute) {
    r.warnings.push_back("policy.max_executions_per_hour is below max_executions_per_minute");
  }
  if (!cfg.policy.sandboxing_enabled) {
    r.warnings.push_back("policy.sandboxing_enabled is false: programs run without isolation");
  }
  if (cfg.default_limits.max_memory_bytes() < kMinSensibleMemoryBytes) {
    r.warnings.push_back("limits.max_memory_bytes below " +
                         std::to_string(kMinSensibleMemoryBytes) +
                         " may stop the interpreter from starting");
  }
  if (cfg.jac_path.empty() && !cfg.jac_translate_fallback &&
      cfg.policy.allowed_languages.contains(LanguageId::jac)) {
    r.warnings.push_back("JAC is allowed but has no interpreter and no translation fallback");
  }

  r.ok = r.errors.empty();
  return r;
}

std::optional<ExecutionRequest> parse_request_json(const std::string& json,
                                                   const ResourceLimits& defaults,
                                                   std::string* error) {
  auto fail = [&](const std::string& msg) -> std::optional<ExecutionRequest> {
    if (error) *error = msg;
    return std::nullopt;
  };

  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(json, &err);
  if (err) return fail(err->code + ": " + err->message);

  const auto lang_name = jsonlite::get_optional_string(doc, "language");
  if (!lang_name) return fail("language is required");
  const auto lang = parse_language(*lang_name);
  if (!lang) return fail("unknown language: " + *lang_name);
  const auto code = jsonlite::get_optional_string(doc, "code");
  if (!code) return fail("code is required");
  if (wrong_type_string(doc, "stdin")) return fail("stdin must be a string");
  if (wrong_type_object(doc, "limits")) return fail("limits must be an object");

  std::vector<std::string> limit_errors;
  const LimitOverride o = read_limit_override(jsonlite::get_object(doc, "limits"), "limits.",
                                              &limit_errors);
  if (!limit_errors.empty()) return fail(limit_errors.front());

  ExecutionRequest req = make_request(*lang, *code, defaults.tightened_by(o));
  if (auto id = jsonlite::get_optional_string(doc, "id")) {
    if (id->empty()) return fail("id must not be empty");
    req.id = *id;
  }
  req.stdin_text = jsonlite::get_optional_string(doc, "stdin");
  return req;
}

std::string request_to_json(const ExecutionRequest& request) {
  jsonlite::Object o;
  o["id"] = request.id;
  o["language"] = to_string(request.language);
  o["code"] = request.code;
  o["stdin"] = request.stdin_text ? jsonlite::Value(*request.stdin_text) : jsonlite::Value();
  o["limits"] = limits_to_object(request.limits);
  o["submitted_at_ms"] = to_unix_ms(request.submitted_at);
  return jsonlite::to_json(o);
}

std::string result_to_json(const ExecutionRequest& request, const ExecutionResult& result,
                           const std::optional<PolicyViolation>& violation) {
  jsonlite::Object o;
  o["id"] = request.id;
  o["status"] = to_string(result.status);
  o["stdout"] = result.stdout_text;
  o["stderr"] = result.stderr_text;
  o["return_code"] = result.return_code
                         ? (*result.return_code < 0
                                ? jsonlite::Value(static_cast<double>(*result.return_code))
                                : jsonlite::Value(static_cast<std::uint64_t>(*result.return_code)))
                         : jsonlite::Value();
  o["wall_time_us"] = result.wall_time_us;
  o["memory_used"] =
      result.memory_used_bytes ? jsonlite::Value(*result.memory_used_bytes) : jsonlite::Value();
  o["truncated_output"] = result.truncated_output;
  o["code_digest"] = code_digest(request.language, request.code);
  if (violation) {
    jsonlite::Object v;
    v["kind"] = to_string(violation->kind);
    v["name"] = violation->name;
    v["detail"] = violation->detail;
    o["violation"] = std::move(v);
  }
  return jsonlite::to_json(o);
}

}  // namespace codelab

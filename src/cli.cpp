#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "codelab/config.hpp"
#include "codelab/hash.hpp"
#include "codelab/jsonlite.hpp"
#include "codelab/observability.hpp"
#include "codelab/pipeline.hpp"
#include "codelab/sandbox.hpp"
#include "codelab/translator.hpp"
#include "codelab/version.hpp"

#ifndef CODELAB_VERSION
#define CODELAB_VERSION "0.1.0"
#endif

namespace {

// Exit codes: 0 ok, 1 run or check failed, 2 bad input, 3 environment failure.
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitEnvironment = 3;

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  std::stringstream ss;
  ss << ifs.rdbuf();
  *out = ss.str();
  return true;
}

std::string flag_value(int argc, char** argv, int from, const std::string& flag) {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == flag && i + 1 < argc) return argv[i + 1];
  }
  return "";
}

bool has_flag(int argc, char** argv, int from, const std::string& flag) {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == flag) return true;
  }
  return false;
}

// Defaults, then --config, then CODELAB_* overrides.
codelab::EngineConfig load_config(const std::string& path) {
  codelab::EngineConfig cfg;
  if (!path.empty()) cfg = codelab::load_config_file(path);
  codelab::apply_env_overrides(cfg);
  return cfg;
}

void print_usage() {
  std::cerr << "usage: codelab <command>\n"
               "  health\n"
               "  version\n"
               "  exec run --request FILE [--config FILE] [--caller ID]\n"
               "  policy check --request FILE [--config FILE] [--caller ID]\n"
               "  translate --from LANG --to LANG --in FILE [--json]\n"
               "  check --lang LANG --in FILE\n"
               "  config validate --config FILE\n"
               "  config show [--config FILE]\n";
}

std::string json_array(const std::vector<std::string>& items) {
  codelab::jsonlite::Array a;
  for (const auto& s : items) a.push_back(s);
  return codelab::jsonlite::to_json(a);
}

int cmd_health() {
  const auto h = codelab::hash_runtime_info();
  const auto caps = codelab::detect_sandbox_capabilities();
  const std::string python = codelab::find_in_path("python3");
  std::cout << "{\"hash_primitive\":\"" << h.primitive << "\""
            << ",\"hash_version\":\"" << h.version << "\""
            << ",\"sandbox\":{\"process_groups\":" << (caps.process_groups ? "true" : "false")
            << ",\"rlimits\":" << (caps.rlimits ? "true" : "false")
            << ",\"network_namespace\":" << (caps.network_namespace ? "true" : "false")
            << ",\"mount_namespace\":" << (caps.mount_namespace ? "true" : "false") << "}"
            << ",\"python3\":\"" << codelab::jsonlite::escape(python) << "\""
            << "}\n";
  return 0;
}

int cmd_exec_run(int argc, char** argv) {
  const std::string req_file = flag_value(argc, argv, 3, "--request");
  const std::string caller = flag_value(argc, argv, 3, "--caller");
  std::string payload;
  if (req_file.empty() || !read_file(req_file, &payload)) {
    std::cerr << "[exec] cannot read request file: " << req_file << "\n";
    return kExitUsage;
  }

  codelab::EngineConfig cfg = load_config(flag_value(argc, argv, 3, "--config"));
  codelab::set_event_log_path(cfg.event_log_path);

  std::string err;
  const auto req = codelab::parse_request_json(payload, cfg.default_limits, &err);
  if (!req) {
    std::cerr << "[exec] invalid request: " << err << "\n";
    return kExitUsage;
  }

  codelab::ExecutorConfig exec_cfg = codelab::to_executor_config(cfg);
  auto policy = exec_cfg.policy;
  codelab::SandboxExecutor executor(std::move(exec_cfg));
  codelab::RateCounter rate_counter;
  codelab::ExecutionPipeline pipeline(std::move(policy), executor, rate_counter);

  const codelab::Submission sub =
      pipeline.submit(*req, codelab::CallerIdentity{caller.empty() ? "cli" : caller});
  std::cout << codelab::result_to_json(*req, sub.result, sub.violation) << "\n";
  return sub.result.status == codelab::ExecutionStatus::completed ? 0 : kExitFailed;
}

int cmd_policy_check(int argc, char** argv) {
  const std::string req_file = flag_value(argc, argv, 3, "--request");
  const std::string caller = flag_value(argc, argv, 3, "--caller");
  std::string payload;
  if (req_file.empty() || !read_file(req_file, &payload)) {
    std::cerr << "[policy] cannot read request file: " << req_file << "\n";
    return kExitUsage;
  }
  const codelab::EngineConfig cfg = load_config(flag_value(argc, argv, 3, "--config"));
  std::string err;
  const auto req = codelab::parse_request_json(payload, cfg.default_limits, &err);
  if (!req) {
    std::cerr << "[policy] invalid request: " << err << "\n";
    return kExitUsage;
  }
  codelab::RateCounter no_history;
  const auto violation = codelab::validate_request(
      *req, cfg.policy, no_history, codelab::CallerIdentity{caller.empty() ? "cli" : caller});
  std::cout << "{\"ok\":" << (violation ? "false" : "true") << ",\"violation\":"
            << (violation ? codelab::violation_to_json(*violation) : "null") << "}\n";
  return violation ? kExitFailed : 0;
}

int cmd_translate(int argc, char** argv) {
  const auto from = codelab::parse_language(flag_value(argc, argv, 2, "--from"));
  const auto to = codelab::parse_language(flag_value(argc, argv, 2, "--to"));
  const std::string in = flag_value(argc, argv, 2, "--in");
  std::string source;
  if (!from || !to) {
    std::cerr << "[translate] --from and --to must be jac or py\n";
    return kExitUsage;
  }
  if (in.empty() || !read_file(in, &source)) {
    std::cerr << "[translate] cannot read input file: " << in << "\n";
    return kExitUsage;
  }
  const codelab::TranslationResult r = codelab::translate(source, *from, *to);
  if (has_flag(argc, argv, 2, "--json")) {
    std::cout << codelab::translation_to_json(r) << "\n";
  } else {
    if (!r.translated_code.empty()) std::cout << r.translated_code << "\n";
    for (const auto& w : r.warnings) std::cerr << "[translate] warning: " << w << "\n";
    for (const auto& e : r.errors) std::cerr << "[translate] error: " << e << "\n";
  }
  return r.success ? 0 : kExitFailed;
}

int cmd_check(int argc, char** argv) {
  const auto lang = codelab::parse_language(flag_value(argc, argv, 2, "--lang"));
  const std::string in = flag_value(argc, argv, 2, "--in");
  std::string source;
  if (!lang) {
    std::cerr << "[check] --lang must be jac or py\n";
    return kExitUsage;
  }
  if (in.empty() || !read_file(in, &source)) {
    std::cerr << "[check] cannot read input file: " << in << "\n";
    return kExitUsage;
  }
  const auto errors = codelab::check_structure(source, *lang);
  std::cout << "{\"ok\":" << (errors.empty() ? "true" : "false")
            << ",\"errors\":" << json_array(errors) << "}\n";
  return errors.empty() ? 0 : kExitFailed;
}

int cmd_config_validate(int argc, char** argv) {
  const std::string path = flag_value(argc, argv, 3, "--config");
  std::string payload;
  if (path.empty() || !read_file(path, &payload)) {
    std::cerr << "[config] cannot read config file: " << path << "\n";
    return kExitUsage;
  }
  const codelab::ConfigValidationResult r = codelab::validate_config(payload);
  std::cout << "{\"ok\":" << (r.ok ? "true" : "false") << ",\"config_version\":\""
            << codelab::jsonlite::escape(r.config_version) << "\""
            << ",\"errors\":" << json_array(r.errors)
            << ",\"warnings\":" << json_array(r.warnings) << "}\n";
  return r.ok ? 0 : kExitFailed;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    print_usage();
    return kExitUsage;
  }
  const std::string sub = argc >= 3 ? argv[2] : "";

  try {
    if (cmd == "health") return cmd_health();

    if (cmd == "version") {
      std::cout << codelab::version::manifest_to_json(
                       codelab::version::current_manifest(CODELAB_VERSION))
                << "\n";
      return 0;
    }

    if (cmd == "exec" && sub == "run") return cmd_exec_run(argc, argv);
    if (cmd == "policy" && sub == "check") return cmd_policy_check(argc, argv);
    if (cmd == "translate") return cmd_translate(argc, argv);
    if (cmd == "check") return cmd_check(argc, argv);
    if (cmd == "config" && sub == "validate") return cmd_config_validate(argc, argv);

    if (cmd == "config" && sub == "show") {
      std::cout << codelab::config_to_json(load_config(flag_value(argc, argv, 3, "--config")))
                << "\n";
      return 0;
    }
  } catch (const codelab::EngineError& e) {
    std::cerr << "[" << codelab::to_string(e.code()) << "] " << e.what() << "\n";
    return kExitEnvironment;
  }

  print_usage();
  return kExitUsage;
}

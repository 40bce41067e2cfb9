#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "codelab/c_api.h"
#include "codelab/config.hpp"
#include "codelab/executor.hpp"
#include "codelab/hash.hpp"
#include "codelab/jsonlite.hpp"
#include "codelab/observability.hpp"
#include "codelab/pipeline.hpp"
#include "codelab/policy.hpp"
#include "codelab/rate_limit.hpp"
#include "codelab/sandbox.hpp"
#include "codelab/session.hpp"
#include "codelab/translator.hpp"
#include "codelab/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;
std::string g_skip_reason;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

// A test that cannot run on this host calls skip() and returns early.
void skip(const std::string& reason) { g_skip_reason = reason; }

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  g_skip_reason.clear();
  fn();
  g_tests_run++;
  if (!g_skip_reason.empty()) {
    std::cout << " SKIPPED (" << g_skip_reason << ")\n";
    g_tests_skipped++;
    return;
  }
  std::cout << " PASSED\n";
  g_tests_passed++;
}

fs::path scratch_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("codelab_test_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

codelab::ProcessSpec shell(const std::string& script) {
  codelab::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"/bin/sh", "-c", script};
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.cwd = fs::temp_directory_path().string();
  return spec;
}

bool have_python() { return !codelab::find_in_path("python3").empty(); }

bool require_python() {
  if (have_python()) return true;
  skip("python3 not found on PATH");
  return false;
}

bool require_mount_namespace() {
  if (codelab::detect_sandbox_capabilities().mount_namespace) return true;
  skip("mount namespaces unavailable");
  return false;
}

// Executor for the tests that run real programs. Network is allowed, and the
// filesystem sandbox is used only where this host supports it, so the result
// does not depend on namespace support.
codelab::SandboxExecutor python_executor() {
  codelab::SecurityPolicy policy;
  policy.network_access_enabled = true;
  policy.sandboxing_enabled = codelab::detect_sandbox_capabilities().mount_namespace;
  codelab::ExecutorConfig cfg;
  cfg.policy = std::make_shared<const codelab::SecurityPolicy>(policy);
  cfg.workspace_root = (fs::temp_directory_path() / "codelab_test_runs").string();
  return codelab::SandboxExecutor(cfg);
}

codelab::ResourceLimits limits_with_time(std::uint64_t ms) {
  const auto d = codelab::ResourceLimits::defaults();
  return codelab::ResourceLimits(ms, d.max_memory_bytes(), d.max_output_bytes(),
                                 d.max_code_bytes());
}

codelab::ResourceLimits limits_with_output(std::uint64_t bytes) {
  const auto d = codelab::ResourceLimits::defaults();
  return codelab::ResourceLimits(d.max_execution_time_ms(), d.max_memory_bytes(), bytes,
                                 d.max_code_bytes());
}

// Counts execute() calls and answers Completed without running anything.
class CountingExecutor final : public codelab::Executor {
 public:
  codelab::ExecutionResult execute(const codelab::ExecutionRequest&,
                                   const codelab::CancellationToken*) override {
    ++calls;
    codelab::ExecutionResult r;
    r.status = codelab::ExecutionStatus::completed;
    r.return_code = 0;
    r.wall_time_us = 1000;
    return r;
  }
  std::atomic<int> calls{0};
};

std::vector<codelab::ExecutionEvent> g_captured_events;
void capture_event(const codelab::ExecutionEvent& ev) { g_captured_events.push_back(ev); }

std::size_t count_lines(const std::string& s) {
  if (s.empty()) return 0;
  std::size_t n = 1;
  for (char c : s) {
    if (c == '\n') ++n;
  }
  return n;
}

// ============================================================================
// Phase 1: Value types, hashing, JSON
// ============================================================================

void test_limits_reject_zero() {
  bool threw = false;
  try {
    codelab::ResourceLimits(0, 1, 1, 1);
  } catch (const codelab::EngineError& e) {
    threw = e.code() == codelab::ErrorCode::invalid_limits;
  }
  expect(threw, "zero time limit must throw invalid_limits");
}

void test_limits_override_only_tightens() {
  const auto d = codelab::ResourceLimits::defaults();
  expect(d.max_execution_time_ms() == 5000, "default time 5s");
  expect(d.max_output_bytes() == 10240, "default output 10240");
  expect(d.max_code_bytes() == 102400, "default code 102400");

  codelab::LimitOverride o;
  o.max_execution_time_ms = 60000;  // looser: ignored
  o.max_output_bytes = 100;         // tighter: applied
  const auto merged = d.tightened_by(o);
  expect(merged.max_execution_time_ms() == 5000, "override cannot raise the time limit");
  expect(merged.max_output_bytes() == 100, "override lowers the output limit");
  expect(merged.max_memory_bytes() == d.max_memory_bytes(), "absent field inherits default");

  const codelab::ResourceLimits big(100000, 1ull << 40, 1 << 20, 1 << 20);
  expect(big.clamped_to(d) == d, "clamping a looser profile yields the ceiling");
}

void test_language_and_status_names() {
  expect(codelab::parse_language("JAC") == codelab::LanguageId::jac, "JAC parses");
  expect(codelab::parse_language("python") == codelab::LanguageId::py, "python parses");
  expect(!codelab::parse_language("ruby"), "ruby rejected");
  expect(codelab::is_terminal(codelab::ExecutionStatus::timed_out), "timed_out is terminal");
  expect(!codelab::is_terminal(codelab::ExecutionStatus::running), "running is not terminal");
  expect(codelab::parse_status(codelab::to_string(codelab::ExecutionStatus::rejected_by_policy)) ==
             codelab::ExecutionStatus::rejected_by_policy,
         "status name round-trips");
}

void test_uuid_shape() {
  const std::string a = codelab::generate_uuid();
  const std::string b = codelab::generate_uuid();
  expect(a.size() == 36 && a[8] == '-' && a[14] == '4', "uuid v4 layout");
  expect(a != b, "uuids differ");
}

void test_blake3_known_vectors() {
  expect(codelab::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(codelab::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(codelab::hash_runtime_info().primitive == "blake3", "hash primitive is blake3");
}

void test_digests() {
  const std::string code = "print(1)";
  expect(codelab::code_digest(codelab::LanguageId::py, code) !=
             codelab::code_digest(codelab::LanguageId::jac, code),
         "language is part of the code digest");

  codelab::ExecutionResult a;
  a.status = codelab::ExecutionStatus::completed;
  a.stdout_text = "1\n";
  a.return_code = 0;
  a.wall_time_us = 100;
  codelab::ExecutionResult b = a;
  b.wall_time_us = 999;
  b.memory_used_bytes = 4096;
  expect(codelab::result_digest(a) == codelab::result_digest(b), "timing excluded from digest");
  b.stdout_text = "2\n";
  expect(codelab::result_digest(a) != codelab::result_digest(b), "stdout included in digest");
}

void test_json_strictness() {
  std::optional<codelab::jsonlite::JsonError> err;
  codelab::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");

  err.reset();
  codelab::jsonlite::parse("{\"a\":1} trailing", &err);
  expect(err && err->code == "json_parse_error", "trailing data rejected");

  err.reset();
  auto obj = codelab::jsonlite::parse("{\"s\":\"a\\u00e9\\n\",\"n\":-3,\"u\":42,\"l\":[\"x\"]}", &err);
  expect(!err, "valid document parses");
  expect(codelab::jsonlite::get_string(obj, "s") == "a\xc3\xa9\n", "unicode escape decoded");
  expect(codelab::jsonlite::get_double(obj, "n") == -3.0, "negative number is a double");
  expect(codelab::jsonlite::get_u64(obj, "u") == 42, "integer is u64");
  expect(codelab::jsonlite::get_string_array(obj, "l").size() == 1, "array read");
  expect(codelab::jsonlite::escape(std::string("a\x01", 2)) == "a\\u0001", "control escaped");
}

// ============================================================================
// Phase 2: Security policy
// ============================================================================

std::optional<codelab::PolicyViolation> scan_py(const std::string& code) {
  return codelab::scan_forbidden_constructs(code, codelab::LanguageId::py,
                                            codelab::SecurityPolicy{});
}

void test_scan_blocked_imports() {
  auto v = scan_py("import os\n");
  expect(v && v->kind == codelab::PolicyViolationKind::forbidden_construct && v->name == "os",
         "import os blocked");
  v = scan_py("import json, os.path as p\n");
  expect(v && v->name == "os", "dotted import with alias blocked by its root");
  v = scan_py("from subprocess import run\n");
  expect(v && v->name == "subprocess", "from-import blocked");
  v = scan_py("from importlib import import_module\n");
  expect(v && v->name == "importlib", "importlib blocked");
  expect(!scan_py("from collections import OrderedDict\nimport math\n"),
         "allowed modules pass");
  expect(!scan_py("import osmosis\n"), "module sharing a prefix is not blocked");

  auto jac = codelab::scan_forbidden_constructs("import:py os;\n", codelab::LanguageId::jac,
                                                codelab::SecurityPolicy{});
  expect(jac && jac->name == "os", "JAC import:py blocked");
}

void test_scan_blocked_functions() {
  auto v = scan_py("x = eval('1+1')\n");
  expect(v && v->name == "eval", "eval call blocked");
  v = scan_py("builtins.exec('x')\n");
  expect(v && v->name == "exec", "attribute call blocked on last component");
  v = scan_py("print(f\"{open('f')}\")\n");
  expect(v && v->name == "open", "call inside f-string field blocked");
  expect(!scan_py("def open(path):\n    return path\n"), "defining a function is not a call");
  expect(!scan_py("evaluate(1)\nexecutor = 2\n"), "identifiers sharing a prefix pass");
}

void test_scan_ignores_comments_and_strings() {
  expect(!scan_py("# import os\nprint('import os')\ns = \"\"\"\neval(1)\n\"\"\"\n"),
         "comments and literals ignored");
  auto jac = codelab::scan_forbidden_constructs("// eval(1)\n/* import os; */\nprint(1);\n",
                                                codelab::LanguageId::jac,
                                                codelab::SecurityPolicy{});
  expect(!jac, "JAC comments ignored");
}

void test_validate_request_order() {
  codelab::SecurityPolicy policy;
  policy.allowed_languages = {codelab::LanguageId::py};
  codelab::RateCounter rates;
  const codelab::CallerIdentity caller{"alice"};

  auto req = codelab::make_request(codelab::LanguageId::jac, std::string(200000, 'x'));
  auto v = codelab::validate_request(req, policy, rates, caller);
  expect(v && v->kind == codelab::PolicyViolationKind::unsupported_language,
         "language checked before size");

  const auto d = codelab::ResourceLimits::defaults();
  const codelab::ResourceLimits tiny(d.max_execution_time_ms(), d.max_memory_bytes(),
                                     d.max_output_bytes(), 10);
  req = codelab::make_request(codelab::LanguageId::py, "import os  # 20 bytes", tiny);
  v = codelab::validate_request(req, policy, rates, caller);
  expect(v && v->kind == codelab::PolicyViolationKind::code_too_large,
         "size checked before constructs");

  req = codelab::make_request(codelab::LanguageId::py, "print(1)\n");
  expect(!codelab::validate_request(req, policy, rates, caller), "clean request passes");
  expect(rates.executions_in_last_minute(caller) == 0, "validation records nothing");
}

void test_rate_limits() {
  codelab::SecurityPolicy policy;
  policy.max_executions_per_minute = 2;
  policy.max_executions_per_hour = 3;
  codelab::RateCounter rates;
  const codelab::CallerIdentity alice{"alice"};
  const codelab::CallerIdentity bob{"bob"};
  const auto req = codelab::make_request(codelab::LanguageId::py, "print(1)\n");

  rates.record_attempt(alice);
  expect(!codelab::validate_request(req, policy, rates, alice), "1 of 2 per minute allowed");
  rates.record_attempt(alice);
  auto v = codelab::validate_request(req, policy, rates, alice);
  expect(v && v->kind == codelab::PolicyViolationKind::rate_limited && v->name == "minute",
         "minute cap reached");
  expect(!codelab::validate_request(req, policy, rates, bob), "callers are independent");

  using namespace std::chrono_literals;
  codelab::RateCounter windows;
  const auto t0 = codelab::RateCounter::Clock::now();
  windows.record_attempt(alice, t0);
  windows.record_attempt(alice, t0 + 30s);
  expect(windows.count_within(alice, 1min, t0 + 61s) == 1, "minute window slides");
  expect(windows.count_within(alice, 1h, t0 + 61s) == 2, "hour window holds both");
  windows.record_attempt(alice, t0 + 2h);
  expect(windows.count_within(alice, 1h, t0 + 2h) == 1, "entries older than an hour drop");
  expect(windows.tracked_callers() == 1, "one caller tracked");
}

void test_rate_try_record_respects_caps() {
  using namespace std::chrono_literals;
  codelab::RateCounter rates;
  const codelab::CallerIdentity carol{"carol"};
  const auto t0 = codelab::RateCounter::Clock::now();
  expect(!rates.try_record_attempt(carol, 2, 3, t0), "first attempt recorded");
  expect(!rates.try_record_attempt(carol, 2, 3, t0 + 1s), "second attempt recorded");
  auto v = rates.try_record_attempt(carol, 2, 3, t0 + 2s);
  expect(v && v->name == "minute", "minute cap refuses the third");
  expect(rates.count_within(carol, 1h, t0 + 2s) == 2, "refused attempt not recorded");
  expect(!rates.try_record_attempt(carol, 2, 3, t0 + 61s), "minute window reopens");
  v = rates.try_record_attempt(carol, 2, 3, t0 + 200s);
  expect(v && v->name == "hour", "hour cap refuses the fourth");

  codelab::RateCounter shared;
  std::atomic<int> admitted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      for (int k = 0; k < 50; ++k) {
        if (!shared.try_record_attempt(carol, 10, 100)) admitted++;
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(admitted.load() == 10, "concurrent callers never exceed the cap");
}

void test_rate_counter_forgets_idle_callers() {
  using namespace std::chrono_literals;
  codelab::RateCounter rates;
  const auto t0 = codelab::RateCounter::Clock::now();
  rates.record_attempt(codelab::CallerIdentity{"alice"}, t0);
  rates.record_attempt(codelab::CallerIdentity{"bob"}, t0 + 90min);
  expect(rates.tracked_callers() == 2, "two callers tracked");
  expect(rates.prune(t0 + 90min) == 1, "caller idle for an hour dropped");
  expect(rates.prune(t0 + 3h) == 0, "map empty once every window expires");

  // The periodic sweep runs without an explicit prune().
  for (std::uint64_t i = 0; i < codelab::RateCounter::kSweepInterval; ++i) {
    rates.record_attempt(codelab::CallerIdentity{"caller-" + std::to_string(i)}, t0);
  }
  rates.record_attempt(codelab::CallerIdentity{"late"}, t0 + 2h);
  for (std::uint64_t i = 0; i < codelab::RateCounter::kSweepInterval; ++i) {
    rates.record_attempt(codelab::CallerIdentity{"late"}, t0 + 2h);
  }
  expect(rates.tracked_callers() == 1, "sweep drops expired callers");
}

void test_policy_json_round_trip() {
  std::vector<std::string> errors;
  std::optional<codelab::jsonlite::JsonError> err;
  const auto obj = codelab::jsonlite::parse(
      "{\"blocked_imports\":[\"socket\"],\"allowed_languages\":[\"py\",\"cobol\"],"
      "\"max_executions_per_minute\":5}",
      &err);
  const auto p = codelab::policy_from_object(obj, &errors);
  expect(p.blocked_imports.size() == 1 && p.blocked_imports.contains("socket"),
         "blocked imports replaced");
  expect(p.allowed_languages.size() == 1, "only known languages kept");
  expect(errors.size() == 1, "unknown language reported");
  expect(p.max_executions_per_minute == 5, "rate cap read");
  expect(p.blocked_functions.contains("eval"), "absent field keeps default");
}

// ============================================================================
// Phase 3: Translator
// ============================================================================

void test_translate_function_to_py() {
  const auto r = codelab::translate("can add(a, b) ->\n    return a + b\nye",
                                    codelab::LanguageId::jac, codelab::LanguageId::py);
  expect(r.success, "translation succeeds");
  expect(r.translated_code == "def add(a, b):\n    return a + b", "JAC function becomes def");
  expect(r.warnings.empty() && r.errors.empty(), "no diagnostics");
}

void test_translate_round_trip_if_else() {
  const std::string py =
      "def sign(x):\n"
      "    if x < 0:\n"
      "        return -1\n"
      "    else:\n"
      "        return 1";
  const auto to_jac = codelab::translate(py, codelab::LanguageId::py, codelab::LanguageId::jac);
  expect(to_jac.success, "PY to JAC succeeds");
  expect(to_jac.translated_code ==
             "can sign(x) ->\n"
             "    if x < 0 ->\n"
             "        return -1;\n"
             "    else ->\n"
             "        return 1;\n"
             "    ye\n"
             "ye",
         "JAC form uses arrows and ye");
  const auto back =
      codelab::translate(to_jac.translated_code, codelab::LanguageId::jac, codelab::LanguageId::py);
  expect(back.success && back.translated_code == py, "round trip restores the PY source");
}

void test_translate_loops_and_declarations() {
  const std::string jac =
      "var total: int = 0;\n"
      "for i in range(3) ->\n"
      "    total = total + i;\n"
      "ye\n"
      "while total > 0 ->\n"
      "    total = total - 1;\n"
      "ye";
  const auto r = codelab::translate(jac, codelab::LanguageId::jac, codelab::LanguageId::py);
  expect(r.success, "loops translate");
  expect(r.translated_code ==
             "total: int = 0\n"
             "for i in range(3):\n"
             "    total = total + i\n"
             "while total > 0:\n"
             "    total = total - 1",
         "for/while/var mapped");
  const auto back = codelab::translate(r.translated_code, codelab::LanguageId::py,
                                       codelab::LanguageId::jac);
  expect(back.success && back.translated_code == jac, "loops round trip");
}

void test_translate_comments() {
  const auto r = codelab::translate("// hello\nx = 1;  // set x", codelab::LanguageId::jac,
                                    codelab::LanguageId::py);
  expect(r.success && r.translated_code == "# hello\nx = 1  # set x", "comment markers swapped");
  const auto s = codelab::translate("s = \"a # not a comment\"", codelab::LanguageId::py,
                                    codelab::LanguageId::jac);
  expect(s.translated_code == "s = \"a # not a comment\";", "marker inside string kept");
}

void test_translate_unrecognized_passes_through() {
  const std::string jac =
      "obj Point {\n"
      "    has x: int = 1;\n"
      "}\n"
      "print(1);";
  const auto r = codelab::translate(jac, codelab::LanguageId::jac, codelab::LanguageId::py);
  expect(r.success, "unrecognized lines do not fail translation");
  expect(r.warnings.size() == 3, "one warning per unrecognized line");
  expect(count_lines(r.translated_code) == 4, "line count preserved");
  expect(r.translated_code.find("obj Point {") == 0, "unrecognized line copied unchanged");

  const auto py = codelab::translate("class Point:\n    x = 1\nprint(Point.x)",
                                     codelab::LanguageId::py, codelab::LanguageId::jac);
  expect(py.success && py.warnings.size() == 1, "class header is a warning");
  expect(py.translated_code == "class Point:\n    x = 1;\nprint(Point.x);",
         "opaque block keeps its body indented without a terminator");
}

void test_translate_missing_terminator() {
  const auto r = codelab::translate("can add(a, b) ->\n    return a + b",
                                    codelab::LanguageId::jac, codelab::LanguageId::py);
  expect(!r.success, "missing ye fails");
  expect(r.errors.size() == 1 && r.errors[0].find("line 1") == 0, "error names the header line");
  expect(r.translated_code == "def add(a, b):\n    return a + b", "partial output kept");

  const auto extra = codelab::translate("x = 1;\nye", codelab::LanguageId::jac,
                                        codelab::LanguageId::py);
  expect(!extra.success && extra.errors[0].find("line 2") == 0, "stray ye reported");
  expect(extra.translated_code == "x = 1", "output before the error kept");
}

void test_translate_indentation_errors() {
  auto r = codelab::translate("def f():\nreturn 1", codelab::LanguageId::py,
                              codelab::LanguageId::jac);
  expect(!r.success && r.errors[0].find("expected an indented block") != std::string::npos,
         "header without body");
  r = codelab::translate("x = 1\n    y = 2", codelab::LanguageId::py, codelab::LanguageId::jac);
  expect(!r.success && r.errors[0].find("unexpected indent") != std::string::npos,
         "unexpected indent");
  r = codelab::translate("if a:\n        b()\n    c()", codelab::LanguageId::py,
                         codelab::LanguageId::jac);
  expect(!r.success && r.errors[0].find("unindent") != std::string::npos, "unmatched dedent");
  r = codelab::translate("def f():", codelab::LanguageId::py, codelab::LanguageId::jac);
  expect(!r.success, "header at end of input");
}

void test_translate_trivial_inputs() {
  auto r = codelab::translate("print(1)", codelab::LanguageId::py, codelab::LanguageId::py);
  expect(r.success && r.translated_code.empty(), "same language yields empty output");
  r = codelab::translate("\n   \n", codelab::LanguageId::jac, codelab::LanguageId::py);
  expect(r.success && r.translated_code.empty() && r.warnings.empty(), "blank input");
}

void test_translate_separate_else_block() {
  const auto r = codelab::translate("if x ->\n    a();\nye\nelse ->\n    b();\nye",
                                    codelab::LanguageId::jac, codelab::LanguageId::py);
  expect(r.success && r.translated_code == "if x:\n    a()\nelse:\n    b()",
         "else after a closed if continues the chain");

  const auto empty_if = codelab::translate("if x ->\nye\nelse ->\n    y();\nye",
                                           codelab::LanguageId::jac, codelab::LanguageId::py);
  expect(empty_if.success && empty_if.translated_code == "if x:\n    pass\nelse:\n    y()",
         "empty if body gets a single pass");
}

void test_translate_jac_words_as_identifiers() {
  const auto r = codelab::translate("test = 1;\nnode.value = 2;\nedge(3);\nhere[0] += 1;",
                                    codelab::LanguageId::jac, codelab::LanguageId::py);
  expect(r.success && r.warnings.empty(), "identifiers named like JAC keywords are statements");
  expect(r.translated_code == "test = 1\nnode.value = 2\nedge(3)\nhere[0] += 1",
         "terminators stripped");

  const auto kw = codelab::translate("report total;\ntest = 2;", codelab::LanguageId::jac,
                                     codelab::LanguageId::py);
  expect(kw.warnings.size() == 1, "keyword use still unrecognized");
  expect(kw.translated_code == "report total;\ntest = 2", "only the keyword line copied as is");
}

void test_check_structure_and_grammar() {
  expect(codelab::check_structure("if x ->\n    y();\n", codelab::LanguageId::jac).size() == 1,
         "unterminated if reported");
  expect(codelab::check_structure("if x:\n    y()\n", codelab::LanguageId::py).empty(),
         "sound PY block");
  bool has_def = false;
  for (const auto& rule : codelab::grammar_table()) {
    if (rule.kind == codelab::LineKind::function_def) has_def = rule.py_keyword == "def";
  }
  expect(has_def, "grammar table maps can to def");
  const std::string json = codelab::translation_to_json(
      codelab::translate("x = 1", codelab::LanguageId::py, codelab::LanguageId::jac));
  expect(json.find("\"translated_code\":\"x = 1;\"") != std::string::npos, "JSON rendering");
}

// ============================================================================
// Phase 4: Sandbox
// ============================================================================

void test_sandbox_exit_codes() {
  auto r = codelab::run_process(shell("echo hello"));
  expect(r.outcome == codelab::ProcessOutcome::exited && r.exit_code == 0, "echo exits 0");
  expect(r.stdout_text == "hello\n", "stdout captured");
  r = codelab::run_process(shell("echo oops >&2; exit 3"));
  expect(r.exit_code == 3 && r.stderr_text == "oops\n", "exit code and stderr captured");
}

void test_sandbox_timeout_kills_group() {
  auto spec = shell("sleep 5 & sleep 5; wait");
  spec.timeout_ms = 200;
  const auto start = std::chrono::steady_clock::now();
  const auto r = codelab::run_process(spec);
  const auto took = std::chrono::steady_clock::now() - start;
  expect(r.outcome == codelab::ProcessOutcome::timed_out, "timeout reported");
  expect(r.exit_code == 124, "timeout exit code 124");
  expect(took < std::chrono::seconds(2), "background children killed with the group");
}

void test_sandbox_output_bound() {
  auto spec = shell("head -c 100000 /dev/zero");
  spec.max_output_bytes = 1024;
  const auto r = codelab::run_process(spec);
  expect(r.outcome == codelab::ProcessOutcome::exited && r.exit_code == 0,
         "process not killed for volume");
  expect(r.stdout_text.size() == 1024 && r.stdout_truncated, "stdout bounded exactly");
  expect(!r.stderr_truncated, "stderr untouched");
}

void test_sandbox_stdin_and_cwd() {
  const fs::path dir = scratch_dir("stdin");
  {
    std::ofstream(dir / "in.txt") << "from file\n";
  }
  auto spec = shell("cat; pwd");
  spec.cwd = dir.string();
  spec.stdin_path = (dir / "in.txt").string();
  const auto r = codelab::run_process(spec);
  expect(r.stdout_text.rfind("from file\n", 0) == 0, "stdin read from file");
  expect(r.stdout_text.find(fs::weakly_canonical(dir).string()) != std::string::npos,
         "runs in the given directory");
  fs::remove_all(dir);
}

void test_sandbox_cancellation() {
  codelab::CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.cancel();
  });
  const auto start = std::chrono::steady_clock::now();
  const auto r = codelab::run_process(shell("sleep 5"), &token);
  canceller.join();
  expect(r.outcome == codelab::ProcessOutcome::cancelled, "cancel is not a timeout");
  expect(std::chrono::steady_clock::now() - start < std::chrono::seconds(2), "killed promptly");
}

void test_sandbox_setup_failure() {
  auto spec = shell("true");
  spec.cwd = "/nonexistent/codelab/dir";
  const auto r = codelab::run_process(spec);
  expect(r.outcome == codelab::ProcessOutcome::setup_failed, "chdir failure detected");
  expect(r.failed_stage == codelab::SetupStage::working_directory, "stage reported");

  auto missing = shell("true");
  missing.command = "/nonexistent/interpreter";
  const auto m = codelab::run_process(missing);
  expect(m.failed_stage == codelab::SetupStage::exec, "exec failure reported");
}

void test_sandbox_filesystem_isolation() {
  if (!require_mount_namespace()) return;
  const fs::path ws = fs::weakly_canonical(scratch_dir("fs_ws"));
  const fs::path root = scratch_dir("fs_root");
  auto spec = shell(
      "test -e /etc/passwd && echo visible || echo hidden; "
      "echo kept > out.txt && cat out.txt; "
      "touch /usr/codelab_marker 2>/dev/null && echo writable || echo readonly");
  spec.cwd = ws.string();
  spec.fs_root = root.string();
  spec.readonly_paths = {"/usr", "/bin", "/sbin", "/lib", "/lib32", "/lib64"};
  const auto r = codelab::run_process(spec);
  expect(r.outcome == codelab::ProcessOutcome::exited && r.exit_code == 0,
         "isolated shell runs: " + codelab::to_string(r.failed_stage) + " " + r.stderr_text);
  expect(r.stdout_text == "hidden\nkept\nreadonly\n", "only system dirs and workspace visible");
  expect(fs::exists(ws / "out.txt"), "workspace writes reach the host directory");
  expect(!fs::exists("/usr/codelab_marker"), "system dirs are read-only");
  fs::remove_all(ws);
  fs::remove_all(root);
}

void test_environment_scrubbing() {
  ::setenv("CODELAB_TEST_API_TOKEN", "secret", 1);
  ::setenv("TZ", "UTC", 1);
  const auto sandboxed = codelab::child_environment(true, "/tmp/ws");
  const auto open = codelab::child_environment(false, "/tmp/ws");
  expect(!sandboxed.contains("CODELAB_TEST_API_TOKEN") && !open.contains("CODELAB_TEST_API_TOKEN"),
         "credentials stripped");
  expect(!open.contains("TZ"), "nondeterministic variables stripped");
  expect(sandboxed.at("PYTHONHASHSEED") == "0", "hash seed pinned");
  expect(sandboxed.at("HOME") == "/tmp/ws", "HOME is the workspace");
  expect(sandboxed.contains("PATH"), "PATH always present");
  ::unsetenv("CODELAB_TEST_API_TOKEN");
  ::unsetenv("TZ");

  expect(codelab::is_secret_key("AWS_SECRET_ACCESS_KEY") && codelab::is_secret_key("GH_TOKEN"),
         "secret key patterns");
  expect(!codelab::is_secret_key("LANG"), "LANG is not a secret");
  expect(codelab::sanitize_request_id("../a b;c-1_2") == "abc-1_2", "request id sanitized");
}

// ============================================================================
// Phase 5: Execution engine
// ============================================================================

void test_python_add_prints_five() {
  if (!require_python()) return;
  auto exec = python_executor();
  const auto req = codelab::make_request(codelab::LanguageId::py,
                                         "def add(a, b):\n    return a + b\nprint(add(2, 3))\n");
  const auto r = exec.execute(req);
  expect(r.status == codelab::ExecutionStatus::completed, "add completes");
  expect(r.stdout_text == "5\n", "add prints 5");
  expect(r.return_code == 0, "return code 0");
  expect(!r.truncated_output, "no truncation");
}

void test_python_determinism() {
  if (!require_python()) return;
  auto exec = python_executor();
  const std::string code = "print(hash('codelab'))\nprint(sorted({3, 1, 2}))\n";
  const auto a = exec.execute(codelab::make_request(codelab::LanguageId::py, code));
  const auto b = exec.execute(codelab::make_request(codelab::LanguageId::py, code));
  expect(a.status == codelab::ExecutionStatus::completed, "deterministic program completes");
  expect(a.stdout_text == b.stdout_text && a.stderr_text == b.stderr_text &&
             a.return_code == b.return_code,
         "identical runs match");
  expect(codelab::result_digest(a) == codelab::result_digest(b), "result digests match");
}

void test_python_timeout() {
  if (!require_python()) return;
  auto exec = python_executor();
  const auto req =
      codelab::make_request(codelab::LanguageId::py, "while True:\n    pass\n", limits_with_time(200));
  const auto r = exec.execute(req);
  expect(r.status == codelab::ExecutionStatus::timed_out, "busy loop times out");
  expect(r.wall_time_us <= 250000, "wall time at most 250ms");
  expect(!r.return_code, "no return code for a timeout");
}

void test_python_output_truncation() {
  if (!require_python()) return;
  auto exec = python_executor();
  const auto req = codelab::make_request(codelab::LanguageId::py,
                                         "print('x' * 10_000_000)\n", limits_with_output(1024));
  const auto r = exec.execute(req);
  expect(r.status == codelab::ExecutionStatus::completed, "large output still completes");
  expect(r.truncated_output, "truncation flagged");
  expect(r.stdout_text.size() == 1024, "stdout exactly at the limit");
}

void test_python_failure_and_stdin() {
  if (!require_python()) return;
  auto exec = python_executor();
  auto r = exec.execute(codelab::make_request(codelab::LanguageId::py, "raise SystemExit(3)\n"));
  expect(r.status == codelab::ExecutionStatus::failed && r.return_code == 3, "non-zero exit fails");

  auto req = codelab::make_request(codelab::LanguageId::py, "print(input().upper())\n");
  req.stdin_text = "hello\n";
  r = exec.execute(req);
  expect(r.stdout_text == "HELLO\n", "stdin supplied");
}

void test_python_request_limits_clamped() {
  if (!require_python()) return;
  codelab::SecurityPolicy policy;
  policy.network_access_enabled = true;
  policy.sandboxing_enabled = codelab::detect_sandbox_capabilities().mount_namespace;
  codelab::ExecutorConfig cfg;
  cfg.policy = std::make_shared<const codelab::SecurityPolicy>(policy);
  cfg.default_limits = limits_with_time(200);
  codelab::SandboxExecutor exec(cfg);
  // The request asks for the 5s default; the executor ceiling is 200ms.
  const auto r = exec.execute(codelab::make_request(codelab::LanguageId::py,
                                                    "import time\ntime.sleep(3)\n"));
  expect(r.status == codelab::ExecutionStatus::timed_out, "executor ceiling applies");
}

void test_python_cancellation() {
  if (!require_python()) return;
  auto exec = python_executor();
  codelab::CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    token.cancel();
  });
  const auto r = exec.execute(
      codelab::make_request(codelab::LanguageId::py, "import time\ntime.sleep(5)\n"), &token);
  canceller.join();
  expect(r.status == codelab::ExecutionStatus::cancelled, "cancelled run reports Cancelled");
}

void test_jac_runs_through_translation() {
  if (!require_python()) return;
  auto exec = python_executor();
  auto r = exec.execute(codelab::make_request(
      codelab::LanguageId::jac, "can add(a, b) ->\n    return a + b;\nye\nprint(add(2, 3));\n"));
  expect(r.status == codelab::ExecutionStatus::completed && r.stdout_text == "5\n",
         "JAC program runs via PY");
  r = exec.execute(codelab::make_request(codelab::LanguageId::jac, "can f() ->\n    return 1;\n"));
  expect(r.status == codelab::ExecutionStatus::failed, "untranslatable JAC fails");
  expect(r.stderr_text.find("translation failed") == 0, "translation errors on stderr");
}

void test_network_isolation_or_rejection() {
  if (!require_python()) return;
  codelab::ExecutorConfig cfg;  // default policy: sandboxed, no network
  cfg.workspace_root = (fs::temp_directory_path() / "codelab_test_runs").string();
  codelab::SandboxExecutor exec(cfg);
  const auto r = exec.execute(codelab::make_request(
      codelab::LanguageId::py,
      "import socket\ns = socket.socket()\ns.settimeout(1)\n"
      "try:\n    s.connect(('1.1.1.1', 53))\n    print('connected')\n"
      "except OSError:\n    print('blocked')\n"));
  expect(r.status == codelab::ExecutionStatus::rejected_by_policy ||
             (r.status == codelab::ExecutionStatus::completed && r.stdout_text == "blocked\n"),
         "no network: either isolated or refused, never an open run");
}

void test_python_cannot_read_host_files() {
  if (!require_python()) return;
  codelab::SecurityPolicy policy;  // sandboxed
  policy.network_access_enabled = true;
  codelab::ExecutorConfig cfg;
  cfg.policy = std::make_shared<const codelab::SecurityPolicy>(policy);
  cfg.workspace_root = (fs::temp_directory_path() / "codelab_test_runs").string();
  codelab::SandboxExecutor exec(cfg);
  const auto r = exec.execute(codelab::make_request(
      codelab::LanguageId::py,
      "import pathlib\n"
      "try:\n    pathlib.Path('/etc/passwd').read_text()\n    print('visible')\n"
      "except OSError:\n    print('hidden')\n"
      "pathlib.Path('note.txt').write_text('ok')\nprint(pathlib.Path('note.txt').read_text())\n"));
  if (!codelab::detect_sandbox_capabilities().mount_namespace) {
    expect(r.status == codelab::ExecutionStatus::rejected_by_policy,
           "no filesystem isolation: sandboxed run refused");
    return;
  }
  expect(r.status == codelab::ExecutionStatus::completed, "isolated run completes: " + r.stderr_text);
  expect(r.stdout_text == "hidden\nok\n", "host files hidden, workspace writable");
}

void test_python_memory_ceiling() {
  if (!require_python()) return;
  auto exec = python_executor();
  // 1 GiB against the 256 MiB default address-space limit.
  const auto r = exec.execute(
      codelab::make_request(codelab::LanguageId::py, "x = bytearray(1024 ** 3)\nprint('allocated')\n"));
  expect(r.status == codelab::ExecutionStatus::failed, "allocation past the ceiling fails");
  expect(r.return_code && *r.return_code != 0, "non-zero return code");
  expect(r.stdout_text.find("allocated") == std::string::npos, "allocation never succeeded");
}

void test_missing_interpreter_throws() {
  codelab::ExecutorConfig cfg;
  cfg.python_path = "/nonexistent/python3";
  codelab::SandboxExecutor exec(cfg);
  bool threw = false;
  try {
    exec.execute(codelab::make_request(codelab::LanguageId::py, "print(1)\n"));
  } catch (const codelab::EngineError& e) {
    threw = e.code() == codelab::ErrorCode::interpreter_unavailable;
  }
  expect(threw, "missing interpreter is an environment failure");
}

// ============================================================================
// Phase 6: Pipeline, sessions, observability
// ============================================================================

void test_pipeline_rejects_without_executing() {
  codelab::global_engine_stats().reset();
  g_captured_events.clear();
  codelab::set_execution_event_hook(capture_event);

  CountingExecutor exec;
  codelab::RateCounter rates;
  codelab::ExecutionPipeline pipeline(std::make_shared<const codelab::SecurityPolicy>(), exec,
                                      rates);
  const codelab::CallerIdentity caller{"mallory"};
  const auto sub =
      pipeline.submit(codelab::make_request(codelab::LanguageId::py, "import os\nos.system('x')\n"),
                      caller);
  expect(sub.violation && sub.violation->name == "os", "blocked import reported");
  expect(sub.result.status == codelab::ExecutionStatus::rejected_by_policy, "status is rejected");
  expect(exec.calls == 0, "executor never invoked");
  expect(rates.executions_in_last_hour(caller) == 0, "rejection not counted");
  expect(g_captured_events.size() == 1 && g_captured_events[0].violation == "forbidden_construct",
         "rejection event emitted");
  expect(codelab::global_engine_stats().rejected_forbidden_construct.load() == 1,
         "rejection counted by kind");

  const auto ok = pipeline.submit(codelab::make_request(codelab::LanguageId::py, "print(1)\n"),
                                  caller);
  expect(!ok.violation && exec.calls == 1, "clean request executed once");
  expect(rates.executions_in_last_hour(caller) == 1, "attempt counted");

  codelab::set_execution_event_hook(nullptr);
}

void test_pipeline_rate_limit() {
  auto policy = std::make_shared<codelab::SecurityPolicy>();
  policy->max_executions_per_minute = 2;
  CountingExecutor exec;
  codelab::RateCounter rates;
  codelab::ExecutionPipeline pipeline(policy, exec, rates);
  const codelab::CallerIdentity caller{"eager"};
  std::optional<codelab::PolicyViolation> last;
  for (int i = 0; i < 3; ++i) {
    last = pipeline.submit(codelab::make_request(codelab::LanguageId::py, "print(1)\n"), caller)
               .violation;
  }
  expect(last && last->kind == codelab::PolicyViolationKind::rate_limited, "third run limited");
  expect(exec.calls == 2, "only allowed runs executed");
}

void test_pipeline_concurrent_rate_limit() {
  auto policy = std::make_shared<codelab::SecurityPolicy>();
  policy->max_executions_per_minute = 1;
  CountingExecutor exec;
  codelab::RateCounter rates;
  codelab::ExecutionPipeline pipeline(policy, exec, rates);
  const codelab::CallerIdentity caller{"burst"};
  std::atomic<int> limited{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      const auto sub =
          pipeline.submit(codelab::make_request(codelab::LanguageId::py, "print(1)\n"), caller);
      if (sub.violation && sub.violation->kind == codelab::PolicyViolationKind::rate_limited) {
        limited++;
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(exec.calls == 1, "exactly one run admitted under a cap of 1");
  expect(limited.load() == 7, "the rest are rate limited");
  expect(rates.executions_in_last_minute(caller) == 1, "one attempt recorded");
}

void test_session_accounting() {
  codelab::SessionRegistry registry;
  const auto h = registry.open();
  for (auto status : {codelab::ExecutionStatus::completed, codelab::ExecutionStatus::failed,
                      codelab::ExecutionStatus::timed_out}) {
    codelab::ExecutionResult r;
    r.status = status;
    r.wall_time_us = 1000;
    registry.record(h, r);
  }
  expect(registry.open_sessions().size() == 1, "session listed while open");
  const auto summary = registry.close(h);
  expect(summary.total_executions == 3, "3 executions");
  expect(summary.successful_executions == 1, "1 success");
  expect(summary.failed_executions == 2, "2 failures");
  expect(summary.total_execution_time == std::chrono::microseconds(3000), "time accumulated");
  expect(!summary.is_active && summary.ended_at, "closed session is inactive");
  expect(summary.success_rate() > 0.33 && summary.success_rate() < 0.34, "success rate 1/3");
  expect(registry.open_sessions().empty(), "closed session not listed");

  codelab::ExecutionResult late;
  late.status = codelab::ExecutionStatus::completed;
  bool rejected = false;
  try {
    registry.record(h, late);
  } catch (const codelab::PreconditionViolation& e) {
    rejected = e.code() == codelab::ErrorCode::session_closed;
  }
  expect(rejected, "record after close is a precondition violation");
  expect(registry.summary(h).total_executions == 3, "closed session frozen");
}

void test_session_registry_releases_closed() {
  codelab::SessionRegistry registry;
  const std::size_t total = codelab::SessionRegistry::kMaxClosedSummaries + 10;
  std::vector<codelab::SessionHandle> handles;
  for (std::size_t i = 0; i < total; ++i) handles.push_back(registry.open());
  expect(registry.size() == total, "all sessions open");
  for (const auto& h : handles) registry.close(h);
  expect(registry.size() == 0, "closed sessions released");
  expect(registry.closed_size() == codelab::SessionRegistry::kMaxClosedSummaries,
         "closed summaries bounded");

  expect(!registry.summary(handles.back()).is_active, "recent close still answerable");
  bool closed = false;
  try {
    registry.close(handles.back());
  } catch (const codelab::PreconditionViolation& e) {
    closed = e.code() == codelab::ErrorCode::session_closed;
  }
  expect(closed, "second close of a recent session is session_closed");

  bool unknown = false;
  try {
    registry.summary(handles.front());
  } catch (const codelab::PreconditionViolation& e) {
    unknown = e.code() == codelab::ErrorCode::session_unknown;
  }
  expect(unknown, "oldest closed handle evicted");
}

void test_session_misuse() {
  codelab::SessionRegistry registry;
  const auto h = registry.open();
  codelab::ExecutionResult pending;
  bool threw = false;
  try {
    registry.record(h, pending);
  } catch (const codelab::PreconditionViolation&) {
    threw = true;
  }
  expect(threw, "non-terminal status rejected");

  threw = false;
  try {
    registry.close(codelab::SessionHandle{9999});
  } catch (const codelab::PreconditionViolation& e) {
    threw = e.code() == codelab::ErrorCode::session_unknown;
  }
  expect(threw, "unknown handle rejected");
}

void test_session_concurrent_records() {
  codelab::ExecutionSession session;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&session] {
      for (int i = 0; i < 100; ++i) {
        codelab::ExecutionResult r;
        r.status = (i % 2 == 0) ? codelab::ExecutionStatus::completed
                                : codelab::ExecutionStatus::failed;
        r.wall_time_us = 1;
        session.record(r);
      }
    });
  }
  for (auto& th : threads) th.join();
  const auto s = session.close();
  expect(s.total_executions == 800 && s.successful_executions == 400, "no lost updates");
}

void test_pipeline_records_into_session() {
  CountingExecutor exec;
  codelab::RateCounter rates;
  codelab::SessionRegistry sessions;
  codelab::ExecutionPipeline pipeline(std::make_shared<const codelab::SecurityPolicy>(), exec,
                                      rates, &sessions);
  const auto h = sessions.open();
  const codelab::CallerIdentity caller{"learner"};
  pipeline.submit(codelab::make_request(codelab::LanguageId::py, "print(1)\n"), caller, h);
  pipeline.submit(codelab::make_request(codelab::LanguageId::py, "eval('1')\n"), caller, h);
  const auto s = sessions.close(h);
  expect(s.total_executions == 1 && s.successful_executions == 1,
         "only executed runs are recorded");
}

void test_stats_and_histogram() {
  codelab::LatencyHistogram hist;
  for (int i = 0; i < 10; ++i) hist.record(2'000'000);  // 2ms
  expect(hist.count() == 10, "histogram count");
  expect(hist.percentile(0.5) > 1000.0 && hist.percentile(0.5) < 4000.0, "p50 near 2ms");

  codelab::EngineStats stats;
  codelab::ExecutionEvent ev;
  ev.status = codelab::ExecutionStatus::timed_out;
  ev.duration_ns = 1000;
  stats.record_execution(ev);
  expect(stats.timed_out.load() == 1 && stats.total_executions.load() == 1, "status counted");
  std::optional<codelab::jsonlite::JsonError> err;
  codelab::jsonlite::parse(stats.to_json(), &err);
  expect(!err, "stats JSON is valid");
  expect(stats.recent_events_snapshot().size() == 1, "event kept in ring");

  codelab::jsonlite::parse(codelab::event_to_json(ev), &err);
  expect(!err, "event JSON is valid");
}

void test_event_log_file() {
  const fs::path dir = scratch_dir("events");
  const std::string log = (dir / "events.jsonl").string();
  codelab::set_event_log_path(log);
  ::unsetenv("CODELAB_EVENT_LOG");
  codelab::ExecutionEvent ev;
  ev.request_id = "req-1";
  ev.status = codelab::ExecutionStatus::completed;
  codelab::emit_execution_event(ev);
  codelab::emit_execution_event(ev);
  codelab::set_event_log_path("");

  std::ifstream in(log);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    ++lines;
    std::optional<codelab::jsonlite::JsonError> err;
    const auto obj = codelab::jsonlite::parse(line, &err);
    expect(!err && codelab::jsonlite::get_string(obj, "request_id") == "req-1", "event line");
  }
  expect(lines == 2, "one line per event");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 7: Configuration, versioning, C ABI
// ============================================================================

void test_config_from_json() {
  std::vector<std::string> errors;
  const auto cfg = codelab::config_from_json(
      "{\"config_version\":\"1\",\"policy\":{\"network_access_enabled\":true},"
      "\"limits\":{\"max_execution_time_ms\":2000},"
      "\"interpreters\":{\"python\":\"/usr/bin/python3\",\"jac_translate_fallback\":false},"
      "\"workspace_root\":\"/tmp/codelab-ws\"}",
      &errors);
  expect(errors.empty(), "config parses cleanly");
  expect(cfg.policy.network_access_enabled, "policy read");
  expect(cfg.default_limits.max_execution_time_ms() == 2000, "limits read");
  expect(cfg.default_limits.max_output_bytes() == 10240, "absent limit keeps default");
  expect(cfg.python_path == "/usr/bin/python3" && !cfg.jac_translate_fallback,
         "interpreters read");
  expect(cfg.workspace_root == "/tmp/codelab-ws", "workspace root read");
}

void test_config_env_overrides() {
  ::setenv("CODELAB_SANDBOX_DISABLED", "1", 1);
  ::setenv("CODELAB_WORKSPACE", "/tmp/override", 1);
  codelab::EngineConfig cfg;
  codelab::apply_env_overrides(cfg);
  ::unsetenv("CODELAB_SANDBOX_DISABLED");
  ::unsetenv("CODELAB_WORKSPACE");
  expect(!cfg.policy.sandboxing_enabled, "sandbox disabled by environment");
  expect(cfg.workspace_root == "/tmp/override", "workspace overridden");
}

void test_validate_config() {
  auto r = codelab::validate_config("{\"config_version\":\"1\",\"limits\":{\"max_code_bytes\":0}}");
  expect(!r.ok && !r.errors.empty(), "zero limit is an error");
  r = codelab::validate_config("{\"config_version\":\"1\",\"colour\":\"blue\"}");
  expect(r.ok && r.warnings.size() == 1, "unknown key is a warning");
  r = codelab::validate_config("{\"config_version\":\"9\"}");
  expect(!r.ok, "unsupported version rejected");
  r = codelab::validate_config("not json");
  expect(!r.ok, "malformed config rejected");
}

void test_request_json() {
  const auto d = codelab::ResourceLimits::defaults();
  std::string err;
  auto req = codelab::parse_request_json(
      "{\"id\":\"r1\",\"language\":\"py\",\"code\":\"print(1)\",\"stdin\":\"x\","
      "\"limits\":{\"max_execution_time_ms\":999999,\"max_output_bytes\":64}}",
      d, &err);
  expect(req.has_value(), "request parses");
  expect(req->id == "r1" && req->stdin_text == "x", "id and stdin read");
  expect(req->limits.max_execution_time_ms() == d.max_execution_time_ms(),
         "larger limit clamped to the default");
  expect(req->limits.max_output_bytes() == 64, "smaller limit applied");

  expect(!codelab::parse_request_json("{\"language\":\"ruby\",\"code\":\"\"}", d, &err),
         "unknown language rejected");
  expect(!codelab::parse_request_json("{\"language\":\"py\"}", d, &err), "code required");

  codelab::ExecutionResult res;
  res.status = codelab::ExecutionStatus::timed_out;
  std::optional<codelab::jsonlite::JsonError> jerr;
  const auto obj = codelab::jsonlite::parse(codelab::result_to_json(*req, res), &jerr);
  expect(!jerr && codelab::jsonlite::get_string(obj, "status") == "timed_out", "result JSON");
  expect(std::holds_alternative<std::nullptr_t>(obj.at("return_code").v), "null return code");
}

void test_version_manifest() {
  expect(codelab::version::check_compatibility().ok, "current ABI compatible");
  const auto bad = codelab::version::check_compatibility(codelab::version::ENGINE_ABI_VERSION + 1);
  expect(!bad.ok && bad.error_code == "abi_version_mismatch", "mismatch detected");
  std::optional<codelab::jsonlite::JsonError> err;
  codelab::jsonlite::parse(
      codelab::version::manifest_to_json(codelab::version::current_manifest()), &err);
  expect(!err, "manifest JSON valid");
  expect(CODELAB_ABI_VERSION == codelab::version::ENGINE_ABI_VERSION, "C header matches");
}

void test_c_api() {
  expect(codelab_init("{}", CODELAB_ABI_VERSION + 1) == nullptr, "ABI mismatch refused");
  expect(codelab_init("{\"limits\":{\"max_code_bytes\":0}}", CODELAB_ABI_VERSION) == nullptr,
         "invalid config refused");
  codelab_ctx_t* ctx = codelab_init("{}", CODELAB_ABI_VERSION);
  expect(ctx != nullptr, "init succeeds");

  char* t = codelab_translate("can f(x) ->\n    return x;\nye", "jac", "py");
  expect(std::string(t).find("def f(x):") != std::string::npos, "translate via C ABI");
  codelab_free_string(t);

  char* v = codelab_validate(ctx, "{\"language\":\"py\",\"code\":\"import subprocess\"}", "c");
  expect(std::string(v).find("\"ok\":false") != std::string::npos, "validate via C ABI");
  codelab_free_string(v);

  const uint64_t session = codelab_session_open(ctx);
  expect(session != 0, "session opened");
  char* e = codelab_execute(ctx, "{\"language\":\"py\",\"code\":\"eval('1')\"}", "c", session);
  expect(std::string(e).find("rejected_by_policy") != std::string::npos, "rejection via C ABI");
  codelab_free_string(e);
  char* bad = codelab_execute(ctx, "{\"language\":", "c", 0);
  expect(std::string(bad).find("\"error\"") != std::string::npos, "malformed request");
  codelab_free_string(bad);

  char* s = codelab_session_close(ctx, session);
  expect(std::string(s).find("\"is_active\":false") != std::string::npos, "session closed");
  codelab_free_string(s);
  char* again = codelab_session_close(ctx, session);
  expect(std::string(again).find("session_closed") != std::string::npos, "double close");
  codelab_free_string(again);

  char* stats = codelab_stats(ctx);
  expect(std::string(stats).find("total_executions") != std::string::npos, "stats via C ABI");
  codelab_free_string(stats);
  codelab_shutdown(ctx);
}

}  // namespace

int main() {
  std::cout << "=== codelab Test Suite ===\n";

  std::cout << "\n[Phase 1] Value types, hashing, JSON\n";
  run_test("limits reject zero", test_limits_reject_zero);
  run_test("limit override only tightens", test_limits_override_only_tightens);
  run_test("language and status names", test_language_and_status_names);
  run_test("uuid shape", test_uuid_shape);
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("code and result digests", test_digests);
  run_test("JSON strictness", test_json_strictness);

  std::cout << "\n[Phase 2] Security policy\n";
  run_test("blocked imports", test_scan_blocked_imports);
  run_test("blocked functions", test_scan_blocked_functions);
  run_test("comments and strings ignored", test_scan_ignores_comments_and_strings);
  run_test("validation order", test_validate_request_order);
  run_test("rate limits", test_rate_limits);
  run_test("atomic check and record", test_rate_try_record_respects_caps);
  run_test("idle callers forgotten", test_rate_counter_forgets_idle_callers);
  run_test("policy JSON", test_policy_json_round_trip);

  std::cout << "\n[Phase 3] Translator\n";
  run_test("JAC function to PY", test_translate_function_to_py);
  run_test("if/else round trip", test_translate_round_trip_if_else);
  run_test("loops and declarations", test_translate_loops_and_declarations);
  run_test("comment markers", test_translate_comments);
  run_test("unrecognized constructs pass through", test_translate_unrecognized_passes_through);
  run_test("missing terminator", test_translate_missing_terminator);
  run_test("indentation errors", test_translate_indentation_errors);
  run_test("trivial inputs", test_translate_trivial_inputs);
  run_test("else after closed if", test_translate_separate_else_block);
  run_test("JAC words as identifiers", test_translate_jac_words_as_identifiers);
  run_test("structure check and grammar", test_check_structure_and_grammar);

  std::cout << "\n[Phase 4] Sandbox\n";
  run_test("exit codes", test_sandbox_exit_codes);
  run_test("timeout kills process group", test_sandbox_timeout_kills_group);
  run_test("output bound", test_sandbox_output_bound);
  run_test("stdin and cwd", test_sandbox_stdin_and_cwd);
  run_test("cancellation", test_sandbox_cancellation);
  run_test("setup failure", test_sandbox_setup_failure);
  run_test("filesystem isolation", test_sandbox_filesystem_isolation);
  run_test("environment scrubbing", test_environment_scrubbing);

  std::cout << "\n[Phase 5] Execution engine\n";
  run_test("add(2, 3) prints 5", test_python_add_prints_five);
  run_test("determinism", test_python_determinism);
  run_test("timeout at 200ms", test_python_timeout);
  run_test("10MB output at 1KB limit", test_python_output_truncation);
  run_test("failure and stdin", test_python_failure_and_stdin);
  run_test("executor ceiling", test_python_request_limits_clamped);
  run_test("cancellation", test_python_cancellation);
  run_test("JAC via translation", test_jac_runs_through_translation);
  run_test("network isolation", test_network_isolation_or_rejection);
  run_test("host files hidden", test_python_cannot_read_host_files);
  run_test("memory ceiling", test_python_memory_ceiling);
  run_test("missing interpreter", test_missing_interpreter_throws);

  std::cout << "\n[Phase 6] Pipeline, sessions, observability\n";
  run_test("rejection never executes", test_pipeline_rejects_without_executing);
  run_test("pipeline rate limit", test_pipeline_rate_limit);
  run_test("concurrent submissions respect the cap", test_pipeline_concurrent_rate_limit);
  run_test("session accounting", test_session_accounting);
  run_test("session misuse", test_session_misuse);
  run_test("closed sessions released", test_session_registry_releases_closed);
  run_test("concurrent session records", test_session_concurrent_records);
  run_test("pipeline records into session", test_pipeline_records_into_session);
  run_test("stats and histogram", test_stats_and_histogram);
  run_test("event log file", test_event_log_file);

  std::cout << "\n[Phase 7] Configuration, versioning, C ABI\n";
  run_test("config from JSON", test_config_from_json);
  run_test("environment overrides", test_config_env_overrides);
  run_test("config validation", test_validate_config);
  run_test("request JSON", test_request_json);
  run_test("version manifest", test_version_manifest);
  run_test("C ABI", test_c_api);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped > 0) std::cout << ", " << g_tests_skipped << " skipped";
  std::cout << " ===\n";
  return g_tests_passed + g_tests_skipped == g_tests_run ? 0 : 1;
}

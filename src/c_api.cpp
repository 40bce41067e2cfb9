#include "codelab/c_api.h"

// The C ABI wraps the pipeline, the translator and the session registry.
//   - Output strings are strdup'd and released with codelab_free_string().
//   - Exceptions never cross the boundary; they become error documents.

#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include "codelab/config.hpp"
#include "codelab/jsonlite.hpp"
#include "codelab/observability.hpp"
#include "codelab/pipeline.hpp"
#include "codelab/translator.hpp"
#include "codelab/version.hpp"

struct codelab_ctx {
  codelab::EngineConfig config;
  std::unique_ptr<codelab::SandboxExecutor> executor;
  codelab::RateCounter rate_counter;
  codelab::SessionRegistry sessions;
  std::unique_ptr<codelab::ExecutionPipeline> pipeline;
};

namespace {

char* dup(const std::string& s) { return strdup(s.c_str()); }

char* error_json(const std::string& code, const std::string& message) {
  codelab::jsonlite::Object err;
  err["code"] = code;
  err["message"] = message;
  codelab::jsonlite::Object o;
  o["error"] = std::move(err);
  return dup(codelab::jsonlite::to_json(o));
}

codelab::CallerIdentity caller_from(const char* caller_id) {
  return codelab::CallerIdentity{(caller_id && caller_id[0]) ? caller_id : "anonymous"};
}

}  // namespace

extern "C" {

uint32_t codelab_abi_version(void) { return CODELAB_ABI_VERSION; }

codelab_ctx_t* codelab_init(const char* config_json, uint32_t abi_version) {
  if (!codelab::version::check_compatibility(abi_version).ok) return nullptr;

  try {
    auto ctx = std::make_unique<codelab_ctx>();
    if (config_json && config_json[0]) {
      std::vector<std::string> errors;
      ctx->config = codelab::config_from_json(config_json, &errors);
      if (!errors.empty()) return nullptr;
    }
    codelab::apply_env_overrides(ctx->config);
    codelab::set_event_log_path(ctx->config.event_log_path);

    codelab::ExecutorConfig exec_cfg = codelab::to_executor_config(ctx->config);
    auto policy = exec_cfg.policy;
    ctx->executor = std::make_unique<codelab::SandboxExecutor>(std::move(exec_cfg));
    ctx->pipeline = std::make_unique<codelab::ExecutionPipeline>(
        std::move(policy), *ctx->executor, ctx->rate_counter, &ctx->sessions);
    return ctx.release();
  } catch (const std::exception&) {
    return nullptr;
  }
}

char* codelab_execute(codelab_ctx_t* ctx, const char* request_json, const char* caller_id,
                      uint64_t session) {
  if (!ctx || !request_json) return nullptr;
  try {
    std::string err;
    auto req = codelab::parse_request_json(request_json, ctx->config.default_limits, &err);
    if (!req) return error_json(codelab::to_string(codelab::ErrorCode::invalid_request), err);

    std::optional<codelab::SessionHandle> handle;
    if (session != 0) handle = codelab::SessionHandle{session};
    const codelab::Submission sub = ctx->pipeline->submit(*req, caller_from(caller_id), handle);
    return dup(codelab::result_to_json(*req, sub.result, sub.violation));
  } catch (const codelab::EngineError& e) {
    return error_json(codelab::to_string(e.code()), e.what());
  } catch (const codelab::PreconditionViolation& e) {
    return error_json(codelab::to_string(e.code()), e.what());
  } catch (const std::exception& e) {
    return error_json("internal_error", e.what());
  }
}

char* codelab_validate(codelab_ctx_t* ctx, const char* request_json, const char* caller_id) {
  if (!ctx || !request_json) return nullptr;
  try {
    std::string err;
    auto req = codelab::parse_request_json(request_json, ctx->config.default_limits, &err);
    if (!req) return error_json(codelab::to_string(codelab::ErrorCode::invalid_request), err);

    const auto violation = codelab::validate_request(*req, ctx->pipeline->policy(),
                                                     ctx->rate_counter, caller_from(caller_id));
    codelab::jsonlite::Object o;
    o["ok"] = !violation.has_value();
    if (violation) {
      codelab::jsonlite::Object v;
      v["kind"] = codelab::to_string(violation->kind);
      v["name"] = violation->name;
      v["detail"] = violation->detail;
      o["violation"] = std::move(v);
    } else {
      o["violation"] = nullptr;
    }
    return dup(codelab::jsonlite::to_json(o));
  } catch (const std::exception& e) {
    return error_json("internal_error", e.what());
  }
}

char* codelab_translate(const char* source, const char* from, const char* to) {
  if (!source || !from || !to) return nullptr;
  try {
    const auto from_lang = codelab::parse_language(from);
    const auto to_lang = codelab::parse_language(to);
    if (!from_lang || !to_lang) {
      return error_json(codelab::to_string(codelab::ErrorCode::invalid_request),
                        std::string("unknown language: ") + (from_lang ? to : from));
    }
    return dup(codelab::translation_to_json(codelab::translate(source, *from_lang, *to_lang)));
  } catch (const std::exception& e) {
    return error_json("internal_error", e.what());
  }
}

uint64_t codelab_session_open(codelab_ctx_t* ctx) {
  if (!ctx) return 0;
  try {
    return ctx->sessions.open().value;
  } catch (const std::exception&) {
    return 0;
  }
}

char* codelab_session_close(codelab_ctx_t* ctx, uint64_t session) {
  if (!ctx) return nullptr;
  try {
    return dup(codelab::summary_to_json(ctx->sessions.close(codelab::SessionHandle{session})));
  } catch (const codelab::PreconditionViolation& e) {
    return error_json(codelab::to_string(e.code()), e.what());
  } catch (const std::exception& e) {
    return error_json("internal_error", e.what());
  }
}

char* codelab_stats(codelab_ctx_t* ctx) {
  if (!ctx) return nullptr;
  try {
    return dup(codelab::global_engine_stats().to_json());
  } catch (const std::exception& e) {
    return error_json("internal_error", e.what());
  }
}

void codelab_free_string(char* s) {
  free(s);  // allocated by strdup in this file
}

void codelab_shutdown(codelab_ctx_t* ctx) { delete ctx; }

}  // extern "C"

/*
 * codelab/c_api.h — C ABI for embedding the execution core.
 *
 * Everything crossing this boundary is a C string holding JSON. No C++ types
 * and no exceptions leave the library.
 *
 * OWNERSHIP:
 *   - Caller owns all input strings.
 *   - Every non-NULL char* returned here is heap-allocated and must be released
 *     with codelab_free_string().
 *   - codelab_ctx_t* is opaque.
 *
 * THREAD SAFETY:
 *   - codelab_init() and codelab_shutdown() are not thread-safe.
 *   - All other calls may run concurrently on the same ctx.
 *
 * ERRORS:
 *   Calls returning char* return {"error":{"code":"...","message":"..."}}
 *   when the request cannot be served (malformed JSON, no interpreter, ...).
 *   NULL is returned only for a NULL ctx or NULL input.
 *
 * EXAMPLE:
 *   codelab_ctx_t* ctx = codelab_init("{}", CODELAB_ABI_VERSION);
 *   char* out = codelab_execute(ctx, "{\"language\":\"py\",\"code\":\"print(1)\"}", "alice", 0);
 *   printf("%s\n", out);
 *   codelab_free_string(out);
 *   codelab_shutdown(ctx);
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define CODELAB_ABI_VERSION 1

typedef struct codelab_ctx codelab_ctx_t;

/*
 * config_json: engine config document (see codelab/config.hpp), "{}" or NULL
 * for defaults. CODELAB_* environment overrides are applied on top.
 * Returns NULL on ABI mismatch or an invalid config.
 */
codelab_ctx_t* codelab_init(const char* config_json, uint32_t abi_version);

/*
 * Validate, rate-count and run one request.
 *   request_json: {id?, language, code, stdin?, limits?}
 *   caller_id:    rate-limit key; NULL or "" means "anonymous"
 *   session:      handle from codelab_session_open(), or 0 for none
 * Returns the result document; a policy rejection carries "violation".
 */
char* codelab_execute(codelab_ctx_t* ctx, const char* request_json, const char* caller_id,
                      uint64_t session);

/* Policy check only. Returns {"ok":bool,"violation":{...}|null}. */
char* codelab_validate(codelab_ctx_t* ctx, const char* request_json, const char* caller_id);

/*
 * from/to: "jac" or "py". Returns
 * {"success":bool,"translated_code":"...","errors":[...],"warnings":[...]}.
 */
char* codelab_translate(const char* source, const char* from, const char* to);

/* Returns 0 on failure. */
uint64_t codelab_session_open(codelab_ctx_t* ctx);

/* Returns the frozen session summary. */
char* codelab_session_close(codelab_ctx_t* ctx, uint64_t session);

/* Engine counters, see EngineStats::to_json(). */
char* codelab_stats(codelab_ctx_t* ctx);

void codelab_free_string(char* s);

/* Not thread-safe: no call on ctx may be in progress. */
void codelab_shutdown(codelab_ctx_t* ctx);

uint32_t codelab_abi_version(void);

#ifdef __cplusplus
} /* extern "C" */
#endif

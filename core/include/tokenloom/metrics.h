/**
 * @file metrics.h
 * @brief Structured logging & generation metrics
 *
 * C-ABI compatible. Collects prefill/decode latency, request outcomes and
 * KV cache counters. Exports JSON and Prometheus text.
 */

#ifndef TL_METRICS_H
#define TL_METRICS_H

#include <stdint.h>
#include <stddef.h>

#include "tokenloom/tokenloom_abi.h" /* TL_API */

#ifdef __cplusplus
extern "C" {
#endif

/* ---- Log Levels ---- */
typedef enum tl_log_level {
    TL_LOG_TRACE = 0,
    TL_LOG_DEBUG = 1,
    TL_LOG_INFO  = 2,
    TL_LOG_WARN  = 3,
    TL_LOG_ERROR = 4,
    TL_LOG_FATAL = 5,
    TL_LOG_OFF   = 6
} tl_log_level;

/* ---- Log callback ---- */
typedef void (*tl_log_fn)(tl_log_level level, const char* component,
                          const char* message, void* userdata);

TL_API void tl_log_set_callback(tl_log_fn fn, void* userdata);
TL_API void tl_log_set_level(tl_log_level level);
TL_API tl_log_level tl_log_get_level(void);
/** Reads TL_LOG_LEVEL (trace|debug|info|warn|error|fatal|off). */
TL_API void tl_log_init_from_env(void);
TL_API void tl_log(tl_log_level level, const char* component, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/* ---- Metrics Collector ---- */

typedef struct tl_metrics_snapshot {
    uint64_t prefill_us;
    uint64_t decode_us;
    uint64_t total_us;
    uint32_t prefill_tokens;
    uint32_t tokens_generated;
    double   tokens_per_second;
    uint32_t active_requests;
    uint32_t completed_requests;
    uint32_t failed_requests;
    uint32_t cancelled_requests;
    uint32_t timed_out_requests;
    uint64_t kv_cache_bytes;
    uint64_t kv_cache_hits;
    uint64_t kv_cache_misses;
    uint64_t kv_cache_evictions;
    uint64_t kv_reused_tokens;
} tl_metrics_snapshot;

TL_API void tl_metrics_reset(void);
TL_API void tl_metrics_record_prefill(uint64_t us, uint32_t tokens);
TL_API void tl_metrics_record_decode(uint64_t us, uint32_t tokens);
TL_API void tl_metrics_request_begin(void);
/** Closes a request opened by tl_metrics_request_begin with its status. */
TL_API void tl_metrics_request_end(tl_status st);
TL_API void tl_metrics_record_kv_lookup(int hit, uint32_t reused_tokens);
TL_API void tl_metrics_record_kv_eviction(uint64_t freed_bytes);
TL_API void tl_metrics_record_kv_bytes(uint64_t current_bytes);
TL_API void tl_metrics_snapshot_get(tl_metrics_snapshot* out);
TL_API size_t tl_metrics_to_json(char* buf, size_t buf_size);
TL_API size_t tl_metrics_to_prometheus(char* buf, size_t buf_size);

#ifdef __cplusplus
}
#endif

#endif /* TL_METRICS_H */

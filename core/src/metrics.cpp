/**
 * @file metrics.cpp
 * @brief Metrics collector + structured logging implementation
 */

#include "tokenloom/metrics.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

/* ---- Logging ---- */

static tl_log_fn                  s_log_fn    = nullptr;
static void*                      s_log_ud    = nullptr;
static std::atomic<tl_log_level>  s_log_level{TL_LOG_INFO};
static std::mutex                 s_log_mu;

void tl_log_set_callback(tl_log_fn fn, void* userdata) {
    std::lock_guard<std::mutex> lk(s_log_mu);
    s_log_fn = fn;
    s_log_ud = userdata;
}

void tl_log_set_level(tl_log_level level) {
    s_log_level.store(level, std::memory_order_relaxed);
}

tl_log_level tl_log_get_level(void) {
    return s_log_level.load(std::memory_order_relaxed);
}

void tl_log_init_from_env(void) {
    const char* env = std::getenv("TL_LOG_LEVEL");
    if (!env) return;

    static const struct { const char* name; tl_log_level level; } k_levels[] = {
        {"trace", TL_LOG_TRACE}, {"debug", TL_LOG_DEBUG}, {"info", TL_LOG_INFO},
        {"warn",  TL_LOG_WARN},  {"error", TL_LOG_ERROR}, {"fatal", TL_LOG_FATAL},
        {"off",   TL_LOG_OFF},
    };
    for (auto& l : k_levels) {
        if (std::strcmp(env, l.name) == 0) {
            tl_log_set_level(l.level);
            return;
        }
    }
    tl_log(TL_LOG_WARN, "log", "unknown TL_LOG_LEVEL '%s' ignored", env);
}

static const char* level_str(tl_log_level l) {
    switch (l) {
        case TL_LOG_TRACE: return "TRACE";
        case TL_LOG_DEBUG: return "DEBUG";
        case TL_LOG_INFO:  return "INFO";
        case TL_LOG_WARN:  return "WARN";
        case TL_LOG_ERROR: return "ERROR";
        case TL_LOG_FATAL: return "FATAL";
        default:           return "?";
    }
}

void tl_log(tl_log_level level, const char* component, const char* fmt, ...) {
    if (level < tl_log_get_level() || level == TL_LOG_OFF) return;

    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);

    std::lock_guard<std::mutex> lk(s_log_mu);
    if (s_log_fn) {
        s_log_fn(level, component, buf, s_log_ud);
    } else {
        std::fprintf(stderr, "[%s] %s: %s\n", level_str(level), component, buf);
    }
}

/* ---- Metrics ---- */

static struct {
    std::atomic<uint64_t> prefill_us{0};
    std::atomic<uint64_t> decode_us{0};
    std::atomic<uint64_t> total_us{0};
    std::atomic<uint32_t> prefill_tokens{0};
    std::atomic<uint32_t> decode_tokens{0};
    std::atomic<uint32_t> active_reqs{0};
    std::atomic<uint32_t> completed_reqs{0};
    std::atomic<uint32_t> failed_reqs{0};
    std::atomic<uint32_t> cancelled_reqs{0};
    std::atomic<uint32_t> timed_out_reqs{0};
    std::atomic<uint64_t> kv_bytes{0};
    std::atomic<uint64_t> kv_hits{0};
    std::atomic<uint64_t> kv_misses{0};
    std::atomic<uint64_t> kv_evictions{0};
    std::atomic<uint64_t> kv_reused{0};
} s_metrics;

void tl_metrics_reset(void) {
    s_metrics.prefill_us.store(0);
    s_metrics.decode_us.store(0);
    s_metrics.total_us.store(0);
    s_metrics.prefill_tokens.store(0);
    s_metrics.decode_tokens.store(0);
    s_metrics.active_reqs.store(0);
    s_metrics.completed_reqs.store(0);
    s_metrics.failed_reqs.store(0);
    s_metrics.cancelled_reqs.store(0);
    s_metrics.timed_out_reqs.store(0);
    s_metrics.kv_bytes.store(0);
    s_metrics.kv_hits.store(0);
    s_metrics.kv_misses.store(0);
    s_metrics.kv_evictions.store(0);
    s_metrics.kv_reused.store(0);
}

void tl_metrics_record_prefill(uint64_t us, uint32_t tokens) {
    s_metrics.prefill_us.fetch_add(us);
    s_metrics.prefill_tokens.fetch_add(tokens);
    s_metrics.total_us.fetch_add(us);
}

void tl_metrics_record_decode(uint64_t us, uint32_t tokens) {
    s_metrics.decode_us.fetch_add(us);
    s_metrics.decode_tokens.fetch_add(tokens);
    s_metrics.total_us.fetch_add(us);
}

void tl_metrics_request_begin(void) {
    s_metrics.active_reqs.fetch_add(1);
}

void tl_metrics_request_end(tl_status st) {
    uint32_t cur = s_metrics.active_reqs.load();
    while (cur > 0 && !s_metrics.active_reqs.compare_exchange_weak(cur, cur - 1));

    switch (st) {
        case TL_OK:              s_metrics.completed_reqs.fetch_add(1); break;
        case TL_ERROR_CANCELLED: s_metrics.cancelled_reqs.fetch_add(1); break;
        case TL_ERROR_TIMEOUT:   s_metrics.timed_out_reqs.fetch_add(1); break;
        default:                 s_metrics.failed_reqs.fetch_add(1);    break;
    }
}

void tl_metrics_record_kv_lookup(int hit, uint32_t reused_tokens) {
    if (hit) {
        s_metrics.kv_hits.fetch_add(1);
        s_metrics.kv_reused.fetch_add(reused_tokens);
    } else {
        s_metrics.kv_misses.fetch_add(1);
    }
}

void tl_metrics_record_kv_eviction(uint64_t freed_bytes) {
    (void)freed_bytes;
    s_metrics.kv_evictions.fetch_add(1);
}

void tl_metrics_record_kv_bytes(uint64_t current_bytes) {
    s_metrics.kv_bytes.store(current_bytes);
}

void tl_metrics_snapshot_get(tl_metrics_snapshot* out) {
    out->prefill_us = s_metrics.prefill_us.load();
    out->decode_us = s_metrics.decode_us.load();
    out->total_us = s_metrics.total_us.load();
    out->prefill_tokens = s_metrics.prefill_tokens.load();
    out->tokens_generated = s_metrics.decode_tokens.load();
    double dec_s = (double)out->decode_us / 1e6;
    out->tokens_per_second = (dec_s > 0) ? (double)out->tokens_generated / dec_s : 0;
    out->active_requests = s_metrics.active_reqs.load();
    out->completed_requests = s_metrics.completed_reqs.load();
    out->failed_requests = s_metrics.failed_reqs.load();
    out->cancelled_requests = s_metrics.cancelled_reqs.load();
    out->timed_out_requests = s_metrics.timed_out_reqs.load();
    out->kv_cache_bytes = s_metrics.kv_bytes.load();
    out->kv_cache_hits = s_metrics.kv_hits.load();
    out->kv_cache_misses = s_metrics.kv_misses.load();
    out->kv_cache_evictions = s_metrics.kv_evictions.load();
    out->kv_reused_tokens = s_metrics.kv_reused.load();
}

size_t tl_metrics_to_json(char* buf, size_t buf_size) {
    tl_metrics_snapshot snap;
    tl_metrics_snapshot_get(&snap);
    int n = snprintf(buf, buf_size,
        "{\"prefill_us\":%llu,\"decode_us\":%llu,\"total_us\":%llu,"
        "\"prefill_tokens\":%u,\"tokens_generated\":%u,\"tokens_per_second\":%.2f,"
        "\"active_requests\":%u,\"completed_requests\":%u,\"failed_requests\":%u,"
        "\"cancelled_requests\":%u,\"timed_out_requests\":%u,"
        "\"kv_cache_bytes\":%llu,\"kv_cache_hits\":%llu,\"kv_cache_misses\":%llu,"
        "\"kv_cache_evictions\":%llu,\"kv_reused_tokens\":%llu}",
        (unsigned long long)snap.prefill_us, (unsigned long long)snap.decode_us,
        (unsigned long long)snap.total_us,
        snap.prefill_tokens, snap.tokens_generated, snap.tokens_per_second,
        snap.active_requests, snap.completed_requests, snap.failed_requests,
        snap.cancelled_requests, snap.timed_out_requests,
        (unsigned long long)snap.kv_cache_bytes, (unsigned long long)snap.kv_cache_hits,
        (unsigned long long)snap.kv_cache_misses,
        (unsigned long long)snap.kv_cache_evictions,
        (unsigned long long)snap.kv_reused_tokens);
    return (n > 0) ? (size_t)n : 0;
}

size_t tl_metrics_to_prometheus(char* buf, size_t buf_size) {
    tl_metrics_snapshot snap;
    tl_metrics_snapshot_get(&snap);
    int n = snprintf(buf, buf_size,
        "# HELP tl_prefill_us Total prefill latency in microseconds\n"
        "# TYPE tl_prefill_us counter\n"
        "tl_prefill_us %llu\n"
        "# HELP tl_decode_us Total decode latency in microseconds\n"
        "# TYPE tl_decode_us counter\n"
        "tl_decode_us %llu\n"
        "# HELP tl_tokens_generated Total tokens generated\n"
        "# TYPE tl_tokens_generated counter\n"
        "tl_tokens_generated %u\n"
        "# HELP tl_tokens_per_second Current throughput\n"
        "# TYPE tl_tokens_per_second gauge\n"
        "tl_tokens_per_second %.2f\n"
        "# HELP tl_kv_cache_bytes KV cache store usage\n"
        "# TYPE tl_kv_cache_bytes gauge\n"
        "tl_kv_cache_bytes %llu\n"
        "# HELP tl_kv_cache_evictions Total KV cache evictions\n"
        "# TYPE tl_kv_cache_evictions counter\n"
        "tl_kv_cache_evictions %llu\n"
        "# HELP tl_requests_completed Total completed requests\n"
        "# TYPE tl_requests_completed counter\n"
        "tl_requests_completed %u\n"
        "# HELP tl_requests_failed Total failed requests\n"
        "# TYPE tl_requests_failed counter\n"
        "tl_requests_failed %u\n"
        "# HELP tl_requests_timed_out Total requests that missed their deadline\n"
        "# TYPE tl_requests_timed_out counter\n"
        "tl_requests_timed_out %u\n",
        (unsigned long long)snap.prefill_us, (unsigned long long)snap.decode_us,
        snap.tokens_generated, snap.tokens_per_second,
        (unsigned long long)snap.kv_cache_bytes,
        (unsigned long long)snap.kv_cache_evictions,
        snap.completed_requests, snap.failed_requests, snap.timed_out_requests);
    return (n > 0) ? (size_t)n : 0;
}

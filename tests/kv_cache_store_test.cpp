/**
 * @file kv_cache_store_test.cpp
 * @brief KvCacheEntry storage and KvCacheStore LRU / budget policy
 *
 * 8 test functions:
 *   1. Entry sizing, append/commit, range reads
 *   2. Entry truncate / slide
 *   3. GetOrCreate hit, shape mismatch, regrow
 *   4. LRU eviction by session count (touch reorders)
 *   5. Eviction by aggregate bytes, per-session budget
 *   6. Evicted entry stays alive for its holder
 *   7. LCP and the three-way reuse decision
 *   8. Concurrent GetOrCreate keeps the capacity invariant
 */

#include "tokenloom/KvCacheStore.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

static const tl_model_shape k_shape = {2, 2, 4};      /* row = 8 floats */
static const tl_model_shape k_other = {4, 2, 4};

/* ================================================================== */
/*  Test 1: entry basics                                               */
/* ================================================================== */

static void test_entry_basics() {
    CHECK(tl::kv_bytes_for(k_shape, 16) == 2ull * 2 * 16 * 2 * 4 * 4);
    CHECK(!tl::KvCacheEntry::create("x", tl_model_shape{0, 2, 4}, 16));
    CHECK(!tl::KvCacheEntry::create("x", k_shape, 0));

    auto e = tl::KvCacheEntry::create("s1", k_shape, 4);
    CHECK(e);
    CHECK(e->session_id() == "s1");
    CHECK(e->max_tokens() == 4 && e->current_tokens() == 0);
    CHECK(e->row_floats() == 8);
    CHECK(e->size_bytes() == tl::kv_bytes_for(k_shape, 4));

    std::vector<float> k(16), v(16);
    for (size_t i = 0; i < k.size(); ++i) { k[i] = static_cast<float>(i); v[i] = -k[i]; }
    for (uint32_t l = 0; l < 2; ++l) CHECK(e->append_kv(l, k, v, 2) == TL_OK);
    CHECK(e->append_kv(2, k, v, 2) == TL_ERROR_INVALID_ARG);
    CHECK(e->append_kv(0, k, v, 1) == TL_ERROR_INVALID_ARG);   /* size mismatch */

    /* Not committed yet: nothing readable. */
    CHECK(e->keys(0, 0, 1).empty());
    CHECK(e->commit(2) == TL_OK);
    CHECK(e->current_tokens() == 2);

    auto row1 = e->keys(1, 1, 1);
    CHECK(row1.size() == 8 && row1[0] == 8.0f && row1[7] == 15.0f);
    auto vals = e->values(0, 0, 2);
    CHECK(vals.size() == 16 && vals[3] == -3.0f);
    CHECK(e->keys(0, 1, 2).empty());

    CHECK(e->commit(3) == TL_ERROR_RESOURCE_LIMIT);
    CHECK(e->current_tokens() <= e->max_tokens());
    CHECK(e->commit(2) == TL_OK);
    CHECK(!e->has_capacity(1));
    CHECK(e->append_kv(0, std::span<const float>(k.data(), 8),
                       std::span<const float>(v.data(), 8), 1) == TL_ERROR_RESOURCE_LIMIT);

    /* The view the backend sees aliases the same storage. */
    tl_kv_view* view = e->view();
    CHECK(view->n_tokens == 4 && view->max_tokens == 4);
    CHECK(view->keys[1][8] == 8.0f);
    std::printf("  PASS: entry append/commit/read\n");
}

/* ================================================================== */
/*  Test 2: truncate / slide                                           */
/* ================================================================== */

static void test_entry_shrink() {
    auto e = tl::KvCacheEntry::create("s", k_shape, 8);
    std::vector<float> k(5 * 8), v(5 * 8);
    for (size_t i = 0; i < k.size(); ++i) { k[i] = static_cast<float>(i / 8); v[i] = 100.0f + k[i]; }
    for (uint32_t l = 0; l < 2; ++l) CHECK(e->append_kv(l, k, v, 5) == TL_OK);
    CHECK(e->commit(5) == TL_OK);

    e->truncate(7);
    CHECK(e->current_tokens() == 5);
    e->truncate(4);
    CHECK(e->current_tokens() == 4);

    /* Keep the last two of positions 0..3. */
    e->slide(2);
    CHECK(e->current_tokens() == 2);
    CHECK(e->keys(0, 0, 1)[0] == 2.0f);
    CHECK(e->keys(1, 1, 1)[0] == 3.0f);
    CHECK(e->values(1, 0, 1)[0] == 102.0f);

    e->slide(5);
    CHECK(e->current_tokens() == 2);
    e->reset();
    CHECK(e->current_tokens() == 0 && e->has_capacity(8));
    std::printf("  PASS: entry truncate/slide\n");
}

/* ================================================================== */
/*  Test 3: GetOrCreate                                                */
/* ================================================================== */

static void test_get_or_create() {
    tl::KvCacheStore store;
    std::shared_ptr<tl::KvCacheEntry> a, b;

    CHECK(store.get_or_create("", k_shape, 8, &a) == TL_ERROR_INVALID_ARG);
    CHECK(store.get_or_create("conv", k_shape, 8, &a) == TL_OK);
    CHECK(a && a->max_tokens() == 8);

    /* Same id, same shape, enough rows: the same entry. */
    CHECK(store.get_or_create("conv", k_shape, 4, &b) == TL_OK);
    CHECK(b == a);
    CHECK(store.stats().sessions == 1);

    /* Model swapped under a live id. */
    CHECK(store.get_or_create("conv", k_other, 8, &b) == TL_ERROR_SHAPE_MISMATCH);
    CHECK(!b);
    CHECK(store.try_get("conv") == a);

    /* Needs more rows than the entry has: replaced. */
    CHECK(store.get_or_create("conv", k_shape, 16, &b) == TL_OK);
    CHECK(b != a && b->max_tokens() == 16);
    CHECK(store.stats().sessions == 1);
    CHECK(store.stats().bytes == tl::kv_bytes_for(k_shape, 16));

    CHECK(!store.try_get("missing"));
    CHECK(!store.touch("missing"));
    CHECK(store.touch("conv"));

    /* Reset is refused while the entry is held outside the store. */
    CHECK(b->commit(3) == TL_OK);
    CHECK(store.reset("conv") == TL_ERROR_BUSY);
    CHECK(b->current_tokens() == 3);
    std::weak_ptr<tl::KvCacheEntry> held = b;
    b.reset();
    CHECK(store.reset("conv") == TL_OK);
    b = held.lock();
    CHECK(b && b->current_tokens() == 0);
    CHECK(store.reset("missing") == TL_ERROR_NOT_FOUND);

    CHECK(store.remove("conv"));
    CHECK(!store.remove("conv"));
    CHECK(store.stats().sessions == 0 && store.stats().bytes == 0);

    tl::KvCacheStore::Config off;
    off.enabled = false;
    off.max_sessions = 0;
    tl::KvCacheStore disabled(off);
    CHECK(!disabled.enabled());
    CHECK(disabled.config().max_sessions == 1);
    std::printf("  PASS: GetOrCreate / shape mismatch / regrow\n");
}

/* ================================================================== */
/*  Test 4: LRU by session count                                       */
/* ================================================================== */

static void test_lru_sessions() {
    tl::KvCacheStore::Config cfg;
    cfg.max_sessions = 3;
    tl::KvCacheStore store(cfg);
    std::shared_ptr<tl::KvCacheEntry> e;

    for (const char* id : {"a", "b", "c"})
        CHECK(store.get_or_create(id, k_shape, 8, &e) == TL_OK);
    CHECK(store.touch("a"));                       /* order: a c b */

    CHECK(store.get_or_create("d", k_shape, 8, &e) == TL_OK);
    CHECK(!store.try_get("b"));
    CHECK(store.try_get("c") && store.try_get("d") && store.try_get("a"));
    /* try_get touched c, d, a in that order: a d c */

    CHECK(store.get_or_create("e", k_shape, 8, &e) == TL_OK);
    CHECK(!store.try_get("c"));
    CHECK(store.try_get("a") && store.try_get("d") && store.try_get("e"));

    tl::KvCacheStore::Stats s = store.stats();
    CHECK(s.sessions == 3);
    CHECK(s.evictions == 2);
    std::printf("  PASS: LRU eviction by session count\n");
}

/* ================================================================== */
/*  Test 5: byte budgets                                               */
/* ================================================================== */

static void test_byte_budgets() {
    const uint64_t one = tl::kv_bytes_for(k_shape, 8);    /* 1024 */
    tl::KvCacheStore::Config cfg;
    cfg.max_bytes_total = one * 2 + one / 2;
    tl::KvCacheStore store(cfg);
    std::shared_ptr<tl::KvCacheEntry> e;

    for (int i = 0; i < 6; ++i) {
        CHECK(store.get_or_create("s" + std::to_string(i), k_shape, 8, &e) == TL_OK);
        tl::KvCacheStore::Stats s = store.stats();
        CHECK(s.bytes <= cfg.max_bytes_total);
        CHECK(s.sessions <= cfg.max_sessions);
    }
    CHECK(store.stats().sessions == 2);
    CHECK(store.try_get("s5") && store.try_get("s4"));
    CHECK(store.stats().evictions == 4);
    CHECK(store.stats().peak_bytes == one * 2);

    /* Larger than the whole store. */
    CHECK(store.get_or_create("huge", k_shape, 32, &e) == TL_ERROR_OUT_OF_MEMORY);
    CHECK(!e);
    CHECK(store.stats().sessions == 2);

    tl::KvCacheStore::Config per;
    per.max_bytes_per_session = one - 1;
    tl::KvCacheStore bounded(per);
    CHECK(bounded.get_or_create("x", k_shape, 8, &e) == TL_ERROR_RESOURCE_LIMIT);
    CHECK(bounded.get_or_create("x", k_shape, 4, &e) == TL_OK);

    store.clear();
    CHECK(store.stats().sessions == 0 && store.stats().bytes == 0);
    std::printf("  PASS: aggregate and per-session byte budgets\n");
}

/* ================================================================== */
/*  Test 6: evicted entry stays alive                                  */
/* ================================================================== */

static void test_evicted_entry_alive() {
    tl::KvCacheStore::Config cfg;
    cfg.max_sessions = 1;
    tl::KvCacheStore store(cfg);

    std::shared_ptr<tl::KvCacheEntry> held, other;
    CHECK(store.get_or_create("held", k_shape, 4, &held) == TL_OK);
    std::vector<float> k(8, 1.5f), v(8, 2.5f);
    CHECK(held->append_kv(0, k, v, 1) == TL_OK);
    CHECK(held->append_kv(1, k, v, 1) == TL_OK);
    CHECK(held->commit(1) == TL_OK);

    CHECK(store.get_or_create("other", k_shape, 4, &other) == TL_OK);
    CHECK(!store.try_get("held"));
    CHECK(held.use_count() == 1);
    CHECK(held->current_tokens() == 1);
    CHECK(held->keys(1, 0, 1)[3] == 1.5f);
    std::printf("  PASS: evicted entry stays valid for its holder\n");
}

/* ================================================================== */
/*  Test 7: LCP / reuse decision                                       */
/* ================================================================== */

static void test_reuse_decision() {
    std::vector<int32_t> p1 = {1, 2, 3};
    std::vector<int32_t> p2 = {1, 2, 3, 4, 5};
    std::vector<int32_t> ed = {1, 9, 3, 4, 5};
    std::vector<int32_t> empty;

    CHECK(tl::longest_common_prefix(p1, p2) == 3);
    CHECK(tl::longest_common_prefix(p2, ed) == 1);
    CHECK(tl::longest_common_prefix(p1, empty) == 0);
    CHECK(tl::longest_common_prefix(p2, p2) == 5);

    tl::CacheReuseDecision d = tl::decide_cache_reuse(p1, p2, 3, 3);
    CHECK(d.reuse && d.lcp == 3 && d.start == 3);

    /* Any disagreement: full prefill from 0. */
    d = tl::decide_cache_reuse(p1, p2, 2, 3);
    CHECK(!d.reuse && d.start == 0 && d.lcp == 3);
    d = tl::decide_cache_reuse(p1, p2, 3, 0);          /* evicted or reset */
    CHECK(!d.reuse && d.start == 0);
    d = tl::decide_cache_reuse(p1, ed, 3, 3);          /* edited history */
    CHECK(!d.reuse && d.lcp == 1);
    d = tl::decide_cache_reuse(empty, p2, 0, 0);       /* first turn */
    CHECK(!d.reuse && d.start == 0);

    tl::KvCacheStore store;
    store.record_lookup(true, 3);
    store.record_lookup(false, 0);
    store.record_lookup(true, 7);
    tl::KvCacheStore::Stats s = store.stats();
    CHECK(s.hits == 2 && s.misses == 1 && s.reused_tokens == 10);
    std::printf("  PASS: LCP and three-way reuse decision\n");
}

/* ================================================================== */
/*  Test 8: concurrent access                                          */
/* ================================================================== */

static void test_concurrent() {
    const uint64_t one = tl::kv_bytes_for(k_shape, 8);
    tl::KvCacheStore::Config cfg;
    cfg.max_sessions = 5;
    cfg.max_bytes_total = one * 4;
    tl::KvCacheStore store(cfg);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                std::shared_ptr<tl::KvCacheEntry> e;
                std::string id = "t" + std::to_string(t) + "-" + std::to_string(i % 10);
                if (store.get_or_create(id, k_shape, 8, &e) != TL_OK || !e) ++failures;
                else if (e->commit(1) != TL_OK) e->reset();
                if (i % 7 == 0) store.remove(id);
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(failures.load() == 0);
    tl::KvCacheStore::Stats s = store.stats();
    CHECK(s.sessions <= 4);
    CHECK(s.bytes <= cfg.max_bytes_total);
    CHECK(s.bytes == s.sessions * one);
    std::printf("  PASS: concurrent GetOrCreate keeps the capacity invariant\n");
}

/* ================================================================== */
/*  Main                                                               */
/* ================================================================== */

int main() {
    tl_log_set_level(TL_LOG_ERROR);
    std::printf("kv_cache_store_test: KV entries and LRU store\n");
    test_entry_basics();
    test_entry_shrink();
    test_get_or_create();
    test_lru_sessions();
    test_byte_budgets();
    test_evicted_entry_alive();
    test_reuse_decision();
    test_concurrent();
    std::printf("OK: all KV cache store tests passed\n");
    return 0;
}

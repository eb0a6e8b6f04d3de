/**
 * @file inference_engine_test.cpp
 * @brief InferenceEngine: concurrency slots, async submission, isolation
 *
 * 6 test functions:
 *   1. Session factory validates options
 *   2. Semaphore bounds concurrently active generations
 *   3. generate_async futures
 *   4. Cancellation while waiting for a slot
 *   5. Concurrent sessions on one shared model stay isolated
 *   6. Request metrics and the log callback
 */

#include "tokenloom/InferenceEngine.hpp"
#include "tokenloom/metrics.h"
#include "model/byte_tokenizer.hpp"
#include "model/reference_model.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <future>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

static void update_max(std::atomic<uint32_t>& m, uint32_t v) {
    uint32_t cur = m.load();
    while (v > cur && !m.compare_exchange_weak(cur, v)) {}
}

/* ================================================================== */
/*  Test 1: session factory                                            */
/* ================================================================== */

static void test_create_session() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    CHECK(engine.valid());

    std::unique_ptr<tl::GenerationSession> s;
    std::string err;
    tl::GenerationOptions bad;
    bad.max_new_tokens = 0;
    CHECK(engine.create_session(bad, &s, &err) == TL_ERROR_INVALID_ARG);
    CHECK(!s);
    CHECK(err.find("MaxNewTokens") != std::string::npos);

    CHECK(engine.create_session(tl::GenerationOptions{}, &s, &err, "named") == TL_OK);
    CHECK(s && s->session_id() == "named");
    CHECK(engine.create_session(tl::GenerationOptions{}, nullptr) == TL_ERROR_INVALID_ARG);

    tl::InferenceEngine broken(tl::ModelHandle(), tok.handle());
    CHECK(!broken.valid());
    CHECK(broken.create_session(tl::GenerationOptions{}, &s) == TL_ERROR_INVALID_ARG);
    std::printf("  PASS: session factory\n");
}

/* ================================================================== */
/*  Test 2: semaphore bound                                            */
/* ================================================================== */

static void test_concurrency_bound() {
    tl::ReferenceModel::Config mc;
    mc.forward_delay_us = 2000;
    tl::ReferenceModel model(mc);
    tl::ByteTokenizer tok;
    tl::InferenceEngine::Config ec;
    ec.max_concurrent_sessions = 2;
    tl::InferenceEngine engine(model.handle(), tok.handle(), ec);

    tl::GenerationOptions o;
    o.seed = 3;
    o.max_new_tokens = 6;
    o.stop_token_ids = {};

    std::atomic<uint32_t> max_active{0};
    std::vector<std::unique_ptr<tl::GenerationSession>> sessions(6);
    for (auto& s : sessions) CHECK(engine.create_session(o, &s) == TL_OK);

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (auto& s : sessions) {
        threads.emplace_back([&, sp = s.get()] {
            tl::GenerationResult r = engine.generate(*sp, "concurrent", {},
                [&](const tl::GeneratedToken&) { update_max(max_active, engine.active()); });
            if (r.ok()) ++ok;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(ok.load() == 6);
    CHECK(max_active.load() >= 1);
    CHECK(max_active.load() <= 2);
    CHECK(engine.active() == 0);
    std::printf("  PASS: at most 2 concurrent generations (max seen %u)\n",
                max_active.load());
}

/* ================================================================== */
/*  Test 3: async                                                      */
/* ================================================================== */

static void test_async() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine::Config ec;
    ec.worker_threads = 3;
    tl::InferenceEngine engine(model.handle(), tok.handle(), ec);

    tl::GenerationOptions o;
    o.max_new_tokens = 5;
    o.seed = 21;

    std::vector<std::unique_ptr<tl::GenerationSession>> sessions(4);
    std::vector<std::future<tl::GenerationResult>> futures;
    std::atomic<int> streamed{0};
    for (auto& s : sessions) {
        CHECK(engine.create_session(o, &s) == TL_OK);
        futures.push_back(engine.generate_async(*s, "async prompt", {},
            [&](const tl::GeneratedToken&) { ++streamed; }));
    }

    size_t total = 0;
    for (auto& f : futures) {
        tl::GenerationResult r = f.get();
        CHECK(r.ok());
        CHECK(!r.tokens.empty() && r.tokens.size() <= 5);
        total += r.tokens.size();
    }
    CHECK(static_cast<size_t>(streamed.load()) == total);

    /* Same session submitted twice at once: one of them is rejected or both
       serialize; never interleaved. */
    auto f1 = engine.generate_async(*sessions[0], "again");
    auto f2 = engine.generate_async(*sessions[0], "again");
    tl::GenerationResult a = f1.get(), b = f2.get();
    CHECK(a.ok() || a.status == TL_ERROR_BUSY);
    CHECK(b.ok() || b.status == TL_ERROR_BUSY);
    CHECK(a.ok() || b.ok());
    std::printf("  PASS: generate_async\n");
}

/* ================================================================== */
/*  Test 4: cancelled while waiting                                    */
/* ================================================================== */

static void test_cancel_while_waiting() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine::Config ec;
    ec.max_concurrent_sessions = 1;
    tl::InferenceEngine engine(model.handle(), tok.handle(), ec);

    std::unique_ptr<tl::GenerationSession> s;
    CHECK(engine.create_session(tl::GenerationOptions{}, &s) == TL_OK);

    tl::InferenceEngine::Slot held;
    CHECK(engine.acquire_slot({}, &held) == TL_OK);
    CHECK(held.held() && engine.active() == 1);

    std::stop_source src;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        src.request_stop();
    });
    auto t0 = std::chrono::steady_clock::now();
    tl::GenerationResult r = engine.generate(*s, "blocked", src.get_token());
    auto waited = std::chrono::steady_clock::now() - t0;
    canceller.join();

    CHECK(r.status == TL_ERROR_CANCELLED);
    CHECK(r.finish_reason == TL_FINISH_CANCELLED);
    CHECK(r.tokens.empty());
    CHECK(waited >= std::chrono::milliseconds(25));
    CHECK(model.forward_calls() == 0);

    /* Pre-cancelled token never waits. */
    tl::InferenceEngine::Slot other;
    CHECK(engine.acquire_slot(src.get_token(), &other) == TL_ERROR_CANCELLED);
    CHECK(!other.held());

    held.release();
    CHECK(!held.held() && engine.active() == 0);
    r = engine.generate(*s, "free now");
    CHECK(r.ok());

    /* Slots move. */
    tl::InferenceEngine::Slot a;
    CHECK(engine.acquire_slot({}, &a) == TL_OK);
    tl::InferenceEngine::Slot b(std::move(a));
    CHECK(!a.held() && b.held());
    CHECK(engine.active() == 1);
    b = tl::InferenceEngine::Slot();
    CHECK(engine.active() == 0);
    std::printf("  PASS: cancellation while waiting for a slot\n");
}

/* ================================================================== */
/*  Test 5: isolation on a shared model                                */
/* ================================================================== */

static void test_isolation() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine::Config ec;
    ec.worker_threads = 4;
    tl::InferenceEngine engine(model.handle(), tok.handle(), ec);

    tl::GenerationOptions o;
    o.seed = 99;
    o.temperature = 1.0f;
    o.top_k = 0;
    o.top_p = 1.0f;
    o.max_new_tokens = 24;

    const std::vector<std::string> prompts = {"alpha", "beta beta", "gamma", "delta!"};

    /* Sequential reference outputs. */
    std::vector<std::string> expected;
    for (const auto& p : prompts) {
        std::unique_ptr<tl::GenerationSession> s;
        CHECK(engine.create_session(o, &s) == TL_OK);
        tl::GenerationResult r = engine.generate(*s, p);
        CHECK(r.ok());
        expected.push_back(r.text);
    }

    /* Same work, all at once, on the one model. */
    for (int round = 0; round < 3; ++round) {
        std::vector<std::unique_ptr<tl::GenerationSession>> sessions(prompts.size());
        std::vector<std::future<tl::GenerationResult>> futures;
        for (size_t i = 0; i < prompts.size(); ++i) {
            CHECK(engine.create_session(o, &sessions[i]) == TL_OK);
            futures.push_back(engine.generate_async(*sessions[i], prompts[i]));
        }
        for (size_t i = 0; i < futures.size(); ++i) {
            tl::GenerationResult r = futures[i].get();
            CHECK(r.ok());
            CHECK(r.text == expected[i]);
        }
    }
    std::printf("  PASS: concurrent sessions on a shared model are isolated\n");
}

/* ================================================================== */
/*  Test 6: metrics and logging                                        */
/* ================================================================== */

static std::atomic<int> g_engine_logs{0};
static std::atomic<int> g_error_logs{0};

static void count_logs(tl_log_level level, const char* component,
                       const char*, void*) {
    if (std::strcmp(component, "engine") == 0) ++g_engine_logs;
    if (level >= TL_LOG_ERROR) ++g_error_logs;
}

static void test_metrics_and_logging() {
    tl_metrics_reset();
    tl_log_set_callback(count_logs, nullptr);
    tl_log_set_level(TL_LOG_DEBUG);

    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());

    tl::GenerationOptions o;
    o.max_new_tokens = 4;
    o.stop_token_ids = {};
    std::unique_ptr<tl::GenerationSession> s;
    CHECK(engine.create_session(o, &s) == TL_OK);

    tl::GenerationResult ok = engine.generate(*s, "metrics");
    CHECK(ok.ok());

    std::stop_source src;
    src.request_stop();
    tl::GenerationResult cancelled = s->generate("metrics", src.get_token());
    CHECK(cancelled.status == TL_ERROR_CANCELLED);

    o.max_input_tokens = 2;
    o.max_context_tokens = 16;
    CHECK(engine.create_session(o, &s) == TL_OK);
    tl::GenerationResult too_long = s->generate("far too long");
    CHECK(too_long.status == TL_ERROR_RESOURCE_LIMIT);

    tl_metrics_snapshot snap;
    tl_metrics_snapshot_get(&snap);
    CHECK(snap.completed_requests == 1);
    CHECK(snap.cancelled_requests == 1);
    CHECK(snap.failed_requests == 1);
    CHECK(snap.active_requests == 0);
    CHECK(snap.tokens_generated == ok.tokens.size());
    CHECK(snap.prefill_tokens >= 7);

    char buf[4096];
    CHECK(tl_metrics_to_json(buf, sizeof(buf)) > 0);
    CHECK(std::strstr(buf, "\"completed_requests\":1") != nullptr);
    CHECK(tl_metrics_to_prometheus(buf, sizeof(buf)) > 0);
    CHECK(std::strstr(buf, "tl_requests_failed 1") != nullptr);

    CHECK(g_engine_logs.load() > 0);
    CHECK(g_error_logs.load() >= 1);

    tl_log_set_level(TL_LOG_OFF);
    tl_log_set_callback(nullptr, nullptr);
    std::printf("  PASS: request metrics and log callback\n");
}

/* ================================================================== */
/*  Main                                                               */
/* ================================================================== */

int main() {
    tl_log_set_level(TL_LOG_OFF);
    std::printf("inference_engine_test: slots and async submission\n");
    test_create_session();
    test_concurrency_bound();
    test_async();
    test_cancel_while_waiting();
    test_isolation();
    test_metrics_and_logging();
    std::printf("OK: all inference engine tests passed\n");
    return 0;
}

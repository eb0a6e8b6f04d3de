/**
 * @file conversation_test.cpp
 * @brief Multi-turn conversations: incremental KV reuse and its resets
 *
 * 9 test functions:
 *   1. Chat templates: rendering and AUTO detection
 *   2. Second turn reuses the previous prompt's cache
 *   3. Reused cache yields the same output as a full prefill
 *   4. History overflow (edited prefix) forces a full prefill
 *   5. Eviction by another conversation forces a full prefill
 *   6. Shape mismatch and failed turns leave history intact
 *   7. reset() / dispose()
 *   8. Store reset(session) while leased and after
 *   9. Prompt over MaxContextTokens ends with MaxContext, store on or off
 */

#include "tokenloom/ConversationSession.hpp"
#include "tokenloom/InferenceEngine.hpp"
#include "tokenloom/metrics.h"
#include "model/byte_tokenizer.hpp"
#include "model/reference_model.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

static tl::GenerationOptions short_replies(uint64_t seed) {
    tl::GenerationOptions o;
    o.seed = seed;
    o.max_new_tokens = 4;
    o.max_input_tokens = 400;
    o.max_context_tokens = 512;
    return o;
}

/* ================================================================== */
/*  Test 1: templates                                                  */
/* ================================================================== */

static void test_templates() {
    std::vector<tl::ChatMessage> msgs = {
        {tl::ChatRole::SYSTEM, "be brief"},
        {tl::ChatRole::USER, "hi"},
        {tl::ChatRole::ASSISTANT, "hello"},
        {tl::ChatRole::USER, "bye"},
    };

    CHECK(tl::render_chatml(msgs) ==
          "<|im_start|>system\nbe brief<|im_end|>\n"
          "<|im_start|>user\nhi<|im_end|>\n"
          "<|im_start|>assistant\nhello<|im_end|>\n"
          "<|im_start|>user\nbye<|im_end|>\n"
          "<|im_start|>assistant\n");
    CHECK(tl::render_llama(msgs) ==
          "[INST] <<SYS>>\nbe brief\n<</SYS>>\n\nhi [/INST] hello [INST] bye [/INST]");
    CHECK(tl::render_phi3(msgs) ==
          "<|system|>\nbe brief<|end|>\n<|user|>\nhi<|end|>\n"
          "<|assistant|>\nhello<|end|>\n<|user|>\nbye<|end|>\n<|assistant|>\n");

    CHECK(tl::detect_chat_format("llama-3-8b") == tl::ChatFormat::LLAMA);
    CHECK(tl::detect_chat_format("mistral-7b") == tl::ChatFormat::LLAMA);
    CHECK(tl::detect_chat_format("phi-3-mini") == tl::ChatFormat::PHI3);
    CHECK(tl::detect_chat_format("qwen2") == tl::ChatFormat::CHATML);

    tl::ChatTemplate t = tl::ChatTemplate::select(tl::ChatFormat::AUTO, "phi3");
    CHECK(t.format() == tl::ChatFormat::PHI3);
    CHECK(std::string(t.turn_end()) == "<|end|>");
    t = tl::ChatTemplate::select(tl::ChatFormat::LLAMA, "phi3");
    CHECK(t.format() == tl::ChatFormat::LLAMA);
    CHECK(t.render(msgs) == tl::render_llama(msgs));
    std::printf("  PASS: chat templates\n");
}

/* ================================================================== */
/*  Test 2: reuse on the second turn                                   */
/* ================================================================== */

static void test_second_turn_reuse() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    tl::KvCacheStore store;

    tl::ConversationSession::Options co;
    co.session_id = "chat-1";
    co.system_prompt = "You are terse.";
    co.generation = short_replies(11);
    tl::ConversationSession convo(engine, store, co);
    CHECK(convo.status() == TL_OK);
    CHECK(convo.chat_template().format() == tl::ChatFormat::CHATML);

    tl::GenerationResult r1 = convo.send("hi");
    CHECK(r1.ok());
    CHECK(r1.reused_tokens == 0);
    CHECK(convo.history().size() == 3);
    CHECK(convo.history()[2].role == tl::ChatRole::ASSISTANT);
    CHECK(convo.history()[2].content == r1.text);
    CHECK(convo.cached_tokens() == r1.prompt_tokens);

    auto entry = store.try_get("chat-1");
    CHECK(entry);
    CHECK(entry->current_tokens() == r1.prompt_tokens);

    uint32_t cached = convo.cached_tokens();
    tl::GenerationResult r2 = convo.send("and now?");
    CHECK(r2.ok());
    CHECK(r2.reused_tokens == cached);
    CHECK(r2.prompt_tokens > cached);
    CHECK(convo.history().size() == 5);

    tl::KvCacheStore::Stats s = store.stats();
    CHECK(s.hits == 1 && s.misses == 1);
    CHECK(s.reused_tokens == cached);
    std::printf("  PASS: second turn reuses %u cached tokens\n", cached);
}

/* ================================================================== */
/*  Test 3: reuse is invisible in the output                           */
/* ================================================================== */

static std::vector<std::string> run_turns(bool cache_enabled) {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    tl::KvCacheStore::Config kc;
    kc.enabled = cache_enabled;
    tl::KvCacheStore store(kc);

    tl::ConversationSession::Options co;
    co.generation = short_replies(77);
    co.generation.temperature = 1.0f;
    co.generation.top_k = 0;
    co.generation.top_p = 1.0f;
    tl::ConversationSession convo(engine, store, co);

    std::vector<std::string> replies;
    uint32_t reused = 0;
    for (const char* msg : {"first", "second", "third"}) {
        tl::GenerationResult r = convo.send(msg);
        CHECK(r.ok());
        reused += r.reused_tokens;
        replies.push_back(r.text);
    }
    CHECK(cache_enabled ? reused > 0 : reused == 0);
    return replies;
}

static void test_reuse_matches_full_prefill() {
    std::vector<std::string> cached = run_turns(true);
    std::vector<std::string> full   = run_turns(false);
    CHECK(cached == full);
    std::printf("  PASS: cached turns match full recomputation\n");
}

/* ================================================================== */
/*  Test 4: overflow drops a turn -> full prefill                      */
/* ================================================================== */

static void test_overflow_forces_reset() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    tl::KvCacheStore store;

    /* ChatML: a user turn "hi" renders to 30 bytes, the assistant header to 22. */
    tl::ConversationSession::Options co;
    co.generation = short_replies(5);
    co.generation.max_input_tokens = 150;
    tl::ConversationSession convo(engine, store, co);

    tl::GenerationResult r1 = convo.send("hi");
    CHECK(r1.ok() && r1.prompt_tokens == 52);
    tl::GenerationResult r2 = convo.send("yo");
    CHECK(r2.ok() && r2.reused_tokens == 52);
    CHECK(convo.dropped_turns() == 0);

    tl::GenerationResult r3 = convo.send("ok");
    CHECK(r3.ok());
    CHECK(convo.dropped_turns() == 1);
    CHECK(r3.prompt_tokens <= 150);
    CHECK(r3.reused_tokens == 0);
    CHECK(convo.history().front().content == "yo");
    CHECK(store.stats().misses == 2);
    std::printf("  PASS: dropped history turn forces a full prefill\n");
}

/* ================================================================== */
/*  Test 5: eviction -> full prefill                                   */
/* ================================================================== */

static void test_eviction_forces_reset() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    tl::KvCacheStore::Config kc;
    kc.max_sessions = 1;
    tl::KvCacheStore store(kc);

    tl::ConversationSession::Options ca;
    ca.session_id = "A";
    ca.generation = short_replies(1);
    tl::ConversationSession a(engine, store, ca);
    tl::ConversationSession::Options cb = ca;
    cb.session_id = "B";
    tl::ConversationSession b(engine, store, cb);

    CHECK(a.send("one").ok());
    CHECK(b.send("one").ok());                  /* evicts A */
    CHECK(!store.try_get("A"));

    tl::GenerationResult r = a.send("two");
    CHECK(r.ok());
    CHECK(r.reused_tokens == 0);
    r = a.send("three");                        /* A is cached again */
    CHECK(r.ok());
    CHECK(r.reused_tokens > 0);
    CHECK(store.stats().evictions >= 2);
    std::printf("  PASS: eviction forces a full prefill\n");
}

/* ================================================================== */
/*  Test 6: failures                                                   */
/* ================================================================== */

static void test_failures() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    tl::KvCacheStore store;

    /* Another model shape already owns the id. */
    std::shared_ptr<tl::KvCacheEntry> foreign;
    CHECK(store.get_or_create("shared-id", tl_model_shape{7, 1, 4}, 16, &foreign) == TL_OK);
    tl::ConversationSession::Options co;
    co.session_id = "shared-id";
    co.generation = short_replies(3);
    tl::ConversationSession clash(engine, store, co);
    tl::GenerationResult r = clash.send("hello");
    CHECK(r.status == TL_ERROR_SHAPE_MISMATCH);
    CHECK(clash.history().empty());
    CHECK(model.forward_calls() == 0);

    /* A cancelled turn is not recorded, and the cache is not trusted. */
    co.session_id = "cancel-me";
    tl::ConversationSession convo(engine, store, co);
    CHECK(convo.send("first").ok());
    size_t turns = convo.history().size();
    std::stop_source src;
    src.request_stop();
    r = convo.send("second", src.get_token());
    CHECK(r.status == TL_ERROR_CANCELLED);
    CHECK(convo.history().size() == turns);
    CHECK(convo.cached_tokens() == 0);
    r = convo.send("second");
    CHECK(r.ok() && r.reused_tokens == 0);

    /* Invalid generation options surface at construction and on send. */
    tl::ConversationSession::Options bad;
    bad.generation.temperature = -1.0f;
    tl::ConversationSession broken(engine, store, bad);
    CHECK(broken.status() == TL_ERROR_INVALID_ARG);
    CHECK(broken.send("x").status == TL_ERROR_INVALID_ARG);
    std::printf("  PASS: failed turns leave history and cache consistent\n");
}

/* ================================================================== */
/*  Test 7: reset / dispose                                            */
/* ================================================================== */

static void test_reset_dispose() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    tl::KvCacheStore store;

    tl::ConversationSession::Options co;
    co.session_id = "resettable";
    co.system_prompt = "sys";
    co.generation = short_replies(9);
    tl::ConversationSession convo(engine, store, co);

    CHECK(convo.send("a").ok());
    CHECK(convo.send("b").ok());
    CHECK(convo.history().size() == 5);

    CHECK(convo.reset() == TL_OK);
    CHECK(convo.history().size() == 1);
    CHECK(convo.history()[0].role == tl::ChatRole::SYSTEM);
    CHECK(convo.cached_tokens() == 0);
    CHECK(!store.try_get("resettable"));

    tl::GenerationResult r = convo.send("c");
    CHECK(r.ok() && r.reused_tokens == 0);

    CHECK(convo.dispose() == TL_OK);
    CHECK(convo.disposed());
    CHECK(convo.dispose() == TL_OK);
    CHECK(convo.send("d").status == TL_ERROR_DISPOSED);
    CHECK(store.stats().sessions == 0);
    std::printf("  PASS: reset and dispose\n");
}

/* ================================================================== */
/*  Test 8: store reset of one session                                 */
/* ================================================================== */

static void test_store_reset() {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    tl::KvCacheStore store;

    tl::ConversationSession::Options co;
    co.session_id = "forgettable";
    co.generation = short_replies(21);
    tl::ConversationSession convo(engine, store, co);
    tl::GenerationResult r1 = convo.send("one");
    CHECK(r1.ok());

    /* Held outside the store: contents stay. */
    std::shared_ptr<tl::KvCacheEntry> held = store.try_get("forgettable");
    CHECK(held && held->current_tokens() == r1.prompt_tokens);
    CHECK(store.reset("forgettable") == TL_ERROR_BUSY);
    CHECK(held->current_tokens() == r1.prompt_tokens);
    held.reset();

    CHECK(store.reset("forgettable") == TL_OK);
    CHECK(store.try_get("forgettable")->current_tokens() == 0);
    CHECK(store.reset("nobody") == TL_ERROR_NOT_FOUND);

    /* The conversation notices the emptied entry and prefills in full. */
    tl::GenerationResult r2 = convo.send("two");
    CHECK(r2.ok());
    CHECK(r2.reused_tokens == 0);
    tl::GenerationResult r3 = convo.send("three");
    CHECK(r3.ok() && r3.reused_tokens == r2.prompt_tokens);
    std::printf("  PASS: store reset refuses leased entries, then forces a full prefill\n");
}

/* ================================================================== */
/*  Test 9: prompt longer than MaxContextTokens                        */
/* ================================================================== */

static tl::GenerationResult send_long_message(bool cache_enabled) {
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    tl::KvCacheStore::Config kc;
    kc.enabled = cache_enabled;
    tl::KvCacheStore store(kc);

    tl::ConversationSession::Options co;
    co.generation = short_replies(13);
    co.generation.max_context_tokens = 64;
    co.generation.max_input_tokens = 0;
    tl::ConversationSession convo(engine, store, co);

    /* 100 bytes of user text render to a 150-byte ChatML prompt. */
    tl::GenerationResult r = convo.send(std::string(100, 'x'));
    CHECK(model.forward_calls() == 0);
    CHECK(convo.cached_tokens() == 0);
    CHECK(convo.history().size() == 2);
    return r;
}

static void test_prompt_over_context_budget() {
    for (bool cache_enabled : {true, false}) {
        tl::GenerationResult r = send_long_message(cache_enabled);
        CHECK(r.ok());
        CHECK(r.finish_reason == TL_FINISH_MAX_CONTEXT);
        CHECK(r.prompt_tokens == 150);
        CHECK(r.tokens.empty() && r.text.empty());
    }

    /* A leased arena smaller than the prompt: same normal finish. */
    tl::ReferenceModel model;
    tl::ByteTokenizer tok;
    tl::InferenceEngine engine(model.handle(), tok.handle());
    std::unique_ptr<tl::GenerationSession> s;
    CHECK(engine.create_session(short_replies(13), &s) == TL_OK);
    std::vector<int32_t> ids(40, 'x');
    tl::CacheLease lease;
    lease.entry = tl::KvCacheEntry::create("small", model.shape(), 16);
    CHECK(lease.entry);
    tl::GenerationResult r = engine.generate_tokens(*s, ids, {}, {}, lease);
    CHECK(r.ok());
    CHECK(r.finish_reason == TL_FINISH_MAX_CONTEXT);
    CHECK(r.tokens.empty());
    CHECK(model.forward_calls() == 0);
    std::printf("  PASS: prompt over the context budget ends with MaxContext\n");
}

/* ================================================================== */
/*  Main                                                               */
/* ================================================================== */

int main() {
    tl_log_set_level(TL_LOG_OFF);
    std::printf("conversation_test: multi-turn KV reuse\n");
    test_templates();
    test_second_turn_reuse();
    test_reuse_matches_full_prefill();
    test_overflow_forces_reset();
    test_eviction_forces_reset();
    test_failures();
    test_reset_dispose();
    test_store_reset();
    test_prompt_over_context_budget();
    std::printf("OK: all conversation tests passed\n");
    return 0;
}

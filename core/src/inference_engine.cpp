/**
 * @file inference_engine.cpp
 * @brief Concurrency slots, session factory, async submission
 */

#include "tokenloom/InferenceEngine.hpp"
#include "tokenloom/metrics.h"

#include <chrono>
#include <cstddef>
#include <utility>

namespace tl {

namespace {

/* Granularity of the cancellable slot wait. */
constexpr auto k_slot_poll = std::chrono::milliseconds(5);

GenerationResult slot_failure(tl_status st) {
    GenerationResult r;
    r.status = st;
    r.finish_reason = (st == TL_ERROR_CANCELLED) ? TL_FINISH_CANCELLED : TL_FINISH_NONE;
    r.error  = (st == TL_ERROR_CANCELLED)
               ? "cancelled while waiting for a concurrency slot"
               : std::string("could not acquire a concurrency slot: ") + tl_status_str(st);
    return r;
}

} // namespace

/* ================================================================== */
/*  Slot                                                               */
/* ================================================================== */

InferenceEngine::Slot& InferenceEngine::Slot::operator=(Slot&& o) noexcept {
    if (this != &o) {
        release();
        engine_ = o.engine_;
        o.engine_ = nullptr;
    }
    return *this;
}

void InferenceEngine::Slot::release() {
    if (engine_) {
        engine_->release_slot();
        engine_ = nullptr;
    }
}

/* ================================================================== */
/*  Engine                                                             */
/* ================================================================== */

InferenceEngine::InferenceEngine(ModelHandle model, TokenizerHandle tokenizer,
                                 Config cfg)
    : model_(model), tokenizer_(tokenizer), cfg_(cfg) {
    if (cfg_.max_concurrent_sessions > 0) {
        slots_ = std::make_unique<std::counting_semaphore<>>(
            static_cast<std::ptrdiff_t>(cfg_.max_concurrent_sessions));
    }
    pool_ = std::make_unique<ThreadPool>(cfg_.worker_threads);
    if (!valid()) {
        tl_log(TL_LOG_ERROR, "engine", "model or tokenizer vtable is incomplete");
        return;
    }
    tl_log(TL_LOG_INFO, "engine", "model '%s': vocab=%u ctx=%u, max concurrent=%u",
           model_.name(), model_.vocab_size(), model_.context_length(),
           cfg_.max_concurrent_sessions);
}

InferenceEngine::~InferenceEngine() {
    /* Drain queued async work before the semaphore goes away. */
    pool_.reset();
}

tl_status InferenceEngine::create_session(const GenerationOptions& options,
                                          std::unique_ptr<GenerationSession>* out,
                                          std::string* err,
                                          std::string session_id) {
    if (!out) return TL_ERROR_INVALID_ARG;
    out->reset();
    auto s = std::make_unique<GenerationSession>(model_, tokenizer_, options,
                                                 std::move(session_id));
    if (s->status() != TL_OK) {
        if (err) *err = s->init_error();
        return s->status();
    }
    *out = std::move(s);
    return TL_OK;
}

tl_status InferenceEngine::acquire_slot(std::stop_token cancel, Slot* out) {
    if (!out) return TL_ERROR_INVALID_ARG;
    if (cancel.stop_requested()) return TL_ERROR_CANCELLED;

    if (slots_) {
        while (!slots_->try_acquire_for(k_slot_poll)) {
            if (cancel.stop_requested()) return TL_ERROR_CANCELLED;
        }
    }
    active_.fetch_add(1, std::memory_order_acq_rel);
    *out = Slot(this);
    return TL_OK;
}

void InferenceEngine::release_slot() {
    active_.fetch_sub(1, std::memory_order_acq_rel);
    if (slots_) slots_->release();
}

GenerationResult InferenceEngine::generate(GenerationSession& session,
                                           std::string_view prompt,
                                           std::stop_token cancel,
                                           const TokenSink& sink) {
    Slot slot;
    tl_status st = acquire_slot(cancel, &slot);
    if (st != TL_OK) return slot_failure(st);
    return session.generate(prompt, std::move(cancel), sink);
}

GenerationResult InferenceEngine::generate_tokens(GenerationSession& session,
                                                  std::span<const int32_t> prompt,
                                                  std::stop_token cancel,
                                                  const TokenSink& sink,
                                                  CacheLease lease) {
    Slot slot;
    tl_status st = acquire_slot(cancel, &slot);
    if (st != TL_OK) return slot_failure(st);
    return session.generate_tokens(prompt, std::move(cancel), sink, std::move(lease));
}

std::future<GenerationResult> InferenceEngine::generate_async(GenerationSession& session,
                                                              std::string prompt,
                                                              std::stop_token cancel,
                                                              TokenSink sink) {
    return pool_->submit(
        [this, &session, prompt = std::move(prompt), cancel = std::move(cancel),
         sink = std::move(sink)]() mutable {
            return generate(session, prompt, std::move(cancel), sink);
        });
}

} // namespace tl

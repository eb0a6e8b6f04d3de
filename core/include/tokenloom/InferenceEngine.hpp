/**
 * @file InferenceEngine.hpp
 * @brief Shared model + tokenizer, concurrency slots, async submission
 *
 * The model is immutable and shared read-only by every session the engine
 * creates. A counting semaphore bounds how many generations run at once;
 * waiting for a slot is the one place a generation blocks before it
 * starts, and that wait observes the caller's stop_token.
 *
 * Usage:
 *   tl::InferenceEngine engine(model, tokenizer, {.max_concurrent_sessions = 4});
 *   std::unique_ptr<tl::GenerationSession> s;
 *   engine.create_session(opts, &s);
 *   auto fut = engine.generate_async(*s, "hello");
 *   tl::GenerationResult r = fut.get();
 */

#ifndef TL_INFERENCE_ENGINE_HPP
#define TL_INFERENCE_ENGINE_HPP

#include "tokenloom/Backend.hpp"
#include "tokenloom/GenerationOptions.hpp"
#include "tokenloom/GenerationSession.hpp"
#include "tokenloom/ThreadPool.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <semaphore>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace tl {

class InferenceEngine {
public:
    struct Config {
        uint32_t max_concurrent_sessions = 0;  /**< 0 = unlimited */
        uint32_t worker_threads          = 2;  /**< for generate_async */
    };

    /** Holds one concurrency slot; releases it on destruction. */
    class Slot {
    public:
        Slot() = default;
        Slot(Slot&& o) noexcept : engine_(o.engine_) { o.engine_ = nullptr; }
        Slot& operator=(Slot&& o) noexcept;
        ~Slot() { release(); }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        bool held() const { return engine_ != nullptr; }
        void release();

    private:
        friend class InferenceEngine;
        explicit Slot(InferenceEngine* e) : engine_(e) {}
        InferenceEngine* engine_ = nullptr;
    };

    InferenceEngine(ModelHandle model, TokenizerHandle tokenizer)
        : InferenceEngine(model, tokenizer, Config{}) {}
    InferenceEngine(ModelHandle model, TokenizerHandle tokenizer, Config cfg);
    ~InferenceEngine();

    InferenceEngine(const InferenceEngine&) = delete;
    InferenceEngine& operator=(const InferenceEngine&) = delete;

    bool valid() const { return model_.valid() && tokenizer_.valid(); }

    const ModelHandle&     model()     const { return model_; }
    const TokenizerHandle& tokenizer() const { return tokenizer_; }
    const Config&          config()    const { return cfg_; }

    /** Validates options; `*out` is left empty on failure. */
    tl_status create_session(const GenerationOptions& options,
                             std::unique_ptr<GenerationSession>* out,
                             std::string* err = nullptr,
                             std::string session_id = {});

    /**
     * Waits for a concurrency slot. TL_ERROR_CANCELLED if `cancel` fires
     * first. Always succeeds immediately when the engine is unlimited.
     */
    tl_status acquire_slot(std::stop_token cancel, Slot* out);

    GenerationResult generate(GenerationSession& session, std::string_view prompt,
                              std::stop_token cancel = {},
                              const TokenSink& sink = {});

    GenerationResult generate_tokens(GenerationSession& session,
                                     std::span<const int32_t> prompt,
                                     std::stop_token cancel = {},
                                     const TokenSink& sink = {},
                                     CacheLease lease = {});

    /**
     * Runs generate() on the worker pool. The session must outlive the
     * returned future's completion.
     */
    std::future<GenerationResult> generate_async(GenerationSession& session,
                                                 std::string prompt,
                                                 std::stop_token cancel = {},
                                                 TokenSink sink = {});

    /** Generations currently holding a slot. */
    uint32_t active() const { return active_.load(std::memory_order_acquire); }

private:
    void release_slot();

    ModelHandle     model_;
    TokenizerHandle tokenizer_;
    Config          cfg_;

    std::unique_ptr<std::counting_semaphore<>> slots_;   /**< null = unlimited */
    std::atomic<uint32_t>                      active_{0};
    std::unique_ptr<ThreadPool>                pool_;
};

} // namespace tl

#endif // TL_INFERENCE_ENGINE_HPP

/**
 * @file GenerationSession.hpp
 * @brief Per-request generation state machine: prefill, decode, stop.
 *
 * INTERNAL TO CORE.
 *
 *   Uninitialized -> Prefill -> Decode (loop) -> Terminated
 *
 * A session owns its token context, cache position, sampler scratch,
 * stop-sequence ring and RNG. It is NOT safe for concurrent invocation:
 * a second generate() while one is in flight returns TL_ERROR_BUSY
 * immediately instead of interleaving.
 *
 * The attention history is either session-owned (standalone requests,
 * cleared after every generation) or leased from a KvCacheStore by a
 * ConversationSession (kept on success, cleared on failure).
 */

#ifndef TL_GENERATION_SESSION_HPP
#define TL_GENERATION_SESSION_HPP

#include "tokenloom/Backend.hpp"
#include "tokenloom/GenerationOptions.hpp"
#include "tokenloom/KvCacheEntry.hpp"
#include "tokenloom/Sampler.hpp"
#include "tokenloom/StopSequenceDetector.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace tl {

struct GeneratedToken {
    int32_t              token_id = -1;
    std::string          text;           /**< decoded fragment; empty for EOS / stop ids */
    uint32_t             index    = 0;   /**< ordinal among generated tokens */
    std::optional<float> logprob;
    tl_finish_reason     finish_reason = TL_FINISH_NONE;
};

/** Streaming sink, called on the generating thread once per token. */
using TokenSink = std::function<void(const GeneratedToken&)>;

struct GenerationResult {
    tl_status                   status        = TL_OK;
    tl_finish_reason            finish_reason = TL_FINISH_NONE;
    std::string                 text;
    std::vector<GeneratedToken> tokens;
    uint32_t                    prompt_tokens    = 0;  /**< after truncation / crop */
    uint32_t                    reused_tokens    = 0;
    bool                        prompt_truncated = false;
    uint64_t                    prefill_us       = 0;
    uint64_t                    decode_us        = 0;
    std::string                 error;

    bool ok() const { return status == TL_OK; }
};

/**
 * Acquire/release guard for "one call in flight". acquired() is false when
 * another holder already owns the flag; the flag is released on every exit
 * path of the owner.
 */
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {
        bool expected = false;
        owned_ = flag_.compare_exchange_strong(expected, true,
                                               std::memory_order_acq_rel);
    }
    ~InFlightGuard() {
        if (owned_) flag_.store(false, std::memory_order_release);
    }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    bool acquired() const { return owned_; }

private:
    std::atomic<bool>& flag_;
    bool               owned_ = false;
};

/** A store entry lent to one generation, with the prefix it may keep. */
struct CacheLease {
    std::shared_ptr<KvCacheEntry> entry;
    uint32_t                      reuse_prefix = 0;
};

class GenerationSession {
public:
    /** Options are copied; later changes to the caller's instance are not seen. */
    GenerationSession(ModelHandle model, TokenizerHandle tokenizer,
                      const GenerationOptions& options,
                      std::string session_id = {});
    ~GenerationSession();

    GenerationSession(const GenerationSession&) = delete;
    GenerationSession& operator=(const GenerationSession&) = delete;

    /** TL_OK, or why construction rejected the model / options. */
    tl_status          status()     const { return init_status_; }
    const std::string& init_error() const { return init_error_; }

    const GenerationOptions& options()    const { return options_; }
    const std::string&       session_id() const { return session_id_; }

    GenerationResult generate(std::string_view prompt,
                              std::stop_token cancel = {},
                              const TokenSink& sink = {});

    GenerationResult generate_tokens(std::span<const int32_t> prompt,
                                     std::stop_token cancel = {},
                                     const TokenSink& sink = {},
                                     CacheLease lease = {});

    /** Releases buffers. TL_ERROR_BUSY while a generation is in flight. */
    tl_status dispose();

    bool disposed() const { return disposed_.load(std::memory_order_acquire); }
    bool busy()     const { return in_flight_.load(std::memory_order_acquire); }

    /** Context and cache position left by the last generation. */
    const std::vector<int32_t>& context()  const { return context_; }
    uint32_t                    position() const { return position_; }

private:
    GenerationResult run(std::span<const int32_t> prompt, std::stop_token cancel,
                         const TokenSink& sink, CacheLease& lease);
    tl_status apply_input_policy(GenerationResult& r);
    tl_status ensure_owned_cache(uint32_t max_tokens);
    void      build_piece_table();
    void      finalize_text(GenerationResult& r, const std::vector<int32_t>& text_ids,
                            int stop_index);

    ModelHandle       model_;
    TokenizerHandle   tokenizer_;
    GenerationOptions options_;
    std::string       session_id_;
    tl_status         init_status_ = TL_OK;
    std::string       init_error_;

    Sampler              sampler_;
    SamplerScratch       scratch_;
    StopSequenceDetector stops_;

    std::vector<int32_t> context_;
    uint32_t             position_ = 0;
    std::string          fragment_;
    std::string          generated_text_;

    /* Output-constraint support, built on first constrained generation. */
    std::vector<std::string> pieces_;
    std::vector<int32_t>     fallback_ids_;

    std::shared_ptr<KvCacheEntry> owned_kv_;

    std::atomic<bool> in_flight_{false};
    std::atomic<bool> disposed_{false};
};

} // namespace tl

#endif // TL_GENERATION_SESSION_HPP

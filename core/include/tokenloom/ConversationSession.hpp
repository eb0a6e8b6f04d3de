/**
 * @file ConversationSession.hpp
 * @brief Multi-turn chat over one persistent GenerationSession with
 *        incremental KV reuse from a KvCacheStore.
 *
 * Each send():
 *   1. appends the user turn and renders the whole history through the
 *      chat template chosen at construction
 *   2. drops the oldest non-system turns while the prompt exceeds
 *      MaxInputTokens
 *   3. leases the store entry for the session id and reuses its prefix
 *      only when LCP(previous prompt, new prompt) equals both the count
 *      recorded here and the entry's current count
 *   4. on success, trims the entry back to the prompt length (the
 *      generated tail is re-encoded through the template next turn);
 *      on any failure, resets the entry and forgets the recorded prompt
 */

#ifndef TL_CONVERSATION_SESSION_HPP
#define TL_CONVERSATION_SESSION_HPP

#include "tokenloom/ChatTemplate.hpp"
#include "tokenloom/GenerationSession.hpp"
#include "tokenloom/InferenceEngine.hpp"
#include "tokenloom/KvCacheStore.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace tl {

class ConversationSession {
public:
    struct Options {
        std::string       session_id;          /**< empty = generated */
        ChatFormat        format = ChatFormat::AUTO;
        std::string       system_prompt;
        GenerationOptions generation;
        bool              stop_at_turn_end = true;  /**< template end marker as stop sequence */
    };

    ConversationSession(InferenceEngine& engine, KvCacheStore& store, Options opts);
    ~ConversationSession();

    ConversationSession(const ConversationSession&) = delete;
    ConversationSession& operator=(const ConversationSession&) = delete;

    tl_status          status()     const { return init_status_; }
    const std::string& init_error() const { return init_error_; }

    GenerationResult send(std::string_view user_message,
                          std::stop_token cancel = {},
                          const TokenSink& sink = {});

    /** Clears history (system prompt kept) and drops the store entry. */
    tl_status reset();

    /** reset() plus releasing the generation session. Idempotent. */
    tl_status dispose();

    const std::string&              session_id()    const { return session_id_; }
    const std::vector<ChatMessage>& history()       const { return history_; }
    const ChatTemplate&             chat_template() const { return template_; }
    uint32_t                        cached_tokens() const { return cached_tokens_; }
    uint32_t                        dropped_turns() const { return dropped_turns_; }
    bool disposed() const { return disposed_.load(std::memory_order_acquire); }

private:
    tl_status render_prompt(std::vector<int32_t>& ids, std::string* err);
    void      forget_cache(KvCacheEntry* entry);

    InferenceEngine& engine_;
    KvCacheStore&    store_;
    std::string      session_id_;
    ChatTemplate     template_;
    tl_status        init_status_ = TL_OK;
    std::string      init_error_;

    std::unique_ptr<GenerationSession> gen_;
    std::vector<ChatMessage>           history_;
    std::vector<int32_t>               prev_prompt_;
    uint32_t                           cached_tokens_ = 0;
    uint32_t                           dropped_turns_ = 0;
    std::string                        prompt_text_;

    std::atomic<bool> in_flight_{false};
    std::atomic<bool> disposed_{false};
};

} // namespace tl

#endif // TL_CONVERSATION_SESSION_HPP

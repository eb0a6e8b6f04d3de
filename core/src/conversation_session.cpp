/**
 * @file conversation_session.cpp
 * @brief Chat turns, history overflow, three-way KV reuse protocol
 */

#include "tokenloom/ConversationSession.hpp"
#include "tokenloom/metrics.h"

#include <algorithm>

namespace tl {

namespace {

std::string next_conversation_id() {
    static std::atomic<uint64_t> s_next{1};
    return "conv-" + std::to_string(s_next.fetch_add(1, std::memory_order_relaxed));
}

GenerationResult failed(tl_status st, std::string msg) {
    GenerationResult r;
    r.status = st;
    r.error  = std::move(msg);
    return r;
}

} // namespace

ConversationSession::ConversationSession(InferenceEngine& engine, KvCacheStore& store,
                                         Options opts)
    : engine_(engine), store_(store),
      session_id_(opts.session_id.empty() ? next_conversation_id()
                                          : std::move(opts.session_id)),
      template_(ChatTemplate::select(opts.format, engine.model().valid()
                                                  ? engine.model().name() : "")) {
    if (!opts.system_prompt.empty())
        history_.push_back({ChatRole::SYSTEM, std::move(opts.system_prompt)});

    GenerationOptions gen = opts.generation;
    if (opts.stop_at_turn_end) {
        std::string marker = template_.turn_end();
        if (std::find(gen.stop_sequences.begin(), gen.stop_sequences.end(), marker) ==
            gen.stop_sequences.end())
            gen.stop_sequences.push_back(std::move(marker));
    }

    init_status_ = engine_.create_session(gen, &gen_, &init_error_, session_id_);
    if (init_status_ != TL_OK) {
        tl_log(TL_LOG_WARN, "conversation", "'%s': %s", session_id_.c_str(),
               init_error_.c_str());
        return;
    }
    tl_log(TL_LOG_DEBUG, "conversation", "'%s': template %s", session_id_.c_str(),
           chat_format_str(template_.format()));
}

ConversationSession::~ConversationSession() {
    tl_status st = dispose();
    if (st != TL_OK)
        tl_log(TL_LOG_ERROR, "conversation", "'%s' destroyed while busy",
               session_id_.c_str());
}

/* ================================================================== */
/*  Prompt rendering with overflow policy                              */
/* ================================================================== */

tl_status ConversationSession::render_prompt(std::vector<int32_t>& ids, std::string* err) {
    const uint32_t max_in = gen_->options().max_input_tokens;
    for (;;) {
        prompt_text_ = template_.render(history_);
        tl_status st = engine_.tokenizer().encode(prompt_text_, ids);
        if (st != TL_OK) {
            if (err) *err = std::string("tokenizer encode failed: ") + tl_status_str(st);
            return TL_ERROR_BACKEND;
        }
        if (!max_in || ids.size() <= max_in) return TL_OK;

        /* Oldest non-system turn, never the pending user message. */
        auto last = history_.end() - 1;
        auto it = std::find_if(history_.begin(), last, [](const ChatMessage& m) {
            return m.role != ChatRole::SYSTEM;
        });
        if (it == last) return TL_OK;   /* engine input policy decides */

        auto next = it + 1;
        if (it->role == ChatRole::USER && next != last && next->role == ChatRole::ASSISTANT)
            history_.erase(it, next + 1);
        else
            history_.erase(it);
        ++dropped_turns_;
        tl_log(TL_LOG_DEBUG, "conversation", "'%s': prompt %zu > %u tokens, dropped a turn",
               session_id_.c_str(), ids.size(), max_in);
    }
}

void ConversationSession::forget_cache(KvCacheEntry* entry) {
    if (entry) entry->reset();
    prev_prompt_.clear();
    cached_tokens_ = 0;
}

/* ================================================================== */
/*  send                                                               */
/* ================================================================== */

GenerationResult ConversationSession::send(std::string_view user_message,
                                           std::stop_token cancel,
                                           const TokenSink& sink) {
    InFlightGuard guard(in_flight_);
    if (!guard.acquired())
        return failed(TL_ERROR_BUSY, "conversation '" + session_id_ +
                                         "' already has a turn in flight");
    if (disposed())
        return failed(TL_ERROR_DISPOSED, "conversation '" + session_id_ + "' is disposed");
    if (init_status_ != TL_OK) return failed(init_status_, init_error_);

    history_.push_back({ChatRole::USER, std::string(user_message)});

    std::string err;
    std::vector<int32_t> ids;
    ids.reserve(prev_prompt_.size() + user_message.size() + 64);
    tl_status st = render_prompt(ids, &err);
    if (st != TL_OK) {
        history_.pop_back();
        return failed(st, err);
    }

    /* ---- Lease the store entry ---- */
    std::shared_ptr<KvCacheEntry> entry;
    if (store_.enabled()) {
        const ModelHandle& model = engine_.model();
        /* Room for the whole prompt, like a private arena; the window caps both. */
        const uint32_t window = model.context_length();
        uint32_t rows = window;
        if (gen_->options().max_context_tokens)
            rows = std::min(rows, gen_->options().max_context_tokens);
        rows = static_cast<uint32_t>(std::min<size_t>(window, std::max<size_t>(rows, ids.size())));
        st = store_.get_or_create(session_id_, model.shape(), rows, &entry);
        if (st == TL_ERROR_SHAPE_MISMATCH) {
            history_.pop_back();
            forget_cache(nullptr);
            return failed(st, "conversation '" + session_id_ +
                                  "' has a KV entry for a different model shape");
        }
        if (st != TL_OK) {
            tl_log(TL_LOG_WARN, "conversation", "'%s': KV store unavailable (%s), no reuse",
                   session_id_.c_str(), tl_status_str(st));
            forget_cache(nullptr);
        }
    }

    CacheLease lease;
    if (entry) {
        CacheReuseDecision d = decide_cache_reuse(prev_prompt_, ids, cached_tokens_,
                                                  entry->current_tokens());
        if (d.reuse) {
            tl_log(TL_LOG_DEBUG, "conversation", "'%s': reuse %u of %zu prompt tokens",
                   session_id_.c_str(), d.start, ids.size());
        } else {
            tl_log(TL_LOG_DEBUG, "conversation",
                   "'%s': full prefill (lcp=%u recorded=%u entry=%u)",
                   session_id_.c_str(), d.lcp, cached_tokens_, entry->current_tokens());
            entry->reset();
        }
        store_.record_lookup(d.reuse, d.start);
        lease.entry = entry;
        lease.reuse_prefix = d.start;
    }

    GenerationResult r = engine_.generate_tokens(*gen_, ids, std::move(cancel), sink,
                                                 std::move(lease));

    if (!r.ok()) {
        history_.pop_back();
        forget_cache(entry.get());
        return r;
    }

    history_.push_back({ChatRole::ASSISTANT, r.text});

    if (!entry || r.prompt_truncated) {
        forget_cache(entry.get());
        return r;
    }
    entry->truncate(r.prompt_tokens);
    if (entry->current_tokens() != r.prompt_tokens) {
        /* Prefill never ran (budget hit before the first token). */
        forget_cache(entry.get());
        return r;
    }
    prev_prompt_ = std::move(ids);
    cached_tokens_ = r.prompt_tokens;
    return r;
}

/* ================================================================== */
/*  reset / dispose                                                    */
/* ================================================================== */

tl_status ConversationSession::reset() {
    InFlightGuard guard(in_flight_);
    if (!guard.acquired()) return TL_ERROR_BUSY;

    auto keep = std::remove_if(history_.begin(), history_.end(), [](const ChatMessage& m) {
        return m.role != ChatRole::SYSTEM;
    });
    history_.erase(keep, history_.end());
    forget_cache(nullptr);
    dropped_turns_ = 0;
    store_.remove(session_id_);
    return TL_OK;
}

tl_status ConversationSession::dispose() {
    if (disposed()) return TL_OK;
    tl_status st = reset();
    if (st != TL_OK) return st;

    InFlightGuard guard(in_flight_);
    if (!guard.acquired()) return TL_ERROR_BUSY;
    if (gen_) {
        st = gen_->dispose();
        if (st != TL_OK) return st;
    }
    disposed_.store(true, std::memory_order_release);
    return TL_OK;
}

} // namespace tl

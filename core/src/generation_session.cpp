/**
 * @file generation_session.cpp
 * @brief Prefill / decode loop, stop detection, budget enforcement
 */

#include "tokenloom/GenerationSession.hpp"
#include "tokenloom/BudgetEnforcer.hpp"
#include "tokenloom/metrics.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace tl {

namespace {

using Clock = std::chrono::steady_clock;

uint64_t us_since(Clock::time_point t0) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now() - t0).count());
}

/**
 * Scoped activation of a KV entry. The backend's kv_release hook runs on
 * every exit path; contents are cleared unless keep(true) was called.
 */
class KvActivation {
public:
    KvActivation(const ModelHandle& model, KvCacheEntry& kv)
        : model_(model), kv_(kv) {}
    ~KvActivation() {
        model_.kv_release(kv_.view());
        if (!keep_) kv_.reset();
    }
    KvActivation(const KvActivation&) = delete;
    KvActivation& operator=(const KvActivation&) = delete;

    void keep(bool k) { keep_ = k; }

private:
    const ModelHandle& model_;
    KvCacheEntry&      kv_;
    bool               keep_ = false;
};

GenerationResult failed(tl_status st, std::string msg) {
    GenerationResult r;
    r.status = st;
    r.error  = std::move(msg);
    return r;
}

/* Unmasked when ConstraintFallback is on and the constraint rejects all. */
constexpr const char* k_fallback_pieces[] = {"}", "]", ")", "\"", "."};

} // namespace

/* ================================================================== */
/*  Construction                                                       */
/* ================================================================== */

GenerationSession::GenerationSession(ModelHandle model, TokenizerHandle tokenizer,
                                     const GenerationOptions& options,
                                     std::string session_id)
    : model_(model), tokenizer_(tokenizer), options_(options),
      session_id_(std::move(session_id)),
      sampler_(options.sampler_params(), options.seed) {
    if (session_id_.empty()) session_id_ = "anonymous";

    if (!model_.valid() || !tokenizer_.valid()) {
        init_status_ = TL_ERROR_INVALID_ARG;
        init_error_  = "model or tokenizer vtable is incomplete";
        return;
    }
    if (model_.context_length() == 0 || model_.vocab_size() == 0) {
        init_status_ = TL_ERROR_INVALID_ARG;
        init_error_  = "model reports an empty vocabulary or context window";
        return;
    }
    if (tokenizer_.vocab_size() > model_.vocab_size()) {
        init_status_ = TL_ERROR_INVALID_ARG;
        init_error_  = "tokenizer vocabulary (" + std::to_string(tokenizer_.vocab_size()) +
                       ") is larger than the model's (" +
                       std::to_string(model_.vocab_size()) + ")";
        return;
    }
    init_status_ = options_.validate(&init_error_);
    if (init_status_ != TL_OK) {
        tl_log(TL_LOG_WARN, "engine", "session '%s': %s", session_id_.c_str(),
               init_error_.c_str());
        return;
    }

    stops_.configure(options_.stop_sequences);
    context_.reserve(model_.context_length());
}

GenerationSession::~GenerationSession() = default;

/* ================================================================== */
/*  Public entry points                                                */
/* ================================================================== */

GenerationResult GenerationSession::generate(std::string_view prompt,
                                             std::stop_token cancel,
                                             const TokenSink& sink) {
    if (init_status_ != TL_OK) return failed(init_status_, init_error_);

    std::vector<int32_t> ids;
    ids.reserve(prompt.size() + 8);
    tl_status st = tokenizer_.encode(prompt, ids);
    if (st != TL_OK)
        return failed(TL_ERROR_BACKEND,
                      std::string("tokenizer encode failed: ") + tl_status_str(st));
    return generate_tokens(ids, std::move(cancel), sink);
}

GenerationResult GenerationSession::generate_tokens(std::span<const int32_t> prompt,
                                                    std::stop_token cancel,
                                                    const TokenSink& sink,
                                                    CacheLease lease) {
    InFlightGuard guard(in_flight_);
    if (!guard.acquired())
        return failed(TL_ERROR_BUSY, "session '" + session_id_ +
                                         "' already has a generation in flight");
    if (disposed())
        return failed(TL_ERROR_DISPOSED, "session '" + session_id_ + "' is disposed");
    if (init_status_ != TL_OK) return failed(init_status_, init_error_);

    tl_metrics_request_begin();
    GenerationResult r = run(prompt, std::move(cancel), sink, lease);
    tl_metrics_request_end(r.status);

    if (r.status == TL_OK) {
        tl_log(TL_LOG_DEBUG, "engine",
               "session '%s': %zu tokens, finish=%s, prefill %llu us, decode %llu us",
               session_id_.c_str(), r.tokens.size(),
               tl_finish_reason_str(r.finish_reason),
               (unsigned long long)r.prefill_us, (unsigned long long)r.decode_us);
    } else if (r.status == TL_ERROR_TIMEOUT || r.status == TL_ERROR_CANCELLED) {
        tl_log(TL_LOG_INFO, "engine", "session '%s': %s after %zu tokens",
               session_id_.c_str(), tl_status_str(r.status), r.tokens.size());
    } else {
        tl_log(TL_LOG_ERROR, "engine", "session '%s': %s: %s", session_id_.c_str(),
               tl_status_str(r.status), r.error.c_str());
    }
    return r;
}

tl_status GenerationSession::dispose() {
    InFlightGuard guard(in_flight_);
    if (!guard.acquired()) return TL_ERROR_BUSY;
    if (disposed_.exchange(true, std::memory_order_acq_rel)) return TL_OK;

    scratch_.release();
    owned_kv_.reset();
    std::vector<int32_t>().swap(context_);
    std::vector<std::string>().swap(pieces_);
    fallback_ids_.clear();
    position_ = 0;
    return TL_OK;
}

/* ================================================================== */
/*  Prefill helpers                                                    */
/* ================================================================== */

tl_status GenerationSession::apply_input_policy(GenerationResult& r) {
    const uint32_t vocab = model_.vocab_size();
    for (int32_t id : context_) {
        if (id < 0 || static_cast<uint32_t>(id) >= vocab) {
            r.error = "prompt token id " + std::to_string(id) + " is outside the vocabulary";
            return TL_ERROR_INVALID_ARG;
        }
    }

    const uint32_t max_in = options_.max_input_tokens;
    if (max_in && context_.size() > max_in) {
        if (!options_.truncate_input) {
            r.error = "prompt has " + std::to_string(context_.size()) +
                      " tokens, MaxInputTokens is " + std::to_string(max_in) +
                      "; shorten it or set TruncateInput";
            return TL_ERROR_RESOURCE_LIMIT;
        }
        size_t drop = context_.size() - max_in;
        context_.erase(context_.begin(), context_.begin() + static_cast<ptrdiff_t>(drop));
        r.prompt_truncated = true;
        tl_log(TL_LOG_WARN, "engine", "session '%s': dropped %zu oldest prompt tokens",
               session_id_.c_str(), drop);
    }

    const uint32_t window = model_.context_length();
    if (context_.size() > window) {
        size_t drop = context_.size() - window;
        context_.erase(context_.begin(), context_.begin() + static_cast<ptrdiff_t>(drop));
        r.prompt_truncated = true;
        tl_log(TL_LOG_WARN, "engine",
               "session '%s': prompt cropped by %zu tokens to the %u-token window",
               session_id_.c_str(), drop, window);
    }
    return TL_OK;
}

tl_status GenerationSession::ensure_owned_cache(uint32_t max_tokens) {
    if (owned_kv_ && owned_kv_->max_tokens() >= max_tokens &&
        shape_equal(owned_kv_->shape(), model_.shape()))
        return TL_OK;
    owned_kv_ = KvCacheEntry::create(session_id_, model_.shape(), max_tokens);
    return owned_kv_ ? TL_OK : TL_ERROR_OUT_OF_MEMORY;
}

void GenerationSession::build_piece_table() {
    const uint32_t n = tokenizer_.vocab_size();
    pieces_.assign(n, std::string());
    fallback_ids_.clear();
    for (uint32_t i = 0; i < n; ++i) {
        int32_t id = static_cast<int32_t>(i);
        if (tokenizer_.decode({&id, 1}, pieces_[i]) != TL_OK) pieces_[i].clear();
        if (!options_.constraint_fallback) continue;
        for (const char* p : k_fallback_pieces) {
            if (pieces_[i] == p) { fallback_ids_.push_back(id); break; }
        }
    }
}

void GenerationSession::finalize_text(GenerationResult& r,
                                      const std::vector<int32_t>& text_ids,
                                      int stop_index) {
    if (text_ids.empty()) return;
    tl_status st = tokenizer_.decode(text_ids, r.text);
    if (st != TL_OK) {
        if (r.status == TL_OK) {
            r.status = TL_ERROR_BACKEND;
            r.error  = std::string("tokenizer decode failed: ") + tl_status_str(st);
        }
        return;
    }
    if (stop_index < 0) return;

    /* The detector fires on the first completed occurrence. */
    const std::string& stop = stops_.stop(stop_index);
    size_t at = r.text.find(stop);
    if (at == std::string::npos) return;
    r.text.resize(options_.remove_stop_sequence_from_output ? at : at + stop.size());
}

/* ================================================================== */
/*  Prefill + decode                                                   */
/* ================================================================== */

GenerationResult GenerationSession::run(std::span<const int32_t> prompt,
                                        std::stop_token cancel,
                                        const TokenSink& sink,
                                        CacheLease& lease) {
    GenerationResult r;
    position_ = 0;

    if (prompt.empty()) {
        r.status = TL_ERROR_INVALID_ARG;
        r.error  = "prompt is empty";
        return r;
    }
    context_.assign(prompt.begin(), prompt.end());
    if ((r.status = apply_input_policy(r)) != TL_OK) return r;
    r.prompt_tokens = static_cast<uint32_t>(context_.size());

    /* ---- Cache selection: structural errors before any forward ---- */
    const uint32_t window = model_.context_length();
    const bool leased = lease.entry != nullptr;
    KvCacheEntry* kv = nullptr;
    if (leased) {
        kv = lease.entry.get();
        if (!shape_equal(kv->shape(), model_.shape())) {
            r.status = TL_ERROR_SHAPE_MISMATCH;
            r.error  = "KV entry '" + kv->session_id() + "' was built for another model shape";
            return r;
        }
    } else {
        uint32_t rows = options_.max_context_tokens
                        ? std::min(window, options_.max_context_tokens) : window;
        rows = std::max<uint32_t>(rows, r.prompt_tokens);
        if ((r.status = ensure_owned_cache(rows)) != TL_OK) {
            r.error = "cannot allocate a KV cache of " + std::to_string(rows) + " tokens";
            return r;
        }
        kv = owned_kv_.get();
        kv->reset();
    }
    uint32_t reuse = (leased && !r.prompt_truncated) ? lease.reuse_prefix : 0;
    if (reuse > kv->current_tokens()) reuse = 0;
    /* Always re-run at least the last prompt token to get its logits. */
    if (reuse >= r.prompt_tokens) reuse = r.prompt_tokens - 1;
    kv->truncate(reuse);
    r.reused_tokens = reuse;

    const uint32_t vocab = model_.vocab_size();
    if (scratch_.logits.size() != vocab)
        scratch_.reserve(vocab, options_.effective_repetition_window());
    const bool constrained = options_.output_constraint.active();
    if (constrained && pieces_.empty()) build_piece_table();
    stops_.reset();
    generated_text_.clear();

    KvActivation activation(model_, *kv);

    BudgetEnforcer::Limits limits;
    limits.max_new_tokens     = options_.max_new_tokens;
    limits.max_context_tokens = options_.max_context_tokens;
    limits.model_context      = std::min(window, kv->max_tokens());
    limits.timeout_ms         = options_.timeout_ms;
    BudgetEnforcer budget(limits, std::move(cancel));

    tl_log(TL_LOG_DEBUG, "engine", "session '%s': prompt=%u reused=%u max_new=%u",
           session_id_.c_str(), r.prompt_tokens, reuse, options_.max_new_tokens);

    const int32_t eos = tokenizer_.eos_id();
    auto is_stop_token = [this](int32_t id) {
        return std::find(options_.stop_token_ids.begin(), options_.stop_token_ids.end(),
                         id) != options_.stop_token_ids.end();
    };
    auto allows = [this](int32_t id) {
        return static_cast<size_t>(id) < pieces_.size() &&
               options_.output_constraint.allows(generated_text_,
                                                 pieces_[static_cast<size_t>(id)]);
    };

    std::vector<int32_t> text_ids;
    text_ids.reserve(std::min(options_.max_new_tokens, window));
    int              stop_index = -1;
    uint32_t         generated  = 0;
    tl_finish_reason finish     = TL_FINISH_NONE;

    /* ---- Prefill ---- */
    /* A prompt that fills the context budget or the arena ends with MaxContext. */
    BudgetVerdict verdict = budget.check(0, r.prompt_tokens);
    if (verdict == BudgetVerdict::CONTINUE) {
        auto t0 = Clock::now();
        std::span<const int32_t> fresh(context_.data() + reuse, r.prompt_tokens - reuse);
        tl_status st = model_.forward(kv->view(), fresh, reuse, scratch_.logits.data());
        if (st == TL_OK) st = kv->commit(static_cast<uint32_t>(fresh.size()));
        if (st != TL_OK) {
            r.status = TL_ERROR_BACKEND;
            r.error  = std::string("prefill forward failed: ") + tl_status_str(st);
            return r;
        }
        position_ = r.prompt_tokens;
        r.prefill_us = us_since(t0);
        tl_metrics_record_prefill(r.prefill_us, static_cast<uint32_t>(fresh.size()));
    } else {
        finish = to_finish_reason(verdict);
    }

    /* ---- Decode ---- */
    auto t_decode = Clock::now();
    while (verdict == BudgetVerdict::CONTINUE) {
        if (generated > 0) {
            const int32_t last = context_.back();
            tl_status st = model_.forward(kv->view(), {&last, 1}, position_,
                                          scratch_.logits.data());
            if (st == TL_OK) st = kv->commit(1);
            if (st != TL_OK) {
                r.status = TL_ERROR_BACKEND;
                r.error  = "decode forward failed at position " +
                           std::to_string(position_) + ": " + tl_status_str(st);
                break;
            }
            ++position_;
        }

        SampledToken tok;
        tl_status st = constrained
            ? sampler_.sample(scratch_, context_, &allows, fallback_ids_, &tok)
            : sampler_.sample(scratch_, context_, &tok);
        if (st != TL_OK) {
            r.status = st;
            r.error  = "output constraint rejected every candidate token";
            break;
        }

        context_.push_back(tok.id);
        ++generated;

        GeneratedToken gt;
        gt.token_id = tok.id;
        gt.index    = generated - 1;
        if (options_.include_logprobs)
            gt.logprob = tok.prob > 0.0f ? std::log(tok.prob) : TL_NEG_INF;

        if (tok.id == eos) {
            finish = TL_FINISH_END_OF_SEQUENCE;
        } else if (is_stop_token(tok.id)) {
            finish = TL_FINISH_STOP_TOKEN;
        } else {
            st = tokenizer_.decode({&tok.id, 1}, fragment_);
            if (st != TL_OK) {
                r.status = TL_ERROR_BACKEND;
                r.error  = std::string("tokenizer decode failed: ") + tl_status_str(st);
                break;
            }
            gt.text = fragment_;
            generated_text_ += fragment_;
            text_ids.push_back(tok.id);
            int hit = stops_.append(fragment_);
            if (hit >= 0) {
                stop_index = hit;
                finish = TL_FINISH_STOP_SEQUENCE;
            }
        }

        /* Budgets for the next token; the verdict tags this one. */
        if (finish == TL_FINISH_NONE) {
            verdict = budget.check(generated, static_cast<uint32_t>(context_.size()));
            finish  = to_finish_reason(verdict);
        }
        gt.finish_reason = finish;
        if (sink) sink(gt);
        r.tokens.push_back(std::move(gt));
        if (finish != TL_FINISH_NONE) break;
    }
    r.decode_us = us_since(t_decode);
    if (generated) tl_metrics_record_decode(r.decode_us, generated);

    r.finish_reason = finish;
    if (r.status == TL_OK && finish == TL_FINISH_TIMEOUT) {
        r.status = TL_ERROR_TIMEOUT;
        r.error  = "generation exceeded TimeoutMs=" + std::to_string(options_.timeout_ms);
    } else if (r.status == TL_OK && finish == TL_FINISH_CANCELLED) {
        r.status = TL_ERROR_CANCELLED;
        r.error  = "generation cancelled by caller";
    }

    finalize_text(r, text_ids, stop_index);
    activation.keep(leased && r.status == TL_OK);
    return r;
}

} // namespace tl

/**
 * @file Sampler.hpp
 * @brief Logits -> token: penalties, temperature, top-k, softmax, top-p,
 *        min-p, output constraint, weighted draw.
 *
 * Header-only. The stage order is fixed; changing it changes seeded output.
 * All buffers live in SamplerScratch, which a session allocates once, so a
 * decode step performs no heap allocation after the first token.
 */

#ifndef TL_SAMPLER_HPP
#define TL_SAMPLER_HPP

#include "tokenloom/tokenloom_abi.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <span>
#include <vector>

namespace tl {

struct SamplerParams {
    float    temperature        = 0.8f;
    int32_t  top_k              = 40;     // <= 0 = disabled
    float    top_p              = 0.95f;  // 1.0 = disabled
    float    min_p              = 0.0f;   // 0 = disabled
    float    repetition_penalty = 1.0f;   // 1.0 = disabled
    float    presence_penalty   = 0.0f;
    float    frequency_penalty  = 0.0f;
    uint32_t repetition_window  = 256;
};

static constexpr float TL_NEG_INF = -std::numeric_limits<float>::infinity();

/* ================================================================== */
/*  Deterministic RNG                                                  */
/* ================================================================== */

/** mt19937_64 with a portable double extraction (53 high bits). */
class SamplerRng {
public:
    explicit SamplerRng(std::optional<uint64_t> seed)
        : engine_(seed ? *seed : seed_from_device()) {}

    /** Uniform double in [0, 1). Identical on every platform for a seed. */
    double next_unit() {
        return static_cast<double>(engine_() >> 11) * 0x1.0p-53;
    }

private:
    static uint64_t seed_from_device() {
        std::random_device rd;
        return (static_cast<uint64_t>(rd()) << 32) ^ rd();
    }

    std::mt19937_64 engine_;
};

/* ================================================================== */
/*  RepetitionCounter                                                  */
/* ================================================================== */

/**
 * Sparse occurrence counts over the trailing window. Linear scan: the
 * window is small next to the vocabulary.
 */
class RepetitionCounter {
public:
    void reserve(uint32_t window) {
        ids_.reserve(window);
        counts_.reserve(window);
    }

    void clear() {
        ids_.clear();
        counts_.clear();
    }

    void add(int32_t id) {
        for (size_t i = 0; i < ids_.size(); ++i) {
            if (ids_[i] == id) { ++counts_[i]; return; }
        }
        ids_.push_back(id);
        counts_.push_back(1);
    }

    size_t   size()              const { return ids_.size(); }
    int32_t  id(size_t i)        const { return ids_[i]; }
    uint32_t count(size_t i)     const { return counts_[i]; }

    uint32_t count_of(int32_t id) const {
        for (size_t i = 0; i < ids_.size(); ++i)
            if (ids_[i] == id) return counts_[i];
        return 0;
    }

private:
    std::vector<int32_t>  ids_;
    std::vector<uint32_t> counts_;
};

/* ================================================================== */
/*  SamplerScratch                                                     */
/* ================================================================== */

struct SamplerScratch {
    std::vector<float>   logits;   // forward output, transformed in place
    std::vector<float>   probs;
    std::vector<int32_t> order;    // sorted-index buffer
    RepetitionCounter    counter;

    void reserve(uint32_t vocab, uint32_t window) {
        logits.assign(vocab, 0.0f);
        probs.assign(vocab, 0.0f);
        order.reserve(vocab);
        counter.reserve(window);
    }

    void release() {
        std::vector<float>().swap(logits);
        std::vector<float>().swap(probs);
        std::vector<int32_t>().swap(order);
        counter = RepetitionCounter{};
    }
};

/* ================================================================== */
/*  Pipeline stages                                                    */
/* ================================================================== */

/** Stage 1: penalties over the last `window` ids of `history`. */
inline void apply_penalties(std::span<float> logits,
                            std::span<const int32_t> history,
                            const SamplerParams& p,
                            RepetitionCounter& counter) {
    if (p.repetition_penalty == 1.0f && p.presence_penalty == 0.0f &&
        p.frequency_penalty == 0.0f)
        return;

    size_t window = std::min<size_t>(history.size(), p.repetition_window);
    counter.clear();
    for (size_t i = history.size() - window; i < history.size(); ++i)
        counter.add(history[i]);

    for (size_t i = 0; i < counter.size(); ++i) {
        int32_t tid = counter.id(i);
        if (tid < 0 || static_cast<size_t>(tid) >= logits.size()) continue;
        float& l = logits[static_cast<size_t>(tid)];
        if (p.repetition_penalty != 1.0f)
            l = (l > 0.0f) ? l / p.repetition_penalty : l * p.repetition_penalty;
        l -= p.presence_penalty;
        l -= p.frequency_penalty * static_cast<float>(counter.count(i));
    }
}

/** Stage 2 */
inline void apply_temperature(std::span<float> logits, float temperature) {
    if (temperature == 1.0f) return;
    float inv = 1.0f / temperature;
    for (auto& l : logits) l *= inv;
}

/** Stage 3: keep exactly k entries (ties resolved toward the lower id). */
inline void apply_top_k(std::span<float> logits, int32_t k,
                        std::vector<int32_t>& order) {
    if (k <= 0 || static_cast<size_t>(k) >= logits.size()) return;

    order.resize(logits.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = static_cast<int32_t>(i);
    std::nth_element(order.begin(), order.begin() + k, order.end(),
                     [&](int32_t a, int32_t b) {
                         if (logits[a] != logits[b]) return logits[a] > logits[b];
                         return a < b;
                     });
    for (size_t i = static_cast<size_t>(k); i < order.size(); ++i)
        logits[static_cast<size_t>(order[i])] = TL_NEG_INF;
}

/** Stage 4. Returns false when every logit is -inf (probs left at zero). */
inline bool softmax(std::span<const float> logits, std::span<float> probs) {
    float max_l = TL_NEG_INF;
    for (float l : logits)
        if (l > max_l) max_l = l;
    if (max_l == TL_NEG_INF) {
        std::fill(probs.begin(), probs.end(), 0.0f);
        return false;
    }

    double sum = 0.0;
    for (size_t i = 0; i < logits.size(); ++i) {
        float e = (logits[i] == TL_NEG_INF) ? 0.0f : std::exp(logits[i] - max_l);
        probs[i] = e;
        sum += e;
    }
    float inv = static_cast<float>(1.0 / sum);
    for (auto& p : probs) p *= inv;
    return true;
}

inline void renormalize(std::span<float> probs) {
    double sum = 0.0;
    for (float p : probs) sum += p;
    if (sum <= 0.0) return;
    float inv = static_cast<float>(1.0 / sum);
    for (auto& p : probs) p *= inv;
}

/** Stage 5: nucleus. */
inline void apply_top_p(std::span<float> probs, float top_p,
                        std::vector<int32_t>& order) {
    if (top_p >= 1.0f) return;

    order.clear();
    for (size_t i = 0; i < probs.size(); ++i)
        if (probs[i] > 0.0f) order.push_back(static_cast<int32_t>(i));
    std::sort(order.begin(), order.end(), [&](int32_t a, int32_t b) {
        if (probs[a] != probs[b]) return probs[a] > probs[b];
        return a < b;
    });

    double cum = 0.0;
    size_t keep = order.size();
    for (size_t i = 0; i < order.size(); ++i) {
        cum += probs[static_cast<size_t>(order[i])];
        if (cum >= top_p) { keep = i + 1; break; }
    }
    for (size_t i = keep; i < order.size(); ++i)
        probs[static_cast<size_t>(order[i])] = 0.0f;
    renormalize(probs);
}

/** Stage 6 */
inline void apply_min_p(std::span<float> probs, float min_p) {
    if (min_p <= 0.0f) return;
    float max_p = 0.0f;
    for (float p : probs) max_p = std::max(max_p, p);
    float threshold = min_p * max_p;
    for (auto& p : probs)
        if (p < threshold) p = 0.0f;
    renormalize(probs);
}

/**
 * Stage 7: output constraint. `allows(id)` is consulted only for ids that
 * survived the earlier filters. When nothing is allowed and `fallback` is
 * non-empty, the fallback ids are unmasked with equal weight; otherwise
 * TL_ERROR_NO_CONTINUATION.
 */
template <typename AllowFn>
tl_status apply_constraint(std::span<float> logits, std::span<float> probs,
                           AllowFn&& allows,
                           std::span<const int32_t> fallback) {
    bool any = false;
    for (size_t i = 0; i < probs.size(); ++i) {
        if (probs[i] > 0.0f && allows(static_cast<int32_t>(i))) {
            any = true;
        } else {
            logits[i] = TL_NEG_INF;
        }
    }
    if (any) {
        softmax(logits, probs);
        return TL_OK;
    }

    if (fallback.empty()) return TL_ERROR_NO_CONTINUATION;
    std::fill(probs.begin(), probs.end(), 0.0f);
    float w = 1.0f / static_cast<float>(fallback.size());
    for (int32_t id : fallback) {
        if (id >= 0 && static_cast<size_t>(id) < probs.size())
            probs[static_cast<size_t>(id)] = w;
    }
    renormalize(probs);
    return TL_OK;
}

/**
 * Stage 8: cumulative draw. Zero-probability ids are never chosen; if
 * rounding leaves `u` past the total, the last non-zero id wins.
 */
inline int32_t sample_from_probs(std::span<const float> probs, double u) {
    double cum = 0.0;
    int32_t last = -1;
    for (size_t i = 0; i < probs.size(); ++i) {
        if (probs[i] <= 0.0f) continue;
        cum += probs[i];
        last = static_cast<int32_t>(i);
        if (cum >= u) return last;
    }
    return last >= 0 ? last : static_cast<int32_t>(probs.size()) - 1;
}

/* ================================================================== */
/*  Sampler                                                            */
/* ================================================================== */

struct SampledToken {
    int32_t id   = -1;
    float   prob = 0.0f;
};

/**
 * Full pipeline over scratch.logits. `allows` is null when no constraint
 * is configured.
 */
class Sampler {
public:
    Sampler(const SamplerParams& params, std::optional<uint64_t> seed)
        : params_(params), rng_(seed) {}

    const SamplerParams& params() const { return params_; }

    /** Unconstrained draw. */
    tl_status sample(SamplerScratch& s, std::span<const int32_t> history,
                     SampledToken* out) {
        return sample<AcceptAll>(s, history, nullptr, {}, out);
    }

    template <typename AllowFn>
    tl_status sample(SamplerScratch& s, std::span<const int32_t> history,
                     const AllowFn* allows, std::span<const int32_t> fallback,
                     SampledToken* out) {
        std::span<float> logits(s.logits);
        std::span<float> probs(s.probs);

        apply_penalties(logits, history, params_, s.counter);
        apply_temperature(logits, params_.temperature);
        apply_top_k(logits, params_.top_k, s.order);
        softmax(logits, probs);
        apply_top_p(probs, params_.top_p, s.order);
        apply_min_p(probs, params_.min_p);
        if (allows) {
            tl_status st = apply_constraint(logits, probs, *allows, fallback);
            if (st != TL_OK) return st;
        }

        out->id = sample_from_probs(probs, rng_.next_unit());
        out->prob = probs[static_cast<size_t>(out->id)];
        return TL_OK;
    }

private:
    struct AcceptAll {
        bool operator()(int32_t) const { return true; }
    };

    SamplerParams params_;
    SamplerRng    rng_;
};

} // namespace tl

#endif // TL_SAMPLER_HPP

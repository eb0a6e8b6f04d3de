/**
 * @file KvCacheEntry.hpp
 * @brief One session's bounded key/value attention storage
 *
 * INTERNAL TO CORE. Storage is an owned arena, one key and one value plane
 * per layer, each laid out [position][head][head_dim]. The backend receives
 * a tl_kv_view over it for every forward call; nothing about the cache is
 * toggled on the shared model object.
 *
 * Invariant: current_tokens() <= max_tokens().
 *
 * Not internally synchronized. The store serializes recency bookkeeping;
 * the contents belong to the single generation running on the session.
 */

#ifndef TL_KV_CACHE_ENTRY_HPP
#define TL_KV_CACHE_ENTRY_HPP

#include "tokenloom/Backend.hpp"
#include "tokenloom/tokenloom_backend_abi.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <new>
#include <span>
#include <string>
#include <vector>

namespace tl {

/** Bytes for K and V planes: 2 * layers * max_tokens * heads * head_dim * 4. */
inline uint64_t kv_bytes_for(const tl_model_shape& shape, uint32_t max_tokens) {
    return 2ull * shape.n_layers * max_tokens * shape.n_heads * shape.head_dim *
           sizeof(float);
}

class KvCacheEntry {
public:
    using Clock = std::chrono::steady_clock;

    /** nullptr on allocation failure or an empty shape. */
    static std::shared_ptr<KvCacheEntry> create(std::string session_id,
                                                tl_model_shape shape,
                                                uint32_t max_tokens) {
        if (shape.n_layers == 0 || shape.n_heads == 0 || shape.head_dim == 0 ||
            max_tokens == 0)
            return nullptr;
        try {
            return std::shared_ptr<KvCacheEntry>(
                new KvCacheEntry(std::move(session_id), shape, max_tokens));
        } catch (const std::bad_alloc&) {
            return nullptr;
        }
    }

    KvCacheEntry(const KvCacheEntry&) = delete;
    KvCacheEntry& operator=(const KvCacheEntry&) = delete;

    const std::string& session_id()     const { return session_id_; }
    tl_model_shape     shape()          const { return view_.shape; }
    uint32_t           max_tokens()     const { return view_.max_tokens; }
    uint32_t           current_tokens() const { return view_.n_tokens; }
    uint64_t           size_bytes()     const { return kv_bytes_for(view_.shape, view_.max_tokens); }
    uint32_t           row_floats()     const { return row_; }
    bool has_capacity(uint32_t n) const { return view_.n_tokens + n <= view_.max_tokens; }

    Clock::time_point last_touched() const { return last_touched_; }
    void touch() { last_touched_ = Clock::now(); }

    /* -- Host-side writes --------------------------------------------- */

    /**
     * Writes `n` K/V rows for `layer` at the uncommitted tail. Rows become
     * visible once commit(n) is called after every layer is written.
     */
    tl_status append_kv(uint32_t layer, std::span<const float> k,
                        std::span<const float> v, uint32_t n) {
        if (layer >= view_.shape.n_layers) return TL_ERROR_INVALID_ARG;
        size_t want = static_cast<size_t>(n) * row_;
        if (k.size() != want || v.size() != want) return TL_ERROR_INVALID_ARG;
        if (!has_capacity(n)) return TL_ERROR_RESOURCE_LIMIT;

        size_t off = static_cast<size_t>(view_.n_tokens) * row_;
        std::memcpy(keys_[layer].data() + off, k.data(), want * sizeof(float));
        std::memcpy(values_[layer].data() + off, v.data(), want * sizeof(float));
        return TL_OK;
    }

    /** Advances the committed length after a forward pass or append_kv. */
    tl_status commit(uint32_t n) {
        if (!has_capacity(n)) return TL_ERROR_RESOURCE_LIMIT;
        view_.n_tokens += n;
        return TL_OK;
    }

    /* -- Reads --------------------------------------------------------- */

    /** Empty span when the range is outside the committed tokens. */
    std::span<const float> keys(uint32_t layer, uint32_t start, uint32_t count) const {
        return range(keys_, layer, start, count);
    }
    std::span<const float> values(uint32_t layer, uint32_t start, uint32_t count) const {
        return range(values_, layer, start, count);
    }

    /* -- Shrinking ----------------------------------------------------- */

    void reset() { view_.n_tokens = 0; }

    /** Keeps the first `n` tokens. */
    void truncate(uint32_t n) {
        if (n < view_.n_tokens) view_.n_tokens = n;
    }

    /** Keeps the last `window` tokens, moved to the front. */
    void slide(uint32_t window) {
        if (window >= view_.n_tokens) return;
        uint32_t drop = view_.n_tokens - window;
        size_t   src  = static_cast<size_t>(drop) * row_;
        size_t   len  = static_cast<size_t>(window) * row_;
        for (uint32_t l = 0; l < view_.shape.n_layers; ++l) {
            std::memmove(keys_[l].data(), keys_[l].data() + src, len * sizeof(float));
            std::memmove(values_[l].data(), values_[l].data() + src, len * sizeof(float));
        }
        view_.n_tokens = window;
    }

    /** View handed to the model's forward pass. */
    tl_kv_view* view() { return &view_; }

private:
    KvCacheEntry(std::string session_id, tl_model_shape shape, uint32_t max_tokens)
        : session_id_(std::move(session_id)),
          row_(shape.n_heads * shape.head_dim),
          last_touched_(Clock::now()) {
        size_t plane = static_cast<size_t>(max_tokens) * row_;
        keys_.resize(shape.n_layers);
        values_.resize(shape.n_layers);
        key_ptrs_.resize(shape.n_layers);
        value_ptrs_.resize(shape.n_layers);
        for (uint32_t l = 0; l < shape.n_layers; ++l) {
            keys_[l].assign(plane, 0.0f);
            values_[l].assign(plane, 0.0f);
            key_ptrs_[l]   = keys_[l].data();
            value_ptrs_[l] = values_[l].data();
        }
        view_.shape      = shape;
        view_.max_tokens = max_tokens;
        view_.n_tokens   = 0;
        view_.keys       = key_ptrs_.data();
        view_.values     = value_ptrs_.data();
    }

    std::span<const float> range(const std::vector<std::vector<float>>& planes,
                                 uint32_t layer, uint32_t start,
                                 uint32_t count) const {
        if (layer >= view_.shape.n_layers || start + count > view_.n_tokens)
            return {};
        return std::span<const float>(planes[layer].data() +
                                          static_cast<size_t>(start) * row_,
                                      static_cast<size_t>(count) * row_);
    }

    std::string                     session_id_;
    uint32_t                        row_;
    Clock::time_point               last_touched_;
    std::vector<std::vector<float>> keys_;
    std::vector<std::vector<float>> values_;
    std::vector<float*>             key_ptrs_;
    std::vector<float*>             value_ptrs_;
    tl_kv_view                      view_{};
};

} // namespace tl

#endif // TL_KV_CACHE_ENTRY_HPP

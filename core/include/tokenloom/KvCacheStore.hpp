/**
 * @file KvCacheStore.hpp
 * @brief Session-id -> KvCacheEntry map with LRU capacity policy
 *
 * INTERNAL TO CORE.
 *
 * Invariant after every insert / touch: sessions <= max_sessions and
 * bytes <= max_bytes_total, restored by evicting least-recently-touched
 * entries. Entries are shared_ptr: an evicted entry stays valid for a
 * generation that still holds it, it is just no longer findable.
 *
 * Also hosts the incremental-reuse helpers used by ConversationSession
 * (longest_common_prefix, decide_cache_reuse).
 */

#ifndef TL_KV_CACHE_STORE_HPP
#define TL_KV_CACHE_STORE_HPP

#include "tokenloom/KvCacheEntry.hpp"
#include "tokenloom/metrics.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <list>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>

namespace tl {

/* ================================================================== */
/*  Incremental reuse                                                  */
/* ================================================================== */

inline uint32_t longest_common_prefix(std::span<const int32_t> a,
                                      std::span<const int32_t> b) {
    size_t n = std::min(a.size(), b.size());
    size_t i = 0;
    while (i < n && a[i] == b[i]) ++i;
    return static_cast<uint32_t>(i);
}

struct CacheReuseDecision {
    bool     reuse = false;
    uint32_t lcp   = 0;
    uint32_t start = 0;   /**< first position to prefill */
};

/**
 * Reuse only on three-way agreement: the LCP of the two prompts equals the
 * count the session recorded after its last turn and the count the entry
 * currently holds. Anything else means a full prefill from position 0.
 */
inline CacheReuseDecision decide_cache_reuse(std::span<const int32_t> prev_prompt,
                                             std::span<const int32_t> next_prompt,
                                             uint32_t session_cached_tokens,
                                             uint32_t entry_current_tokens) {
    CacheReuseDecision d;
    d.lcp = longest_common_prefix(prev_prompt, next_prompt);
    if (d.lcp > 0 && d.lcp == session_cached_tokens &&
        d.lcp == entry_current_tokens) {
        d.reuse = true;
        d.start = d.lcp;
    }
    return d;
}

/* ================================================================== */
/*  KvCacheStore                                                       */
/* ================================================================== */

class KvCacheStore {
public:
    struct Config {
        bool     enabled               = true;
        uint32_t max_sessions          = 16;
        uint64_t max_bytes_total       = 512ull << 20;
        uint64_t max_bytes_per_session = 0;   /**< 0 = only the total applies */
    };

    struct Stats {
        uint32_t sessions      = 0;
        uint64_t bytes         = 0;
        uint64_t peak_bytes    = 0;
        uint64_t hits          = 0;
        uint64_t misses        = 0;
        uint64_t evictions     = 0;
        uint64_t reused_tokens = 0;
    };

    KvCacheStore() : KvCacheStore(Config{}) {}
    explicit KvCacheStore(Config cfg) : cfg_(cfg) {
        if (cfg_.max_sessions == 0) {
            tl_log(TL_LOG_WARN, "kv_store", "max_sessions=0 clamped to 1");
            cfg_.max_sessions = 1;
        }
    }

    KvCacheStore(const KvCacheStore&) = delete;
    KvCacheStore& operator=(const KvCacheStore&) = delete;

    bool          enabled() const { return cfg_.enabled; }
    const Config& config()  const { return cfg_; }

    /* -- GetOrCreate -------------------------------------------------- */

    /**
     * Existing entry when the shape matches (touched); a new bounded entry
     * otherwise. TL_ERROR_SHAPE_MISMATCH when the id is live under another
     * model shape. A hit here only means the entry exists; whether its
     * contents are reusable is decide_cache_reuse's call.
     */
    tl_status get_or_create(const std::string& session_id, tl_model_shape shape,
                            uint32_t max_tokens,
                            std::shared_ptr<KvCacheEntry>* out) {
        if (!out || session_id.empty()) return TL_ERROR_INVALID_ARG;
        out->reset();

        std::lock_guard<std::mutex> lk(mu_);
        auto it = index_.find(session_id);
        if (it != index_.end()) {
            auto& entry = *it->second;
            if (!shape_equal(entry->shape(), shape)) {
                tl_log(TL_LOG_WARN, "kv_store",
                       "session '%s': cached shape %ux%ux%u, model %ux%ux%u",
                       session_id.c_str(), entry->shape().n_layers,
                       entry->shape().n_heads, entry->shape().head_dim,
                       shape.n_layers, shape.n_heads, shape.head_dim);
                return TL_ERROR_SHAPE_MISMATCH;
            }
            if (entry->max_tokens() >= max_tokens) {
                touch_locked(it->second);
                *out = entry;
                return TL_OK;
            }
            /* Too small for the new request: replace it. */
            remove_locked(it);
        }

        uint64_t size = kv_bytes_for(shape, max_tokens);
        if (cfg_.max_bytes_per_session && size > cfg_.max_bytes_per_session) {
            tl_log(TL_LOG_WARN, "kv_store",
                   "session '%s': %llu bytes exceeds per-session budget %llu",
                   session_id.c_str(), (unsigned long long)size,
                   (unsigned long long)cfg_.max_bytes_per_session);
            return TL_ERROR_RESOURCE_LIMIT;
        }
        if (size > cfg_.max_bytes_total) return TL_ERROR_OUT_OF_MEMORY;

        while (!lru_.empty() &&
               (lru_.size() + 1 > cfg_.max_sessions ||
                used_ + size > cfg_.max_bytes_total)) {
            evict_lru_locked();
        }

        auto entry = KvCacheEntry::create(session_id, shape, max_tokens);
        if (!entry) return TL_ERROR_OUT_OF_MEMORY;

        lru_.push_front(entry);
        index_[session_id] = lru_.begin();
        used_ += size;
        stats_.peak_bytes = std::max(stats_.peak_bytes, used_);
        tl_metrics_record_kv_bytes(used_);
        *out = std::move(entry);
        return TL_OK;
    }

    /** Touching lookup; nullptr when absent. */
    std::shared_ptr<KvCacheEntry> try_get(const std::string& session_id) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = index_.find(session_id);
        if (it == index_.end()) return nullptr;
        touch_locked(it->second);
        return *it->second;
    }

    bool touch(const std::string& session_id) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = index_.find(session_id);
        if (it == index_.end()) return false;
        touch_locked(it->second);
        return true;
    }

    bool remove(const std::string& session_id) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = index_.find(session_id);
        if (it == index_.end()) return false;
        remove_locked(it);
        return true;
    }

    /**
     * Drops the entry's contents but keeps its slot. Refused with
     * TL_ERROR_BUSY while anyone outside the store holds the entry.
     */
    tl_status reset(const std::string& session_id) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = index_.find(session_id);
        if (it == index_.end()) return TL_ERROR_NOT_FOUND;
        if (it->second->use_count() > 1) return TL_ERROR_BUSY;
        (*it->second)->reset();
        return TL_OK;
    }

    void clear() {
        std::lock_guard<std::mutex> lk(mu_);
        lru_.clear();
        index_.clear();
        used_ = 0;
        tl_metrics_record_kv_bytes(0);
    }

    /* -- Accounting (called by the conversation layer) ---------------- */

    void record_lookup(bool reused, uint32_t reused_tokens) {
        std::lock_guard<std::mutex> lk(mu_);
        if (reused) {
            ++stats_.hits;
            stats_.reused_tokens += reused_tokens;
        } else {
            ++stats_.misses;
        }
        tl_metrics_record_kv_lookup(reused ? 1 : 0, reused_tokens);
    }

    Stats stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        Stats s = stats_;
        s.sessions = static_cast<uint32_t>(lru_.size());
        s.bytes    = used_;
        return s;
    }

private:
    using LruList = std::list<std::shared_ptr<KvCacheEntry>>;
    using Index   = std::unordered_map<std::string, LruList::iterator>;

    void touch_locked(LruList::iterator it) {
        (*it)->touch();
        lru_.splice(lru_.begin(), lru_, it);
    }

    void remove_locked(Index::iterator it) {
        used_ -= (*it->second)->size_bytes();
        lru_.erase(it->second);
        index_.erase(it);
        tl_metrics_record_kv_bytes(used_);
    }

    void evict_lru_locked() {
        auto victim = std::prev(lru_.end());
        uint64_t freed = (*victim)->size_bytes();
        tl_log(TL_LOG_DEBUG, "kv_store", "evict '%s' (%llu bytes)",
               (*victim)->session_id().c_str(), (unsigned long long)freed);
        index_.erase((*victim)->session_id());
        lru_.erase(victim);
        used_ -= freed;
        ++stats_.evictions;
        tl_metrics_record_kv_eviction(freed);
        tl_metrics_record_kv_bytes(used_);
    }

    Config             cfg_;
    mutable std::mutex mu_;
    LruList            lru_;     /**< front = most recently touched */
    Index              index_;
    uint64_t           used_ = 0;
    Stats              stats_;
};

} // namespace tl

#endif // TL_KV_CACHE_STORE_HPP
